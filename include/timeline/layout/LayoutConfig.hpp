#pragma once

#include <QRectF>

#include "timeline/layout/Types.hpp"

namespace timeline {
namespace layout {

struct LayoutConfig
{
    double cardWidth = 260.0;
    double titleOnlyHeight = 32.0;
    double cardSpacing = 12.0;

    double headerSafeZone = 100.0;
    double aboveTimelineMargin = 48.0;
    double belowTimelineMargin = 55.0;
    double leftMargin = 136.0;
    double rightMargin = 40.0;

    int minCellsPerRegion = 4;
    int maxCellsPerRegion = 8;

    double minColumnWidth = 340.0;
    double proximityMergeThreshold = 30.0;
    double stabilityThreshold = 24.0;
    double promotionThreshold = 0.40;

    int multiEventFootprint = 2;
    int multiEventCapacity = 5;
    bool aggregationEnabled = false;

    double cellPitch() const { return titleOnlyHeight + cardSpacing; }
    double columnWidth() const { return qMax(minColumnWidth, cardWidth); }
};

class LayoutGeometry
{
public:
    LayoutGeometry(const LayoutConfig &config, const Viewport &viewport);

    double timelineY() const { return m_timelineY; }
    double leftEdge() const { return m_config.leftMargin; }
    double usableWidth() const { return m_usableWidth; }

    int cellBudget(Region region) const;
    double cardHeight(int footprint) const;
    QRectF cardRect(Region region, double left, int cellIndex, int footprint) const;

private:
    double regionSpace(Region region) const;

    LayoutConfig m_config;
    Viewport m_viewport;
    double m_timelineY = 0.0;
    double m_usableWidth = 0.0;
};

} // namespace layout
} // namespace timeline
