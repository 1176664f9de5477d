#include "timeline/layout/LayoutConfig.hpp"

#include <cmath>

namespace timeline {
namespace layout {

LayoutGeometry::LayoutGeometry(const LayoutConfig &config, const Viewport &viewport)
    : m_config(config)
    , m_viewport(viewport)
{
    m_timelineY = m_config.headerSafeZone + (m_viewport.height - m_config.headerSafeZone) / 2.0;
    m_usableWidth = qMax(0.0, m_viewport.width - m_config.leftMargin - m_config.rightMargin);
}

double LayoutGeometry::regionSpace(Region region) const
{
    switch (region) {
    case Region::Above:
        return m_timelineY - m_config.headerSafeZone - m_config.aboveTimelineMargin;
    case Region::Below:
        return m_viewport.height - m_timelineY - m_config.belowTimelineMargin;
    }
    return 0.0;
}

int LayoutGeometry::cellBudget(Region region) const
{
    const double space = regionSpace(region);
    const double pitch = m_config.cellPitch();
    if (space <= 0.0 || pitch <= 0.0) {
        return 0;
    }
    // Clamp before converting; a tall viewport would not fit in an int.
    const double cells = qBound<double>(m_config.minCellsPerRegion, std::floor(space / pitch),
                                        m_config.maxCellsPerRegion);
    return static_cast<int>(cells);
}

double LayoutGeometry::cardHeight(int footprint) const
{
    return footprint * m_config.cellPitch() - m_config.cardSpacing;
}

QRectF LayoutGeometry::cardRect(Region region, double left, int cellIndex, int footprint) const
{
    const double pitch = m_config.cellPitch();
    const double height = cardHeight(footprint);
    if (region == Region::Above) {
        // Cell 0 sits directly above the axis; later cells stack upward.
        const double bottom = m_timelineY - m_config.aboveTimelineMargin - cellIndex * pitch;
        return QRectF(left, bottom - height, m_config.cardWidth, height);
    }
    const double top = m_timelineY + m_config.belowTimelineMargin + cellIndex * pitch;
    return QRectF(left, top, m_config.cardWidth, height);
}

} // namespace layout
} // namespace timeline
