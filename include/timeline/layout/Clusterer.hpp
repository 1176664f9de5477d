#pragma once

#include <vector>

#include "timeline/layout/LayoutConfig.hpp"
#include "timeline/layout/Types.hpp"

namespace timeline {
namespace layout {

class Clusterer
{
public:
    explicit Clusterer(const LayoutConfig &config);

    std::vector<ColumnGroup> cluster(Region region, const std::vector<TimedEvent> &events) const;
    std::vector<ColumnGroup> mergeAdjacent(std::vector<ColumnGroup> groups) const;

    static QString groupId(Region region, int index);

private:
    double m_columnWidth = 0.0;
    double m_proximityThreshold = 0.0;
};

} // namespace layout
} // namespace timeline
