#include "timeline/layout/Clusterer.hpp"

#include <algorithm>

namespace timeline {
namespace layout {

Clusterer::Clusterer(const LayoutConfig &config)
    : m_columnWidth(config.columnWidth())
    , m_proximityThreshold(config.proximityMergeThreshold)
{
}

QString Clusterer::groupId(Region region, int index)
{
    return QStringLiteral("%1-%2").arg(toString(region)).arg(index);
}

std::vector<ColumnGroup> Clusterer::cluster(Region region, const std::vector<TimedEvent> &events) const
{
    std::vector<ColumnGroup> groups;
    for (const auto &event : events) {
        // Scan in creation order so a boundary hit lands in the earlier group.
        auto it = std::find_if(groups.begin(), groups.end(), [&event](const ColumnGroup &group) {
            return event.x >= group.startX && event.x <= group.endX;
        });
        if (it != groups.end()) {
            it->events.push_back(event);
            continue;
        }
        ColumnGroup group;
        group.side = region;
        group.startX = event.x;
        group.endX = event.x + m_columnWidth;
        group.events.push_back(event);
        groups.push_back(std::move(group));
    }

    groups = mergeAdjacent(std::move(groups));
    for (std::size_t index = 0; index < groups.size(); ++index) {
        auto &group = groups[index];
        group.id = groupId(region, static_cast<int>(index));
        group.centerX = (group.startX + group.endX) / 2.0;
    }
    return groups;
}

std::vector<ColumnGroup> Clusterer::mergeAdjacent(std::vector<ColumnGroup> groups) const
{
    if (groups.size() <= 1) {
        return groups;
    }
    std::stable_sort(groups.begin(), groups.end(), [](const ColumnGroup &lhs, const ColumnGroup &rhs) {
        return lhs.startX < rhs.startX;
    });

    std::vector<ColumnGroup> merged;
    merged.reserve(groups.size());
    for (auto &group : groups) {
        if (!merged.empty() && group.startX - merged.back().endX < m_proximityThreshold) {
            auto &previous = merged.back();
            previous.endX = qMax(previous.endX, group.endX);
            previous.events.insert(previous.events.end(), group.events.begin(), group.events.end());
            continue;
        }
        merged.push_back(std::move(group));
    }
    return merged;
}

} // namespace layout
} // namespace timeline
