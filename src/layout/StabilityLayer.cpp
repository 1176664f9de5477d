#include "timeline/layout/StabilityLayer.hpp"

#include <cmath>

namespace timeline {
namespace layout {

StabilityLayer::StabilityLayer(const StabilityMemory &previous, double threshold)
    : m_previous(previous)
    , m_threshold(qMax(0.0, threshold))
{
}

std::vector<ColumnGroup> StabilityLayer::stabilize(std::vector<ColumnGroup> groups) const
{
    if (groups.empty() || m_previous.isEmpty()) {
        return groups;
    }

    const std::vector<ColumnGroup> raw = groups;
    std::vector<bool> snapped(groups.size(), false);
    std::vector<bool> consumed(m_previous.columns.size(), false);
    const ColumnGroup *placedBefore = nullptr;
    for (std::size_t position = 0; position < groups.size(); ++position) {
        auto &group = groups[position];
        int bestIndex = -1;
        double bestDistance = 0.0;
        for (std::size_t index = 0; index < m_previous.columns.size(); ++index) {
            const auto &column = m_previous.columns[index];
            if (consumed[index] || column.side != group.side) {
                continue;
            }
            const double distance = std::abs(column.startX - group.startX);
            if (bestIndex < 0 || distance < bestDistance) {
                bestIndex = static_cast<int>(index);
                bestDistance = distance;
            }
        }

        if (bestIndex >= 0) {
            const auto &column = m_previous.columns[static_cast<std::size_t>(bestIndex)];
            const bool withinThreshold = std::abs(column.startX - group.startX) <= m_threshold
                && std::abs(column.endX - group.endX) <= m_threshold;
            const bool clearOfNeighbour = !placedBefore || column.startX > placedBefore->endX;
            if (withinThreshold && clearOfNeighbour) {
                group.startX = column.startX;
                group.endX = column.endX;
                group.centerX = (group.startX + group.endX) / 2.0;
                group.preferredState = column.state;
                consumed[static_cast<std::size_t>(bestIndex)] = true;
                snapped[position] = true;
            }
        }
        placedBefore = &group;
    }

    // A snap to the right can still run into the next column. Undo snaps
    // until neighbours are clear again; unsnapped columns never overlap.
    bool changed = true;
    while (changed) {
        changed = false;
        for (std::size_t index = 0; index + 1 < groups.size(); ++index) {
            if (groups[index].endX < groups[index + 1].startX) {
                continue;
            }
            const std::size_t undo = snapped[index + 1] ? index + 1 : index;
            if (!snapped[undo]) {
                continue;
            }
            groups[undo].startX = raw[undo].startX;
            groups[undo].endX = raw[undo].endX;
            groups[undo].centerX = raw[undo].centerX;
            groups[undo].preferredState.reset();
            snapped[undo] = false;
            changed = true;
        }
    }
    return groups;
}

StabilityMemory StabilityLayer::remember(const std::vector<ColumnGroup> &groups)
{
    StabilityMemory memory;
    memory.columns.reserve(groups.size());
    for (const auto &group : groups) {
        StabilityMemory::Column column;
        column.side = group.side;
        column.startX = group.startX;
        column.endX = group.endX;
        column.state = group.state;
        memory.columns.push_back(column);
    }
    return memory;
}

} // namespace layout
} // namespace timeline
