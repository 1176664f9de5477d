#pragma once

#include "timeline/layout/CapacityAllocator.hpp"
#include "timeline/layout/LayoutConfig.hpp"
#include "timeline/layout/Types.hpp"

namespace timeline {
namespace layout {

struct StateSelection
{
    DegradationState state = DegradationState::Full;
    bool promoted = false;
};

// Cards are placed in chronological order, so earlier events never get a
// cruder card than later ones.
class DegradationEngine
{
public:
    DegradationEngine(const LayoutConfig &config, const LayoutGeometry &geometry);

    StateSelection selectState(int eventCount, int capacity, DegradationState start) const;
    ColumnGroup apply(ColumnGroup group) const;

    static DegradationState denser(DegradationState state);
    static DegradationState lessDegraded(DegradationState state);

private:
    int requiredCells(int eventCount, DegradationState state) const;
    PositionedCard makeCard(const ColumnGroup &group,
                            CardType type,
                            int cellIndex,
                            QStringList eventIds) const;
    void placeUniform(ColumnGroup &group, CapacityAllocator &allocator, CardType type) const;
    void placeOverflowed(ColumnGroup &group, CapacityAllocator &allocator) const;

    LayoutConfig m_config;
    LayoutGeometry m_geometry;
};

} // namespace layout
} // namespace timeline
