#pragma once

#include <optional>

#include "timeline/layout/Types.hpp"

namespace timeline {
namespace layout {

class CapacityAllocator
{
public:
    explicit CapacityAllocator(int capacity);

    static int requiredCells(int eventCount, CardType type, int multiEventFootprint = 2);

    int capacity() const { return m_capacity; }
    int usedCells() const { return m_usedCells; }
    int availableCells() const { return m_capacity - m_usedCells; }
    double utilization() const;

    bool canFit(int footprint) const;
    // Returns the first cell index of the reserved range.
    std::optional<int> allocate(int footprint);
    void reset();

private:
    int m_capacity = 0;
    int m_usedCells = 0;
};

} // namespace layout
} // namespace timeline
