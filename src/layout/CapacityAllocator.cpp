#include "timeline/layout/CapacityAllocator.hpp"

namespace timeline {
namespace layout {

CapacityAllocator::CapacityAllocator(int capacity)
    : m_capacity(qMax(0, capacity))
{
}

int CapacityAllocator::requiredCells(int eventCount, CardType type, int multiEventFootprint)
{
    return eventCount * footprintCells(type, multiEventFootprint);
}

double CapacityAllocator::utilization() const
{
    if (m_capacity <= 0) {
        return 0.0;
    }
    return static_cast<double>(m_usedCells) / static_cast<double>(m_capacity);
}

bool CapacityAllocator::canFit(int footprint) const
{
    return footprint > 0 && footprint <= availableCells();
}

std::optional<int> CapacityAllocator::allocate(int footprint)
{
    if (!canFit(footprint)) {
        return std::nullopt;
    }
    const int cellIndex = m_usedCells;
    m_usedCells += footprint;
    return cellIndex;
}

void CapacityAllocator::reset()
{
    m_usedCells = 0;
}

} // namespace layout
} // namespace timeline
