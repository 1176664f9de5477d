#pragma once

#include <vector>

#include "timeline/layout/Types.hpp"

namespace timeline {
namespace layout {

struct StabilityMemory
{
    struct Column
    {
        Region side = Region::Above;
        double startX = 0.0;
        double endX = 0.0;
        DegradationState state = DegradationState::Full;
    };

    std::vector<Column> columns;

    bool isEmpty() const { return columns.empty(); }
};

// Snaps columns within the threshold of a previous column of the same region
// to its boundaries and inherits its state. Snaps that would overlap a
// neighbour are skipped or undone.
class StabilityLayer
{
public:
    StabilityLayer(const StabilityMemory &previous, double threshold);

    std::vector<ColumnGroup> stabilize(std::vector<ColumnGroup> groups) const;

    static StabilityMemory remember(const std::vector<ColumnGroup> &groups);

private:
    StabilityMemory m_previous;
    double m_threshold = 0.0;
};

} // namespace layout
} // namespace timeline
