#pragma once

#include <vector>

#include "timeline/layout/Types.hpp"

namespace timeline {
namespace layout {

struct DispatchResult
{
    std::vector<TimedEvent> above;
    std::vector<TimedEvent> below;
};

class AlternatingDispatcher
{
public:
    // Ordering key shared by every stage: timestamp, then id.
    static bool chronologicalLess(const TimedEvent &lhs, const TimedEvent &rhs);
    static std::vector<TimedEvent> sorted(std::vector<TimedEvent> events);

    DispatchResult dispatch(std::vector<TimedEvent> events) const;
};

} // namespace layout
} // namespace timeline
