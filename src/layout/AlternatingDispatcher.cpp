#include "timeline/layout/AlternatingDispatcher.hpp"

#include <algorithm>

namespace timeline {
namespace layout {

bool AlternatingDispatcher::chronologicalLess(const TimedEvent &lhs, const TimedEvent &rhs)
{
    if (lhs.timestamp == rhs.timestamp) {
        return lhs.event.id < rhs.event.id;
    }
    return lhs.timestamp < rhs.timestamp;
}

std::vector<TimedEvent> AlternatingDispatcher::sorted(std::vector<TimedEvent> events)
{
    std::stable_sort(events.begin(), events.end(), &AlternatingDispatcher::chronologicalLess);
    return events;
}

DispatchResult AlternatingDispatcher::dispatch(std::vector<TimedEvent> events) const
{
    const auto ordered = sorted(std::move(events));
    DispatchResult result;
    result.above.reserve(ordered.size() / 2 + 1);
    result.below.reserve(ordered.size() / 2);
    for (std::size_t index = 0; index < ordered.size(); ++index) {
        if (index % 2 == 0) {
            result.above.push_back(ordered[index]);
        } else {
            result.below.push_back(ordered[index]);
        }
    }
    return result;
}

} // namespace layout
} // namespace timeline
