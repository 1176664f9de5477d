#include "timeline/layout/AnchorPositioner.hpp"

#include <algorithm>

namespace timeline {
namespace layout {

AnchorPositioner::AnchorPositioner(const TimeMapper &mapper, double timelineY)
    : m_mapper(mapper)
    , m_timelineY(timelineY)
{
}

qint64 AnchorPositioner::temporalMidpoint(const std::vector<TimedEvent> &events)
{
    if (events.empty()) {
        return 0;
    }
    const auto [earliest, latest] = std::minmax_element(events.begin(), events.end(),
                                                        [](const TimedEvent &lhs, const TimedEvent &rhs) {
                                                            return lhs.timestamp < rhs.timestamp;
                                                        });
    return earliest->timestamp + (latest->timestamp - earliest->timestamp) / 2;
}

ColumnGroup AnchorPositioner::position(ColumnGroup group) const
{
    group.anchorTime = temporalMidpoint(group.events);
    group.anchorX = m_mapper.xForTime(group.anchorTime);
    return group;
}

Anchor AnchorPositioner::anchorFor(const ColumnGroup &group) const
{
    Anchor anchor;
    anchor.id = QStringLiteral("anchor-%1").arg(group.id);
    anchor.groupId = group.id;
    anchor.side = group.side;
    anchor.time = dateTimeFromTimestamp(group.anchorTime);
    anchor.x = group.anchorX;
    anchor.y = m_timelineY;
    for (const auto &event : group.events) {
        anchor.eventIds << event.event.id;
    }
    anchor.overflowCount = static_cast<int>(group.overflowEvents.size());
    anchor.visibleCount = static_cast<int>(group.events.size()) - anchor.overflowCount;
    return anchor;
}

} // namespace layout
} // namespace timeline
