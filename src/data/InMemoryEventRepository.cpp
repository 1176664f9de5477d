#include "timeline/data/InMemoryEventRepository.hpp"

#include <algorithm>

#include "timeline/core/Logging.hpp"

namespace timeline {
namespace data {

InMemoryEventRepository::InMemoryEventRepository() = default;
InMemoryEventRepository::~InMemoryEventRepository() = default;

std::vector<TimelineEvent> InMemoryEventRepository::snapshot() const
{
    std::vector<TimelineEvent> events;
    events.reserve(static_cast<std::size_t>(m_events.size()));
    for (const auto &event : m_events) {
        events.push_back(event);
    }
    // QHash iteration order is unspecified; callers get a stable order.
    std::sort(events.begin(), events.end(), [](const TimelineEvent &lhs, const TimelineEvent &rhs) {
        return lhs.id < rhs.id;
    });
    return events;
}

std::optional<TimelineEvent> InMemoryEventRepository::findById(const QString &id) const
{
    if (m_events.contains(id)) {
        return m_events.value(id);
    }
    return std::nullopt;
}

bool InMemoryEventRepository::addEvent(const TimelineEvent &event)
{
    if (event.id.isEmpty() || m_events.contains(event.id)) {
        qCWarning(lcData) << "rejected event with empty or duplicate id" << event.id;
        return false;
    }
    m_events.insert(event.id, event);
    return true;
}

bool InMemoryEventRepository::updateEvent(const TimelineEvent &event)
{
    if (!m_events.contains(event.id)) {
        return false;
    }
    m_events.insert(event.id, event);
    return true;
}

bool InMemoryEventRepository::removeEvent(const QString &id)
{
    return m_events.remove(id) > 0;
}

} // namespace data
} // namespace timeline
