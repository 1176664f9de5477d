#pragma once

#include <optional>
#include <vector>

#include "timeline/data/Event.hpp"

namespace timeline {
namespace data {

class EventRepository
{
public:
    virtual ~EventRepository() = default;

    virtual std::vector<TimelineEvent> snapshot() const = 0;
    virtual std::optional<TimelineEvent> findById(const QString &id) const = 0;
    virtual bool addEvent(const TimelineEvent &event) = 0;
    virtual bool updateEvent(const TimelineEvent &event) = 0;
    virtual bool removeEvent(const QString &id) = 0;
};

} // namespace data
} // namespace timeline
