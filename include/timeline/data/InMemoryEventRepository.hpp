#pragma once

#include <QHash>

#include "timeline/data/EventRepository.hpp"

namespace timeline {
namespace data {

class InMemoryEventRepository : public EventRepository
{
public:
    InMemoryEventRepository();
    ~InMemoryEventRepository() override;

    std::vector<TimelineEvent> snapshot() const override;
    std::optional<TimelineEvent> findById(const QString &id) const override;
    bool addEvent(const TimelineEvent &event) override;
    bool updateEvent(const TimelineEvent &event) override;
    bool removeEvent(const QString &id) override;

private:
    QHash<QString, TimelineEvent> m_events;
};

} // namespace data
} // namespace timeline
