#pragma once

#include <memory>

namespace timeline {
namespace data {

class EventRepository;

class DataProvider
{
public:
    explicit DataProvider(bool seedDemo = true);
    ~DataProvider();

    EventRepository &eventRepository();

private:
    void seedDemoData();

    std::unique_ptr<EventRepository> m_eventRepository;
};

} // namespace data
} // namespace timeline
