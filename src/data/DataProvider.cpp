#include "timeline/data/DataProvider.hpp"

#include "timeline/core/Logging.hpp"
#include "timeline/data/InMemoryEventRepository.hpp"

#include <QStringList>

namespace timeline {
namespace data {

DataProvider::DataProvider(bool seedDemo)
    : m_eventRepository(std::make_unique<InMemoryEventRepository>())
{
    if (seedDemo) {
        seedDemoData();
    }
}

DataProvider::~DataProvider() = default;

EventRepository &DataProvider::eventRepository()
{
    return *m_eventRepository;
}

void DataProvider::seedDemoData()
{
    if (!m_eventRepository->snapshot().empty()) {
        return;
    }

    struct Seed
    {
        const char *date;
        const char *time;
        const char *title;
    };
    // A dense July 1969 week next to sparse months around it.
    static const Seed seeds[] = {
        { "1969-01-14", "", "Soyuz 4 launch" },
        { "1969-03-03", "16:00", "Apollo 9 launch" },
        { "1969-05-18", "16:49", "Apollo 10 launch" },
        { "1969-07-16", "13:32", "Apollo 11 launch" },
        { "1969-07-16", "16:22", "Translunar injection" },
        { "1969-07-19", "17:21", "Lunar orbit insertion" },
        { "1969-07-20", "17:44", "Eagle undocks" },
        { "1969-07-20", "20:17", "Eagle lands" },
        { "1969-07-21", "02:56", "First step" },
        { "1969-07-21", "17:54", "Lunar liftoff" },
        { "1969-07-21", "21:35", "Docking with Columbia" },
        { "1969-07-22", "04:55", "Transearth injection" },
        { "1969-07-24", "16:50", "Splashdown" },
        { "1969-11-14", "16:22", "Apollo 12 launch" },
        { "1969-11-19", "06:54", "Intrepid lands" },
        { "1969-11-24", "20:58", "Apollo 12 splashdown" },
        { "1969-13-01", "", "Malformed entry" },
    };

    int index = 0;
    for (const Seed &seed : seeds) {
        TimelineEvent event;
        event.id = QStringLiteral("demo-%1").arg(index++, 2, 10, QLatin1Char('0'));
        event.date = QString::fromLatin1(seed.date);
        event.time = QString::fromLatin1(seed.time);
        event.title = QString::fromLatin1(seed.title);
        event.sources = QStringList { QStringLiteral("demo") };
        if (!m_eventRepository->addEvent(event)) {
            qCWarning(lcData) << "could not seed demo event" << event.id;
        }
    }
}

} // namespace data
} // namespace timeline
