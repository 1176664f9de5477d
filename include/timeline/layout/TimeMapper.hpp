#pragma once

#include <QtGlobal>
#include <optional>

#include "timeline/layout/LayoutConfig.hpp"
#include "timeline/layout/Types.hpp"

namespace timeline {
namespace layout {

// UTC milliseconds for the event's date plus optional time; nullopt when the date does not parse.
std::optional<qint64> eventTimestamp(const data::TimelineEvent &event);
QDateTime dateTimeFromTimestamp(qint64 timestamp);

class TimeMapper
{
public:
    TimeMapper(qint64 visibleStart, qint64 visibleEnd, double left, double usableWidth);

    static TimeMapper forWindow(qint64 rangeStart,
                                qint64 rangeEnd,
                                const ViewWindow &window,
                                const LayoutGeometry &geometry);
    static ViewWindow sanitizeWindow(const ViewWindow &window);

    double xForTime(qint64 timestamp) const;
    bool isVisible(qint64 timestamp) const;
    qint64 visibleStart() const { return m_visibleStart; }
    qint64 visibleEnd() const { return m_visibleEnd; }

private:
    qint64 m_visibleStart = 0;
    qint64 m_visibleEnd = 0;
    double m_left = 0.0;
    double m_usableWidth = 0.0;
};

} // namespace layout
} // namespace timeline
