#include "timeline/layout/TimeMapper.hpp"

#include <QDate>
#include <QTime>
#include <cmath>
#include <utility>

namespace timeline {
namespace layout {

std::optional<qint64> eventTimestamp(const data::TimelineEvent &event)
{
    const QDate date = QDate::fromString(event.date.trimmed(), Qt::ISODate);
    if (!date.isValid()) {
        return std::nullopt;
    }
    QTime time(0, 0);
    if (!event.time.isEmpty()) {
        const QTime parsed = QTime::fromString(event.time.trimmed(), QStringLiteral("HH:mm"));
        if (parsed.isValid()) {
            time = parsed;
        }
    }
    return QDateTime(date, time, Qt::UTC).toMSecsSinceEpoch();
}

QDateTime dateTimeFromTimestamp(qint64 timestamp)
{
    return QDateTime::fromMSecsSinceEpoch(timestamp, Qt::UTC);
}

TimeMapper::TimeMapper(qint64 visibleStart, qint64 visibleEnd, double left, double usableWidth)
    : m_visibleStart(visibleStart)
    , m_visibleEnd(visibleEnd)
    , m_left(left)
    , m_usableWidth(usableWidth)
{
}

TimeMapper TimeMapper::forWindow(qint64 rangeStart,
                                 qint64 rangeEnd,
                                 const ViewWindow &window,
                                 const LayoutGeometry &geometry)
{
    const ViewWindow clean = sanitizeWindow(window);
    const double span = static_cast<double>(rangeEnd - rangeStart);
    const qint64 visibleStart = rangeStart + qRound64(span * clean.viewStart);
    const qint64 visibleEnd = rangeStart + qRound64(span * clean.viewEnd);
    return TimeMapper(visibleStart, visibleEnd, geometry.leftEdge(), geometry.usableWidth());
}

ViewWindow TimeMapper::sanitizeWindow(const ViewWindow &window)
{
    if (!std::isfinite(window.viewStart) || !std::isfinite(window.viewEnd)) {
        return ViewWindow();
    }
    ViewWindow clean;
    clean.viewStart = qBound(0.0, window.viewStart, 1.0);
    clean.viewEnd = qBound(0.0, window.viewEnd, 1.0);
    if (clean.viewEnd < clean.viewStart) {
        std::swap(clean.viewStart, clean.viewEnd);
    }
    return clean;
}

double TimeMapper::xForTime(qint64 timestamp) const
{
    const qint64 duration = m_visibleEnd - m_visibleStart;
    if (duration <= 0) {
        return m_left + m_usableWidth / 2.0;
    }
    const double ratio = static_cast<double>(timestamp - m_visibleStart) / static_cast<double>(duration);
    return m_left + ratio * m_usableWidth;
}

bool TimeMapper::isVisible(qint64 timestamp) const
{
    return timestamp >= m_visibleStart && timestamp <= m_visibleEnd;
}

} // namespace layout
} // namespace timeline
