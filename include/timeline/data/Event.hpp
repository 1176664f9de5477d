#pragma once

#include <QString>
#include <QStringList>

namespace timeline {
namespace data {

struct TimelineEvent
{
    QString id;
    QString date;    // ISO yyyy-MM-dd
    QString endDate; // optional, same format
    QString time;    // optional HH:mm
    QString title;
    QString description;
    QStringList sources;
};

} // namespace data
} // namespace timeline
