#include "timeline/layout/Telemetry.hpp"

#include <QJsonArray>

namespace timeline {
namespace layout {

namespace {
int countFor(const std::map<CardType, int> &counts, CardType type)
{
    const auto it = counts.find(type);
    return it != counts.end() ? it->second : 0;
}

QJsonObject countsToJson(const std::map<CardType, int> &counts)
{
    QJsonObject object;
    for (const auto &[type, count] : counts) {
        object.insert(toString(type), count);
    }
    return object;
}

QJsonObject regionToJson(const RegionTelemetry &region)
{
    QJsonArray perColumn;
    for (int events : region.eventsPerHalfColumn) {
        perColumn.append(events);
    }
    QJsonObject object;
    object.insert(QStringLiteral("count"), region.count);
    object.insert(QStringLiteral("events"), region.events);
    object.insert(QStringLiteral("eventsPerHalfColumn"), perColumn);
    object.insert(QStringLiteral("totalCells"), region.totalCells);
    object.insert(QStringLiteral("usedCells"), region.usedCells);
    return object;
}
} // namespace

int LayoutTelemetry::degradedCount(CardType type) const
{
    return countFor(degradation.degradedCountByType, type);
}

int LayoutTelemetry::promotedCount(CardType type) const
{
    return countFor(degradation.promotedCountByType, type);
}

bool LayoutTelemetry::reconciles() const
{
    return cards.single + cards.multiContained + cards.summaryContained == events.total;
}

QJsonObject LayoutTelemetry::toJson() const
{
    QJsonObject eventsObject;
    eventsObject.insert(QStringLiteral("total"), events.total);
    eventsObject.insert(QStringLiteral("invalid"), events.invalid);
    eventsObject.insert(QStringLiteral("outsideView"), events.outsideView);

    QJsonObject halfColumnsObject;
    halfColumnsObject.insert(QStringLiteral("above"), regionToJson(halfColumns.above));
    halfColumnsObject.insert(QStringLiteral("below"), regionToJson(halfColumns.below));

    QJsonObject capacityObject;
    capacityObject.insert(QStringLiteral("totalCells"), capacity.totalCells);
    capacityObject.insert(QStringLiteral("usedCells"), capacity.usedCells);
    capacityObject.insert(QStringLiteral("utilization"), capacity.utilization);

    QJsonObject degradationObject;
    degradationObject.insert(QStringLiteral("degradedCountByType"), countsToJson(degradation.degradedCountByType));
    degradationObject.insert(QStringLiteral("promotedCountByType"), countsToJson(degradation.promotedCountByType));

    QJsonObject aggregationObject;
    aggregationObject.insert(QStringLiteral("totalAggregations"), aggregation.totalAggregations);
    aggregationObject.insert(QStringLiteral("eventsAggregated"), aggregation.eventsAggregated);

    QJsonObject cardsObject;
    cardsObject.insert(QStringLiteral("single"), cards.single);
    cardsObject.insert(QStringLiteral("multiContained"), cards.multiContained);
    cardsObject.insert(QStringLiteral("summaryContained"), cards.summaryContained);

    QJsonObject root;
    root.insert(QStringLiteral("events"), eventsObject);
    root.insert(QStringLiteral("halfColumns"), halfColumnsObject);
    root.insert(QStringLiteral("capacity"), capacityObject);
    root.insert(QStringLiteral("degradation"), degradationObject);
    root.insert(QStringLiteral("aggregation"), aggregationObject);
    root.insert(QStringLiteral("cards"), cardsObject);
    return root;
}

void TelemetryAggregator::addRegion(RegionTelemetry &region, const ColumnGroup &group)
{
    const int events = static_cast<int>(group.events.size());
    region.count += 1;
    region.events += events;
    region.eventsPerHalfColumn.push_back(events);
    region.totalCells += group.capacity;
    region.usedCells += group.usedCells;
}

LayoutTelemetry TelemetryAggregator::summarize(const std::vector<ColumnGroup> &groups,
                                               int invalidEvents,
                                               int outsideView) const
{
    LayoutTelemetry telemetry;
    telemetry.events.invalid = invalidEvents;
    telemetry.events.outsideView = outsideView;

    for (const auto &group : groups) {
        const int events = static_cast<int>(group.events.size());
        telemetry.events.total += events;
        addRegion(group.side == Region::Above ? telemetry.halfColumns.above : telemetry.halfColumns.below, group);

        const CardType groupType = cardTypeFor(group.state);
        if (groupType != CardType::Full) {
            telemetry.degradation.degradedCountByType[groupType] += events;
        }
        if (group.promoted) {
            telemetry.degradation.promotedCountByType[groupType] += events;
        }

        for (const auto &card : group.cards) {
            switch (card.type) {
            case CardType::Full:
            case CardType::Compact:
            case CardType::TitleOnly:
                telemetry.cards.single += card.eventIds.size();
                break;
            case CardType::MultiEvent:
                telemetry.aggregation.totalAggregations += 1;
                telemetry.aggregation.eventsAggregated += card.eventIds.size();
                telemetry.cards.multiContained += card.eventIds.size();
                break;
            }
        }
        telemetry.cards.summaryContained += static_cast<int>(group.overflowEvents.size());
    }

    const auto &above = telemetry.halfColumns.above;
    const auto &below = telemetry.halfColumns.below;
    telemetry.capacity.totalCells = above.totalCells + below.totalCells;
    telemetry.capacity.usedCells = above.usedCells + below.usedCells;
    if (telemetry.capacity.totalCells > 0) {
        telemetry.capacity.utilization = 100.0 * telemetry.capacity.usedCells / telemetry.capacity.totalCells;
    }
    return telemetry;
}

} // namespace layout
} // namespace timeline
