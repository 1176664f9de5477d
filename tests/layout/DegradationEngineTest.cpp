#include <QtTest/QtTest>

#include <algorithm>
#include <limits>

#include "timeline/layout/DegradationEngine.hpp"
#include "timeline/layout/Telemetry.hpp"

using namespace timeline::layout;

class DegradationEngineTest : public QObject
{
    Q_OBJECT

private slots:
    void fewEventsStayFull();
    void overlappingEventsDegradeToCompact();
    void overflowKeepsEarliestEvents();
    void zeroCapacityOverflowsEverything();
    void promotesWhenUtilizationIsLow();
    void promotionStopsAtThreshold();
    void preferredStateHoldsAboveThreshold();
    void earlierEventsGetEqualOrBetterCards();
    void aggregatesIntoMultiEventCard();
    void placesCardsFromAxisOutward();
};

namespace {
const Viewport kViewport { 1600.0, 1000.0 };

ColumnGroup makeGroup(int eventCount, int capacity, Region side = Region::Above)
{
    ColumnGroup group;
    group.id = QStringLiteral("%1-0").arg(toString(side));
    group.side = side;
    group.startX = 200.0;
    group.endX = 540.0;
    group.capacity = capacity;
    for (int index = 0; index < eventCount; ++index) {
        TimedEvent timed;
        timed.event.id = QStringLiteral("e%1").arg(index, 2, 10, QLatin1Char('0'));
        timed.timestamp = 1000 * index;
        timed.x = 200.0;
        group.events.push_back(timed);
    }
    return group;
}

QStringList cardEventIds(const ColumnGroup &group)
{
    QStringList ids;
    for (const auto &card : group.cards) {
        ids << card.eventIds;
    }
    return ids;
}

bool cellsOverlap(const PositionedCard &lhs, const PositionedCard &rhs)
{
    return lhs.cellIndex < rhs.cellIndex + rhs.footprintCells && rhs.cellIndex < lhs.cellIndex + lhs.footprintCells;
}
} // namespace

void DegradationEngineTest::fewEventsStayFull()
{
    const LayoutConfig config;
    const DegradationEngine engine(config, LayoutGeometry(config, kViewport));
    const ColumnGroup group = engine.apply(makeGroup(2, 8));
    QCOMPARE(group.state, DegradationState::Full);
    QVERIFY(!group.promoted);
    QCOMPARE(group.cards.size(), std::size_t(2));
    QCOMPARE(group.usedCells, 8);
    QVERIFY(group.overflowEvents.empty());
}

void DegradationEngineTest::overlappingEventsDegradeToCompact()
{
    const LayoutConfig config;
    const DegradationEngine engine(config, LayoutGeometry(config, kViewport));
    const ColumnGroup group = engine.apply(makeGroup(3, 8));

    QCOMPARE(group.state, DegradationState::Compact);
    QCOMPARE(group.cards.size(), std::size_t(3));
    for (const auto &card : group.cards) {
        QCOMPARE(card.type, CardType::Compact);
        QCOMPARE(card.footprintCells, 2);
    }
    QCOMPARE(group.cards[0].cellIndex, 0);
    QCOMPARE(group.cards[1].cellIndex, 2);
    QCOMPARE(group.cards[2].cellIndex, 4);
    QCOMPARE(group.usedCells, 6);
    QVERIFY(group.overflowEvents.empty());
}

void DegradationEngineTest::overflowKeepsEarliestEvents()
{
    const LayoutConfig config;
    const DegradationEngine engine(config, LayoutGeometry(config, kViewport));
    const ColumnGroup group = engine.apply(makeGroup(10, 8));

    QCOMPARE(group.state, DegradationState::Overflowed);
    QCOMPARE(group.cards.size(), std::size_t(8));
    for (const auto &card : group.cards) {
        QCOMPARE(card.type, CardType::TitleOnly);
    }
    QCOMPARE(cardEventIds(group).front(), QStringLiteral("e00"));
    QCOMPARE(cardEventIds(group).back(), QStringLiteral("e07"));
    QCOMPARE(group.overflowEvents.size(), std::size_t(2));
    QCOMPARE(group.overflowEvents[0].event.id, QStringLiteral("e08"));
    QCOMPARE(group.overflowEvents[1].event.id, QStringLiteral("e09"));

    const LayoutTelemetry telemetry = TelemetryAggregator().summarize({ group }, 0, 0);
    QCOMPARE(telemetry.degradedCount(CardType::TitleOnly), 10);
    QCOMPARE(telemetry.cards.single, 8);
    QCOMPARE(telemetry.cards.summaryContained, 2);
    QVERIFY(telemetry.reconciles());
}

void DegradationEngineTest::zeroCapacityOverflowsEverything()
{
    const LayoutConfig config;
    const DegradationEngine engine(config, LayoutGeometry(config, kViewport));
    const ColumnGroup group = engine.apply(makeGroup(3, 0));
    QCOMPARE(group.state, DegradationState::Overflowed);
    QVERIFY(group.cards.empty());
    QCOMPARE(group.overflowEvents.size(), std::size_t(3));
    QCOMPARE(group.usedCells, 0);
}

void DegradationEngineTest::promotesWhenUtilizationIsLow()
{
    const LayoutConfig config;
    const DegradationEngine engine(config, LayoutGeometry(config, kViewport));
    ColumnGroup input = makeGroup(1, 8);
    input.preferredState = DegradationState::TitleOnly;

    const ColumnGroup group = engine.apply(input);
    QCOMPARE(group.state, DegradationState::Full);
    QVERIFY(group.promoted);
    QCOMPARE(group.cards.front().type, CardType::Full);

    const LayoutTelemetry telemetry = TelemetryAggregator().summarize({ group }, 0, 0);
    QCOMPARE(telemetry.promotedCount(CardType::Full), 1);
    QCOMPARE(telemetry.degradedCount(CardType::TitleOnly), 0);
}

void DegradationEngineTest::promotionStopsAtThreshold()
{
    const LayoutConfig config;
    const DegradationEngine engine(config, LayoutGeometry(config, kViewport));
    // 3 title-only cells of 8 is under 40%; 6 compact cells of 8 is not.
    const StateSelection selection = engine.selectState(3, 8, DegradationState::TitleOnly);
    QCOMPARE(selection.state, DegradationState::Compact);
    QVERIFY(selection.promoted);
}

void DegradationEngineTest::preferredStateHoldsAboveThreshold()
{
    const LayoutConfig config;
    const DegradationEngine engine(config, LayoutGeometry(config, kViewport));
    // 4 of 8 cells is 50%, so the group stays compact although full would fit.
    const StateSelection selection = engine.selectState(2, 8, DegradationState::Compact);
    QCOMPARE(selection.state, DegradationState::Compact);
    QVERIFY(!selection.promoted);

    QCOMPARE(engine.selectState(2, 8, DegradationState::Full).state, DegradationState::Full);
    QCOMPARE(engine.selectState(5, 8, DegradationState::Overflowed).state, DegradationState::TitleOnly);
}

void DegradationEngineTest::earlierEventsGetEqualOrBetterCards()
{
    LayoutConfig config;
    config.aggregationEnabled = true;
    const DegradationEngine engine(config, LayoutGeometry(config, kViewport));

    ColumnGroup input = makeGroup(12, 8);
    std::reverse(input.events.begin(), input.events.end());
    const ColumnGroup group = engine.apply(input);

    qint64 previousTimestamp = std::numeric_limits<qint64>::min();
    int previousRank = detailRank(CardType::Full);
    for (const auto &card : group.cards) {
        for (const auto &id : card.eventIds) {
            const auto it = std::find_if(group.events.begin(), group.events.end(), [&id](const TimedEvent &event) {
                return event.event.id == id;
            });
            QVERIFY(it != group.events.end());
            QVERIFY(it->timestamp >= previousTimestamp);
            previousTimestamp = it->timestamp;
        }
        QVERIFY(detailRank(card.type) <= previousRank);
        previousRank = detailRank(card.type);
    }
    for (const auto &overflow : group.overflowEvents) {
        QVERIFY(overflow.timestamp >= previousTimestamp);
    }
    for (std::size_t lhs = 0; lhs < group.cards.size(); ++lhs) {
        for (std::size_t rhs = lhs + 1; rhs < group.cards.size(); ++rhs) {
            QVERIFY(!cellsOverlap(group.cards[lhs], group.cards[rhs]));
        }
    }
}

void DegradationEngineTest::aggregatesIntoMultiEventCard()
{
    LayoutConfig config;
    config.aggregationEnabled = true;
    const DegradationEngine engine(config, LayoutGeometry(config, kViewport));
    const ColumnGroup group = engine.apply(makeGroup(12, 8));

    QCOMPARE(group.state, DegradationState::Overflowed);
    QCOMPARE(group.cards.size(), std::size_t(7));
    const PositionedCard &multi = group.cards.back();
    QCOMPARE(multi.type, CardType::MultiEvent);
    QCOMPARE(multi.cellIndex, 6);
    QCOMPARE(multi.footprintCells, 2);
    QCOMPARE(multi.eventIds, QStringList({ QStringLiteral("e06"), QStringLiteral("e07"), QStringLiteral("e08"),
                                           QStringLiteral("e09"), QStringLiteral("e10") }));
    QCOMPARE(group.overflowEvents.size(), std::size_t(1));
    QCOMPARE(group.usedCells, 8);

    const LayoutTelemetry telemetry = TelemetryAggregator().summarize({ group }, 0, 0);
    QCOMPARE(telemetry.aggregation.totalAggregations, 1);
    QCOMPARE(telemetry.aggregation.eventsAggregated, 5);
    QCOMPARE(telemetry.cards.single, 6);
    QCOMPARE(telemetry.cards.multiContained, 5);
    QCOMPARE(telemetry.cards.summaryContained, 1);
    QVERIFY(telemetry.reconciles());
}

void DegradationEngineTest::placesCardsFromAxisOutward()
{
    const LayoutConfig config;
    const LayoutGeometry geometry(config, kViewport);
    QCOMPARE(geometry.timelineY(), 550.0);
    const DegradationEngine engine(config, geometry);

    const ColumnGroup above = engine.apply(makeGroup(2, 8, Region::Above));
    QCOMPARE(above.cards[0].x, 200.0);
    QCOMPARE(above.cards[0].width, 260.0);
    QCOMPARE(above.cards[0].height, 164.0);
    QCOMPARE(above.cards[0].y, 550.0 - 48.0 - 164.0);
    QCOMPARE(above.cards[1].y, 550.0 - 48.0 - 176.0 - 164.0);

    const ColumnGroup below = engine.apply(makeGroup(2, 8, Region::Below));
    QCOMPARE(below.cards[0].y, 550.0 + 55.0);
    QCOMPARE(below.cards[1].y, 550.0 + 55.0 + 176.0);
    QCOMPARE(below.cards[0].id, QStringLiteral("below-0-0"));
}

QTEST_GUILESS_MAIN(DegradationEngineTest)
#include "DegradationEngineTest.moc"
