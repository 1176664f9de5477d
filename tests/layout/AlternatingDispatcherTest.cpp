#include <QtTest/QtTest>

#include "timeline/layout/AlternatingDispatcher.hpp"

using namespace timeline::layout;

class AlternatingDispatcherTest : public QObject
{
    Q_OBJECT

private slots:
    void alternatesStartingAbove();
    void ordersByTimestampThenId();
    void emptyInput();
};

namespace {
TimedEvent makeTimed(const QString &id, qint64 timestamp)
{
    TimedEvent timed;
    timed.event.id = id;
    timed.timestamp = timestamp;
    return timed;
}

QStringList idsOf(const std::vector<TimedEvent> &events)
{
    QStringList ids;
    for (const auto &event : events) {
        ids << event.event.id;
    }
    return ids;
}
} // namespace

void AlternatingDispatcherTest::alternatesStartingAbove()
{
    const AlternatingDispatcher dispatcher;
    const auto result = dispatcher.dispatch({ makeTimed(QStringLiteral("a"), 10),
                                              makeTimed(QStringLiteral("b"), 20),
                                              makeTimed(QStringLiteral("c"), 30),
                                              makeTimed(QStringLiteral("d"), 40),
                                              makeTimed(QStringLiteral("e"), 50) });
    QCOMPARE(idsOf(result.above), QStringList({ QStringLiteral("a"), QStringLiteral("c"), QStringLiteral("e") }));
    QCOMPARE(idsOf(result.below), QStringList({ QStringLiteral("b"), QStringLiteral("d") }));
}

void AlternatingDispatcherTest::ordersByTimestampThenId()
{
    const AlternatingDispatcher dispatcher;
    const auto result = dispatcher.dispatch({ makeTimed(QStringLiteral("z"), 30),
                                              makeTimed(QStringLiteral("b"), 10),
                                              makeTimed(QStringLiteral("a"), 10),
                                              makeTimed(QStringLiteral("m"), 20) });
    QCOMPARE(idsOf(result.above), QStringList({ QStringLiteral("a"), QStringLiteral("m") }));
    QCOMPARE(idsOf(result.below), QStringList({ QStringLiteral("b"), QStringLiteral("z") }));

    // Same input in another order gives the same split.
    const auto shuffled = dispatcher.dispatch({ makeTimed(QStringLiteral("a"), 10),
                                                makeTimed(QStringLiteral("m"), 20),
                                                makeTimed(QStringLiteral("z"), 30),
                                                makeTimed(QStringLiteral("b"), 10) });
    QCOMPARE(idsOf(shuffled.above), idsOf(result.above));
    QCOMPARE(idsOf(shuffled.below), idsOf(result.below));
}

void AlternatingDispatcherTest::emptyInput()
{
    const auto result = AlternatingDispatcher().dispatch({});
    QVERIFY(result.above.empty());
    QVERIFY(result.below.empty());
}

QTEST_GUILESS_MAIN(AlternatingDispatcherTest)
#include "AlternatingDispatcherTest.moc"
