#include <QtTest/QtTest>

#include <limits>

#include "timeline/data/InMemoryEventRepository.hpp"
#include "timeline/ui/LayoutViewModel.hpp"

using namespace timeline;

class LayoutViewModelTest : public QObject
{
    Q_OBJECT

private slots:
    void coalescesRequests();
    void refreshRunsImmediately();
    void rejectedPassKeepsPreviousResult();
    void picksUpRepositoryChanges();
    void zoomAndPanStayInRange();
};

namespace {
data::TimelineEvent makeEvent(const QString &id, const QString &date)
{
    data::TimelineEvent event;
    event.id = id;
    event.date = date;
    event.title = id;
    return event;
}

void seed(data::InMemoryEventRepository &repo)
{
    QVERIFY(repo.addEvent(makeEvent(QStringLiteral("a"), QStringLiteral("2024-01-01"))));
    QVERIFY(repo.addEvent(makeEvent(QStringLiteral("b"), QStringLiteral("2024-06-01"))));
    QVERIFY(repo.addEvent(makeEvent(QStringLiteral("c"), QStringLiteral("2024-12-31"))));
}
} // namespace

void LayoutViewModelTest::coalescesRequests()
{
    data::InMemoryEventRepository repo;
    seed(repo);
    ui::LayoutViewModel model(repo);
    QSignalSpy spy(&model, &ui::LayoutViewModel::layoutChanged);

    model.setViewport({ 1600.0, 1000.0 });
    model.setViewWindow({ 0.0, 1.0 });
    model.requestLayout();
    model.requestLayout();
    QCOMPARE(spy.count(), 0);

    QTRY_COMPARE(spy.count(), 1);
    QTest::qWait(20);
    QCOMPARE(spy.count(), 1);
    QVERIFY(model.hasResult());
    QCOMPARE(model.result().telemetry.events.total, 3);
}

void LayoutViewModelTest::refreshRunsImmediately()
{
    data::InMemoryEventRepository repo;
    seed(repo);
    ui::LayoutViewModel model(repo);
    QSignalSpy spy(&model, &ui::LayoutViewModel::layoutChanged);

    model.setViewport({ 1600.0, 1000.0 });
    model.refresh();
    QCOMPARE(spy.count(), 1);
    QCOMPARE(model.result().cards.size(), std::size_t(3));

    // The pending request was dropped by the explicit refresh.
    QTest::qWait(20);
    QCOMPARE(spy.count(), 1);
}

void LayoutViewModelTest::rejectedPassKeepsPreviousResult()
{
    data::InMemoryEventRepository repo;
    seed(repo);
    ui::LayoutViewModel model(repo);
    QSignalSpy changed(&model, &ui::LayoutViewModel::layoutChanged);
    QSignalSpy rejected(&model, &ui::LayoutViewModel::layoutRejected);

    QVERIFY(!model.hasResult());
    QVERIFY(model.result().cards.empty());

    model.setViewport({ 1600.0, 1000.0 });
    model.refresh();
    QCOMPARE(changed.count(), 1);

    model.setViewport({ std::numeric_limits<double>::quiet_NaN(), 1000.0 });
    model.refresh();
    QCOMPARE(rejected.count(), 1);
    QCOMPARE(changed.count(), 1);
    QCOMPARE(model.result().cards.size(), std::size_t(3));
}

void LayoutViewModelTest::picksUpRepositoryChanges()
{
    data::InMemoryEventRepository repo;
    seed(repo);
    ui::LayoutViewModel model(repo);
    model.setViewport({ 1600.0, 1000.0 });
    model.refresh();
    QCOMPARE(model.result().telemetry.events.total, 3);

    QVERIFY(repo.removeEvent(QStringLiteral("b")));
    model.refresh();
    QCOMPARE(model.result().telemetry.events.total, 2);
}

void LayoutViewModelTest::zoomAndPanStayInRange()
{
    data::InMemoryEventRepository repo;
    ui::LayoutViewModel model(repo);

    model.zoom(0.5, 0.5);
    QCOMPARE(model.viewWindow().viewStart, 0.25);
    QCOMPARE(model.viewWindow().viewEnd, 0.75);

    model.pan(0.5);
    QCOMPARE(model.viewWindow().viewStart, 0.5);
    QCOMPARE(model.viewWindow().viewEnd, 1.0);

    model.pan(1.0);
    QCOMPARE(model.viewWindow().viewStart, 0.5);
    QCOMPARE(model.viewWindow().viewEnd, 1.0);

    model.zoom(10.0, 0.0);
    QCOMPARE(model.viewWindow().viewStart, 0.0);
    QCOMPARE(model.viewWindow().viewEnd, 1.0);

    model.setViewWindow({ 0.9, 0.2 });
    QCOMPARE(model.viewWindow().viewStart, 0.2);
    QCOMPARE(model.viewWindow().viewEnd, 0.9);
}

QTEST_GUILESS_MAIN(LayoutViewModelTest)
#include "LayoutViewModelTest.moc"
