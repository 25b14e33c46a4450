#include <QtTest/QtTest>

#include "homework/core/StatusCache.hpp"
#include "homework/data/InMemoryHomeworkRepository.hpp"

using namespace homework;
using core::StatusTag;

namespace {
data::HomeworkItem makeItem(const QString &code, const QString &due)
{
    data::HomeworkItem item;
    item.code = code;
    item.subject = "Math";
    item.content = "Exercises";
    item.createDate = "01/03/2025";
    item.dueDate = due;
    return item;
}

const QDate kToday(2025, 3, 10);
} // namespace

class StatusCacheTest : public QObject
{
    Q_OBJECT

private slots:
    void recomputeAllMatchesClassifier();
    void missComputesAndInserts();
    void missingItemDefaultsToPending();
    void setAndInvalidate();
    void clearEmptiesMapping();
};

void StatusCacheTest::recomputeAllMatchesClassifier()
{
    data::InMemoryHomeworkRepository repo;
    repo.addHomework(makeItem("A", "09/03/2025"));
    repo.addHomework(makeItem("B", "10/03/2025"));
    repo.addHomework(makeItem("C", "12/03/2025"));
    repo.addHomework(makeItem("D", "01/04/2025"));

    core::StatusCache cache(repo);
    QVERIFY(!cache.lastRecomputeDate().isValid());
    cache.recomputeAll(kToday, 3);

    QCOMPARE(cache.size(), 4);
    QCOMPARE(cache.lastRecomputeDate(), kToday);
    for (const auto &item : repo.fetchAll()) {
        QVERIFY(cache.contains(item.code));
        QCOMPARE(cache.get(item.code, kToday, 3), core::classify(item, kToday, 3));
    }
}

void StatusCacheTest::missComputesAndInserts()
{
    data::InMemoryHomeworkRepository repo;
    repo.addHomework(makeItem("A", "09/03/2025"));
    core::StatusCache cache(repo);

    QVERIFY(!cache.contains("A"));
    QCOMPARE(cache.get("A", kToday, 3), StatusTag::Overdue);
    QVERIFY(cache.contains("A"));
}

void StatusCacheTest::missingItemDefaultsToPending()
{
    data::InMemoryHomeworkRepository repo;
    core::StatusCache cache(repo);
    QCOMPARE(cache.get("ghost", kToday, 3), StatusTag::Pending);
    QVERIFY(!cache.contains("ghost"));
}

void StatusCacheTest::setAndInvalidate()
{
    data::InMemoryHomeworkRepository repo;
    repo.addHomework(makeItem("A", "20/03/2025"));
    core::StatusCache cache(repo);
    cache.recomputeAll(kToday, 3);
    QCOMPARE(cache.get("A", kToday, 3), StatusTag::Pending);

    cache.set("A", StatusTag::Completed);
    QCOMPARE(cache.get("A", kToday, 3), StatusTag::Completed);

    cache.invalidate("A");
    QVERIFY(!cache.contains("A"));
    QCOMPARE(cache.get("A", kToday, 3), StatusTag::Pending);
}

void StatusCacheTest::clearEmptiesMapping()
{
    data::InMemoryHomeworkRepository repo;
    repo.addHomework(makeItem("A", "10/03/2025"));
    core::StatusCache cache(repo);
    cache.recomputeAll(kToday, 3);
    repo.clear();
    cache.clear();

    QCOMPARE(cache.size(), 0);
    QCOMPARE(cache.get("A", kToday, 3), StatusTag::Pending);
}

QTEST_GUILESS_MAIN(StatusCacheTest)
#include "StatusCacheTest.moc"
