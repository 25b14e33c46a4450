#include <QtTest/QtTest>

#include "homework/core/HomeworkViews.hpp"

using namespace homework;
using core::HomeworkRow;
using core::StatusTag;

namespace {
HomeworkRow makeRow(const QString &code, const QString &created, const QString &due, StatusTag tag,
                    data::HomeworkStatus status = data::HomeworkStatus::Pending)
{
    HomeworkRow row;
    row.item.code = code;
    row.item.createDate = created;
    row.item.dueDate = due;
    row.item.status = status;
    row.tag = tag;
    return row;
}

QStringList codesOf(const std::vector<HomeworkRow> &rows)
{
    QStringList codes;
    for (const auto &row : rows) {
        codes << row.item.code;
    }
    return codes;
}
} // namespace

class HomeworkViewsTest : public QObject
{
    Q_OBJECT

private slots:
    void sortsByUrgencyThenDueDate();
    void sortIsStableForEqualKeys();
    void hidesCompletedPastDueOnly();
    void aggregatesCountTagsAndDays();
};

void HomeworkViewsTest::sortsByUrgencyThenDueDate()
{
    std::vector<HomeworkRow> rows{
        makeRow("done", "01/03/2025", "20/03/2025", StatusTag::Completed),
        makeRow("later", "01/03/2025", "30/04/2025", StatusTag::Pending),
        makeRow("soon", "01/03/2025", "12/03/2025", StatusTag::DueSoon),
        makeRow("late2", "01/03/2025", "05/03/2025", StatusTag::Overdue),
        makeRow("today", "01/03/2025", "10/03/2025", StatusTag::DueToday),
        makeRow("late1", "01/03/2025", "01/03/2025", StatusTag::Overdue),
        makeRow("pending", "01/03/2025", "20/03/2025", StatusTag::Pending),
    };
    core::sortByUrgency(rows);
    QCOMPARE(codesOf(rows), (QStringList{ "today", "late1", "late2", "soon", "pending", "later", "done" }));
}

void HomeworkViewsTest::sortIsStableForEqualKeys()
{
    std::vector<HomeworkRow> rows{
        makeRow("first", "01/03/2025", "20/03/2025", StatusTag::Pending),
        makeRow("second", "01/03/2025", "20/03/2025", StatusTag::Pending),
        makeRow("third", "01/03/2025", "20/03/2025", StatusTag::Pending),
    };
    core::sortByUrgency(rows);
    QCOMPARE(codesOf(rows), (QStringList{ "first", "second", "third" }));
}

void HomeworkViewsTest::hidesCompletedPastDueOnly()
{
    const QDate today(2025, 3, 10);
    data::HomeworkItem item;
    item.dueDate = "09/03/2025";
    QVERIFY(core::isDisplayed(item, today)); // pending overdue stays visible

    item.status = data::HomeworkStatus::Completed;
    QVERIFY(!core::isDisplayed(item, today));

    item.dueDate = "10/03/2025";
    QVERIFY(core::isDisplayed(item, today));

    item.dueDate = "garbage";
    QVERIFY(core::isDisplayed(item, today));
}

void HomeworkViewsTest::aggregatesCountTagsAndDays()
{
    const QDate today(2025, 3, 10);
    std::vector<HomeworkRow> rows{
        makeRow("a", "08/03/2025", "10/03/2025", StatusTag::DueToday),
        makeRow("b", "10/03/2025", "09/03/2025", StatusTag::Overdue),
        makeRow("c", "10/03/2025", "11/03/2025", StatusTag::DueSoon),
        makeRow("d", "1/3/2025", "30/03/2025", StatusTag::Pending),
        makeRow("e", "01/03/2025", "20/03/2025", StatusTag::Completed, data::HomeworkStatus::Completed),
    };
    std::vector<data::HomeworkItem> items;
    for (const auto &row : rows) {
        items.push_back(row.item);
    }

    const core::Aggregates aggregates = core::computeAggregates(rows, items, today, 3);
    QCOMPARE(aggregates.total, 5);
    QCOMPARE(aggregates.statusCounts.dueToday, 1);
    QCOMPARE(aggregates.statusCounts.overdue, 1);
    QCOMPARE(aggregates.statusCounts.dueSoon, 1);
    QCOMPARE(aggregates.statusCounts.pending, 1);
    QCOMPARE(aggregates.statusCounts.completed, 1);

    QCOMPARE(aggregates.daily.size(), static_cast<std::size_t>(3));
    QCOMPARE(aggregates.daily[0].date, QDate(2025, 3, 8));
    QCOMPARE(aggregates.daily[0].created, 1);
    QCOMPARE(aggregates.daily[0].due, 0);
    QCOMPARE(aggregates.daily[1].date, QDate(2025, 3, 9));
    QCOMPARE(aggregates.daily[1].due, 1);
    QCOMPARE(aggregates.daily[2].date, today);
    QCOMPARE(aggregates.daily[2].created, 2);
    QCOMPARE(aggregates.daily[2].due, 1);
}

QTEST_GUILESS_MAIN(HomeworkViewsTest)
#include "HomeworkViewsTest.moc"
