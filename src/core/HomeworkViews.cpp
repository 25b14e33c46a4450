#include "homework/core/HomeworkViews.hpp"

#include <QHash>
#include <algorithm>

#include "homework/data/DateFormat.hpp"

namespace homework {
namespace core {

bool isDisplayed(const data::HomeworkItem &item, const QDate &today)
{
    if (item.status != data::HomeworkStatus::Completed) {
        return true;
    }
    const QDate due = data::parseDate(item.dueDate);
    if (!due.isValid()) {
        return true;
    }
    return due >= today;
}

void sortByUrgency(std::vector<HomeworkRow> &rows)
{
    struct Key
    {
        int weight;
        QDate due;
    };
    std::vector<std::pair<Key, HomeworkRow>> keyed;
    keyed.reserve(rows.size());
    for (auto &row : rows) {
        const Key key{ urgencyWeight(row.tag), data::parseDate(row.item.dueDate) };
        keyed.emplace_back(key, std::move(row));
    }
    std::stable_sort(keyed.begin(), keyed.end(), [](const auto &lhs, const auto &rhs) {
        if (lhs.first.weight != rhs.first.weight) {
            return lhs.first.weight < rhs.first.weight;
        }
        // Unparseable dates (invalid QDate) sort first.
        if (lhs.first.due.isValid() != rhs.first.due.isValid()) {
            return !lhs.first.due.isValid();
        }
        return lhs.first.due < rhs.first.due;
    });
    rows.clear();
    for (auto &entry : keyed) {
        rows.push_back(std::move(entry.second));
    }
}

Aggregates computeAggregates(const std::vector<HomeworkRow> &displayedRows,
                             const std::vector<data::HomeworkItem> &allItems, const QDate &today,
                             int chartDays)
{
    Aggregates aggregates;
    aggregates.total = static_cast<int>(displayedRows.size());
    for (const auto &row : displayedRows) {
        switch (row.tag) {
        case StatusTag::Completed:
            ++aggregates.statusCounts.completed;
            break;
        case StatusTag::Overdue:
            ++aggregates.statusCounts.overdue;
            break;
        case StatusTag::DueToday:
            ++aggregates.statusCounts.dueToday;
            break;
        case StatusTag::DueSoon:
            ++aggregates.statusCounts.dueSoon;
            break;
        case StatusTag::Pending:
            ++aggregates.statusCounts.pending;
            break;
        }
    }

    if (chartDays <= 0 || !today.isValid()) {
        return aggregates;
    }
    QHash<QDate, std::size_t> dayIndex;
    aggregates.daily.reserve(static_cast<std::size_t>(chartDays));
    for (int offset = chartDays - 1; offset >= 0; --offset) {
        DailyCounts day;
        day.date = today.addDays(-offset);
        dayIndex.insert(day.date, aggregates.daily.size());
        aggregates.daily.push_back(day);
    }
    for (const auto &item : allItems) {
        const auto created = dayIndex.constFind(data::parseDate(item.createDate));
        if (created != dayIndex.constEnd()) {
            ++aggregates.daily[created.value()].created;
        }
        const auto due = dayIndex.constFind(data::parseDate(item.dueDate));
        if (due != dayIndex.constEnd()) {
            ++aggregates.daily[due.value()].due;
        }
    }
    return aggregates;
}

} // namespace core
} // namespace homework
