#pragma once

#include <QDate>
#include <vector>

#include "homework/core/StatusClassifier.hpp"
#include "homework/data/Homework.hpp"

namespace homework {
namespace core {

struct HomeworkRow
{
    data::HomeworkItem item;
    StatusTag tag = StatusTag::Pending;
};

struct StatusCounts
{
    int pending = 0;
    int dueSoon = 0;
    int dueToday = 0;
    int overdue = 0;
    int completed = 0;
};

struct DailyCounts
{
    QDate date;
    int created = 0;
    int due = 0;
};

struct Aggregates
{
    int total = 0;
    StatusCounts statusCounts;
    // One entry per day of the chart window, oldest first.
    std::vector<DailyCounts> daily;
};

// Completed homework disappears from the list once its due date has passed.
bool isDisplayed(const data::HomeworkItem &item, const QDate &today);

// Most urgent first, then by due date. Equal keys keep their relative order.
void sortByUrgency(std::vector<HomeworkRow> &rows);

Aggregates computeAggregates(const std::vector<HomeworkRow> &displayedRows,
                             const std::vector<data::HomeworkItem> &allItems, const QDate &today,
                             int chartDays);

} // namespace core
} // namespace homework
