#pragma once

#include <QDate>
#include <QString>

#include "homework/data/Homework.hpp"

namespace homework {
namespace core {

enum class StatusTag
{
    Pending,
    DueSoon,
    DueToday,
    Overdue,
    Completed,
};

// Pure: depends on nothing but its arguments. An invalid dueDate classifies as Pending.
StatusTag classify(const QDate &dueDate, data::HomeworkStatus status, const QDate &today,
                   int remindDays);
StatusTag classify(const data::HomeworkItem &item, const QDate &today, int remindDays);

// Lower is more urgent: due today, overdue, due soon, pending, completed.
int urgencyWeight(StatusTag tag);

QString statusTagName(StatusTag tag);

} // namespace core
} // namespace homework
