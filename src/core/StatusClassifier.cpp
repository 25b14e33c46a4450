#include "homework/core/StatusClassifier.hpp"

#include "homework/data/DateFormat.hpp"

namespace homework {
namespace core {

StatusTag classify(const QDate &dueDate, data::HomeworkStatus status, const QDate &today,
                   int remindDays)
{
    if (status == data::HomeworkStatus::Completed) {
        return StatusTag::Completed;
    }
    if (!dueDate.isValid() || !today.isValid()) {
        return StatusTag::Pending;
    }
    const qint64 days = today.daysTo(dueDate);
    if (days < 0) {
        return StatusTag::Overdue;
    }
    if (days == 0) {
        return StatusTag::DueToday;
    }
    if (days <= remindDays) {
        return StatusTag::DueSoon;
    }
    return StatusTag::Pending;
}

StatusTag classify(const data::HomeworkItem &item, const QDate &today, int remindDays)
{
    return classify(data::parseDate(item.dueDate), item.status, today, remindDays);
}

int urgencyWeight(StatusTag tag)
{
    switch (tag) {
    case StatusTag::DueToday:
        return 0;
    case StatusTag::Overdue:
        return 1;
    case StatusTag::DueSoon:
        return 2;
    case StatusTag::Completed:
        return 4;
    case StatusTag::Pending:
    default:
        return 3;
    }
}

QString statusTagName(StatusTag tag)
{
    switch (tag) {
    case StatusTag::DueSoon:
        return QStringLiteral("due_soon");
    case StatusTag::DueToday:
        return QStringLiteral("due_today");
    case StatusTag::Overdue:
        return QStringLiteral("overdue");
    case StatusTag::Completed:
        return QStringLiteral("completed");
    case StatusTag::Pending:
    default:
        return QStringLiteral("pending");
    }
}

} // namespace core
} // namespace homework
