#pragma once

#include <QString>
#include <QVariantMap>

namespace homework {
namespace data {

enum class HomeworkStatus
{
    Pending,
    Completed,
};

struct HomeworkItem
{
    QString code;
    QString subject;
    QString content;
    QString createDate;
    QString dueDate;
    HomeworkStatus status = HomeworkStatus::Pending;
};

// Accepted ranges for the document settings; anything outside reads as the default.
constexpr int MIN_REMIND_DAYS = 1;
constexpr int MAX_REMIND_DAYS = 7;
constexpr int MIN_CHART_DAYS = 3;
constexpr int MAX_CHART_DAYS = 14;

struct Settings
{
    int remindDays = 3;
    int chartDays = 5;
    // Remaining scalars of the document's settings map, written back unchanged.
    QVariantMap extra;
};

} // namespace data
} // namespace homework
