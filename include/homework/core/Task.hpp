#pragma once

#include <QDateTime>
#include <QMetaType>
#include <QSet>
#include <QString>
#include <variant>

namespace homework {
namespace core {

struct LoadTask
{
};

struct SaveTask
{
};

struct AddTask
{
    QString code;
    QString subject;
    QString content;
    QString createDate;
    QString dueDate;
};

struct RefreshTask
{
    // Rebuild every cached status tag before building the view.
    bool recomputeStatuses = false;
};

struct UpdateDerivedViewsTask
{
};

enum class QueryField
{
    DueDate,
    CreateDate,
};

struct QueryTask
{
    QString date;
    QueryField field = QueryField::DueDate;
};

struct DeleteTask
{
    QSet<QString> codes;
};

struct ClearAllTask
{
};

struct MarkCompletedTask
{
    QString code;
};

// Alternatives are listed in TaskKind order.
using TaskPayload = std::variant<LoadTask, SaveTask, AddTask, RefreshTask, UpdateDerivedViewsTask,
                                 QueryTask, DeleteTask, ClearAllTask, MarkCompletedTask>;

enum class TaskKind
{
    Load,
    Save,
    Add,
    Refresh,
    UpdateDerivedViews,
    Query,
    Delete,
    ClearAll,
    MarkCompleted,
};

static_assert(std::variant_size<TaskPayload>::value == static_cast<std::size_t>(TaskKind::MarkCompleted) + 1,
              "TaskPayload and TaskKind must list the same kinds");

TaskKind taskKind(const TaskPayload &payload);
QString taskKindName(TaskKind kind);

struct Task
{
    quint64 id = 0;
    TaskPayload payload;
    QDateTime submittedAt;

    TaskKind kind() const { return taskKind(payload); }
};

enum class ErrorKind
{
    Validation,
    Io,
};

struct TaskOutcome
{
    bool ok = true;
    ErrorKind errorKind = ErrorKind::Validation;
    QString message;

    static TaskOutcome success() { return {}; }
    static TaskOutcome failure(ErrorKind kind, QString message)
    {
        return { false, kind, std::move(message) };
    }
};

} // namespace core
} // namespace homework

Q_DECLARE_METATYPE(homework::core::TaskKind)
