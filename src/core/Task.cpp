#include "homework/core/Task.hpp"

namespace homework {
namespace core {

TaskKind taskKind(const TaskPayload &payload)
{
    return static_cast<TaskKind>(payload.index());
}

QString taskKindName(TaskKind kind)
{
    switch (kind) {
    case TaskKind::Load:
        return QStringLiteral("load");
    case TaskKind::Save:
        return QStringLiteral("save");
    case TaskKind::Add:
        return QStringLiteral("add");
    case TaskKind::Refresh:
        return QStringLiteral("refresh");
    case TaskKind::UpdateDerivedViews:
        return QStringLiteral("updateDerivedViews");
    case TaskKind::Query:
        return QStringLiteral("query");
    case TaskKind::Delete:
        return QStringLiteral("delete");
    case TaskKind::ClearAll:
        return QStringLiteral("clearAll");
    case TaskKind::MarkCompleted:
        return QStringLiteral("markCompleted");
    }
    return QStringLiteral("unknown");
}

} // namespace core
} // namespace homework
