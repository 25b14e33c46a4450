#pragma once

namespace homework {
namespace core {

struct Task;

class TaskExecutor
{
public:
    virtual ~TaskExecutor() = default;
    // Must eventually lead to TaskCoordinator::complete(task.id, ...), either
    // before returning or from a callback posted back to the coordinator.
    virtual void execute(const Task &task) = 0;
};

} // namespace core
} // namespace homework
