#include "homework/core/TaskCoordinator.hpp"

#include <QMutexLocker>

#include "homework/core/Logging.hpp"
#include "homework/core/TaskExecutor.hpp"

namespace homework {
namespace core {

TaskCoordinator::TaskCoordinator(int tickIntervalMs, QObject *parent)
    : QObject(parent)
{
    qRegisterMetaType<homework::core::TaskKind>("homework::core::TaskKind");
    m_timer.setInterval(tickIntervalMs > 0 ? tickIntervalMs : 50);
    connect(&m_timer, &QTimer::timeout, this, &TaskCoordinator::tick);
}

TaskCoordinator::~TaskCoordinator() = default;

void TaskCoordinator::setExecutor(TaskExecutor *executor)
{
    m_executor = executor;
}

void TaskCoordinator::start()
{
    m_timer.start();
}

void TaskCoordinator::stop()
{
    m_timer.stop();
    QMutexLocker locker(&m_mutex);
    if (!m_queue.empty()) {
        qCInfo(lcTasks) << "Discarding" << m_queue.size() << "queued tasks";
    }
    m_queue.clear();
}

quint64 TaskCoordinator::submit(TaskPayload payload)
{
    QMutexLocker locker(&m_mutex);
    Task task;
    task.id = m_nextId++;
    task.payload = std::move(payload);
    task.submittedAt = QDateTime::currentDateTime();
    qCDebug(lcTasks) << "Queued" << taskKindName(task.kind()) << "task" << task.id;
    m_queue.push_back(std::move(task));
    m_drainedReported = false;
    return m_nextId - 1;
}

int TaskCoordinator::queueDepth() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_queue.size());
}

std::optional<TaskKind> TaskCoordinator::currentTaskKind() const
{
    QMutexLocker locker(&m_mutex);
    if (!m_current) {
        return std::nullopt;
    }
    return m_current->kind();
}

void TaskCoordinator::post(std::function<void()> callback)
{
    if (!callback) {
        return;
    }
    QMutexLocker locker(&m_mutex);
    m_completions.push_back(std::move(callback));
}

TaskCoordinator::State TaskCoordinator::state() const
{
    QMutexLocker locker(&m_mutex);
    return m_current ? State::Busy : State::Idle;
}

bool TaskCoordinator::isDrained() const
{
    QMutexLocker locker(&m_mutex);
    return !m_current && m_queue.empty() && m_completions.empty();
}

void TaskCoordinator::complete(quint64 taskId, const TaskOutcome &outcome)
{
    std::optional<Task> finished;
    {
        QMutexLocker locker(&m_mutex);
        if (!m_current || m_current->id != taskId) {
            qCWarning(lcTasks) << "Ignoring completion for task" << taskId
                               << "which is not in flight";
            return;
        }
        finished = std::move(m_current);
        m_current.reset();
    }

    const TaskKind kind = finished->kind();
    const qint64 elapsed = finished->submittedAt.msecsTo(QDateTime::currentDateTime());
    if (outcome.ok) {
        qCDebug(lcTasks) << "Task" << taskId << taskKindName(kind) << "finished," << elapsed
                         << "ms after submission";
    } else {
        qCWarning(lcTasks) << "Task" << taskId << taskKindName(kind) << "failed:" << outcome.message;
        emit taskFailed(kind, outcome.message);
    }
    emit taskFinished(kind, outcome.ok);
}

void TaskCoordinator::tick()
{
    drainCompletions();
    dispatchNext();

    if (isDrained()) {
        QMutexLocker locker(&m_mutex);
        if (m_drainedReported) {
            return;
        }
        m_drainedReported = true;
        locker.unlock();
        emit drained();
    }
}

void TaskCoordinator::drainCompletions()
{
    std::deque<std::function<void()>> completions;
    {
        QMutexLocker locker(&m_mutex);
        completions.swap(m_completions);
    }
    for (auto &callback : completions) {
        callback();
    }
}

void TaskCoordinator::dispatchNext()
{
    Task task;
    {
        QMutexLocker locker(&m_mutex);
        if (m_current || m_queue.empty()) {
            return;
        }
        task = std::move(m_queue.front());
        m_queue.pop_front();
        m_current = task;
    }

    qCDebug(lcTasks) << "Dispatching" << taskKindName(task.kind()) << "task" << task.id;
    emit taskStarted(task.kind());
    if (!m_executor) {
        complete(task.id, TaskOutcome::failure(ErrorKind::Io, tr("No task executor installed")));
        return;
    }
    m_executor->execute(task);
}

} // namespace core
} // namespace homework
