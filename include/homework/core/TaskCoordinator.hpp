#pragma once

#include <QMutex>
#include <QObject>
#include <QTimer>
#include <deque>
#include <functional>
#include <optional>

#include "homework/core/Task.hpp"

namespace homework {
namespace core {

class TaskExecutor;

// Runs at most one task at a time, in submission order. A task stays in
// flight until its handler calls complete(), which may happen after
// background work has posted its result back through post().
class TaskCoordinator : public QObject
{
    Q_OBJECT

public:
    enum class State
    {
        Idle,
        Busy,
    };

    explicit TaskCoordinator(int tickIntervalMs = 50, QObject *parent = nullptr);
    ~TaskCoordinator() override;

    void setExecutor(TaskExecutor *executor);

    void start();
    // Stops ticking and discards tasks that have not been dispatched yet.
    void stop();

    // Thread-safe.
    quint64 submit(TaskPayload payload);
    int queueDepth() const;
    std::optional<TaskKind> currentTaskKind() const;
    void post(std::function<void()> callback);

    State state() const;
    bool isDrained() const;

    // Coordinator thread only.
    void complete(quint64 taskId, const TaskOutcome &outcome);

public slots:
    void tick();

signals:
    void taskStarted(homework::core::TaskKind kind);
    void taskFinished(homework::core::TaskKind kind, bool succeeded);
    void taskFailed(homework::core::TaskKind kind, const QString &message);
    void drained();

private:
    void drainCompletions();
    void dispatchNext();

    QTimer m_timer;
    TaskExecutor *m_executor = nullptr;

    mutable QMutex m_mutex;
    std::deque<Task> m_queue;
    std::deque<std::function<void()>> m_completions;
    std::optional<Task> m_current;
    quint64 m_nextId = 1;
    bool m_drainedReported = true;
};

} // namespace core
} // namespace homework
