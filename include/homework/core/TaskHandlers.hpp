#pragma once

#include <QDate>
#include <QString>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "homework/core/HomeworkViews.hpp"
#include "homework/core/Task.hpp"
#include "homework/core/TaskExecutor.hpp"
#include "homework/data/Homework.hpp"
#include "homework/data/LoadPipeline.hpp"

class QThread;

namespace homework {
namespace data {
class HomeworkRepository;
}

namespace core {

class Presenter;
class StatusCache;
class TaskCoordinator;

struct HandlerOptions
{
    QString dataFilePath;
    data::PipelineOptions pipeline;
};

// One handler per task kind. Every handler runs on the coordinator thread;
// blocking work is moved to a worker that reports back through
// TaskCoordinator::post() and only touches copies of shared state.
class TaskHandlers : public TaskExecutor
{
public:
    using Clock = std::function<QDate()>;

    TaskHandlers(TaskCoordinator &coordinator, data::HomeworkRepository &repository,
                 StatusCache &cache, Presenter &presenter, HandlerOptions options);
    ~TaskHandlers() override;

    void execute(const Task &task) override;

    void setClock(Clock clock);
    const data::Settings &settings() const;
    void setSettings(data::Settings settings);

    // Joins the load pipeline and every worker thread still running.
    void waitForBackgroundWork();

private:
    void handle(const Task &task, const LoadTask &load);
    void handle(const Task &task, const SaveTask &save);
    void handle(const Task &task, const AddTask &add);
    void handle(const Task &task, const RefreshTask &refresh);
    void handle(const Task &task, const UpdateDerivedViewsTask &update);
    void handle(const Task &task, const QueryTask &query);
    void handle(const Task &task, const DeleteTask &remove);
    void handle(const Task &task, const ClearAllTask &clear);
    void handle(const Task &task, const MarkCompletedTask &mark);

    void presentPartialLoad(const std::vector<data::HomeworkItem> &items, double progress);
    void finishLoad(quint64 taskId, data::LoadedDocument document);
    void failLoad(quint64 taskId, const QString &message);
    void releasePipeline();

    void cascadeAfterMutation();
    // Recomputes every tag when forced or when the day changed since the last recompute.
    void recomputeStatusesIfStale(const QDate &today, int remindDays, bool force = false);
    std::vector<HomeworkRow> displayedRows(const QDate &today, const data::Settings &settings);
    void runInBackground(std::function<void()> work);
    void reapFinishedWorkers();
    QDate today() const;

    TaskCoordinator &m_coordinator;
    data::HomeworkRepository &m_repository;
    StatusCache &m_cache;
    Presenter &m_presenter;
    HandlerOptions m_options;
    data::Settings m_settings;
    // Settings of the document being loaded, known before its first batch.
    std::optional<data::Settings> m_loadingSettings;
    Clock m_clock;
    // Set after a document that exists failed to load; saving would replace it.
    bool m_documentUnreadable = false;
    std::unique_ptr<data::LoadPipeline> m_pipeline;
    std::vector<std::unique_ptr<QThread>> m_workers;
};

} // namespace core
} // namespace homework
