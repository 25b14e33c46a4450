#include "homework/core/TaskHandlers.hpp"

#include <QFileInfo>
#include <QObject>
#include <QThread>
#include <algorithm>
#include <variant>

#include "homework/core/Logging.hpp"
#include "homework/core/Presenter.hpp"
#include "homework/core/StatusCache.hpp"
#include "homework/core/TaskCoordinator.hpp"
#include "homework/data/DateFormat.hpp"
#include "homework/data/HomeworkDocument.hpp"
#include "homework/data/HomeworkRepository.hpp"

namespace homework {
namespace core {

TaskHandlers::TaskHandlers(TaskCoordinator &coordinator, data::HomeworkRepository &repository,
                           StatusCache &cache, Presenter &presenter, HandlerOptions options)
    : m_coordinator(coordinator)
    , m_repository(repository)
    , m_cache(cache)
    , m_presenter(presenter)
    , m_options(std::move(options))
    , m_clock([]() { return QDate::currentDate(); })
{
}

TaskHandlers::~TaskHandlers()
{
    waitForBackgroundWork();
}

void TaskHandlers::execute(const Task &task)
{
    std::visit([this, &task](const auto &payload) { handle(task, payload); }, task.payload);
}

void TaskHandlers::setClock(Clock clock)
{
    if (clock) {
        m_clock = std::move(clock);
    }
}

const data::Settings &TaskHandlers::settings() const
{
    return m_settings;
}

void TaskHandlers::setSettings(data::Settings settings)
{
    m_settings = std::move(settings);
}

void TaskHandlers::waitForBackgroundWork()
{
    if (m_pipeline) {
        m_pipeline->wait();
    }
    for (auto &worker : m_workers) {
        worker->wait();
    }
    m_workers.clear();
}

void TaskHandlers::handle(const Task &task, const LoadTask &)
{
    releasePipeline();
    m_presenter.notifyUser(QObject::tr("Loading homework..."), Severity::Info);

    const quint64 taskId = task.id;
    m_loadingSettings.reset();
    data::LoadPipeline::Callbacks callbacks;
    callbacks.onHeader = [this](data::DocumentShape, const std::optional<data::Settings> &settings,
                                int totalCount) {
        qCDebug(lcPipeline) << "Document holds" << totalCount << "records";
        m_coordinator.post([this, settings]() { m_loadingSettings = settings; });
    };
    callbacks.onBatch = [](const data::PipelineBatch &batch, int loadedCount) {
        qCDebug(lcPipeline) << "Batch" << batch.sequence + 1 << "of" << batch.batchCount << '('
                            << loadedCount << '/' << batch.totalCount << ')';
    };
    callbacks.onPartialResult = [this](std::vector<data::HomeworkItem> items, double progress) {
        m_coordinator.post([this, items = std::move(items), progress]() {
            presentPartialLoad(items, progress);
        });
    };
    callbacks.onComplete = [this, taskId](data::LoadedDocument document) {
        m_coordinator.post([this, taskId, document = std::move(document)]() mutable {
            finishLoad(taskId, std::move(document));
        });
    };
    callbacks.onError = [this, taskId](const QString &message) {
        m_coordinator.post([this, taskId, message]() { failLoad(taskId, message); });
    };

    m_pipeline = std::make_unique<data::LoadPipeline>(m_options.dataFilePath, m_options.pipeline);
    m_pipeline->start(std::move(callbacks));
}

void TaskHandlers::presentPartialLoad(const std::vector<data::HomeworkItem> &items, double progress)
{
    const QDate today = this->today();
    const int remindDays = m_loadingSettings.value_or(m_settings).remindDays;
    std::vector<HomeworkRow> rows;
    rows.reserve(items.size());
    for (const auto &item : items) {
        if (isDisplayed(item, today)) {
            rows.push_back({ item, classify(item, today, remindDays) });
        }
    }
    sortByUrgency(rows);
    m_presenter.presentList(rows, progress);
}

void TaskHandlers::finishLoad(quint64 taskId, data::LoadedDocument document)
{
    releasePipeline();
    m_loadingSettings.reset();
    m_documentUnreadable = false;
    if (document.settings) {
        m_settings = *document.settings;
    }
    m_repository.replaceAll(std::move(document.items));
    m_cache.recomputeAll(today(), m_settings.remindDays);

    m_coordinator.submit(RefreshTask{});
    m_coordinator.submit(UpdateDerivedViewsTask{});

    const int loaded = m_repository.count();
    qCInfo(lcTasks) << "Loaded" << loaded << "homework records from" << m_options.dataFilePath
                    << (document.shape == data::DocumentShape::Legacy ? "(legacy format)" : "");
    if (loaded > 0) {
        m_presenter.notifyUser(QObject::tr("Loaded %1 homework records").arg(loaded), Severity::Info);
    }
    m_coordinator.complete(taskId, TaskOutcome::success());
}

void TaskHandlers::failLoad(quint64 taskId, const QString &message)
{
    releasePipeline();
    m_loadingSettings.reset();
    m_documentUnreadable = QFileInfo::exists(m_options.dataFilePath);
    m_repository.clear();
    m_cache.clear();
    m_coordinator.complete(taskId,
                           TaskOutcome::failure(ErrorKind::Io,
                                                QObject::tr("Failed to load homework: %1").arg(message)));
}

void TaskHandlers::releasePipeline()
{
    if (!m_pipeline) {
        return;
    }
    m_pipeline->wait();
    m_pipeline.reset();
}

void TaskHandlers::handle(const Task &task, const SaveTask &)
{
    if (m_documentUnreadable) {
        m_coordinator.complete(
            task.id, TaskOutcome::failure(ErrorKind::Io,
                                          QObject::tr("Not saving: %1 exists but could not be loaded")
                                              .arg(m_options.dataFilePath)));
        return;
    }

    const quint64 taskId = task.id;
    runInBackground([this, taskId, items = m_repository.fetchAll(), settings = m_settings,
                     path = m_options.dataFilePath]() {
        QString error;
        const bool ok = data::HomeworkDocument(path).write(items, settings, &error);
        m_coordinator.post([this, taskId, ok, error]() {
            if (ok) {
                m_coordinator.complete(taskId, TaskOutcome::success());
                return;
            }
            m_coordinator.complete(taskId,
                                   TaskOutcome::failure(ErrorKind::Io,
                                                        QObject::tr("Failed to save homework: %1")
                                                            .arg(error)));
        });
    });
}

void TaskHandlers::handle(const Task &task, const AddTask &add)
{
    const data::Settings settings = m_settings;
    data::HomeworkItem item;
    item.code = add.code.trimmed();
    item.subject = add.subject.trimmed();
    item.content = add.content.trimmed();
    item.createDate = add.createDate.trimmed();
    item.dueDate = add.dueDate.trimmed();

    if (item.code.isEmpty() || item.subject.isEmpty() || item.content.isEmpty()
        || item.createDate.isEmpty() || item.dueDate.isEmpty()) {
        m_coordinator.complete(task.id,
                               TaskOutcome::failure(ErrorKind::Validation,
                                                    QObject::tr("Please fill in all fields")));
        return;
    }

    const QDate created = data::parseDate(item.createDate);
    const QDate due = data::parseDate(item.dueDate);
    if (!created.isValid() || !due.isValid()) {
        m_coordinator.complete(
            task.id, TaskOutcome::failure(ErrorKind::Validation,
                                          QObject::tr("Invalid date format, use DD/MM/YYYY or D/M/YYYY")));
        return;
    }

    if (m_repository.contains(item.code)) {
        m_coordinator.complete(task.id,
                               TaskOutcome::failure(ErrorKind::Validation,
                                                    QObject::tr("Homework code '%1' already exists")
                                                        .arg(item.code)));
        return;
    }

    item.createDate = data::formatDate(created);
    item.dueDate = data::formatDate(due);
    item.status = data::HomeworkStatus::Pending;
    const QString code = item.code;
    const StatusTag tag = classify(due, item.status, today(), settings.remindDays);
    if (!m_repository.addHomework(std::move(item))) {
        m_coordinator.complete(task.id, TaskOutcome::failure(ErrorKind::Validation,
                                                             QObject::tr("Homework '%1' was rejected")
                                                                 .arg(code)));
        return;
    }
    m_cache.set(code, tag);

    cascadeAfterMutation();
    m_presenter.notifyUser(QObject::tr("Homework added"), Severity::Info);
    m_coordinator.complete(task.id, TaskOutcome::success());
}

void TaskHandlers::handle(const Task &task, const RefreshTask &refresh)
{
    const data::Settings settings = m_settings;
    const QDate today = this->today();
    recomputeStatusesIfStale(today, settings.remindDays, refresh.recomputeStatuses);

    const quint64 taskId = task.id;
    runInBackground([this, taskId, rows = displayedRows(today, settings)]() mutable {
        sortByUrgency(rows);
        m_coordinator.post([this, taskId, rows = std::move(rows)]() {
            m_presenter.presentList(rows, std::nullopt);
            m_coordinator.complete(taskId, TaskOutcome::success());
        });
    });
}

void TaskHandlers::handle(const Task &task, const UpdateDerivedViewsTask &)
{
    const data::Settings settings = m_settings;
    const QDate today = this->today();
    recomputeStatusesIfStale(today, settings.remindDays);
    const auto rows = displayedRows(today, settings);
    m_presenter.presentAggregates(
        computeAggregates(rows, m_repository.fetchAll(), today, settings.chartDays));
    m_coordinator.complete(task.id, TaskOutcome::success());
}

void TaskHandlers::handle(const Task &task, const QueryTask &query)
{
    const data::Settings settings = m_settings;
    const QDate queryDate = data::parseDate(query.date);
    if (!queryDate.isValid()) {
        m_coordinator.complete(task.id,
                               TaskOutcome::failure(ErrorKind::Validation,
                                                    QObject::tr("Invalid query date '%1'")
                                                        .arg(query.date)));
        return;
    }

    const QString wanted = data::formatDate(queryDate);
    const QDate today = this->today();
    recomputeStatusesIfStale(today, settings.remindDays);
    std::vector<HomeworkRow> rows;
    for (const auto &item : m_repository.fetchAll()) {
        const QString &field =
            query.field == QueryField::DueDate ? item.dueDate : item.createDate;
        if (data::normalizeDate(field) == wanted) {
            rows.push_back({ item, m_cache.get(item.code, today, settings.remindDays) });
        }
    }
    sortByUrgency(rows);
    m_presenter.presentList(rows, std::nullopt);

    const QString message = query.field == QueryField::DueDate
        ? QObject::tr("%1 homework due on %2")
        : QObject::tr("%1 homework created on %2");
    m_presenter.notifyUser(message.arg(rows.size()).arg(wanted), Severity::Info);
    m_coordinator.complete(task.id, TaskOutcome::success());
}

void TaskHandlers::handle(const Task &task, const DeleteTask &remove)
{
    if (remove.codes.isEmpty()) {
        m_coordinator.complete(task.id,
                               TaskOutcome::failure(ErrorKind::Validation,
                                                    QObject::tr("No homework selected")));
        return;
    }

    const int removed = m_repository.removeHomeworks(remove.codes);
    for (const QString &code : remove.codes) {
        m_cache.invalidate(code);
    }

    cascadeAfterMutation();
    m_presenter.notifyUser(QObject::tr("%1 homework deleted").arg(removed), Severity::Info);
    m_coordinator.complete(task.id, TaskOutcome::success());
}

void TaskHandlers::handle(const Task &task, const ClearAllTask &)
{
    m_repository.clear();
    m_cache.clear();
    data::clearDateCache();

    cascadeAfterMutation();
    m_presenter.notifyUser(QObject::tr("All homework cleared"), Severity::Info);
    m_coordinator.complete(task.id, TaskOutcome::success());
}

void TaskHandlers::handle(const Task &task, const MarkCompletedTask &mark)
{
    auto item = m_repository.findByCode(mark.code);
    if (!item) {
        m_coordinator.complete(task.id,
                               TaskOutcome::failure(ErrorKind::Validation,
                                                    QObject::tr("No homework with code '%1'")
                                                        .arg(mark.code)));
        return;
    }

    item->status = data::HomeworkStatus::Completed;
    m_repository.updateHomework(*item);
    m_cache.set(mark.code, StatusTag::Completed);

    cascadeAfterMutation();
    m_presenter.notifyUser(QObject::tr("Homework marked as completed"), Severity::Info);
    m_coordinator.complete(task.id, TaskOutcome::success());
}

void TaskHandlers::cascadeAfterMutation()
{
    m_coordinator.submit(SaveTask{});
    m_coordinator.submit(RefreshTask{});
    m_coordinator.submit(UpdateDerivedViewsTask{});
}

void TaskHandlers::recomputeStatusesIfStale(const QDate &today, int remindDays, bool force)
{
    if (force || m_cache.lastRecomputeDate() != today) {
        m_cache.recomputeAll(today, remindDays);
    }
}

std::vector<HomeworkRow> TaskHandlers::displayedRows(const QDate &today,
                                                     const data::Settings &settings)
{
    std::vector<HomeworkRow> rows;
    for (const auto &item : m_repository.fetchAll()) {
        if (isDisplayed(item, today)) {
            rows.push_back({ item, m_cache.get(item.code, today, settings.remindDays) });
        }
    }
    return rows;
}

void TaskHandlers::runInBackground(std::function<void()> work)
{
    reapFinishedWorkers();
    std::unique_ptr<QThread> worker(QThread::create(std::move(work)));
    worker->setObjectName(QStringLiteral("homework-worker"));
    worker->start();
    m_workers.push_back(std::move(worker));
}

void TaskHandlers::reapFinishedWorkers()
{
    m_workers.erase(std::remove_if(m_workers.begin(), m_workers.end(),
                                   [](const std::unique_ptr<QThread> &worker) {
                                       return worker->isFinished();
                                   }),
                    m_workers.end());
}

QDate TaskHandlers::today() const
{
    return m_clock();
}

} // namespace core
} // namespace homework
