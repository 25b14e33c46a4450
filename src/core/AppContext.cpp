#include "homework/core/AppContext.hpp"

#include <QTimer>

#include "homework/core/Logging.hpp"
#include "homework/core/Presenter.hpp"
#include "homework/core/StatusCache.hpp"
#include "homework/core/TaskCoordinator.hpp"
#include "homework/core/TaskHandlers.hpp"
#include "homework/data/InMemoryHomeworkRepository.hpp"

namespace homework {
namespace core {

namespace {
HandlerOptions handlerOptions(const AppConfig &config)
{
    HandlerOptions options;
    options.dataFilePath = config.dataFile;
    options.pipeline.batchSize = config.batchSize;
    options.pipeline.channelCapacity = config.channelCapacity;
    options.pipeline.eagerBatches = config.eagerBatches;
    return options;
}
} // namespace

AppContext::AppContext(AppConfig config, Presenter &presenter)
    : m_config(std::move(config))
    , m_repository(std::make_unique<data::InMemoryHomeworkRepository>())
    , m_statusCache(std::make_unique<StatusCache>(*m_repository))
    , m_coordinator(std::make_unique<TaskCoordinator>(m_config.tickIntervalMs))
    , m_handlers(std::make_unique<TaskHandlers>(*m_coordinator, *m_repository, *m_statusCache,
                                                presenter, handlerOptions(m_config)))
    , m_statusRefreshTimer(std::make_unique<QTimer>())
{
    m_coordinator->setExecutor(m_handlers.get());
    QObject::connect(m_coordinator.get(), &TaskCoordinator::taskFailed, m_coordinator.get(),
                     [&presenter](TaskKind, const QString &message) {
                         presenter.notifyUser(message, Severity::Error);
                     });

    m_statusRefreshTimer->setInterval(m_config.statusRefreshIntervalMs);
    QObject::connect(m_statusRefreshTimer.get(), &QTimer::timeout, m_coordinator.get(), [this]() {
        qCDebug(lcApp) << "Periodic status recompute";
        m_coordinator->submit(RefreshTask{ true });
        m_coordinator->submit(UpdateDerivedViewsTask{});
    });
}

AppContext::~AppContext()
{
    stop();
}

void AppContext::start()
{
    qCInfo(lcApp) << "Using homework document" << m_config.dataFile;
    m_coordinator->start();
    m_statusRefreshTimer->start();
}

void AppContext::stop()
{
    m_statusRefreshTimer->stop();
    m_coordinator->stop();
}

const AppConfig &AppContext::config() const
{
    return m_config;
}

data::HomeworkRepository &AppContext::repository()
{
    return *m_repository;
}

StatusCache &AppContext::statusCache()
{
    return *m_statusCache;
}

TaskCoordinator &AppContext::coordinator()
{
    return *m_coordinator;
}

TaskHandlers &AppContext::handlers()
{
    return *m_handlers;
}

} // namespace core
} // namespace homework
