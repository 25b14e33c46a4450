#pragma once

#include <memory>

#include "homework/core/AppConfig.hpp"

class QTimer;

namespace homework {
namespace data {
class HomeworkRepository;
}

namespace core {

class Presenter;
class StatusCache;
class TaskCoordinator;
class TaskHandlers;

class AppContext
{
public:
    AppContext(AppConfig config, Presenter &presenter);
    ~AppContext();

    // Starts the coordinator tick and the periodic status recompute.
    void start();
    void stop();

    const AppConfig &config() const;
    data::HomeworkRepository &repository();
    StatusCache &statusCache();
    TaskCoordinator &coordinator();
    TaskHandlers &handlers();

private:
    AppConfig m_config;
    std::unique_ptr<data::HomeworkRepository> m_repository;
    std::unique_ptr<StatusCache> m_statusCache;
    std::unique_ptr<TaskCoordinator> m_coordinator;
    std::unique_ptr<TaskHandlers> m_handlers;
    std::unique_ptr<QTimer> m_statusRefreshTimer;
};

} // namespace core
} // namespace homework
