#include "homework/core/Logging.hpp"

namespace homework {

Q_LOGGING_CATEGORY(lcTasks, "homework.tasks")
Q_LOGGING_CATEGORY(lcPipeline, "homework.pipeline")
Q_LOGGING_CATEGORY(lcStorage, "homework.storage")
Q_LOGGING_CATEGORY(lcApp, "homework.app")

} // namespace homework
