#pragma once

#include <QString>
#include <optional>
#include <vector>

#include "homework/core/HomeworkViews.hpp"

namespace homework {
namespace core {

enum class Severity
{
    Info,
    Warning,
    Error,
};

// Presentation side of the application. Called on the coordinator thread only.
class Presenter
{
public:
    virtual ~Presenter() = default;

    virtual void notifyUser(const QString &message, Severity severity) = 0;
    // progress is set while a load is still delivering partial results.
    virtual void presentList(const std::vector<HomeworkRow> &rows,
                             std::optional<double> progress) = 0;
    virtual void presentAggregates(const Aggregates &aggregates) = 0;
};

} // namespace core
} // namespace homework
