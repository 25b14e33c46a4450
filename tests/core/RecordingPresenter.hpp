#pragma once

#include <QStringList>
#include <optional>
#include <vector>

#include "homework/core/Presenter.hpp"

// Keeps everything the core hands to the presentation layer.
class RecordingPresenter : public homework::core::Presenter
{
public:
    struct Notification
    {
        QString message;
        homework::core::Severity severity;
    };

    void notifyUser(const QString &message, homework::core::Severity severity) override
    {
        notifications.push_back({ message, severity });
    }

    void presentList(const std::vector<homework::core::HomeworkRow> &rows,
                     std::optional<double> progress) override
    {
        if (progress) {
            partialProgress.push_back(*progress);
            partialLists.push_back(rows);
            return;
        }
        lists.push_back(rows);
    }

    void presentAggregates(const homework::core::Aggregates &aggregates) override
    {
        this->aggregates.push_back(aggregates);
    }

    QStringList errors() const
    {
        QStringList result;
        for (const auto &notification : notifications) {
            if (notification.severity == homework::core::Severity::Error) {
                result << notification.message;
            }
        }
        return result;
    }

    QStringList lastListCodes() const
    {
        QStringList codes;
        if (!lists.empty()) {
            for (const auto &row : lists.back()) {
                codes << row.item.code;
            }
        }
        return codes;
    }

    std::vector<Notification> notifications;
    std::vector<std::vector<homework::core::HomeworkRow>> lists;
    std::vector<double> partialProgress;
    std::vector<std::vector<homework::core::HomeworkRow>> partialLists;
    std::vector<homework::core::Aggregates> aggregates;
};
