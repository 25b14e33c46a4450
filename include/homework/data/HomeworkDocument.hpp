#pragma once

#include <QJsonObject>
#include <QString>
#include <vector>

#include "homework/data/Homework.hpp"

namespace homework {
namespace data {

enum class DocumentShape
{
    Legacy,  // bare array of homework objects
    Current, // { "homeworks": [...], "settings": {...} }
};

class HomeworkDocument
{
public:
    explicit HomeworkDocument(QString filePath);

    const QString &filePath() const;

    // Always writes the current shape. The file is replaced atomically.
    bool write(const std::vector<HomeworkItem> &items, const Settings &settings,
               QString *errorMessage = nullptr) const;

    static QJsonObject itemToJson(const HomeworkItem &item);
    static HomeworkItem itemFromJson(const QJsonObject &object);
    static QJsonObject settingsToJson(const Settings &settings);
    static Settings settingsFromJson(const QJsonObject &object);
    static QString statusToString(HomeworkStatus status);
    static HomeworkStatus statusFromString(const QString &value);

private:
    QString m_filePath;
};

} // namespace data
} // namespace homework
