#include "homework/data/HomeworkDocument.hpp"

#include <QDir>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>

#include "homework/core/Logging.hpp"

namespace homework {
namespace data {

namespace {
constexpr auto KEY_HOMEWORKS = "homeworks";
constexpr auto KEY_SETTINGS = "settings";
constexpr auto KEY_REMIND_DAYS = "remind_days";
constexpr auto KEY_CHART_DAYS = "chart_days";

int boundedSetting(const QString &key, const QJsonValue &value, int fallback, int minimum,
                   int maximum)
{
    const double parsed = value.toDouble(fallback);
    if (!(parsed >= minimum && parsed <= maximum)) {
        qCWarning(lcStorage) << "Ignoring out of range setting" << key << value;
        return fallback;
    }
    return static_cast<int>(parsed);
}

void setError(QString *errorMessage, const QString &message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}
} // namespace

HomeworkDocument::HomeworkDocument(QString filePath)
    : m_filePath(std::move(filePath))
{
}

const QString &HomeworkDocument::filePath() const
{
    return m_filePath;
}

bool HomeworkDocument::write(const std::vector<HomeworkItem> &items, const Settings &settings,
                             QString *errorMessage) const
{
    if (m_filePath.isEmpty()) {
        setError(errorMessage, QStringLiteral("no document path configured"));
        return false;
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        setError(errorMessage, QStringLiteral("cannot create directory %1").arg(dir.path()));
        return false;
    }

    QJsonArray homeworks;
    for (const HomeworkItem &item : items) {
        homeworks.append(itemToJson(item));
    }
    QJsonObject root;
    root.insert(QLatin1String(KEY_HOMEWORKS), homeworks);
    root.insert(QLatin1String(KEY_SETTINGS), settingsToJson(settings));

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        setError(errorMessage, file.errorString());
        return false;
    }
    const QByteArray payload = QJsonDocument(root).toJson(QJsonDocument::Indented);
    if (file.write(payload) != payload.size()) {
        setError(errorMessage, file.errorString());
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        setError(errorMessage, file.errorString());
        return false;
    }
    qCDebug(lcStorage) << "Wrote" << items.size() << "records to" << m_filePath;
    return true;
}

QJsonObject HomeworkDocument::itemToJson(const HomeworkItem &item)
{
    QJsonObject object;
    object.insert(QStringLiteral("code"), item.code);
    object.insert(QStringLiteral("subject"), item.subject);
    object.insert(QStringLiteral("content"), item.content);
    object.insert(QStringLiteral("create_date"), item.createDate);
    object.insert(QStringLiteral("due_date"), item.dueDate);
    object.insert(QStringLiteral("status"), statusToString(item.status));
    return object;
}

HomeworkItem HomeworkDocument::itemFromJson(const QJsonObject &object)
{
    HomeworkItem item;
    item.code = object.value(QStringLiteral("code")).toString();
    item.subject = object.value(QStringLiteral("subject")).toString();
    item.content = object.value(QStringLiteral("content")).toString();
    item.createDate = object.value(QStringLiteral("create_date")).toString();
    item.dueDate = object.value(QStringLiteral("due_date")).toString();
    item.status = statusFromString(object.value(QStringLiteral("status")).toString());
    return item;
}

QJsonObject HomeworkDocument::settingsToJson(const Settings &settings)
{
    QJsonObject object = QJsonObject::fromVariantMap(settings.extra);
    object.insert(QLatin1String(KEY_REMIND_DAYS), settings.remindDays);
    object.insert(QLatin1String(KEY_CHART_DAYS), settings.chartDays);
    return object;
}

Settings HomeworkDocument::settingsFromJson(const QJsonObject &object)
{
    Settings settings;
    for (auto it = object.constBegin(); it != object.constEnd(); ++it) {
        if (it.key() == QLatin1String(KEY_REMIND_DAYS)) {
            settings.remindDays = boundedSetting(it.key(), it.value(), settings.remindDays,
                                                 MIN_REMIND_DAYS, MAX_REMIND_DAYS);
        } else if (it.key() == QLatin1String(KEY_CHART_DAYS)) {
            settings.chartDays = boundedSetting(it.key(), it.value(), settings.chartDays,
                                                MIN_CHART_DAYS, MAX_CHART_DAYS);
        } else if (!it.value().isObject() && !it.value().isArray()) {
            settings.extra.insert(it.key(), it.value().toVariant());
        }
    }
    return settings;
}

QString HomeworkDocument::statusToString(HomeworkStatus status)
{
    switch (status) {
    case HomeworkStatus::Completed:
        return QStringLiteral("completed");
    case HomeworkStatus::Pending:
    default:
        return QStringLiteral("pending");
    }
}

HomeworkStatus HomeworkDocument::statusFromString(const QString &value)
{
    if (value.compare(QLatin1String("completed"), Qt::CaseInsensitive) == 0) {
        return HomeworkStatus::Completed;
    }
    return HomeworkStatus::Pending;
}

} // namespace data
} // namespace homework
