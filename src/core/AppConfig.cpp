#include "homework/core/AppConfig.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>

namespace homework {
namespace core {

namespace {
constexpr auto KEY_DATA_FILE = "storage/dataFile";
constexpr auto KEY_TICK_INTERVAL = "scheduler/tickIntervalMs";
constexpr auto KEY_STATUS_REFRESH = "scheduler/statusRefreshIntervalMs";
constexpr auto KEY_BATCH_SIZE = "pipeline/batchSize";
constexpr auto KEY_CHANNEL_CAPACITY = "pipeline/channelCapacity";
constexpr auto KEY_EAGER_BATCHES = "pipeline/eagerBatches";

int positiveValue(const QSettings &settings, const char *key, int fallback)
{
    bool ok = false;
    const int value = settings.value(QLatin1String(key)).toInt(&ok);
    return ok && value > 0 ? value : fallback;
}
} // namespace

QString AppConfig::defaultDataFile()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/homework-record");
    }
    return QDir(storageFolder).filePath(QStringLiteral("homework_data.json"));
}

AppConfig AppConfig::load(const QSettings &settings)
{
    const AppConfig defaults;
    AppConfig config;
    config.dataFile = settings.value(QLatin1String(KEY_DATA_FILE)).toString();
    if (config.dataFile.isEmpty()) {
        config.dataFile = defaultDataFile();
    }
    config.tickIntervalMs = positiveValue(settings, KEY_TICK_INTERVAL, defaults.tickIntervalMs);
    config.statusRefreshIntervalMs =
        positiveValue(settings, KEY_STATUS_REFRESH, defaults.statusRefreshIntervalMs);
    config.batchSize = positiveValue(settings, KEY_BATCH_SIZE, defaults.batchSize);
    config.channelCapacity = positiveValue(settings, KEY_CHANNEL_CAPACITY, defaults.channelCapacity);
    config.eagerBatches = positiveValue(settings, KEY_EAGER_BATCHES, defaults.eagerBatches);
    return config;
}

void AppConfig::store(QSettings &settings) const
{
    settings.setValue(QLatin1String(KEY_DATA_FILE), dataFile);
    settings.setValue(QLatin1String(KEY_TICK_INTERVAL), tickIntervalMs);
    settings.setValue(QLatin1String(KEY_STATUS_REFRESH), statusRefreshIntervalMs);
    settings.setValue(QLatin1String(KEY_BATCH_SIZE), batchSize);
    settings.setValue(QLatin1String(KEY_CHANNEL_CAPACITY), channelCapacity);
    settings.setValue(QLatin1String(KEY_EAGER_BATCHES), eagerBatches);
}

} // namespace core
} // namespace homework
