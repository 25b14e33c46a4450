#pragma once

#include <QString>

class QSettings;

namespace homework {
namespace core {

struct AppConfig
{
    QString dataFile;
    int tickIntervalMs = 50;
    int statusRefreshIntervalMs = 60 * 60 * 1000;
    int batchSize = 100;
    int channelCapacity = 50;
    int eagerBatches = 3;

    static QString defaultDataFile();
    // Missing or non-positive values fall back to the defaults above.
    static AppConfig load(const QSettings &settings);
    void store(QSettings &settings) const;
};

} // namespace core
} // namespace homework
