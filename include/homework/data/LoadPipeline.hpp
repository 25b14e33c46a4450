#pragma once

#include <QJsonArray>
#include <QString>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "homework/core/BoundedChannel.hpp"
#include "homework/data/Homework.hpp"
#include "homework/data/HomeworkDocument.hpp"

class QThread;

namespace homework {
namespace data {

struct PipelineBatch
{
    int sequence = 0;
    int batchCount = 0;
    int totalCount = 0;
    bool terminal = false;
    QJsonArray records;
    std::vector<HomeworkItem> items;
};

struct PipelineMessage
{
    enum class Type
    {
        Header,
        Batch,
        Complete,
        Error,
        End,
    };

    Type type = Type::End;
    PipelineBatch batch;
    int totalCount = 0;
    DocumentShape shape = DocumentShape::Current;
    std::optional<Settings> settings;
    QString error;
};

struct LoadedDocument
{
    std::vector<HomeworkItem> items;
    DocumentShape shape = DocumentShape::Current;
    std::optional<Settings> settings;
};

struct PipelineOptions
{
    int batchSize = 100;
    int channelCapacity = 50;
    int eagerBatches = 3;
};

// Reader, normalizer and sink stages on their own threads. All callbacks are
// invoked on the sink thread, in reader emission order; exactly one of
// onComplete/onError is called per run. A readable document reports onHeader
// before its first batch.
class LoadPipeline
{
public:
    struct Callbacks
    {
        std::function<void(DocumentShape shape, const std::optional<Settings> &settings,
                           int totalCount)>
            onHeader;
        std::function<void(const PipelineBatch &batch, int loadedCount)> onBatch;
        std::function<void(std::vector<HomeworkItem> loadedSoFar, double progress)> onPartialResult;
        std::function<void(LoadedDocument document)> onComplete;
        std::function<void(const QString &message)> onError;
    };

    LoadPipeline(QString filePath, PipelineOptions options = {});
    ~LoadPipeline();

    LoadPipeline(const LoadPipeline &) = delete;
    LoadPipeline &operator=(const LoadPipeline &) = delete;

    void start(Callbacks callbacks);
    // Blocks until all three stages have returned.
    void wait();
    bool isRunning() const;

private:
    using Channel = core::BoundedChannel<PipelineMessage>;

    void readDocument();
    void normalizeBatches();
    void collectResults();

    void emitError(const QString &message);

    QString m_filePath;
    PipelineOptions m_options;
    Callbacks m_callbacks;
    Channel m_readChannel;
    Channel m_normalizedChannel;
    std::vector<std::unique_ptr<QThread>> m_stages;
};

} // namespace data
} // namespace homework
