#include "homework/data/LoadPipeline.hpp"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QThread>

#include "homework/core/Logging.hpp"

namespace homework {
namespace data {

namespace {
PipelineMessage endMessage()
{
    PipelineMessage message;
    message.type = PipelineMessage::Type::End;
    return message;
}
} // namespace

LoadPipeline::LoadPipeline(QString filePath, PipelineOptions options)
    : m_filePath(std::move(filePath))
    , m_options(options)
    , m_readChannel(static_cast<std::size_t>(qMax(1, options.channelCapacity)))
    , m_normalizedChannel(static_cast<std::size_t>(qMax(1, options.channelCapacity)))
{
    if (m_options.batchSize <= 0) {
        m_options.batchSize = PipelineOptions{}.batchSize;
    }
}

LoadPipeline::~LoadPipeline()
{
    wait();
}

void LoadPipeline::start(Callbacks callbacks)
{
    if (!m_stages.empty()) {
        qCWarning(lcPipeline) << "Load pipeline already started for" << m_filePath;
        return;
    }
    m_callbacks = std::move(callbacks);

    m_stages.emplace_back(QThread::create([this]() { readDocument(); }));
    m_stages.emplace_back(QThread::create([this]() { normalizeBatches(); }));
    m_stages.emplace_back(QThread::create([this]() { collectResults(); }));
    m_stages[0]->setObjectName(QStringLiteral("pipeline-reader"));
    m_stages[1]->setObjectName(QStringLiteral("pipeline-normalizer"));
    m_stages[2]->setObjectName(QStringLiteral("pipeline-sink"));
    for (auto &stage : m_stages) {
        stage->start();
    }
    qCDebug(lcPipeline) << "Started load pipeline for" << m_filePath;
}

void LoadPipeline::wait()
{
    for (auto &stage : m_stages) {
        stage->wait();
    }
}

bool LoadPipeline::isRunning() const
{
    for (const auto &stage : m_stages) {
        if (stage->isRunning()) {
            return true;
        }
    }
    return false;
}

void LoadPipeline::emitError(const QString &message)
{
    PipelineMessage error;
    error.type = PipelineMessage::Type::Error;
    error.error = message;
    m_readChannel.push(std::move(error));
    m_readChannel.push(endMessage());
}

void LoadPipeline::readDocument()
{
    QFile file(m_filePath);
    if (!file.exists()) {
        emitError(QStringLiteral("document not found: %1").arg(m_filePath));
        return;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        emitError(QStringLiteral("cannot open %1: %2").arg(m_filePath, file.errorString()));
        return;
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        emitError(QStringLiteral("malformed document %1: %2")
                      .arg(m_filePath, parseError.errorString()));
        return;
    }

    QJsonArray records;
    PipelineMessage complete;
    complete.type = PipelineMessage::Type::Complete;
    if (document.isObject() && document.object().value(QStringLiteral("homeworks")).isArray()) {
        const QJsonObject root = document.object();
        records = root.value(QStringLiteral("homeworks")).toArray();
        complete.shape = DocumentShape::Current;
        const QJsonValue settings = root.value(QStringLiteral("settings"));
        if (settings.isObject()) {
            complete.settings = HomeworkDocument::settingsFromJson(settings.toObject());
        }
    } else if (document.isArray()) {
        records = document.array();
        complete.shape = DocumentShape::Legacy;
    } else {
        emitError(QStringLiteral("unexpected document shape in %1").arg(m_filePath));
        return;
    }

    const int total = records.size();
    PipelineMessage header;
    header.type = PipelineMessage::Type::Header;
    header.totalCount = total;
    header.shape = complete.shape;
    header.settings = complete.settings;
    m_readChannel.push(std::move(header));

    const int batchSize = m_options.batchSize;
    const int batchCount = (total + batchSize - 1) / batchSize;
    for (int sequence = 0; sequence < batchCount; ++sequence) {
        PipelineMessage message;
        message.type = PipelineMessage::Type::Batch;
        message.batch.sequence = sequence;
        message.batch.batchCount = batchCount;
        message.batch.totalCount = total;
        message.batch.terminal = sequence == batchCount - 1;
        const int first = sequence * batchSize;
        const int last = qMin(first + batchSize, total);
        for (int i = first; i < last; ++i) {
            message.batch.records.append(records.at(i));
        }
        m_readChannel.push(std::move(message));
    }

    complete.totalCount = total;
    m_readChannel.push(std::move(complete));
    m_readChannel.push(endMessage());
    qCDebug(lcPipeline) << "Reader emitted" << batchCount << "batches," << total << "records";
}

void LoadPipeline::normalizeBatches()
{
    const QString statusKey = QStringLiteral("status");
    for (;;) {
        PipelineMessage message = m_readChannel.pop();
        switch (message.type) {
        case PipelineMessage::Type::Batch: {
            auto &batch = message.batch;
            batch.items.reserve(static_cast<std::size_t>(batch.records.size()));
            for (const QJsonValue &value : qAsConst(batch.records)) {
                QJsonObject record = value.toObject();
                if (!record.contains(statusKey)) {
                    record.insert(statusKey, QStringLiteral("pending"));
                }
                batch.items.push_back(HomeworkDocument::itemFromJson(record));
            }
            batch.records = QJsonArray();
            m_normalizedChannel.push(std::move(message));
            break;
        }
        case PipelineMessage::Type::Header:
        case PipelineMessage::Type::Complete:
            m_normalizedChannel.push(std::move(message));
            break;
        case PipelineMessage::Type::Error:
            m_normalizedChannel.push(std::move(message));
            m_normalizedChannel.push(endMessage());
            return;
        case PipelineMessage::Type::End:
            m_normalizedChannel.push(std::move(message));
            return;
        }
    }
}

void LoadPipeline::collectResults()
{
    std::vector<HomeworkItem> loaded;
    bool finished = false;
    for (;;) {
        PipelineMessage message = m_normalizedChannel.pop();
        switch (message.type) {
        case PipelineMessage::Type::Header:
            if (m_callbacks.onHeader) {
                m_callbacks.onHeader(message.shape, message.settings, message.totalCount);
            }
            break;
        case PipelineMessage::Type::Batch: {
            const PipelineBatch &batch = message.batch;
            loaded.insert(loaded.end(), batch.items.begin(), batch.items.end());
            const int loadedCount = static_cast<int>(loaded.size());
            if (m_callbacks.onBatch) {
                m_callbacks.onBatch(batch, loadedCount);
            }
            if (batch.sequence < m_options.eagerBatches && m_callbacks.onPartialResult) {
                const double progress = batch.totalCount > 0
                    ? static_cast<double>(loadedCount) / batch.totalCount
                    : 1.0;
                m_callbacks.onPartialResult(loaded, progress);
            }
            break;
        }
        case PipelineMessage::Type::Complete:
            if (!finished) {
                finished = true;
                LoadedDocument document;
                document.items = std::move(loaded);
                document.shape = message.shape;
                document.settings = std::move(message.settings);
                qCDebug(lcPipeline) << "Sink collected" << document.items.size() << "records";
                if (m_callbacks.onComplete) {
                    m_callbacks.onComplete(std::move(document));
                }
            }
            break;
        case PipelineMessage::Type::Error:
            if (!finished) {
                finished = true;
                qCWarning(lcPipeline) << "Load failed:" << message.error;
                if (m_callbacks.onError) {
                    m_callbacks.onError(message.error);
                }
            }
            break;
        case PipelineMessage::Type::End:
            return;
        }
    }
}

} // namespace data
} // namespace homework
