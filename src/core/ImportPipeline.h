// src/core/ImportPipeline.h
//
// ImportPipeline – moves a fetched dataset into a LayerSink without
// blocking the event loop.
//
// Large datasets are pulled from a RecordCursor in chunks of
// AppConfig::importChunkSize, one chunk per event-loop turn, with progress
// after each chunk.  cancel() takes effect before the next chunk and rolls
// the sink back.  Datasets at or below chunkedImportThreshold go through
// in a single chunk.

#pragma once

#include "AppConfig.h"
#include "LayerSink.h"
#include "RecordCursor.h"
#include "Types.h"

#include <QObject>

#include <memory>

namespace mdi {

enum class ImportErrorCode : int32_t {
    None             = 0,
    InvalidLayerName = 1,
    EmptyDataset     = 2,
    Busy             = 3,
    SinkFailure      = 4,
};

struct ImportError {
    ImportErrorCode code = ImportErrorCode::None;
    QString         message;

    [[nodiscard]] bool ok() const noexcept { return code == ImportErrorCode::None; }
};

struct ImportSummary {
    QString layerName;
    qint64  processedCount = 0;   ///< Records handed to the sink.
    qint64  writtenCount   = 0;   ///< Records the sink accepted.
    int     chunkCount     = 0;
};

class ImportPipeline : public QObject {
    Q_OBJECT

public:
    explicit ImportPipeline(const AppConfig& config, QObject* parent = nullptr);
    ~ImportPipeline() override;

    /// Begin importing `cursor` into `sink` as `layerName`.  A non-ok result
    /// means nothing was started; otherwise completion is reported by
    /// importFinished, importFailed or importCancelled.
    ImportError start(RecordCursor cursor, std::unique_ptr<LayerSink> sink, const QString& layerName);

    /// Stop before the next chunk and roll back the sink.
    void cancel();

    [[nodiscard]] bool isRunning() const noexcept { return m_job != nullptr; }

signals:
    void importStarted(const QString& layerName, qint64 total);
    void importProgress(qint64 processed, qint64 total);
    void importFinished(const mdi::ImportSummary& summary);
    void importFailed(const mdi::ImportError& error);
    void importCancelled(const QString& layerName);

private:
    struct Job {
        RecordCursor               cursor;
        std::unique_ptr<LayerSink> sink;
        QString                    layerName;
        int                        chunkSize  = 0;
        int                        chunkCount = 0;
    };

    void scheduleNextChunk();
    void processNextChunk();
    void finish();
    void failSink(const QString& message);

    const AppConfig&     m_config;
    std::unique_ptr<Job> m_job;
    quint64              m_generation = 0;
};

} // namespace mdi

Q_DECLARE_METATYPE(mdi::ImportError)
Q_DECLARE_METATYPE(mdi::ImportSummary)
