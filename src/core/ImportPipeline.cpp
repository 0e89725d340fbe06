// src/core/ImportPipeline.cpp

#include "ImportPipeline.h"

#include "Validation.h"
#include "util/Log.h"

#include <QTimer>

namespace mdi {

ImportPipeline::ImportPipeline(const AppConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(config)
{
    qRegisterMetaType<mdi::ImportError>();
    qRegisterMetaType<mdi::ImportSummary>();
}

ImportPipeline::~ImportPipeline()
{
    if (m_job) {
        m_job->sink->rollback();
    }
}

ImportError ImportPipeline::start(RecordCursor cursor, std::unique_ptr<LayerSink> sink, const QString& layerName)
{
    ImportError error;
    if (m_job) {
        error.code    = ImportErrorCode::Busy;
        error.message = QStringLiteral("An import is already running.");
        return error;
    }
    const QString nameProblem = validateLayerName(layerName);
    if (!nameProblem.isEmpty()) {
        error.code    = ImportErrorCode::InvalidLayerName;
        error.message = nameProblem;
        return error;
    }
    if (!cursor.hasMore()) {
        error.code    = ImportErrorCode::EmptyDataset;
        error.message = QStringLiteral("No data to import. Please fetch data first.");
        return error;
    }
    if (!sink) {
        error.code    = ImportErrorCode::SinkFailure;
        error.message = QStringLiteral("No layer sink available.");
        return error;
    }

    QString sinkError;
    if (!sink->begin(layerName.trimmed(), cursor.headers(), &sinkError)) {
        error.code    = ImportErrorCode::SinkFailure;
        error.message = QStringLiteral("Failed to create layer: %1").arg(sinkError);
        return error;
    }

    const int total = cursor.total();

    auto job       = std::make_unique<Job>();
    job->cursor    = std::move(cursor);
    job->sink      = std::move(sink);
    job->layerName = layerName.trimmed();
    job->chunkSize = total > m_config.chunkedImportThreshold ? m_config.importChunkSize : total;
    m_job          = std::move(job);

    qCInfo(lcImport) << "Importing" << total << "records into" << m_job->layerName
                     << "chunk size" << m_job->chunkSize;
    emit importStarted(m_job->layerName, total);
    scheduleNextChunk();
    return error;
}

void ImportPipeline::cancel()
{
    if (!m_job) {
        return;
    }
    ++m_generation;
    std::unique_ptr<Job> job = std::move(m_job);
    job->sink->rollback();
    qCInfo(lcImport) << "Import of" << job->layerName << "cancelled at" << job->cursor.position()
                     << "of" << job->cursor.total();
    emit importCancelled(job->layerName);
}

// ===========================================================================
// Chunk loop
// ===========================================================================

void ImportPipeline::scheduleNextChunk()
{
    const quint64 generation = m_generation;
    QTimer::singleShot(0, this, [this, generation]() {
        if (generation == m_generation) {
            processNextChunk();
        }
    });
}

void ImportPipeline::processNextChunk()
{
    if (!m_job) {
        return;
    }
    Job& job = *m_job;

    const RecordList chunk = job.cursor.nextChunk(job.chunkSize);
    ++job.chunkCount;

    QString sinkError;
    if (!job.sink->addRecords(chunk, &sinkError)) {
        failSink(sinkError);
        return;
    }

    qCDebug(lcImport) << "Chunk" << job.chunkCount << "done," << job.cursor.position()
                      << "of" << job.cursor.total();
    const quint64 generation = m_generation;
    emit importProgress(job.cursor.position(), job.cursor.total());

    // A progress listener may have cancelled.
    if (generation != m_generation || !m_job) {
        return;
    }
    if (job.cursor.hasMore()) {
        scheduleNextChunk();
    } else {
        finish();
    }
}

void ImportPipeline::finish()
{
    std::unique_ptr<Job> job = std::move(m_job);
    ++m_generation;

    QString sinkError;
    if (!job->sink->commit(&sinkError)) {
        m_job = std::move(job);
        failSink(sinkError);
        return;
    }

    ImportSummary summary;
    summary.layerName      = job->layerName;
    summary.processedCount = job->cursor.position();
    summary.writtenCount   = job->sink->writtenCount();
    summary.chunkCount     = job->chunkCount;

    qCInfo(lcImport) << "Imported" << summary.writtenCount << "of" << summary.processedCount
                     << "records into" << summary.layerName << "in" << summary.chunkCount << "chunk(s)";
    emit importFinished(summary);
}

void ImportPipeline::failSink(const QString& message)
{
    std::unique_ptr<Job> job = std::move(m_job);
    ++m_generation;
    job->sink->rollback();

    ImportError error;
    error.code    = ImportErrorCode::SinkFailure;
    error.message = QStringLiteral("Import into %1 failed: %2").arg(job->layerName, message);
    qCWarning(lcImport) << error.message;
    emit importFailed(error);
}

} // namespace mdi
