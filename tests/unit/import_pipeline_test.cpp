// tests/unit/import_pipeline_test.cpp

#include "TestSupport.h"

#include "core/GeoJsonLayerSink.h"
#include "core/ImportPipeline.h"
#include "core/RecordCursor.h"

#include <QCoreApplication>
#include <QFile>
#include <QTemporaryDir>

#include <cassert>
#include <iostream>

using namespace mdi;
using namespace mdi_test;

namespace {

const QStringList kHeaders{ QStringLiteral("hole_id"), QStringLiteral("latitude"), QStringLiteral("longitude") };

/// What a RecordingSink saw; outlives the sink, which the pipeline owns.
struct SinkLog {
    QString     layerName;
    QStringList headers;
    QVector<int> chunkSizes;
    qint64      received   = 0;
    bool        committed  = false;
    bool        rolledBack = false;
    bool        failBegin  = false;
    int         failOnChunk = -1;
};

class RecordingSink final : public LayerSink {
public:
    explicit RecordingSink(std::shared_ptr<SinkLog> log) : m_log(std::move(log)) {}

    bool begin(const QString& layerName, const QStringList& headers, QString* error) override
    {
        if (m_log->failBegin) {
            *error = QStringLiteral("read-only project");
            return false;
        }
        m_log->layerName = layerName;
        m_log->headers   = headers;
        return true;
    }

    bool addRecords(const RecordList& chunk, QString* error) override
    {
        if (m_log->chunkSizes.size() == m_log->failOnChunk) {
            *error = QStringLiteral("disk full");
            return false;
        }
        m_log->chunkSizes.append(static_cast<int>(chunk.size()));
        m_log->received += chunk.size();
        return true;
    }

    bool commit(QString*) override
    {
        m_log->committed = true;
        return true;
    }

    void rollback() noexcept override { m_log->rolledBack = true; }

    [[nodiscard]] qint64 writtenCount() const noexcept override { return m_log->received; }

private:
    std::shared_ptr<SinkLog> m_log;
};

struct Harness {
    Harness()
    {
        QObject::connect(&pipeline, &ImportPipeline::importProgress,
                         [this](qint64 processed, qint64 total) { progress.append({ processed, total }); });
        QObject::connect(&pipeline, &ImportPipeline::importFinished,
                         [this](const ImportSummary& s) { summaries.append(s); });
        QObject::connect(&pipeline, &ImportPipeline::importFailed,
                         [this](const ImportError& e) { failures.append(e); });
        QObject::connect(&pipeline, &ImportPipeline::importCancelled,
                         [this](const QString&) { ++cancelled; });
    }

    [[nodiscard]] bool done() const { return !summaries.isEmpty() || !failures.isEmpty() || cancelled > 0; }

    AppConfig      config = testConfig();
    ImportPipeline pipeline{ config };
    std::shared_ptr<SinkLog> log = std::make_shared<SinkLog>();

    QVector<QPair<qint64, qint64>> progress;
    QVector<ImportSummary>         summaries;
    QVector<ImportError>           failures;
    int cancelled = 0;
};

void TestSmallDatasetImportsInOneChunk()
{
    Harness h;
    const ImportError started = h.pipeline.start(RecordCursor(makeRecords(5000), kHeaders),
                                                 std::make_unique<RecordingSink>(h.log), QStringLiteral(" WA holes "));
    assert(started.ok());
    assert(h.pipeline.isRunning());
    // Nothing happens until the event loop runs.
    assert(h.log->chunkSizes.isEmpty());

    assert(pumpUntil([&]() { return h.done(); }));
    assert(h.log->chunkSizes == QVector<int>({ 5000 }));
    assert(h.log->committed);
    assert(!h.log->rolledBack);
    assert(h.log->layerName == QStringLiteral("WA holes"));
    assert(h.log->headers == kHeaders);
    assert(h.summaries.size() == 1);
    assert(h.summaries.front().processedCount == 5000);
    assert(h.summaries.front().writtenCount == 5000);
    assert(h.summaries.front().chunkCount == 1);
    assert(!h.pipeline.isRunning());
}

void TestLargeDatasetIsChunked()
{
    Harness h;
    assert(h.pipeline.start(RecordCursor(makeRecords(25000), kHeaders),
                            std::make_unique<RecordingSink>(h.log), QStringLiteral("Assays")).ok());
    assert(pumpUntil([&]() { return h.done(); }));

    assert(h.log->chunkSizes == QVector<int>({ 10000, 10000, 5000 }));
    assert(h.progress.size() == 3);
    assert(h.progress.at(0) == qMakePair(qint64(10000), qint64(25000)));
    assert(h.progress.at(2) == qMakePair(qint64(25000), qint64(25000)));
    assert(h.summaries.front().chunkCount == 3);
    assert(h.log->committed);
}

void TestCancelBetweenChunksRollsBack()
{
    Harness h;
    QObject::connect(&h.pipeline, &ImportPipeline::importProgress, [&](qint64 processed, qint64) {
        if (processed == 10000) {
            h.pipeline.cancel();
        }
    });
    assert(h.pipeline.start(RecordCursor(makeRecords(30000), kHeaders),
                            std::make_unique<RecordingSink>(h.log), QStringLiteral("Holes")).ok());
    assert(pumpUntil([&]() { return h.done(); }));

    // Let any stray chunk callback run.
    for (int i = 0; i < 5; ++i) {
        QCoreApplication::processEvents();
    }
    assert(h.cancelled == 1);
    assert(h.log->chunkSizes == QVector<int>({ 10000 }));
    assert(h.log->rolledBack);
    assert(!h.log->committed);
    assert(h.summaries.isEmpty());
    assert(!h.pipeline.isRunning());

    // Cancelling with nothing running is a no-op.
    h.pipeline.cancel();
    assert(h.cancelled == 1);
}

void TestStartRejections()
{
    Harness h;

    ImportError e = h.pipeline.start(RecordCursor(makeRecords(10), kHeaders),
                                     std::make_unique<RecordingSink>(h.log), QStringLiteral("bad/name"));
    assert(e.code == ImportErrorCode::InvalidLayerName);

    e = h.pipeline.start(RecordCursor(makeRecords(10), kHeaders),
                         std::make_unique<RecordingSink>(h.log), QStringLiteral("   "));
    assert(e.code == ImportErrorCode::InvalidLayerName);

    e = h.pipeline.start(RecordCursor(), std::make_unique<RecordingSink>(h.log), QStringLiteral("Empty"));
    assert(e.code == ImportErrorCode::EmptyDataset);

    e = h.pipeline.start(RecordCursor(makeRecords(10), kHeaders), nullptr, QStringLiteral("NoSink"));
    assert(e.code == ImportErrorCode::SinkFailure);

    h.log->failBegin = true;
    e = h.pipeline.start(RecordCursor(makeRecords(10), kHeaders),
                         std::make_unique<RecordingSink>(h.log), QStringLiteral("Holes"));
    assert(e.code == ImportErrorCode::SinkFailure);
    assert(e.message.contains(QStringLiteral("read-only project")));
    assert(!h.pipeline.isRunning());

    h.log->failBegin = false;
    assert(h.pipeline.start(RecordCursor(makeRecords(10), kHeaders),
                            std::make_unique<RecordingSink>(h.log), QStringLiteral("First")).ok());
    e = h.pipeline.start(RecordCursor(makeRecords(10), kHeaders),
                         std::make_unique<RecordingSink>(std::make_shared<SinkLog>()), QStringLiteral("Second"));
    assert(e.code == ImportErrorCode::Busy);
    assert(pumpUntil([&]() { return h.done(); }));
    assert(h.summaries.front().layerName == QStringLiteral("First"));
}

void TestSinkFailureMidImport()
{
    Harness h;
    h.log->failOnChunk = 1;
    assert(h.pipeline.start(RecordCursor(makeRecords(25000), kHeaders),
                            std::make_unique<RecordingSink>(h.log), QStringLiteral("Holes")).ok());
    assert(pumpUntil([&]() { return h.done(); }));

    assert(h.failures.size() == 1);
    assert(h.failures.front().code == ImportErrorCode::SinkFailure);
    assert(h.failures.front().message.contains(QStringLiteral("disk full")));
    assert(h.log->rolledBack);
    assert(!h.log->committed);
    assert(!h.pipeline.isRunning());
}

// ---------------------------------------------------------------------------
// GeoJSON sink
// ---------------------------------------------------------------------------

void TestCoordinateExtraction()
{
    double lat = 0.0;
    double lon = 0.0;

    Record a;
    a.append(QStringLiteral("LAT"), QStringLiteral("-27.5"));
    a.append(QStringLiteral("Lng"), 153.0);
    assert(extractCoordinates(a, lat, lon));
    assert(lat == -27.5);
    assert(lon == 153.0);

    Record b;
    b.append(QStringLiteral("x"), 117.1);
    b.append(QStringLiteral("y"), -31.9);
    assert(extractCoordinates(b, lat, lon));
    assert(lat == -31.9);
    assert(lon == 117.1);

    Record c;
    c.append(QStringLiteral("latitude"), QVariant());
    c.append(QStringLiteral("longitude"), 120.0);
    assert(!extractCoordinates(c, lat, lon));

    Record d;
    d.append(QStringLiteral("latitude"), QStringLiteral("n/a"));
    d.append(QStringLiteral("longitude"), 120.0);
    assert(!extractCoordinates(d, lat, lon));
}

void TestGeoJsonSinkWritesFeatureCollection()
{
    QTemporaryDir dir;
    assert(dir.isValid());

    RecordList records = makeRecords(3);
    Record noCoords;
    noCoords.append(QStringLiteral("hole_id"), QStringLiteral("LOST"));
    records.append(noCoords);

    GeoJsonLayerSink sink{ QDir(dir.path()) };
    QString error;
    assert(sink.begin(QStringLiteral("WA \"deep\" holes"), kHeaders, &error));
    assert(sink.addRecords(records.mid(0, 2), &error));
    assert(sink.addRecords(records.mid(2), &error));
    assert(!QFile::exists(sink.filePath()));
    assert(sink.commit(&error));
    assert(sink.writtenCount() == 3);
    assert(sink.skippedCount() == 1);

    QFile file(sink.filePath());
    assert(file.open(QIODevice::ReadOnly));
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    assert(parseError.error == QJsonParseError::NoError);

    const QJsonObject root = doc.object();
    assert(root.value(QStringLiteral("type")).toString() == QStringLiteral("FeatureCollection"));
    assert(root.value(QStringLiteral("name")).toString() == QStringLiteral("WA \"deep\" holes"));
    const QJsonArray features = root.value(QStringLiteral("features")).toArray();
    assert(features.size() == 3);

    const QJsonObject first = features.at(0).toObject();
    const QJsonArray coordinates = first.value(QStringLiteral("geometry")).toObject()
                                       .value(QStringLiteral("coordinates")).toArray();
    assert(coordinates.at(0).toDouble() == 121.25);
    assert(coordinates.at(1).toDouble() == -31.5);
    const QJsonObject properties = first.value(QStringLiteral("properties")).toObject();
    assert(properties.value(QStringLiteral("hole_id")).toString() == QStringLiteral("H0"));
    assert(!properties.contains(QStringLiteral("latitude")));
}

void TestGeoJsonRollbackLeavesNoFile()
{
    QTemporaryDir dir;
    assert(dir.isValid());

    QString path;
    {
        GeoJsonLayerSink sink{ QDir(dir.path()) };
        QString error;
        assert(sink.begin(QStringLiteral("Cancelled"), kHeaders, &error));
        assert(sink.addRecords(makeRecords(10), &error));
        path = sink.filePath();
        sink.rollback();
        sink.rollback();
        assert(!sink.commit(&error));
    }
    assert(!QFile::exists(path));
    assert(QDir(dir.path()).entryList(QDir::Files).isEmpty());
}

void TestPipelineIntoGeoJson()
{
    QTemporaryDir dir;
    assert(dir.isValid());

    Harness h;
    auto sink = std::make_unique<GeoJsonLayerSink>(QDir(dir.path()));
    const QString path = QDir(dir.path()).filePath(QStringLiteral("Holes_WA.geojson"));
    assert(h.pipeline.start(RecordCursor(makeRecords(12000), kHeaders), std::move(sink),
                            QStringLiteral("Holes_WA")).ok());
    assert(pumpUntil([&]() { return h.done(); }));
    assert(h.summaries.size() == 1);
    assert(h.summaries.front().writtenCount == 12000);
    assert(h.summaries.front().chunkCount == 2);
    assert(QFile::exists(path));
}

} // namespace

int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);
    TestSmallDatasetImportsInOneChunk();
    TestLargeDatasetIsChunked();
    TestCancelBetweenChunksRollsBack();
    TestStartRejections();
    TestSinkFailureMidImport();
    TestCoordinateExtraction();
    TestGeoJsonSinkWritesFeatureCollection();
    TestGeoJsonRollbackLeavesNoFile();
    TestPipelineIntoGeoJson();
    std::cout << "mdi_unit_import_pipeline: pass\n";
    return 0;
}
