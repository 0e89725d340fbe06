// src/core/FetchOrchestrator.h
//
// FetchOrchestrator – paginated dataset download.
//
// Pages of AppConfig::pageSize are requested strictly one after another
// with `limit` / `skip` query parameters.  Results accumulate privately and
// are committed to DatasetStore only when the whole fetch succeeds; a
// cancelled or failed fetch leaves the stored dataset exactly as it was.
//
// One fetch runs at a time.  Starting another cancels the current one.

#pragma once

#include "AppConfig.h"
#include "DatasetStore.h"
#include "HttpTransport.h"
#include "RequestGateway.h"
#include "SessionController.h"
#include "Types.h"

#include <QElapsedTimer>
#include <QObject>
#include <QUrlQuery>

#include <optional>

namespace mdi {

/// Encodes filter values as query items.  Lists are comma-joined, booleans
/// become "true"/"false", null and empty values are skipped.
QUrlQuery filterQuery(const FilterParams& filters);

/// One decoded page of a data response.
struct DataPage {
    QStringList headers;
    RecordList  records;
    qint64      serverTotal = -1;   ///< -1 when the server did not say.
};

/// Accepts `{headers|columns, records|data, total_count|totalCount}` with
/// rows as arrays (aligned to headers) or objects, or a bare array of row
/// objects.  Returns false with `error` set when the shape is unusable.
bool parseDataPage(const QByteArray& body, DataPage& page, QString* error = nullptr);

class FetchOrchestrator : public QObject {
    Q_OBJECT

public:
    FetchOrchestrator(RequestGateway& gateway,
                      SessionController& session,
                      DatasetStore& datasets,
                      const AppConfig& config,
                      Clock clock = systemClock(),
                      QObject* parent = nullptr);
    ~FetchOrchestrator() override;

    FetchOrchestrator(const FetchOrchestrator&)            = delete;
    FetchOrchestrator& operator=(const FetchOrchestrator&) = delete;

    /// Start downloading `kind`.  `requestedCount <= 0` fetches everything the
    /// current tier allows.  Completion is reported by fetchFinished,
    /// fetchFailed or fetchCancelled.
    void fetchDataset(DatasetKind kind, const FilterParams& filters, qint64 requestedCount);

    /// Abort the running fetch.  Partial results are discarded.
    void cancel();

    [[nodiscard]] bool isFetching() const noexcept { return m_job.has_value(); }
    [[nodiscard]] std::optional<DatasetKind> activeKind() const;

signals:
    void fetchStarted(mdi::DatasetKind kind, qint64 target);
    void fetchProgress(mdi::DatasetKind kind, qint64 fetched, qint64 total);
    void fetchFinished(mdi::DatasetKind kind, const mdi::FetchDetails& details);
    void fetchFailed(mdi::DatasetKind kind, const mdi::FetchError& error);
    void fetchCancelled(mdi::DatasetKind kind);

private:
    struct Job {
        DatasetKind   kind = DatasetKind::Holes;
        FilterParams  filters;
        qint64        requested = 0;
        qint64        target    = 0;
        RecordList    records;
        QStringList   headers;
        qint64        serverTotal = -1;
        int           pages       = 0;
        RequestId     request     = 0;
        QElapsedTimer elapsed;
    };

    void requestNextPage();
    void handlePage(const HttpResponse& response);
    void commit();
    void fail(FetchError error);
    void abandon();

    [[nodiscard]] qint64 progressTotal() const;

    RequestGateway&    m_gateway;
    SessionController& m_session;
    DatasetStore&      m_datasets;
    const AppConfig&   m_config;
    Clock              m_clock;

    std::optional<Job> m_job;
};

} // namespace mdi
