// src/core/ImporterController.h
//
// ImporterController – owns the importer core and is the single object the
// UI talks to.
//
//   TokenStore <- RequestGateway <- SessionController
//                      ^                  ^
//                      |                  |
//              FetchOrchestrator -> DatasetStore -> ImportPipeline
//              LookupService
//
// The transport and settings store are injected so the same wiring runs
// against QNetworkAccessManager / QSettings in the application and against
// fakes in tests.

#pragma once

#include "AppConfig.h"
#include "DatasetStore.h"
#include "FetchOrchestrator.h"
#include "HttpTransport.h"
#include "ImportPipeline.h"
#include "LookupService.h"
#include "RequestGateway.h"
#include "SessionController.h"
#include "SettingsStore.h"
#include "TokenStore.h"
#include "Types.h"

#include <QObject>

#include <memory>

namespace mdi {

class ImporterController : public QObject {
    Q_OBJECT

public:
    ImporterController(HttpTransport& transport,
                       SettingsStore& settings,
                       AppConfig config,
                       Clock clock = systemClock(),
                       QObject* parent = nullptr);
    ~ImporterController() override;

    ImporterController(const ImporterController&)            = delete;
    ImporterController& operator=(const ImporterController&) = delete;

    // Component access
    [[nodiscard]] const AppConfig&   config() const noexcept { return m_config; }
    [[nodiscard]] SessionController& session() noexcept { return m_session; }
    [[nodiscard]] RequestGateway&    gateway() noexcept { return m_gateway; }
    [[nodiscard]] DatasetStore&      datasets() noexcept { return m_datasets; }
    [[nodiscard]] FetchOrchestrator& fetcher() noexcept { return m_fetcher; }
    [[nodiscard]] ImportPipeline&    importer() noexcept { return m_importer; }
    [[nodiscard]] LookupService&     lookup() noexcept { return m_lookup; }

    // -----------------------------------------------------------------------
    // UI operations
    // -----------------------------------------------------------------------
    void fetch(DatasetKind kind, const FilterParams& filters, qint64 requestedCount);
    void cancelFetch();

    /// Start importing the full dataset of `kind`.  A non-ok result means
    /// nothing started.
    ImportError importDataset(DatasetKind kind, std::unique_ptr<LayerSink> sink, const QString& layerName);

    /// Clear both datasets and their filters.
    void resetAll();

    /// Abort everything in flight (dialog closing).  The session survives.
    void shutdown();

signals:
    void sessionChanged(bool authenticated, mdi::Role role);
    void fetchProgress(qint64 fetched, qint64 total);
    void fetchError(mdi::DatasetKind kind, const QString& message);
    void logoutCompleted();

private:
    AppConfig         m_config;
    Clock             m_clock;
    TokenStore        m_tokens;
    RequestGateway    m_gateway;
    SessionController m_session;
    DatasetStore      m_datasets;
    FetchOrchestrator m_fetcher;
    ImportPipeline    m_importer;
    LookupService     m_lookup;
};

} // namespace mdi
