// src/core/ImporterController.cpp

#include "ImporterController.h"

#include "util/Log.h"

namespace mdi {

ImporterController::ImporterController(HttpTransport& transport,
                                       SettingsStore& settings,
                                       AppConfig config,
                                       Clock clock,
                                       QObject* parent)
    : QObject(parent)
    , m_config(std::move(config))
    , m_clock(std::move(clock))
    , m_gateway(transport, m_tokens, m_config, m_clock)
    , m_session(m_tokens, m_gateway, settings, m_config, m_clock)
    , m_datasets(m_config)
    , m_fetcher(m_gateway, m_session, m_datasets, m_config, m_clock)
    , m_importer(m_config)
    , m_lookup(m_gateway, m_config)
{
    connect(&m_session, &SessionController::sessionChanged, this, &ImporterController::sessionChanged);

    // Auth state is cleared by the session itself; dataset state and any
    // running import go here, after every logout path.
    connect(&m_session, &SessionController::logoutCompleted, this, [this]() {
        m_importer.cancel();
        m_datasets.clearOnLogout();
        emit logoutCompleted();
    });

    connect(&m_fetcher, &FetchOrchestrator::fetchProgress, this,
            [this](DatasetKind, qint64 fetched, qint64 total) {
                emit fetchProgress(fetched, total);
            });
    connect(&m_fetcher, &FetchOrchestrator::fetchFailed, this,
            [this](DatasetKind kind, const FetchError& error) {
                emit fetchError(kind, describe(error));
            });

    connect(&m_lookup, &LookupService::loginRequired, &m_session, &SessionController::handleLoginRequired);
    connect(&m_lookup, &LookupService::sessionRejected, &m_session, &SessionController::invalidateSession);
}

ImporterController::~ImporterController()
{
    shutdown();
}

void ImporterController::fetch(DatasetKind kind, const FilterParams& filters, qint64 requestedCount)
{
    m_fetcher.fetchDataset(kind, filters, requestedCount);
}

void ImporterController::cancelFetch()
{
    m_fetcher.cancel();
}

ImportError ImporterController::importDataset(DatasetKind kind,
                                              std::unique_ptr<LayerSink> sink,
                                              const QString& layerName)
{
    return m_importer.start(m_datasets.cursor(kind), std::move(sink), layerName);
}

void ImporterController::resetAll()
{
    for (DatasetKind kind : kAllDatasetKinds) {
        m_datasets.clearAll(kind);
    }
}

void ImporterController::shutdown()
{
    m_fetcher.cancel();
    m_importer.cancel();
    m_gateway.cancelAll();
}

} // namespace mdi
