// src/ui/MainWindow.cpp

#include "MainWindow.h"
#include "DataTab.h"
#include "LoginDialog.h"
#include "StatusLog.h"
#include "TopBar.h"

#include "core/FilterCatalog.h"
#include "core/GeoJsonLayerSink.h"
#include "core/ImporterController.h"
#include "core/Validation.h"

#include <QCloseEvent>
#include <QDockWidget>
#include <QFileDialog>
#include <QInputDialog>
#include <QMessageBox>
#include <QSettings>
#include <QStandardPaths>
#include <QStatusBar>
#include <QTabWidget>

#include <memory>

namespace {

const QString kLastExportDirKey = QStringLiteral("ui/lastExportDir");

} // anonymous namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

MainWindow::MainWindow(QWidget* parent)
    : QMainWindow(parent)
{
    setWindowTitle(tr("Mining Data Importer"));
    setMinimumSize(850, 700);

    setupUi();
    setupDocks();
    connectSignals();
    updateSessionUi(false, mdi::Role::Unset);
}

MainWindow::~MainWindow() = default;

// ---------------------------------------------------------------------------
// Sub-component accessors
// ---------------------------------------------------------------------------

TopBar*    MainWindow::topBar()    const { return m_topBar; }
StatusLog* MainWindow::statusLog() const { return m_statusLog; }

DataTab* MainWindow::dataTab(mdi::DatasetKind kind) const
{
    return kind == mdi::DatasetKind::Holes ? m_holesTab : m_assaysTab;
}

mdi::ImporterController* MainWindow::controller() const { return m_controller; }

// ---------------------------------------------------------------------------
// Controller
// ---------------------------------------------------------------------------

void MainWindow::setController(mdi::ImporterController* controller)
{
    if (m_controller == controller) return;
    m_controller = controller;
    if (!m_controller) return;

    connectController();

    const QString configProblem = m_controller->config().validate();
    if (!configProblem.isEmpty()) {
        m_statusLog->logWarning(configProblem);
    }

    auto& session = m_controller->session();
    updateSessionUi(session.isAuthenticated(), session.role());
    for (mdi::DatasetKind kind : mdi::kAllDatasetKinds) {
        refreshTab(kind);
    }
}

void MainWindow::connectController()
{
    auto* session  = &m_controller->session();
    auto* datasets = &m_controller->datasets();
    auto* fetcher  = &m_controller->fetcher();
    auto* importer = &m_controller->importer();
    auto* lookup   = &m_controller->lookup();

    // Session
    connect(m_controller, &mdi::ImporterController::sessionChanged,
            this, &MainWindow::updateSessionUi);

    connect(session, &mdi::SessionController::loginSucceeded,
            this, [this](const mdi::Session& s) {
                m_statusLog->logSuccess(tr("Logged in as %1 (%2)").arg(s.lastIdentity, mdi::roleName(s.role)));
                if (m_loginDialog) {
                    m_loginDialog->accept();
                }
            });

    connect(session, &mdi::SessionController::loginFailed,
            this, [this](const mdi::AuthError& error) {
                m_statusLog->logError(tr("Login failed: %1").arg(error.message));
                if (m_loginDialog) {
                    m_loginDialog->setBusy(false);
                    m_loginDialog->showError(error.message);
                }
            });

    // Queued: expiry is raised from inside reply handlers, and the modal
    // boxes must not spin an event loop there.
    connect(session, &mdi::SessionController::sessionExpired, this, [this]() {
        m_statusLog->logWarning(tr("Session expired. Please log in again."));
        QMessageBox::information(this, tr("Session Expired"),
                                 tr("Your session has expired. Please log in again."));
    }, Qt::QueuedConnection);

    connect(session, &mdi::SessionController::loginRequired,
            this, &MainWindow::showLoginDialog, Qt::QueuedConnection);

    connect(m_controller, &mdi::ImporterController::logoutCompleted, this, [this]() {
        m_holesTab->resetFilters();
        m_assaysTab->resetFilters();
        m_statusLog->logInfo(tr("Logged out; all data cleared."));
    });

    // Datasets
    connect(datasets, &mdi::DatasetStore::datasetChanged, this, &MainWindow::refreshTab);
    connect(datasets, &mdi::DatasetStore::pageChanged,
            this, [this](mdi::DatasetKind kind, int) { refreshTab(kind); });

    // Fetch
    connect(fetcher, &mdi::FetchOrchestrator::fetchStarted,
            this, [this](mdi::DatasetKind kind, qint64 target) {
                dataTab(kind)->setFetching(true);
                m_statusLog->logInfo(tr("Fetching %1 (up to %L2 records)...")
                                         .arg(mdi::datasetKindName(kind)).arg(target));
                statusBar()->showMessage(tr("Fetching data..."));
            });

    connect(fetcher, &mdi::FetchOrchestrator::fetchProgress,
            this, [this](mdi::DatasetKind kind, qint64 fetched, qint64 total) {
                dataTab(kind)->setProgress(fetched, total);
            });

    connect(fetcher, &mdi::FetchOrchestrator::fetchFinished,
            this, [this](mdi::DatasetKind kind, const mdi::FetchDetails& details) {
                dataTab(kind)->setFetching(false);
                m_statusLog->logSuccess(tr("Fetched %L1 %2 records in %3 page(s) (%4 s)")
                                         .arg(details.fetchedCount)
                                         .arg(mdi::datasetKindName(kind))
                                         .arg(details.pageCount)
                                         .arg(details.elapsedSeconds, 0, 'f', 1));
                statusBar()->showMessage(details.fetchedCount > 0 ? tr("Data fetch complete.")
                                                                  : tr("No data found matching your criteria."));
            });

    connect(fetcher, &mdi::FetchOrchestrator::fetchCancelled,
            this, [this](mdi::DatasetKind kind) {
                dataTab(kind)->setFetching(false);
                m_statusLog->logWarning(tr("%1 fetch cancelled.").arg(mdi::datasetKindName(kind)));
                statusBar()->showMessage(tr("Fetch cancelled."), 5000);
            });

    connect(fetcher, &mdi::FetchOrchestrator::fetchFailed,
            this, [this](mdi::DatasetKind kind, const mdi::FetchError&) {
                dataTab(kind)->setFetching(false);
                statusBar()->showMessage(tr("An error occurred."), 5000);
            });

    connect(m_controller, &mdi::ImporterController::fetchError,
            this, [this](mdi::DatasetKind kind, const QString& message) {
                m_statusLog->logError(tr("%1: %2").arg(mdi::datasetKindName(kind), message));
                QMessageBox::warning(this, tr("Fetch Failed"), message);
            });

    // Import
    connect(importer, &mdi::ImportPipeline::importProgress,
            this, [this](qint64 processed, qint64 total) {
                if (m_importKind) {
                    DataTab* tab = dataTab(*m_importKind);
                    tab->setProgress(processed, total);
                    tab->setProgressText(tr("Importing %L1 / %L2").arg(processed).arg(total));
                }
            });

    connect(importer, &mdi::ImportPipeline::importFinished,
            this, [this](const mdi::ImportSummary& summary) {
                if (m_importKind) {
                    dataTab(*m_importKind)->setImporting(false);
                    m_importKind.reset();
                }
                m_statusLog->logSuccess(tr("Imported %L1 of %L2 records into layer '%3' (%4 chunk(s))")
                                         .arg(summary.writtenCount)
                                         .arg(summary.processedCount)
                                         .arg(summary.layerName)
                                         .arg(summary.chunkCount));
                if (summary.writtenCount < summary.processedCount) {
                    m_statusLog->logWarning(tr("%L1 record(s) had no coordinates and were skipped.")
                                                .arg(summary.processedCount - summary.writtenCount));
                }
            });

    connect(importer, &mdi::ImportPipeline::importFailed,
            this, [this](const mdi::ImportError& error) {
                if (m_importKind) {
                    dataTab(*m_importKind)->setImporting(false);
                    m_importKind.reset();
                }
                m_statusLog->logError(error.message);
                QMessageBox::critical(this, tr("Import Failed"), error.message);
            });

    connect(importer, &mdi::ImportPipeline::importCancelled,
            this, [this](const QString& layerName) {
                if (m_importKind) {
                    dataTab(*m_importKind)->setImporting(false);
                    m_importKind.reset();
                }
                m_statusLog->logWarning(tr("Import of '%1' cancelled; nothing was written.").arg(layerName));
            });

    // Lookups
    connect(lookup, &mdi::LookupService::holeTypesReady,
            this, [this](const QStringList& types, bool fromServer) {
                m_holesTab->setHoleTypes(types);
                m_assaysTab->setHoleTypes(types);
                if (!fromServer) {
                    m_statusLog->logWarning(tr("Could not load hole types; using defaults."));
                }
            });

    connect(lookup, &mdi::LookupService::companiesFound,
            this, [this](const QString& query, const QStringList& names) {
                qobject_cast<DataTab*>(m_tabs->currentWidget())->setCompanySuggestions(query, names);
            });

    // Tabs -> controller
    for (DataTab* tab : { m_holesTab, m_assaysTab }) {
        const mdi::DatasetKind kind = tab->kind();
        connect(tab, &DataTab::fetchRequested,
                this, [this, kind](const mdi::FilterParams& filters, qint64 requestedCount) {
                    m_controller->fetch(kind, filters, requestedCount);
                });
        connect(tab, &DataTab::cancelRequested, this, [this]() {
            m_controller->cancelFetch();
            m_controller->importer().cancel();
        });
        connect(tab, &DataTab::clearRequested, this, [this, kind]() {
            m_controller->datasets().clearDataOnly(kind);
            m_statusLog->logInfo(tr("%1 data cleared.").arg(mdi::datasetKindName(kind)));
        });
        connect(tab, &DataTab::importRequested, this, [this, kind]() { startImport(kind); });
        connect(tab, &DataTab::previousPageRequested,
                this, [this, kind]() { m_controller->datasets().previousPage(kind); });
        connect(tab, &DataTab::nextPageRequested,
                this, [this, kind]() { m_controller->datasets().nextPage(kind); });
        connect(tab, &DataTab::companySearchRequested,
                lookup, &mdi::LookupService::searchCompanies);
    }
}

// ---------------------------------------------------------------------------
// Login / session
// ---------------------------------------------------------------------------

void MainWindow::showLoginDialog()
{
    if (!m_controller || m_loginDialog) return;

    LoginDialog dialog(m_controller->session().lastIdentity(), this);
    m_loginDialog = &dialog;
    connect(&dialog, &LoginDialog::loginSubmitted,
            this, [this](const QString& email, const QString& password) {
                m_loginDialog->setBusy(true);
                m_controller->session().login(email, password);
            });
    dialog.exec();
    m_loginDialog = nullptr;
}

void MainWindow::updateSessionUi(bool authenticated, mdi::Role role)
{
    const QString identity = m_controller ? m_controller->session().lastIdentity() : QString();
    m_topBar->setSessionState(authenticated, role, identity);
    m_holesTab->setAuthenticated(authenticated);
    m_assaysTab->setAuthenticated(authenticated);
    statusBar()->showMessage(authenticated ? tr("Ready to fetch data.") : tr("Ready. Please log in."));

    if (authenticated && m_controller) {
        m_controller->lookup().fetchHoleTypes();
    }
}

// ---------------------------------------------------------------------------
// Datasets
// ---------------------------------------------------------------------------

void MainWindow::refreshTab(mdi::DatasetKind kind)
{
    if (!m_controller) return;
    const auto& datasets = m_controller->datasets();
    dataTab(kind)->showDataset(datasets.state(kind), datasets.paginationInfo(kind), datasets.pageRecords(kind));
}

void MainWindow::startImport(mdi::DatasetKind kind)
{
    if (!m_controller) return;
    const mdi::DatasetState& state = m_controller->datasets().state(kind);
    if (state.isEmpty()) {
        QMessageBox::information(this, tr("Nothing to Import"), tr("No data to import. Please fetch data first."));
        return;
    }

    QString layerName = mdi::defaultLayerName(kind, state.filterParams, state.fetchDetails.requestedCount);
    for (;;) {
        bool ok = false;
        layerName = QInputDialog::getText(this, tr("Import Layer"), tr("Layer name:"),
                                          QLineEdit::Normal, layerName, &ok);
        if (!ok) return;
        const QString problem = mdi::validateLayerName(layerName);
        if (problem.isEmpty()) break;
        QMessageBox::warning(this, tr("Invalid Layer Name"), problem);
    }

    QSettings settings;
    const QString startDir = settings.value(kLastExportDirKey,
        QStandardPaths::writableLocation(QStandardPaths::DocumentsLocation)).toString();
    const QString dir = QFileDialog::getExistingDirectory(this, tr("Choose Output Folder"), startDir);
    if (dir.isEmpty()) return;
    settings.setValue(kLastExportDirKey, dir);

    auto sink = std::make_unique<mdi::GeoJsonLayerSink>(QDir(dir));
    const mdi::ImportError error = m_controller->importDataset(kind, std::move(sink), layerName);
    if (!error.ok()) {
        m_statusLog->logError(error.message);
        QMessageBox::warning(this, tr("Import Failed"), error.message);
        return;
    }
    m_importKind = kind;
    dataTab(kind)->setImporting(true);
    m_statusLog->logInfo(tr("Importing %L1 records into '%2'...").arg(state.records.size()).arg(layerName));
}

// ---------------------------------------------------------------------------
// Private – UI construction
// ---------------------------------------------------------------------------

void MainWindow::setupUi()
{
    const qint64 maxCount = mdi::AppConfig().hardApiCeiling;

    m_topBar    = new TopBar(this);
    m_tabs      = new QTabWidget(this);
    m_holesTab  = new DataTab(mdi::DatasetKind::Holes, maxCount, m_tabs);
    m_assaysTab = new DataTab(mdi::DatasetKind::Assays, maxCount, m_tabs);
    m_statusLog = new StatusLog(this);

    m_tabs->addTab(m_holesTab, tr("Holes"));
    m_tabs->addTab(m_assaysTab, tr("Assays"));
    setCentralWidget(m_tabs);

    addToolBar(Qt::TopToolBarArea, m_topBar);
}

void MainWindow::setupDocks()
{
    m_statusDock = new QDockWidget(tr("Log"), this);
    m_statusDock->setObjectName("StatusDock");
    m_statusDock->setWidget(m_statusLog);
    m_statusDock->setAllowedAreas(Qt::BottomDockWidgetArea | Qt::TopDockWidgetArea);
    addDockWidget(Qt::BottomDockWidgetArea, m_statusDock);

    resizeDocks({m_statusDock}, {140}, Qt::Vertical);
}

void MainWindow::connectSignals()
{
    connect(m_topBar, &TopBar::loginRequested, this, &MainWindow::showLoginDialog);

    connect(m_topBar, &TopBar::logoutRequested, this, [this]() {
        if (m_controller) {
            m_controller->session().logout();
        }
    });

    connect(m_topBar, &TopBar::resetAllRequested, this, [this]() {
        if (!m_controller) return;
        m_controller->resetAll();
        m_holesTab->resetFilters();
        m_assaysTab->resetFilters();
        m_statusLog->logInfo(tr("All data and filters reset."));
    });
}

// ---------------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------------

void MainWindow::changeEvent(QEvent* event)
{
    // Tokens can expire while the window sits in the background.
    if (event->type() == QEvent::ActivationChange && isActiveWindow() && m_controller) {
        m_controller->session().validateAndLogoutIfExpired();
    }
    QMainWindow::changeEvent(event);
}

void MainWindow::closeEvent(QCloseEvent* event)
{
    if (m_controller) {
        m_controller->shutdown();
    }
    event->accept();
}
