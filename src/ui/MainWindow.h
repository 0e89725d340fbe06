// src/ui/MainWindow.h
//
// MainWindow – top-level QMainWindow of the importer.
//
// Layout
// ------
//   TopBar    : addToolBar(Qt::TopToolBarArea)
//   QTabWidget: setCentralWidget, one DataTab per dataset kind
//   StatusLog : QDockWidget, bottom

#pragma once

#include "core/Types.h"

#include <QMainWindow>

#include <optional>

// Forward declarations – keep compile times short.
class TopBar;
class DataTab;
class StatusLog;
class LoginDialog;
class QDockWidget;
class QTabWidget;

namespace mdi {
class ImporterController;
} // namespace mdi

/// \brief Top-level application window.
class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow() override;

    // Sub-component accessors
    TopBar*    topBar()    const;
    StatusLog* statusLog() const;
    DataTab*   dataTab(mdi::DatasetKind kind) const;

    // Controller wiring
    void setController(mdi::ImporterController* controller);
    mdi::ImporterController* controller() const;

public slots:
    void showLoginDialog();

protected:
    void changeEvent(QEvent* event) override;
    void closeEvent(QCloseEvent* event) override;

private:
    void setupUi();
    void setupDocks();
    void connectSignals();
    void connectController();
    void refreshTab(mdi::DatasetKind kind);
    void startImport(mdi::DatasetKind kind);
    void updateSessionUi(bool authenticated, mdi::Role role);

    TopBar*      m_topBar     = nullptr;
    QTabWidget*  m_tabs       = nullptr;
    DataTab*     m_holesTab   = nullptr;
    DataTab*     m_assaysTab  = nullptr;
    StatusLog*   m_statusLog  = nullptr;
    QDockWidget* m_statusDock = nullptr;
    LoginDialog* m_loginDialog = nullptr;

    mdi::ImporterController*        m_controller = nullptr;
    std::optional<mdi::DatasetKind> m_importKind;
};
