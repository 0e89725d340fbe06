// src/main.cpp
//
// Application entry point for the Mining Data Importer.
//
// Responsibilities:
//   - Initialize the Qt application and its settings identity
//   - Apply the dark theme
//   - Build the importer core over QNetworkAccessManager / QSettings
//   - Create MainWindow and resume any persisted session
//   - Enter Qt event loop

#include "core/AppConfig.h"
#include "core/ImporterController.h"
#include "core/NetworkTransport.h"
#include "core/SettingsStore.h"
#include "ui/MainWindow.h"

#include <QApplication>
#include <QPalette>

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    app.setApplicationName("Mining Data Importer");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("NeedleDigital");

    // -----------------------------------------------------------------------
    // Dark palette, so container widgets do not fall back to the platform's
    // light window colour.
    // -----------------------------------------------------------------------
    QPalette darkPalette;
    darkPalette.setColor(QPalette::Window,          QColor(0x2b, 0x2b, 0x2b));
    darkPalette.setColor(QPalette::WindowText,      QColor(0xe0, 0xe0, 0xe0));
    darkPalette.setColor(QPalette::Base,            QColor(0x1e, 0x1e, 0x1e));
    darkPalette.setColor(QPalette::AlternateBase,   QColor(0x26, 0x26, 0x26));
    darkPalette.setColor(QPalette::Text,            QColor(0xe0, 0xe0, 0xe0));
    darkPalette.setColor(QPalette::Button,          QColor(0x4a, 0x4a, 0x4a));
    darkPalette.setColor(QPalette::ButtonText,      QColor(0xe0, 0xe0, 0xe0));
    darkPalette.setColor(QPalette::Highlight,       QColor(0x19, 0x76, 0xd2));
    darkPalette.setColor(QPalette::HighlightedText, Qt::white);
    darkPalette.setColor(QPalette::PlaceholderText, QColor(0x80, 0x80, 0x80));
    darkPalette.setColor(QPalette::Disabled, QPalette::Text,       QColor(0x66, 0x66, 0x66));
    darkPalette.setColor(QPalette::Disabled, QPalette::ButtonText, QColor(0x66, 0x66, 0x66));
    app.setPalette(darkPalette);

    app.setStyleSheet(R"(
        QToolBar {
            background-color: #3c3c3c;
            border: none;
            spacing: 6px;
            padding: 4px;
        }
        QPushButton {
            background-color: #4a4a4a;
            border: 1px solid #5a5a5a;
            border-radius: 4px;
            padding: 5px 14px;
        }
        QPushButton:hover    { background-color: #5a5a5a; }
        QPushButton:disabled { background-color: #3a3a3a; color: #666666; }
        QLineEdit, QSpinBox, QComboBox {
            background-color: #3c3c3c;
            border: 1px solid #5a5a5a;
            border-radius: 3px;
            padding: 3px;
        }
        QTabBar::tab {
            background-color: #3c3c3c;
            color: #b0b0b0;
            padding: 8px 20px;
        }
        QTabBar::tab:selected {
            background-color: #2b2b2b;
            color: #e0e0e0;
            border-bottom: 2px solid #1976d2;
        }
        QProgressBar {
            background-color: #3c3c3c;
            border: 1px solid #5a5a5a;
            border-radius: 3px;
            text-align: center;
        }
        QProgressBar::chunk { background-color: #1976d2; }
        QGroupBox {
            border: 1px solid #4a4a4a;
            border-radius: 4px;
            margin-top: 12px;
            padding-top: 14px;
        }
        QGroupBox::title {
            subcontrol-origin: margin;
            left: 10px;
            padding: 0 6px;
        }
        QHeaderView::section {
            background-color: #3c3c3c;
            border: 1px solid #4a4a4a;
            padding: 4px;
        }
    )");

    // -----------------------------------------------------------------------
    // Importer core
    // -----------------------------------------------------------------------
    mdi::AppConfig config = mdi::AppConfig::fromEnvironment();
    mdi::NetworkTransport transport(config.requestTimeoutMs);
    mdi::QSettingsStore settings;
    mdi::ImporterController controller(transport, settings, config);

    // -----------------------------------------------------------------------
    // Main window
    // -----------------------------------------------------------------------
    MainWindow window;
    window.setController(&controller);
    window.resize(1100, 820);
    window.show();

    // Silent login from persisted tokens, if any.
    controller.session().restoreSession();

    return app.exec();
}
