// src/ui/StatusLog.h
//
// StatusLog – bottom dock with the session / fetch / import activity log.
// Warnings and errors are counted in the header until the log is cleared.

#pragma once

#include <QWidget>

class QPlainTextEdit;
class QLabel;
class QPushButton;

/// \brief Colour-coded activity log with a one-line status header.
class StatusLog : public QWidget
{
    Q_OBJECT

public:
    enum class Level { Info, Success, Warning, Error };

    explicit StatusLog(QWidget* parent = nullptr);

    void logInfo(const QString& message)    { log(Level::Info, message); }
    void logSuccess(const QString& message) { log(Level::Success, message); }
    void logWarning(const QString& message) { log(Level::Warning, message); }
    void logError(const QString& message)   { log(Level::Error, message); }
    void log(Level level, const QString& message);
    void clear();

    /// Current activity ("Fetching Holes...", "Ready").
    void setStatusText(const QString& text);

    int warningCount() const { return m_warnings; }
    int errorCount() const { return m_errors; }

private:
    void setupUi();
    void updateCounters();

    QPlainTextEdit* m_logText      = nullptr;
    QLabel*         m_statusLabel  = nullptr;
    QLabel*         m_counterLabel = nullptr;
    QPushButton*    m_clearBtn     = nullptr;

    int m_warnings = 0;
    int m_errors   = 0;
};
