// src/ui/StatusLog.cpp

#include "StatusLog.h"

#include <QDateTime>
#include <QHBoxLayout>
#include <QLabel>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QVBoxLayout>

namespace {

const char* levelColor(StatusLog::Level level)
{
    switch (level) {
    case StatusLog::Level::Success: return "#4caf50";
    case StatusLog::Level::Warning: return "orange";
    case StatusLog::Level::Error:   return "#ef5350";
    case StatusLog::Level::Info:    break;
    }
    return nullptr;
}

QString levelName(StatusLog::Level level)
{
    switch (level) {
    case StatusLog::Level::Success: return StatusLog::tr("OK");
    case StatusLog::Level::Warning: return StatusLog::tr("Warning");
    case StatusLog::Level::Error:   return StatusLog::tr("Error");
    case StatusLog::Level::Info:    break;
    }
    return StatusLog::tr("Info");
}

} // anonymous namespace

StatusLog::StatusLog(QWidget* parent)
    : QWidget(parent)
{
    setupUi();
}

void StatusLog::setupUi()
{
    auto* mainLayout = new QVBoxLayout(this);
    mainLayout->setContentsMargins(4, 4, 4, 4);
    mainLayout->setSpacing(4);

    auto* header = new QWidget(this);
    auto* headerLayout = new QHBoxLayout(header);
    headerLayout->setContentsMargins(0, 0, 0, 0);

    m_statusLabel = new QLabel(tr("Ready"), header);
    m_statusLabel->setStyleSheet("QLabel { font-weight: bold; }");
    headerLayout->addWidget(m_statusLabel, 1);

    m_counterLabel = new QLabel(header);
    m_counterLabel->setStyleSheet("QLabel { color: #aaaaaa; }");
    headerLayout->addWidget(m_counterLabel);

    m_clearBtn = new QPushButton(tr("Clear"), header);
    m_clearBtn->setMaximumWidth(80);
    connect(m_clearBtn, &QPushButton::clicked, this, &StatusLog::clear);
    headerLayout->addWidget(m_clearBtn);

    mainLayout->addWidget(header);

    m_logText = new QPlainTextEdit(this);
    m_logText->setReadOnly(true);
    m_logText->setMaximumBlockCount(2000);
    mainLayout->addWidget(m_logText);
}

void StatusLog::log(Level level, const QString& message)
{
    if (level == Level::Warning) {
        ++m_warnings;
    } else if (level == Level::Error) {
        ++m_errors;
    }

    const QString ts = QDateTime::currentDateTime().toString("HH:mm:ss");
    const char* color = levelColor(level);
    if (!color) {
        m_logText->appendPlainText(QString("[%1] %2").arg(ts, message));
    } else {
        m_logText->appendHtml(QString("<span style='color: %1;'>[%2] <b>%3</b>: %4</span>")
                                  .arg(QLatin1String(color), ts, levelName(level), message.toHtmlEscaped()));
    }
    updateCounters();
}

void StatusLog::clear()
{
    m_logText->clear();
    m_warnings = 0;
    m_errors   = 0;
    updateCounters();
}

void StatusLog::setStatusText(const QString& text)
{
    m_statusLabel->setText(text);
}

void StatusLog::updateCounters()
{
    QStringList parts;
    if (m_warnings > 0) {
        parts << tr("%n warning(s)", nullptr, m_warnings);
    }
    if (m_errors > 0) {
        parts << tr("%n error(s)", nullptr, m_errors);
    }
    m_counterLabel->setText(parts.join(QStringLiteral(", ")));
}
