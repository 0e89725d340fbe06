// src/ui/TopBar.cpp

#include "TopBar.h"

#include <QAction>
#include <QLabel>
#include <QStyle>

TopBar::TopBar(QWidget* parent)
    : QToolBar(tr("Toolbar"), parent)
{
    setObjectName("TopBar");
    setMovable(false);
    setFloatable(false);
    setToolButtonStyle(Qt::ToolButtonTextBesideIcon);
    setIconSize(QSize(20, 20));

    setupActions();
    setSessionState(false, mdi::Role::Unset);
}

void TopBar::setupActions()
{
    m_sessionStatus = new QLabel(this);
    addWidget(m_sessionStatus);

    m_tierLabel = new QLabel(this);
    m_tierLabel->setStyleSheet("QLabel { color: #2196F3; margin: 0 8px; }");
    addWidget(m_tierLabel);

    // Push the actions right
    QWidget* spacer = new QWidget(this);
    spacer->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Preferred);
    addWidget(spacer);

    m_actResetAll = addAction(tr("Reset All"));
    m_actResetAll->setIcon(style()->standardIcon(QStyle::SP_BrowserReload));
    m_actResetAll->setToolTip(tr("Clear fetched data and filters on both tabs"));
    connect(m_actResetAll, &QAction::triggered, this, &TopBar::resetAllRequested);

    addSeparator();

    m_actLogin = addAction(tr("Login"));
    m_actLogin->setIcon(style()->standardIcon(QStyle::SP_DialogOkButton));
    connect(m_actLogin, &QAction::triggered, this, &TopBar::loginRequested);

    m_actLogout = addAction(tr("Logout"));
    m_actLogout->setIcon(style()->standardIcon(QStyle::SP_DialogCloseButton));
    connect(m_actLogout, &QAction::triggered, this, &TopBar::logoutRequested);
}

void TopBar::setSessionState(bool authenticated, mdi::Role role, const QString& identity)
{
    m_actLogin->setVisible(!authenticated);
    m_actLogout->setVisible(authenticated);

    if (authenticated) {
        m_sessionStatus->setText(identity.isEmpty() ? tr("Logged in") : tr("Logged in as %1").arg(identity));
        m_sessionStatus->setStyleSheet("QLabel { color: green; margin: 0 8px; }");
        m_tierLabel->setText(mdi::roleName(role));
    } else {
        m_sessionStatus->setText(tr("Not logged in"));
        m_sessionStatus->setStyleSheet("QLabel { color: gray; margin: 0 8px; }");
        m_tierLabel->clear();
    }
}
