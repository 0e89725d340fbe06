// src/ui/TopBar.h
//
// TopBar – QToolBar with the session controls and the global reset.

#pragma once

#include "core/Types.h"

#include <QToolBar>

class QAction;
class QLabel;

/// \brief Application toolbar with login state, login/logout and reset.
class TopBar : public QToolBar
{
    Q_OBJECT

public:
    explicit TopBar(QWidget* parent = nullptr);

    void setSessionState(bool authenticated, mdi::Role role, const QString& identity = {});

signals:
    void loginRequested();
    void logoutRequested();
    void resetAllRequested();

private:
    QAction* m_actLogin    = nullptr;
    QAction* m_actLogout   = nullptr;
    QAction* m_actResetAll = nullptr;
    QLabel*  m_sessionStatus = nullptr;
    QLabel*  m_tierLabel     = nullptr;

    void setupActions();
};
