// src/core/SessionController.h
//
// SessionController – authentication state machine.
//
//   LoggedOut --[login / restore / refresh ok]--> LoggedIn
//   LoggedIn  --[logout | expiry | refresh failure | token rejected]--> LoggedOut
//
// Every path back to LoggedOut goes through logout(), so user-initiated
// logout and detected expiry leave identical state behind.  logout() only
// owns auth state; dataset state is cleared by whoever listens to
// logoutCompleted().
//
// Token material is persisted through the injected SettingsStore; the
// refresh timer fires refreshLeadSeconds before expiry.

#pragma once

#include "AppConfig.h"
#include "HttpTransport.h"
#include "RequestGateway.h"
#include "SettingsStore.h"
#include "TokenStore.h"
#include "Types.h"

#include <QObject>
#include <QTimer>

namespace mdi {

class SessionController : public QObject {
    Q_OBJECT

public:
    SessionController(TokenStore& tokens,
                      RequestGateway& gateway,
                      SettingsStore& settings,
                      const AppConfig& config,
                      Clock clock = systemClock(),
                      QObject* parent = nullptr);
    ~SessionController() override;

    SessionController(const SessionController&)            = delete;
    SessionController& operator=(const SessionController&) = delete;

    // -----------------------------------------------------------------------
    // Queries
    // -----------------------------------------------------------------------
    [[nodiscard]] bool           isAuthenticated() const;
    [[nodiscard]] const Session& session() const noexcept { return m_tokens.session(); }
    [[nodiscard]] Role           role() const noexcept { return m_tokens.session().role; }
    [[nodiscard]] bool           isLoginPending() const noexcept { return m_loginRequest != 0; }
    [[nodiscard]] bool           isRefreshPending() const noexcept { return m_refreshRequest != 0; }
    [[nodiscard]] bool           isRefreshScheduled() const { return m_refreshTimer.isActive(); }
    [[nodiscard]] int            refreshIntervalMs() const { return m_refreshTimer.interval(); }

    /// Last identity that logged in successfully, for autofill.
    [[nodiscard]] QString lastIdentity() const { return m_tokens.session().lastIdentity; }

    // -----------------------------------------------------------------------
    // Operations
    // -----------------------------------------------------------------------

    /// Exchange credentials for a session.  Completes with loginSucceeded or
    /// loginFailed.  An invalid email fails without touching the network.
    void login(const QString& identity, const QString& credential);

    /// Idempotent and total: clear tokens, stop the refresh timer, cancel
    /// all in-flight requests, remove persisted keys.  Always emits
    /// logoutCompleted().
    void logout();

    /// Log out if a token is present but no longer valid.  Emits
    /// sessionExpired() once per logout performed.  Returns whether a logout
    /// happened.
    bool validateAndLogoutIfExpired();

    /// The server rejected a token we still considered valid.  Goes through
    /// the same expiry path.  Returns false if there was no session.
    bool invalidateSession();

    /// Defensive logout, then ask the UI for credentials.
    void handleLoginRequired();

    /// Exchange the refresh token for a new access token now.
    void refreshNow();

    /// Resume a persisted session at startup.  A still-valid access token is
    /// reused; an expired one is silently refreshed; stale keys are purged.
    void restoreSession();

signals:
    void sessionChanged(bool authenticated, mdi::Role role);
    void loginSucceeded(const mdi::Session& session);
    void loginFailed(const mdi::AuthError& error);
    void sessionExpired();
    void logoutCompleted();
    void loginRequired();

private:
    void startRefresh(const QString& refreshToken, const QString& identity);
    void handleLoginReply(const HttpResponse& response, const QString& identity);
    void handleRefreshReply(const HttpResponse& response, const QString& identity);

    /// Validates, stores, persists and schedules.  Returns a non-ok error
    /// when the token cannot be used.
    AuthError establish(const QString& accessToken,
                        const QString& refreshToken,
                        qint64 expiresIn,
                        const QString& identity);

    void persist(const Session& session);
    void purgePersisted();
    void scheduleRefresh();
    void expire();

    TokenStore&      m_tokens;
    RequestGateway&  m_gateway;
    SettingsStore&   m_settings;
    const AppConfig& m_config;
    Clock            m_clock;

    QTimer    m_refreshTimer;
    RequestId m_loginRequest   = 0;
    RequestId m_refreshRequest = 0;
};

} // namespace mdi
