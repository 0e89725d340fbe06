// src/core/SessionController.cpp

#include "SessionController.h"

#include "TokenCodec.h"
#include "Validation.h"
#include "util/JsonReply.h"
#include "util/Log.h"

#include <QJsonObject>

#include <algorithm>
#include <initializer_list>
#include <limits>

namespace mdi {

namespace {

// Firebase reports expiresIn as a decimal string; tolerate numbers too.
qint64 readSeconds(const QJsonValue& v)
{
    if (v.isString()) {
        return v.toString().toLongLong();
    }
    if (v.isDouble()) {
        return static_cast<qint64>(v.toDouble());
    }
    return 0;
}

QString firstString(const QJsonObject& obj, std::initializer_list<const char*> keys)
{
    for (const char* key : keys) {
        const QString value = obj.value(QLatin1String(key)).toString();
        if (!value.isEmpty()) {
            return value;
        }
    }
    return QString();
}

QString friendlyAuthMessage(const QString& serverMessage)
{
    const QString code = serverMessage.section(QLatin1Char(' '), 0, 0).trimmed();
    if (code == QLatin1String("INVALID_PASSWORD")
        || code == QLatin1String("EMAIL_NOT_FOUND")
        || code == QLatin1String("INVALID_LOGIN_CREDENTIALS")
        || code == QLatin1String("INVALID_EMAIL")) {
        return QStringLiteral("Invalid email or password.");
    }
    if (code == QLatin1String("USER_DISABLED")) {
        return QStringLiteral("This account has been disabled.");
    }
    if (code == QLatin1String("TOO_MANY_ATTEMPTS_TRY_LATER")) {
        return QStringLiteral("Too many failed attempts. Please try again later.");
    }
    return serverMessage.isEmpty() ? QStringLiteral("Login failed.") : serverMessage;
}

} // anonymous namespace

// ===========================================================================
// Construction
// ===========================================================================

SessionController::SessionController(TokenStore& tokens,
                                     RequestGateway& gateway,
                                     SettingsStore& settings,
                                     const AppConfig& config,
                                     Clock clock,
                                     QObject* parent)
    : QObject(parent)
    , m_tokens(tokens)
    , m_gateway(gateway)
    , m_settings(settings)
    , m_config(config)
    , m_clock(std::move(clock))
{
    qRegisterMetaType<mdi::Role>();
    qRegisterMetaType<mdi::Session>();
    qRegisterMetaType<mdi::AuthError>();

    m_refreshTimer.setSingleShot(true);
    connect(&m_refreshTimer, &QTimer::timeout, this, &SessionController::refreshNow);
}

SessionController::~SessionController() = default;

bool SessionController::isAuthenticated() const
{
    return m_tokens.isValidAt(m_clock());
}

// ===========================================================================
// Login
// ===========================================================================

void SessionController::login(const QString& identity, const QString& credential)
{
    const QString email = identity.trimmed();
    if (credential.isEmpty() || !isValidEmail(email)) {
        emit loginFailed(AuthError{ AuthErrorCode::InvalidCredential,
                                    QStringLiteral("A valid email and password are required.") });
        return;
    }

    const QString configProblem = m_config.validate();
    if (!configProblem.isEmpty()) {
        emit loginFailed(AuthError{ AuthErrorCode::NetworkFailure, configProblem });
        return;
    }

    // Never let a previous session (or a half-finished attempt) leak into
    // this one.
    if (m_tokens.hasToken()) {
        logout();
    }
    if (m_loginRequest != 0) {
        m_gateway.cancel(m_loginRequest);
        m_loginRequest = 0;
    }
    // A silent refresh from restoreSession() holds no token yet; it belongs
    // to the previous identity and must not land on top of this login.
    if (m_refreshRequest != 0) {
        m_gateway.cancel(m_refreshRequest);
        m_refreshRequest = 0;
        purgePersisted();
    }

    QJsonObject payload;
    payload.insert(QStringLiteral("email"), email);
    payload.insert(QStringLiteral("password"), credential);
    payload.insert(QStringLiteral("returnSecureToken"), true);

    ApiRequest request;
    request.kind        = RequestKind::Auth;
    request.http.method = HttpMethod::Post;
    request.http.url    = m_config.signInUrl();
    request.http.body   = toJsonBody(payload);

    qCInfo(lcSession) << "Logging in";
    const DispatchResult dispatched = m_gateway.dispatch(request, /*requiresAuth=*/false,
        [this, email](const HttpResponse& response) {
            handleLoginReply(response, email);
        });
    m_loginRequest = dispatched.id;
}

void SessionController::handleLoginReply(const HttpResponse& response, const QString& identity)
{
    m_loginRequest = 0;

    if (response.transportFailed || response.status == 0 || response.status >= 500) {
        const QString reason = response.errorString.isEmpty()
            ? QStringLiteral("HTTP %1").arg(response.status)
            : response.errorString;
        qCWarning(lcSession) << "Login failed: network error:" << reason;
        emit loginFailed(AuthError{ AuthErrorCode::NetworkFailure,
                                    QStringLiteral("Login failed: %1").arg(reason) });
        return;
    }

    if (response.status >= 400) {
        const QString serverMessage = errorMessageFromBody(response.body);
        qCInfo(lcSession) << "Login rejected:" << response.status << serverMessage;
        emit loginFailed(AuthError{ AuthErrorCode::InvalidCredential, friendlyAuthMessage(serverMessage) });
        return;
    }

    QJsonDocument doc;
    QString parseError;
    if (!parseJsonBody(response.body, doc, &parseError) || !doc.isObject()) {
        emit loginFailed(AuthError{ AuthErrorCode::MalformedToken,
                                    parseError.isEmpty() ? QStringLiteral("Unexpected login response.") : parseError });
        return;
    }

    const QJsonObject obj = doc.object();
    const QString accessToken  = firstString(obj, { "idToken" });
    const QString refreshToken = firstString(obj, { "refreshToken" });
    if (accessToken.isEmpty() || refreshToken.isEmpty()) {
        emit loginFailed(AuthError{ AuthErrorCode::MalformedToken,
                                    QStringLiteral("Could not retrieve authentication credentials.") });
        return;
    }

    const AuthError error = establish(accessToken, refreshToken,
                                      readSeconds(obj.value(QStringLiteral("expiresIn"))), identity);
    if (!error.ok()) {
        qCWarning(lcSession) << "Login failed:" << error.message;
        emit loginFailed(error);
        return;
    }

    qCInfo(lcSession) << "Logged in as" << roleName(role());
    emit loginSucceeded(session());
}

// ===========================================================================
// Session establishment
// ===========================================================================

AuthError SessionController::establish(const QString& accessToken,
                                       const QString& refreshToken,
                                       qint64 expiresIn,
                                       const QString& identity)
{
    const qint64 now = m_clock();

    TokenClaims claims;
    QString decodeError;
    if (!decodeToken(accessToken, expiresIn > 0 ? now + expiresIn : 0, claims, &decodeError)) {
        return AuthError{ AuthErrorCode::MalformedToken, decodeError };
    }
    if (claims.expiresAt <= now) {
        return AuthError{ AuthErrorCode::MalformedToken, QStringLiteral("Token is already expired.") };
    }

    Session s;
    s.accessToken  = accessToken;
    s.refreshToken = refreshToken;
    s.expiresAt    = claims.expiresAt;
    s.role         = claims.role;
    s.lastIdentity = identity.isEmpty() ? claims.email : identity;

    m_tokens.set(s);
    persist(s);
    scheduleRefresh();

    emit sessionChanged(true, s.role);
    return AuthError{};
}

void SessionController::persist(const Session& session)
{
    m_settings.set(settings_keys::kAccessToken, session.accessToken);
    m_settings.set(settings_keys::kRefreshToken, session.refreshToken);
    m_settings.set(settings_keys::kExpiresAt, QString::number(session.expiresAt));
    m_settings.set(settings_keys::kLastIdentity, session.lastIdentity);
}

void SessionController::purgePersisted()
{
    for (const QString& key : settings_keys::all()) {
        m_settings.remove(key);
    }
}

void SessionController::scheduleRefresh()
{
    // Tokens living shorter than the lead time refresh at half-life, never
    // immediately.
    const qint64 remainingMs = std::max<qint64>(0, m_tokens.session().expiresAt - m_clock()) * 1000;
    const qint64 leadMs      = static_cast<qint64>(m_config.refreshLeadSeconds) * 1000;
    const qint64 delayMs     = std::min<qint64>(std::max<qint64>(remainingMs - leadMs, remainingMs / 2),
                                                std::numeric_limits<int>::max());
    m_refreshTimer.start(static_cast<int>(delayMs));
    qCDebug(lcSession) << "Token refresh scheduled in" << delayMs << "ms";
}

// ===========================================================================
// Logout / expiry
// ===========================================================================

void SessionController::logout()
{
    const bool wasActive = m_tokens.hasToken();

    m_tokens.clear();
    m_refreshTimer.stop();
    m_loginRequest   = 0;
    m_refreshRequest = 0;
    m_gateway.cancelAll();
    purgePersisted();

    if (wasActive) {
        qCInfo(lcSession) << "Logged out";
        emit sessionChanged(false, Role::Unset);
    }
    emit logoutCompleted();
}

void SessionController::expire()
{
    logout();
    emit sessionExpired();
}

bool SessionController::validateAndLogoutIfExpired()
{
    if (!m_tokens.hasToken() || isAuthenticated()) {
        return false;
    }
    qCInfo(lcSession) << "Session expired";
    expire();
    return true;
}

bool SessionController::invalidateSession()
{
    if (!m_tokens.hasToken()) {
        return false;
    }
    qCInfo(lcSession) << "Session rejected by server";
    expire();
    return true;
}

void SessionController::handleLoginRequired()
{
    logout();
    emit loginRequired();
}

// ===========================================================================
// Refresh / restore
// ===========================================================================

void SessionController::refreshNow()
{
    const QString refreshToken = m_tokens.session().refreshToken;
    if (refreshToken.isEmpty()) {
        qCWarning(lcSession) << "Token refresh skipped: no refresh token";
        return;
    }
    startRefresh(refreshToken, m_tokens.session().lastIdentity);
}

void SessionController::startRefresh(const QString& refreshToken, const QString& identity)
{
    if (m_refreshRequest != 0) {
        return;
    }
    const QString configProblem = m_config.validate();
    if (!configProblem.isEmpty()) {
        qCWarning(lcSession).noquote() << "Token refresh skipped:" << configProblem;
        return;
    }

    QJsonObject payload;
    payload.insert(QStringLiteral("grant_type"), QStringLiteral("refresh_token"));
    payload.insert(QStringLiteral("refresh_token"), refreshToken);

    ApiRequest request;
    request.kind        = RequestKind::Auth;
    request.http.method = HttpMethod::Post;
    request.http.url    = m_config.refreshUrl();
    request.http.body   = toJsonBody(payload);

    qCDebug(lcSession) << "Refreshing access token";
    const DispatchResult dispatched = m_gateway.dispatch(request, /*requiresAuth=*/false,
        [this, refreshToken, identity](const HttpResponse& response) {
            m_refreshRequest = 0;
            QJsonDocument doc;
            if (response.transportFailed || response.status != 200
                || !parseJsonBody(response.body, doc) || !doc.isObject()) {
                qCWarning(lcSession) << "Token refresh failed:" << response.status
                                     << (response.errorString.isEmpty()
                                             ? errorMessageFromBody(response.body)
                                             : response.errorString);
                expire();
                return;
            }

            const QJsonObject obj = doc.object();
            const QString accessToken = firstString(obj, { "id_token", "access_token" });
            QString nextRefresh = firstString(obj, { "refresh_token" });
            if (nextRefresh.isEmpty()) {
                nextRefresh = refreshToken;
            }
            const AuthError error = accessToken.isEmpty()
                ? AuthError{ AuthErrorCode::MalformedToken, QStringLiteral("No token in refresh response") }
                : establish(accessToken, nextRefresh,
                            readSeconds(obj.value(QStringLiteral("expires_in"))), identity);
            if (!error.ok()) {
                qCWarning(lcSession) << "Token refresh failed:" << error.message;
                expire();
                return;
            }
            qCInfo(lcSession) << "Access token refreshed";
        });
    m_refreshRequest = dispatched.id;
}

void SessionController::restoreSession()
{
    const QString accessToken  = m_settings.get(settings_keys::kAccessToken);
    const QString refreshToken = m_settings.get(settings_keys::kRefreshToken);
    const QString identity     = m_settings.get(settings_keys::kLastIdentity);
    const qint64  expiresAt    = m_settings.get(settings_keys::kExpiresAt).toLongLong();

    if (!accessToken.isEmpty()) {
        TokenClaims claims;
        if (decodeToken(accessToken, expiresAt, claims) && claims.expiresAt > m_clock()) {
            Session s;
            s.accessToken  = accessToken;
            s.refreshToken = refreshToken;
            s.expiresAt    = claims.expiresAt;
            s.role         = claims.role;
            s.lastIdentity = identity;
            m_tokens.set(s);
            scheduleRefresh();
            qCInfo(lcSession) << "Resumed persisted session as" << roleName(s.role);
            emit sessionChanged(true, s.role);
            return;
        }
    }

    if (!refreshToken.isEmpty()) {
        qCInfo(lcSession) << "Persisted access token unusable; refreshing silently";
        startRefresh(refreshToken, identity);
        return;
    }

    purgePersisted();
}

} // namespace mdi
