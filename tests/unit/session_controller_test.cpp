// tests/unit/session_controller_test.cpp

#include "TestSupport.h"

#include "core/RequestGateway.h"
#include "core/SessionController.h"
#include "core/TokenStore.h"

#include <QCoreApplication>

#include <cassert>
#include <iostream>

using namespace mdi;
using namespace mdi_test;

namespace {

struct Harness {
    ManualClock         clock;
    AppConfig           config = testConfig();
    FakeTransport       transport;
    MemorySettingsStore settings;
    TokenStore          tokens;
    RequestGateway      gateway{ transport, tokens, config, clock.clock() };
    SessionController   session{ tokens, gateway, settings, config, clock.clock() };

    int expiredCount   = 0;
    int logoutCount    = 0;
    int succeededCount = 0;
    int signedOutCount = 0;
    QVector<AuthError> failures;

    Harness()
    {
        QObject::connect(&session, &SessionController::sessionExpired, [this]() { ++expiredCount; });
        QObject::connect(&session, &SessionController::logoutCompleted, [this]() { ++logoutCount; });
        QObject::connect(&session, &SessionController::loginSucceeded, [this](const Session&) { ++succeededCount; });
        QObject::connect(&session, &SessionController::loginFailed, [this](const AuthError& e) { failures.append(e); });
        QObject::connect(&session, &SessionController::sessionChanged, [this](bool authenticated, Role) {
            if (!authenticated) {
                ++signedOutCount;
            }
        });
    }

    void loginAs(const QString& role, qint64 lifetime = 3600)
    {
        session.login(QStringLiteral("geo@example.com"), QStringLiteral("secret"));
        assert(transport.replyJson(200, loginReply(makeToken(clock.now() + lifetime, role))));
    }
};

void TestLoginEstablishesAndPersistsSession()
{
    Harness h;
    h.session.login(QStringLiteral("geo@example.com"), QStringLiteral("secret"));
    assert(h.session.isLoginPending());
    assert(h.transport.sentCount() == 1);
    assert(h.transport.lastRequest().url.host() == QStringLiteral("auth.test"));
    assert(queryValue(h.transport.lastRequest(), QStringLiteral("key")) == QStringLiteral("test-key"));
    assert(h.transport.lastRequest().body.contains("geo@example.com"));

    const QString token = makeToken(h.clock.now() + 3600, QStringLiteral("premium"));
    assert(h.transport.replyJson(200, loginReply(token)));

    assert(h.succeededCount == 1);
    assert(h.session.isAuthenticated());
    assert(h.session.role() == Role::Premium);
    assert(h.session.session().accessToken == token);
    assert(h.session.lastIdentity() == QStringLiteral("geo@example.com"));

    assert(h.settings.size() == 4);
    assert(h.settings.get(settings_keys::kAccessToken) == token);
    assert(h.settings.get(settings_keys::kRefreshToken) == QStringLiteral("refresh-1"));
    assert(h.settings.get(settings_keys::kExpiresAt).toLongLong() == h.clock.now() + 3600);

    assert(h.session.isRefreshScheduled());
    assert(h.session.refreshIntervalMs() == (3600 - 60) * 1000);
}

void TestInvalidEmailNeverHitsNetwork()
{
    Harness h;
    h.session.login(QStringLiteral("not-an-email"), QStringLiteral("secret"));
    assert(h.transport.sentCount() == 0);
    assert(h.failures.size() == 1);
    assert(h.failures.front().code == AuthErrorCode::InvalidCredential);
    assert(!h.session.isAuthenticated());
}

void TestRejectedLogin()
{
    Harness h;
    h.session.login(QStringLiteral("geo@example.com"), QStringLiteral("wrong"));
    assert(h.transport.reply(400, QByteArray(R"({"error":{"message":"INVALID_PASSWORD"}})")));
    assert(h.failures.size() == 1);
    assert(h.failures.front().code == AuthErrorCode::InvalidCredential);
    assert(!h.session.isAuthenticated());
    assert(h.settings.size() == 0);

    h.session.login(QStringLiteral("geo@example.com"), QStringLiteral("secret"));
    assert(h.transport.failTransport(QStringLiteral("Connection refused")));
    assert(h.failures.size() == 2);
    assert(h.failures.back().code == AuthErrorCode::NetworkFailure);

    h.session.login(QStringLiteral("geo@example.com"), QStringLiteral("secret"));
    assert(h.transport.replyJson(200, loginReply(QStringLiteral("garbage"))));
    assert(h.failures.size() == 3);
    assert(h.failures.back().code == AuthErrorCode::MalformedToken);
    assert(!h.session.isAuthenticated());
}

void TestLogoutIsIdempotentAndTotal()
{
    Harness h;
    h.loginAs(QStringLiteral("premium"));

    ApiRequest request;
    request.http.url = QUrl(QStringLiteral("https://data.test/companies/search"));
    bool handlerRan = false;
    assert(h.gateway.dispatch(request, true, [&](const HttpResponse&) { handlerRan = true; }).ok());

    h.session.logout();
    const Session afterFirst = h.session.session();
    assert(afterFirst == Session{});
    assert(h.settings.size() == 0);
    assert(h.gateway.inFlightCount() == 0);
    assert(h.transport.abortCount() == 1);
    assert(!h.session.isRefreshScheduled());
    assert(h.logoutCount == 1);
    assert(h.signedOutCount == 1);

    h.session.logout();
    assert(h.session.session() == afterFirst);
    assert(h.settings.size() == 0);
    assert(h.logoutCount == 2);
    assert(h.signedOutCount == 1);
    assert(!h.transport.reply(200, QByteArray("[]")));
    assert(!handlerRan);
    assert(h.expiredCount == 0);
}

void TestExpiryLeavesSameStateAsLogout()
{
    Harness userLogout;
    userLogout.loginAs(QStringLiteral("admin"));
    userLogout.session.logout();

    Harness expiry;
    expiry.loginAs(QStringLiteral("admin"));
    assert(!expiry.session.validateAndLogoutIfExpired());
    expiry.clock.advance(3600);
    assert(!expiry.session.isAuthenticated());
    assert(expiry.session.validateAndLogoutIfExpired());
    assert(expiry.expiredCount == 1);
    assert(!expiry.session.validateAndLogoutIfExpired());
    assert(expiry.expiredCount == 1);

    assert(expiry.session.session() == userLogout.session.session());
    assert(expiry.settings.keys() == userLogout.settings.keys());
    assert(expiry.gateway.inFlightCount() == userLogout.gateway.inFlightCount());
    assert(expiry.session.isRefreshScheduled() == userLogout.session.isRefreshScheduled());
}

void TestInvalidateSession()
{
    Harness h;
    assert(!h.session.invalidateSession());
    assert(h.expiredCount == 0);

    h.loginAs(QStringLiteral("premium"));
    assert(h.session.invalidateSession());
    assert(h.expiredCount == 1);
    assert(!h.session.isAuthenticated());
    assert(!h.session.invalidateSession());
    assert(h.expiredCount == 1);
}

void TestSecondLoginReplacesSession()
{
    Harness h;
    h.loginAs(QStringLiteral("free_trial"));
    assert(h.session.role() == Role::FreeTrial);
    assert(h.logoutCount == 0);

    h.loginAs(QStringLiteral("premium"));
    assert(h.logoutCount == 1);
    assert(h.session.role() == Role::Premium);
    assert(h.succeededCount == 2);
}

void TestRefreshReplacesToken()
{
    Harness h;
    h.loginAs(QStringLiteral("premium"));
    h.clock.advance(3500);

    h.session.refreshNow();
    assert(h.session.isRefreshPending());
    assert(h.transport.lastRequest().url.host() == QStringLiteral("auth.test"));
    assert(h.transport.lastRequest().url.path() == QStringLiteral("/token"));
    assert(h.transport.lastRequest().body.contains("refresh-1"));

    const QString renewed = makeToken(h.clock.now() + 3600, QStringLiteral("premium"));
    QJsonObject reply;
    reply.insert(QStringLiteral("id_token"), renewed);
    reply.insert(QStringLiteral("refresh_token"), QStringLiteral("refresh-2"));
    reply.insert(QStringLiteral("expires_in"), QStringLiteral("3600"));
    assert(h.transport.replyJson(200, reply));

    assert(!h.session.isRefreshPending());
    assert(h.session.isAuthenticated());
    assert(h.session.session().accessToken == renewed);
    assert(h.settings.get(settings_keys::kRefreshToken) == QStringLiteral("refresh-2"));
    assert(h.session.lastIdentity() == QStringLiteral("geo@example.com"));
    assert(h.expiredCount == 0);
}

void TestRefreshFailureExpiresSession()
{
    Harness h;
    h.loginAs(QStringLiteral("premium"));
    h.session.refreshNow();
    assert(h.transport.reply(400, QByteArray(R"({"error":{"message":"TOKEN_EXPIRED"}})")));
    assert(h.expiredCount == 1);
    assert(!h.session.isAuthenticated());
    assert(h.settings.size() == 0);
}

void TestRestoreValidSession()
{
    Harness h;
    const QString token = makeToken(h.clock.now() + 600, QStringLiteral("admin"));
    h.settings.set(settings_keys::kAccessToken, token);
    h.settings.set(settings_keys::kRefreshToken, QStringLiteral("refresh-9"));
    h.settings.set(settings_keys::kExpiresAt, QString::number(h.clock.now() + 600));
    h.settings.set(settings_keys::kLastIdentity, QStringLiteral("geo@example.com"));

    h.session.restoreSession();
    assert(h.transport.sentCount() == 0);
    assert(h.session.isAuthenticated());
    assert(h.session.role() == Role::Admin);
    assert(h.session.lastIdentity() == QStringLiteral("geo@example.com"));
    assert(h.session.isRefreshScheduled());
}

void TestRestoreExpiredSessionRefreshes()
{
    Harness h;
    h.settings.set(settings_keys::kAccessToken, makeToken(h.clock.now() - 10, QStringLiteral("premium")));
    h.settings.set(settings_keys::kRefreshToken, QStringLiteral("refresh-9"));
    h.settings.set(settings_keys::kLastIdentity, QStringLiteral("geo@example.com"));

    h.session.restoreSession();
    assert(!h.session.isAuthenticated());
    assert(h.transport.sentCount() == 1);

    QJsonObject reply;
    reply.insert(QStringLiteral("id_token"), makeToken(h.clock.now() + 3600, QStringLiteral("premium")));
    reply.insert(QStringLiteral("expires_in"), QStringLiteral("3600"));
    assert(h.transport.replyJson(200, reply));
    assert(h.session.isAuthenticated());
    assert(h.settings.get(settings_keys::kRefreshToken) == QStringLiteral("refresh-9"));
}

void TestLoginDuringSilentRefreshKeepsNewIdentity()
{
    Harness h;
    h.settings.set(settings_keys::kAccessToken,
                   makeToken(h.clock.now() - 10, QStringLiteral("admin"), QStringLiteral("old@example.com")));
    h.settings.set(settings_keys::kRefreshToken, QStringLiteral("refresh-old"));
    h.settings.set(settings_keys::kLastIdentity, QStringLiteral("old@example.com"));

    h.session.restoreSession();
    assert(h.session.isRefreshPending());
    assert(h.transport.sentCount() == 1);

    h.session.login(QStringLiteral("new@example.com"), QStringLiteral("secret"));
    assert(!h.session.isRefreshPending());
    assert(h.transport.abortCount() == 1);
    assert(h.settings.get(settings_keys::kRefreshToken).isEmpty());

    const QString token = makeToken(h.clock.now() + 3600, QStringLiteral("free_trial"), QStringLiteral("new@example.com"));
    assert(h.transport.replyJson(200, loginReply(token, QStringLiteral("refresh-new"))));
    assert(h.session.isAuthenticated());

    // The old refresh was aborted: nothing is left to answer.
    QJsonObject late;
    late.insert(QStringLiteral("id_token"),
                makeToken(h.clock.now() + 3600, QStringLiteral("admin"), QStringLiteral("old@example.com")));
    late.insert(QStringLiteral("expires_in"), QStringLiteral("3600"));
    assert(!h.transport.replyJson(200, late));
    assert(!h.transport.reply(400, QByteArray(R"({"error":{"message":"TOKEN_EXPIRED"}})")));

    assert(h.session.session().accessToken == token);
    assert(h.session.lastIdentity() == QStringLiteral("new@example.com"));
    assert(h.session.role() == Role::FreeTrial);
    assert(h.settings.get(settings_keys::kRefreshToken) == QStringLiteral("refresh-new"));
    assert(h.expiredCount == 0);
    assert(h.succeededCount == 1);
}

void TestShortLivedTokenRefreshesAtHalfLife()
{
    Harness h;
    h.loginAs(QStringLiteral("premium"), 30);
    assert(h.session.isRefreshScheduled());
    assert(h.session.refreshIntervalMs() == 15000);

    h.loginAs(QStringLiteral("premium"), 61);
    assert(h.session.refreshIntervalMs() == 30500);

    h.loginAs(QStringLiteral("premium"), 600);
    assert(h.session.refreshIntervalMs() == (600 - 60) * 1000);
}

void TestRestoreWithoutRefreshTokenPurges()
{
    Harness h;
    h.settings.set(settings_keys::kAccessToken, makeToken(h.clock.now() - 10, QStringLiteral("premium")));
    h.settings.set(settings_keys::kExpiresAt, QString::number(h.clock.now() - 10));

    h.session.restoreSession();
    assert(h.transport.sentCount() == 0);
    assert(!h.session.isAuthenticated());
    assert(h.settings.size() == 0);
}

void TestLoginRequiredLogsOutFirst()
{
    Harness h;
    int prompts = 0;
    QObject::connect(&h.session, &SessionController::loginRequired, [&]() { ++prompts; });
    h.loginAs(QStringLiteral("premium"));

    h.session.handleLoginRequired();
    assert(prompts == 1);
    assert(h.logoutCount == 1);
    assert(!h.session.isAuthenticated());
}

} // namespace

int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);
    TestLoginEstablishesAndPersistsSession();
    TestInvalidEmailNeverHitsNetwork();
    TestRejectedLogin();
    TestLogoutIsIdempotentAndTotal();
    TestExpiryLeavesSameStateAsLogout();
    TestInvalidateSession();
    TestSecondLoginReplacesSession();
    TestRefreshReplacesToken();
    TestRefreshFailureExpiresSession();
    TestRestoreValidSession();
    TestRestoreExpiredSessionRefreshes();
    TestLoginDuringSilentRefreshKeepsNewIdentity();
    TestShortLivedTokenRefreshesAtHalfLife();
    TestRestoreWithoutRefreshTokenPurges();
    TestLoginRequiredLogsOutFirst();
    std::cout << "mdi_unit_session_controller: pass\n";
    return 0;
}
