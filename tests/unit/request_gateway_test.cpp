// tests/unit/request_gateway_test.cpp

#include "TestSupport.h"

#include "core/RequestGateway.h"

#include <QCoreApplication>

#include <cassert>
#include <iostream>

using namespace mdi;
using namespace mdi_test;

namespace {

Session sessionFor(Role role, qint64 expiresAt)
{
    Session s;
    s.accessToken  = QStringLiteral("access-token");
    s.refreshToken = QStringLiteral("refresh-token");
    s.expiresAt    = expiresAt;
    s.role         = role;
    return s;
}

ApiRequest dataRequest(qint64 requestedCount)
{
    ApiRequest request;
    request.kind           = RequestKind::FetchPage;
    request.requestedCount = requestedCount;
    request.http.url       = QUrl(QStringLiteral("https://data.test/plugin/fetch_drill_holes"));
    return request;
}

void TestUnauthenticatedCallNeverReachesTransport()
{
    ManualClock clock;
    AppConfig config = testConfig();
    FakeTransport transport;
    TokenStore tokens;
    RequestGateway gateway(transport, tokens, config, clock.clock());

    bool ran = false;
    const DispatchResult result = gateway.dispatch(dataRequest(10), true, [&](const HttpResponse&) { ran = true; });
    assert(result.error == DispatchError::Unauthenticated);
    assert(result.id == 0);
    assert(transport.sentCount() == 0);
    assert(gateway.inFlightCount() == 0);

    // Present but expired counts as unauthenticated too.
    tokens.set(sessionFor(Role::Premium, clock.now()));
    assert(gateway.dispatch(dataRequest(10), true, {}).error == DispatchError::Unauthenticated);
    assert(transport.sentCount() == 0);
    assert(!ran);
}

void TestTierCeilingIsEnforcedLocally()
{
    ManualClock clock;
    AppConfig config = testConfig();
    FakeTransport transport;
    TokenStore tokens;
    RequestGateway gateway(transport, tokens, config, clock.clock());

    tokens.set(sessionFor(Role::FreeTrial, clock.now() + 3600));
    const DispatchResult rejected = gateway.dispatch(dataRequest(1001), true, {});
    assert(rejected.error == DispatchError::TierLimitExceeded);
    assert(rejected.tierLimit.requested == 1001);
    assert(rejected.tierLimit.allowed == 1000);
    assert(transport.sentCount() == 0);

    assert(gateway.dispatch(dataRequest(1000), true, {}).ok());
    assert(transport.sentCount() == 1);

    tokens.set(sessionFor(Role::Premium, clock.now() + 3600));
    assert(gateway.dispatch(dataRequest(5000001), true, {}).error == DispatchError::TierLimitExceeded);
    assert(gateway.dispatch(dataRequest(5000000), true, {}).ok());

    tokens.set(sessionFor(Role::Admin, clock.now() + 3600));
    assert(gateway.tierCeiling(Role::Admin) == 5000000);
    assert(gateway.tierCeiling(Role::Unset) == 1000);
    assert(!gateway.checkTierLimit(200000).has_value());
    assert(transport.sentCount() == 2);
}

void TestBearerHeaderOnlyOnAuthenticatedCalls()
{
    ManualClock clock;
    AppConfig config = testConfig();
    FakeTransport transport;
    TokenStore tokens;
    RequestGateway gateway(transport, tokens, config, clock.clock());
    tokens.set(sessionFor(Role::Premium, clock.now() + 3600));

    assert(gateway.dispatch(dataRequest(5), true, {}).ok());
    assert(transport.lastRequest().header("authorization") == QByteArray("Bearer access-token"));

    ApiRequest login;
    login.kind = RequestKind::Auth;
    assert(gateway.dispatch(login, false, {}).ok());
    assert(transport.lastRequest().header("Authorization").isEmpty());
}

void TestCompletionRunsHandlerOnce()
{
    ManualClock clock;
    AppConfig config = testConfig();
    FakeTransport transport;
    TokenStore tokens;
    RequestGateway gateway(transport, tokens, config, clock.clock());
    tokens.set(sessionFor(Role::Premium, clock.now() + 3600));

    int calls  = 0;
    int status = 0;
    const DispatchResult result = gateway.dispatch(dataRequest(5), true, [&](const HttpResponse& r) {
        ++calls;
        status = r.status;
    });
    assert(gateway.isInFlight(result.id));
    assert(transport.reply(200, QByteArray("[]")));
    assert(calls == 1);
    assert(status == 200);
    assert(!gateway.isInFlight(result.id));
    assert(!gateway.cancel(result.id));
    assert(!transport.reply(200, QByteArray("[]")));
    assert(calls == 1);
}

void TestCancelAllAbortsEverything()
{
    ManualClock clock;
    AppConfig config = testConfig();
    FakeTransport transport;
    TokenStore tokens;
    RequestGateway gateway(transport, tokens, config, clock.clock());
    tokens.set(sessionFor(Role::Premium, clock.now() + 3600));

    int calls = 0;
    const auto handler = [&](const HttpResponse&) { ++calls; };
    assert(gateway.dispatch(dataRequest(5), true, handler).ok());
    assert(gateway.dispatch(dataRequest(5), true, handler).ok());
    assert(gateway.inFlightCount() == 2);

    gateway.cancelAll();
    assert(gateway.inFlightCount() == 0);
    assert(transport.abortCount() == 2);
    assert(transport.pendingCount() == 0);
    assert(!transport.reply(200, QByteArray("[]")));
    assert(calls == 0);

    // Nothing in flight is fine.
    gateway.cancelAll();
    assert(transport.abortCount() == 2);
}

} // namespace

int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);
    TestUnauthenticatedCallNeverReachesTransport();
    TestTierCeilingIsEnforcedLocally();
    TestBearerHeaderOnlyOnAuthenticatedCalls();
    TestCompletionRunsHandlerOnce();
    TestCancelAllAbortsEverything();
    std::cout << "mdi_unit_request_gateway: pass\n";
    return 0;
}
