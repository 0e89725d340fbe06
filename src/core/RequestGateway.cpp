// src/core/RequestGateway.cpp

#include "RequestGateway.h"

#include "util/Log.h"

namespace mdi {

namespace {

const char* kindName(RequestKind kind)
{
    switch (kind) {
    case RequestKind::Auth:      return "auth";
    case RequestKind::FetchPage: return "fetch-page";
    case RequestKind::Other:     return "other";
    }
    return "other";
}

} // anonymous namespace

RequestGateway::RequestGateway(HttpTransport& transport,
                               const TokenStore& tokens,
                               const AppConfig& config,
                               Clock clock,
                               QObject* parent)
    : QObject(parent)
    , m_transport(transport)
    , m_tokens(tokens)
    , m_config(config)
    , m_clock(std::move(clock))
{
}

RequestGateway::~RequestGateway()
{
    cancelAll();
}

// ===========================================================================
// Tier checks
// ===========================================================================

qint64 RequestGateway::tierCeiling(Role role) const noexcept
{
    switch (role) {
    case Role::Premium:
    case Role::Admin:
        return m_config.hardApiCeiling;
    case Role::FreeTrial:
    case Role::Unset:
        break;
    }
    return m_config.freeTrialCeiling;
}

std::optional<TierLimitExceeded> RequestGateway::checkTierLimit(qint64 requested) const
{
    const qint64 allowed = tierCeiling(m_tokens.session().role);
    if (requested > allowed) {
        return TierLimitExceeded{ requested, allowed };
    }
    return std::nullopt;
}

// ===========================================================================
// Dispatch
// ===========================================================================

DispatchResult RequestGateway::dispatch(const ApiRequest& request, bool requiresAuth, HttpHandler onFinished)
{
    DispatchResult result;

    HttpRequest http = request.http;
    if (requiresAuth) {
        if (!m_tokens.isValidAt(m_clock())) {
            qCInfo(lcGateway) << "Rejected" << kindName(request.kind) << "request: not authenticated";
            result.error = DispatchError::Unauthenticated;
            return result;
        }
        http.headers.append({ QByteArrayLiteral("Authorization"),
                              QByteArrayLiteral("Bearer ") + m_tokens.session().accessToken.toUtf8() });
    }

    if (request.requestedCount > 0) {
        if (const auto limit = checkTierLimit(request.requestedCount)) {
            qCInfo(lcGateway) << "Rejected request for" << limit->requested
                              << "records; tier allows" << limit->allowed;
            result.error     = DispatchError::TierLimitExceeded;
            result.tierLimit = *limit;
            return result;
        }
    }

    const RequestId id = m_nextId++;
    auto handler = std::make_shared<HttpHandler>(std::move(onFinished));
    std::unique_ptr<HttpCall> call = m_transport.send(http, [this, id, handler](const HttpResponse& response) {
        complete(id, *handler, response);
    });

    m_inFlight.emplace(id, InFlightRequest{ id, std::move(call), request.kind });
    qCDebug(lcGateway) << "Dispatched" << kindName(request.kind) << "request" << id;
    emit inFlightCountChanged(inFlightCount());

    result.id = id;
    return result;
}

void RequestGateway::complete(RequestId id, const HttpHandler& handler, const HttpResponse& response)
{
    auto it = m_inFlight.find(id);
    if (it == m_inFlight.end()) {
        // Cancelled while the reply was already queued.
        return;
    }
    // Keep the call object alive until the handler has returned.
    std::unique_ptr<HttpCall> call = std::move(it->second.cancelToken);
    m_inFlight.erase(it);
    emit inFlightCountChanged(inFlightCount());

    if (handler) {
        handler(response);
    }
}

// ===========================================================================
// Cancellation
// ===========================================================================

bool RequestGateway::cancel(RequestId id)
{
    auto it = m_inFlight.find(id);
    if (it == m_inFlight.end()) {
        return false;
    }
    std::unique_ptr<HttpCall> call = std::move(it->second.cancelToken);
    m_inFlight.erase(it);
    if (call) {
        call->abort();
    }
    qCDebug(lcGateway) << "Cancelled request" << id;
    emit inFlightCountChanged(inFlightCount());
    return true;
}

void RequestGateway::cancelAll()
{
    if (m_inFlight.empty()) {
        return;
    }
    std::map<RequestId, InFlightRequest> pending;
    pending.swap(m_inFlight);
    for (auto& entry : pending) {
        if (entry.second.cancelToken) {
            entry.second.cancelToken->abort();
        }
    }
    qCInfo(lcGateway) << "Cancelled" << pending.size() << "in-flight request(s)";
    emit inFlightCountChanged(0);
}

} // namespace mdi
