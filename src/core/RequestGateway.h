// src/core/RequestGateway.h
//
// RequestGateway – the single exit point for network calls.
//
// * Attaches the bearer token to authenticated calls and refuses them up
//   front when the session is not valid.
// * Enforces the tier ceiling locally, before anything reaches the wire.
// * Owns the set of in-flight calls so logout / dialog close can abort all
//   of them at once.
//
// Only the gateway mutates the in-flight set.  It reads TokenStore but never
// writes it.

#pragma once

#include "AppConfig.h"
#include "HttpTransport.h"
#include "TokenStore.h"
#include "Types.h"

#include <QObject>

#include <map>
#include <memory>
#include <optional>

namespace mdi {

enum class RequestKind { Auth, FetchPage, Other };

using RequestId = quint64;

struct ApiRequest {
    HttpRequest http;
    RequestKind kind           = RequestKind::Other;
    qint64      requestedCount = 0;   ///< Records this call may return; 0 = not a data call.
};

enum class DispatchError { None, Unauthenticated, TierLimitExceeded };

struct DispatchResult {
    RequestId         id    = 0;
    DispatchError     error = DispatchError::None;
    TierLimitExceeded tierLimit;

    [[nodiscard]] bool ok() const noexcept { return error == DispatchError::None; }
};

class RequestGateway : public QObject {
    Q_OBJECT

public:
    RequestGateway(HttpTransport& transport,
                   const TokenStore& tokens,
                   const AppConfig& config,
                   Clock clock = systemClock(),
                   QObject* parent = nullptr);
    ~RequestGateway() override;

    RequestGateway(const RequestGateway&)            = delete;
    RequestGateway& operator=(const RequestGateway&) = delete;

    /// Issue `request`.  On success the call is registered and `onFinished`
    /// runs when it completes (never when it is cancelled).  On failure no
    /// network call was made and `onFinished` is dropped.
    DispatchResult dispatch(const ApiRequest& request, bool requiresAuth, HttpHandler onFinished);

    /// Record ceiling for `role`.
    [[nodiscard]] qint64 tierCeiling(Role role) const noexcept;

    /// Rejection details when `requested` exceeds the current session's ceiling.
    [[nodiscard]] std::optional<TierLimitExceeded> checkTierLimit(qint64 requested) const;

    /// Abort one call.  Returns false if it was not in flight.
    bool cancel(RequestId id);

    /// Abort every in-flight call.  Safe when none are registered.
    void cancelAll();

    [[nodiscard]] int  inFlightCount() const noexcept { return static_cast<int>(m_inFlight.size()); }
    [[nodiscard]] bool isInFlight(RequestId id) const { return m_inFlight.count(id) != 0; }

signals:
    void inFlightCountChanged(int count);

private:
    struct InFlightRequest {
        RequestId                 id = 0;
        std::unique_ptr<HttpCall> cancelToken;
        RequestKind               kind = RequestKind::Other;
    };

    void complete(RequestId id, const HttpHandler& handler, const HttpResponse& response);

    HttpTransport&    m_transport;
    const TokenStore& m_tokens;
    const AppConfig&  m_config;
    Clock             m_clock;

    std::map<RequestId, InFlightRequest> m_inFlight;
    RequestId                            m_nextId = 1;
};

} // namespace mdi
