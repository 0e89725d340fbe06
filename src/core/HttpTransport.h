// src/core/HttpTransport.h
//
// Asynchronous HTTP transport seam.  RequestGateway talks to this
// interface only; the application plugs in NetworkTransport
// (QNetworkAccessManager) and the tests plug in a scripted fake.
//
// Contract
// --------
// * send() never blocks and never invokes the completion handler
//   synchronously.
// * The handler runs on the thread that owns the transport, exactly once,
//   unless the call was aborted first; after abort() it never runs.
// * The returned HttpCall is the cancel token for that call.

#pragma once

#include <QByteArray>
#include <QList>
#include <QPair>
#include <QString>
#include <QUrl>

#include <functional>
#include <memory>

namespace mdi {

enum class HttpMethod { Get, Post };

struct HttpRequest {
    HttpMethod method = HttpMethod::Get;
    QUrl       url;
    QByteArray body;                                ///< JSON body for Post.
    QList<QPair<QByteArray, QByteArray>> headers;
    int        timeoutMs = 0;                       ///< 0 = transport default.

    [[nodiscard]] QByteArray header(const QByteArray& name) const
    {
        for (const auto& h : headers) {
            if (h.first.compare(name, Qt::CaseInsensitive) == 0) {
                return h.second;
            }
        }
        return {};
    }
};

struct HttpResponse {
    /// True when the request never produced an HTTP status (DNS, refused,
    /// TLS, timeout...).
    bool       transportFailed = false;
    int        status = 0;
    QByteArray body;
    QString    errorString;
};

using HttpHandler = std::function<void(const HttpResponse&)>;

class HttpCall {
public:
    virtual ~HttpCall() = default;
    virtual void abort() = 0;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual std::unique_ptr<HttpCall> send(const HttpRequest& request, HttpHandler onFinished) = 0;
};

} // namespace mdi
