// src/core/NetworkTransport.cpp

#include "NetworkTransport.h"

#include "util/Log.h"

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPointer>

namespace mdi {

namespace {

// ---------------------------------------------------------------------------
// NetworkCall – cancel token wrapping one QNetworkReply.
// ---------------------------------------------------------------------------
class NetworkCall final : public HttpCall {
public:
    NetworkCall(QNetworkReply* reply, QMetaObject::Connection finished)
        : m_reply(reply), m_finished(std::move(finished))
    {
    }

    void abort() override
    {
        // abort() emits finished() synchronously; drop our handler first so
        // an aborted call never reports back.
        QObject::disconnect(m_finished);
        if (m_reply) {
            m_reply->abort();
            m_reply->deleteLater();
            m_reply = nullptr;
        }
    }

private:
    QPointer<QNetworkReply>  m_reply;
    QMetaObject::Connection  m_finished;
};

HttpResponse toResponse(QNetworkReply* reply)
{
    HttpResponse out;
    const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    out.status = status.isValid() ? status.toInt() : 0;
    out.body   = reply->readAll();
    if (reply->error() != QNetworkReply::NoError) {
        out.errorString = reply->errorString();
        out.transportFailed = (out.status == 0);
    }
    return out;
}

} // anonymous namespace

NetworkTransport::NetworkTransport(int defaultTimeoutMs, QObject* parent)
    : QObject(parent)
    , m_manager(new QNetworkAccessManager(this))
    , m_defaultTimeoutMs(defaultTimeoutMs)
{
}

NetworkTransport::~NetworkTransport() = default;

std::unique_ptr<HttpCall> NetworkTransport::send(const HttpRequest& request, HttpHandler onFinished)
{
    QNetworkRequest req(request.url);
    for (const auto& h : request.headers) {
        req.setRawHeader(h.first, h.second);
    }
    req.setTransferTimeout(request.timeoutMs > 0 ? request.timeoutMs : m_defaultTimeoutMs);

    QNetworkReply* reply = nullptr;
    if (request.method == HttpMethod::Post) {
        req.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
        reply = m_manager->post(req, request.body);
    } else {
        reply = m_manager->get(req);
    }

    qCDebug(lcGateway) << (request.method == HttpMethod::Post ? "POST" : "GET")
                       << request.url.toString(QUrl::RemoveQuery);

    auto connection = connect(reply, &QNetworkReply::finished, this,
        [reply, handler = std::move(onFinished)]() {
            const HttpResponse response = toResponse(reply);
            reply->deleteLater();
            if (handler) {
                handler(response);
            }
        });

    return std::make_unique<NetworkCall>(reply, connection);
}

} // namespace mdi
