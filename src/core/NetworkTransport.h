// src/core/NetworkTransport.h
//
// HttpTransport over QNetworkAccessManager.  Replies are delivered on the
// owning thread's event loop; abort() maps to QNetworkReply::abort().

#pragma once

#include "HttpTransport.h"

#include <QObject>

class QNetworkAccessManager;

namespace mdi {

class NetworkTransport : public QObject, public HttpTransport {
    Q_OBJECT

public:
    explicit NetworkTransport(int defaultTimeoutMs = 120000, QObject* parent = nullptr);
    ~NetworkTransport() override;

    NetworkTransport(const NetworkTransport&)            = delete;
    NetworkTransport& operator=(const NetworkTransport&) = delete;

    std::unique_ptr<HttpCall> send(const HttpRequest& request, HttpHandler onFinished) override;

private:
    QNetworkAccessManager* m_manager = nullptr;
    int                    m_defaultTimeoutMs;
};

} // namespace mdi
