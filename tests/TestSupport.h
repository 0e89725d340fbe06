// tests/TestSupport.h
//
// Shared fixtures for the core tests: a scripted HttpTransport, an
// in-memory SettingsStore, a movable clock and a JWT builder.

#pragma once

#include "core/AppConfig.h"
#include "core/HttpTransport.h"
#include "core/SettingsStore.h"
#include "core/Types.h"

#include <QCoreApplication>
#include <QElapsedTimer>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMap>
#include <QUrlQuery>

#include <deque>
#include <memory>
#include <vector>

namespace mdi_test {

// ---------------------------------------------------------------------------
// FakeTransport
// ---------------------------------------------------------------------------

/// Records every request and holds the completion handlers until the test
/// replies.  Replies are delivered from test code, never from inside send().
class FakeTransport final : public mdi::HttpTransport {
public:
    struct Pending {
        mdi::HttpRequest      request;
        mdi::HttpHandler      handler;
        std::shared_ptr<bool> aborted;
    };

    std::unique_ptr<mdi::HttpCall> send(const mdi::HttpRequest& request, mdi::HttpHandler onFinished) override
    {
        auto aborted = std::make_shared<bool>(false);
        m_sent.push_back(request);
        m_pending.push_back(Pending{ request, std::move(onFinished), aborted });
        return std::make_unique<Call>(aborted, m_abortCount);
    }

    [[nodiscard]] int sentCount() const { return static_cast<int>(m_sent.size()); }
    [[nodiscard]] int abortCount() const { return *m_abortCount; }

    [[nodiscard]] int pendingCount()
    {
        dropAborted();
        return static_cast<int>(m_pending.size());
    }

    [[nodiscard]] const mdi::HttpRequest& request(int index) const { return m_sent.at(index); }
    [[nodiscard]] const mdi::HttpRequest& lastRequest() const { return m_sent.back(); }

    /// Completes the oldest live call.  Returns false when none is pending.
    bool reply(int status, const QByteArray& body)
    {
        mdi::HttpResponse response;
        response.status = status;
        response.body   = body;
        return deliver(response);
    }

    bool replyJson(int status, const QJsonObject& object)
    {
        return reply(status, QJsonDocument(object).toJson(QJsonDocument::Compact));
    }

    bool failTransport(const QString& errorString)
    {
        mdi::HttpResponse response;
        response.transportFailed = true;
        response.errorString     = errorString;
        return deliver(response);
    }

private:
    class Call final : public mdi::HttpCall {
    public:
        Call(std::shared_ptr<bool> aborted, std::shared_ptr<int> counter)
            : m_aborted(std::move(aborted)), m_counter(std::move(counter)) {}

        void abort() override
        {
            if (!*m_aborted) {
                *m_aborted = true;
                ++*m_counter;
            }
        }

    private:
        std::shared_ptr<bool> m_aborted;
        std::shared_ptr<int>  m_counter;
    };

    void dropAborted()
    {
        for (auto it = m_pending.begin(); it != m_pending.end();) {
            it = *it->aborted ? m_pending.erase(it) : it + 1;
        }
    }

    bool deliver(const mdi::HttpResponse& response)
    {
        dropAborted();
        if (m_pending.empty()) {
            return false;
        }
        Pending call = std::move(m_pending.front());
        m_pending.pop_front();
        if (call.handler) {
            call.handler(response);
        }
        return true;
    }

    std::vector<mdi::HttpRequest> m_sent;
    std::deque<Pending>           m_pending;
    std::shared_ptr<int>          m_abortCount = std::make_shared<int>(0);
};

// ---------------------------------------------------------------------------
// MemorySettingsStore
// ---------------------------------------------------------------------------

class MemorySettingsStore final : public mdi::SettingsStore {
public:
    [[nodiscard]] QString get(const QString& key) const override { return m_values.value(key); }
    [[nodiscard]] bool    contains(const QString& key) const override { return m_values.contains(key); }
    void set(const QString& key, const QString& value) override { m_values.insert(key, value); }
    void remove(const QString& key) override { m_values.remove(key); }

    [[nodiscard]] int size() const { return m_values.size(); }
    [[nodiscard]] QStringList keys() const { return m_values.keys(); }

private:
    QMap<QString, QString> m_values;
};

// ---------------------------------------------------------------------------
// Clock
// ---------------------------------------------------------------------------

/// Manually advanced clock.  Copies of clock() observe later advances.
class ManualClock {
public:
    explicit ManualClock(qint64 start = 1700000000) : m_now(std::make_shared<qint64>(start)) {}

    [[nodiscard]] qint64 now() const { return *m_now; }
    void advance(qint64 seconds) { *m_now += seconds; }

    [[nodiscard]] mdi::Clock clock() const
    {
        auto now = m_now;
        return [now]() { return *now; };
    }

private:
    std::shared_ptr<qint64> m_now;
};

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

/// Unsigned JWT with the given claims.  `exp <= 0` omits the claim and an
/// empty role omits the role claim.
inline QString makeToken(qint64 exp, const QString& role, const QString& email = QStringLiteral("geo@example.com"))
{
    QJsonObject payload;
    if (exp > 0) {
        payload.insert(QStringLiteral("exp"), static_cast<double>(exp));
    }
    if (!role.isEmpty()) {
        payload.insert(QStringLiteral("role"), role);
    }
    payload.insert(QStringLiteral("email"), email);

    const auto encode = [](const QJsonObject& obj) {
        return QString::fromLatin1(QJsonDocument(obj).toJson(QJsonDocument::Compact).toBase64(
            QByteArray::Base64UrlEncoding | QByteArray::OmitTrailingEquals));
    };
    QJsonObject header;
    header.insert(QStringLiteral("alg"), QStringLiteral("none"));
    header.insert(QStringLiteral("typ"), QStringLiteral("JWT"));
    return encode(header) + QLatin1Char('.') + encode(payload) + QStringLiteral(".sig");
}

/// Config with an API key so login/refresh pass validation.
inline mdi::AppConfig testConfig()
{
    mdi::AppConfig config;
    config.apiKey     = QStringLiteral("test-key");
    config.baseApiUrl = QStringLiteral("https://data.test");
    config.authUrl    = QStringLiteral("https://auth.test/signIn");
    config.tokenUrl   = QStringLiteral("https://auth.test/token");
    return config;
}

/// Login reply body carrying `token`.
inline QJsonObject loginReply(const QString& token, const QString& refresh = QStringLiteral("refresh-1"))
{
    QJsonObject obj;
    obj.insert(QStringLiteral("idToken"), token);
    obj.insert(QStringLiteral("refreshToken"), refresh);
    obj.insert(QStringLiteral("expiresIn"), QStringLiteral("3600"));
    return obj;
}

/// `{headers, records, total_count}` with `count` rows numbered from `first`.
inline QByteArray dataPage(int first, int count, qint64 total)
{
    QJsonArray headers{ QStringLiteral("hole_id"), QStringLiteral("latitude"), QStringLiteral("longitude") };
    QJsonArray rows;
    for (int i = 0; i < count; ++i) {
        const int n = first + i;
        rows.append(QJsonArray{ QStringLiteral("H%1").arg(n), -30.0 - n * 1e-6, 120.0 + n * 1e-6 });
    }
    QJsonObject obj;
    obj.insert(QStringLiteral("headers"), headers);
    obj.insert(QStringLiteral("records"), rows);
    obj.insert(QStringLiteral("total_count"), static_cast<double>(total));
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

inline mdi::RecordList makeRecords(int count)
{
    mdi::RecordList records;
    records.reserve(count);
    for (int i = 0; i < count; ++i) {
        mdi::Record r;
        r.append(QStringLiteral("hole_id"), QStringLiteral("H%1").arg(i));
        r.append(QStringLiteral("latitude"), -31.5);
        r.append(QStringLiteral("longitude"), 121.25);
        records.append(r);
    }
    return records;
}

inline QString queryValue(const mdi::HttpRequest& request, const QString& key)
{
    return QUrlQuery(request.url).queryItemValue(key, QUrl::FullyDecoded);
}

/// Runs the event loop until `done()` holds or `timeoutMs` passes.
template <typename Pred>
bool pumpUntil(Pred done, int timeoutMs = 5000)
{
    QElapsedTimer timer;
    timer.start();
    while (!done()) {
        if (timer.elapsed() > timeoutMs) {
            return false;
        }
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
    }
    return true;
}

} // namespace mdi_test
