// src/core/FetchOrchestrator.cpp

#include "FetchOrchestrator.h"

#include "util/JsonReply.h"
#include "util/Log.h"

#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>

#include <algorithm>
#include <utility>

namespace mdi {

namespace {

QVariant toVariant(const QJsonValue& v)
{
    if (v.isNull() || v.isUndefined()) {
        return QVariant();
    }
    return v.toVariant();
}

QJsonValue firstPresent(const QJsonObject& obj, const char* key, const char* alias)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    return v.isUndefined() ? obj.value(QLatin1String(alias)) : v;
}

QString filterValueString(const QVariant& value)
{
    switch (value.typeId()) {
    case QMetaType::Bool:
        return value.toBool() ? QStringLiteral("true") : QStringLiteral("false");
    case QMetaType::QStringList:
        return value.toStringList().join(QLatin1Char(','));
    case QMetaType::QVariantList: {
        QStringList parts;
        for (const QVariant& v : value.toList()) {
            const QString s = v.toString().trimmed();
            if (!s.isEmpty()) {
                parts.append(s);
            }
        }
        return parts.join(QLatin1Char(','));
    }
    default:
        return value.toString().trimmed();
    }
}

} // anonymous namespace

// ===========================================================================
// Wire helpers
// ===========================================================================

QUrlQuery filterQuery(const FilterParams& filters)
{
    QUrlQuery query;
    for (auto it = filters.cbegin(); it != filters.cend(); ++it) {
        if (it.key() == QLatin1String("limit") || it.key() == QLatin1String("skip")) {
            continue;
        }
        if (!it.value().isValid() || it.value().isNull()) {
            continue;
        }
        const QString value = filterValueString(it.value());
        if (!value.isEmpty()) {
            query.addQueryItem(it.key(), value);
        }
    }
    return query;
}

bool parseDataPage(const QByteArray& body, DataPage& page, QString* error)
{
    QJsonDocument doc;
    if (!parseJsonBody(body, doc, error)) {
        return false;
    }

    QJsonArray rows;
    page = DataPage{};

    if (doc.isArray()) {
        rows = doc.array();
    } else if (doc.isObject()) {
        const QJsonObject obj = doc.object();

        const QJsonValue rowsValue = firstPresent(obj, "records", "data");
        if (!rowsValue.isArray()) {
            if (error) *error = QStringLiteral("response has no record list");
            return false;
        }
        rows = rowsValue.toArray();

        for (const QJsonValue& h : firstPresent(obj, "headers", "columns").toArray()) {
            page.headers.append(h.toString());
        }

        const QJsonValue total = firstPresent(obj, "total_count", "totalCount");
        if (total.isDouble()) {
            page.serverTotal = static_cast<qint64>(total.toDouble());
        } else if (total.isString()) {
            bool ok = false;
            const qint64 n = total.toString().toLongLong(&ok);
            if (ok) {
                page.serverTotal = n;
            }
        }
    } else {
        if (error) *error = QStringLiteral("unexpected response shape");
        return false;
    }

    page.records.reserve(rows.size());
    for (const QJsonValue& row : rows) {
        Record record;
        if (row.isArray()) {
            if (page.headers.isEmpty()) {
                if (error) *error = QStringLiteral("row values without column headers");
                return false;
            }
            const QJsonArray values = row.toArray();
            for (int i = 0; i < page.headers.size(); ++i) {
                record.append(page.headers.at(i), i < values.size() ? toVariant(values.at(i)) : QVariant());
            }
        } else if (row.isObject()) {
            const QJsonObject obj = row.toObject();
            if (page.headers.isEmpty()) {
                page.headers = obj.keys();
            }
            for (const QString& h : std::as_const(page.headers)) {
                record.append(h, toVariant(obj.value(h)));
            }
        } else {
            if (error) *error = QStringLiteral("unexpected row type");
            return false;
        }
        page.records.append(std::move(record));
    }
    return true;
}

// ===========================================================================
// Construction
// ===========================================================================

FetchOrchestrator::FetchOrchestrator(RequestGateway& gateway,
                                     SessionController& session,
                                     DatasetStore& datasets,
                                     const AppConfig& config,
                                     Clock clock,
                                     QObject* parent)
    : QObject(parent)
    , m_gateway(gateway)
    , m_session(session)
    , m_datasets(datasets)
    , m_config(config)
    , m_clock(std::move(clock))
{
    qRegisterMetaType<mdi::DatasetKind>();
    qRegisterMetaType<mdi::FetchError>();
    qRegisterMetaType<mdi::FetchDetails>();

    // Logout aborts our page request through the gateway; the handler never
    // runs, so drop the job here.
    connect(&m_session, &SessionController::logoutCompleted, this, &FetchOrchestrator::abandon);
}

FetchOrchestrator::~FetchOrchestrator()
{
    if (m_job && m_job->request != 0) {
        m_gateway.cancel(m_job->request);
    }
}

std::optional<DatasetKind> FetchOrchestrator::activeKind() const
{
    if (!m_job) {
        return std::nullopt;
    }
    return m_job->kind;
}

// ===========================================================================
// Operations
// ===========================================================================

void FetchOrchestrator::fetchDataset(DatasetKind kind, const FilterParams& filters, qint64 requestedCount)
{
    if (m_job) {
        qCInfo(lcFetch) << "New fetch requested; cancelling" << datasetKindName(m_job->kind);
        cancel();
    }

    if (m_session.validateAndLogoutIfExpired()) {
        FetchError error;
        error.code = FetchErrorCode::Unauthenticated;
        emit fetchFailed(kind, error);
        return;
    }

    Job job;
    job.kind      = kind;
    job.filters   = filters;
    job.requested = requestedCount;
    job.target    = requestedCount > 0 ? requestedCount : m_gateway.tierCeiling(m_session.role());
    job.elapsed.start();
    m_job = std::move(job);

    qCInfo(lcFetch) << "Fetching" << datasetKindName(kind) << "target" << m_job->target;
    emit fetchStarted(kind, m_job->target);
    requestNextPage();
}

void FetchOrchestrator::cancel()
{
    if (!m_job) {
        return;
    }
    const DatasetKind kind = m_job->kind;
    if (m_job->request != 0) {
        m_gateway.cancel(m_job->request);
    }
    qCInfo(lcFetch) << "Cancelled" << datasetKindName(kind) << "fetch after"
                    << m_job->records.size() << "records";
    m_job.reset();
    emit fetchCancelled(kind);
}

void FetchOrchestrator::abandon()
{
    if (!m_job) {
        return;
    }
    const DatasetKind kind = m_job->kind;
    qCInfo(lcFetch) << "Session ended during" << datasetKindName(kind) << "fetch";
    m_job.reset();
    emit fetchCancelled(kind);
}

// ===========================================================================
// Paging
// ===========================================================================

void FetchOrchestrator::requestNextPage()
{
    Job& job = *m_job;
    const qint64 skip  = job.records.size();
    const qint64 limit = std::min<qint64>(m_config.pageSize, job.target - skip);

    QUrl url = m_config.endpointUrl(QLatin1String(job.kind == DatasetKind::Holes ? endpoints::kHolesData
                                                                                   : endpoints::kAssaysData));
    QUrlQuery query = filterQuery(job.filters);
    query.addQueryItem(QStringLiteral("limit"), QString::number(limit));
    query.addQueryItem(QStringLiteral("skip"), QString::number(skip));
    url.setQuery(query);

    ApiRequest request;
    request.kind           = RequestKind::FetchPage;
    request.requestedCount = job.target;
    request.http.method    = HttpMethod::Get;
    request.http.url       = url;
    request.http.timeoutMs = m_config.requestTimeoutMs;

    qCDebug(lcFetch) << "Page" << job.pages + 1 << "skip" << skip << "limit" << limit;
    const DispatchResult dispatched = m_gateway.dispatch(request, /*requiresAuth=*/true,
        [this](const HttpResponse& response) {
            handlePage(response);
        });

    if (!dispatched.ok()) {
        FetchError error;
        if (dispatched.error == DispatchError::TierLimitExceeded) {
            error.code      = FetchErrorCode::TierLimitExceeded;
            error.tierLimit = dispatched.tierLimit;
        } else {
            error.code = FetchErrorCode::Unauthenticated;
        }
        fail(error);
        return;
    }
    job.request = dispatched.id;
}

void FetchOrchestrator::handlePage(const HttpResponse& response)
{
    if (!m_job) {
        return;
    }
    Job& job = *m_job;
    job.request = 0;

    FetchError error;
    if (response.transportFailed || response.status == 0) {
        error.code    = FetchErrorCode::NetworkFailure;
        error.message = response.errorString;
        fail(error);
        return;
    }
    if (response.status == 401 || response.status == 403) {
        error.code       = FetchErrorCode::Unauthenticated;
        error.httpStatus = response.status;
        fail(error);
        return;
    }
    if (response.status >= 400) {
        error.code       = FetchErrorCode::ServerError;
        error.httpStatus = response.status;
        error.message    = errorMessageFromBody(response.body);
        fail(error);
        return;
    }

    DataPage page;
    QString  parseError;
    if (!parseDataPage(response.body, page, &parseError)) {
        error.code    = FetchErrorCode::MalformedResponse;
        error.message = parseError;
        fail(error);
        return;
    }

    const qint64 limit = std::min<qint64>(m_config.pageSize, job.target - job.records.size());
    const qint64 received = page.records.size();

    ++job.pages;
    if (job.headers.isEmpty()) {
        job.headers = page.headers;
    }
    if (page.serverTotal >= 0) {
        job.serverTotal = page.serverTotal;
    }
    const qint64 room = job.target - job.records.size();
    if (received > room) {
        page.records.resize(static_cast<int>(room));
    }
    job.records.append(page.records);

    const qint64 fetched = job.records.size();
    emit fetchProgress(job.kind, fetched, progressTotal());

    const bool satisfied    = fetched >= job.target;
    const bool shortPage    = received < limit;
    const bool totalReached = job.serverTotal >= 0 && fetched >= job.serverTotal;
    if (satisfied || shortPage || totalReached) {
        commit();
        return;
    }
    requestNextPage();
}

qint64 FetchOrchestrator::progressTotal() const
{
    if (m_job->serverTotal >= 0) {
        return std::min(m_job->target, m_job->serverTotal);
    }
    return m_job->target;
}

// ===========================================================================
// Completion
// ===========================================================================

void FetchOrchestrator::commit()
{
    Job job = std::move(*m_job);
    m_job.reset();

    FetchDetails details;
    details.requestedCount = job.requested;
    details.fetchedCount   = job.records.size();
    details.serverTotal    = std::max<qint64>(job.serverTotal, 0);
    details.pageCount      = job.pages;
    details.elapsedSeconds = job.elapsed.elapsed() / 1000.0;
    details.fetchedAt      = m_clock();

    DatasetMeta meta;
    meta.serverTotal  = details.serverTotal;
    meta.filterParams = job.filters;
    meta.fetchDetails = details;

    qCInfo(lcFetch) << "Fetched" << details.fetchedCount << datasetKindName(job.kind) << "records in"
                    << details.pageCount << "page(s)";
    m_datasets.replace(job.kind, std::move(job.records), std::move(job.headers), meta);
    emit fetchFinished(job.kind, details);
}

void FetchOrchestrator::fail(FetchError error)
{
    const DatasetKind kind = m_job->kind;
    m_job.reset();

    qCWarning(lcFetch) << datasetKindName(kind) << "fetch failed:" << describe(error);

    // Report the failure before tearing the session down so listeners see
    // the fetch settled ahead of any sessionExpired.
    emit fetchFailed(kind, error);

    if (error.code == FetchErrorCode::Unauthenticated) {
        // Locally expired tokens take the expiry path; a token the server
        // refused while it still looked valid is invalidated.
        if (!m_session.validateAndLogoutIfExpired()) {
            m_session.invalidateSession();
        }
    }
}

} // namespace mdi
