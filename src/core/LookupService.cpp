// src/core/LookupService.cpp

#include "LookupService.h"

#include "util/JsonReply.h"
#include "util/Log.h"

#include <QJsonArray>
#include <QJsonObject>
#include <QUrlQuery>

#include <initializer_list>

namespace mdi {

namespace {

QJsonArray listFrom(const QJsonDocument& doc, std::initializer_list<const char*> keys)
{
    if (doc.isArray()) {
        return doc.array();
    }
    const QJsonObject obj = doc.object();
    for (const char* key : keys) {
        const QJsonValue v = obj.value(QLatin1String(key));
        if (v.isArray()) {
            return v.toArray();
        }
    }
    return QJsonArray();
}

bool succeeded(const HttpResponse& response)
{
    return !response.transportFailed && response.status >= 200 && response.status < 300;
}

bool rejectedSession(const HttpResponse& response)
{
    return !response.transportFailed && (response.status == 401 || response.status == 403);
}

} // anonymous namespace

LookupService::LookupService(RequestGateway& gateway, const AppConfig& config, QObject* parent)
    : QObject(parent)
    , m_gateway(gateway)
    , m_config(config)
{
}

LookupService::~LookupService()
{
    if (m_searchRequest != 0) {
        m_gateway.cancel(m_searchRequest);
    }
    if (m_holeTypeRequest != 0) {
        m_gateway.cancel(m_holeTypeRequest);
    }
}

QStringList LookupService::defaultHoleTypes()
{
    return { QStringLiteral("RAB"), QStringLiteral("DIAMOND"), QStringLiteral("AC"), QStringLiteral("RC") };
}

// ===========================================================================
// Parsing
// ===========================================================================

QStringList LookupService::parseCompanyNames(const QByteArray& body)
{
    QJsonDocument doc;
    QString       error;
    if (!parseJsonBody(body, doc, &error)) {
        qCWarning(lcLookup) << "Bad company search response:" << error;
        return {};
    }

    QStringList names;
    for (const QJsonValue& v : listFrom(doc, { "companies" })) {
        const QString name = v.isObject() ? v.toObject().value(QLatin1String("name")).toString()
                                          : v.toVariant().toString();
        if (!name.trimmed().isEmpty()) {
            names.append(name);
        }
    }
    return names;
}

QStringList LookupService::parseHoleTypes(const QByteArray& body)
{
    QJsonDocument doc;
    if (!parseJsonBody(body, doc)) {
        return {};
    }
    QStringList types;
    for (const QJsonValue& v : listFrom(doc, { "hole_types", "data" })) {
        const QString t = v.toString().trimmed();
        if (!t.isEmpty()) {
            types.append(t);
        }
    }
    return types;
}

// ===========================================================================
// Requests
// ===========================================================================

void LookupService::searchCompanies(const QString& query)
{
    if (m_searchRequest != 0) {
        m_gateway.cancel(m_searchRequest);
        m_searchRequest = 0;
    }

    const QString trimmed = query.trimmed();
    if (trimmed.size() < kMinCompanyQueryLength) {
        emit companiesFound(query, {});
        return;
    }

    QUrl url = m_config.endpointUrl(QLatin1String(endpoints::kCompaniesSearch));
    QUrlQuery q;
    q.addQueryItem(QStringLiteral("company_name"), trimmed);
    url.setQuery(q);

    ApiRequest request;
    request.http.url       = url;
    request.http.timeoutMs = m_config.requestTimeoutMs;

    const DispatchResult dispatched = m_gateway.dispatch(request, /*requiresAuth=*/true,
        [this, query](const HttpResponse& response) {
            m_searchRequest = 0;
            if (rejectedSession(response)) {
                qCInfo(lcLookup) << "Company search rejected, status" << response.status;
                emit companiesFound(query, {});
                emit sessionRejected();
                return;
            }
            if (!succeeded(response)) {
                qCWarning(lcLookup) << "Company search failed, status" << response.status << response.errorString;
                emit companiesFound(query, {});
                return;
            }
            emit companiesFound(query, parseCompanyNames(response.body));
        });

    if (dispatched.error == DispatchError::Unauthenticated) {
        emit loginRequired();
        return;
    }
    m_searchRequest = dispatched.id;
}

void LookupService::fetchHoleTypes()
{
    if (m_holeTypeRequest != 0 && m_gateway.isInFlight(m_holeTypeRequest)) {
        return;
    }

    ApiRequest request;
    request.http.url       = m_config.endpointUrl(QLatin1String(endpoints::kHoleTypes));
    request.http.timeoutMs = m_config.requestTimeoutMs;

    const DispatchResult dispatched = m_gateway.dispatch(request, /*requiresAuth=*/true,
        [this](const HttpResponse& response) {
            m_holeTypeRequest = 0;
            if (rejectedSession(response)) {
                qCInfo(lcLookup) << "Hole type request rejected, status" << response.status;
                emit holeTypesReady(defaultHoleTypes(), false);
                emit sessionRejected();
                return;
            }
            const QStringList types = succeeded(response) ? parseHoleTypes(response.body) : QStringList();
            if (types.isEmpty()) {
                qCInfo(lcLookup) << "Using built-in hole types";
                emit holeTypesReady(defaultHoleTypes(), false);
                return;
            }
            emit holeTypesReady(types, true);
        });

    if (!dispatched.ok()) {
        emit holeTypesReady(defaultHoleTypes(), false);
        return;
    }
    m_holeTypeRequest = dispatched.id;
}

} // namespace mdi
