// src/core/LookupService.h
//
// LookupService – filter vocabularies for the data tabs: company name
// search and the list of hole types.  Both calls are authenticated and go
// through the RequestGateway.

#pragma once

#include "AppConfig.h"
#include "HttpTransport.h"
#include "RequestGateway.h"

#include <QObject>
#include <QStringList>

namespace mdi {

class LookupService : public QObject {
    Q_OBJECT

public:
    static constexpr int kMinCompanyQueryLength = 3;

    LookupService(RequestGateway& gateway, const AppConfig& config, QObject* parent = nullptr);
    ~LookupService() override;

    /// Results arrive via companiesFound.  Queries shorter than
    /// kMinCompanyQueryLength answer immediately with an empty list.  A new
    /// search supersedes one still in flight.
    void searchCompanies(const QString& query);

    /// Results arrive via holeTypesReady; on any failure the built-in list is
    /// reported instead.
    void fetchHoleTypes();

    [[nodiscard]] static QStringList defaultHoleTypes();

    /// Bare list or `{companies: [...]}`; entries are strings or `{name}`.
    [[nodiscard]] static QStringList parseCompanyNames(const QByteArray& body);

    /// Bare list or `{hole_types|data: [...]}` of strings.  Empty on failure.
    [[nodiscard]] static QStringList parseHoleTypes(const QByteArray& body);

signals:
    void companiesFound(const QString& query, const QStringList& names);
    void holeTypesReady(const QStringList& holeTypes, bool fromServer);
    void loginRequired();
    /// The server answered 401/403 to a token that still looked valid.
    void sessionRejected();

private:
    RequestGateway&  m_gateway;
    const AppConfig& m_config;
    RequestId        m_searchRequest   = 0;
    RequestId        m_holeTypeRequest = 0;
};

} // namespace mdi
