// src/core/AppConfig.cpp

#include "AppConfig.h"

#include "util/Log.h"

#include <QUrlQuery>

namespace mdi {

namespace {

void overrideFromEnv(QString& target, const char* name)
{
    const QString value = qEnvironmentVariable(name).trimmed();
    if (!value.isEmpty()) {
        qCDebug(lcConfig) << "Using" << name << "from environment";
        target = value;
    }
}

QUrl withApiKey(const QString& url, const QString& apiKey)
{
    QUrl out(url);
    QUrlQuery query(out);
    query.addQueryItem(QStringLiteral("key"), apiKey);
    out.setQuery(query);
    return out;
}

} // anonymous namespace

AppConfig AppConfig::fromEnvironment()
{
    AppConfig cfg;
    overrideFromEnv(cfg.apiKey,     "NEEDLE_FIREBASE_API_KEY");
    overrideFromEnv(cfg.baseApiUrl, "NEEDLE_BASE_API_URL");
    overrideFromEnv(cfg.authUrl,    "NEEDLE_AUTH_URL");
    overrideFromEnv(cfg.tokenUrl,   "NEEDLE_TOKEN_URL");

    while (cfg.baseApiUrl.endsWith(QLatin1Char('/'))) {
        cfg.baseApiUrl.chop(1);
    }

    const QString problem = cfg.validate();
    if (!problem.isEmpty()) {
        qCWarning(lcConfig).noquote() << problem;
    }
    return cfg;
}

QString AppConfig::validate() const
{
    if (apiKey.isEmpty()) {
        return QStringLiteral("API key not configured. Set the NEEDLE_FIREBASE_API_KEY environment variable.");
    }
    if (!QUrl(baseApiUrl).isValid() || baseApiUrl.isEmpty()) {
        return QStringLiteral("Invalid data service URL: %1").arg(baseApiUrl);
    }
    if (pageSize <= 0 || importChunkSize <= 0 || displayCeiling < 0 || recordsPerTablePage <= 0) {
        return QStringLiteral("Invalid paging configuration.");
    }
    return QString();
}

QUrl AppConfig::signInUrl() const
{
    return withApiKey(authUrl, apiKey);
}

QUrl AppConfig::refreshUrl() const
{
    return withApiKey(tokenUrl, apiKey);
}

QUrl AppConfig::endpointUrl(const QString& endpoint) const
{
    return QUrl(baseApiUrl + QLatin1Char('/') + endpoint);
}

} // namespace mdi
