// src/core/AppConfig.h
//
// Runtime configuration: endpoints read from the environment with built-in
// defaults, plus the paging / import tunables shared by the core.

#pragma once

#include <QString>
#include <QUrl>

namespace mdi {

struct AppConfig {
    // -----------------------------------------------------------------------
    // Endpoints
    // -----------------------------------------------------------------------
    QString apiKey;
    QString baseApiUrl = QStringLiteral("https://master.api.drh.needle-digital.com");
    QString authUrl    = QStringLiteral("https://identitytoolkit.googleapis.com/v1/accounts:signInWithPassword");
    QString tokenUrl   = QStringLiteral("https://securetoken.googleapis.com/v1/token");

    // -----------------------------------------------------------------------
    // Limits
    // -----------------------------------------------------------------------
    int    pageSize               = 50000;     ///< Records per data request.
    int    displayCeiling         = 1000;      ///< Records kept for the table.
    int    recordsPerTablePage    = 100;
    int    importChunkSize        = 10000;
    int    chunkedImportThreshold = 5000;
    int    refreshLeadSeconds     = 60;        ///< Refresh this long before expiry.
    int    requestTimeoutMs       = 120000;
    qint64 freeTrialCeiling       = 1000;
    qint64 hardApiCeiling         = 5000000;

    /// Reads NEEDLE_FIREBASE_API_KEY, NEEDLE_BASE_API_URL, NEEDLE_AUTH_URL and
    /// NEEDLE_TOKEN_URL; unset variables keep the defaults above.
    static AppConfig fromEnvironment();

    /// Empty when the configuration is usable, otherwise a user-facing reason.
    [[nodiscard]] QString validate() const;

    [[nodiscard]] QUrl signInUrl() const;
    [[nodiscard]] QUrl refreshUrl() const;
    [[nodiscard]] QUrl endpointUrl(const QString& endpoint) const;
};

// Data service endpoints, relative to baseApiUrl.
namespace endpoints {
inline constexpr const char* kHolesData       = "plugin/fetch_drill_holes";
inline constexpr const char* kAssaysData      = "plugin/fetch_assay_samples";
inline constexpr const char* kCompaniesSearch = "companies/search";
inline constexpr const char* kHoleTypes       = "plugin/fetch_hole_type";
} // namespace endpoints

} // namespace mdi
