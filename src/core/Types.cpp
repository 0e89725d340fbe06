// src/core/Types.cpp

#include "Types.h"

#include <QDateTime>

namespace mdi {

Clock systemClock()
{
    return []() { return QDateTime::currentSecsSinceEpoch(); };
}

QString roleName(Role role)
{
    switch (role) {
    case Role::FreeTrial: return QStringLiteral("Free Trial");
    case Role::Premium:   return QStringLiteral("Premium");
    case Role::Admin:     return QStringLiteral("Admin");
    case Role::Unset:     break;
    }
    return QString();
}

QString datasetKindName(DatasetKind kind)
{
    switch (kind) {
    case DatasetKind::Holes:  return QStringLiteral("Holes");
    case DatasetKind::Assays: return QStringLiteral("Assays");
    }
    return QString();
}

// ---------------------------------------------------------------------------
// Record
// ---------------------------------------------------------------------------

bool Record::contains(const QString& name) const
{
    for (const auto& f : m_fields) {
        if (f.name == name) {
            return true;
        }
    }
    return false;
}

QVariant Record::value(const QString& name) const
{
    for (const auto& f : m_fields) {
        if (f.name == name) {
            return f.value;
        }
    }
    return QVariant();
}

// ---------------------------------------------------------------------------
// FetchError
// ---------------------------------------------------------------------------

QString describe(const FetchError& error)
{
    switch (error.code) {
    case FetchErrorCode::None:
        return QString();
    case FetchErrorCode::NetworkFailure:
        return error.message.isEmpty()
            ? QStringLiteral("Network error occurred. Please check your connection and try again.")
            : QStringLiteral("Network error: %1").arg(error.message);
    case FetchErrorCode::ServerError:
        return QStringLiteral("API request failed (HTTP %1): %2")
            .arg(error.httpStatus)
            .arg(error.message.isEmpty() ? QStringLiteral("server error") : error.message);
    case FetchErrorCode::Unauthenticated:
        return QStringLiteral("Your session has expired. Please log in again.");
    case FetchErrorCode::Cancelled:
        return QStringLiteral("Fetch cancelled.");
    case FetchErrorCode::TierLimitExceeded:
        return QStringLiteral("Your plan allows up to %1 records per request; %2 were requested.")
            .arg(error.tierLimit.allowed)
            .arg(error.tierLimit.requested);
    case FetchErrorCode::MalformedResponse:
        return QStringLiteral("Invalid response from server: %1").arg(error.message);
    }
    return error.message;
}

} // namespace mdi
