// src/core/Types.h
//
// Qt-friendly domain data types shared by the session, gateway, fetch and
// import layers.  Everything here is a plain value type so it can travel
// through queued signal/slot connections and be stored in QVariant.
//
// Errors are modelled as small result holders (code + message + ok()) and
// are delivered through signals; nothing in the core throws across a
// component boundary.

#pragma once

#include <QMetaType>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <QVariantMap>
#include <QVector>

#include <cstdint>
#include <functional>

namespace mdi {

// ---------------------------------------------------------------------------
// Clock
// ---------------------------------------------------------------------------

/// Returns "now" in epoch seconds.  Injected so tests can move time.
using Clock = std::function<qint64()>;

/// Wall-clock implementation used by the application.
Clock systemClock();

// ---------------------------------------------------------------------------
// Roles / tiers
// ---------------------------------------------------------------------------

enum class Role : int32_t {
    Unset     = 0,
    FreeTrial = 1,
    Premium   = 2,
    Admin     = 3,
};

QString roleName(Role role);

// ---------------------------------------------------------------------------
// Dataset kinds
// ---------------------------------------------------------------------------

enum class DatasetKind : int32_t {
    Holes  = 0,
    Assays = 1,
};

constexpr DatasetKind kAllDatasetKinds[] = { DatasetKind::Holes, DatasetKind::Assays };

QString datasetKindName(DatasetKind kind);

// ---------------------------------------------------------------------------
// Session
// ---------------------------------------------------------------------------

struct Session {
    QString accessToken;        ///< Empty when unset.
    QString refreshToken;       ///< Empty when unset.
    qint64  expiresAt = 0;      ///< Epoch seconds; 0 means no valid session.
    Role    role      = Role::Unset;
    QString lastIdentity;       ///< Email, UI autofill only.

    [[nodiscard]] bool hasAccessToken() const noexcept { return !accessToken.isEmpty(); }

    bool operator==(const Session& other) const
    {
        return accessToken == other.accessToken
            && refreshToken == other.refreshToken
            && expiresAt == other.expiresAt
            && role == other.role
            && lastIdentity == other.lastIdentity;
    }
    bool operator!=(const Session& other) const { return !(*this == other); }
};

// ---------------------------------------------------------------------------
// Records
// ---------------------------------------------------------------------------

/// One named scalar.  A null QVariant represents a JSON null.
struct Field {
    QString  name;
    QVariant value;

    bool operator==(const Field& other) const
    {
        return name == other.name && value == other.value;
    }
};

/// A drill hole or assay sample.  The schema comes from the server response,
/// so a record is an ordered list of fields rather than a fixed struct.
class Record {
public:
    Record() = default;
    explicit Record(QVector<Field> fields) : m_fields(std::move(fields)) {}

    void append(const QString& name, const QVariant& value) { m_fields.append(Field{name, value}); }

    [[nodiscard]] bool     contains(const QString& name) const;
    [[nodiscard]] QVariant value(const QString& name) const;   ///< Invalid QVariant when absent.
    [[nodiscard]] int      size() const noexcept { return static_cast<int>(m_fields.size()); }
    [[nodiscard]] bool     isEmpty() const noexcept { return m_fields.isEmpty(); }

    [[nodiscard]] const QVector<Field>& fields() const noexcept { return m_fields; }

    bool operator==(const Record& other) const { return m_fields == other.m_fields; }
    bool operator!=(const Record& other) const { return !(*this == other); }

private:
    QVector<Field> m_fields;
};

using RecordList   = QVector<Record>;
using FilterParams = QVariantMap;

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

enum class AuthErrorCode : int32_t {
    None              = 0,
    InvalidCredential = 1,
    NetworkFailure    = 2,
    MalformedToken    = 3,
};

struct AuthError {
    AuthErrorCode code = AuthErrorCode::None;
    QString       message;

    [[nodiscard]] bool ok() const noexcept { return code == AuthErrorCode::None; }
};

struct TierLimitExceeded {
    qint64 requested = 0;
    qint64 allowed   = 0;
};

enum class FetchErrorCode : int32_t {
    None              = 0,
    NetworkFailure    = 1,
    ServerError       = 2,
    Unauthenticated   = 3,
    Cancelled         = 4,
    TierLimitExceeded = 5,
    MalformedResponse = 6,
};

struct FetchError {
    FetchErrorCode    code       = FetchErrorCode::None;
    int               httpStatus = 0;     ///< Set for ServerError.
    TierLimitExceeded tierLimit;          ///< Set for TierLimitExceeded.
    QString           message;

    [[nodiscard]] bool ok() const noexcept { return code == FetchErrorCode::None; }
};

QString describe(const FetchError& error);

// ---------------------------------------------------------------------------
// Fetch bookkeeping
// ---------------------------------------------------------------------------

/// Metadata kept for the "details" view of the last fetch.
struct FetchDetails {
    qint64  requestedCount = 0;
    qint64  fetchedCount   = 0;
    qint64  serverTotal    = 0;
    int     pageCount      = 0;
    double  elapsedSeconds = 0.0;
    qint64  fetchedAt      = 0;   ///< Epoch seconds.

    [[nodiscard]] bool isEmpty() const noexcept { return fetchedAt == 0; }

    bool operator==(const FetchDetails& other) const
    {
        return requestedCount == other.requestedCount
            && fetchedCount == other.fetchedCount
            && serverTotal == other.serverTotal
            && pageCount == other.pageCount
            && elapsedSeconds == other.elapsedSeconds
            && fetchedAt == other.fetchedAt;
    }
};

/// Table paging snapshot for one dataset.
struct PaginationInfo {
    int    currentPage    = 0;    ///< 1-based; 0 when there is no data.
    int    totalPages     = 0;
    int    recordsPerPage = 0;
    qint64 totalRecords   = 0;    ///< Full fetched set.
    int    displayCount   = 0;    ///< Size of the display prefix.
    int    showingRecords = 0;
    bool   hasData        = false;
};

} // namespace mdi

Q_DECLARE_METATYPE(mdi::Role)
Q_DECLARE_METATYPE(mdi::DatasetKind)
Q_DECLARE_METATYPE(mdi::Session)
Q_DECLARE_METATYPE(mdi::AuthError)
Q_DECLARE_METATYPE(mdi::FetchError)
Q_DECLARE_METATYPE(mdi::FetchDetails)
