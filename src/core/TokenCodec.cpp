// src/core/TokenCodec.cpp

#include "TokenCodec.h"

#include "util/Log.h"

#include <QByteArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

namespace mdi {

namespace {

bool fail(QString* error, const QString& message)
{
    if (error) {
        *error = message;
    }
    return false;
}

} // anonymous namespace

Role parseRoleClaim(const QString& value)
{
    const QString v = value.trimmed().toLower().remove(QLatin1Char('-')).remove(QLatin1Char('_'));
    if (v == QLatin1String("freetrial") || v == QLatin1String("trial") || v == QLatin1String("free")) {
        return Role::FreeTrial;
    }
    if (v == QLatin1String("premium")) {
        return Role::Premium;
    }
    if (v == QLatin1String("admin")) {
        return Role::Admin;
    }
    return Role::Unset;
}

bool decodeToken(const QString& token,
                 qint64 fallbackExpiresAt,
                 TokenClaims& claims,
                 QString* error)
{
    const QStringList parts = token.split(QLatin1Char('.'));
    if (parts.size() != 3 || parts.at(1).isEmpty()) {
        return fail(error, QStringLiteral("Token is not a JWT"));
    }

    const auto decoded = QByteArray::fromBase64Encoding(
        parts.at(1).toLatin1(),
        QByteArray::Base64UrlEncoding | QByteArray::OmitTrailingEquals
            | QByteArray::AbortOnBase64DecodingErrors);
    if (!decoded) {
        return fail(error, QStringLiteral("Token payload is not valid base64url"));
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(*decoded, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return fail(error, QStringLiteral("Token payload is not a JSON object"));
    }
    const QJsonObject payload = doc.object();

    qint64 expiresAt = fallbackExpiresAt;
    const QJsonValue exp = payload.value(QStringLiteral("exp"));
    if (exp.isDouble()) {
        expiresAt = static_cast<qint64>(exp.toDouble());
    } else if (!exp.isUndefined()) {
        return fail(error, QStringLiteral("Token 'exp' claim is not numeric"));
    }
    if (expiresAt <= 0) {
        return fail(error, QStringLiteral("Token carries no expiry"));
    }

    Role role = Role::Unset;
    const QJsonValue roleClaim = payload.value(QStringLiteral("role"));
    if (roleClaim.isString()) {
        role = parseRoleClaim(roleClaim.toString());
        if (role == Role::Unset) {
            qCWarning(lcSession) << "Unknown role claim" << roleClaim.toString()
                                 << "- treating session as free trial";
        }
    }
    if (role == Role::Unset) {
        role = Role::FreeTrial;
    }

    claims.role      = role;
    claims.expiresAt = expiresAt;
    claims.email     = payload.value(QStringLiteral("email")).toString();
    return true;
}

} // namespace mdi
