// src/core/TokenCodec.h
//
// Local decoding of the identity provider's signed token (a JWT).  Only the
// payload is read: `exp` for expiry and `role` for the subscription tier.
// The signature is not verified here; the data service does that on every
// request.

#pragma once

#include "Types.h"

namespace mdi {

struct TokenClaims {
    Role   role      = Role::Unset;
    qint64 expiresAt = 0;
    QString email;
};

/// Parses a role claim value ("free_trial", "premium", "admin", any case).
/// Unknown values map to Role::Unset.
Role parseRoleClaim(const QString& value);

/// Decodes `token`.  When the payload carries no `exp` claim,
/// `fallbackExpiresAt` is used; when that is 0 too, decoding fails.  A
/// missing or unknown role claim yields Role::FreeTrial.
///
/// Returns false and fills `error` when the token is not a decodable JWT.
bool decodeToken(const QString& token,
                 qint64 fallbackExpiresAt,
                 TokenClaims& claims,
                 QString* error = nullptr);

} // namespace mdi
