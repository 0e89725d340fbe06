// src/core/TokenStore.h
//
// TokenStore – holds the process-wide Session value.  Pure data, no I/O;
// persistence belongs to SessionController.

#pragma once

#include "Types.h"

namespace mdi {

class TokenStore {
public:
    TokenStore() = default;

    TokenStore(const TokenStore&)            = delete;
    TokenStore& operator=(const TokenStore&) = delete;

    /// Replace every field.  A session without an access token is stored
    /// as fully cleared so role/token/expiry can never disagree.
    void set(const Session& session);

    /// Reset every field to unset.  Idempotent.
    void clear() noexcept;

    [[nodiscard]] const Session& session() const noexcept { return m_session; }

    /// Token present and not yet expired at `now` (epoch seconds).
    [[nodiscard]] bool isValidAt(qint64 now) const noexcept;
    [[nodiscard]] bool hasToken() const noexcept { return m_session.hasAccessToken(); }

private:
    Session m_session;
};

} // namespace mdi
