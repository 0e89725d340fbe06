// src/core/TokenStore.cpp

#include "TokenStore.h"

namespace mdi {

void TokenStore::set(const Session& session)
{
    if (session.accessToken.isEmpty() || session.role == Role::Unset || session.expiresAt == 0) {
        clear();
        m_session.lastIdentity = session.lastIdentity;
        return;
    }
    m_session = session;
}

void TokenStore::clear() noexcept
{
    m_session.accessToken.clear();
    m_session.refreshToken.clear();
    m_session.expiresAt = 0;
    m_session.role      = Role::Unset;
    m_session.lastIdentity.clear();
}

bool TokenStore::isValidAt(qint64 now) const noexcept
{
    return m_session.hasAccessToken() && now < m_session.expiresAt;
}

} // namespace mdi
