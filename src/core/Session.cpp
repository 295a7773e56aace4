#include "lockbox/core/Session.hpp"
#include <utility>

namespace lockbox::core
{

Session::Session(std::string id, UnlockedVault&& vault, Duration timeout, NowProvider nowProvider)
    : m_id(std::move(id)), m_now(std::move(nowProvider)), m_timeout(timeout), m_vault(std::move(vault))
{
    m_createdAt = m_now();
    m_lastActivity = m_createdAt;
}

void Session::touch() noexcept
{
    m_lastActivity = m_now();
}

bool Session::isExpired() const noexcept
{
    return (m_now() - m_lastActivity) > m_timeout;
}

const std::string& Session::id() const noexcept
{
    return m_id;
}

TimePoint Session::createdAt() const noexcept
{
    return m_createdAt;
}

TimePoint Session::lastActivity() const noexcept
{
    return m_lastActivity;
}

Session::Duration Session::timeout() const noexcept
{
    return m_timeout;
}

const UnlockedVault& Session::vault() const noexcept
{
    return m_vault;
}

UnlockedVault& Session::vault() noexcept
{
    return m_vault;
}

} // namespace lockbox::core
