#include "lockbox/core/AuthSessionManager.hpp"
#include "lockbox/core/AuditLog.hpp"
#include "lockbox/core/Logging.hpp"
#include "lockbox/security/SecureRandom.hpp"
#include <exception>
#include <memory>
#include <stdexcept>
#include <utility>

namespace lockbox::core
{
namespace
{

constexpr std::size_t g_sessionIdBytes{ 32U };

} // namespace

AuthSessionManager::AuthSessionManager(EngineConfig config, NowProvider now)
    : m_config{ config }, m_now{ std::move(now) }
{
    if (!m_config.isValid())
    {
        throw std::invalid_argument("AuthSessionManager: invalid engine configuration");
    }
}

VaultResult<std::string> AuthSessionManager::authenticate(VaultStore& store,
                                                          const lockbox::security::SecureString& passphrase) noexcept
{
    const std::scoped_lock lock{ m_mutex };
    try
    {
        const std::string& identity{ store.identity() };
        const TimePoint now{ m_now() };

        auto lockoutIt{ m_lockouts.find(identity) };
        if (lockoutIt != m_lockouts.end())
        {
            LockoutState& state{ lockoutIt->second };
            if (state.lockedUntil && now < *state.lockedUntil)
            {
                log(LogLevel::Warning, "auth_locked_out", identity);
                if (const auto audited{ store.audit().append(AuditEventKind::AuthLockedOut, {}) }; isError(audited))
                {
                    return std::get<VaultError>(audited);
                }
                return VaultError::LockedOut;
            }
            if (state.lockedUntil || (now - state.firstFailureAt) > m_config.failureWindow)
            {
                m_lockouts.erase(lockoutIt);
                lockoutIt = m_lockouts.end();
            }
        }

        auto opened{ store.open(passphrase) };
        if (const auto* err = std::get_if<VaultError>(&opened))
        {
            if (*err != VaultError::AuthenticationFailed)
            {
                log(LogLevel::Warning, "auth_aborted", errorName(*err));
                if (const auto audited{ store.audit().append(AuditEventKind::AuthFailed, {}) }; isError(audited))
                {
                    log(LogLevel::Error, "auth_audit_failed", errorName(std::get<VaultError>(audited)));
                }
                return *err;
            }

            if (lockoutIt == m_lockouts.end())
            {
                lockoutIt = m_lockouts.emplace(identity, LockoutState{ .firstFailureAt = now }).first;
            }
            LockoutState& state{ lockoutIt->second };
            ++state.failedAttemptCount;
            if (state.failedAttemptCount >= m_config.maxFailedAttempts)
            {
                state.lockedUntil = now + m_config.lockoutDuration;
                log(LogLevel::Warning, "lockout_started", identity);
            }
            else
            {
                log(LogLevel::Info, "auth_failed", identity);
            }

            if (const auto audited{ store.audit().append(AuditEventKind::AuthFailed, {}) }; isError(audited))
            {
                return std::get<VaultError>(audited);
            }
            return VaultError::AuthenticationFailed;
        }

        const auto id{ lockbox::security::secureRandomHex(g_sessionIdBytes) };
        if (!id)
        {
            return VaultError::RandomFailed;
        }
        if (const auto audited{ store.audit().append(AuditEventKind::AuthSucceeded, {}) }; isError(audited))
        {
            return std::get<VaultError>(audited);
        }

        m_lockouts.erase(identity);
        endSessionsForLocked(identity);
        m_sessions.emplace(*id, ActiveSession{ .vaultIdentity = identity,
                                               .store = &store,
                                               .session = std::make_unique<Session>(
                                                   *id, std::move(std::get<UnlockedVault>(opened)),
                                                   m_config.sessionTimeout, m_now) });
        log(LogLevel::Info, "session_started", identity);
        return *id;
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "authenticate_failed", e.what());
        return VaultError::StorageError;
    }
}

Session* AuthSessionManager::liveSessionLocked(std::string_view sessionId) noexcept
{
    const auto it{ m_sessions.find(sessionId) };
    if (it == m_sessions.end())
    {
        return nullptr;
    }
    if (it->second.session->isExpired())
    {
        log(LogLevel::Info, "session_expired", it->second.vaultIdentity);
        m_sessions.erase(it);
        return nullptr;
    }
    return it->second.session.get();
}

VaultResult<std::monostate> AuthSessionManager::touch(std::string_view sessionId) noexcept
{
    const std::scoped_lock lock{ m_mutex };
    Session* session{ liveSessionLocked(sessionId) };
    if (session == nullptr)
    {
        return VaultError::SessionExpired;
    }
    session->touch();
    return std::monostate{};
}

bool AuthSessionManager::isExpired(std::string_view sessionId) noexcept
{
    const std::scoped_lock lock{ m_mutex };
    return liveSessionLocked(sessionId) == nullptr;
}

VaultResult<std::monostate> AuthSessionManager::logout(std::string_view sessionId) noexcept
{
    const std::scoped_lock lock{ m_mutex };
    if (liveSessionLocked(sessionId) == nullptr)
    {
        return VaultError::SessionExpired;
    }
    const auto it{ m_sessions.find(sessionId) };
    VaultStore* store{ it->second.store };
    log(LogLevel::Info, "session_ended", it->second.vaultIdentity);
    m_sessions.erase(it);

    if (const auto audited{ store->audit().append(AuditEventKind::LoggedOut, {}) }; isError(audited))
    {
        return std::get<VaultError>(audited);
    }
    return std::monostate{};
}

void AuthSessionManager::endSessionsForLocked(std::string_view vaultIdentity) noexcept
{
    for (auto it{ m_sessions.begin() }; it != m_sessions.end();)
    {
        if (it->second.vaultIdentity == vaultIdentity)
        {
            it = m_sessions.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

void AuthSessionManager::endSessionsFor(std::string_view vaultIdentity) noexcept
{
    const std::scoped_lock lock{ m_mutex };
    endSessionsForLocked(vaultIdentity);
}

std::optional<LockoutState> AuthSessionManager::lockoutState(std::string_view vaultIdentity) const
{
    const std::scoped_lock lock{ m_mutex };
    const auto it{ m_lockouts.find(vaultIdentity) };
    if (it == m_lockouts.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::size_t AuthSessionManager::activeSessionCount() const noexcept
{
    const std::scoped_lock lock{ m_mutex };
    return m_sessions.size();
}

} // namespace lockbox::core
