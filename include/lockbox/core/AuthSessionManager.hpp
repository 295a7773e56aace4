#ifndef INCLUDE_LOCKBOX_CORE_AUTHSESSIONMANAGER_HPP
#define INCLUDE_LOCKBOX_CORE_AUTHSESSIONMANAGER_HPP

#include "lockbox/core/Clock.hpp"
#include "lockbox/core/EngineConfig.hpp"
#include "lockbox/core/Logging.hpp"
#include "lockbox/core/Session.hpp"
#include "lockbox/core/VaultError.hpp"
#include "lockbox/core/VaultStore.hpp"
#include "lockbox/security/SecureMemory.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace lockbox::core
{

struct LockoutState final
{
    std::uint32_t failedAttemptCount{};
    TimePoint firstFailureAt{};
    std::optional<TimePoint> lockedUntil;
};

// Process-wide unlock/lockout state machine and session table. Lockout state is keyed by vault identity
// and lives in memory only. One live session per vault: a new unlock ends the previous one.
class AuthSessionManager final
{
public:
    explicit AuthSessionManager(EngineConfig config, NowProvider now = Clock::now);

    AuthSessionManager(const AuthSessionManager&) = delete;
    AuthSessionManager& operator=(const AuthSessionManager&) = delete;
    AuthSessionManager(AuthSessionManager&&) = delete;
    AuthSessionManager& operator=(AuthSessionManager&&) = delete;
    ~AuthSessionManager() = default;

    // Returns the new session id.
    [[nodiscard]] VaultResult<std::string> authenticate(VaultStore& store,
                                                        const lockbox::security::SecureString& passphrase) noexcept;

    [[nodiscard]] VaultResult<std::monostate> touch(std::string_view sessionId) noexcept;

    // Unknown sessions count as expired. An expired session is destroyed here.
    [[nodiscard]] bool isExpired(std::string_view sessionId) noexcept;

    [[nodiscard]] VaultResult<std::monostate> logout(std::string_view sessionId) noexcept;

    // Drops every session of one vault without auditing; used when the vault's owner goes away.
    void endSessionsFor(std::string_view vaultIdentity) noexcept;

    [[nodiscard]] std::optional<LockoutState> lockoutState(std::string_view vaultIdentity) const;
    [[nodiscard]] std::size_t activeSessionCount() const noexcept;

    // Runs `fn(Session&)` on a live session of `vaultIdentity` after refreshing its activity time.
    // The manager lock is held for the duration of the call.
    template <class Fn>
    [[nodiscard]] auto withSession(std::string_view vaultIdentity, std::string_view sessionId, Fn&& fn) noexcept
        -> std::invoke_result_t<Fn, Session&>
    {
        const std::scoped_lock lock{ m_mutex };
        Session* session{ liveSessionLocked(sessionId) };
        if (session == nullptr || m_sessions.find(sessionId)->second.vaultIdentity != vaultIdentity)
        {
            return VaultError::SessionExpired;
        }
        session->touch();
        return std::forward<Fn>(fn)(*session);
    }

private:
    struct ActiveSession final
    {
        std::string vaultIdentity;
        VaultStore* store{ nullptr };
        std::unique_ptr<Session> session;
    };

    // Returns nullptr for unknown sessions; destroys and returns nullptr for expired ones.
    [[nodiscard]] Session* liveSessionLocked(std::string_view sessionId) noexcept;
    void endSessionsForLocked(std::string_view vaultIdentity) noexcept;

    EngineConfig m_config;
    NowProvider m_now;
    mutable std::mutex m_mutex;
    std::map<std::string, LockoutState, std::less<>> m_lockouts;
    std::map<std::string, ActiveSession, std::less<>> m_sessions;
};

} // namespace lockbox::core

#endif // INCLUDE_LOCKBOX_CORE_AUTHSESSIONMANAGER_HPP
