#ifndef INCLUDE_LOCKBOX_CORE_SESSION_HPP
#define INCLUDE_LOCKBOX_CORE_SESSION_HPP

#include "lockbox/core/Clock.hpp"
#include "lockbox/core/VaultStore.hpp"
#include <string>

namespace lockbox::core
{

// An unlocked vault plus idle-timeout bookkeeping. The key is wiped when the session is destroyed.
class Session final
{
public:
    using Duration = Seconds;

    Session(std::string id, UnlockedVault&& vault, Duration timeout, NowProvider nowProvider = Clock::now);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&) noexcept = default;
    Session& operator=(Session&&) noexcept = default;
    ~Session() = default;

    void touch() noexcept;

    // Idle longer than the timeout.
    [[nodiscard]] bool isExpired() const noexcept;

    [[nodiscard]] const std::string& id() const noexcept;
    [[nodiscard]] TimePoint createdAt() const noexcept;
    [[nodiscard]] TimePoint lastActivity() const noexcept;
    [[nodiscard]] Duration timeout() const noexcept;
    [[nodiscard]] const UnlockedVault& vault() const noexcept;
    [[nodiscard]] UnlockedVault& vault() noexcept;

private:
    std::string m_id;
    NowProvider m_now;
    Duration m_timeout{};
    TimePoint m_createdAt{};
    TimePoint m_lastActivity{};
    UnlockedVault m_vault;
};

} // namespace lockbox::core

#endif // INCLUDE_LOCKBOX_CORE_SESSION_HPP
