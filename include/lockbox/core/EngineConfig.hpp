#ifndef INCLUDE_LOCKBOX_CORE_ENGINECONFIG_HPP
#define INCLUDE_LOCKBOX_CORE_ENGINECONFIG_HPP

#include "lockbox/core/Clock.hpp"
#include "lockbox/crypto/KdfParams.hpp"
#include <cstddef>
#include <cstdint>

namespace lockbox::core
{

constexpr Seconds g_defaultSessionTimeout{ 300 };
constexpr std::uint32_t g_defaultMaxFailedAttempts{ 5U };
constexpr Seconds g_defaultFailureWindow{ 300 };
constexpr Seconds g_defaultLockoutDuration{ 300 };
constexpr Seconds g_defaultShareTtl{ 3600 };

// Supplied by the integrator; the core never parses configuration itself.
struct EngineConfig final
{
    // Idle time after which a session is dropped. Must be positive.
    Seconds sessionTimeout{ g_defaultSessionTimeout };
    std::uint32_t maxFailedAttempts{ g_defaultMaxFailedAttempts };
    Seconds failureWindow{ g_defaultFailureWindow };
    Seconds lockoutDuration{ g_defaultLockoutDuration };
    std::uint32_t kdfIterations{ lockbox::crypto::g_defaultKdfIterations };
    std::uint32_t shareKdfIterations{ lockbox::crypto::g_defaultKdfIterations };
    Seconds defaultShareTtl{ g_defaultShareTtl };

    [[nodiscard]] bool isValid() const noexcept;
};

} // namespace lockbox::core

#endif // INCLUDE_LOCKBOX_CORE_ENGINECONFIG_HPP
