#ifndef INCLUDE_LOCKBOX_SECURITY_SECURERANDOM_HPP
#define INCLUDE_LOCKBOX_SECURITY_SECURERANDOM_HPP

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace lockbox::security
{

// All functions return false / std::nullopt when the OS CSPRNG fails; callers must not fall back to a weaker source.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;
[[nodiscard]] bool secureRandomUint64(std::uint64_t& out) noexcept;

// Uniform value in [0, maxExcl) via rejection sampling.
[[nodiscard]] bool secureRandomBounded(std::uint64_t maxExcl, std::uint64_t& out) noexcept;

template <std::unsigned_integral T>
    requires(!std::same_as<T, std::uint64_t> && sizeof(T) < sizeof(std::uint64_t))
[[nodiscard]] bool secureRandomBounded(T maxExcl, T& out) noexcept
{
    std::uint64_t wide{};
    if (!secureRandomBounded(static_cast<std::uint64_t>(maxExcl), wide))
    {
        return false;
    }
    out = static_cast<T>(wide);
    return true;
}

// Lowercase hex encoding of `byteCount` random bytes; used for record ids, session ids and share tokens.
[[nodiscard]] std::optional<std::string> secureRandomHex(std::size_t byteCount);

[[nodiscard]] std::string toHex(std::span<const std::uint8_t> bytes);

} // namespace lockbox::security

#endif // INCLUDE_LOCKBOX_SECURITY_SECURERANDOM_HPP
