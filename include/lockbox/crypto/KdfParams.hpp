#ifndef INCLUDE_LOCKBOX_CRYPTO_KDFPARAMS_HPP
#define INCLUDE_LOCKBOX_CRYPTO_KDFPARAMS_HPP

#include <array>
#include <cstddef>
#include <cstdint>

namespace lockbox::crypto
{

constexpr std::size_t g_saltBytes{ 16 };
constexpr std::size_t g_derivedKeyBytes{ 32 };

// PBKDF2-HMAC-SHA512 work bounds. Headers outside this range are refused before any derivation.
constexpr std::uint32_t g_minKdfIterations{ 100'000 };
constexpr std::uint32_t g_maxKdfIterations{ 10'000'000 };
constexpr std::uint32_t g_defaultKdfIterations{ g_minKdfIterations };

struct KdfParams final
{
    std::uint32_t iterations{ g_defaultKdfIterations };
    std::array<std::uint8_t, g_saltBytes> salt{};
};

[[nodiscard]] constexpr bool isIterationCountAccepted(std::uint32_t iterations) noexcept
{
    return iterations >= g_minKdfIterations && iterations <= g_maxKdfIterations;
}

} // namespace lockbox::crypto

#endif // INCLUDE_LOCKBOX_CRYPTO_KDFPARAMS_HPP
