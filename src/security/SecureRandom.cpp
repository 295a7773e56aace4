#include "lockbox/security/SecureRandom.hpp"
#include "lockbox/security/SecureMemory.hpp"
#include <array>
#include <cerrno>
#include <cstring>
#include <limits>
#include <string_view>
#include <vector>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#include <bcrypt.h>
#elif defined(__linux__)
#include <sys/random.h>
#else
#error Unsupported platform
#endif

namespace lockbox::security
{

namespace
{

constexpr std::size_t g_maxBoundedAttempts{ 128U };
constexpr std::string_view g_hexDigits{ "0123456789abcdef" };

#if defined(_WIN32)
bool fillFromOs(std::uint8_t* out, std::size_t size) noexcept
{
    constexpr std::size_t kMaxChunk{ static_cast<std::size_t>(std::numeric_limits<ULONG>::max()) };
    while (size > 0U)
    {
        const std::size_t chunk{ (size > kMaxChunk) ? kMaxChunk : size };
        const NTSTATUS status{ ::BCryptGenRandom(nullptr, reinterpret_cast<PUCHAR>(out), static_cast<ULONG>(chunk),
                                                 BCRYPT_USE_SYSTEM_PREFERRED_RNG) };
        if (!BCRYPT_SUCCESS(status))
        {
            return false;
        }
        size -= chunk;
        out += chunk;
    }
    return true;
}
#else
bool fillFromOs(std::uint8_t* out, std::size_t size) noexcept
{
    while (size > 0U)
    {
        const ssize_t got{ ::getrandom(out, size, 0) };
        if (got < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return false;
        }
        const auto received{ static_cast<std::size_t>(got) };
        if (received == 0U || received > size)
        {
            return false;
        }
        size -= received;
        out += received;
    }
    return true;
}
#endif

} // namespace

bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    if (out.empty())
    {
        return true;
    }
    return fillFromOs(out.data(), out.size());
}

bool secureRandomUint64(std::uint64_t& out) noexcept
{
    std::array<std::uint8_t, sizeof(std::uint64_t)> bytes{};
    auto wipe{ scopeWipe(bytes) };
    if (!secureRandomFill(bytes))
    {
        return false;
    }
    std::memcpy(&out, bytes.data(), sizeof(out));
    return true;
}

bool secureRandomBounded(std::uint64_t maxExcl, std::uint64_t& out) noexcept
{
    if (maxExcl == 0U)
    {
        return false;
    }
    if (maxExcl == 1U)
    {
        out = 0U;
        return true;
    }

    // Largest multiple of maxExcl that fits; values at or above it would bias the modulo.
    const std::uint64_t limit{ (std::numeric_limits<std::uint64_t>::max() / maxExcl) * maxExcl };
    for (std::size_t attempt{}; attempt < g_maxBoundedAttempts; ++attempt)
    {
        std::uint64_t candidate{};
        if (!secureRandomUint64(candidate))
        {
            return false;
        }
        if (candidate < limit)
        {
            out = candidate % maxExcl;
            return true;
        }
    }
    return false;
}

std::string toHex(std::span<const std::uint8_t> bytes)
{
    std::string out;
    out.reserve(bytes.size() * 2U);
    for (const std::uint8_t b : bytes)
    {
        out.push_back(g_hexDigits[b >> 4U]);
        out.push_back(g_hexDigits[b & 0x0FU]);
    }
    return out;
}

std::optional<std::string> secureRandomHex(std::size_t byteCount)
{
    SecureBuffer raw(byteCount);
    if (!secureRandomFill(raw))
    {
        return std::nullopt;
    }
    return toHex(asSpan(raw));
}

} // namespace lockbox::security
