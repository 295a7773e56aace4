#include "lockbox/crypto/KeyDerivation.hpp"

#include "monocypher-ed25519.h"
#include "monocypher.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>

namespace lockbox::crypto
{

namespace
{

constexpr std::size_t g_sha512Bytes{ 64 };

// INT(1), big-endian. The derived key fits in the first PRF block.
constexpr std::array<std::uint8_t, 4> g_firstBlockIndex{ 0x00, 0x00, 0x00, 0x01 };

const std::uint8_t* asU8Ptr(std::span<const std::byte> s) noexcept
{
    return reinterpret_cast<const std::uint8_t*>(s.data());
}

} // namespace

lockbox::security::SecureBuffer derivePbkdf2HmacSha512(std::span<const std::byte> password,
                                                       std::span<const std::byte> salt, std::uint32_t iterations)
{
    static_assert(g_derivedKeyBytes <= g_sha512Bytes);

    if (password.empty())
    {
        throw std::invalid_argument("derivePbkdf2HmacSha512: empty password");
    }
    if (salt.size() != g_saltBytes)
    {
        throw std::invalid_argument("derivePbkdf2HmacSha512: invalid salt size");
    }
    if (iterations == 0U || iterations > g_maxKdfIterations)
    {
        throw std::invalid_argument("derivePbkdf2HmacSha512: invalid iteration count");
    }

    // HMAC key schedule is computed once and copied per iteration; final() wipes the context it consumes.
    crypto_sha512_hmac_ctx keyed{};
    auto wipeKeyed{ lockbox::security::scopeWipe(keyed) };
    crypto_sha512_hmac_init(&keyed, asU8Ptr(password), password.size());

    std::array<std::uint8_t, g_sha512Bytes> u{};
    std::array<std::uint8_t, g_sha512Bytes> t{};
    auto wipeU{ lockbox::security::scopeWipe(u) };
    auto wipeT{ lockbox::security::scopeWipe(t) };

    crypto_sha512_hmac_ctx ctx{ keyed };
    auto wipeCtx{ lockbox::security::scopeWipe(ctx) };
    crypto_sha512_hmac_update(&ctx, asU8Ptr(salt), salt.size());
    crypto_sha512_hmac_update(&ctx, g_firstBlockIndex.data(), g_firstBlockIndex.size());
    crypto_sha512_hmac_final(&ctx, u.data());
    t = u;

    for (std::uint32_t i{ 1U }; i < iterations; ++i)
    {
        ctx = keyed;
        crypto_sha512_hmac_update(&ctx, u.data(), u.size());
        crypto_sha512_hmac_final(&ctx, u.data());
        for (std::size_t j{}; j < t.size(); ++j)
        {
            t[j] ^= u[j];
        }
    }

    lockbox::security::SecureBuffer key(g_derivedKeyBytes);
    std::copy_n(t.begin(), key.size(), key.begin());
    return key;
}

} // namespace lockbox::crypto
