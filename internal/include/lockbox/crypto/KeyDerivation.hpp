#ifndef INCLUDE_LOCKBOX_CRYPTO_KEYDERIVATION_HPP
#define INCLUDE_LOCKBOX_CRYPTO_KEYDERIVATION_HPP

#include "lockbox/crypto/KdfParams.hpp"
#include "lockbox/security/SecureMemory.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace lockbox::crypto
{

// PBKDF2 (RFC 8018) with HMAC-SHA512 as PRF, truncated to g_derivedKeyBytes.
[[nodiscard]] lockbox::security::SecureBuffer derivePbkdf2HmacSha512(std::span<const std::byte> password,
                                                                     std::span<const std::byte> salt,
                                                                     std::uint32_t iterations);

} // namespace lockbox::crypto

#endif // INCLUDE_LOCKBOX_CRYPTO_KEYDERIVATION_HPP
