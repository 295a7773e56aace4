#ifndef INCLUDE_LOCKBOX_CORE_CIPHERCODEC_HPP
#define INCLUDE_LOCKBOX_CORE_CIPHERCODEC_HPP

#include "lockbox/crypto/ICryptoProvider.hpp"
#include "lockbox/security/SecureMemory.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace lockbox::core
{

constexpr std::size_t g_sealOverheadBytes{ lockbox::crypto::g_aeadNonceBytes + lockbox::crypto::g_aeadTagBytes };

// Returns nonce || ciphertext || tag under a fresh random nonce.
// Throws std::invalid_argument for a bad key size and std::runtime_error when the CSPRNG or backend fails.
[[nodiscard]] std::vector<std::uint8_t> sealPayload(lockbox::crypto::ICryptoProvider& crypto,
                                                    std::span<const std::uint8_t> key,
                                                    std::span<const std::byte> plainText,
                                                    std::span<const std::byte> associatedData = {});

// std::nullopt when the input is too short or fails authentication.
[[nodiscard]] std::optional<lockbox::security::SecureBuffer>
openPayload(lockbox::crypto::ICryptoProvider& crypto, std::span<const std::uint8_t> key,
            std::span<const std::uint8_t> sealed, std::span<const std::byte> associatedData = {});

} // namespace lockbox::core

#endif // INCLUDE_LOCKBOX_CORE_CIPHERCODEC_HPP
