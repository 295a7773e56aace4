#ifndef INCLUDE_LOCKBOX_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_LOCKBOX_CRYPTO_ICRYPTOPROVIDER_HPP

#include "lockbox/crypto/KdfParams.hpp"
#include "lockbox/security/SecureMemory.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace lockbox::crypto
{

constexpr std::size_t g_aeadKeyBytes{ 32 };
constexpr std::size_t g_aeadNonceBytes{ 12 };
constexpr std::size_t g_aeadTagBytes{ 16 };
constexpr std::size_t g_digestBytes{ 64 };

using Digest = std::array<std::uint8_t, g_digestBytes>;

struct AeadBox final
{
    std::array<std::uint8_t, g_aeadNonceBytes> nonce{};
    std::array<std::uint8_t, g_aeadTagBytes> tag{};
    std::vector<std::uint8_t> cipherText;
};

// Crypto backend seam. Implementations must be byte-compatible with each other:
// PBKDF2-HMAC-SHA512, ChaCha20-Poly1305 (IETF) and BLAKE2b-512.
class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    // Throws std::invalid_argument on an empty password or an iteration count of zero or above
    // g_maxKdfIterations; std::runtime_error when the backend fails.
    [[nodiscard]] virtual lockbox::security::SecureBuffer deriveKey(std::span<const std::byte> password,
                                                                    const KdfParams& params) const = 0;

    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;

    // Fresh random nonce per call. Throws std::runtime_error on CSPRNG failure.
    [[nodiscard]] virtual AeadBox aeadEncrypt(std::span<const std::uint8_t> key, std::span<const std::byte> plainText,
                                              std::span<const std::byte> associatedData) = 0;

    // Returns std::nullopt on authentication failure; no partial plaintext escapes.
    [[nodiscard]] virtual std::optional<lockbox::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const AeadBox& box, std::span<const std::byte> associatedData) = 0;

    [[nodiscard]] virtual Digest digest(std::span<const std::byte> message) const = 0;
};

} // namespace lockbox::crypto

#endif // INCLUDE_LOCKBOX_CRYPTO_ICRYPTOPROVIDER_HPP
