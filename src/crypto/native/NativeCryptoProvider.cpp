#include "lockbox/crypto/KeyDerivation.hpp"
#include "lockbox/crypto/providers/NativeProviderFactory.hpp"
#include "lockbox/security/SecureMemory.hpp"
#include "lockbox/security/SecureRandom.hpp"
#include "monocypher.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

namespace lockbox::crypto::providers
{
namespace
{

std::span<const std::uint8_t> asU8(std::span<const std::byte> s) noexcept
{
    return { reinterpret_cast<const std::uint8_t*>(s.data()), s.size() };
}

void requireExactSize(std::span<const std::uint8_t> s, std::size_t expected, const char* what)
{
    if (s.size() != expected)
    {
        throw std::invalid_argument(what);
    }
}

class NativeCryptoProvider final : public lockbox::crypto::ICryptoProvider
{
public:
    [[nodiscard]] lockbox::security::SecureBuffer deriveKey(std::span<const std::byte> password,
                                                            const lockbox::crypto::KdfParams& params) const override
    {
        return lockbox::crypto::derivePbkdf2HmacSha512(password, std::as_bytes(std::span{ params.salt }),
                                                       params.iterations);
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return lockbox::security::secureRandomFill(out);
    }

    [[nodiscard]] lockbox::crypto::AeadBox aeadEncrypt(std::span<const std::uint8_t> key,
                                                       std::span<const std::byte> plainText,
                                                       std::span<const std::byte> associatedData) override
    {
        requireExactSize(key, lockbox::crypto::g_aeadKeyBytes, "aeadEncrypt: key");

        lockbox::crypto::AeadBox box{};
        if (!randomBytes(box.nonce))
        {
            throw std::runtime_error("aeadEncrypt: CSPRNG failure");
        }
        box.cipherText.resize(plainText.size());

        crypto_aead_ctx ctx{};
        auto wipeCtx{ lockbox::security::scopeWipe(ctx) };
        crypto_aead_init_ietf(&ctx, key.data(), box.nonce.data());
        crypto_aead_write(&ctx, box.cipherText.data(), box.tag.data(), asU8(associatedData).data(),
                          associatedData.size(), asU8(plainText).data(), plainText.size());
        return box;
    }

    [[nodiscard]] std::optional<lockbox::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const lockbox::crypto::AeadBox& box,
                std::span<const std::byte> associatedData) override
    {
        requireExactSize(key, lockbox::crypto::g_aeadKeyBytes, "aeadDecrypt: key");

        lockbox::security::SecureBuffer plainText(box.cipherText.size());

        crypto_aead_ctx ctx{};
        auto wipeCtx{ lockbox::security::scopeWipe(ctx) };
        crypto_aead_init_ietf(&ctx, key.data(), box.nonce.data());
        const int rc{ crypto_aead_read(&ctx, plainText.data(), box.tag.data(), asU8(associatedData).data(),
                                       associatedData.size(), box.cipherText.data(), box.cipherText.size()) };
        if (rc != 0)
        {
            lockbox::security::secureRelease(plainText);
            return std::nullopt;
        }
        return plainText;
    }

    [[nodiscard]] lockbox::crypto::Digest digest(std::span<const std::byte> message) const override
    {
        lockbox::crypto::Digest out{};
        crypto_blake2b(out.data(), out.size(), asU8(message).data(), message.size());
        return out;
    }
};

} // namespace

std::unique_ptr<lockbox::crypto::ICryptoProvider> makeNativeCryptoProvider()
{
    return std::make_unique<NativeCryptoProvider>();
}

} // namespace lockbox::crypto::providers
