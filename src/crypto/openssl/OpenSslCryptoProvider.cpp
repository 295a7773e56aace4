#include "lockbox/crypto/providers/OpenSslProviderFactory.hpp"
#include "lockbox/security/SecureMemory.hpp"
#include "lockbox/security/SecureRandom.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

namespace lockbox::crypto::providers
{
namespace
{

constexpr std::array<char, 7> g_pbkdf2Digest{ "SHA512" };

void requireExactSize(std::span<const std::uint8_t> s, std::size_t expected, const char* what)
{
    if (s.size() != expected)
    {
        throw std::invalid_argument(what);
    }
}

void requireIntSized(std::size_t size, const char* what)
{
    if (size > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        throw std::invalid_argument(what);
    }
}

using EvpKdfPtr = std::unique_ptr<EVP_KDF, decltype(&EVP_KDF_free)>;
using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;
using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

EvpKdfPtr fetchPbkdf2Kdf()
{
    return EvpKdfPtr{ EVP_KDF_fetch(nullptr, "PBKDF2", nullptr), &EVP_KDF_free };
}

class OpenSslCryptoProvider final : public lockbox::crypto::ICryptoProvider
{
public:
    OpenSslCryptoProvider() : m_pbkdf2{ fetchPbkdf2Kdf() }
    {
    }

    [[nodiscard]] lockbox::security::SecureBuffer deriveKey(std::span<const std::byte> password,
                                                            const lockbox::crypto::KdfParams& params) const override
    {
        if (password.empty())
        {
            throw std::invalid_argument("deriveKey: empty password");
        }
        if (params.iterations == 0U || params.iterations > lockbox::crypto::g_maxKdfIterations)
        {
            throw std::invalid_argument("deriveKey: invalid iteration count");
        }
        if (!m_pbkdf2)
        {
            throw std::runtime_error("deriveKey: OpenSSL PBKDF2 not available");
        }

        EvpKdfCtxPtr ctx{ EVP_KDF_CTX_new(m_pbkdf2.get()), &EVP_KDF_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("deriveKey: EVP_KDF_CTX_new failed");
        }

        // OSSL_PARAM takes non-const pointers even for inputs; hand it private copies instead of casting.
        lockbox::security::SecureBuffer passwordCopy{ lockbox::security::secureBufferFrom(password) };
        auto saltCopy{ params.salt };
        auto digestName{ g_pbkdf2Digest };
        unsigned int iterations{ params.iterations };
        // Same bounds as the native backend; the SP 800-132 lower limits are enforced by the caller.
        int pkcs5Mode{ 1 };

        OSSL_PARAM ossl[]{
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD, passwordCopy.data(), passwordCopy.size()),
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, saltCopy.data(), saltCopy.size()),
            OSSL_PARAM_construct_uint(OSSL_KDF_PARAM_ITER, &iterations),
            OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, digestName.data(), 0),
            OSSL_PARAM_construct_int(OSSL_KDF_PARAM_PKCS5, &pkcs5Mode),
            OSSL_PARAM_construct_end(),
        };

        lockbox::security::SecureBuffer out(lockbox::crypto::g_derivedKeyBytes);
        if (EVP_KDF_derive(ctx.get(), out.data(), out.size(), ossl) <= 0)
        {
            throw std::runtime_error("deriveKey: EVP_KDF_derive failed");
        }
        return out;
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
        requireIntSized(plainText.size(), "aeadEncrypt: plainText too large");
        requireIntSized(associatedData.size(), "aeadEncrypt: associatedData too large");

        lockbox::crypto::AeadBox box{};
        if (!randomBytes(box.nonce))
        {
            throw std::runtime_error("aeadEncrypt: CSPRNG failure");
        }

        EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("aeadEncrypt: EVP_CIPHER_CTX_new failed");
        }
        if (EVP_EncryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(box.nonce.size()), nullptr) != 1 ||
            EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), box.nonce.data()) != 1)
        {
            throw std::runtime_error("aeadEncrypt: cipher init failed");
        }

        int len{ 0 };
        if (!associatedData.empty())
        {
            const auto* adPtr{ reinterpret_cast<const unsigned char*>(associatedData.data()) };
            if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, adPtr, static_cast<int>(associatedData.size())) != 1)
            {
                throw std::runtime_error("aeadEncrypt: add aad failed");
            }
        }

        // ChaCha20-Poly1305 is a stream mode: ciphertext length equals plaintext length and Final emits nothing.
        box.cipherText.resize(plainText.size());
        if (!plainText.empty())
        {
            const auto* ptPtr{ reinterpret_cast<const unsigned char*>(plainText.data()) };
            if (EVP_EncryptUpdate(ctx.get(), box.cipherText.data(), &len, ptPtr, static_cast<int>(plainText.size())) !=
                    1 ||
                static_cast<std::size_t>(len) != plainText.size())
            {
                throw std::runtime_error("aeadEncrypt: encrypt update failed");
            }
        }

        std::array<unsigned char, 16> finalScratch{};
        if (EVP_EncryptFinal_ex(ctx.get(), finalScratch.data(), &len) != 1 || len != 0)
        {
            throw std::runtime_error("aeadEncrypt: encrypt final failed");
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(box.tag.size()), box.tag.data()) !=
            1)
        {
            throw std::runtime_error("aeadEncrypt: get tag failed");
        }
        return box;
    }

    [[nodiscard]] std::optional<lockbox::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const lockbox::crypto::AeadBox& box,
                std::span<const std::byte> associatedData) override
    {
        requireExactSize(key, lockbox::crypto::g_aeadKeyBytes, "aeadDecrypt: key");
        requireIntSized(box.cipherText.size(), "aeadDecrypt: cipherText too large");
        requireIntSized(associatedData.size(), "aeadDecrypt: associatedData too large");

        EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("aeadDecrypt: EVP_CIPHER_CTX_new failed");
        }
        if (EVP_DecryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(box.nonce.size()), nullptr) != 1 ||
            EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), box.nonce.data()) != 1)
        {
            throw std::runtime_error("aeadDecrypt: cipher init failed");
        }

        int len{ 0 };
        if (!associatedData.empty())
        {
            const auto* adPtr{ reinterpret_cast<const unsigned char*>(associatedData.data()) };
            if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, adPtr, static_cast<int>(associatedData.size())) != 1)
            {
                throw std::runtime_error("aeadDecrypt: add aad failed");
            }
        }

        lockbox::security::SecureBuffer plainText(box.cipherText.size());
        if (!box.cipherText.empty())
        {
            if (EVP_DecryptUpdate(ctx.get(), plainText.data(), &len, box.cipherText.data(),
                                  static_cast<int>(box.cipherText.size())) != 1 ||
                static_cast<std::size_t>(len) != plainText.size())
            {
                lockbox::security::secureRelease(plainText);
                return std::nullopt;
            }
        }

        std::array<std::uint8_t, lockbox::crypto::g_aeadTagBytes> tagCopy{ box.tag };
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(tagCopy.size()), tagCopy.data()) !=
            1)
        {
            throw std::runtime_error("aeadDecrypt: set tag failed");
        }

        std::array<unsigned char, 16> finalScratch{};
        if (EVP_DecryptFinal_ex(ctx.get(), finalScratch.data(), &len) != 1 || len != 0)
        {
            lockbox::security::secureRelease(plainText);
            return std::nullopt;
        }
        return plainText;
    }

    [[nodiscard]] lockbox::crypto::Digest digest(std::span<const std::byte> message) const override
    {
        lockbox::crypto::Digest out{};
        unsigned int written{ 0 };
        if (EVP_Digest(message.data(), message.size(), out.data(), &written, EVP_blake2b512(), nullptr) != 1 ||
            written != out.size())
        {
            throw std::runtime_error("digest: EVP_Digest failed");
        }
        return out;
    }

private:
    EvpKdfPtr m_pbkdf2{ nullptr, &EVP_KDF_free };
};

} // namespace

std::unique_ptr<lockbox::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

} // namespace lockbox::crypto::providers
