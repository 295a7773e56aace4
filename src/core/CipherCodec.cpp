#include "lockbox/core/CipherCodec.hpp"
#include <algorithm>

namespace lockbox::core
{

std::vector<std::uint8_t> sealPayload(lockbox::crypto::ICryptoProvider& crypto, std::span<const std::uint8_t> key,
                                      std::span<const std::byte> plainText, std::span<const std::byte> associatedData)
{
    const auto box{ crypto.aeadEncrypt(key, plainText, associatedData) };

    std::vector<std::uint8_t> out;
    out.reserve(g_sealOverheadBytes + box.cipherText.size());
    out.insert(out.end(), box.nonce.begin(), box.nonce.end());
    out.insert(out.end(), box.cipherText.begin(), box.cipherText.end());
    out.insert(out.end(), box.tag.begin(), box.tag.end());
    return out;
}

std::optional<lockbox::security::SecureBuffer> openPayload(lockbox::crypto::ICryptoProvider& crypto,
                                                           std::span<const std::uint8_t> key,
                                                           std::span<const std::uint8_t> sealed,
                                                           std::span<const std::byte> associatedData)
{
    if (sealed.size() < g_sealOverheadBytes)
    {
        return std::nullopt;
    }

    lockbox::crypto::AeadBox box{};
    const auto nonce{ sealed.first(lockbox::crypto::g_aeadNonceBytes) };
    const auto tag{ sealed.last(lockbox::crypto::g_aeadTagBytes) };
    const auto body{ sealed.subspan(lockbox::crypto::g_aeadNonceBytes, sealed.size() - g_sealOverheadBytes) };
    std::copy(nonce.begin(), nonce.end(), box.nonce.begin());
    std::copy(tag.begin(), tag.end(), box.tag.begin());
    box.cipherText.assign(body.begin(), body.end());

    return crypto.aeadDecrypt(key, box, associatedData);
}

} // namespace lockbox::core
