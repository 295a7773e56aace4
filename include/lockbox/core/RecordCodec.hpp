#ifndef INCLUDE_LOCKBOX_CORE_RECORDCODEC_HPP
#define INCLUDE_LOCKBOX_CORE_RECORDCODEC_HPP

#include "lockbox/core/CredentialRecord.hpp"
#include "lockbox/security/SecureMemory.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace lockbox::core
{

constexpr std::uint32_t g_contentsVersion{ 1U };
constexpr std::uint32_t g_snapshotVersion{ 1U };

// Decrypted payload of a vault file or export bundle.
struct VaultContents final
{
    std::int64_t createdAt{};
    std::vector<CredentialRecord> records;
};

// The encoding holds secrets in the clear and is only ever fed to the AEAD.
[[nodiscard]] lockbox::security::SecureBuffer encodeContents(const VaultContents& contents);

// Rejects unknown versions, truncation, trailing bytes, malformed ids and duplicate ids.
[[nodiscard]] std::optional<VaultContents> decodeContents(std::span<const std::uint8_t> bytes);

[[nodiscard]] lockbox::security::SecureBuffer encodeSnapshot(const SharedCredential& snapshot);
[[nodiscard]] std::optional<SharedCredential> decodeSnapshot(std::span<const std::uint8_t> bytes);

} // namespace lockbox::core

#endif // INCLUDE_LOCKBOX_CORE_RECORDCODEC_HPP
