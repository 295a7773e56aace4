#ifndef INCLUDE_LOCKBOX_CORE_VAULTFORMAT_HPP
#define INCLUDE_LOCKBOX_CORE_VAULTFORMAT_HPP

#include "lockbox/crypto/ICryptoProvider.hpp"
#include "lockbox/crypto/KdfParams.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace lockbox::core
{

constexpr std::uint32_t g_vaultFormatVersion{ 1U };

// [u32 format_version][16 salt][u32 kdf_iterations]
constexpr std::size_t g_vaultHeaderBytes{ 4U + lockbox::crypto::g_saltBytes + 4U };

// [header][12 nonce][ciphertext][16 tag]
constexpr std::size_t g_minContainerBytes{ g_vaultHeaderBytes + lockbox::crypto::g_aeadNonceBytes +
                                           lockbox::crypto::g_aeadTagBytes };

// Vault files and export bundles share the layout but authenticate under different domain tags,
// so one can never be substituted for the other.
enum class ContainerKind : std::uint8_t
{
    VaultFile,
    ExportBundle,
};

struct VaultHeader final
{
    std::uint32_t formatVersion{ g_vaultFormatVersion };
    lockbox::crypto::KdfParams kdf{};
};

struct SealedContainer final
{
    VaultHeader header{};
    // nonce || ciphertext || tag
    std::vector<std::uint8_t> sealedPayload;
};

[[nodiscard]] std::array<std::uint8_t, g_vaultHeaderBytes> encodeVaultHeader(const VaultHeader& header) noexcept;

// Structural decode only: no version or range policy.
[[nodiscard]] std::optional<VaultHeader> decodeVaultHeader(std::span<const std::uint8_t> bytes) noexcept;

// Domain tag followed by the encoded header; bound to the payload as AEAD associated data.
[[nodiscard]] std::vector<std::byte> containerAad(ContainerKind kind, const VaultHeader& header);

[[nodiscard]] std::vector<std::uint8_t> encodeContainer(const VaultHeader& header,
                                                        std::span<const std::uint8_t> sealedPayload);

// Accepts only the supported version, an iteration count within bounds and a payload long enough
// to hold nonce and tag.
[[nodiscard]] std::optional<SealedContainer> decodeContainer(std::span<const std::uint8_t> bytes);

} // namespace lockbox::core

#endif // INCLUDE_LOCKBOX_CORE_VAULTFORMAT_HPP
