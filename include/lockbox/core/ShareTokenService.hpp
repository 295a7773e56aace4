#ifndef INCLUDE_LOCKBOX_CORE_SHARETOKENSERVICE_HPP
#define INCLUDE_LOCKBOX_CORE_SHARETOKENSERVICE_HPP

#include "lockbox/core/AuditLog.hpp"
#include "lockbox/core/Clock.hpp"
#include "lockbox/core/CredentialRecord.hpp"
#include "lockbox/core/EngineConfig.hpp"
#include "lockbox/core/VaultError.hpp"
#include "lockbox/core/VaultStore.hpp"
#include "lockbox/crypto/ICryptoProvider.hpp"
#include "lockbox/crypto/KdfParams.hpp"
#include "lockbox/security/SecureMemory.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lockbox::core
{

constexpr std::size_t g_shareTokenBytes{ 32U };
constexpr Seconds g_shareTombstoneRetention{ 3600 };

struct IssuedShare final
{
    std::string tokenId;
    std::int64_t expiresAt{};
};

// Single-use, time-limited grants to one record. Snapshots are sealed under a key derived from the
// token id and the table is indexed by digest(token_id), so the table alone cannot reveal a snapshot.
class ShareTokenService final
{
public:
    ShareTokenService(lockbox::crypto::ICryptoProvider& crypto, AuditLog& audit, EngineConfig config,
                      NowProvider now = Clock::now);

    ShareTokenService(const ShareTokenService&) = delete;
    ShareTokenService& operator=(const ShareTokenService&) = delete;
    ShareTokenService(ShareTokenService&&) = delete;
    ShareTokenService& operator=(ShareTokenService&&) = delete;
    ~ShareTokenService() = default;

    [[nodiscard]] VaultResult<IssuedShare>
    issue(const UnlockedVault& vault, std::string_view credentialId, Seconds ttl,
          const std::optional<lockbox::security::SecureString>& sharePassphrase) noexcept;

    // Needs no unlocked vault. A wrong passphrase leaves the token redeemable.
    [[nodiscard]] VaultResult<SharedCredential>
    redeem(std::string_view tokenId, const std::optional<lockbox::security::SecureString>& sharePassphrase) noexcept;

    // Live and tombstoned entries currently held.
    [[nodiscard]] std::size_t trackedCount() const noexcept;

private:
    struct PassphraseHash final
    {
        std::array<std::uint8_t, lockbox::crypto::g_saltBytes> salt{};
        lockbox::security::SecureBuffer hash;
    };

    struct ShareEntry final
    {
        std::string credentialId;
        std::int64_t issuedAt{};
        std::int64_t expiresAt{};
        std::optional<PassphraseHash> passphraseHash;
        std::array<std::uint8_t, lockbox::crypto::g_saltBytes> snapshotSalt{};
        // Empty once redeemed or expired.
        std::vector<std::uint8_t> sealedSnapshot;
        bool redeemed{ false };
    };

    void purgeLocked(std::int64_t now) noexcept;
    [[nodiscard]] std::string tableKey(std::string_view tokenId) const;
    [[nodiscard]] lockbox::security::SecureBuffer stretch(std::span<const std::byte> secret,
                                                          const std::array<std::uint8_t, lockbox::crypto::g_saltBytes>&
                                                              salt) const;
    [[nodiscard]] VaultResult<SharedCredential> reject(VaultError error, std::string_view subject) noexcept;

    lockbox::crypto::ICryptoProvider* m_crypto{ nullptr };
    AuditLog* m_audit{ nullptr };
    EngineConfig m_config;
    NowProvider m_now;
    mutable std::mutex m_mutex;
    std::map<std::string, ShareEntry, std::less<>> m_entries;
};

} // namespace lockbox::core

#endif // INCLUDE_LOCKBOX_CORE_SHARETOKENSERVICE_HPP
