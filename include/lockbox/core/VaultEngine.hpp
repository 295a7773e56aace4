#ifndef INCLUDE_LOCKBOX_CORE_VAULTENGINE_HPP
#define INCLUDE_LOCKBOX_CORE_VAULTENGINE_HPP

#include "lockbox/core/AuditLog.hpp"
#include "lockbox/core/AuthSessionManager.hpp"
#include "lockbox/core/Clock.hpp"
#include "lockbox/core/CredentialRecord.hpp"
#include "lockbox/core/EngineConfig.hpp"
#include "lockbox/core/ShareTokenService.hpp"
#include "lockbox/core/VaultError.hpp"
#include "lockbox/core/VaultStore.hpp"
#include "lockbox/crypto/ICryptoProvider.hpp"
#include "lockbox/security/SecureMemory.hpp"
#include "lockbox/storage/IAuditRepository.hpp"
#include "lockbox/storage/IVaultRepository.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lockbox::core
{

// Operation surface for one vault file. Sessions and lockout state live in the shared AuthSessionManager;
// everything that touches records requires a live session of this vault.
class VaultEngine final
{
public:
    VaultEngine(lockbox::crypto::ICryptoProvider& crypto, lockbox::storage::IVaultRepository& vaults,
                lockbox::storage::IAuditRepository& auditRepository, AuthSessionManager& sessions,
                EngineConfig config, NowProvider now = Clock::now);

    VaultEngine(const VaultEngine&) = delete;
    VaultEngine& operator=(const VaultEngine&) = delete;
    VaultEngine(VaultEngine&&) = delete;
    VaultEngine& operator=(VaultEngine&&) = delete;
    ~VaultEngine();

    [[nodiscard]] const std::string& identity() const noexcept
    {
        return m_store.identity();
    }

    [[nodiscard]] VaultResult<bool> vaultExists() const noexcept;
    [[nodiscard]] VaultResult<std::monostate> createVault(const lockbox::security::SecureString& passphrase) noexcept;
    [[nodiscard]] VaultResult<std::string> authenticate(const lockbox::security::SecureString& passphrase) noexcept;
    [[nodiscard]] VaultResult<std::monostate> logout(std::string_view session) noexcept;
    [[nodiscard]] bool isAuthenticated(std::string_view session) noexcept;

    [[nodiscard]] VaultResult<std::vector<CredentialRecord>> listCredentials(std::string_view session) noexcept;
    [[nodiscard]] VaultResult<CredentialRecord> getCredential(std::string_view session, std::string_view id) noexcept;
    [[nodiscard]] VaultResult<CredentialRecord> addCredential(std::string_view session,
                                                              CredentialFields fields) noexcept;
    [[nodiscard]] VaultResult<CredentialRecord> updateCredential(std::string_view session, std::string_view id,
                                                                 CredentialUpdate update) noexcept;
    [[nodiscard]] VaultResult<std::monostate> deleteCredential(std::string_view session, std::string_view id) noexcept;
    [[nodiscard]] VaultResult<std::vector<CredentialRecord>>
    search(std::string_view session, std::string_view query, const std::optional<Tags>& anyOfTags = {}) noexcept;

    [[nodiscard]] VaultResult<std::monostate>
    changePassphrase(std::string_view session, const lockbox::security::SecureString& oldPassphrase,
                     const lockbox::security::SecureString& newPassphrase) noexcept;
    [[nodiscard]] VaultResult<std::vector<std::uint8_t>>
    exportVault(std::string_view session, const lockbox::security::SecureString& exportPassphrase) noexcept;
    [[nodiscard]] VaultResult<std::size_t> importVault(std::string_view session, std::span<const std::uint8_t> bundle,
                                                       const lockbox::security::SecureString& exportPassphrase) noexcept;

    // A missing ttl uses EngineConfig::defaultShareTtl.
    [[nodiscard]] VaultResult<IssuedShare>
    issueShare(std::string_view session, std::string_view credentialId, std::optional<Seconds> ttl = {},
               const std::optional<lockbox::security::SecureString>& sharePassphrase = {}) noexcept;
    [[nodiscard]] VaultResult<SharedCredential>
    redeemShare(std::string_view tokenId,
                const std::optional<lockbox::security::SecureString>& sharePassphrase = {}) noexcept;

    // Whole log, oldest first; a limit keeps only the most recent entries.
    [[nodiscard]] VaultResult<std::vector<AuditEntry>>
    readAuditLog(std::string_view session, std::optional<std::size_t> limit = {}) noexcept;
    [[nodiscard]] VaultResult<std::monostate> verifyAuditLog(std::string_view session) noexcept;

    [[nodiscard]] VaultResult<VaultStats> vaultStats(std::string_view session) noexcept;
    [[nodiscard]] VaultResult<VaultSummary> verifyVaultIntegrity() const noexcept;

private:
    AuthSessionManager* m_sessions{ nullptr };
    EngineConfig m_config;
    AuditLog m_audit;
    VaultStore m_store;
    ShareTokenService m_shares;
};

} // namespace lockbox::core

#endif // INCLUDE_LOCKBOX_CORE_VAULTENGINE_HPP
