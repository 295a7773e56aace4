#ifndef INCLUDE_LOCKBOX_CORE_VAULTSTORE_HPP
#define INCLUDE_LOCKBOX_CORE_VAULTSTORE_HPP

#include "lockbox/core/AuditLog.hpp"
#include "lockbox/core/Clock.hpp"
#include "lockbox/core/CredentialRecord.hpp"
#include "lockbox/core/EngineConfig.hpp"
#include "lockbox/core/RecordCodec.hpp"
#include "lockbox/core/VaultError.hpp"
#include "lockbox/core/VaultFormat.hpp"
#include "lockbox/crypto/ICryptoProvider.hpp"
#include "lockbox/security/SecureMemory.hpp"
#include "lockbox/storage/IVaultRepository.hpp"
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lockbox::core
{

struct VaultStats final
{
    std::size_t recordCount{};
    std::int64_t createdAt{};
    std::int64_t lastActivityAt{};
    std::uintmax_t fileBytes{};
    std::uint32_t formatVersion{};
    std::uint32_t kdfIterations{};
};

// Structural facts established without the passphrase.
struct VaultSummary final
{
    std::uint32_t formatVersion{};
    std::uint32_t kdfIterations{};
    std::uintmax_t fileBytes{};
};

// Decrypted vault: header, key and record collection. Key material is wiped on destruction.
class UnlockedVault final
{
public:
    UnlockedVault() = default;
    UnlockedVault(VaultHeader header, lockbox::security::SecureBuffer key, std::int64_t createdAt,
                  std::vector<CredentialRecord> records, std::uintmax_t fileBytes) noexcept;

    UnlockedVault(const UnlockedVault&) = delete;
    UnlockedVault& operator=(const UnlockedVault&) = delete;
    UnlockedVault(UnlockedVault&& other) noexcept;
    UnlockedVault& operator=(UnlockedVault&& other) noexcept;
    ~UnlockedVault() noexcept;

    [[nodiscard]] const VaultHeader& header() const noexcept
    {
        return m_header;
    }
    [[nodiscard]] std::span<const std::uint8_t> key() const noexcept
    {
        return lockbox::security::asSpan(m_key);
    }
    [[nodiscard]] std::int64_t createdAt() const noexcept
    {
        return m_createdAt;
    }
    [[nodiscard]] const std::vector<CredentialRecord>& records() const noexcept
    {
        return m_records;
    }
    [[nodiscard]] std::uintmax_t fileBytes() const noexcept
    {
        return m_fileBytes;
    }
    [[nodiscard]] bool isOpen() const noexcept
    {
        return !m_key.empty();
    }

    [[nodiscard]] const CredentialRecord* find(std::string_view id) const noexcept;

private:
    friend class VaultStore;

    void wipe() noexcept;

    VaultHeader m_header{};
    lockbox::security::SecureBuffer m_key;
    std::int64_t m_createdAt{};
    std::vector<CredentialRecord> m_records;
    std::uintmax_t m_fileBytes{};
};

// Durable encrypted container for one vault file. Every mutation is applied to a copy of the
// collection, sealed and atomically written; the live collection changes only after the write succeeds.
class VaultStore final
{
public:
    VaultStore(lockbox::crypto::ICryptoProvider& crypto, lockbox::storage::IVaultRepository& repository,
               AuditLog& audit, EngineConfig config, NowProvider now = Clock::now);

    VaultStore(const VaultStore&) = delete;
    VaultStore& operator=(const VaultStore&) = delete;
    VaultStore(VaultStore&&) = delete;
    VaultStore& operator=(VaultStore&&) = delete;
    ~VaultStore() = default;

    // Weakly-canonical absolute path of the vault file; keys lockout state.
    [[nodiscard]] const std::string& identity() const noexcept
    {
        return m_identity;
    }
    [[nodiscard]] AuditLog& audit() noexcept
    {
        return *m_audit;
    }

    [[nodiscard]] VaultResult<bool> exists() const noexcept;

    [[nodiscard]] VaultResult<std::monostate> create(const lockbox::security::SecureString& passphrase) noexcept;

    // Header, range and decryption failures all report AuthenticationFailed.
    [[nodiscard]] VaultResult<UnlockedVault> open(const lockbox::security::SecureString& passphrase) noexcept;

    [[nodiscard]] VaultResult<VaultSummary> verifyIntegrity() const noexcept;

    [[nodiscard]] VaultResult<CredentialRecord> add(UnlockedVault& vault, CredentialFields fields) noexcept;
    [[nodiscard]] VaultResult<CredentialRecord> update(UnlockedVault& vault, std::string_view id,
                                                       CredentialUpdate update) noexcept;
    [[nodiscard]] VaultResult<std::monostate> remove(UnlockedVault& vault, std::string_view id) noexcept;

    [[nodiscard]] VaultResult<CredentialRecord> get(const UnlockedVault& vault, std::string_view id) noexcept;
    [[nodiscard]] VaultResult<std::vector<CredentialRecord>> list(const UnlockedVault& vault) noexcept;
    [[nodiscard]] VaultResult<std::vector<CredentialRecord>> search(const UnlockedVault& vault, std::string_view query,
                                                                    const std::optional<Tags>& anyOfTags) noexcept;

    [[nodiscard]] VaultResult<std::monostate>
    changePassphrase(UnlockedVault& vault, const lockbox::security::SecureString& oldPassphrase,
                     const lockbox::security::SecureString& newPassphrase) noexcept;

    [[nodiscard]] VaultResult<std::vector<std::uint8_t>>
    exportVault(const UnlockedVault& vault, const lockbox::security::SecureString& exportPassphrase) noexcept;

    // Returns the number of imported records. Ids already present are replaced.
    [[nodiscard]] VaultResult<std::size_t> importVault(UnlockedVault& vault, std::span<const std::uint8_t> bundle,
                                                       const lockbox::security::SecureString& exportPassphrase) noexcept;

    [[nodiscard]] VaultResult<VaultStats> stats(const UnlockedVault& vault, TimePoint lastActivity) const noexcept;

private:
    [[nodiscard]] VaultResult<VaultHeader> freshHeader(std::uint32_t iterations) noexcept;
    [[nodiscard]] VaultResult<lockbox::security::SecureBuffer>
    deriveKey(const lockbox::security::SecureString& passphrase, const VaultHeader& header) const noexcept;
    [[nodiscard]] VaultResult<std::vector<std::uint8_t>> seal(ContainerKind kind, const VaultHeader& header,
                                                              std::span<const std::uint8_t> key,
                                                              const VaultContents& contents) noexcept;
    [[nodiscard]] VaultResult<std::monostate> persist(std::span<const std::uint8_t> bytes) noexcept;

    // Seals `records` under the vault's key, writes them, then swaps them into `vault`.
    [[nodiscard]] VaultResult<std::monostate> commit(UnlockedVault& vault,
                                                     std::vector<CredentialRecord> records) noexcept;

    [[nodiscard]] VaultResult<std::monostate> record(AuditEventKind kind, std::string_view subject) noexcept;

    lockbox::crypto::ICryptoProvider* m_crypto{ nullptr };
    lockbox::storage::IVaultRepository* m_repository{ nullptr };
    AuditLog* m_audit{ nullptr };
    EngineConfig m_config;
    NowProvider m_now;
    std::string m_identity;
    mutable std::mutex m_mutex;
};

} // namespace lockbox::core

#endif // INCLUDE_LOCKBOX_CORE_VAULTSTORE_HPP
