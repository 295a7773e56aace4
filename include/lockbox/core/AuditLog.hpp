#ifndef INCLUDE_LOCKBOX_CORE_AUDITLOG_HPP
#define INCLUDE_LOCKBOX_CORE_AUDITLOG_HPP

#include "lockbox/core/Clock.hpp"
#include "lockbox/core/VaultError.hpp"
#include "lockbox/crypto/ICryptoProvider.hpp"
#include "lockbox/storage/IAuditRepository.hpp"
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lockbox::core
{

// Stored as u32; values are part of the hash input and must never be renumbered.
enum class AuditEventKind : std::uint32_t
{
    VaultCreated = 1U,
    AuthSucceeded = 2U,
    AuthFailed = 3U,
    AuthLockedOut = 4U,
    LoggedOut = 5U,
    CredentialAdded = 6U,
    CredentialUpdated = 7U,
    CredentialDeleted = 8U,
    CredentialRead = 9U,
    CredentialsListed = 10U,
    CredentialsSearched = 11U,
    PassphraseChanged = 12U,
    VaultExported = 13U,
    VaultImported = 14U,
    ShareIssued = 15U,
    ShareRedeemed = 16U,
    ShareRejected = 17U,
};

[[nodiscard]] std::string_view eventKindName(AuditEventKind kind) noexcept;

struct AuditEntry final
{
    std::uint64_t sequenceNumber{};
    std::int64_t timestamp{};
    AuditEventKind kind{};
    std::string subjectId;
    lockbox::crypto::Digest priorEntryHash{};
    lockbox::crypto::Digest entryHash{};
};

// Hash-chained event log. entry_hash = BLAKE2b-512(prior || u64 seq || u64 ts || u32 kind || u32 len || subject),
// with 64 zero bytes as the genesis prior.
class AuditLog final
{
public:
    AuditLog(lockbox::crypto::ICryptoProvider& crypto, lockbox::storage::IAuditRepository& repository,
             NowProvider now = Clock::now) noexcept;

    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;
    AuditLog(AuditLog&&) = delete;
    AuditLog& operator=(AuditLog&&) = delete;
    ~AuditLog() = default;

    [[nodiscard]] VaultResult<AuditEntry> append(AuditEventKind kind, std::string_view subjectId) noexcept;

    // TamperDetected on any gap, broken link or hash mismatch; StorageError when the log cannot be read.
    [[nodiscard]] VaultResult<std::monostate> verifyChain() const noexcept;

    // Oldest first. Without a limit the whole log is returned; with one, the most recent `limit` entries.
    [[nodiscard]] VaultResult<std::vector<AuditEntry>> read(std::optional<std::size_t> limit = {}) const noexcept;

    [[nodiscard]] static lockbox::crypto::Digest computeEntryHash(const lockbox::crypto::ICryptoProvider& crypto,
                                                                  const lockbox::crypto::Digest& prior,
                                                                  std::uint64_t sequence, std::int64_t timestamp,
                                                                  std::uint32_t kind, std::string_view subjectId);

private:
    lockbox::crypto::ICryptoProvider* m_crypto{ nullptr };
    lockbox::storage::IAuditRepository* m_repository{ nullptr };
    NowProvider m_now;
    mutable std::mutex m_mutex;
};

} // namespace lockbox::core

#endif // INCLUDE_LOCKBOX_CORE_AUDITLOG_HPP
