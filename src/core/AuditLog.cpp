#include "lockbox/core/AuditLog.hpp"
#include "LittleEndian.hpp"
#include "lockbox/core/Logging.hpp"
#include "lockbox/security/SecureMemory.hpp"
#include <exception>
#include <string>
#include <utility>

namespace lockbox::core
{
namespace
{

[[nodiscard]] AuditEntry toEntry(const lockbox::storage::AuditRecord& rec)
{
    return AuditEntry{ .sequenceNumber = rec.sequence,
                       .timestamp = rec.timestamp,
                       .kind = static_cast<AuditEventKind>(rec.kind),
                       .subjectId = rec.subject,
                       .priorEntryHash = rec.priorHash,
                       .entryHash = rec.entryHash };
}

} // namespace

std::string_view eventKindName(AuditEventKind kind) noexcept
{
    switch (kind)
    {
    case AuditEventKind::VaultCreated:
        return "vault_created";
    case AuditEventKind::AuthSucceeded:
        return "auth_succeeded";
    case AuditEventKind::AuthFailed:
        return "auth_failed";
    case AuditEventKind::AuthLockedOut:
        return "auth_locked_out";
    case AuditEventKind::LoggedOut:
        return "logged_out";
    case AuditEventKind::CredentialAdded:
        return "credential_added";
    case AuditEventKind::CredentialUpdated:
        return "credential_updated";
    case AuditEventKind::CredentialDeleted:
        return "credential_deleted";
    case AuditEventKind::CredentialRead:
        return "credential_read";
    case AuditEventKind::CredentialsListed:
        return "credentials_listed";
    case AuditEventKind::CredentialsSearched:
        return "credentials_searched";
    case AuditEventKind::PassphraseChanged:
        return "passphrase_changed";
    case AuditEventKind::VaultExported:
        return "vault_exported";
    case AuditEventKind::VaultImported:
        return "vault_imported";
    case AuditEventKind::ShareIssued:
        return "share_issued";
    case AuditEventKind::ShareRedeemed:
        return "share_redeemed";
    case AuditEventKind::ShareRejected:
        return "share_rejected";
    }
    return "unknown";
}

AuditLog::AuditLog(lockbox::crypto::ICryptoProvider& crypto, lockbox::storage::IAuditRepository& repository,
                   NowProvider now) noexcept
    : m_crypto{ &crypto }, m_repository{ &repository }, m_now{ std::move(now) }
{
}

lockbox::crypto::Digest AuditLog::computeEntryHash(const lockbox::crypto::ICryptoProvider& crypto,
                                                   const lockbox::crypto::Digest& prior, std::uint64_t sequence,
                                                   std::int64_t timestamp, std::uint32_t kind,
                                                   std::string_view subjectId)
{
    std::vector<std::uint8_t> message;
    message.reserve(prior.size() + 24U + subjectId.size());
    detail::ByteWriter w{ message };
    w.bytes(prior);
    w.u64(sequence);
    w.u64(static_cast<std::uint64_t>(timestamp));
    w.u32(kind);
    w.text(subjectId);
    return crypto.digest(std::as_bytes(std::span<const std::uint8_t>{ message }));
}

VaultResult<AuditEntry> AuditLog::append(AuditEventKind kind, std::string_view subjectId) noexcept
{
    const std::scoped_lock lock{ m_mutex };
    try
    {
        const auto head{ m_repository->last() };

        lockbox::storage::AuditRecord rec{};
        rec.sequence = head ? head->sequence + 1U : 1U;
        rec.timestamp = toUnixSeconds(m_now());
        rec.kind = static_cast<std::uint32_t>(kind);
        rec.subject.assign(subjectId);
        if (head)
        {
            rec.priorHash = head->entryHash;
        }
        rec.entryHash = computeEntryHash(*m_crypto, rec.priorHash, rec.sequence, rec.timestamp, rec.kind, rec.subject);

        m_repository->append(rec);
        return toEntry(rec);
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "audit_append_failed", e.what());
        return VaultError::StorageError;
    }
}

VaultResult<std::monostate> AuditLog::verifyChain() const noexcept
{
    const std::scoped_lock lock{ m_mutex };
    std::vector<lockbox::storage::AuditRecord> rows;
    try
    {
        rows = m_repository->readAll();
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "audit_read_failed", e.what());
        return VaultError::StorageError;
    }

    lockbox::crypto::Digest expectedPrior{};
    std::uint64_t expectedSeq{ 1U };
    for (const auto& rec : rows)
    {
        bool intact{ rec.sequence == expectedSeq &&
                     lockbox::security::secureEquals(rec.priorHash, expectedPrior) };
        if (intact)
        {
            try
            {
                const auto recomputed{ computeEntryHash(*m_crypto, rec.priorHash, rec.sequence, rec.timestamp,
                                                        rec.kind, rec.subject) };
                intact = lockbox::security::secureEquals(recomputed, rec.entryHash);
            }
            catch (const std::exception& e)
            {
                log(LogLevel::Error, "audit_hash_failed", e.what());
                return VaultError::CryptoError;
            }
        }
        if (!intact)
        {
            log(LogLevel::Error, "audit_tamper_detected", "sequence=" + std::to_string(rec.sequence));
            return VaultError::TamperDetected;
        }
        expectedPrior = rec.entryHash;
        ++expectedSeq;
    }
    return std::monostate{};
}

VaultResult<std::vector<AuditEntry>> AuditLog::read(std::optional<std::size_t> limit) const noexcept
{
    const std::scoped_lock lock{ m_mutex };
    try
    {
        const auto rows{ limit ? m_repository->readLatest(*limit) : m_repository->readAll() };
        std::vector<AuditEntry> out;
        out.reserve(rows.size());
        for (const auto& rec : rows)
        {
            out.push_back(toEntry(rec));
        }
        return out;
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "audit_read_failed", e.what());
        return VaultError::StorageError;
    }
}

} // namespace lockbox::core
