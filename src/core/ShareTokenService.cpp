#include "lockbox/core/ShareTokenService.hpp"
#include "lockbox/core/CipherCodec.hpp"
#include "lockbox/core/Logging.hpp"
#include "lockbox/core/RecordCodec.hpp"
#include "lockbox/security/SecureRandom.hpp"
#include <exception>
#include <limits>
#include <stdexcept>
#include <utility>

namespace lockbox::core
{
namespace
{

constexpr std::string_view g_snapshotDomain{ "lockbox.share-snapshot.v1" };

[[nodiscard]] std::span<const std::byte> textBytes(std::string_view s) noexcept
{
    return std::as_bytes(std::span<const char>{ s.data(), s.size() });
}

} // namespace

ShareTokenService::ShareTokenService(lockbox::crypto::ICryptoProvider& crypto, AuditLog& audit, EngineConfig config,
                                     NowProvider now)
    : m_crypto{ &crypto }, m_audit{ &audit }, m_config{ config }, m_now{ std::move(now) }
{
    if (!m_config.isValid())
    {
        throw std::invalid_argument("ShareTokenService: invalid engine configuration");
    }
}

std::string ShareTokenService::tableKey(std::string_view tokenId) const
{
    const auto digest{ m_crypto->digest(textBytes(tokenId)) };
    return lockbox::security::toHex(digest);
}

lockbox::security::SecureBuffer
ShareTokenService::stretch(std::span<const std::byte> secret,
                           const std::array<std::uint8_t, lockbox::crypto::g_saltBytes>& salt) const
{
    return m_crypto->deriveKey(secret, lockbox::crypto::KdfParams{ .iterations = m_config.shareKdfIterations,
                                                                   .salt = salt });
}

void ShareTokenService::purgeLocked(std::int64_t now) noexcept
{
    const auto retention{ g_shareTombstoneRetention.count() };
    for (auto it{ m_entries.begin() }; it != m_entries.end();)
    {
        ShareEntry& entry{ it->second };
        if (now - entry.expiresAt >= retention)
        {
            it = m_entries.erase(it);
            continue;
        }
        if (now >= entry.expiresAt && !entry.sealedSnapshot.empty())
        {
            lockbox::security::secureWipe(std::span<std::uint8_t>{ entry.sealedSnapshot });
            entry.sealedSnapshot.clear();
            entry.passphraseHash.reset();
        }
        ++it;
    }
}

VaultResult<IssuedShare>
ShareTokenService::issue(const UnlockedVault& vault, std::string_view credentialId, Seconds ttl,
                         const std::optional<lockbox::security::SecureString>& sharePassphrase) noexcept
{
    if (ttl.count() <= 0 || (sharePassphrase && sharePassphrase->empty()))
    {
        return VaultError::InvalidArgument;
    }

    const std::scoped_lock lock{ m_mutex };
    try
    {
        const std::int64_t now{ toUnixSeconds(m_now()) };
        purgeLocked(now);

        const CredentialRecord* record{ vault.find(credentialId) };
        if (record == nullptr)
        {
            return VaultError::NotFound;
        }
        // expiresAt plus the tombstone retention must stay representable.
        if (ttl.count() > std::numeric_limits<std::int64_t>::max() - g_shareTombstoneRetention.count() - now)
        {
            return VaultError::InvalidArgument;
        }

        auto tokenId{ lockbox::security::secureRandomHex(g_shareTokenBytes) };
        if (!tokenId)
        {
            return VaultError::RandomFailed;
        }

        ShareEntry entry{};
        entry.credentialId = record->id;
        entry.issuedAt = now;
        entry.expiresAt = now + ttl.count();
        if (!m_crypto->randomBytes(entry.snapshotSalt))
        {
            return VaultError::RandomFailed;
        }

        const auto snapshotKey{ stretch(textBytes(*tokenId), entry.snapshotSalt) };
        const auto plain{ encodeSnapshot(snapshotOf(*record)) };
        entry.sealedSnapshot = sealPayload(*m_crypto, lockbox::security::asSpan(snapshotKey),
                                           std::as_bytes(lockbox::security::asSpan(plain)), textBytes(g_snapshotDomain));

        if (sharePassphrase)
        {
            PassphraseHash hashed{};
            if (!m_crypto->randomBytes(hashed.salt))
            {
                return VaultError::RandomFailed;
            }
            hashed.hash = stretch(std::as_bytes(std::span<const char>{ *sharePassphrase }), hashed.salt);
            entry.passphraseHash = std::move(hashed);
        }

        if (const auto audited{ m_audit->append(AuditEventKind::ShareIssued, entry.credentialId) }; isError(audited))
        {
            return std::get<VaultError>(audited);
        }

        IssuedShare out{ .tokenId = *tokenId, .expiresAt = entry.expiresAt };
        m_entries.insert_or_assign(tableKey(*tokenId), std::move(entry));
        log(LogLevel::Info, "share_issued", out.tokenId.substr(0, 8));
        return out;
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "share_issue_failed", e.what());
        return VaultError::CryptoError;
    }
}

VaultResult<SharedCredential> ShareTokenService::reject(VaultError error, std::string_view subject) noexcept
{
    if (const auto audited{ m_audit->append(AuditEventKind::ShareRejected, subject) }; isError(audited))
    {
        return std::get<VaultError>(audited);
    }
    return error;
}

VaultResult<SharedCredential>
ShareTokenService::redeem(std::string_view tokenId,
                          const std::optional<lockbox::security::SecureString>& sharePassphrase) noexcept
{
    const std::scoped_lock lock{ m_mutex };
    try
    {
        const std::int64_t now{ toUnixSeconds(m_now()) };
        purgeLocked(now);

        const auto it{ m_entries.find(tableKey(tokenId)) };
        if (it == m_entries.end())
        {
            return reject(VaultError::NotFound, {});
        }
        ShareEntry& entry{ it->second };
        if (entry.redeemed || now >= entry.expiresAt)
        {
            return reject(VaultError::TokenExpired, entry.credentialId);
        }

        if (entry.passphraseHash)
        {
            if (!sharePassphrase || sharePassphrase->empty())
            {
                return reject(VaultError::AuthenticationFailed, entry.credentialId);
            }
            const auto candidate{ stretch(std::as_bytes(std::span<const char>{ *sharePassphrase }),
                                          entry.passphraseHash->salt) };
            if (!lockbox::security::secureEquals(lockbox::security::asSpan(candidate),
                                                 lockbox::security::asSpan(entry.passphraseHash->hash)))
            {
                log(LogLevel::Warning, "share_passphrase_mismatch", entry.credentialId);
                return reject(VaultError::AuthenticationFailed, entry.credentialId);
            }
        }

        const auto snapshotKey{ stretch(textBytes(tokenId), entry.snapshotSalt) };
        const auto plain{ openPayload(*m_crypto, lockbox::security::asSpan(snapshotKey), entry.sealedSnapshot,
                                      textBytes(g_snapshotDomain)) };
        if (!plain)
        {
            log(LogLevel::Error, "share_snapshot_integrity_failed", entry.credentialId);
            return reject(VaultError::IntegrityFailure, entry.credentialId);
        }
        auto snapshot{ decodeSnapshot(lockbox::security::asSpan(*plain)) };
        if (!snapshot)
        {
            log(LogLevel::Error, "share_snapshot_integrity_failed", entry.credentialId);
            return reject(VaultError::IntegrityFailure, entry.credentialId);
        }

        if (const auto audited{ m_audit->append(AuditEventKind::ShareRedeemed, entry.credentialId) };
            isError(audited))
        {
            return std::get<VaultError>(audited);
        }

        entry.redeemed = true;
        lockbox::security::secureWipe(std::span<std::uint8_t>{ entry.sealedSnapshot });
        entry.sealedSnapshot.clear();
        entry.passphraseHash.reset();
        return std::move(*snapshot);
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "share_redeem_failed", e.what());
        return VaultError::CryptoError;
    }
}

std::size_t ShareTokenService::trackedCount() const noexcept
{
    const std::scoped_lock lock{ m_mutex };
    return m_entries.size();
}

} // namespace lockbox::core
