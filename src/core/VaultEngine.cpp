#include "lockbox/core/VaultEngine.hpp"
#include "lockbox/core/Logging.hpp"
#include "lockbox/core/Session.hpp"
#include <stdexcept>
#include <utility>

namespace lockbox::core
{

VaultEngine::VaultEngine(lockbox::crypto::ICryptoProvider& crypto, lockbox::storage::IVaultRepository& vaults,
                         lockbox::storage::IAuditRepository& auditRepository, AuthSessionManager& sessions,
                         EngineConfig config, NowProvider now)
    : m_sessions{ &sessions }, m_config{ config }, m_audit{ crypto, auditRepository, now },
      m_store{ crypto, vaults, m_audit, config, now }, m_shares{ crypto, m_audit, config, std::move(now) }
{
}

VaultEngine::~VaultEngine()
{
    m_sessions->endSessionsFor(m_store.identity());
}

VaultResult<bool> VaultEngine::vaultExists() const noexcept
{
    return m_store.exists();
}

VaultResult<std::monostate> VaultEngine::createVault(const lockbox::security::SecureString& passphrase) noexcept
{
    return m_store.create(passphrase);
}

VaultResult<std::string> VaultEngine::authenticate(const lockbox::security::SecureString& passphrase) noexcept
{
    return m_sessions->authenticate(m_store, passphrase);
}

VaultResult<std::monostate> VaultEngine::logout(std::string_view session) noexcept
{
    if (!isAuthenticated(session))
    {
        return VaultError::SessionExpired;
    }
    return m_sessions->logout(session);
}

bool VaultEngine::isAuthenticated(std::string_view session) noexcept
{
    const auto r{ m_sessions->withSession(m_store.identity(), session,
                                          [](Session&) -> VaultResult<std::monostate> { return std::monostate{}; }) };
    return !isError(r);
}

VaultResult<std::vector<CredentialRecord>> VaultEngine::listCredentials(std::string_view session) noexcept
{
    return m_sessions->withSession(m_store.identity(), session,
                                   [this](Session& s) { return m_store.list(s.vault()); });
}

VaultResult<CredentialRecord> VaultEngine::getCredential(std::string_view session, std::string_view id) noexcept
{
    return m_sessions->withSession(m_store.identity(), session,
                                   [this, id](Session& s) { return m_store.get(s.vault(), id); });
}

VaultResult<CredentialRecord> VaultEngine::addCredential(std::string_view session, CredentialFields fields) noexcept
{
    return m_sessions->withSession(m_store.identity(), session, [this, &fields](Session& s) {
        return m_store.add(s.vault(), std::move(fields));
    });
}

VaultResult<CredentialRecord> VaultEngine::updateCredential(std::string_view session, std::string_view id,
                                                            CredentialUpdate update) noexcept
{
    return m_sessions->withSession(m_store.identity(), session, [this, id, &update](Session& s) {
        return m_store.update(s.vault(), id, std::move(update));
    });
}

VaultResult<std::monostate> VaultEngine::deleteCredential(std::string_view session, std::string_view id) noexcept
{
    return m_sessions->withSession(m_store.identity(), session,
                                   [this, id](Session& s) { return m_store.remove(s.vault(), id); });
}

VaultResult<std::vector<CredentialRecord>> VaultEngine::search(std::string_view session, std::string_view query,
                                                               const std::optional<Tags>& anyOfTags) noexcept
{
    return m_sessions->withSession(m_store.identity(), session, [this, query, &anyOfTags](Session& s) {
        return m_store.search(s.vault(), query, anyOfTags);
    });
}

VaultResult<std::monostate> VaultEngine::changePassphrase(std::string_view session,
                                                          const lockbox::security::SecureString& oldPassphrase,
                                                          const lockbox::security::SecureString& newPassphrase) noexcept
{
    return m_sessions->withSession(m_store.identity(), session, [&](Session& s) {
        return m_store.changePassphrase(s.vault(), oldPassphrase, newPassphrase);
    });
}

VaultResult<std::vector<std::uint8_t>>
VaultEngine::exportVault(std::string_view session, const lockbox::security::SecureString& exportPassphrase) noexcept
{
    return m_sessions->withSession(m_store.identity(), session,
                                   [&](Session& s) { return m_store.exportVault(s.vault(), exportPassphrase); });
}

VaultResult<std::size_t> VaultEngine::importVault(std::string_view session, std::span<const std::uint8_t> bundle,
                                                  const lockbox::security::SecureString& exportPassphrase) noexcept
{
    return m_sessions->withSession(m_store.identity(), session, [&](Session& s) {
        return m_store.importVault(s.vault(), bundle, exportPassphrase);
    });
}

VaultResult<IssuedShare> VaultEngine::issueShare(std::string_view session, std::string_view credentialId,
                                                 std::optional<Seconds> ttl,
                                                 const std::optional<lockbox::security::SecureString>& sharePassphrase) noexcept
{
    const Seconds effectiveTtl{ ttl.value_or(m_config.defaultShareTtl) };
    return m_sessions->withSession(m_store.identity(), session, [&](Session& s) {
        return m_shares.issue(s.vault(), credentialId, effectiveTtl, sharePassphrase);
    });
}

VaultResult<SharedCredential>
VaultEngine::redeemShare(std::string_view tokenId,
                         const std::optional<lockbox::security::SecureString>& sharePassphrase) noexcept
{
    return m_shares.redeem(tokenId, sharePassphrase);
}

VaultResult<std::vector<AuditEntry>> VaultEngine::readAuditLog(std::string_view session,
                                                              std::optional<std::size_t> limit) noexcept
{
    if (limit && *limit == 0U)
    {
        return VaultError::InvalidArgument;
    }
    return m_sessions->withSession(m_store.identity(), session,
                                   [this, limit](Session&) { return m_audit.read(limit); });
}

VaultResult<std::monostate> VaultEngine::verifyAuditLog(std::string_view session) noexcept
{
    return m_sessions->withSession(m_store.identity(), session, [this](Session&) {
        auto verdict{ m_audit.verifyChain() };
        if (isError(verdict))
        {
            log(LogLevel::Error, "audit_chain_rejected", errorName(std::get<VaultError>(verdict)));
        }
        return verdict;
    });
}

VaultResult<VaultStats> VaultEngine::vaultStats(std::string_view session) noexcept
{
    return m_sessions->withSession(m_store.identity(), session,
                                   [this](Session& s) { return m_store.stats(s.vault(), s.lastActivity()); });
}

VaultResult<VaultSummary> VaultEngine::verifyVaultIntegrity() const noexcept
{
    return m_store.verifyIntegrity();
}

} // namespace lockbox::core
