#include "lockbox/core/AuthSessionManager.hpp"
#include "lockbox/core/VaultEngine.hpp"
#include "lockbox/security/SecureMemory.hpp"
#include "lockbox/storage/file/FileVaultRepositoryFactory.hpp"
#include "lockbox/storage/sqlite/SqliteAuditRepositoryFactory.hpp"
#include "test_utils/TestUtils.hpp"
#include <algorithm>
#include <string>
#include <vector>
#include <gtest/gtest.h>

using lockbox::core::Seconds;
using lockbox::core::VaultError;
using lockbox::security::asStringView;
using lockbox::security::secureStringFrom;

namespace
{

template <class T> VaultError errorOf(const lockbox::core::VaultResult<T>& r)
{
    return std::get<VaultError>(r);
}

lockbox::core::CredentialFields githubFields()
{
    lockbox::core::CredentialFields fields{};
    fields.serviceName = "github";
    fields.username = "alice";
    fields.secret = secureStringFrom("s3cr3t");
    fields.url = "https://github.com";
    fields.tags = { "dev", "work" };
    return fields;
}

class VaultEngineTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_FALSE(m_dir.path().empty());
        ASSERT_FALSE(lockbox::core::isError(m_engine->createVault(m_passphrase)));
    }

    std::string login()
    {
        auto res{ m_engine->authenticate(m_passphrase) };
        if (lockbox::core::isError(res))
        {
            ADD_FAILURE() << "authenticate failed: " << lockbox::core::errorName(errorOf(res));
            return {};
        }
        return std::get<std::string>(res);
    }

    std::vector<lockbox::core::AuditEventKind> auditKinds(const std::string& session)
    {
        std::vector<lockbox::core::AuditEventKind> kinds;
        const auto entries{ m_engine->readAuditLog(session) };
        if (lockbox::core::isError(entries))
        {
            ADD_FAILURE() << "readAuditLog failed";
            return kinds;
        }
        for (const auto& e : std::get<std::vector<lockbox::core::AuditEntry>>(entries))
        {
            kinds.push_back(e.kind);
        }
        return kinds;
    }

    lockbox::test_utils::TempDirGuard m_dir{ lockbox::test_utils::makeSecureTempDir("vault_engine_") };
    std::unique_ptr<lockbox::crypto::ICryptoProvider> m_crypto{ lockbox::test_utils::makeTestCryptoProvider() };
    lockbox::test_utils::ManualClock m_clock;
    lockbox::core::EngineConfig m_config{ lockbox::test_utils::engineConfigForTests() };
    std::unique_ptr<lockbox::storage::IVaultRepository> m_vaults{ lockbox::storage::file::makeFileVaultRepository(
        m_dir.path() / "personal.lbx") };
    std::unique_ptr<lockbox::storage::IAuditRepository> m_auditRepo{
        lockbox::storage::sqlite::makeSqliteAuditRepository(m_dir.path() / "audit.db")
    };
    lockbox::core::AuthSessionManager m_sessions{ m_config, m_clock.provider() };
    std::unique_ptr<lockbox::core::VaultEngine> m_engine{ std::make_unique<lockbox::core::VaultEngine>(
        *m_crypto, *m_vaults, *m_auditRepo, m_sessions, m_config, m_clock.provider()) };
    lockbox::security::SecureString m_passphrase{ secureStringFrom("Tr0ub4dor&3") };
};

} // namespace

TEST_F(VaultEngineTest, LockoutScenarioLeavesVaultIntact)
{
    std::string session{ login() };
    const auto added{ m_engine->addCredential(session, githubFields()) };
    ASSERT_FALSE(lockbox::core::isError(added));
    const std::string id{ std::get<lockbox::core::CredentialRecord>(added).id };
    ASSERT_FALSE(lockbox::core::isError(m_engine->logout(session)));

    for (int i{}; i < 5; ++i)
    {
        EXPECT_EQ(errorOf(m_engine->authenticate(secureStringFrom("wrong"))), VaultError::AuthenticationFailed);
    }
    EXPECT_EQ(errorOf(m_engine->authenticate(m_passphrase)), VaultError::LockedOut);

    m_clock.advance(m_config.lockoutDuration);
    session = login();
    ASSERT_FALSE(session.empty());

    const auto got{ m_engine->getCredential(session, id) };
    ASSERT_FALSE(lockbox::core::isError(got));
    EXPECT_EQ(asStringView(std::get<lockbox::core::CredentialRecord>(got).secret), "s3cr3t");

    const auto kinds{ auditKinds(session) };
    using lockbox::core::AuditEventKind;
    EXPECT_EQ(std::count(kinds.begin(), kinds.end(), AuditEventKind::AuthFailed), 5);
    EXPECT_EQ(std::count(kinds.begin(), kinds.end(), AuditEventKind::AuthLockedOut), 1);
    EXPECT_EQ(std::count(kinds.begin(), kinds.end(), AuditEventKind::AuthSucceeded), 2);
    EXPECT_FALSE(lockbox::core::isError(m_engine->verifyAuditLog(session)));
}

TEST_F(VaultEngineTest, CredentialLifecyclePersistsAcrossEngines)
{
    const auto session{ login() };
    const auto added{ m_engine->addCredential(session, githubFields()) };
    ASSERT_FALSE(lockbox::core::isError(added));
    const std::string id{ std::get<lockbox::core::CredentialRecord>(added).id };

    lockbox::core::CredentialUpdate update{};
    update.username = "alice2";
    ASSERT_FALSE(lockbox::core::isError(m_engine->updateCredential(session, id, std::move(update))));

    auto other{ lockbox::core::CredentialFields{} };
    other.serviceName = "gitlab";
    other.username = "bob";
    other.secret = secureStringFrom("hunter2");
    other.tags = { "personal" };
    ASSERT_FALSE(lockbox::core::isError(m_engine->addCredential(session, std::move(other))));

    const auto hits{ m_engine->search(session, "GIT", lockbox::core::Tags{ "work" }) };
    ASSERT_FALSE(lockbox::core::isError(hits));
    ASSERT_EQ(std::get<std::vector<lockbox::core::CredentialRecord>>(hits).size(), 1U);
    EXPECT_EQ(std::get<std::vector<lockbox::core::CredentialRecord>>(hits)[0].username, "alice2");

    m_engine.reset();
    EXPECT_EQ(m_sessions.activeSessionCount(), 0U);

    m_engine = std::make_unique<lockbox::core::VaultEngine>(*m_crypto, *m_vaults, *m_auditRepo, m_sessions, m_config,
                                                            m_clock.provider());
    const auto again{ login() };
    const auto listed{ m_engine->listCredentials(again) };
    ASSERT_FALSE(lockbox::core::isError(listed));
    EXPECT_EQ(std::get<std::vector<lockbox::core::CredentialRecord>>(listed).size(), 2U);

    ASSERT_FALSE(lockbox::core::isError(m_engine->deleteCredential(again, id)));
    EXPECT_EQ(errorOf(m_engine->getCredential(again, id)), VaultError::NotFound);
}

TEST_F(VaultEngineTest, OperationsRequireLiveSession)
{
    EXPECT_EQ(errorOf(m_engine->listCredentials("bogus")), VaultError::SessionExpired);
    EXPECT_EQ(errorOf(m_engine->addCredential("bogus", githubFields())), VaultError::SessionExpired);
    EXPECT_EQ(errorOf(m_engine->readAuditLog("bogus")), VaultError::SessionExpired);
    EXPECT_EQ(errorOf(m_engine->logout("bogus")), VaultError::SessionExpired);

    const auto session{ login() };
    EXPECT_TRUE(m_engine->isAuthenticated(session));

    m_clock.advance(m_config.sessionTimeout + Seconds{ 1 });
    EXPECT_FALSE(m_engine->isAuthenticated(session));
    EXPECT_EQ(errorOf(m_engine->listCredentials(session)), VaultError::SessionExpired);
}

TEST_F(VaultEngineTest, LogoutInvalidatesSession)
{
    const auto session{ login() };
    ASSERT_FALSE(lockbox::core::isError(m_engine->logout(session)));
    EXPECT_FALSE(m_engine->isAuthenticated(session));
    EXPECT_EQ(errorOf(m_engine->listCredentials(session)), VaultError::SessionExpired);
}

TEST_F(VaultEngineTest, CreateTwiceIsAlreadyExists)
{
    EXPECT_EQ(errorOf(m_engine->createVault(m_passphrase)), VaultError::AlreadyExists);
    const auto exists{ m_engine->vaultExists() };
    ASSERT_FALSE(lockbox::core::isError(exists));
    EXPECT_TRUE(std::get<bool>(exists));
}

TEST_F(VaultEngineTest, ChangePassphraseRequiresOldOne)
{
    const auto session{ login() };
    const auto next{ secureStringFrom("correct horse battery staple") };

    EXPECT_EQ(errorOf(m_engine->changePassphrase(session, secureStringFrom("nope"), next)),
              VaultError::AuthenticationFailed);
    ASSERT_FALSE(lockbox::core::isError(m_engine->changePassphrase(session, m_passphrase, next)));
    EXPECT_TRUE(m_engine->isAuthenticated(session));

    EXPECT_EQ(errorOf(m_engine->authenticate(m_passphrase)), VaultError::AuthenticationFailed);
    EXPECT_FALSE(lockbox::core::isError(m_engine->authenticate(next)));
}

TEST_F(VaultEngineTest, ExportImportBetweenVaults)
{
    const auto session{ login() };
    ASSERT_FALSE(lockbox::core::isError(m_engine->addCredential(session, githubFields())));
    const auto bundle{ m_engine->exportVault(session, secureStringFrom("export-pass")) };
    ASSERT_FALSE(lockbox::core::isError(bundle));

    auto otherRepo{ lockbox::storage::file::makeFileVaultRepository(m_dir.path() / "second.lbx") };
    lockbox::core::VaultEngine second{ *m_crypto, *otherRepo, *m_auditRepo, m_sessions, m_config, m_clock.provider() };
    const auto pass{ secureStringFrom("another passphrase") };
    ASSERT_FALSE(lockbox::core::isError(second.createVault(pass)));
    const auto otherSession{ std::get<std::string>(second.authenticate(pass)) };

    const auto& bytes{ std::get<std::vector<std::uint8_t>>(bundle) };
    EXPECT_EQ(errorOf(second.importVault(otherSession, bytes, secureStringFrom("wrong"))),
              VaultError::IntegrityFailure);
    const auto imported{ second.importVault(otherSession, bytes, secureStringFrom("export-pass")) };
    ASSERT_FALSE(lockbox::core::isError(imported));
    EXPECT_EQ(std::get<std::size_t>(imported), 1U);

    // Sessions are bound to their own vault.
    EXPECT_EQ(errorOf(second.listCredentials(session)), VaultError::SessionExpired);
    EXPECT_TRUE(m_engine->isAuthenticated(session));
}

TEST_F(VaultEngineTest, ShareRoundTripWithoutSession)
{
    const auto session{ login() };
    const auto added{ m_engine->addCredential(session, githubFields()) };
    const std::string id{ std::get<lockbox::core::CredentialRecord>(added).id };

    const auto issued{ m_engine->issueShare(session, id) };
    ASSERT_FALSE(lockbox::core::isError(issued));
    const auto& share{ std::get<lockbox::core::IssuedShare>(issued) };
    EXPECT_EQ(share.expiresAt, lockbox::core::toUnixSeconds(m_clock.now()) + m_config.defaultShareTtl.count());

    ASSERT_FALSE(lockbox::core::isError(m_engine->logout(session)));
    const auto redeemed{ m_engine->redeemShare(share.tokenId) };
    ASSERT_FALSE(lockbox::core::isError(redeemed));
    EXPECT_EQ(asStringView(std::get<lockbox::core::SharedCredential>(redeemed).secret), "s3cr3t");
    EXPECT_EQ(errorOf(m_engine->redeemShare(share.tokenId)), VaultError::TokenExpired);

    EXPECT_EQ(errorOf(m_engine->issueShare("bogus", id)), VaultError::SessionExpired);
}

TEST_F(VaultEngineTest, StatsAndIntegrity)
{
    const auto session{ login() };
    ASSERT_FALSE(lockbox::core::isError(m_engine->addCredential(session, githubFields())));
    m_clock.advance(Seconds{ 10 });

    const auto stats{ m_engine->vaultStats(session) };
    ASSERT_FALSE(lockbox::core::isError(stats));
    const auto& s{ std::get<lockbox::core::VaultStats>(stats) };
    EXPECT_EQ(s.recordCount, 1U);
    EXPECT_GT(s.fileBytes, 0U);
    EXPECT_EQ(s.kdfIterations, m_config.kdfIterations);

    const auto summary{ m_engine->verifyVaultIntegrity() };
    ASSERT_FALSE(lockbox::core::isError(summary));
    EXPECT_EQ(std::get<lockbox::core::VaultSummary>(summary).kdfIterations, m_config.kdfIterations);
}

TEST_F(VaultEngineTest, AuditTrailCoversEveryMutation)
{
    const auto session{ login() };
    const auto added{ m_engine->addCredential(session, githubFields()) };
    const std::string id{ std::get<lockbox::core::CredentialRecord>(added).id };
    (void)m_engine->getCredential(session, id);
    (void)m_engine->listCredentials(session);
    ASSERT_FALSE(lockbox::core::isError(m_engine->deleteCredential(session, id)));

    using lockbox::core::AuditEventKind;
    const std::vector<AuditEventKind> expected{ AuditEventKind::VaultCreated,    AuditEventKind::AuthSucceeded,
                                                AuditEventKind::CredentialAdded, AuditEventKind::CredentialRead,
                                                AuditEventKind::CredentialsListed, AuditEventKind::CredentialDeleted };
    EXPECT_EQ(auditKinds(session), expected);
    EXPECT_FALSE(lockbox::core::isError(m_engine->verifyAuditLog(session)));
}

TEST_F(VaultEngineTest, AuditLogIsCompleteBeyondOneHundredOperations)
{
    std::size_t operations{ 1U }; // createVault
    EXPECT_EQ(errorOf(m_engine->authenticate(secureStringFrom("wrong"))), VaultError::AuthenticationFailed);
    ++operations;
    const auto session{ login() };
    ++operations;

    std::vector<std::string> ids;
    for (int i{}; i < 30; ++i)
    {
        auto fields{ githubFields() };
        fields.serviceName = "service-" + std::to_string(i);
        const auto added{ m_engine->addCredential(session, std::move(fields)) };
        ASSERT_FALSE(lockbox::core::isError(added));
        ids.push_back(std::get<lockbox::core::CredentialRecord>(added).id);
        ++operations;
    }
    for (const auto& id : ids)
    {
        ASSERT_FALSE(lockbox::core::isError(m_engine->getCredential(session, id)));
        lockbox::core::CredentialUpdate update{};
        update.notes = "rotated";
        ASSERT_FALSE(lockbox::core::isError(m_engine->updateCredential(session, id, std::move(update))));
        operations += 2U;
    }
    for (int i{}; i < 10; ++i)
    {
        const auto issued{ m_engine->issueShare(session, ids[static_cast<std::size_t>(i)]) };
        ASSERT_FALSE(lockbox::core::isError(issued));
        ASSERT_FALSE(lockbox::core::isError(m_engine->redeemShare(std::get<lockbox::core::IssuedShare>(issued).tokenId)));
        operations += 2U;
    }
    for (int i{}; i < 10; ++i)
    {
        ASSERT_FALSE(lockbox::core::isError(m_engine->deleteCredential(session, ids[static_cast<std::size_t>(i)])));
        ASSERT_FALSE(lockbox::core::isError(m_engine->listCredentials(session)));
        operations += 2U;
    }
    ASSERT_GT(operations, 100U);

    const auto all{ m_engine->readAuditLog(session) };
    ASSERT_FALSE(lockbox::core::isError(all));
    const auto& entries{ std::get<std::vector<lockbox::core::AuditEntry>>(all) };
    EXPECT_GE(entries.size(), operations);
    EXPECT_EQ(entries.front().sequenceNumber, 1U);
    EXPECT_EQ(entries.back().sequenceNumber, entries.size());
    EXPECT_FALSE(lockbox::core::isError(m_engine->verifyAuditLog(session)));

    const auto latest{ m_engine->readAuditLog(session, 5U) };
    ASSERT_FALSE(lockbox::core::isError(latest));
    const auto& tail{ std::get<std::vector<lockbox::core::AuditEntry>>(latest) };
    ASSERT_EQ(tail.size(), 5U);
    EXPECT_EQ(tail.back().sequenceNumber, entries.back().sequenceNumber);
    EXPECT_EQ(errorOf(m_engine->readAuditLog(session, 0U)), VaultError::InvalidArgument);
}
