#include "lockbox/core/AuditLog.hpp"
#include "lockbox/core/VaultStore.hpp"
#include "lockbox/security/SecureMemory.hpp"
#include "test_utils/FakeRepositories.hpp"
#include "test_utils/TestUtils.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <stdexcept>

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::ReturnRef;
using ::testing::Throw;
using lockbox::core::VaultError;

namespace
{

lockbox::core::CredentialFields sampleFields()
{
    lockbox::core::CredentialFields fields{};
    fields.serviceName = "github";
    fields.username = "alice";
    fields.secret = lockbox::security::secureStringFrom("s3cr3t");
    return fields;
}

class VaultStoreFailureTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_FALSE(lockbox::core::isError(m_store.create(m_passphrase)));
        auto opened{ m_store.open(m_passphrase) };
        ASSERT_FALSE(lockbox::core::isError(opened));
        m_vault = std::move(std::get<lockbox::core::UnlockedVault>(opened));
    }

    std::unique_ptr<lockbox::crypto::ICryptoProvider> m_crypto{ lockbox::test_utils::makeTestCryptoProvider() };
    lockbox::test_utils::InMemoryVaultRepository m_repo{ "/tmp/lockbox-failure-test.lbx" };
    lockbox::test_utils::InMemoryAuditRepository m_auditRepo;
    lockbox::core::AuditLog m_audit{ *m_crypto, m_auditRepo };
    lockbox::core::VaultStore m_store{ *m_crypto, m_repo, m_audit, lockbox::test_utils::engineConfigForTests() };
    lockbox::security::SecureString m_passphrase{ lockbox::security::secureStringFrom("Tr0ub4dor&3") };
    lockbox::core::UnlockedVault m_vault;
};

} // namespace

TEST_F(VaultStoreFailureTest, FailedWriteLeavesFileAndCollectionUntouched)
{
    const auto before{ *m_repo.bytes };
    const auto auditBefore{ m_auditRepo.rows.size() };
    m_repo.failStores = true;

    const auto res{ m_store.add(m_vault, sampleFields()) };
    ASSERT_TRUE(lockbox::core::isError(res));
    EXPECT_EQ(std::get<VaultError>(res), VaultError::StorageError);
    EXPECT_TRUE(m_vault.records().empty());
    EXPECT_EQ(*m_repo.bytes, before);
    EXPECT_EQ(m_auditRepo.rows.size(), auditBefore);
}

TEST_F(VaultStoreFailureTest, FailedWriteDuringPassphraseChangeKeepsOldKey)
{
    m_repo.failStores = true;
    const auto res{ m_store.changePassphrase(m_vault, m_passphrase, lockbox::security::secureStringFrom("next")) };
    ASSERT_TRUE(lockbox::core::isError(res));
    EXPECT_EQ(std::get<VaultError>(res), VaultError::StorageError);

    m_repo.failStores = false;
    EXPECT_FALSE(lockbox::core::isError(m_store.open(m_passphrase)));
}

TEST(VaultStoreFailure, UnreadableVaultIsStorageError)
{
    auto crypto{ lockbox::test_utils::makeTestCryptoProvider() };
    const std::filesystem::path location{ "/tmp/lockbox-mock.lbx" };
    NiceMock<lockbox::test_utils::MockVaultRepository> repo;
    ON_CALL(repo, location()).WillByDefault(ReturnRef(location));
    EXPECT_CALL(repo, load()).WillRepeatedly(Throw(std::runtime_error("EIO")));
    EXPECT_CALL(repo, exists()).WillOnce(Throw(std::runtime_error("EACCES")));

    lockbox::test_utils::InMemoryAuditRepository auditRepo;
    lockbox::core::AuditLog audit{ *crypto, auditRepo };
    lockbox::core::VaultStore store{ *crypto, repo, audit, lockbox::test_utils::engineConfigForTests() };

    const auto pass{ lockbox::security::secureStringFrom("pw") };
    EXPECT_EQ(std::get<VaultError>(store.open(pass)), VaultError::StorageError);
    EXPECT_EQ(std::get<VaultError>(store.verifyIntegrity()), VaultError::StorageError);
    EXPECT_EQ(std::get<VaultError>(store.exists()), VaultError::StorageError);
}

TEST(VaultStoreFailure, AuditFailureAfterCommitReportsStorageErrorButKeepsTheWrite)
{
    auto crypto{ lockbox::test_utils::makeTestCryptoProvider() };
    lockbox::test_utils::InMemoryVaultRepository repo{ "/tmp/lockbox-audit-failure.lbx" };
    NiceMock<lockbox::test_utils::MockAuditRepository> auditRepo;
    ON_CALL(auditRepo, last()).WillByDefault(Return(std::nullopt));

    lockbox::core::AuditLog audit{ *crypto, auditRepo };
    lockbox::core::VaultStore store{ *crypto, repo, audit, lockbox::test_utils::engineConfigForTests() };
    const auto pass{ lockbox::security::secureStringFrom("pw") };

    ASSERT_FALSE(lockbox::core::isError(store.create(pass)));
    auto vault{ std::move(std::get<lockbox::core::UnlockedVault>(store.open(pass))) };

    EXPECT_CALL(auditRepo, append(_)).WillOnce(Throw(std::runtime_error("database is locked")));
    const auto res{ store.add(vault, sampleFields()) };
    ASSERT_TRUE(lockbox::core::isError(res));
    EXPECT_EQ(std::get<VaultError>(res), VaultError::StorageError);

    auto reopened{ std::move(std::get<lockbox::core::UnlockedVault>(store.open(pass))) };
    EXPECT_EQ(reopened.records().size(), 1U);
}
