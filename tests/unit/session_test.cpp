#include "lockbox/core/Session.hpp"
#include "lockbox/core/CredentialRecord.hpp"
#include "lockbox/security/SecureMemory.hpp"

#include <gtest/gtest.h>

namespace
{
using lockbox::core::Session;
using lockbox::core::TimePoint;
using Duration = Session::Duration;

lockbox::core::UnlockedVault openVaultWithOneRecord()
{
    lockbox::core::CredentialFields fields{};
    fields.serviceName = "github";
    fields.secret = lockbox::security::secureStringFrom("s3cr3t");
    std::vector<lockbox::core::CredentialRecord> records;
    records.push_back(lockbox::core::makeRecord(std::string(32, 'a'), std::move(fields), 0));

    return lockbox::core::UnlockedVault{ lockbox::core::VaultHeader{}, lockbox::security::SecureBuffer(32U, 0x42U), 0,
                                         std::move(records), 128U };
}

class SessionTest : public ::testing::Test
{
protected:
    Session makeSession(Duration timeout)
    {
        return Session{ "s1", openVaultWithOneRecord(), timeout, [this]() { return m_now; } };
    }

    TimePoint m_now{};
};

} // namespace

TEST_F(SessionTest, HoldsTheUnlockedVault)
{
    auto session{ makeSession(Duration{ 5 }) };

    EXPECT_EQ(session.id(), "s1");
    EXPECT_EQ(session.createdAt(), m_now);
    EXPECT_TRUE(session.vault().isOpen());
    ASSERT_NE(session.vault().find(std::string(32, 'a')), nullptr);
    EXPECT_EQ(session.vault().records().size(), 1U);
}

TEST_F(SessionTest, IdleBeyondTimeoutExpires)
{
    const auto session{ makeSession(Duration{ 5 }) };

    m_now += Duration{ 5 };
    EXPECT_FALSE(session.isExpired());
    m_now += Duration{ 1 };
    EXPECT_TRUE(session.isExpired());
}

TEST_F(SessionTest, TouchRestartsIdleTimer)
{
    auto session{ makeSession(Duration{ 5 }) };

    m_now += Duration{ 3 };
    session.touch();
    EXPECT_EQ(session.lastActivity(), m_now);

    m_now += Duration{ 4 };
    EXPECT_FALSE(session.isExpired());
    m_now += Duration{ 2 };
    EXPECT_TRUE(session.isExpired());
}

TEST_F(SessionTest, ZeroTimeoutExpiresAfterAnyIdleTime)
{
    const auto session{ makeSession(Duration{ 0 }) };
    EXPECT_FALSE(session.isExpired());
    m_now += Duration{ 1 };
    EXPECT_TRUE(session.isExpired());
}

TEST_F(SessionTest, MovedFromVaultIsClosed)
{
    auto vault{ openVaultWithOneRecord() };
    const Session session{ "s2", std::move(vault), Duration{ 5 }, [this]() { return m_now; } };

    EXPECT_TRUE(session.vault().isOpen());
    // NOLINTNEXTLINE(bugprone-use-after-move)
    EXPECT_FALSE(vault.isOpen());
    EXPECT_TRUE(vault.records().empty());
}
