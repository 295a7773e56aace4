#include "lockbox/security/SecureRandom.hpp"
#include <array>
#include <cstdint>
#include <gtest/gtest.h>
#include <set>
#include <string>

TEST(SecureRandom, FillSucceedsAndChangesBuffer)
{
    std::array<std::uint8_t, 0> empty{};
    EXPECT_TRUE(lockbox::security::secureRandomFill(std::span{ empty }));

    std::array<std::uint8_t, 64> bytes{};
    ASSERT_TRUE(lockbox::security::secureRandomFill(std::span{ bytes }));
    EXPECT_NE(bytes, (std::array<std::uint8_t, 64>{}));

    std::uint64_t value{};
    EXPECT_TRUE(lockbox::security::secureRandomUint64(value));
}

TEST(SecureRandom, BoundedRejectsZero)
{
    std::uint64_t out{};
    EXPECT_FALSE(lockbox::security::secureRandomBounded(std::uint64_t{ 0U }, out));
}

TEST(SecureRandom, BoundedOneAlwaysReturnsZero)
{
    constexpr std::uint64_t kSentinel{ 123U };
    std::uint64_t out{ kSentinel };
    EXPECT_TRUE(lockbox::security::secureRandomBounded(std::uint64_t{ 1U }, out));
    EXPECT_EQ(out, 0U);
}

TEST(SecureRandom, BoundedValueIsWithinRange)
{
    std::uint64_t out{};
    constexpr std::uint64_t kMaxExcl{ 10U };
    constexpr int kTrials{ 64 };
    for (int i{}; i < kTrials; ++i)
    {
        ASSERT_TRUE(lockbox::security::secureRandomBounded(kMaxExcl, out));
        EXPECT_LT(out, kMaxExcl);
    }
}

TEST(SecureRandom, BoundedTemplateOverloadWorksForUint32)
{
    std::uint32_t out{};
    constexpr std::uint32_t kMaxExcl{ 10U };
    ASSERT_TRUE(lockbox::security::secureRandomBounded(kMaxExcl, out));
    EXPECT_LT(out, kMaxExcl);
}

TEST(SecureRandom, ToHexIsLowercase)
{
    const std::array<std::uint8_t, 3> bytes{ 0x00U, 0xABU, 0x7FU };
    EXPECT_EQ(lockbox::security::toHex(bytes), "00ab7f");
}

TEST(SecureRandom, HexTokensHaveExpectedLengthAndDiffer)
{
    constexpr std::size_t kBytes{ 16U };
    constexpr int kTrials{ 32 };
    std::set<std::string> seen;
    for (int i{}; i < kTrials; ++i)
    {
        const auto token{ lockbox::security::secureRandomHex(kBytes) };
        ASSERT_TRUE(token.has_value());
        EXPECT_EQ(token->size(), kBytes * 2U);
        EXPECT_EQ(token->find_first_not_of("0123456789abcdef"), std::string::npos);
        seen.insert(*token);
    }
    EXPECT_EQ(seen.size(), static_cast<std::size_t>(kTrials));
}
