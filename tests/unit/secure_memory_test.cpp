#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

#include "lockbox/security/SecureMemory.hpp"

namespace
{

constexpr std::size_t g_bufferSize{ 32U };
constexpr std::uint8_t g_nonZeroByte{ 0xA5U };

struct NonTrivial
{
    std::unique_ptr<int> p;
};

template <typename T>
concept CanSecureWipe = requires(T buffer) { lockbox::security::secureWipe(buffer); };

static_assert(!CanSecureWipe<std::span<const std::uint32_t>>);
static_assert(!CanSecureWipe<std::span<NonTrivial>>);

void expectAllBytesEq(const std::array<std::uint8_t, g_bufferSize>& buffer, std::uint8_t expected)
{
    for (const auto b : buffer)
    {
        EXPECT_EQ(b, expected);
    }
}

} // namespace

TEST(SecureWipe, ZerosTypedSpan)
{
    constexpr std::size_t wordCount{ 16U };
    constexpr std::uint32_t nonZeroWord{ 0xDEADBEEFU };

    std::array<std::uint32_t, wordCount> words{};
    words.fill(nonZeroWord);
    lockbox::security::secureWipe(std::span<std::uint32_t>{ words });

    for (const auto w : words)
    {
        EXPECT_EQ(w, 0U);
    }
}

TEST(SecureWipe, EmptySpanIsNoOp)
{
    lockbox::security::secureWipe(std::span<std::byte>{});
}

TEST(ZeroAllocator, VectorGrowsAndKeepsContents)
{
    constexpr int kFirst{ 42 };
    constexpr std::size_t kLargeSize{ 1000U };

    lockbox::security::SecureVector<int> values;
    values.push_back(kFirst);
    values.resize(kLargeSize, 0);

    EXPECT_EQ(values.size(), kLargeSize);
    EXPECT_EQ(values[0], kFirst);
}

TEST(ZeroAllocator, AllInstancesCompareEqual)
{
    const lockbox::security::ZeroAllocator<int> a;
    const lockbox::security::ZeroAllocator<double> b(a);
    EXPECT_TRUE(a == b);
}

TEST(SecureString, RoundTripsThroughStringView)
{
    const auto s{ lockbox::security::secureStringFrom("Tr0ub4dor&3") };
    EXPECT_EQ(lockbox::security::asStringView(s), "Tr0ub4dor&3");
    EXPECT_TRUE(lockbox::security::asStringView(lockbox::security::SecureString{}).empty());
}

TEST(SecureString, ReleaseDropsCapacity)
{
    auto s{ lockbox::security::secureStringFrom("secret") };
    lockbox::security::secureRelease(s);
    EXPECT_TRUE(s.empty());
    EXPECT_EQ(s.capacity(), 0U);
}

TEST(SecureBuffer, FromBytesCopiesContent)
{
    const std::array<std::byte, 3> raw{ std::byte{ 1 }, std::byte{ 2 }, std::byte{ 3 } };
    const auto buffer{ lockbox::security::secureBufferFrom(raw) };
    ASSERT_EQ(buffer.size(), raw.size());
    EXPECT_EQ(buffer[0], 1U);
    EXPECT_EQ(buffer[2], 3U);
}

TEST(SecureEquals, MismatchedSizesReturnFalse)
{
    const lockbox::security::SecureBuffer a(10);
    const lockbox::security::SecureBuffer b(5);
    EXPECT_FALSE(lockbox::security::secureEquals(lockbox::security::asSpan(a), lockbox::security::asSpan(b)));
}

TEST(SecureEquals, ComparesContent)
{
    lockbox::security::SecureBuffer a(10, 1U);
    const lockbox::security::SecureBuffer b(10, 1U);
    EXPECT_TRUE(lockbox::security::secureEquals(lockbox::security::asSpan(a), lockbox::security::asSpan(b)));

    a[9] = 2U;
    EXPECT_FALSE(lockbox::security::secureEquals(lockbox::security::asSpan(a), lockbox::security::asSpan(b)));
}

TEST(ScopeWipe, WipesOnDestruction)
{
    std::array<std::uint8_t, g_bufferSize> buffer{};
    buffer.fill(g_nonZeroByte);

    {
        const auto guard{ lockbox::security::scopeWipe(buffer) };
        expectAllBytesEq(buffer, g_nonZeroByte);
    }

    expectAllBytesEq(buffer, std::uint8_t{});
}

TEST(ScopeWipe, ReleaseDisablesWipe)
{
    std::array<std::uint8_t, g_bufferSize> buffer{};
    buffer.fill(g_nonZeroByte);

    {
        auto guard{ lockbox::security::scopeWipe(buffer) };
        guard.release();
    }

    expectAllBytesEq(buffer, g_nonZeroByte);
}

TEST(ScopeWipe, MoveTransfersWipeResponsibility)
{
    std::array<std::uint8_t, g_bufferSize> buffer{};
    buffer.fill(g_nonZeroByte);

    {
        auto a{ lockbox::security::scopeWipe(buffer) };
        auto b{ std::move(a) };
    }

    expectAllBytesEq(buffer, std::uint8_t{});
}

TEST(ScopeWipe, WipesSecureVectorContents)
{
    auto password{ lockbox::security::secureStringFrom("hunter2") };
    const char* data{ password.data() };
    {
        const auto guard{ lockbox::security::scopeWipe(password) };
    }
    ASSERT_EQ(password.size(), 7U);
    for (std::size_t i{}; i < password.size(); ++i)
    {
        EXPECT_EQ(data[i], '\0');
    }
}
