#include "lockbox/core/RecordCodec.hpp"
#include "lockbox/security/SecureMemory.hpp"
#include <gtest/gtest.h>
#include <string>

namespace
{

constexpr std::int64_t g_createdAt{ 1'700'000'000 };

lockbox::core::CredentialRecord sampleRecord(std::string id, std::string service)
{
    lockbox::core::CredentialFields fields{};
    fields.serviceName = std::move(service);
    fields.username = "alice";
    fields.secret = lockbox::security::secureStringFrom("s3cr3t");
    fields.url = "https://example.test";
    fields.notes = "";
    fields.tags = { "a", "b" };
    return lockbox::core::makeRecord(std::move(id), std::move(fields), g_createdAt);
}

lockbox::core::VaultContents twoRecords()
{
    lockbox::core::VaultContents contents{};
    contents.createdAt = g_createdAt;
    contents.records.push_back(sampleRecord("00000000000000000000000000000001", "github"));
    contents.records.push_back(sampleRecord("00000000000000000000000000000002", "mail"));
    return contents;
}

} // namespace

TEST(RecordCodec, ContentsRoundTripPreservesEveryField)
{
    const auto contents{ twoRecords() };
    const auto encoded{ lockbox::core::encodeContents(contents) };
    const auto decoded{ lockbox::core::decodeContents(lockbox::security::asSpan(encoded)) };

    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->createdAt, g_createdAt);
    ASSERT_EQ(decoded->records.size(), 2U);

    const auto& r{ decoded->records[0] };
    EXPECT_EQ(r.id, "00000000000000000000000000000001");
    EXPECT_EQ(r.serviceName, "github");
    EXPECT_EQ(r.username, "alice");
    EXPECT_EQ(lockbox::security::asStringView(r.secret), "s3cr3t");
    EXPECT_EQ(r.url, "https://example.test");
    EXPECT_TRUE(r.notes.empty());
    EXPECT_EQ(r.tags, (lockbox::core::Tags{ "a", "b" }));
    EXPECT_EQ(r.createdAt, g_createdAt);
    EXPECT_EQ(r.updatedAt, g_createdAt);
}

TEST(RecordCodec, EmptyCollectionRoundTrips)
{
    const lockbox::core::VaultContents empty{ .createdAt = g_createdAt, .records = {} };
    const auto encoded{ lockbox::core::encodeContents(empty) };
    const auto decoded{ lockbox::core::decodeContents(lockbox::security::asSpan(encoded)) };
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->records.empty());
}

TEST(RecordCodec, RejectsTruncationAndTrailingBytes)
{
    auto encoded{ lockbox::core::encodeContents(twoRecords()) };

    const auto truncated{ lockbox::security::asSpan(encoded).first(encoded.size() - 1U) };
    EXPECT_FALSE(lockbox::core::decodeContents(truncated).has_value());

    encoded.push_back(0U);
    EXPECT_FALSE(lockbox::core::decodeContents(lockbox::security::asSpan(encoded)).has_value());
}

TEST(RecordCodec, RejectsUnknownVersion)
{
    auto encoded{ lockbox::core::encodeContents(twoRecords()) };
    encoded[0] = 0x7FU;
    EXPECT_FALSE(lockbox::core::decodeContents(lockbox::security::asSpan(encoded)).has_value());
}

TEST(RecordCodec, RejectsDuplicateAndMalformedIds)
{
    auto duplicated{ twoRecords() };
    duplicated.records[1].id = duplicated.records[0].id;
    const auto dupEncoded{ lockbox::core::encodeContents(duplicated) };
    EXPECT_FALSE(lockbox::core::decodeContents(lockbox::security::asSpan(dupEncoded)).has_value());

    auto malformed{ twoRecords() };
    malformed.records[0].id = "not-an-id";
    const auto badEncoded{ lockbox::core::encodeContents(malformed) };
    EXPECT_FALSE(lockbox::core::decodeContents(lockbox::security::asSpan(badEncoded)).has_value());
}

TEST(RecordCodec, SnapshotRoundTrip)
{
    const auto snapshot{ lockbox::core::snapshotOf(sampleRecord("00000000000000000000000000000001", "github")) };
    const auto encoded{ lockbox::core::encodeSnapshot(snapshot) };
    const auto decoded{ lockbox::core::decodeSnapshot(lockbox::security::asSpan(encoded)) };

    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->serviceName, "github");
    EXPECT_EQ(lockbox::security::asStringView(decoded->secret), "s3cr3t");
    EXPECT_FALSE(lockbox::core::decodeSnapshot(lockbox::security::asSpan(encoded).first(3)).has_value());
}
