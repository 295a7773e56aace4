#ifndef INCLUDE_LOCKBOX_CORE_CREDENTIALRECORD_HPP
#define INCLUDE_LOCKBOX_CORE_CREDENTIALRECORD_HPP

#include "lockbox/security/SecureMemory.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace lockbox::core
{

constexpr std::size_t g_recordIdBytes{ 16 };
constexpr std::size_t g_recordIdChars{ g_recordIdBytes * 2U };
constexpr std::size_t g_maxFieldBytes{ 64U * 1024U };
constexpr std::size_t g_maxTagsPerRecord{ 64U };

using Tags = std::set<std::string, std::less<>>;

struct CredentialRecord final
{
    std::string id;
    std::string serviceName;
    std::string username;
    lockbox::security::SecureString secret;
    std::string url;
    std::string notes;
    Tags tags;
    std::int64_t createdAt{};
    std::int64_t updatedAt{};
};

// Caller-supplied content of a new record.
struct CredentialFields final
{
    std::string serviceName;
    std::string username;
    lockbox::security::SecureString secret;
    std::string url;
    std::string notes;
    Tags tags;
};

// Only engaged members are applied.
struct CredentialUpdate final
{
    std::optional<std::string> serviceName;
    std::optional<std::string> username;
    std::optional<lockbox::security::SecureString> secret;
    std::optional<std::string> url;
    std::optional<std::string> notes;
    std::optional<Tags> tags;
};

// Shareable subset handed to share-token redeemers.
struct SharedCredential final
{
    std::string serviceName;
    std::string username;
    lockbox::security::SecureString secret;
    std::string url;
    std::string notes;
};

[[nodiscard]] bool isValid(const CredentialFields& fields) noexcept;
[[nodiscard]] bool isValid(const CredentialUpdate& update) noexcept;
[[nodiscard]] bool isWellFormedRecordId(std::string_view id) noexcept;

[[nodiscard]] CredentialRecord makeRecord(std::string id, CredentialFields fields, std::int64_t now);
void applyUpdate(CredentialRecord& record, CredentialUpdate update, std::int64_t now);

// Case-insensitive substring match on service name, username, url and notes (empty query matches),
// and, when tags are given, at least one shared tag.
[[nodiscard]] bool matchesQuery(const CredentialRecord& record, std::string_view query,
                                const std::optional<Tags>& anyOfTags);

[[nodiscard]] SharedCredential snapshotOf(const CredentialRecord& record);

} // namespace lockbox::core

#endif // INCLUDE_LOCKBOX_CORE_CREDENTIALRECORD_HPP
