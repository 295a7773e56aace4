#include "lockbox/core/CredentialRecord.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace lockbox::core
{
namespace
{

[[nodiscard]] bool fitsField(std::string_view s) noexcept
{
    return s.size() <= g_maxFieldBytes;
}

[[nodiscard]] bool fitsTags(const Tags& tags) noexcept
{
    if (tags.size() > g_maxTagsPerRecord)
    {
        return false;
    }
    return std::all_of(tags.begin(), tags.end(),
                       [](const std::string& t) { return !t.empty() && fitsField(t); });
}

[[nodiscard]] char lowerAscii(char c) noexcept
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

[[nodiscard]] bool containsIgnoreCase(std::string_view haystack, std::string_view needle)
{
    const auto it{ std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                               [](char a, char b) { return lowerAscii(a) == lowerAscii(b); }) };
    return it != haystack.end() || needle.empty();
}

} // namespace

bool isValid(const CredentialFields& fields) noexcept
{
    return !fields.serviceName.empty() && fitsField(fields.serviceName) && fitsField(fields.username) &&
           fields.secret.size() <= g_maxFieldBytes && fitsField(fields.url) && fitsField(fields.notes) &&
           fitsTags(fields.tags);
}

bool isValid(const CredentialUpdate& update) noexcept
{
    if (update.serviceName && (update.serviceName->empty() || !fitsField(*update.serviceName)))
    {
        return false;
    }
    if ((update.username && !fitsField(*update.username)) || (update.url && !fitsField(*update.url)) ||
        (update.notes && !fitsField(*update.notes)))
    {
        return false;
    }
    if (update.secret && update.secret->size() > g_maxFieldBytes)
    {
        return false;
    }
    return !update.tags || fitsTags(*update.tags);
}

bool isWellFormedRecordId(std::string_view id) noexcept
{
    if (id.size() != g_recordIdChars)
    {
        return false;
    }
    return std::all_of(id.begin(), id.end(),
                       [](char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); });
}

CredentialRecord makeRecord(std::string id, CredentialFields fields, std::int64_t now)
{
    CredentialRecord r{};
    r.id = std::move(id);
    r.serviceName = std::move(fields.serviceName);
    r.username = std::move(fields.username);
    r.secret = std::move(fields.secret);
    r.url = std::move(fields.url);
    r.notes = std::move(fields.notes);
    r.tags = std::move(fields.tags);
    r.createdAt = now;
    r.updatedAt = now;
    return r;
}

void applyUpdate(CredentialRecord& record, CredentialUpdate update, std::int64_t now)
{
    if (update.serviceName)
    {
        record.serviceName = std::move(*update.serviceName);
    }
    if (update.username)
    {
        record.username = std::move(*update.username);
    }
    if (update.secret)
    {
        lockbox::security::secureRelease(record.secret);
        record.secret = std::move(*update.secret);
    }
    if (update.url)
    {
        record.url = std::move(*update.url);
    }
    if (update.notes)
    {
        record.notes = std::move(*update.notes);
    }
    if (update.tags)
    {
        record.tags = std::move(*update.tags);
    }
    record.updatedAt = now;
}

bool matchesQuery(const CredentialRecord& record, std::string_view query, const std::optional<Tags>& anyOfTags)
{
    const bool textMatch{ query.empty() || containsIgnoreCase(record.serviceName, query) ||
                          containsIgnoreCase(record.username, query) || containsIgnoreCase(record.url, query) ||
                          containsIgnoreCase(record.notes, query) };
    if (!textMatch)
    {
        return false;
    }
    if (!anyOfTags || anyOfTags->empty())
    {
        return true;
    }
    return std::any_of(anyOfTags->begin(), anyOfTags->end(),
                       [&record](const std::string& tag) { return record.tags.contains(tag); });
}

SharedCredential snapshotOf(const CredentialRecord& record)
{
    return SharedCredential{ .serviceName = record.serviceName,
                             .username = record.username,
                             .secret = record.secret,
                             .url = record.url,
                             .notes = record.notes };
}

} // namespace lockbox::core
