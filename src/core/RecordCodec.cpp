#include "lockbox/core/RecordCodec.hpp"
#include "LittleEndian.hpp"
#include <string>
#include <string_view>
#include <unordered_set>

namespace lockbox::core
{
namespace
{

using lockbox::security::SecureBuffer;
using Writer = detail::ByteWriter<SecureBuffer>;
using detail::ByteReader;

void writeSecret(Writer& w, const lockbox::security::SecureString& s)
{
    w.text(lockbox::security::asStringView(s));
}

[[nodiscard]] bool readText(ByteReader& r, std::string& out)
{
    const auto view{ r.text() };
    if (!view || view->size() > g_maxFieldBytes)
    {
        return false;
    }
    out.assign(*view);
    return true;
}

[[nodiscard]] bool readSecret(ByteReader& r, lockbox::security::SecureString& out)
{
    const auto view{ r.text() };
    if (!view || view->size() > g_maxFieldBytes)
    {
        return false;
    }
    out = lockbox::security::secureStringFrom(*view);
    return true;
}

[[nodiscard]] bool readTimestamp(ByteReader& r, std::int64_t& out) noexcept
{
    std::uint64_t raw{};
    if (!r.u64(raw))
    {
        return false;
    }
    out = static_cast<std::int64_t>(raw);
    return true;
}

void writeRecord(Writer& w, const CredentialRecord& rec)
{
    w.text(rec.id);
    w.text(rec.serviceName);
    w.text(rec.username);
    writeSecret(w, rec.secret);
    w.text(rec.url);
    w.text(rec.notes);
    w.u32(static_cast<std::uint32_t>(rec.tags.size()));
    for (const auto& tag : rec.tags)
    {
        w.text(tag);
    }
    w.u64(static_cast<std::uint64_t>(rec.createdAt));
    w.u64(static_cast<std::uint64_t>(rec.updatedAt));
}

[[nodiscard]] bool readRecord(ByteReader& r, CredentialRecord& rec)
{
    if (!readText(r, rec.id) || !isWellFormedRecordId(rec.id))
    {
        return false;
    }
    if (!readText(r, rec.serviceName) || rec.serviceName.empty() || !readText(r, rec.username) ||
        !readSecret(r, rec.secret) || !readText(r, rec.url) || !readText(r, rec.notes))
    {
        return false;
    }

    std::uint32_t tagCount{};
    if (!r.u32(tagCount) || tagCount > g_maxTagsPerRecord)
    {
        return false;
    }
    for (std::uint32_t i{}; i < tagCount; ++i)
    {
        std::string tag;
        if (!readText(r, tag) || tag.empty() || !rec.tags.insert(std::move(tag)).second)
        {
            return false;
        }
    }
    return readTimestamp(r, rec.createdAt) && readTimestamp(r, rec.updatedAt);
}

} // namespace

SecureBuffer encodeContents(const VaultContents& contents)
{
    SecureBuffer out;
    Writer w{ out };
    w.u32(g_contentsVersion);
    w.u64(static_cast<std::uint64_t>(contents.createdAt));
    w.u32(static_cast<std::uint32_t>(contents.records.size()));
    for (const auto& rec : contents.records)
    {
        writeRecord(w, rec);
    }
    return out;
}

std::optional<VaultContents> decodeContents(std::span<const std::uint8_t> bytes)
{
    ByteReader r{ bytes };
    std::uint32_t version{};
    if (!r.u32(version) || version != g_contentsVersion)
    {
        return std::nullopt;
    }

    VaultContents out{};
    std::uint32_t count{};
    if (!readTimestamp(r, out.createdAt) || !r.u32(count))
    {
        return std::nullopt;
    }

    std::unordered_set<std::string> seen;
    for (std::uint32_t i{}; i < count; ++i)
    {
        CredentialRecord rec{};
        if (!readRecord(r, rec) || !seen.insert(rec.id).second)
        {
            return std::nullopt;
        }
        out.records.push_back(std::move(rec));
    }
    if (!r.atEnd())
    {
        return std::nullopt;
    }
    return out;
}

SecureBuffer encodeSnapshot(const SharedCredential& snapshot)
{
    SecureBuffer out;
    Writer w{ out };
    w.u32(g_snapshotVersion);
    w.text(snapshot.serviceName);
    w.text(snapshot.username);
    writeSecret(w, snapshot.secret);
    w.text(snapshot.url);
    w.text(snapshot.notes);
    return out;
}

std::optional<SharedCredential> decodeSnapshot(std::span<const std::uint8_t> bytes)
{
    ByteReader r{ bytes };
    std::uint32_t version{};
    if (!r.u32(version) || version != g_snapshotVersion)
    {
        return std::nullopt;
    }
    SharedCredential out{};
    if (!readText(r, out.serviceName) || !readText(r, out.username) || !readSecret(r, out.secret) ||
        !readText(r, out.url) || !readText(r, out.notes) || !r.atEnd())
    {
        return std::nullopt;
    }
    return out;
}

} // namespace lockbox::core
