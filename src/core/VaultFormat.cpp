#include "lockbox/core/VaultFormat.hpp"
#include "LittleEndian.hpp"
#include <algorithm>
#include <string_view>

namespace lockbox::core
{
namespace
{

constexpr std::string_view g_vaultFileDomain{ "lockbox.vault-file.v1" };
constexpr std::string_view g_exportBundleDomain{ "lockbox.export-bundle.v1" };

[[nodiscard]] std::string_view domainFor(ContainerKind kind) noexcept
{
    return kind == ContainerKind::ExportBundle ? g_exportBundleDomain : g_vaultFileDomain;
}

} // namespace

std::array<std::uint8_t, g_vaultHeaderBytes> encodeVaultHeader(const VaultHeader& header) noexcept
{
    std::array<std::uint8_t, g_vaultHeaderBytes> out{};
    const std::span<std::uint8_t, g_vaultHeaderBytes> s{ out };
    detail::storeLE<detail::g_u32Bytes>(s.subspan<0, detail::g_u32Bytes>(), header.formatVersion);
    std::copy(header.kdf.salt.begin(), header.kdf.salt.end(), out.begin() + detail::g_u32Bytes);
    detail::storeLE<detail::g_u32Bytes>(s.subspan<detail::g_u32Bytes + lockbox::crypto::g_saltBytes,
                                                  detail::g_u32Bytes>(),
                                        header.kdf.iterations);
    return out;
}

std::optional<VaultHeader> decodeVaultHeader(std::span<const std::uint8_t> bytes) noexcept
{
    detail::ByteReader r{ bytes };
    VaultHeader h{};
    if (!r.u32(h.formatVersion) || !r.bytes(h.kdf.salt) || !r.u32(h.kdf.iterations))
    {
        return std::nullopt;
    }
    return h;
}

std::vector<std::byte> containerAad(ContainerKind kind, const VaultHeader& header)
{
    const auto domain{ domainFor(kind) };
    const auto encoded{ encodeVaultHeader(header) };

    std::vector<std::byte> aad;
    aad.reserve(domain.size() + encoded.size());
    for (const char c : domain)
    {
        aad.push_back(static_cast<std::byte>(c));
    }
    for (const std::uint8_t b : encoded)
    {
        aad.push_back(static_cast<std::byte>(b));
    }
    return aad;
}

std::vector<std::uint8_t> encodeContainer(const VaultHeader& header, std::span<const std::uint8_t> sealedPayload)
{
    const auto encoded{ encodeVaultHeader(header) };
    std::vector<std::uint8_t> out;
    out.reserve(encoded.size() + sealedPayload.size());
    out.insert(out.end(), encoded.begin(), encoded.end());
    out.insert(out.end(), sealedPayload.begin(), sealedPayload.end());
    return out;
}

std::optional<SealedContainer> decodeContainer(std::span<const std::uint8_t> bytes)
{
    if (bytes.size() < g_minContainerBytes)
    {
        return std::nullopt;
    }
    const auto header{ decodeVaultHeader(bytes.first(g_vaultHeaderBytes)) };
    if (!header || header->formatVersion != g_vaultFormatVersion ||
        !lockbox::crypto::isIterationCountAccepted(header->kdf.iterations))
    {
        return std::nullopt;
    }

    SealedContainer out{};
    out.header = *header;
    const auto payload{ bytes.subspan(g_vaultHeaderBytes) };
    out.sealedPayload.assign(payload.begin(), payload.end());
    return out;
}

} // namespace lockbox::core
