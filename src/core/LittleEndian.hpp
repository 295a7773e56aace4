#ifndef LOCKBOX_SRC_CORE_LITTLEENDIAN_HPP
#define LOCKBOX_SRC_CORE_LITTLEENDIAN_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace lockbox::core::detail
{

constexpr std::size_t g_u32Bytes{ sizeof(std::uint32_t) };
constexpr std::size_t g_u64Bytes{ sizeof(std::uint64_t) };
constexpr std::uint64_t g_byteMask{ 0xFFU };
constexpr std::uint64_t g_bitsPerByte{ 8U };

template <std::size_t N, class UInt> void storeLE(std::span<std::uint8_t, N> out, UInt v) noexcept
{
    static_assert(N == sizeof(UInt));
    for (std::size_t i{}; i < N; ++i)
    {
        out[i] = static_cast<std::uint8_t>((static_cast<std::uint64_t>(v) >> (i * g_bitsPerByte)) & g_byteMask);
    }
}

template <class UInt, std::size_t N> [[nodiscard]] UInt loadLE(std::span<const std::uint8_t, N> in) noexcept
{
    static_assert(N == sizeof(UInt));
    std::uint64_t v{ 0U };
    for (std::size_t i{}; i < N; ++i)
    {
        v |= static_cast<std::uint64_t>(in[i]) << (i * g_bitsPerByte);
    }
    return static_cast<UInt>(v);
}

// Appends little-endian fields to any byte vector (plain or zero-on-free).
template <class Buffer> class ByteWriter final
{
public:
    explicit ByteWriter(Buffer& out) noexcept : m_out{ out }
    {
    }

    void u32(std::uint32_t v)
    {
        std::array<std::uint8_t, g_u32Bytes> b{};
        storeLE<g_u32Bytes>(std::span{ b }, v);
        bytes(b);
    }

    void u64(std::uint64_t v)
    {
        std::array<std::uint8_t, g_u64Bytes> b{};
        storeLE<g_u64Bytes>(std::span{ b }, v);
        bytes(b);
    }

    void bytes(std::span<const std::uint8_t> b)
    {
        m_out.insert(m_out.end(), b.begin(), b.end());
    }

    // u32 length prefix followed by the raw characters.
    void text(std::string_view s)
    {
        u32(static_cast<std::uint32_t>(s.size()));
        const auto* p{ reinterpret_cast<const std::uint8_t*>(s.data()) };
        bytes(std::span<const std::uint8_t>{ p, s.size() });
    }

private:
    Buffer& m_out;
};

class ByteReader final
{
public:
    explicit ByteReader(std::span<const std::uint8_t> in) noexcept : m_in{ in }
    {
    }

    [[nodiscard]] bool u32(std::uint32_t& out) noexcept
    {
        const auto b{ take(g_u32Bytes) };
        if (!b)
        {
            return false;
        }
        out = loadLE<std::uint32_t>(b->first<g_u32Bytes>());
        return true;
    }

    [[nodiscard]] bool u64(std::uint64_t& out) noexcept
    {
        const auto b{ take(g_u64Bytes) };
        if (!b)
        {
            return false;
        }
        out = loadLE<std::uint64_t>(b->first<g_u64Bytes>());
        return true;
    }

    [[nodiscard]] bool bytes(std::span<std::uint8_t> out) noexcept
    {
        const auto b{ take(out.size()) };
        if (!b)
        {
            return false;
        }
        for (std::size_t i{}; i < out.size(); ++i)
        {
            out[i] = (*b)[i];
        }
        return true;
    }

    // Length-prefixed text; the view aliases the input buffer.
    [[nodiscard]] std::optional<std::string_view> text() noexcept
    {
        std::uint32_t size{};
        if (!u32(size))
        {
            return std::nullopt;
        }
        const auto b{ take(size) };
        if (!b)
        {
            return std::nullopt;
        }
        return std::string_view{ reinterpret_cast<const char*>(b->data()), b->size() };
    }

    [[nodiscard]] std::optional<std::span<const std::uint8_t>> take(std::size_t n) noexcept
    {
        if (n > remaining())
        {
            return std::nullopt;
        }
        const auto out{ m_in.subspan(m_pos, n) };
        m_pos += n;
        return out;
    }

    [[nodiscard]] std::size_t remaining() const noexcept
    {
        return m_in.size() - m_pos;
    }

    [[nodiscard]] bool atEnd() const noexcept
    {
        return remaining() == 0U;
    }

private:
    std::span<const std::uint8_t> m_in;
    std::size_t m_pos{ 0U };
};

} // namespace lockbox::core::detail

#endif // LOCKBOX_SRC_CORE_LITTLEENDIAN_HPP
