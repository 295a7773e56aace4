#ifndef INCLUDE_LOCKBOX_SECURITY_SECUREMEMORY_HPP
#define INCLUDE_LOCKBOX_SECURITY_SECUREMEMORY_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <type_traits>
#include <vector>

namespace lockbox::security
{

// Zeroes memory in a way the optimizer may not elide.
void secureWipe(std::span<std::byte> bytes) noexcept;

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T> values) noexcept
{
    secureWipe(std::as_writable_bytes(values));
}

// Allocator that wipes every block before handing it back to the heap, so
// reallocation and destruction never leave copies of key material behind.
template <class T> struct ZeroAllocator
{
    using value_type = T;
    using is_always_equal = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;
    using propagate_on_container_swap = std::true_type;

    ZeroAllocator() noexcept = default;

    template <class U> constexpr ZeroAllocator([[maybe_unused]] const ZeroAllocator<U>& other) noexcept
    {
    }

    [[nodiscard]] T* allocate(std::size_t n)
    {
        return std::allocator<T>{}.allocate(n);
    }

    void deallocate(T* p, std::size_t n) noexcept
    {
        if (p == nullptr)
        {
            return;
        }
        if (n != 0U)
        {
            secureWipe(std::as_writable_bytes(std::span<T>{ p, n }));
        }
        std::allocator<T>{}.deallocate(p, n);
    }
};

template <class T, class U>
constexpr bool operator==([[maybe_unused]] const ZeroAllocator<T>& a, [[maybe_unused]] const ZeroAllocator<U>& b) noexcept
{
    return true;
}

template <class T> using SecureVector = std::vector<T, ZeroAllocator<T>>;

using SecureBuffer = SecureVector<std::uint8_t>;
using SecureString = SecureVector<char>;

template <class T> [[nodiscard]] std::span<const std::byte> asBytes(const SecureVector<T>& v) noexcept
{
    return std::as_bytes(std::span<const T>{ v });
}

template <class T> [[nodiscard]] std::span<std::byte> asWritableBytes(SecureVector<T>& v) noexcept
{
    return std::as_writable_bytes(std::span<T>{ v });
}

[[nodiscard]] inline std::span<const std::uint8_t> asSpan(const SecureBuffer& b) noexcept
{
    return std::span<const std::uint8_t>{ b };
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    if (s.empty())
    {
        return {};
    }
    return std::string_view{ s.data(), s.size() };
}

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(s.begin(), s.end());
}

[[nodiscard]] inline SecureBuffer secureBufferFrom(std::span<const std::byte> bytes)
{
    SecureBuffer out(bytes.size());
    for (std::size_t i{}; i < bytes.size(); ++i)
    {
        out[i] = std::to_integer<std::uint8_t>(bytes[i]);
    }
    return out;
}

// Wipes the contents and drops the allocation (capacity becomes zero).
template <class T> void secureRelease(SecureVector<T>& v) noexcept
{
    secureWipe(asWritableBytes(v));
    SecureVector<T> empty{};
    v.swap(empty);
}

[[nodiscard]] inline bool secureEquals(std::span<const std::byte> a, std::span<const std::byte> b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }

    volatile unsigned char diff{};
    for (std::size_t i{}; i < a.size(); ++i)
    {
        diff |= std::to_integer<unsigned char>(a[i] ^ b[i]);
    }
    return diff == 0U;
}

[[nodiscard]] inline bool secureEquals(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) noexcept
{
    return secureEquals(std::as_bytes(a), std::as_bytes(b));
}

// Wipes a borrowed byte range when the guard goes out of scope.
class [[nodiscard]] ScopeWipe final
{
public:
    explicit ScopeWipe(std::span<std::byte> bytes) noexcept : m_bytes{ bytes }
    {
    }

    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;
    ScopeWipe(ScopeWipe&& other) noexcept : m_bytes{ other.m_bytes }
    {
        other.release();
    }
    ScopeWipe& operator=(ScopeWipe&&) = delete;

    ~ScopeWipe() noexcept
    {
        secureWipe(m_bytes);
    }

    void release() noexcept
    {
        m_bytes = {};
    }

private:
    std::span<std::byte> m_bytes;
};

template <class T> [[nodiscard]] ScopeWipe scopeWipe(SecureVector<T>& v) noexcept
{
    return ScopeWipe{ asWritableBytes(v) };
}

template <class T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
[[nodiscard]] ScopeWipe scopeWipe(T& object) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(std::span<T, 1>{ &object, 1 }) };
}

} // namespace lockbox::security

#endif // INCLUDE_LOCKBOX_SECURITY_SECUREMEMORY_HPP
