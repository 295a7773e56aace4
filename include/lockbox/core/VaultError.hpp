#ifndef INCLUDE_LOCKBOX_CORE_VAULTERROR_HPP
#define INCLUDE_LOCKBOX_CORE_VAULTERROR_HPP

#include <cstdint>
#include <string_view>
#include <variant>

namespace lockbox::core
{

enum class VaultError : std::uint8_t
{
    AuthenticationFailed,
    LockedOut,
    SessionExpired,
    NotFound,
    TokenExpired,
    IntegrityFailure,
    TamperDetected,
    AlreadyExists,
    InvalidArgument,
    StorageError,
    RandomFailed,
    CryptoError,
};

template <class T> using VaultResult = std::variant<T, VaultError>;

// Fixed user-facing message. Never carries caller data.
[[nodiscard]] std::string_view describe(VaultError error) noexcept;

// Stable identifier used in diagnostic log lines.
[[nodiscard]] std::string_view errorName(VaultError error) noexcept;

template <class T> [[nodiscard]] bool isError(const VaultResult<T>& r) noexcept
{
    return std::holds_alternative<VaultError>(r);
}

} // namespace lockbox::core

#endif // INCLUDE_LOCKBOX_CORE_VAULTERROR_HPP
