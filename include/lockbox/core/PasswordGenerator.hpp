#ifndef INCLUDE_LOCKBOX_CORE_PASSWORDGENERATOR_HPP
#define INCLUDE_LOCKBOX_CORE_PASSWORDGENERATOR_HPP

#include "lockbox/core/VaultError.hpp"
#include "lockbox/security/SecureMemory.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace lockbox::core
{

constexpr std::size_t g_minPasswordLength{ 4U };
constexpr std::size_t g_maxPasswordLength{ 256U };
constexpr std::size_t g_defaultPasswordLength{ 16U };

constexpr std::string_view g_lowercaseChars{ "abcdefghijklmnopqrstuvwxyz" };
constexpr std::string_view g_uppercaseChars{ "ABCDEFGHIJKLMNOPQRSTUVWXYZ" };
constexpr std::string_view g_digitChars{ "0123456789" };
constexpr std::string_view g_symbolChars{ "!@#$%^&*()_+-=[]{}|;:,.<>?" };
constexpr std::string_view g_ambiguousChars{ "0O1lI|" };

struct PasswordPolicy final
{
    std::size_t length{ g_defaultPasswordLength };
    bool lowercase{ true };
    bool uppercase{ true };
    bool digits{ true };
    bool symbols{ true };
    bool excludeAmbiguous{ true };
};

enum class StrengthLevel : std::uint8_t
{
    Weak,
    Medium,
    Strong,
    VeryStrong,
};

struct StrengthEstimate final
{
    double entropyBits{};
    StrengthLevel level{ StrengthLevel::Weak };
};

// Alphabet for a policy; plain alphanumerics when every class is disabled.
[[nodiscard]] std::string alphabetFor(const PasswordPolicy& policy);

// InvalidArgument outside [4, 256]; RandomFailed when the OS CSPRNG fails.
[[nodiscard]] VaultResult<lockbox::security::SecureString> generatePassword(const PasswordPolicy& policy = {}) noexcept;

// length * log2(charset), where charset sums the sizes of the classes present in the password.
[[nodiscard]] StrengthEstimate estimateStrength(std::string_view password) noexcept;

[[nodiscard]] std::string_view strengthName(StrengthLevel level) noexcept;

} // namespace lockbox::core

#endif // INCLUDE_LOCKBOX_CORE_PASSWORDGENERATOR_HPP
