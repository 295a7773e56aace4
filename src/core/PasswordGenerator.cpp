#include "lockbox/core/PasswordGenerator.hpp"
#include "lockbox/core/Logging.hpp"
#include "lockbox/security/SecureRandom.hpp"
#include <algorithm>
#include <cmath>
#include <exception>

namespace lockbox::core
{
namespace
{

constexpr double g_weakBelowBits{ 30.0 };
constexpr double g_mediumBelowBits{ 60.0 };
constexpr double g_strongBelowBits{ 90.0 };

[[nodiscard]] bool containsAny(std::string_view haystack, std::string_view set) noexcept
{
    return haystack.find_first_of(set) != std::string_view::npos;
}

} // namespace

std::string alphabetFor(const PasswordPolicy& policy)
{
    std::string chars{};
    if (policy.lowercase)
    {
        chars += g_lowercaseChars;
    }
    if (policy.uppercase)
    {
        chars += g_uppercaseChars;
    }
    if (policy.digits)
    {
        chars += g_digitChars;
    }
    if (policy.symbols)
    {
        chars += g_symbolChars;
    }
    if (policy.excludeAmbiguous)
    {
        std::erase_if(chars, [](char c) { return g_ambiguousChars.find(c) != std::string_view::npos; });
    }

    if (chars.empty())
    {
        chars.append(g_lowercaseChars).append(g_uppercaseChars).append(g_digitChars);
    }
    return chars;
}

VaultResult<lockbox::security::SecureString> generatePassword(const PasswordPolicy& policy) noexcept
{
    if (policy.length < g_minPasswordLength || policy.length > g_maxPasswordLength)
    {
        return VaultError::InvalidArgument;
    }

    try
    {
        const std::string alphabet{ alphabetFor(policy) };
        lockbox::security::SecureString out(policy.length);
        for (char& c : out)
        {
            std::uint64_t index{};
            if (!lockbox::security::secureRandomBounded(static_cast<std::uint64_t>(alphabet.size()), index))
            {
                lockbox::security::secureRelease(out);
                return VaultError::RandomFailed;
            }
            c = alphabet[static_cast<std::size_t>(index)];
        }
        return out;
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "password_generation_failed", e.what());
        return VaultError::RandomFailed;
    }
}

StrengthEstimate estimateStrength(std::string_view password) noexcept
{
    std::size_t charset{};
    if (containsAny(password, g_lowercaseChars))
    {
        charset += g_lowercaseChars.size();
    }
    if (containsAny(password, g_uppercaseChars))
    {
        charset += g_uppercaseChars.size();
    }
    if (containsAny(password, g_digitChars))
    {
        charset += g_digitChars.size();
    }
    if (containsAny(password, g_symbolChars))
    {
        charset += g_symbolChars.size();
    }

    StrengthEstimate estimate{};
    if (charset == 0U || password.empty())
    {
        return estimate;
    }
    estimate.entropyBits = static_cast<double>(password.size()) * std::log2(static_cast<double>(charset));

    if (estimate.entropyBits < g_weakBelowBits)
    {
        estimate.level = StrengthLevel::Weak;
    }
    else if (estimate.entropyBits < g_mediumBelowBits)
    {
        estimate.level = StrengthLevel::Medium;
    }
    else if (estimate.entropyBits < g_strongBelowBits)
    {
        estimate.level = StrengthLevel::Strong;
    }
    else
    {
        estimate.level = StrengthLevel::VeryStrong;
    }
    return estimate;
}

std::string_view strengthName(StrengthLevel level) noexcept
{
    switch (level)
    {
    case StrengthLevel::Weak:
        return "weak";
    case StrengthLevel::Medium:
        return "medium";
    case StrengthLevel::Strong:
        return "strong";
    case StrengthLevel::VeryStrong:
        return "very_strong";
    }
    return "unknown";
}

} // namespace lockbox::core
