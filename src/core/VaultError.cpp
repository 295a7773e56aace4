#include "lockbox/core/VaultError.hpp"

namespace lockbox::core
{

std::string_view describe(VaultError error) noexcept
{
    switch (error)
    {
    case VaultError::AuthenticationFailed:
        return "Authentication failed.";
    case VaultError::LockedOut:
        return "Too many failed attempts. Try again later.";
    case VaultError::SessionExpired:
        return "Session expired. Unlock the vault again.";
    case VaultError::NotFound:
        return "Not found.";
    case VaultError::TokenExpired:
        return "Share link expired or already used.";
    case VaultError::IntegrityFailure:
        return "Data failed integrity verification.";
    case VaultError::TamperDetected:
        return "Audit log tampering detected.";
    case VaultError::AlreadyExists:
        return "A vault already exists at this location.";
    case VaultError::InvalidArgument:
        return "Invalid input.";
    case VaultError::StorageError:
        return "Storage error.";
    case VaultError::RandomFailed:
        return "Secure random generator unavailable.";
    case VaultError::CryptoError:
        return "Cryptographic backend error.";
    }
    return "Unknown error.";
}

std::string_view errorName(VaultError error) noexcept
{
    switch (error)
    {
    case VaultError::AuthenticationFailed:
        return "AuthenticationFailed";
    case VaultError::LockedOut:
        return "LockedOut";
    case VaultError::SessionExpired:
        return "SessionExpired";
    case VaultError::NotFound:
        return "NotFound";
    case VaultError::TokenExpired:
        return "TokenExpired";
    case VaultError::IntegrityFailure:
        return "IntegrityFailure";
    case VaultError::TamperDetected:
        return "TamperDetected";
    case VaultError::AlreadyExists:
        return "AlreadyExists";
    case VaultError::InvalidArgument:
        return "InvalidArgument";
    case VaultError::StorageError:
        return "StorageError";
    case VaultError::RandomFailed:
        return "RandomFailed";
    case VaultError::CryptoError:
        return "CryptoError";
    }
    return "Unknown";
}

} // namespace lockbox::core
