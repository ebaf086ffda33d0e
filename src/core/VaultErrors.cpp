#include "sigil/core/VaultErrors.hpp"

namespace sigil::core
{

std::string_view toString(VaultError error) noexcept
{
    switch (error)
    {
    case VaultError::DerivationFailure:
        return "DerivationFailure";
    case VaultError::InvalidMasterPassword:
        return "InvalidMasterPassword";
    case VaultError::AuthenticationFailure:
        return "AuthenticationFailure";
    case VaultError::CorruptArtifact:
        return "CorruptArtifact";
    case VaultError::SecretNotFound:
        return "SecretNotFound";
    case VaultError::VersionNotFound:
        return "VersionNotFound";
    case VaultError::NoteNotFound:
        return "NoteNotFound";
    case VaultError::UserNotFound:
        return "UserNotFound";
    case VaultError::MasterPasswordNotSet:
        return "MasterPasswordNotSet";
    case VaultError::MasterPasswordRequired:
        return "MasterPasswordRequired";
    case VaultError::WeakMasterPassword:
        return "WeakMasterPassword";
    case VaultError::InvalidArgument:
        return "InvalidArgument";
    case VaultError::RandomFailed:
        return "RandomFailed";
    case VaultError::StorageError:
        return "StorageError";
    case VaultError::CryptoError:
        return "CryptoError";
    }
    return "Unknown";
}

std::string_view userMessage(VaultError error) noexcept
{
    switch (error)
    {
    case VaultError::InvalidMasterPassword:
    case VaultError::AuthenticationFailure:
    case VaultError::DerivationFailure:
        return "wrong master password or corrupted data";
    case VaultError::CorruptArtifact:
        return "backup file is damaged or not a backup";
    case VaultError::SecretNotFound:
        return "secret not found";
    case VaultError::VersionNotFound:
        return "version not found";
    case VaultError::NoteNotFound:
        return "note not found";
    case VaultError::UserNotFound:
        return "user not found";
    case VaultError::MasterPasswordNotSet:
        return "master password has not been configured";
    case VaultError::MasterPasswordRequired:
        return "current master password is required";
    case VaultError::WeakMasterPassword:
        return "master password must be at least 8 characters";
    case VaultError::InvalidArgument:
        return "invalid argument";
    case VaultError::RandomFailed:
        return "system random generator failed";
    case VaultError::StorageError:
        return "storage error";
    case VaultError::CryptoError:
        return "cryptographic operation failed";
    }
    return "unknown error";
}

} // namespace sigil::core
