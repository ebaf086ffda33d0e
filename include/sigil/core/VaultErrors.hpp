#ifndef INCLUDE_SIGIL_CORE_VAULTERRORS_HPP
#define INCLUDE_SIGIL_CORE_VAULTERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string_view>
#include <variant>

namespace sigil::core
{

enum class VaultError : std::uint8_t
{
    DerivationFailure,
    InvalidMasterPassword,
    AuthenticationFailure,
    CorruptArtifact,
    SecretNotFound,
    VersionNotFound,
    NoteNotFound,
    UserNotFound,
    MasterPasswordNotSet,
    MasterPasswordRequired,
    WeakMasterPassword,
    InvalidArgument,
    RandomFailed,
    StorageError,
    CryptoError,
};

template <class T> using VaultResult = std::variant<T, VaultError>;

template <class T> [[nodiscard]] bool isError(const VaultResult<T>& result) noexcept
{
    return std::holds_alternative<VaultError>(result);
}

// Internal name, for logs.
[[nodiscard]] std::string_view toString(VaultError error) noexcept;

// Text shown to a caller. Wrong password and tampered ciphertext are indistinguishable here.
[[nodiscard]] std::string_view userMessage(VaultError error) noexcept;

// Key derivation primitive failed (bad salt, bad parameters, OOM inside the KDF).
class DerivationFailure final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// AEAD tag mismatch or malformed ciphertext envelope.
class AuthenticationFailure final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class RandomFailure final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace sigil::core

#endif // INCLUDE_SIGIL_CORE_VAULTERRORS_HPP
