#ifndef INCLUDE_SIGIL_CORE_KEYDERIVATIONSERVICE_HPP
#define INCLUDE_SIGIL_CORE_KEYDERIVATIONSERVICE_HPP

#include "sigil/crypto/ICryptoProvider.hpp"
#include "sigil/crypto/KeyDerivation.hpp"
#include "sigil/security/SecureMemory.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace sigil::core
{

constexpr std::size_t g_kdfSaltBytes{ 32 };
constexpr std::size_t g_fieldNonceBytes{ 16 };

struct DerivedKey final
{
    sigil::security::SecureBuffer key;
    std::string fingerprint; // lowercase hex SHA-256 of `key`
};

class KeyDerivationService final
{
public:
    KeyDerivationService(sigil::crypto::ICryptoProvider& crypto, sigil::crypto::Argon2idParams params) noexcept;

    // Argon2id over the 32-byte hex salt. Throws DerivationFailure; never retries.
    [[nodiscard]] DerivedKey derive(const sigil::security::SecureString& password, std::string_view saltHex) const;

    [[nodiscard]] std::string fingerprintOf(std::span<const std::uint8_t> key) const;

    // Fresh 64-hex-char salt. Throws RandomFailure.
    [[nodiscard]] std::string generateSalt();

    // Fresh 32-hex-char nonce. Throws RandomFailure.
    [[nodiscard]] std::string generateNonce();

    [[nodiscard]] const sigil::crypto::Argon2idParams& params() const noexcept
    {
        return m_params;
    }

private:
    [[nodiscard]] std::string randomHex(std::size_t bytes);

    sigil::crypto::ICryptoProvider* m_crypto{ nullptr };
    sigil::crypto::Argon2idParams m_params{};
};

} // namespace sigil::core

#endif // INCLUDE_SIGIL_CORE_KEYDERIVATIONSERVICE_HPP
