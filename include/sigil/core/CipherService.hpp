#ifndef INCLUDE_SIGIL_CORE_CIPHERSERVICE_HPP
#define INCLUDE_SIGIL_CORE_CIPHERSERVICE_HPP

#include "sigil/crypto/ICryptoProvider.hpp"
#include "sigil/security/SecureMemory.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace sigil::core
{

// Fixed associated data bound into every field envelope.
inline constexpr std::string_view g_envelopeAad{ "password-manager" };

// hex(IV16) || hex(TAG16), the fixed-width head of every envelope.
constexpr std::size_t g_envelopeHeadHexChars{ 2U * (sigil::crypto::g_aeadNonceBytes + sigil::crypto::g_aeadTagBytes) };

// Seals single text fields with AES-256-GCM into hex(IV) || hex(TAG) || hex(CT).
class CipherService final
{
public:
    explicit CipherService(sigil::crypto::ICryptoProvider& crypto) noexcept;

    // Absent or empty plaintext yields std::nullopt and nothing is encrypted.
    [[nodiscard]] std::optional<std::string> encrypt(std::optional<std::string_view> plaintext,
                                                     std::span<const std::uint8_t> key,
                                                     std::span<const std::uint8_t> nonce) const;

    // Absent or empty envelope yields std::nullopt. Throws AuthenticationFailure on a malformed
    // envelope or a tag mismatch.
    [[nodiscard]] std::optional<sigil::security::SecureString> decrypt(std::optional<std::string_view> envelope,
                                                                       std::span<const std::uint8_t> key) const;

private:
    sigil::crypto::ICryptoProvider* m_crypto{ nullptr };
};

} // namespace sigil::core

#endif // INCLUDE_SIGIL_CORE_CIPHERSERVICE_HPP
