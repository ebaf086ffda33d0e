#ifndef INCLUDE_SIGIL_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_SIGIL_CRYPTO_ICRYPTOPROVIDER_HPP

#include "sigil/crypto/KeyDerivation.hpp"
#include "sigil/security/SecureMemory.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace sigil::crypto
{

constexpr std::size_t g_aeadKeyBytes{ 32 };
constexpr std::size_t g_aeadNonceBytes{ 16 };
constexpr std::size_t g_aeadTagBytes{ 16 };
constexpr std::size_t g_cbcIvBytes{ 16 };
constexpr std::size_t g_sha256Bytes{ 32 };

using Sha256Digest = std::array<std::uint8_t, g_sha256Bytes>;

struct AeadBox final
{
    std::array<std::uint8_t, g_aeadNonceBytes> nonce{};
    std::array<std::uint8_t, g_aeadTagBytes> tag{};
    std::vector<std::uint8_t> cipherText;
};

class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    // Contract violations throw std::invalid_argument, primitive failures std::runtime_error.
    [[nodiscard]] virtual sigil::security::SecureBuffer
    deriveArgon2id(std::span<const std::byte> password, std::span<const std::byte> salt,
                   const Argon2idParams& params) const = 0;

    [[nodiscard]] virtual sigil::security::SecureBuffer derivePbkdf2Sha256(std::span<const std::byte> password,
                                                                           std::span<const std::uint8_t> salt,
                                                                           std::uint32_t iterations,
                                                                           std::size_t outBytes) const = 0;

    [[nodiscard]] virtual Sha256Digest sha256(std::span<const std::uint8_t> data) const = 0;

    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;

    // AES-256-GCM with a caller-chosen 16-byte nonce.
    [[nodiscard]] virtual AeadBox aeadEncrypt(std::span<const std::uint8_t> key, std::span<const std::uint8_t> nonce,
                                              std::span<const std::byte> plainText,
                                              std::span<const std::byte> associatedData) = 0;

    // Returns std::nullopt on authentication failure.
    [[nodiscard]] virtual std::optional<sigil::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const AeadBox& box, std::span<const std::byte> associatedData) = 0;

    // AES-256-CBC with PKCS#7 padding.
    [[nodiscard]] virtual std::vector<std::uint8_t> cbcEncrypt(std::span<const std::uint8_t> key,
                                                               std::span<const std::uint8_t> iv,
                                                               std::span<const std::byte> plainText) = 0;

    // Returns std::nullopt when the padding does not check out.
    [[nodiscard]] virtual std::optional<sigil::security::SecureBuffer> cbcDecrypt(
        std::span<const std::uint8_t> key, std::span<const std::uint8_t> iv, std::span<const std::uint8_t> cipherText) = 0;
};

} // namespace sigil::crypto

#endif // INCLUDE_SIGIL_CRYPTO_ICRYPTOPROVIDER_HPP
