#include "sigil/crypto/providers/OpenSslProviderFactory.hpp"

#include "sigil/crypto/KeyDerivation.hpp"
#include "sigil/security/SecureMemory.hpp"
#include "sigil/security/SecureRandom.hpp"
#include <algorithm>
#include <array>
#include <climits>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <openssl/evp.h>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

namespace sigil::crypto::providers
{
namespace
{

using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

void requireExactSize(std::span<const std::uint8_t> s, std::size_t expected, const char* what)
{
    if (s.size() != expected)
    {
        throw std::invalid_argument(what);
    }
}

void requireIntSize(std::size_t size, const char* what)
{
    if (size > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        throw std::invalid_argument(what);
    }
}

[[nodiscard]] EvpCipherCtxPtr newCipherCtx(const char* what)
{
    EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
    if (!ctx)
    {
        throw std::runtime_error(what);
    }
    return ctx;
}

class OpenSslCryptoProvider final : public sigil::crypto::ICryptoProvider
{
public:
    [[nodiscard]] sigil::security::SecureBuffer deriveArgon2id(std::span<const std::byte> password,
                                                               std::span<const std::byte> salt,
                                                               const Argon2idParams& params) const override
    {
        return sigil::crypto::deriveKeyArgon2id(password, salt, params);
    }

    [[nodiscard]] sigil::security::SecureBuffer derivePbkdf2Sha256(std::span<const std::byte> password,
                                                                   std::span<const std::uint8_t> salt,
                                                                   std::uint32_t iterations,
                                                                   std::size_t outBytes) const override
    {
        if (iterations == 0U || iterations > static_cast<std::uint32_t>(INT_MAX))
        {
            throw std::invalid_argument("pbkdf2: invalid iteration count");
        }
        if (outBytes == 0U)
        {
            throw std::invalid_argument("pbkdf2: invalid output size");
        }
        requireIntSize(password.size(), "pbkdf2: password too large");
        requireIntSize(salt.size(), "pbkdf2: salt too large");
        requireIntSize(outBytes, "pbkdf2: output too large");

        sigil::security::SecureBuffer out(outBytes);
        const auto* pass{ reinterpret_cast<const char*>(password.data()) };
        if (PKCS5_PBKDF2_HMAC(pass, static_cast<int>(password.size()), salt.data(), static_cast<int>(salt.size()),
                              static_cast<int>(iterations), EVP_sha256(), static_cast<int>(out.size()),
                              out.data()) != 1)
        {
            throw std::runtime_error("pbkdf2: PKCS5_PBKDF2_HMAC failed");
        }
        return out;
    }

    [[nodiscard]] Sha256Digest sha256(std::span<const std::uint8_t> data) const override
    {
        Sha256Digest digest{};
        unsigned int written{ 0U };
        if (EVP_Digest(data.data(), data.size(), digest.data(), &written, EVP_sha256(), nullptr) != 1 ||
            written != digest.size())
        {
            throw std::runtime_error("sha256: EVP_Digest failed");
        }
        return digest;
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return sigil::security::secureRandomFill(out);
    }

    [[nodiscard]] AeadBox aeadEncrypt(std::span<const std::uint8_t> key, std::span<const std::uint8_t> nonce,
                                      std::span<const std::byte> plainText,
                                      std::span<const std::byte> associatedData) override
    {
        requireExactSize(key, g_aeadKeyBytes, "aeadEncrypt: key");
        requireExactSize(nonce, g_aeadNonceBytes, "aeadEncrypt: nonce");
        requireIntSize(plainText.size(), "aeadEncrypt: plainText too large");
        requireIntSize(associatedData.size(), "aeadEncrypt: associatedData too large");

        AeadBox box{};
        std::copy(nonce.begin(), nonce.end(), box.nonce.begin());

        auto ctx{ newCipherCtx("aeadEncrypt: EVP_CIPHER_CTX_new failed") };
        if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1)
        {
            throw std::runtime_error("aeadEncrypt: EVP_EncryptInit_ex failed");
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(box.nonce.size()), nullptr) != 1)
        {
            throw std::runtime_error("aeadEncrypt: set ivlen failed");
        }
        if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), box.nonce.data()) != 1)
        {
            throw std::runtime_error("aeadEncrypt: set key/nonce failed");
        }

        int len{ 0 };
        if (!associatedData.empty() &&
            EVP_EncryptUpdate(ctx.get(), nullptr, &len, reinterpret_cast<const unsigned char*>(associatedData.data()),
                              static_cast<int>(associatedData.size())) != 1)
        {
            throw std::runtime_error("aeadEncrypt: add aad failed");
        }

        box.cipherText.resize(plainText.size());
        int outLen{ 0 };
        if (!plainText.empty() &&
            EVP_EncryptUpdate(ctx.get(), box.cipherText.data(), &outLen,
                              reinterpret_cast<const unsigned char*>(plainText.data()),
                              static_cast<int>(plainText.size())) != 1)
        {
            throw std::runtime_error("aeadEncrypt: encrypt update failed");
        }

        // GCM is a stream mode; Final only flushes the tag computation.
        std::array<unsigned char, 16> tail{};
        int finalLen{ 0 };
        if (EVP_EncryptFinal_ex(ctx.get(), tail.data(), &finalLen) != 1 || finalLen != 0 ||
            static_cast<std::size_t>(outLen) != plainText.size())
        {
            throw std::runtime_error("aeadEncrypt: encrypt final failed");
        }

        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(box.tag.size()), box.tag.data()) != 1)
        {
            throw std::runtime_error("aeadEncrypt: get tag failed");
        }
        return box;
    }

    [[nodiscard]] std::optional<sigil::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const AeadBox& box,
                std::span<const std::byte> associatedData) override
    {
        requireExactSize(key, g_aeadKeyBytes, "aeadDecrypt: key");
        requireIntSize(associatedData.size(), "aeadDecrypt: associatedData too large");
        requireIntSize(box.cipherText.size(), "aeadDecrypt: cipherText too large");

        auto ctx{ newCipherCtx("aeadDecrypt: EVP_CIPHER_CTX_new failed") };
        if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1)
        {
            throw std::runtime_error("aeadDecrypt: EVP_DecryptInit_ex failed");
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(box.nonce.size()), nullptr) != 1)
        {
            throw std::runtime_error("aeadDecrypt: set ivlen failed");
        }
        if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), box.nonce.data()) != 1)
        {
            throw std::runtime_error("aeadDecrypt: set key/nonce failed");
        }

        int len{ 0 };
        if (!associatedData.empty() &&
            EVP_DecryptUpdate(ctx.get(), nullptr, &len, reinterpret_cast<const unsigned char*>(associatedData.data()),
                              static_cast<int>(associatedData.size())) != 1)
        {
            throw std::runtime_error("aeadDecrypt: add aad failed");
        }

        sigil::security::SecureBuffer plainText(box.cipherText.size());
        int outLen{ 0 };
        if (!box.cipherText.empty() &&
            EVP_DecryptUpdate(ctx.get(), plainText.data(), &outLen, box.cipherText.data(),
                              static_cast<int>(box.cipherText.size())) != 1)
        {
            sigil::security::secureRelease(plainText);
            return std::nullopt;
        }

        std::array<std::uint8_t, g_aeadTagBytes> tagCopy{ box.tag };
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tagCopy.size()), tagCopy.data()) != 1)
        {
            throw std::runtime_error("aeadDecrypt: set tag failed");
        }

        std::array<unsigned char, 16> tail{};
        int finalLen{ 0 };
        if (EVP_DecryptFinal_ex(ctx.get(), tail.data(), &finalLen) != 1 ||
            static_cast<std::size_t>(outLen) != plainText.size())
        {
            sigil::security::secureRelease(plainText);
            return std::nullopt;
        }
        return plainText;
    }

    [[nodiscard]] std::vector<std::uint8_t> cbcEncrypt(std::span<const std::uint8_t> key,
                                                       std::span<const std::uint8_t> iv,
                                                       std::span<const std::byte> plainText) override
    {
        requireExactSize(key, g_aeadKeyBytes, "cbcEncrypt: key");
        requireExactSize(iv, g_cbcIvBytes, "cbcEncrypt: iv");
        requireIntSize(plainText.size() + g_cbcIvBytes, "cbcEncrypt: plainText too large");

        auto ctx{ newCipherCtx("cbcEncrypt: EVP_CIPHER_CTX_new failed") };
        if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != 1)
        {
            throw std::runtime_error("cbcEncrypt: EVP_EncryptInit_ex failed");
        }

        std::vector<std::uint8_t> out(plainText.size() + g_cbcIvBytes);
        int outLen{ 0 };
        if (EVP_EncryptUpdate(ctx.get(), out.data(), &outLen, reinterpret_cast<const unsigned char*>(plainText.data()),
                              static_cast<int>(plainText.size())) != 1)
        {
            throw std::runtime_error("cbcEncrypt: encrypt update failed");
        }
        int finalLen{ 0 };
        if (EVP_EncryptFinal_ex(ctx.get(), out.data() + outLen, &finalLen) != 1)
        {
            throw std::runtime_error("cbcEncrypt: encrypt final failed");
        }
        out.resize(static_cast<std::size_t>(outLen) + static_cast<std::size_t>(finalLen));
        return out;
    }

    [[nodiscard]] std::optional<sigil::security::SecureBuffer> cbcDecrypt(
        std::span<const std::uint8_t> key, std::span<const std::uint8_t> iv,
        std::span<const std::uint8_t> cipherText) override
    {
        requireExactSize(key, g_aeadKeyBytes, "cbcDecrypt: key");
        requireExactSize(iv, g_cbcIvBytes, "cbcDecrypt: iv");
        requireIntSize(cipherText.size() + g_cbcIvBytes, "cbcDecrypt: cipherText too large");
        if (cipherText.empty() || (cipherText.size() % g_cbcIvBytes) != 0U)
        {
            return std::nullopt;
        }

        auto ctx{ newCipherCtx("cbcDecrypt: EVP_CIPHER_CTX_new failed") };
        if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != 1)
        {
            throw std::runtime_error("cbcDecrypt: EVP_DecryptInit_ex failed");
        }

        sigil::security::SecureBuffer plainText(cipherText.size() + g_cbcIvBytes);
        int outLen{ 0 };
        if (EVP_DecryptUpdate(ctx.get(), plainText.data(), &outLen, cipherText.data(),
                              static_cast<int>(cipherText.size())) != 1)
        {
            sigil::security::secureRelease(plainText);
            return std::nullopt;
        }
        int finalLen{ 0 };
        if (EVP_DecryptFinal_ex(ctx.get(), plainText.data() + outLen, &finalLen) != 1)
        {
            sigil::security::secureRelease(plainText);
            return std::nullopt;
        }

        const std::size_t total{ static_cast<std::size_t>(outLen) + static_cast<std::size_t>(finalLen) };
        sigil::security::secureWipe(std::span{ plainText }.subspan(total));
        plainText.resize(total);
        return plainText;
    }
};

} // namespace

std::unique_ptr<sigil::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

} // namespace sigil::crypto::providers
