#include "sigil/core/CipherService.hpp"

#include "sigil/core/VaultErrors.hpp"
#include "sigil/crypto/Encoding.hpp"
#include <algorithm>

namespace sigil::core
{

CipherService::CipherService(sigil::crypto::ICryptoProvider& crypto) noexcept : m_crypto(&crypto)
{
}

std::optional<std::string> CipherService::encrypt(std::optional<std::string_view> plaintext,
                                                  std::span<const std::uint8_t> key,
                                                  std::span<const std::uint8_t> nonce) const
{
    if (!plaintext || plaintext->empty())
    {
        return std::nullopt;
    }

    const auto box{ m_crypto->aeadEncrypt(key, nonce, sigil::security::asBytes(*plaintext),
                                          sigil::security::asBytes(g_envelopeAad)) };

    std::string envelope{};
    envelope.reserve(g_envelopeHeadHexChars + 2U * box.cipherText.size());
    envelope += sigil::crypto::toHex(box.nonce);
    envelope += sigil::crypto::toHex(box.tag);
    envelope += sigil::crypto::toHex(box.cipherText);
    return envelope;
}

std::optional<sigil::security::SecureString> CipherService::decrypt(std::optional<std::string_view> envelope,
                                                                    std::span<const std::uint8_t> key) const
{
    if (!envelope || envelope->empty())
    {
        return std::nullopt;
    }
    if (envelope->size() < g_envelopeHeadHexChars || !sigil::crypto::isHex(*envelope))
    {
        throw AuthenticationFailure("malformed envelope");
    }

    constexpr std::size_t kNonceHex{ 2U * sigil::crypto::g_aeadNonceBytes };
    constexpr std::size_t kTagHex{ 2U * sigil::crypto::g_aeadTagBytes };
    const auto nonce{ sigil::crypto::fromHex(envelope->substr(0, kNonceHex)) };
    const auto tag{ sigil::crypto::fromHex(envelope->substr(kNonceHex, kTagHex)) };
    auto cipherText{ sigil::crypto::fromHex(envelope->substr(g_envelopeHeadHexChars)) };
    if (!nonce || !tag || !cipherText)
    {
        throw AuthenticationFailure("malformed envelope");
    }

    sigil::crypto::AeadBox box{};
    std::copy(nonce->begin(), nonce->end(), box.nonce.begin());
    std::copy(tag->begin(), tag->end(), box.tag.begin());
    box.cipherText = std::move(*cipherText);

    auto plain{ m_crypto->aeadDecrypt(key, box, sigil::security::asBytes(g_envelopeAad)) };
    if (!plain)
    {
        throw AuthenticationFailure("authentication tag mismatch");
    }

    auto text{ sigil::security::secureStringFrom(std::span<const std::uint8_t>{ *plain }) };
    sigil::security::secureRelease(*plain);
    return text;
}

} // namespace sigil::core
