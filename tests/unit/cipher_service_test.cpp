#include "sigil/core/CipherService.hpp"

#include "sigil/core/VaultErrors.hpp"
#include "sigil/crypto/Encoding.hpp"
#include "test_utils/TestUtils.hpp"
#include <array>
#include <gtest/gtest.h>

namespace
{

class CipherServiceTest : public ::testing::Test
{
protected:
    std::unique_ptr<sigil::crypto::ICryptoProvider> m_crypto{ sigil::crypto::providers::makeOpenSslCryptoProvider() }; // NOLINT
    sigil::core::CipherService m_cipher{ *m_crypto };                                                                  // NOLINT
    std::array<std::uint8_t, 32> m_key{ 0x42, 0x01 };                                                                  // NOLINT
    std::array<std::uint8_t, 16> m_nonce{ 0x07, 0x08, 0x09 };                                                          // NOLINT
};

} // namespace

TEST_F(CipherServiceTest, EmptyOrAbsentPlaintextIsNotEncrypted)
{
    EXPECT_FALSE(m_cipher.encrypt(std::nullopt, m_key, m_nonce).has_value());
    EXPECT_FALSE(m_cipher.encrypt(std::string_view{}, m_key, m_nonce).has_value());
}

TEST_F(CipherServiceTest, EnvelopeIsIvTagCiphertextHex)
{
    const auto envelope{ m_cipher.encrypt("s3cret!", m_key, m_nonce) };
    ASSERT_TRUE(envelope.has_value());

    EXPECT_EQ(envelope->size(), sigil::core::g_envelopeHeadHexChars + 2U * 7U);
    EXPECT_TRUE(sigil::crypto::isHex(*envelope));
    EXPECT_EQ(envelope->substr(0, 32), sigil::crypto::toHex(m_nonce));
    EXPECT_EQ(*envelope, sigil::crypto::toHex(sigil::crypto::fromHex(*envelope).value()));
}

TEST_F(CipherServiceTest, DecryptRestoresPlaintext)
{
    const std::string_view text{ "pässwörd ✓" };
    const auto envelope{ m_cipher.encrypt(text, m_key, m_nonce) };
    ASSERT_TRUE(envelope.has_value());

    const auto plain{ m_cipher.decrypt(*envelope, m_key) };
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(sigil::security::asStringView(*plain), text);
}

TEST_F(CipherServiceTest, EmptyOrAbsentEnvelopeDecryptsToNothing)
{
    EXPECT_FALSE(m_cipher.decrypt(std::nullopt, m_key).has_value());
    EXPECT_FALSE(m_cipher.decrypt(std::string_view{}, m_key).has_value());
}

TEST_F(CipherServiceTest, MalformedEnvelopeFailsAuthentication)
{
    EXPECT_THROW((void)m_cipher.decrypt("abcd", m_key), sigil::core::AuthenticationFailure);
    EXPECT_THROW((void)m_cipher.decrypt(std::string(80, 'z'), m_key), sigil::core::AuthenticationFailure);
}

TEST_F(CipherServiceTest, WrongKeyFailsAuthentication)
{
    const auto envelope{ m_cipher.encrypt("value", m_key, m_nonce) };
    ASSERT_TRUE(envelope.has_value());

    auto otherKey{ m_key };
    otherKey[31] ^= 0x01U;
    EXPECT_THROW((void)m_cipher.decrypt(*envelope, otherKey), sigil::core::AuthenticationFailure);
}

TEST_F(CipherServiceTest, TamperedCiphertextFailsAuthentication)
{
    auto envelope{ m_cipher.encrypt("value", m_key, m_nonce).value() };
    char& last{ envelope.back() };
    last = (last == '0') ? '1' : '0';
    EXPECT_THROW((void)m_cipher.decrypt(envelope, m_key), sigil::core::AuthenticationFailure);
}
