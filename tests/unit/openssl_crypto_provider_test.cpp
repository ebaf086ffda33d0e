#include "sigil/crypto/providers/OpenSslProviderFactory.hpp"

#include "sigil/crypto/Encoding.hpp"
#include "sigil/security/SecureMemory.hpp"
#include <algorithm>
#include <array>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace
{

std::span<const std::uint8_t> asU8(std::string_view s)
{
    return { reinterpret_cast<const std::uint8_t*>(s.data()), s.size() };
}

std::vector<std::uint8_t> hex(std::string_view text)
{
    auto bytes{ sigil::crypto::fromHex(text) };
    EXPECT_TRUE(bytes.has_value());
    return bytes.value_or(std::vector<std::uint8_t>{});
}

class OpenSslCryptoProviderTest : public ::testing::Test
{
protected:
    std::unique_ptr<sigil::crypto::ICryptoProvider> m_crypto{ sigil::crypto::providers::makeOpenSslCryptoProvider() }; // NOLINT
    std::array<std::uint8_t, sigil::crypto::g_aeadKeyBytes> m_key{ 0x11 };     // NOLINT
    std::array<std::uint8_t, sigil::crypto::g_aeadNonceBytes> m_nonce{ 0x22 }; // NOLINT
};

} // namespace

TEST_F(OpenSslCryptoProviderTest, Sha256MatchesKnownVector)
{
    const auto digest{ m_crypto->sha256(asU8("abc")) };
    EXPECT_EQ(sigil::crypto::toHex(digest), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(OpenSslCryptoProviderTest, Pbkdf2MatchesKnownVector)
{
    const auto key{ m_crypto->derivePbkdf2Sha256(sigil::security::asBytes(std::string_view{ "password" }),
                                                 asU8("salt"), 1U, 32U) };
    EXPECT_EQ(sigil::crypto::toHex(key), "120fb6cffcf8b32c43e7225256c4f837a86548c92ccc35480805987cb70be17b");
}

TEST_F(OpenSslCryptoProviderTest, Pbkdf2RejectsZeroIterations)
{
    EXPECT_THROW((void)m_crypto->derivePbkdf2Sha256(sigil::security::asBytes(std::string_view{ "password" }),
                                                    asU8("salt"), 0U, 32U),
                 std::invalid_argument);
}

TEST_F(OpenSslCryptoProviderTest, AeadRoundTripKeepsNonce)
{
    const std::string_view aad{ "password-manager" };
    const auto box{ m_crypto->aeadEncrypt(m_key, m_nonce, sigil::security::asBytes(std::string_view{ "hello" }),
                                          sigil::security::asBytes(aad)) };
    EXPECT_EQ(box.nonce, m_nonce);
    EXPECT_EQ(box.cipherText.size(), 5U);

    const auto plain{ m_crypto->aeadDecrypt(m_key, box, sigil::security::asBytes(aad)) };
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(sigil::security::asStringView(sigil::security::secureStringFrom(std::span<const std::uint8_t>{ *plain })),
              "hello");
}

TEST_F(OpenSslCryptoProviderTest, AeadRejectsTamperingAndWrongAad)
{
    const std::string_view aad{ "password-manager" };
    auto box{ m_crypto->aeadEncrypt(m_key, m_nonce, sigil::security::asBytes(std::string_view{ "hello" }),
                                    sigil::security::asBytes(aad)) };

    EXPECT_FALSE(m_crypto->aeadDecrypt(m_key, box, sigil::security::asBytes(std::string_view{ "other" })).has_value());

    box.tag[0] ^= 0x01U;
    EXPECT_FALSE(m_crypto->aeadDecrypt(m_key, box, sigil::security::asBytes(aad)).has_value());
    box.tag[0] ^= 0x01U;

    box.cipherText[0] ^= 0x80U;
    EXPECT_FALSE(m_crypto->aeadDecrypt(m_key, box, sigil::security::asBytes(aad)).has_value());
}

TEST_F(OpenSslCryptoProviderTest, AeadRejectsWrongKeyOrNonceSize)
{
    const std::array<std::uint8_t, 16> shortKey{};
    const std::array<std::uint8_t, 12> shortNonce{};
    EXPECT_THROW((void)m_crypto->aeadEncrypt(shortKey, m_nonce, {}, {}), std::invalid_argument);
    EXPECT_THROW((void)m_crypto->aeadEncrypt(m_key, shortNonce, {}, {}), std::invalid_argument);
}

TEST_F(OpenSslCryptoProviderTest, CbcMatchesNistFirstBlock)
{
    // SP 800-38A F.2.5; PKCS#7 adds a second block.
    const auto key{ hex("603deb1015ca71be2b73aef0857d77811f352c073b6108d72d9810a30914dff4") };
    const auto iv{ hex("000102030405060708090a0b0c0d0e0f") };
    const auto plain{ hex("6bc1bee22e409f96e93d7e117393172a") };

    const auto cipher{ m_crypto->cbcEncrypt(key, iv, std::as_bytes(std::span{ plain })) };
    ASSERT_EQ(cipher.size(), 32U);
    EXPECT_EQ(sigil::crypto::toHex(std::span{ cipher }.first(16)), "f58c4c04d6e5f1ba779eabfb5f7bfbd6");

    const auto back{ m_crypto->cbcDecrypt(key, iv, cipher) };
    ASSERT_TRUE(back.has_value());
    EXPECT_TRUE(std::equal(back->begin(), back->end(), plain.begin(), plain.end()));
}

TEST_F(OpenSslCryptoProviderTest, CbcDecryptRejectsPartialBlocks)
{
    const std::array<std::uint8_t, 16> iv{};
    const std::array<std::uint8_t, 15> partial{};
    EXPECT_FALSE(m_crypto->cbcDecrypt(m_key, iv, partial).has_value());
    EXPECT_FALSE(m_crypto->cbcDecrypt(m_key, iv, std::span<const std::uint8_t>{}).has_value());
}

TEST_F(OpenSslCryptoProviderTest, RandomBytesFillsBuffer)
{
    std::array<std::uint8_t, 32> a{};
    std::array<std::uint8_t, 32> b{};
    ASSERT_TRUE(m_crypto->randomBytes(a));
    ASSERT_TRUE(m_crypto->randomBytes(b));
    EXPECT_NE(a, b);
}
