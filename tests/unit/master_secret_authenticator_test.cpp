#include "sigil/core/MasterSecretAuthenticator.hpp"

#include "sigil/core/RecordIds.hpp"
#include "test_utils/TestUtils.hpp"
#include <gtest/gtest.h>
#include <functional>
#include <optional>
#include <vector>

namespace
{

using sigil::core::VaultError;
using sigil::test_utils::errorOf;
using sigil::test_utils::expectValue;
using sigil::test_utils::secure;

class MasterSecretAuthenticatorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        sigil::core::UserProfile user{};
        user.id = sigil::core::makeRecordId();
        user.email = "alice@example.com";
        user.createdAt = sigil::core::isoTimestampNow();
        m_storage->insertUser(user);
        m_userId = user.id;
    }

    std::unique_ptr<sigil::crypto::ICryptoProvider> m_crypto{ sigil::crypto::providers::makeOpenSslCryptoProvider() }; // NOLINT
    std::unique_ptr<sigil::storage::IStorageRepository> m_storage{
        sigil::storage::sqlite::makeSqliteStorageRepository(":memory:")
    };                                                                                                  // NOLINT
    sigil::log::NullLogger m_logger;                                                                   // NOLINT
    sigil::core::KeyDerivationService m_kdf{ *m_crypto, sigil::test_utils::argon2idParamsForTests() }; // NOLINT
    sigil::core::MasterSecretAuthenticator m_auth{ m_kdf, *m_storage, m_logger };                      // NOLINT
    std::string m_userId;                                                                              // NOLINT
};

// Forwards to a real repository and lets a competing writer commit right before each transaction.
class InterleavingRepository final : public sigil::storage::IStorageRepository
{
public:
    explicit InterleavingRepository(sigil::storage::IStorageRepository& inner) noexcept : m_inner(inner)
    {
    }

    std::function<void()> beforeTransaction; // NOLINT

    void insertUser(const sigil::core::UserProfile& user) override
    {
        m_inner.insertUser(user);
    }
    [[nodiscard]] std::optional<sigil::core::UserProfile> loadUser(std::string_view userId) const override
    {
        return m_inner.loadUser(userId);
    }
    [[nodiscard]] std::optional<sigil::core::MasterKeyRecord> loadMasterKey(std::string_view userId) const override
    {
        return m_inner.loadMasterKey(userId);
    }
    void storeMasterKey(std::string_view userId, const sigil::core::MasterKeyRecord& record) override
    {
        m_inner.storeMasterKey(userId, record);
    }
    void insertSecret(const sigil::core::SecretRecord& secret) override
    {
        m_inner.insertSecret(secret);
    }
    void updateSecret(const sigil::core::SecretRecord& secret) override
    {
        m_inner.updateSecret(secret);
    }
    [[nodiscard]] std::optional<sigil::core::SecretRecord> loadSecret(std::string_view userId,
                                                                     std::string_view secretId) const override
    {
        return m_inner.loadSecret(userId, secretId);
    }
    [[nodiscard]] std::vector<sigil::core::SecretRecord> listSecrets(std::string_view userId,
                                                                    bool includeInactive) const override
    {
        return m_inner.listSecrets(userId, includeInactive);
    }
    [[nodiscard]] sigil::core::SecretVersion appendVersion(const sigil::core::SecretVersion& draft) override
    {
        return m_inner.appendVersion(draft);
    }
    void insertVersion(const sigil::core::SecretVersion& version) override
    {
        m_inner.insertVersion(version);
    }
    [[nodiscard]] std::optional<sigil::core::SecretVersion> loadVersion(std::string_view userId, std::string_view secretId,
                                                                       std::uint32_t version) const override
    {
        return m_inner.loadVersion(userId, secretId, version);
    }
    [[nodiscard]] std::vector<sigil::core::SecretVersion> listVersions(std::string_view userId,
                                                                      std::string_view secretId) const override
    {
        return m_inner.listVersions(userId, secretId);
    }
    [[nodiscard]] std::vector<sigil::core::SecretVersion> listAllVersions(std::string_view userId) const override
    {
        return m_inner.listAllVersions(userId);
    }
    void insertNote(const sigil::core::NoteRecord& note) override
    {
        m_inner.insertNote(note);
    }
    void updateNote(const sigil::core::NoteRecord& note) override
    {
        m_inner.updateNote(note);
    }
    [[nodiscard]] std::optional<sigil::core::NoteRecord> loadNote(std::string_view userId,
                                                                 std::string_view noteId) const override
    {
        return m_inner.loadNote(userId, noteId);
    }
    [[nodiscard]] std::vector<sigil::core::NoteRecord> listNotes(std::string_view userId) const override
    {
        return m_inner.listNotes(userId);
    }
    [[nodiscard]] bool softDeleteNote(std::string_view userId, std::string_view noteId,
                                      std::string_view deletedAt) override
    {
        return m_inner.softDeleteNote(userId, noteId, deletedAt);
    }
    void runInTransaction(const std::function<void()>& work) override
    {
        if (beforeTransaction)
        {
            auto competing{ std::move(beforeTransaction) };
            beforeTransaction = nullptr;
            competing();
        }
        m_inner.runInTransaction(work);
    }

private:
    sigil::storage::IStorageRepository& m_inner;
};

} // namespace

TEST_F(MasterSecretAuthenticatorTest, FreshUserHasNoMasterPassword)
{
    EXPECT_FALSE(expectValue(m_auth.hasMasterPassword(m_userId)));
    EXPECT_EQ(errorOf(m_auth.verifyUser(m_userId, secure(sigil::test_utils::g_testPassword))),
              VaultError::MasterPasswordNotSet);
}

TEST_F(MasterSecretAuthenticatorTest, UnknownUserIsReported)
{
    EXPECT_EQ(errorOf(m_auth.hasMasterPassword("nobody")), VaultError::UserNotFound);
    EXPECT_EQ(errorOf(m_auth.verifyUser("nobody", secure(sigil::test_utils::g_testPassword))),
              VaultError::UserNotFound);
    EXPECT_EQ(errorOf(m_auth.setOrChange("nobody", std::nullopt, secure(sigil::test_utils::g_testPassword))),
              VaultError::UserNotFound);
}

TEST_F(MasterSecretAuthenticatorTest, ShortPasswordIsWeak)
{
    EXPECT_EQ(errorOf(m_auth.setOrChange(m_userId, std::nullopt, secure("seven77"))), VaultError::WeakMasterPassword);
    EXPECT_FALSE(expectValue(m_auth.hasMasterPassword(m_userId)));
}

TEST_F(MasterSecretAuthenticatorTest, LengthCountsCharactersNotBytes)
{
    // Seven two-byte characters: fourteen bytes, still too short.
    EXPECT_EQ(errorOf(m_auth.setOrChange(m_userId, std::nullopt, secure("\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9"))),
              VaultError::WeakMasterPassword);
    (void)expectValue(
        m_auth.setOrChange(m_userId, std::nullopt, secure("\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9")));
}

TEST_F(MasterSecretAuthenticatorTest, SetStoresSaltAndFingerprint)
{
    const auto record{ expectValue(m_auth.setOrChange(m_userId, std::nullopt, secure(sigil::test_utils::g_testPassword))) };
    EXPECT_EQ(record.salt.size(), 64U);
    EXPECT_EQ(record.fingerprint.size(), 64U);

    const auto stored{ m_storage->loadMasterKey(m_userId) };
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->salt, record.salt);
    EXPECT_EQ(stored->fingerprint, record.fingerprint);
    EXPECT_TRUE(expectValue(m_auth.hasMasterPassword(m_userId)));
}

TEST_F(MasterSecretAuthenticatorTest, VerifyAcceptsOnlyTheConfiguredPassword)
{
    (void)expectValue(m_auth.setOrChange(m_userId, std::nullopt, secure(sigil::test_utils::g_testPassword)));

    EXPECT_FALSE(errorOf(m_auth.verifyUser(m_userId, secure(sigil::test_utils::g_testPassword))).has_value());
    EXPECT_EQ(errorOf(m_auth.verifyUser(m_userId, secure(sigil::test_utils::g_wrongPassword))),
              VaultError::InvalidMasterPassword);

    const auto stored{ m_storage->loadMasterKey(m_userId).value() };
    EXPECT_TRUE(m_auth.verify(secure(sigil::test_utils::g_testPassword), stored.fingerprint, stored.salt));
    EXPECT_FALSE(m_auth.verify(secure(sigil::test_utils::g_wrongPassword), stored.fingerprint, stored.salt));
    EXPECT_THROW((void)m_auth.verify(secure(sigil::test_utils::g_testPassword), stored.fingerprint, "zz"),
                 sigil::core::DerivationFailure);
}

TEST_F(MasterSecretAuthenticatorTest, VerifyAndDeriveReturnsMatchingKey)
{
    (void)expectValue(m_auth.setOrChange(m_userId, std::nullopt, secure(sigil::test_utils::g_testPassword)));
    const auto stored{ m_storage->loadMasterKey(m_userId).value() };

    const auto key{ m_auth.verifyAndDerive(secure(sigil::test_utils::g_testPassword), stored.fingerprint, stored.salt) };
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key->fingerprint, stored.fingerprint);
    EXPECT_EQ(key->key.size(), 32U);
}

TEST_F(MasterSecretAuthenticatorTest, ChangeRequiresCurrentPassword)
{
    (void)expectValue(m_auth.setOrChange(m_userId, std::nullopt, secure(sigil::test_utils::g_testPassword)));

    EXPECT_EQ(errorOf(m_auth.setOrChange(m_userId, std::nullopt, secure("another-password"))),
              VaultError::MasterPasswordRequired);
    EXPECT_EQ(errorOf(m_auth.setOrChange(m_userId, secure(""), secure("another-password"))),
              VaultError::MasterPasswordRequired);
    EXPECT_EQ(errorOf(m_auth.setOrChange(m_userId, secure(sigil::test_utils::g_wrongPassword),
                                         secure("another-password"))),
              VaultError::InvalidMasterPassword);
}

TEST_F(MasterSecretAuthenticatorTest, ChangeRegeneratesSalt)
{
    const auto first{ expectValue(m_auth.setOrChange(m_userId, std::nullopt, secure(sigil::test_utils::g_testPassword))) };
    const auto second{ expectValue(
        m_auth.setOrChange(m_userId, secure(sigil::test_utils::g_testPassword), secure(sigil::test_utils::g_testPassword))) };

    EXPECT_NE(first.salt, second.salt);
    EXPECT_NE(first.fingerprint, second.fingerprint);
    EXPECT_FALSE(errorOf(m_auth.verifyUser(m_userId, secure(sigil::test_utils::g_testPassword))).has_value());
}

TEST_F(MasterSecretAuthenticatorTest, RotationRunsWithBothPasswords)
{
    (void)expectValue(m_auth.setOrChange(m_userId, std::nullopt, secure(sigil::test_utils::g_testPassword)));

    std::string seenCurrent;
    std::string seenReplacement;
    const sigil::core::MasterKeyRotation rotation{ [&](const sigil::security::SecureString& current,
                                                       const sigil::security::SecureString& replacement)
                                                       -> std::optional<VaultError> {
        seenCurrent = std::string{ sigil::security::asStringView(current) };
        seenReplacement = std::string{ sigil::security::asStringView(replacement) };
        return std::nullopt;
    } };

    (void)expectValue(m_auth.setOrChange(m_userId, secure(sigil::test_utils::g_testPassword),
                                         secure("another-password"), rotation));
    EXPECT_EQ(seenCurrent, sigil::test_utils::g_testPassword);
    EXPECT_EQ(seenReplacement, "another-password");
    EXPECT_FALSE(errorOf(m_auth.verifyUser(m_userId, secure("another-password"))).has_value());
}

TEST_F(MasterSecretAuthenticatorTest, FailedRotationKeepsOldPassword)
{
    const auto original{ expectValue(
        m_auth.setOrChange(m_userId, std::nullopt, secure(sigil::test_utils::g_testPassword))) };

    const sigil::core::MasterKeyRotation failing{ [](const sigil::security::SecureString&,
                                                     const sigil::security::SecureString&) -> std::optional<VaultError> {
        return VaultError::AuthenticationFailure;
    } };

    EXPECT_EQ(errorOf(m_auth.setOrChange(m_userId, secure(sigil::test_utils::g_testPassword),
                                         secure("another-password"), failing)),
              VaultError::AuthenticationFailure);

    const auto stored{ m_storage->loadMasterKey(m_userId).value() };
    EXPECT_EQ(stored.salt, original.salt);
    EXPECT_FALSE(errorOf(m_auth.verifyUser(m_userId, secure(sigil::test_utils::g_testPassword))).has_value());
}

TEST_F(MasterSecretAuthenticatorTest, RotationIsSkippedOnFirstSet)
{
    bool called{ false };
    const sigil::core::MasterKeyRotation rotation{ [&called](const sigil::security::SecureString&,
                                                             const sigil::security::SecureString&)
                                                       -> std::optional<VaultError> {
        called = true;
        return std::nullopt;
    } };

    (void)expectValue(m_auth.setOrChange(m_userId, std::nullopt, secure(sigil::test_utils::g_testPassword), rotation));
    EXPECT_FALSE(called);
}

TEST_F(MasterSecretAuthenticatorTest, ChangeChecksTheRecordCommittedBeforeIt)
{
    (void)expectValue(m_auth.setOrChange(m_userId, std::nullopt, secure(sigil::test_utils::g_testPassword)));

    InterleavingRepository interleaving{ *m_storage };
    sigil::core::MasterSecretAuthenticator racing{ m_kdf, interleaving, m_logger };
    interleaving.beforeTransaction = [this]() {
        (void)expectValue(
            m_auth.setOrChange(m_userId, secure(sigil::test_utils::g_testPassword), secure("winner-password")));
    };

    bool rotated{ false };
    const sigil::core::MasterKeyRotation rotation{ [&rotated](const sigil::security::SecureString&,
                                                              const sigil::security::SecureString&)
                                                       -> std::optional<VaultError> {
        rotated = true;
        return std::nullopt;
    } };
    EXPECT_EQ(errorOf(racing.setOrChange(m_userId, secure(sigil::test_utils::g_testPassword), secure("loser-password"),
                                         rotation)),
              VaultError::InvalidMasterPassword);
    EXPECT_FALSE(rotated);

    EXPECT_FALSE(errorOf(m_auth.verifyUser(m_userId, secure("winner-password"))).has_value());
    EXPECT_EQ(errorOf(m_auth.verifyUser(m_userId, secure("loser-password"))), VaultError::InvalidMasterPassword);
}
