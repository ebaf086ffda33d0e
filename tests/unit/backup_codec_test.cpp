#include "sigil/core/BackupCodec.hpp"

#include "test_utils/TestUtils.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>

namespace
{

using sigil::core::VaultError;
using sigil::security::asStringView;
using sigil::test_utils::errorOf;
using sigil::test_utils::expectValue;
using sigil::test_utils::secure;

class BackupCodecTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_userId = m_harness.makeUser();
    }

    sigil::core::VaultEngine& engine()
    {
        return *m_harness.engine;
    }

    std::string addSecret(std::string_view title, std::string_view value)
    {
        sigil::core::SecretMetadata metadata{};
        metadata.title = std::string{ title };
        sigil::core::SecretFields fields{};
        fields.identifier = secure("alice");
        fields.secretValue = secure(value);
        return expectValue(engine().createSecret(m_userId, metadata, fields, m_password)).id;
    }

    // Seals `document` the way exportBackup does, so the importer sees a correctly keyed payload.
    [[nodiscard]] std::string sealDocument(std::string_view document,
                                           sigil::core::BackupScheme scheme = sigil::core::BackupScheme::AuthenticatedGcm)
    {
        auto& crypto{ *m_harness.crypto };
        std::vector<std::uint8_t> payload(sigil::core::g_backupSaltBytes + sigil::core::g_backupIvBytes);
        EXPECT_TRUE(crypto.randomBytes(std::span<std::uint8_t>{ payload }));

        const std::span<const std::uint8_t> salt{ payload.data(), sigil::core::g_backupSaltBytes };
        const std::span<const std::uint8_t> iv{ payload.data() + sigil::core::g_backupSaltBytes,
                                                sigil::core::g_backupIvBytes };
        const auto key{ crypto.derivePbkdf2Sha256(sigil::security::asBytes(m_password), salt,
                                                  engine().config().backupPbkdf2Iterations,
                                                  sigil::crypto::g_aeadKeyBytes) };
        const std::span<const std::byte> plain{ reinterpret_cast<const std::byte*>(document.data()),
                                                document.size() };
        if (scheme == sigil::core::BackupScheme::LegacyCbc)
        {
            const auto body{ crypto.cbcEncrypt(key, iv, plain) };
            payload.insert(payload.end(), body.begin(), body.end());
        }
        else
        {
            const auto box{ crypto.aeadEncrypt(key, iv, plain, std::span<const std::byte>{}) };
            payload.insert(payload.end(), box.cipherText.begin(), box.cipherText.end());
            payload.insert(payload.end(), box.tag.begin(), box.tag.end());
        }
        return sigil::crypto::toBase64(payload);
    }

    sigil::test_utils::EngineHarness m_harness;                                            // NOLINT
    std::string m_userId;                                                                  // NOLINT
    sigil::security::SecureString m_password{ secure(sigil::test_utils::g_testPassword) }; // NOLINT
};

} // namespace

TEST_F(BackupCodecTest, EmptyVaultExportsEmptyDocument)
{
    const auto artifact{ expectValue(engine().exportBackup(m_userId, m_password)) };
    EXPECT_EQ(artifact.metadata.totalCredentials, 0U);
    EXPECT_EQ(artifact.metadata.totalVersions, 0U);
    EXPECT_EQ(artifact.metadata.totalNotes, 0U);
    EXPECT_EQ(artifact.metadata.formatVersion, "2.0");
    EXPECT_EQ(artifact.metadata.backupSize, artifact.data.size());

    const auto parsed{ expectValue(engine().importBackup(artifact.data, m_password)) };
    EXPECT_EQ(parsed.version, "1.0");
    EXPECT_EQ(parsed.metadata.formatVersion, "2.0");
    EXPECT_EQ(parsed.scheme, sigil::core::BackupScheme::AuthenticatedGcm);
    EXPECT_EQ(parsed.user.id, m_userId);
    EXPECT_EQ(parsed.user.email, "alice@example.com");
    EXPECT_TRUE(parsed.secrets.empty());
    EXPECT_TRUE(parsed.versions.empty());
    EXPECT_TRUE(parsed.notes.empty());
}

TEST_F(BackupCodecTest, ExportNeedsTheMasterPassword)
{
    EXPECT_EQ(errorOf(engine().exportBackup(m_userId, secure(sigil::test_utils::g_wrongPassword))),
              VaultError::InvalidMasterPassword);
    EXPECT_EQ(errorOf(engine().exportBackup("nobody", m_password)), VaultError::UserNotFound);
}

TEST_F(BackupCodecTest, EveryExportIsFreshlySalted)
{
    (void)addSecret("Mail", "pw-1");
    const auto first{ expectValue(engine().exportBackup(m_userId, m_password)) };
    const auto second{ expectValue(engine().exportBackup(m_userId, m_password)) };
    EXPECT_NE(first.data, second.data);
}

TEST_F(BackupCodecTest, ImportKeepsEnvelopesVerbatim)
{
    const auto id{ addSecret("Mail", "pw-1") };
    const auto stored{ m_harness.storage->loadSecret(m_userId, id).value() };

    const auto artifact{ expectValue(engine().exportBackup(m_userId, m_password)) };
    const auto parsed{ expectValue(engine().importBackup(artifact.data, m_password)) };

    ASSERT_EQ(parsed.secrets.size(), 1U);
    EXPECT_EQ(parsed.secrets[0].id, id);
    EXPECT_EQ(parsed.secrets[0].metadata.title, "Mail");
    EXPECT_EQ(parsed.secrets[0].envelope.encryptedSecretValue, stored.envelope.encryptedSecretValue);
    EXPECT_EQ(parsed.secrets[0].envelope.salt, stored.envelope.salt);
    ASSERT_EQ(parsed.versions.size(), 1U);
    EXPECT_EQ(parsed.versions[0].secretId, id);
    EXPECT_EQ(parsed.versions[0].version, 1U);
    EXPECT_EQ(parsed.metadata.totalCredentials, 1U);
}

TEST_F(BackupCodecTest, RestoreRecreatesSecretsVersionsAndNotes)
{
    const auto id{ addSecret("Mail", "pw-1") };
    sigil::core::SecretChanges changes{};
    changes.secretValue = secure("pw-2");
    (void)expectValue(engine().updateSecret(m_userId, id, changes, m_password));

    sigil::core::NoteDraft note{};
    note.title = "Safe";
    note.content = secure("combination");
    note.isSecure = true;
    (void)expectValue(engine().createNote(m_userId, note, m_password));

    const auto artifact{ expectValue(engine().exportBackup(m_userId, m_password)) };
    EXPECT_EQ(artifact.metadata.totalCredentials, 1U);
    EXPECT_EQ(artifact.metadata.totalVersions, 2U);
    EXPECT_EQ(artifact.metadata.totalNotes, 1U);

    const auto target{ m_harness.makeUser("restore@example.com") };
    const auto summary{ expectValue(engine().restoreBackup(target, artifact.data, m_password)) };
    EXPECT_EQ(summary.secretsRestored, 1U);
    EXPECT_EQ(summary.versionsRestored, 2U);
    EXPECT_EQ(summary.versionsDropped, 0U);
    EXPECT_EQ(summary.notesRestored, 1U);

    const auto secrets{ expectValue(engine().listSecrets(target)) };
    ASSERT_EQ(secrets.size(), 1U);
    EXPECT_NE(secrets[0].id, id);
    EXPECT_EQ(asStringView(expectValue(engine().getSecret(target, secrets[0].id, m_password)).secretValue), "pw-2");
    EXPECT_EQ(asStringView(expectValue(engine().decryptVersion(target, secrets[0].id, 1U, m_password)).secretValue),
              "pw-1");

    const auto notes{ expectValue(engine().listNotes(target)) };
    ASSERT_EQ(notes.size(), 1U);
    EXPECT_EQ(asStringView(expectValue(engine().getNote(target, notes[0].id, m_password)).content), "combination");
}

TEST_F(BackupCodecTest, VersionsOfDeletedSecretsAreDroppedOnRestore)
{
    (void)addSecret("Keep", "pw-keep");
    const auto gone{ addSecret("Gone", "pw-gone") };
    (void)expectValue(engine().deleteSecret(m_userId, gone));

    const auto artifact{ expectValue(engine().exportBackup(m_userId, m_password)) };
    EXPECT_EQ(artifact.metadata.totalCredentials, 1U);
    EXPECT_EQ(artifact.metadata.totalVersions, 3U);

    const auto summary{ expectValue(engine().restoreBackup(m_userId, artifact.data, m_password)) };
    EXPECT_EQ(summary.secretsRestored, 1U);
    EXPECT_EQ(summary.versionsRestored, 1U);
    EXPECT_EQ(summary.versionsDropped, 2U);
}

TEST_F(BackupCodecTest, RestoreIntoDropsOrphanVersions)
{
    sigil::core::ParsedBackup backup{};
    sigil::core::SecretVersion orphan{};
    orphan.id = "v-1";
    orphan.secretId = "not-in-backup";
    orphan.version = 1U;
    orphan.metadata.title = "Orphan";
    backup.versions.push_back(orphan);

    const auto summary{ expectValue(engine().restoreInto(m_userId, backup)) };
    EXPECT_EQ(summary.secretsRestored, 0U);
    EXPECT_EQ(summary.versionsRestored, 0U);
    EXPECT_EQ(summary.versionsDropped, 1U);

    EXPECT_EQ(errorOf(engine().restoreInto("nobody", backup)), VaultError::UserNotFound);
}

TEST_F(BackupCodecTest, WrongPasswordCannotImport)
{
    (void)addSecret("Mail", "pw-1");
    const auto artifact{ expectValue(engine().exportBackup(m_userId, m_password)) };
    EXPECT_EQ(errorOf(engine().importBackup(artifact.data, secure(sigil::test_utils::g_wrongPassword))),
              VaultError::InvalidMasterPassword);
}

TEST_F(BackupCodecTest, TamperedArtifactIsRejected)
{
    const auto artifact{ expectValue(engine().exportBackup(m_userId, m_password)) };
    auto payload{ sigil::crypto::fromBase64(artifact.data).value() };
    payload[sigil::core::g_backupSaltBytes + sigil::core::g_backupIvBytes] ^= 0x01U;

    EXPECT_EQ(errorOf(engine().importBackup(sigil::crypto::toBase64(payload), m_password)),
              VaultError::InvalidMasterPassword);
}

TEST_F(BackupCodecTest, MalformedArtifactIsCorrupt)
{
    EXPECT_EQ(errorOf(engine().importBackup("this is not base64!", m_password)), VaultError::CorruptArtifact);
    EXPECT_EQ(errorOf(engine().importBackup("", m_password)), VaultError::CorruptArtifact);

    const std::vector<std::uint8_t> tooShort(40U, 0x41U);
    EXPECT_EQ(errorOf(engine().importBackup(sigil::crypto::toBase64(tooShort), m_password)),
              VaultError::CorruptArtifact);
}

TEST_F(BackupCodecTest, DecryptableNonBackupIsCorrupt)
{
    EXPECT_EQ(errorOf(engine().importBackup(sealDocument("plain text, not json"), m_password)),
              VaultError::CorruptArtifact);
    EXPECT_EQ(errorOf(engine().importBackup(sealDocument(R"({"hello":"world"})"), m_password)),
              VaultError::CorruptArtifact);
    EXPECT_EQ(errorOf(engine().importBackup(sealDocument(R"({"version":"2.0","credentials":{},"versions":[]})"),
                                            m_password)),
              VaultError::CorruptArtifact);
}

TEST_F(BackupCodecTest, MinimalDocumentImports)
{
    const auto parsed{ expectValue(
        engine().importBackup(sealDocument(R"({"version":"1.0","credentials":[],"versions":[]})"), m_password)) };
    EXPECT_EQ(parsed.version, "1.0");
    EXPECT_EQ(parsed.metadata.formatVersion, "2.0");
    EXPECT_TRUE(parsed.notes.empty());
}

TEST_F(BackupCodecTest, DeclaredFormatMustMatchTheEnvelope)
{
    const auto document{ R"({"version":"1.0","credentials":[],"versions":[],"metadata":{"formatVersion":"1.0"}})" };
    EXPECT_EQ(errorOf(engine().importBackup(sealDocument(document), m_password)), VaultError::CorruptArtifact);

    const auto parsed{ expectValue(
        engine().importBackup(sealDocument(document, sigil::core::BackupScheme::LegacyCbc), m_password)) };
    EXPECT_EQ(parsed.scheme, sigil::core::BackupScheme::LegacyCbc);
    EXPECT_EQ(parsed.metadata.formatVersion, "1.0");
}

TEST_F(BackupCodecTest, NonPositiveVersionNumbersAreCorrupt)
{
    const auto withVersion{ [](std::string_view number) {
        return std::string{ R"({"version":"1.0","credentials":[],"versions":[{"id":"v","credentialId":"c","version":)" } +
               std::string{ number } +
               R"(,"title":"t","password":"00","encryptionKey":"00","iv":"00","salt":"00"}]})";
    } };

    EXPECT_EQ(errorOf(engine().importBackup(sealDocument(withVersion("0")), m_password)), VaultError::CorruptArtifact);
    EXPECT_EQ(errorOf(engine().importBackup(sealDocument(withVersion("-3")), m_password)), VaultError::CorruptArtifact);
    EXPECT_EQ(errorOf(engine().importBackup(sealDocument(withVersion("4294967296")), m_password)),
              VaultError::CorruptArtifact);
    EXPECT_EQ(expectValue(engine().importBackup(sealDocument(withVersion("7")), m_password)).versions.at(0).version, 7U);
}

// Documents written by the first release carry no key material for secure notes.
TEST_F(BackupCodecTest, LegacySecureNotesWithoutKeyMaterialAreSkipped)
{
    const auto secretId{ addSecret("Mail", "pw-1") };
    const auto stored{ m_harness.storage->loadSecret(m_userId, secretId).value() };

    nlohmann::json credential = {
        { "id", "legacy-secret" },
        { "title", "Mail" },
        { "description", nullptr },
        { "category", "Work" },
        { "isFavorite", false },
        { "username", stored.envelope.encryptedIdentifier.value() },
        { "password", stored.envelope.encryptedSecretValue },
        { "notes", nullptr },
        { "encryptionKey", stored.envelope.keyFingerprint },
        { "iv", stored.envelope.iv },
        { "salt", stored.envelope.salt },
        { "createdAt", "2024-01-01T00:00:00.000Z" },
        { "updatedAt", "2024-01-01T00:00:00.000Z" },
    };
    nlohmann::json document = {
        { "version", "1.0" },
        { "timestamp", "2024-01-02T00:00:00.000Z" },
        { "user", { { "id", "old-user" }, { "email", "alice@example.com" } } },
        { "credentials", nlohmann::json::array({ credential }) },
        { "versions", nlohmann::json::array() },
        { "notes", nlohmann::json::array({
                       { { "id", "n1" }, { "title", "Shopping" }, { "content", "milk" }, { "isSecure", false } },
                       { { "id", "n2" }, { "title", "Safe" }, { "content", "deadbeef" }, { "isSecure", true } },
                   }) },
        { "metadata", { { "totalCredentials", 1 }, { "totalVersions", 0 }, { "totalNotes", 2 }, { "backupSize", 0 } } },
    };

    const auto artifact{ sealDocument(document.dump(), sigil::core::BackupScheme::LegacyCbc) };
    const auto parsed{ expectValue(engine().importBackup(artifact, m_password)) };
    EXPECT_EQ(parsed.metadata.formatVersion, "1.0");
    ASSERT_EQ(parsed.secrets.size(), 1U);
    ASSERT_EQ(parsed.notes.size(), 1U);
    EXPECT_EQ(parsed.notes[0].title, "Shopping");
    EXPECT_EQ(parsed.notesDropped, 1U);

    const auto target{ m_harness.makeUser("restore@example.com") };
    const auto summary{ expectValue(engine().restoreBackup(target, artifact, m_password)) };
    EXPECT_EQ(summary.secretsRestored, 1U);
    EXPECT_EQ(summary.notesRestored, 1U);
    EXPECT_EQ(summary.notesDropped, 1U);

    const auto secrets{ expectValue(engine().listSecrets(target)) };
    ASSERT_EQ(secrets.size(), 1U);
    EXPECT_EQ(asStringView(expectValue(engine().getSecret(target, secrets[0].id, m_password)).secretValue), "pw-1");
}

TEST(BackupCodecLegacyTest, CbcArtifactImportsAnywhere)
{
    auto legacyConfig{ sigil::test_utils::engineConfigForTests() };
    legacyConfig.backupScheme = sigil::core::BackupScheme::LegacyCbc;
    sigil::test_utils::EngineHarness legacy{ legacyConfig };
    const auto userId{ legacy.makeUser() };
    const auto password{ secure(sigil::test_utils::g_testPassword) };

    sigil::core::SecretMetadata metadata{};
    metadata.title = "Old";
    sigil::core::SecretFields fields{};
    fields.secretValue = secure("legacy-pw");
    (void)expectValue(legacy.engine->createSecret(userId, metadata, fields, password));

    const auto artifact{ expectValue(legacy.engine->exportBackup(userId, password)) };
    EXPECT_EQ(artifact.metadata.formatVersion, "1.0");

    sigil::test_utils::EngineHarness current{};
    const auto target{ current.makeUser() };
    const auto parsed{ expectValue(current.engine->importBackup(artifact.data, password)) };
    EXPECT_EQ(parsed.version, "1.0");
    EXPECT_EQ(parsed.metadata.formatVersion, "1.0");
    EXPECT_EQ(parsed.scheme, sigil::core::BackupScheme::LegacyCbc);
    ASSERT_EQ(parsed.secrets.size(), 1U);

    (void)expectValue(current.engine->restoreInto(target, parsed));
    const auto secrets{ expectValue(current.engine->listSecrets(target)) };
    ASSERT_EQ(secrets.size(), 1U);
    EXPECT_EQ(asStringView(expectValue(current.engine->getSecret(target, secrets[0].id, password)).secretValue),
              "legacy-pw");

    EXPECT_EQ(errorOf(current.engine->importBackup(artifact.data, secure(sigil::test_utils::g_wrongPassword))),
              VaultError::InvalidMasterPassword);
}
