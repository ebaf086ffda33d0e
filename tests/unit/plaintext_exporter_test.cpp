#include "sigil/core/PlaintextExporter.hpp"

#include "test_utils/TestUtils.hpp"
#include <algorithm>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace
{

using sigil::core::VaultError;
using sigil::security::asStringView;
using sigil::test_utils::errorOf;
using sigil::test_utils::expectValue;
using sigil::test_utils::secure;

class PlaintextExporterTest : public ::testing::Test
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
        fields.secretValue = secure(value);
        return expectValue(engine().createSecret(m_userId, metadata, fields, m_password)).id;
    }

    [[nodiscard]] static nlohmann::json parse(const sigil::core::PlaintextExport& exported)
    {
        const auto text{ asStringView(exported.document) };
        return nlohmann::json::parse(text.begin(), text.end());
    }

    sigil::test_utils::EngineHarness m_harness; // NOLINT
    std::string m_userId;                       // NOLINT
    sigil::security::SecureString m_password{ secure(sigil::test_utils::g_testPassword) }; // NOLINT
};

} // namespace

TEST_F(PlaintextExporterTest, ContainsDecryptedSecretsAndNotes)
{
    sigil::core::SecretMetadata metadata{};
    metadata.title = "Bank";
    metadata.description = "checking";
    metadata.category = "Finance";
    metadata.isFavorite = true;
    sigil::core::SecretFields fields{};
    fields.identifier = secure("alice");
    fields.secretValue = secure("s3cret-value");
    fields.notes = secure("pin 1234");
    const auto secret{ expectValue(engine().createSecret(m_userId, metadata, fields, m_password)) };

    sigil::core::NoteDraft plain{};
    plain.title = "Groceries";
    plain.content = secure("milk");
    plain.tags = { "home" };
    (void)expectValue(engine().createNote(m_userId, plain));

    sigil::core::NoteDraft sealed{};
    sealed.title = "Safe";
    sealed.content = secure("combination 12-34-56");
    sealed.isSecure = true;
    (void)expectValue(engine().createNote(m_userId, sealed, m_password));

    const auto exported{ expectValue(engine().exportPlaintext(m_userId, m_password)) };
    EXPECT_EQ(exported.credentials, 1U);
    EXPECT_EQ(exported.notes, 2U);

    const auto doc = parse(exported);
    EXPECT_TRUE(doc.at("exportedAt").is_string());
    ASSERT_EQ(doc.at("credentials").size(), 1U);
    const auto& credential = doc.at("credentials").at(0);
    EXPECT_EQ(credential.at("id"), secret.id);
    EXPECT_EQ(credential.at("title"), "Bank");
    EXPECT_EQ(credential.at("description"), "checking");
    EXPECT_EQ(credential.at("category"), "Finance");
    EXPECT_EQ(credential.at("username"), "alice");
    EXPECT_EQ(credential.at("password"), "s3cret-value");
    EXPECT_EQ(credential.at("notes"), "pin 1234");
    EXPECT_TRUE(credential.at("isFavorite").get<bool>());
    EXPECT_FALSE(credential.contains("encryptionKey"));

    std::vector<std::string> contents{};
    for (const auto& note : doc.at("notes"))
    {
        EXPECT_FALSE(note.contains("iv"));
        contents.push_back(note.at("title").get<std::string>() + "=" + note.at("content").get<std::string>());
    }
    std::sort(contents.begin(), contents.end());
    EXPECT_EQ(contents, (std::vector<std::string>{ "Groceries=milk", "Safe=combination 12-34-56" }));
}

TEST_F(PlaintextExporterTest, MissingOptionalFieldsAreNull)
{
    (void)addSecret("Bare", "value-only");

    const auto doc = parse(expectValue(engine().exportPlaintext(m_userId, m_password)));
    const auto& credential = doc.at("credentials").at(0);
    EXPECT_TRUE(credential.at("username").is_null());
    EXPECT_TRUE(credential.at("notes").is_null());
    EXPECT_TRUE(credential.at("description").is_null());
    EXPECT_EQ(credential.at("category"), sigil::core::g_defaultCategory);
    EXPECT_TRUE(doc.at("notes").empty());
}

TEST_F(PlaintextExporterTest, DeletedSecretsAreLeftOut)
{
    (void)addSecret("Keep", "kept-value");
    const auto goneId{ addSecret("Gone", "gone-value") };
    (void)expectValue(engine().deleteSecret(m_userId, goneId));

    const auto exported{ expectValue(engine().exportPlaintext(m_userId, m_password)) };
    EXPECT_EQ(exported.credentials, 1U);
    EXPECT_EQ(asStringView(exported.document).find("gone-value"), std::string_view::npos);
    EXPECT_EQ(parse(exported).at("credentials").at(0).at("title"), "Keep");
}

TEST_F(PlaintextExporterTest, RequiresTheMasterPassword)
{
    (void)addSecret("Bank", "s3cret-value");

    EXPECT_EQ(errorOf(engine().exportPlaintext(m_userId, secure(sigil::test_utils::g_wrongPassword))),
              VaultError::InvalidMasterPassword);
    EXPECT_EQ(errorOf(engine().exportPlaintext("no-such-user", m_password)), VaultError::UserNotFound);

    const auto unset{ expectValue(engine().createUser("bob@example.com", "Bob", "Example")) };
    EXPECT_EQ(errorOf(engine().exportPlaintext(unset.id, m_password)), VaultError::MasterPasswordNotSet);
}

TEST_F(PlaintextExporterTest, SecretThatFailsToOpenAbortsTheExport)
{
    (void)addSecret("Fine", "fine-value");
    const auto brokenId{ addSecret("Broken", "broken-value") };

    auto broken{ m_harness.storage->loadSecret(m_userId, brokenId).value() };
    auto& sealed{ broken.envelope.encryptedSecretValue };
    sealed.back() = sealed.back() == '0' ? '1' : '0';
    m_harness.storage->updateSecret(broken);

    EXPECT_EQ(errorOf(engine().exportPlaintext(m_userId, m_password)), VaultError::AuthenticationFailure);
}
