#include "sigil/core/NoteService.hpp"

#include "test_utils/TestUtils.hpp"
#include <gtest/gtest.h>

namespace
{

using sigil::core::VaultError;
using sigil::security::asStringView;
using sigil::test_utils::errorOf;
using sigil::test_utils::expectValue;
using sigil::test_utils::secure;

class NoteServiceTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_userId = m_harness.makeUser();
    }

    [[nodiscard]] static sigil::core::NoteDraft draft(std::string_view title, std::string_view content,
                                                      bool isSecure = false)
    {
        sigil::core::NoteDraft out{};
        out.title = std::string{ title };
        out.content = secure(content);
        out.isSecure = isSecure;
        return out;
    }

    sigil::core::VaultEngine& engine()
    {
        return *m_harness.engine;
    }

    sigil::test_utils::EngineHarness m_harness; // NOLINT
    std::string m_userId;                       // NOLINT
    sigil::security::SecureString m_password{ secure(sigil::test_utils::g_testPassword) }; // NOLINT
};

} // namespace

TEST_F(NoteServiceTest, PlainNoteIsStoredAsGiven)
{
    auto input{ draft("Groceries", "milk, eggs") };
    input.tags = { "home", "weekly" };
    const auto note{ expectValue(engine().createNote(m_userId, input)) };

    EXPECT_FALSE(note.isSecure);
    EXPECT_FALSE(note.crypto.has_value());
    EXPECT_EQ(note.title, "Groceries");
    EXPECT_EQ(note.content, "milk, eggs");
    EXPECT_EQ(note.color, sigil::core::g_defaultNoteColor);

    const auto view{ expectValue(engine().getNote(m_userId, note.id)) };
    EXPECT_EQ(view.title, "Groceries");
    EXPECT_EQ(asStringView(view.content), "milk, eggs");
    EXPECT_EQ(view.record.tags, (std::vector<std::string>{ "home", "weekly" }));
}

TEST_F(NoteServiceTest, EmptyColorFallsBackToDefault)
{
    auto input{ draft("Colors", "none") };
    input.color = "";
    EXPECT_EQ(expectValue(engine().createNote(m_userId, input)).color, sigil::core::g_defaultNoteColor);

    input.color = "#FF0000";
    EXPECT_EQ(expectValue(engine().createNote(m_userId, input)).color, "#FF0000");
}

TEST_F(NoteServiceTest, TitleAndContentAreRequired)
{
    EXPECT_EQ(errorOf(engine().createNote(m_userId, draft("", "body"))), VaultError::InvalidArgument);
    EXPECT_EQ(errorOf(engine().createNote(m_userId, draft("Title", ""))), VaultError::InvalidArgument);
    EXPECT_EQ(errorOf(engine().createNote("nobody", draft("Title", "body"))), VaultError::UserNotFound);
}

TEST_F(NoteServiceTest, SecureNoteIsSealed)
{
    const auto note{ expectValue(engine().createNote(m_userId, draft("Safe", "combination 1-2-3", true), m_password)) };

    EXPECT_TRUE(note.isSecure);
    ASSERT_TRUE(note.crypto.has_value());
    EXPECT_EQ(note.crypto->iv.size(), 32U);
    EXPECT_NE(note.title, "Safe");
    EXPECT_EQ(note.content.find("combination"), std::string::npos);

    const auto view{ expectValue(engine().getNote(m_userId, note.id, m_password)) };
    EXPECT_EQ(view.title, "Safe");
    EXPECT_EQ(asStringView(view.content), "combination 1-2-3");
}

TEST_F(NoteServiceTest, SecureNoteNeedsTheMasterPassword)
{
    EXPECT_EQ(errorOf(engine().createNote(m_userId, draft("Safe", "secret", true))),
              VaultError::MasterPasswordRequired);
    EXPECT_EQ(errorOf(engine().createNote(m_userId, draft("Safe", "secret", true),
                                          secure(sigil::test_utils::g_wrongPassword))),
              VaultError::InvalidMasterPassword);

    const auto note{ expectValue(engine().createNote(m_userId, draft("Safe", "secret", true), m_password)) };
    EXPECT_EQ(errorOf(engine().getNote(m_userId, note.id)), VaultError::MasterPasswordRequired);
    EXPECT_EQ(errorOf(engine().getNote(m_userId, note.id, secure(sigil::test_utils::g_wrongPassword))),
              VaultError::InvalidMasterPassword);
}

TEST_F(NoteServiceTest, UpdateCanToggleSecurity)
{
    const auto plain{ expectValue(engine().createNote(m_userId, draft("Diary", "day one"))) };

    sigil::core::NoteChanges makeSecure{};
    makeSecure.isSecure = true;
    EXPECT_EQ(errorOf(engine().updateNote(m_userId, plain.id, makeSecure)), VaultError::MasterPasswordRequired);

    const auto sealed{ expectValue(engine().updateNote(m_userId, plain.id, makeSecure, m_password)) };
    EXPECT_TRUE(sealed.isSecure);
    EXPECT_TRUE(sealed.crypto.has_value());

    sigil::core::NoteChanges makePlain{};
    makePlain.isSecure = false;
    makePlain.content = secure("day two");
    const auto opened{ expectValue(engine().updateNote(m_userId, plain.id, makePlain, m_password)) };
    EXPECT_FALSE(opened.isSecure);
    EXPECT_FALSE(opened.crypto.has_value());
    EXPECT_EQ(opened.title, "Diary");
    EXPECT_EQ(opened.content, "day two");
}

TEST_F(NoteServiceTest, DeletedNoteIsGone)
{
    const auto note{ expectValue(engine().createNote(m_userId, draft("Temp", "scratch"))) };
    (void)expectValue(engine().deleteNote(m_userId, note.id));

    EXPECT_EQ(errorOf(engine().getNote(m_userId, note.id)), VaultError::NoteNotFound);
    EXPECT_EQ(errorOf(engine().deleteNote(m_userId, note.id)), VaultError::NoteNotFound);
    EXPECT_TRUE(expectValue(engine().listNotes(m_userId)).empty());
}

TEST_F(NoteServiceTest, ListShowsLiveNotesOfTheUser)
{
    (void)expectValue(engine().createNote(m_userId, draft("One", "1")));
    (void)expectValue(engine().createNote(m_userId, draft("Two", "2", true), m_password));
    const auto other{ m_harness.makeUser("bob@example.com") };
    (void)expectValue(engine().createNote(other, draft("Bob's", "b")));

    EXPECT_EQ(expectValue(engine().listNotes(m_userId)).size(), 2U);
    EXPECT_EQ(expectValue(engine().listNotes(other)).size(), 1U);
    EXPECT_EQ(errorOf(engine().listNotes("nobody")), VaultError::UserNotFound);
}

TEST_F(NoteServiceTest, MasterPasswordChangeReKeysSecureNotes)
{
    const auto note{ expectValue(engine().createNote(m_userId, draft("Safe", "secret", true), m_password)) };
    const auto replacement{ secure("brand-new-password") };

    (void)expectValue(engine().setMasterPassword(m_userId, m_password, replacement));

    EXPECT_EQ(errorOf(engine().getNote(m_userId, note.id, m_password)), VaultError::InvalidMasterPassword);
    EXPECT_EQ(asStringView(expectValue(engine().getNote(m_userId, note.id, replacement)).content), "secret");
}
