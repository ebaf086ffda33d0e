#ifndef SIGIL_UI_CLI_INTERACTIVESHELL_HPP
#define SIGIL_UI_CLI_INTERACTIVESHELL_HPP

#include "sigil/core/VaultEngine.hpp"
#include "sigil/security/SecureMemory.hpp"

#include <cstdint>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sigil::ui::cli
{

// In tests: returns a pre-determined string.
using PasswordReader = std::function<sigil::security::SecureString(const std::string&)>;

struct SecretArgs final
{
    std::string title;
    std::string description;
    std::string category;
    std::string username;
    bool favorite{ false };
    bool withNotes{ false };
};

struct NoteArgs final
{
    std::string title;
    std::vector<std::string> tags;
    std::string color;
    bool secure{ false };
    bool favorite{ false };
};

class InteractiveShell final
{
public:
    InteractiveShell(sigil::core::VaultEngine& engine, std::istream& in, std::ostream& out, PasswordReader pwdReader);

    int run();

    // Same as typing `use <userId>`.
    bool selectUser(const std::string& userId);

private:
    sigil::core::VaultEngine& m_engine;
    std::istream& m_in;
    std::ostream& m_out;
    PasswordReader m_pwdReader;

    std::optional<sigil::core::UserProfile> m_user;
    bool m_running{ true };

    void processLine(const std::string& line);

    [[nodiscard]] bool requireUser();
    void printError(sigil::core::VaultError error);

    void doUserAdd(const std::string& email, const std::string& firstName, const std::string& lastName);
    void doMasterSet();
    void doMasterVerify();

    void doAdd(const SecretArgs& args);
    void doGet(const std::string& secretId);
    void doUpdate(const std::string& secretId, sigil::core::SecretChanges changes, bool newSecretValue, bool newNotes);
    void doRm(const std::string& secretId);
    void doList(const sigil::core::SecretFilter& filter);
    void doCategories();
    void doVersions(const std::string& secretId);
    void doShowVersion(const std::string& secretId, std::uint32_t version);
    void doRestore(const std::string& secretId, std::uint32_t version);

    void doNoteAdd(const NoteArgs& args);
    void doNoteGet(const std::string& noteId);
    void doNoteList();
    void doNoteRm(const std::string& noteId);

    void doExport(const std::string& path);
    void doImport(const std::string& path);
    void doExportPlain(const std::string& path);
    [[nodiscard]] bool writePrivateFile(const std::string& path, std::string_view bytes);

    void doGen(const sigil::core::PasswordOptions& options);
    void doStrength();
};

} // namespace sigil::ui::cli

#endif // SIGIL_UI_CLI_INTERACTIVESHELL_HPP
