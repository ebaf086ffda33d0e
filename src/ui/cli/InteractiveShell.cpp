#include "InteractiveShell.hpp"

#include <CLI/CLI.hpp>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>
#include <variant>

namespace sigil::ui::cli
{

using sigil::core::VaultError;
using sigil::security::asStringView;
using sigil::security::SecureString;

namespace
{

[[nodiscard]] bool isHelpRequest(const std::string& line)
{
    const auto first{ line.find_first_not_of(" \t") };
    if (first == std::string::npos || line.compare(first, 4, "help") != 0)
    {
        return false;
    }
    const auto rest{ first + 4 };
    return rest == line.size() || std::isspace(static_cast<unsigned char>(line[rest])) != 0;
}

void printField(std::ostream& out, std::string_view label, const std::optional<SecureString>& value)
{
    out << label << ": " << (value ? asStringView(*value) : std::string_view{ "-" }) << "\n";
}

void printFields(std::ostream& out, const sigil::core::SecretFields& fields)
{
    printField(out, "username", fields.identifier);
    out << "password: " << asStringView(fields.secretValue) << "\n";
    printField(out, "notes", fields.notes);
}

} // namespace

InteractiveShell::InteractiveShell(sigil::core::VaultEngine& engine, std::istream& in, std::ostream& out,
                                   PasswordReader pwdReader)
    : m_engine(engine), m_in(in), m_out(out), m_pwdReader(std::move(pwdReader))
{
}

int InteractiveShell::run()
{
    m_out << "SigilVault shell\n";
    m_out << "Type 'help' for available commands.\n";

    std::string line;
    while (m_running && m_in.good())
    {
        if (m_user.has_value())
        {
            m_out << "sigil(" << m_user->email << ")> ";
        }
        else
        {
            m_out << "sigil> ";
        }

        if (!std::getline(m_in, line))
        {
            break; // EOF
        }

        if (line.empty())
        {
            continue;
        }

        processLine(line);
    }
    return 0;
}

bool InteractiveShell::selectUser(const std::string& userId)
{
    auto result{ m_engine.loadUser(userId) };
    if (auto* error{ std::get_if<VaultError>(&result) })
    {
        printError(*error);
        return false;
    }
    m_user = std::move(std::get<sigil::core::UserProfile>(result));
    m_out << "Using " << m_user->email << ".\n";
    return true;
}

void InteractiveShell::processLine(const std::string& line)
{
    // 'help' prints the root help message rather than the help subcommand's own.
    const std::string commandLine{ isHelpRequest(line) ? std::string{ "--help" } : line };

    CLI::App app{ "SigilVault shell" };
    app.require_subcommand(1);

    app.add_subcommand("help", "Print this help message")->callback([]() { throw CLI::CallForHelp(); });
    app.add_subcommand("exit", "Exit the shell")->alias("quit")->callback([this]() { m_running = false; });

    // Users and the master password
    std::string email;
    std::string firstName;
    std::string lastName;
    auto* subUserAdd{ app.add_subcommand("user-add", "Create a user") };
    subUserAdd->add_option("email", email, "E-mail address")->required();
    subUserAdd->add_option("--first", firstName, "First name");
    subUserAdd->add_option("--last", lastName, "Last name");
    subUserAdd->callback([&]() { doUserAdd(email, firstName, lastName); });

    std::string idArg;
    auto* subUse{ app.add_subcommand("use", "Select the user to work as") };
    subUse->add_option("user-id", idArg, "User id")->required();
    subUse->callback([&]() { (void)selectUser(idArg); });

    app.add_subcommand("master-set", "Set or change the master password")->callback([this]() { doMasterSet(); });
    app.add_subcommand("master-verify", "Check the master password")->callback([this]() { doMasterVerify(); });

    // Secrets
    SecretArgs secretArgs{};
    auto* subAdd{ app.add_subcommand("add", "Store a secret (prompts for value)") };
    subAdd->add_option("title", secretArgs.title, "Title")->required();
    subAdd->add_option("--description", secretArgs.description, "Description");
    subAdd->add_option("--category", secretArgs.category, "Category");
    subAdd->add_option("--username", secretArgs.username, "Username or e-mail stored with the secret");
    subAdd->add_flag("--favorite", secretArgs.favorite, "Mark as favorite");
    subAdd->add_flag("--notes", secretArgs.withNotes, "Prompt for encrypted notes");
    subAdd->callback([&]() { doAdd(secretArgs); });

    auto* subGet{ app.add_subcommand("get", "Decrypt a secret") };
    subGet->add_option("secret-id", idArg, "Secret id")->required();
    subGet->callback([&]() { doGet(idArg); });

    bool newSecretValue{ false };
    bool newNotes{ false };
    bool favorite{ false };
    bool notFavorite{ false };
    auto* subUpdate{ app.add_subcommand("update", "Change a secret") };
    subUpdate->add_option("secret-id", idArg, "Secret id")->required();
    auto* optTitle{ subUpdate->add_option("--title", secretArgs.title, "New title") };
    auto* optDescription{ subUpdate->add_option("--description", secretArgs.description, "New description") };
    auto* optCategory{ subUpdate->add_option("--category", secretArgs.category, "New category") };
    auto* optUsername{ subUpdate->add_option("--username", secretArgs.username, "New username, empty clears it") };
    subUpdate->add_flag("--favorite", favorite, "Mark as favorite");
    subUpdate->add_flag("--no-favorite", notFavorite, "Unmark as favorite");
    subUpdate->add_flag("--password", newSecretValue, "Prompt for a new secret value");
    subUpdate->add_flag("--notes", newNotes, "Prompt for new notes, empty clears them");
    subUpdate->callback([&]() {
        sigil::core::SecretChanges changes{};
        if (optTitle->count() > 0U)
        {
            changes.title = secretArgs.title;
        }
        if (optDescription->count() > 0U)
        {
            changes.description = secretArgs.description;
        }
        if (optCategory->count() > 0U)
        {
            changes.category = secretArgs.category;
        }
        if (optUsername->count() > 0U)
        {
            changes.identifier = sigil::security::secureStringFrom(secretArgs.username);
        }
        if (favorite || notFavorite)
        {
            changes.isFavorite = favorite;
        }
        doUpdate(idArg, std::move(changes), newSecretValue, newNotes);
    });

    auto* subRm{ app.add_subcommand("rm", "Delete a secret") };
    subRm->add_option("secret-id", idArg, "Secret id")->required();
    subRm->callback([&]() { doRm(idArg); });

    sigil::core::SecretFilter filter{};
    std::string categoryArg{};
    std::string searchArg{};
    auto* subLs{ app.add_subcommand("ls", "List secrets") };
    auto* optLsCategory{ subLs->add_option("--category", categoryArg, "Only this category") };
    auto* optLsSearch{ subLs->add_option("--search", searchArg, "Match title or description") };
    subLs->add_flag("--favorites", filter.favoritesOnly, "Only favorites");
    subLs->callback([&]() {
        if (optLsCategory->count() > 0U)
        {
            filter.category = categoryArg;
        }
        if (optLsSearch->count() > 0U)
        {
            filter.search = searchArg;
        }
        doList(filter);
    });

    app.add_subcommand("categories", "List the categories in use")->callback([this]() { doCategories(); });

    // Versions
    std::uint32_t versionArg{ 0U };
    auto* subVersions{ app.add_subcommand("versions", "List the history of a secret") };
    subVersions->add_option("secret-id", idArg, "Secret id")->required();
    subVersions->callback([&]() { doVersions(idArg); });

    auto* subShowVersion{ app.add_subcommand("show-version", "Decrypt one version of a secret") };
    subShowVersion->add_option("secret-id", idArg, "Secret id")->required();
    subShowVersion->add_option("version", versionArg, "Version number")->required()->check(CLI::PositiveNumber);
    subShowVersion->callback([&]() { doShowVersion(idArg, versionArg); });

    auto* subRestore{ app.add_subcommand("restore", "Make an old version current again") };
    subRestore->add_option("secret-id", idArg, "Secret id")->required();
    subRestore->add_option("version", versionArg, "Version number")->required()->check(CLI::PositiveNumber);
    subRestore->callback([&]() { doRestore(idArg, versionArg); });

    // Notes
    NoteArgs noteArgs{};
    auto* subNoteAdd{ app.add_subcommand("note-add", "Store a note (prompts for content)") };
    subNoteAdd->add_option("title", noteArgs.title, "Title")->required();
    subNoteAdd->add_option("--tag", noteArgs.tags, "Tag, may repeat");
    subNoteAdd->add_option("--color", noteArgs.color, "Color");
    subNoteAdd->add_flag("--secure", noteArgs.secure, "Encrypt under the master password");
    subNoteAdd->add_flag("--favorite", noteArgs.favorite, "Mark as favorite");
    subNoteAdd->callback([&]() { doNoteAdd(noteArgs); });

    auto* subNoteGet{ app.add_subcommand("note-get", "Show a note") };
    subNoteGet->add_option("note-id", idArg, "Note id")->required();
    subNoteGet->callback([&]() { doNoteGet(idArg); });

    app.add_subcommand("note-ls", "List notes")->callback([this]() { doNoteList(); });

    auto* subNoteRm{ app.add_subcommand("note-rm", "Delete a note") };
    subNoteRm->add_option("note-id", idArg, "Note id")->required();
    subNoteRm->callback([&]() { doNoteRm(idArg); });

    // Backups
    std::string pathArg;
    auto* subExport{ app.add_subcommand("export", "Write an encrypted backup") };
    subExport->add_option("path", pathArg, "Backup file")->required();
    subExport->callback([&]() { doExport(pathArg); });

    auto* subImport{ app.add_subcommand("import", "Restore an encrypted backup") };
    subImport->add_option("path", pathArg, "Backup file")->required()->check(CLI::ExistingFile);
    subImport->callback([&]() { doImport(pathArg); });

    auto* subExportPlain{ app.add_subcommand("export-plain", "Write every secret and note decrypted, as JSON") };
    subExportPlain->add_option("path", pathArg, "Output file")->required();
    subExportPlain->callback([&]() { doExportPlain(pathArg); });

    // Password tools
    sigil::core::PasswordOptions genOptions{};
    bool noUpper{ false };
    bool noLower{ false };
    bool noDigits{ false };
    bool noSymbols{ false };
    bool allowSimilar{ false };
    auto* subGen{ app.add_subcommand("gen", "Generate a random password") };
    subGen->add_option("--length", genOptions.length, "Length")
        ->check(CLI::Range(sigil::core::g_minGeneratedLength, sigil::core::g_maxGeneratedLength));
    subGen->add_flag("--no-upper", noUpper, "Leave out uppercase letters");
    subGen->add_flag("--no-lower", noLower, "Leave out lowercase letters");
    subGen->add_flag("--no-digits", noDigits, "Leave out digits");
    subGen->add_flag("--no-symbols", noSymbols, "Leave out symbols");
    subGen->add_flag("--allow-similar", allowSimilar, "Allow 0 O 1 l I");
    subGen->callback([&]() {
        genOptions.uppercase = !noUpper;
        genOptions.lowercase = !noLower;
        genOptions.digits = !noDigits;
        genOptions.symbols = !noSymbols;
        genOptions.excludeSimilar = !allowSimilar;
        doGen(genOptions);
    });

    app.add_subcommand("strength", "Rate a password (prompts for it)")->callback([this]() { doStrength(); });

    try
    {
        app.parse(commandLine, false);
    }
    catch ([[maybe_unused]] const CLI::CallForHelp&)
    {
        m_out << app.help();
    }
    catch (const CLI::ParseError& e)
    {
        m_out << "Syntax Error: " << e.what() << "\n";
    }
}

bool InteractiveShell::requireUser()
{
    if (!m_user.has_value())
    {
        m_out << "Error: No user selected. Run 'use <user-id>' first.\n";
        return false;
    }
    return true;
}

void InteractiveShell::printError(VaultError error)
{
    m_out << "Error: " << sigil::core::userMessage(error) << "\n";
}

// --- Handlers ---

void InteractiveShell::doUserAdd(const std::string& email, const std::string& firstName, const std::string& lastName)
{
    auto result{ m_engine.createUser(email, firstName, lastName) };
    if (auto* error{ std::get_if<VaultError>(&result) })
    {
        printError(*error);
        return;
    }
    const auto& user{ std::get<sigil::core::UserProfile>(result) };
    m_out << "User created: " << user.id << "\n";
    m_user = user;
}

void InteractiveShell::doMasterSet()
{
    if (!requireUser())
    {
        return;
    }

    const auto configured{ m_engine.hasMasterPassword(m_user->id) };
    if (const auto* error{ std::get_if<VaultError>(&configured) })
    {
        printError(*error);
        return;
    }
    const bool changing{ std::get<bool>(configured) };

    std::optional<SecureString> current{};
    if (changing)
    {
        current = m_pwdReader("Current Master Password: ");
    }
    const auto p1{ m_pwdReader("New Master Password: ") };
    const auto p2{ m_pwdReader("Confirm Master Password: ") };
    if (!sigil::security::secureEquals(asStringView(p1), asStringView(p2)))
    {
        m_out << "Error: Passwords do not match.\n";
        return;
    }

    const auto result{ m_engine.setMasterPassword(m_user->id, current, p1) };
    if (const auto* error{ std::get_if<VaultError>(&result) })
    {
        printError(*error);
        return;
    }
    m_out << (changing ? "Master password changed.\n" : "Master password set.\n");
}

void InteractiveShell::doMasterVerify()
{
    if (!requireUser())
    {
        return;
    }
    const auto pass{ m_pwdReader("Master Password: ") };
    const auto result{ m_engine.verifyMasterPassword(m_user->id, pass) };
    if (const auto* error{ std::get_if<VaultError>(&result) })
    {
        printError(*error);
        return;
    }
    m_out << "Master password OK.\n";
}

void InteractiveShell::doAdd(const SecretArgs& args)
{
    if (!requireUser())
    {
        return;
    }

    sigil::core::SecretMetadata metadata{};
    metadata.title = args.title;
    if (!args.description.empty())
    {
        metadata.description = args.description;
    }
    if (!args.category.empty())
    {
        metadata.category = args.category;
    }
    metadata.isFavorite = args.favorite;

    const auto pass{ m_pwdReader("Master Password: ") };
    sigil::core::SecretFields fields{};
    fields.secretValue = m_pwdReader("Secret Value: ");
    if (!args.username.empty())
    {
        fields.identifier = sigil::security::secureStringFrom(args.username);
    }
    if (args.withNotes)
    {
        fields.notes = m_pwdReader("Notes: ");
    }

    const auto result{ m_engine.createSecret(m_user->id, metadata, fields, pass) };
    if (const auto* error{ std::get_if<VaultError>(&result) })
    {
        printError(*error);
        return;
    }
    m_out << "Secret stored: " << std::get<sigil::core::SecretRecord>(result).id << "\n";
}

void InteractiveShell::doGet(const std::string& secretId)
{
    if (!requireUser())
    {
        return;
    }
    const auto pass{ m_pwdReader("Master Password: ") };
    const auto result{ m_engine.getSecret(m_user->id, secretId, pass) };
    if (const auto* error{ std::get_if<VaultError>(&result) })
    {
        printError(*error);
        return;
    }
    printFields(m_out, std::get<sigil::core::SecretFields>(result));
}

void InteractiveShell::doUpdate(const std::string& secretId, sigil::core::SecretChanges changes, bool newSecretValue,
                                bool newNotes)
{
    if (!requireUser())
    {
        return;
    }
    const auto pass{ m_pwdReader("Master Password: ") };
    if (newSecretValue)
    {
        changes.secretValue = m_pwdReader("Secret Value: ");
    }
    if (newNotes)
    {
        changes.notes = m_pwdReader("Notes: ");
    }

    const auto result{ m_engine.updateSecret(m_user->id, secretId, changes, pass) };
    if (const auto* error{ std::get_if<VaultError>(&result) })
    {
        printError(*error);
        return;
    }
    m_out << "Secret updated.\n";
}

void InteractiveShell::doRm(const std::string& secretId)
{
    if (!requireUser())
    {
        return;
    }
    const auto result{ m_engine.deleteSecret(m_user->id, secretId) };
    if (const auto* error{ std::get_if<VaultError>(&result) })
    {
        printError(*error);
        return;
    }
    m_out << "Secret deleted.\n";
}

void InteractiveShell::doList(const sigil::core::SecretFilter& filter)
{
    if (!requireUser())
    {
        return;
    }

    const auto result{ m_engine.listSecrets(m_user->id, filter) };
    if (const auto* error{ std::get_if<VaultError>(&result) })
    {
        printError(*error);
        return;
    }

    const auto& secrets{ std::get<std::vector<sigil::core::SecretRecord>>(result) };
    if (secrets.empty())
    {
        m_out << "(empty)\n";
        return;
    }
    for (const auto& s : secrets)
    {
        m_out << " - " << s.id << "  " << s.metadata.title << "  [" << s.metadata.category << "]"
              << (s.metadata.isFavorite ? " *" : "") << "\n";
    }
}

void InteractiveShell::doCategories()
{
    if (!requireUser())
    {
        return;
    }

    const auto result{ m_engine.listCategories(m_user->id) };
    if (const auto* error{ std::get_if<VaultError>(&result) })
    {
        printError(*error);
        return;
    }

    const auto& categories{ std::get<std::vector<std::string>>(result) };
    if (categories.empty())
    {
        m_out << "(empty)\n";
        return;
    }
    for (const auto& category : categories)
    {
        m_out << " - " << category << "\n";
    }
}

void InteractiveShell::doVersions(const std::string& secretId)
{
    if (!requireUser())
    {
        return;
    }
    const auto result{ m_engine.listVersions(m_user->id, secretId) };
    if (const auto* error{ std::get_if<VaultError>(&result) })
    {
        printError(*error);
        return;
    }
    for (const auto& v : std::get<std::vector<sigil::core::SecretVersion>>(result))
    {
        m_out << " v" << v.version << "  " << v.createdAt << "  " << v.metadata.title
              << (v.isActive ? "" : "  (deleted)") << "\n";
    }
}

void InteractiveShell::doShowVersion(const std::string& secretId, std::uint32_t version)
{
    if (!requireUser())
    {
        return;
    }
    const auto pass{ m_pwdReader("Master Password: ") };
    const auto result{ m_engine.decryptVersion(m_user->id, secretId, version, pass) };
    if (const auto* error{ std::get_if<VaultError>(&result) })
    {
        printError(*error);
        return;
    }
    printFields(m_out, std::get<sigil::core::SecretFields>(result));
}

void InteractiveShell::doRestore(const std::string& secretId, std::uint32_t version)
{
    if (!requireUser())
    {
        return;
    }
    const auto pass{ m_pwdReader("Master Password: ") };
    const auto result{ m_engine.restoreVersion(m_user->id, secretId, version, pass) };
    if (const auto* error{ std::get_if<VaultError>(&result) })
    {
        printError(*error);
        return;
    }
    m_out << "Version " << version << " restored.\n";
}

void InteractiveShell::doNoteAdd(const NoteArgs& args)
{
    if (!requireUser())
    {
        return;
    }

    sigil::core::NoteDraft draft{};
    draft.title = args.title;
    draft.isSecure = args.secure;
    draft.tags = args.tags;
    draft.isFavorite = args.favorite;
    if (!args.color.empty())
    {
        draft.color = args.color;
    }

    std::optional<SecureString> pass{};
    if (args.secure)
    {
        pass = m_pwdReader("Master Password: ");
    }
    draft.content = m_pwdReader("Content: ");

    const auto result{ m_engine.createNote(m_user->id, draft, pass) };
    if (const auto* error{ std::get_if<VaultError>(&result) })
    {
        printError(*error);
        return;
    }
    m_out << "Note stored: " << std::get<sigil::core::NoteRecord>(result).id << "\n";
}

void InteractiveShell::doNoteGet(const std::string& noteId)
{
    if (!requireUser())
    {
        return;
    }

    auto result{ m_engine.getNote(m_user->id, noteId) };
    if (const auto* error{ std::get_if<VaultError>(&result) }; error != nullptr &&
                                                               *error == VaultError::MasterPasswordRequired)
    {
        const auto pass{ m_pwdReader("Master Password: ") };
        result = m_engine.getNote(m_user->id, noteId, pass);
    }
    if (const auto* error{ std::get_if<VaultError>(&result) })
    {
        printError(*error);
        return;
    }

    const auto& view{ std::get<sigil::core::NoteView>(result) };
    m_out << "title: " << view.title << "\n";
    if (!view.record.tags.empty())
    {
        m_out << "tags:";
        for (const auto& tag : view.record.tags)
        {
            m_out << " " << tag;
        }
        m_out << "\n";
    }
    m_out << asStringView(view.content) << "\n";
}

void InteractiveShell::doNoteList()
{
    if (!requireUser())
    {
        return;
    }
    const auto result{ m_engine.listNotes(m_user->id) };
    if (const auto* error{ std::get_if<VaultError>(&result) })
    {
        printError(*error);
        return;
    }

    const auto& notes{ std::get<std::vector<sigil::core::NoteRecord>>(result) };
    if (notes.empty())
    {
        m_out << "(empty)\n";
        return;
    }
    for (const auto& n : notes)
    {
        m_out << " - " << n.id << "  " << (n.isSecure ? std::string{ "(secure note)" } : n.title) << "\n";
    }
}

void InteractiveShell::doNoteRm(const std::string& noteId)
{
    if (!requireUser())
    {
        return;
    }
    const auto result{ m_engine.deleteNote(m_user->id, noteId) };
    if (const auto* error{ std::get_if<VaultError>(&result) })
    {
        printError(*error);
        return;
    }
    m_out << "Note deleted.\n";
}

void InteractiveShell::doExport(const std::string& path)
{
    if (!requireUser())
    {
        return;
    }
    const auto pass{ m_pwdReader("Master Password: ") };
    const auto result{ m_engine.exportBackup(m_user->id, pass) };
    if (const auto* error{ std::get_if<VaultError>(&result) })
    {
        printError(*error);
        return;
    }
    const auto& artifact{ std::get<sigil::core::BackupArtifact>(result) };
    if (!writePrivateFile(path, artifact.data))
    {
        return;
    }

    m_out << "Backup written: " << artifact.metadata.totalCredentials << " secrets, "
          << artifact.metadata.totalVersions << " versions, " << artifact.metadata.totalNotes << " notes.\n";
}

void InteractiveShell::doExportPlain(const std::string& path)
{
    if (!requireUser())
    {
        return;
    }
    const auto pass{ m_pwdReader("Master Password: ") };
    const auto result{ m_engine.exportPlaintext(m_user->id, pass) };
    if (const auto* error{ std::get_if<VaultError>(&result) })
    {
        printError(*error);
        return;
    }
    const auto& exported{ std::get<sigil::core::PlaintextExport>(result) };
    if (!writePrivateFile(path, sigil::security::asStringView(exported.document)))
    {
        return;
    }

    m_out << "Plaintext export written: " << exported.credentials << " secrets, " << exported.notes
          << " notes. The file is not encrypted.\n";
}

// The file is emptied and narrowed to the owner before any bytes reach it.
bool InteractiveShell::writePrivateFile(const std::string& path, std::string_view bytes)
{
    {
        std::ofstream reset{ path, std::ios::binary | std::ios::trunc };
        if (!reset)
        {
            m_out << "Error: Cannot write " << path << "\n";
            return false;
        }
    }
#if !defined(_WIN32)
    std::error_code ec{};
    std::filesystem::permissions(path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec)
    {
        m_out << "Error: Cannot restrict permissions of " << path << ": " << ec.message() << "\n";
        return false;
    }
#endif

    std::ofstream file{ path, std::ios::binary | std::ios::trunc };
    file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    file.close();
    if (!file)
    {
        m_out << "Error: Cannot write " << path << "\n";
        return false;
    }
    return true;
}

void InteractiveShell::doImport(const std::string& path)
{
    if (!requireUser())
    {
        return;
    }

    std::ifstream file{ path, std::ios::binary };
    if (!file)
    {
        m_out << "Error: Cannot read " << path << "\n";
        return;
    }
    std::string artifact{ std::istreambuf_iterator<char>{ file }, std::istreambuf_iterator<char>{} };
    while (!artifact.empty() && std::isspace(static_cast<unsigned char>(artifact.back())) != 0)
    {
        artifact.pop_back();
    }

    const auto pass{ m_pwdReader("Master Password: ") };
    const auto result{ m_engine.restoreBackup(m_user->id, artifact, pass) };
    if (const auto* error{ std::get_if<VaultError>(&result) })
    {
        printError(*error);
        return;
    }
    const auto& summary{ std::get<sigil::core::RestoreSummary>(result) };
    m_out << "Backup restored: " << summary.secretsRestored << " secrets, " << summary.versionsRestored
          << " versions, " << summary.notesRestored << " notes.\n";
    if (summary.versionsDropped > 0U)
    {
        m_out << "Skipped " << summary.versionsDropped << " orphaned versions.\n";
    }
    if (summary.notesDropped > 0U)
    {
        m_out << "Skipped " << summary.notesDropped << " secure notes without key material.\n";
    }
}

void InteractiveShell::doGen(const sigil::core::PasswordOptions& options)
{
    const auto result{ m_engine.generatePassword(options) };
    if (const auto* error{ std::get_if<VaultError>(&result) })
    {
        printError(*error);
        return;
    }
    const auto& password{ std::get<SecureString>(result) };
    const auto report{ m_engine.analyzePasswordStrength(asStringView(password)) };
    m_out << asStringView(password) << "\n";
    m_out << "strength: " << sigil::core::toString(report.strength) << "\n";
}

void InteractiveShell::doStrength()
{
    const auto candidate{ m_pwdReader("Password: ") };
    const auto report{ m_engine.analyzePasswordStrength(asStringView(candidate)) };
    m_out << "strength: " << sigil::core::toString(report.strength) << " (" << report.score << "/7)\n";
    for (const auto& hint : report.feedback)
    {
        m_out << " - " << hint << "\n";
    }
}

} // namespace sigil::ui::cli
