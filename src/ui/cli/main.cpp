#include "ConsoleUtils.hpp"
#include "InteractiveShell.hpp"

#include "sigil/core/EngineConfig.hpp"
#include "sigil/core/VaultEngine.hpp"
#include "sigil/crypto/providers/OpenSslProviderFactory.hpp"
#include "sigil/log/Logger.hpp"
#include "sigil/storage/sqlite/SqliteStorageRepositoryFactory.hpp"

#include <CLI/CLI.hpp>
#include <exception>
#include <iostream>
#include <string>

int main(int argc, char** argv)
{
    CLI::App app{ "SigilVault: local encrypted password vault" };

    std::string databasePath{ "sigil.db" };
    std::string userId;
    app.add_option("--db", databasePath, "Vault database file")->capture_default_str();
    app.add_option("--user", userId, "Select this user on start");
    CLI11_PARSE(app, argc, argv);

    try
    {
        sigil::ui::cli::lockProcessMemory();

        const auto config{ sigil::core::engineConfigFromEnvironment() };
        auto logger{ sigil::log::makeStderrLogger(config.logLevel) };
        auto crypto{ sigil::crypto::providers::makeOpenSslCryptoProvider() };
        auto storage{ sigil::storage::sqlite::makeSqliteStorageRepository(databasePath) };

        sigil::core::VaultEngine engine{ *crypto, *storage, *logger, config };
        sigil::ui::cli::InteractiveShell shell{ engine, std::cin, std::cout, sigil::ui::cli::readPassword };
        if (!userId.empty())
        {
            (void)shell.selectUser(userId);
        }
        return shell.run();
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
