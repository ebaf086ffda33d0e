#ifndef SIGIL_UI_CLI_CONSOLEUTILS_HPP
#define SIGIL_UI_CLI_CONSOLEUTILS_HPP

#include "sigil/security/SecureMemory.hpp"
#include <string>

namespace sigil::ui::cli
{

// Pins the process pages and disables core dumps. Best effort; failures are ignored.
void lockProcessMemory() noexcept;

// Prompts on stdout and reads one line from stdin with terminal echo off.
[[nodiscard]] sigil::security::SecureString readPassword(const std::string& prompt);

} // namespace sigil::ui::cli

#endif // SIGIL_UI_CLI_CONSOLEUTILS_HPP
