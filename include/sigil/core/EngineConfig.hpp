#ifndef INCLUDE_SIGIL_CORE_ENGINECONFIG_HPP
#define INCLUDE_SIGIL_CORE_ENGINECONFIG_HPP

#include "sigil/crypto/KeyDerivation.hpp"
#include "sigil/log/Logger.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace sigil::core
{

enum class BackupScheme : std::uint8_t
{
    LegacyCbc,        // format "1.0": PBKDF2 + AES-256-CBC
    AuthenticatedGcm, // format "2.0": PBKDF2 + AES-256-GCM
};

[[nodiscard]] std::string_view formatVersionOf(BackupScheme scheme) noexcept;

[[nodiscard]] sigil::crypto::Argon2idParams defaultArgon2idParams() noexcept;

constexpr std::uint32_t g_defaultBackupPbkdf2Iterations{ 100000U };

struct EngineConfig final
{
    sigil::crypto::Argon2idParams argon2id{ defaultArgon2idParams() };
    std::uint32_t backupPbkdf2Iterations{ g_defaultBackupPbkdf2Iterations };
    BackupScheme backupScheme{ BackupScheme::AuthenticatedGcm };
    sigil::log::Level logLevel{ sigil::log::Level::Info };
};

using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

// Applies SIGIL_* overrides on top of the defaults. Throws std::invalid_argument on a malformed value.
[[nodiscard]] EngineConfig engineConfigFrom(const EnvLookup& lookup);

[[nodiscard]] EngineConfig engineConfigFromEnvironment();

} // namespace sigil::core

#endif // INCLUDE_SIGIL_CORE_ENGINECONFIG_HPP
