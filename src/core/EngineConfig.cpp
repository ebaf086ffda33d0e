#include "sigil/core/EngineConfig.hpp"

#include <charconv>
#include <cstdlib>
#include <fmt/format.h>
#include <stdexcept>
#include <system_error>

namespace sigil::core
{
namespace
{

constexpr std::string_view g_kEnvKdfIterations{ "SIGIL_KDF_ITERATIONS" };
constexpr std::string_view g_kEnvKdfMemoryKiB{ "SIGIL_KDF_MEMORY_KIB" };
constexpr std::string_view g_kEnvKdfParallelism{ "SIGIL_KDF_PARALLELISM" };
constexpr std::string_view g_kEnvBackupIterations{ "SIGIL_BACKUP_PBKDF2_ITERATIONS" };
constexpr std::string_view g_kEnvBackupScheme{ "SIGIL_BACKUP_SCHEME" };
constexpr std::string_view g_kEnvLogLevel{ "SIGIL_LOG_LEVEL" };

[[nodiscard]] std::uint32_t parseU32(std::string_view name, const std::string& text)
{
    std::uint32_t value{};
    const auto* first{ text.data() };
    const auto* last{ text.data() + text.size() };
    const auto [ptr, ec]{ std::from_chars(first, last, value) };
    if (ec != std::errc{} || ptr != last || value == 0U)
    {
        throw std::invalid_argument(fmt::format("{}: expected a positive integer, got '{}'", name, text));
    }
    return value;
}

} // namespace

std::string_view formatVersionOf(BackupScheme scheme) noexcept
{
    return scheme == BackupScheme::LegacyCbc ? "1.0" : "2.0";
}

sigil::crypto::Argon2idParams defaultArgon2idParams() noexcept
{
    constexpr std::uint32_t kDefaultIterations{ 3U };
    constexpr std::uint32_t kDefaultMemoryMiB{ 64U };
    constexpr std::uint32_t kKiBPerMiB{ 1024U };
    constexpr std::uint32_t kDefaultParallelism{ 1U };

    return sigil::crypto::Argon2idParams{
        .iterations = kDefaultIterations,
        .memoryKiB = kDefaultMemoryMiB * kKiBPerMiB,
        .parallelism = kDefaultParallelism,
    };
}

EngineConfig engineConfigFrom(const EnvLookup& lookup)
{
    EngineConfig config{};

    if (const auto v{ lookup(g_kEnvKdfIterations) })
    {
        config.argon2id.iterations = parseU32(g_kEnvKdfIterations, *v);
    }
    if (const auto v{ lookup(g_kEnvKdfMemoryKiB) })
    {
        config.argon2id.memoryKiB = parseU32(g_kEnvKdfMemoryKiB, *v);
    }
    if (const auto v{ lookup(g_kEnvKdfParallelism) })
    {
        config.argon2id.parallelism = parseU32(g_kEnvKdfParallelism, *v);
    }
    sigil::crypto::requireArgon2idParamsSafe(config.argon2id);

    if (const auto v{ lookup(g_kEnvBackupIterations) })
    {
        config.backupPbkdf2Iterations = parseU32(g_kEnvBackupIterations, *v);
    }

    if (const auto v{ lookup(g_kEnvBackupScheme) })
    {
        if (*v == "gcm")
        {
            config.backupScheme = BackupScheme::AuthenticatedGcm;
        }
        else if (*v == "cbc")
        {
            config.backupScheme = BackupScheme::LegacyCbc;
        }
        else
        {
            throw std::invalid_argument(fmt::format("{}: expected 'gcm' or 'cbc', got '{}'", g_kEnvBackupScheme, *v));
        }
    }

    if (const auto v{ lookup(g_kEnvLogLevel) })
    {
        const auto level{ sigil::log::parseLevel(*v) };
        if (!level)
        {
            throw std::invalid_argument(fmt::format("{}: unknown level '{}'", g_kEnvLogLevel, *v));
        }
        config.logLevel = *level;
    }

    return config;
}

EngineConfig engineConfigFromEnvironment()
{
    return engineConfigFrom([](std::string_view name) -> std::optional<std::string> {
        const char* value{ std::getenv(std::string{ name }.c_str()) };
        if (value == nullptr || *value == '\0')
        {
            return std::nullopt;
        }
        return std::string{ value };
    });
}

} // namespace sigil::core
