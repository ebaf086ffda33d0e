#ifndef INCLUDE_SIGIL_CORE_PASSWORDTOOLS_HPP
#define INCLUDE_SIGIL_CORE_PASSWORDTOOLS_HPP

#include "sigil/core/VaultErrors.hpp"
#include "sigil/security/SecureMemory.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sigil::core
{

constexpr std::size_t g_minGeneratedLength{ 4 };
constexpr std::size_t g_maxGeneratedLength{ 128 };

inline constexpr std::string_view g_passwordSymbols{ "!@#$%^&*()_+-=[]{}|;:,.<>?" };
inline constexpr std::string_view g_similarCharacters{ "0O1lI" };

struct PasswordOptions final
{
    std::size_t length{ 16 };
    bool uppercase{ true };
    bool lowercase{ true };
    bool digits{ true };
    bool symbols{ true };
    bool excludeSimilar{ true };
};

enum class PasswordStrength : std::uint8_t
{
    VeryWeak,
    Weak,
    Medium,
    Strong,
    VeryStrong,
};

[[nodiscard]] std::string_view toString(PasswordStrength strength) noexcept;

struct StrengthReport final
{
    int score{ 0 }; // 0..7
    PasswordStrength strength{ PasswordStrength::VeryWeak };
    std::vector<std::string> feedback;
};

// InvalidArgument for a length outside 4..128 or when every class is off. RandomFailed if the
// CSPRNG fails.
[[nodiscard]] VaultResult<sigil::security::SecureString> generatePassword(const PasswordOptions& options) noexcept;

[[nodiscard]] StrengthReport analyzePasswordStrength(std::string_view password);

} // namespace sigil::core

#endif // INCLUDE_SIGIL_CORE_PASSWORDTOOLS_HPP
