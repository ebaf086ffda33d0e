#include "sigil/core/PasswordTools.hpp"

#include "sigil/security/SecureRandom.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>
#include <new>

namespace sigil::core
{
namespace
{

constexpr std::string_view g_lowercase{ "abcdefghijklmnopqrstuvwxyz" };
constexpr std::string_view g_uppercase{ "ABCDEFGHIJKLMNOPQRSTUVWXYZ" };
constexpr std::string_view g_digits{ "0123456789" };

constexpr std::string_view g_sequences[]{ "123", "abc", "qwe" };
constexpr std::string_view g_obviousWords[]{ "password", "senha", "123456" };

[[nodiscard]] std::string alphabetFor(const PasswordOptions& options)
{
    std::string alphabet{};
    if (options.lowercase)
    {
        alphabet += g_lowercase;
    }
    if (options.uppercase)
    {
        alphabet += g_uppercase;
    }
    if (options.digits)
    {
        alphabet += g_digits;
    }
    if (options.symbols)
    {
        alphabet += g_passwordSymbols;
    }
    if (options.excludeSimilar)
    {
        std::erase_if(alphabet, [](char c) { return g_similarCharacters.find(c) != std::string_view::npos; });
    }
    return alphabet;
}

[[nodiscard]] bool hasRun(std::string_view text, std::size_t runLength) noexcept
{
    std::size_t run{ 1U };
    for (std::size_t i{ 1U }; i < text.size(); ++i)
    {
        run = (text[i] == text[i - 1U]) ? run + 1U : 1U;
        if (run >= runLength)
        {
            return true;
        }
    }
    return false;
}

template <std::size_t N>
[[nodiscard]] bool containsAny(std::string_view text, const std::string_view (&needles)[N]) noexcept
{
    return std::any_of(std::begin(needles), std::end(needles),
                       [text](std::string_view needle) { return text.find(needle) != std::string_view::npos; });
}

[[nodiscard]] PasswordStrength strengthFor(int score) noexcept
{
    if (score >= 7)
    {
        return PasswordStrength::VeryStrong;
    }
    if (score >= 5)
    {
        return PasswordStrength::Strong;
    }
    if (score >= 3)
    {
        return PasswordStrength::Medium;
    }
    if (score >= 1)
    {
        return PasswordStrength::Weak;
    }
    return PasswordStrength::VeryWeak;
}

} // namespace

std::string_view toString(PasswordStrength strength) noexcept
{
    switch (strength)
    {
    case PasswordStrength::VeryWeak:
        return "very weak";
    case PasswordStrength::Weak:
        return "weak";
    case PasswordStrength::Medium:
        return "medium";
    case PasswordStrength::Strong:
        return "strong";
    case PasswordStrength::VeryStrong:
        return "very strong";
    }
    return "unknown";
}

VaultResult<sigil::security::SecureString> generatePassword(const PasswordOptions& options) noexcept
{
    if (options.length < g_minGeneratedLength || options.length > g_maxGeneratedLength)
    {
        return VaultError::InvalidArgument;
    }

    try
    {
        const auto alphabet{ alphabetFor(options) };
        if (alphabet.empty())
        {
            return VaultError::InvalidArgument;
        }

        sigil::security::SecureString password{};
        password.reserve(options.length);
        for (std::size_t i{ 0U }; i < options.length; ++i)
        {
            std::size_t index{ 0U };
            if (!sigil::security::secureRandomIndex(alphabet.size(), index))
            {
                sigil::security::secureRelease(password);
                return VaultError::RandomFailed;
            }
            password.push_back(alphabet[index]);
        }
        return password;
    }
    catch (const std::bad_alloc&)
    {
        return VaultError::CryptoError;
    }
}

StrengthReport analyzePasswordStrength(std::string_view password)
{
    StrengthReport report{};
    if (password.empty())
    {
        return report;
    }

    const auto any{ [password](auto predicate) {
        return std::any_of(password.begin(), password.end(),
                           [&predicate](char c) { return predicate(static_cast<unsigned char>(c)) != 0; });
    } };

    report.score += password.size() >= 8U ? 1 : 0;
    report.score += password.size() >= 12U ? 1 : 0;
    report.score += password.size() >= 16U ? 1 : 0;
    report.score += any([](unsigned char c) { return std::islower(c); }) ? 1 : 0;
    report.score += any([](unsigned char c) { return std::isupper(c); }) ? 1 : 0;
    report.score += any([](unsigned char c) { return std::isdigit(c); }) ? 1 : 0;
    report.score += any([](unsigned char c) { return std::isalnum(c) == 0 ? 1 : 0; }) ? 1 : 0;

    sigil::security::SecureString lowered(password.begin(), password.end());
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
    const auto folded{ sigil::security::asStringView(lowered) };

    if (hasRun(password, 3U))
    {
        report.feedback.emplace_back("avoid repeated characters");
    }
    if (containsAny(folded, g_sequences))
    {
        report.feedback.emplace_back("avoid common sequences");
    }
    if (containsAny(folded, g_obviousWords))
    {
        report.feedback.emplace_back("avoid obvious passwords");
    }

    report.strength = strengthFor(report.score);
    return report;
}

} // namespace sigil::core
