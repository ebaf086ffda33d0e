#ifndef INCLUDE_SIGIL_SECURITY_SECURERANDOM_HPP
#define INCLUDE_SIGIL_SECURITY_SECURERANDOM_HPP

#include <cstddef>
#include <cstdint>
#include <span>

namespace sigil::security
{

// Fills `out` from the OS CSPRNG. Returns false if the OS source fails.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

// Uniform value in [0, maxExcl) by rejection sampling.
[[nodiscard]] bool secureRandomBounded(std::uint64_t maxExcl, std::uint64_t& out) noexcept;

[[nodiscard]] inline bool secureRandomIndex(std::size_t size, std::size_t& out) noexcept
{
    std::uint64_t value{};
    if (!secureRandomBounded(static_cast<std::uint64_t>(size), value))
    {
        return false;
    }
    out = static_cast<std::size_t>(value);
    return true;
}

} // namespace sigil::security

#endif // INCLUDE_SIGIL_SECURITY_SECURERANDOM_HPP
