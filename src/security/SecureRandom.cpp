#include "sigil/security/SecureRandom.hpp"
#include <array>
#include <cerrno>
#include <cstring>
#include <limits>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#include <bcrypt.h>
#elif defined(__linux__)
#include <sys/random.h>
#else
#error Unsupported platform
#endif

namespace sigil::security
{
namespace
{

[[nodiscard]] bool randomUint64(std::uint64_t& out) noexcept
{
    std::array<std::uint8_t, sizeof(std::uint64_t)> bytes{};
    if (!secureRandomFill(std::span{ bytes }))
    {
        return false;
    }
    std::memcpy(&out, bytes.data(), sizeof(out));
    return true;
}

} // namespace

bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    std::uint8_t* cursor{ out.data() };
    std::size_t remaining{ out.size() };

#if defined(_WIN32)
    constexpr std::size_t kMaxChunk{ static_cast<std::size_t>(std::numeric_limits<ULONG>::max()) };
    while (remaining > 0U)
    {
        const std::size_t chunk{ (remaining > kMaxChunk) ? kMaxChunk : remaining };
        const NTSTATUS status{ BCryptGenRandom(nullptr, reinterpret_cast<PUCHAR>(cursor), static_cast<ULONG>(chunk),
                                               BCRYPT_USE_SYSTEM_PREFERRED_RNG) };
        if (!BCRYPT_SUCCESS(status))
        {
            return false;
        }
        remaining -= chunk;
        cursor += chunk;
    }
#else
    while (remaining > 0U)
    {
        const ssize_t got{ ::getrandom(cursor, remaining, 0) };
        if (got < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return false;
        }
        if (got == 0 || static_cast<std::size_t>(got) > remaining)
        {
            return false;
        }
        remaining -= static_cast<std::size_t>(got);
        cursor += got;
    }
#endif
    return true;
}

bool secureRandomBounded(std::uint64_t maxExcl, std::uint64_t& out) noexcept
{
    if (maxExcl == 0U)
    {
        return false;
    }
    if (maxExcl == 1U)
    {
        out = 0U;
        return true;
    }

    const std::uint64_t limit{ (std::numeric_limits<std::uint64_t>::max() / maxExcl) * maxExcl };
    constexpr std::size_t kMaxAttempts{ 128U };
    for (std::size_t attempt{}; attempt < kMaxAttempts; ++attempt)
    {
        std::uint64_t candidate{};
        if (!randomUint64(candidate))
        {
            return false;
        }
        if (candidate < limit)
        {
            out = candidate % maxExcl;
            return true;
        }
    }
    return false;
}

} // namespace sigil::security
