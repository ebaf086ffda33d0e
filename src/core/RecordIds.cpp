#include "sigil/core/RecordIds.hpp"

#include "sigil/core/VaultErrors.hpp"
#include "sigil/crypto/Encoding.hpp"
#include "sigil/security/SecureRandom.hpp"
#include <array>
#include <cstdint>
#include <ctime>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <span>

namespace sigil::core
{

std::string makeRecordId()
{
    std::array<std::uint8_t, 16> raw{};
    if (!sigil::security::secureRandomFill(std::span<std::uint8_t>{ raw }))
    {
        throw RandomFailure("record id: CSPRNG failure");
    }
    raw[6] = static_cast<std::uint8_t>((raw[6] & 0x0FU) | 0x40U); // version 4
    raw[8] = static_cast<std::uint8_t>((raw[8] & 0x3FU) | 0x80U); // RFC 4122 variant

    const std::string hex{ sigil::crypto::toHex(std::span<const std::uint8_t>{ raw }) };
    return fmt::format("{}-{}-{}-{}-{}", hex.substr(0, 8), hex.substr(8, 4), hex.substr(12, 4), hex.substr(16, 4),
                       hex.substr(20, 12));
}

std::string isoTimestamp(std::chrono::system_clock::time_point when)
{
    const auto millis{ std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count() % 1000 };
    const std::time_t seconds{ std::chrono::system_clock::to_time_t(when) };
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z", fmt::gmtime(seconds), millis < 0 ? millis + 1000 : millis);
}

} // namespace sigil::core
