#ifndef INCLUDE_SIGIL_CORE_RECORDIDS_HPP
#define INCLUDE_SIGIL_CORE_RECORDIDS_HPP

#include <chrono>
#include <string>

namespace sigil::core
{

// Random UUID v4 text. Throws RandomFailure if the CSPRNG fails.
[[nodiscard]] std::string makeRecordId();

// ISO-8601 UTC with milliseconds, e.g. 2026-01-02T03:04:05.678Z.
[[nodiscard]] std::string isoTimestamp(std::chrono::system_clock::time_point when);

[[nodiscard]] inline std::string isoTimestampNow()
{
    return isoTimestamp(std::chrono::system_clock::now());
}

} // namespace sigil::core

#endif // INCLUDE_SIGIL_CORE_RECORDIDS_HPP
