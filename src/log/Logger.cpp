#include "sigil/log/Logger.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <exception>
#include <fmt/chrono.h>
#include <initializer_list>
#include <mutex>

namespace sigil::log
{
namespace
{

class StderrLogger final : public ILogger
{
public:
    explicit StderrLogger(Level minLevel) noexcept : m_minLevel{ minLevel }
    {
    }

    [[nodiscard]] bool enabled(Level level) const noexcept override
    {
        return level >= m_minLevel;
    }

    void write(Level level, std::string_view message) noexcept override
    {
        const auto now{ std::chrono::system_clock::now() };
        const std::time_t seconds{ std::chrono::system_clock::to_time_t(now) };

        const std::scoped_lock lock{ m_mutex };
        try
        {
            fmt::print(stderr, "{:%Y-%m-%dT%H:%M:%SZ} [{}] {}\n", fmt::gmtime(seconds), toString(level), message);
        }
        catch (const std::exception& e)
        {
            std::fputs("sigil: log write failed: ", stderr);
            std::fputs(e.what(), stderr);
            std::fputc('\n', stderr);
        }
    }

private:
    Level m_minLevel;
    std::mutex m_mutex;
};

} // namespace

std::string_view toString(Level level) noexcept
{
    switch (level)
    {
    case Level::Debug:
        return "debug";
    case Level::Info:
        return "info";
    case Level::Warn:
        return "warn";
    case Level::Error:
        return "error";
    }
    return "unknown";
}

std::optional<Level> parseLevel(std::string_view text) noexcept
{
    for (const Level level : { Level::Debug, Level::Info, Level::Warn, Level::Error })
    {
        if (text == toString(level))
        {
            return level;
        }
    }
    return std::nullopt;
}

std::unique_ptr<ILogger> makeStderrLogger(Level minLevel)
{
    return std::make_unique<StderrLogger>(minLevel);
}

} // namespace sigil::log
