#ifndef INCLUDE_SIGIL_LOG_LOGGER_HPP
#define INCLUDE_SIGIL_LOG_LOGGER_HPP

#include <cstdint>
#include <fmt/format.h>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>

namespace sigil::log
{

enum class Level : std::uint8_t
{
    Debug,
    Info,
    Warn,
    Error,
};

[[nodiscard]] std::string_view toString(Level level) noexcept;

// Accepts "debug", "info", "warn", "error".
[[nodiscard]] std::optional<Level> parseLevel(std::string_view text) noexcept;

// Sink handed to every service at construction. Messages never carry plaintext or key material.
class ILogger
{
public:
    ILogger() = default;
    ILogger(const ILogger&) = delete;
    ILogger& operator=(const ILogger&) = delete;
    ILogger(ILogger&&) = delete;
    ILogger& operator=(ILogger&&) = delete;
    virtual ~ILogger() = default;

    [[nodiscard]] virtual bool enabled(Level level) const noexcept = 0;
    virtual void write(Level level, std::string_view message) noexcept = 0;

    template <class... Args> void log(Level level, fmt::format_string<Args...> format, Args&&... args)
    {
        if (!enabled(level))
        {
            return;
        }
        write(level, fmt::format(format, std::forward<Args>(args)...));
    }

    template <class... Args> void debug(fmt::format_string<Args...> format, Args&&... args)
    {
        log(Level::Debug, format, std::forward<Args>(args)...);
    }

    template <class... Args> void info(fmt::format_string<Args...> format, Args&&... args)
    {
        log(Level::Info, format, std::forward<Args>(args)...);
    }

    template <class... Args> void warn(fmt::format_string<Args...> format, Args&&... args)
    {
        log(Level::Warn, format, std::forward<Args>(args)...);
    }

    template <class... Args> void error(fmt::format_string<Args...> format, Args&&... args)
    {
        log(Level::Error, format, std::forward<Args>(args)...);
    }
};

class NullLogger final : public ILogger
{
public:
    [[nodiscard]] bool enabled([[maybe_unused]] Level level) const noexcept override
    {
        return false;
    }

    void write([[maybe_unused]] Level level, [[maybe_unused]] std::string_view message) noexcept override
    {
    }
};

// Timestamped lines on stderr; writes are serialized.
[[nodiscard]] std::unique_ptr<ILogger> makeStderrLogger(Level minLevel);

} // namespace sigil::log

#endif // INCLUDE_SIGIL_LOG_LOGGER_HPP
