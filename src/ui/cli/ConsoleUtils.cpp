#include "ConsoleUtils.hpp"

#include <iostream>
#include <span>
#include <string>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__linux__)
#include <sys/mman.h>
#include <sys/resource.h>
#include <termios.h>
#include <unistd.h>
#else
#error "Unsupported platform"
#endif

namespace sigil::ui::cli
{

namespace
{

// Turns echo off for its lifetime and puts back whatever mode the terminal had. Does nothing when
// stdin is not a terminal.
class EchoSuppressor final
{
public:
    EchoSuppressor() noexcept
    {
#if defined(_WIN32)
        m_handle = GetStdHandle(STD_INPUT_HANDLE);
        if (GetConsoleMode(m_handle, &m_saved) != 0)
        {
            m_active = SetConsoleMode(m_handle, m_saved & ~static_cast<DWORD>(ENABLE_ECHO_INPUT)) != 0;
        }
#elif defined(__linux__)
        if (tcgetattr(STDIN_FILENO, &m_saved) == 0)
        {
            struct termios silent{ m_saved };
            silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
            m_active = tcsetattr(STDIN_FILENO, TCSANOW, &silent) == 0;
        }
#endif
    }

    EchoSuppressor(const EchoSuppressor&) = delete;
    EchoSuppressor& operator=(const EchoSuppressor&) = delete;
    EchoSuppressor(EchoSuppressor&&) = delete;
    EchoSuppressor& operator=(EchoSuppressor&&) = delete;

    ~EchoSuppressor()
    {
        if (!m_active)
        {
            return;
        }
#if defined(_WIN32)
        (void)SetConsoleMode(m_handle, m_saved);
#elif defined(__linux__)
        (void)tcsetattr(STDIN_FILENO, TCSANOW, &m_saved);
#endif
    }

private:
#if defined(_WIN32)
    HANDLE m_handle{ nullptr };
    DWORD m_saved{ 0 };
#elif defined(__linux__)
    struct termios m_saved{};
#endif
    bool m_active{ false };
};

} // namespace

void lockProcessMemory() noexcept
{
#if defined(__linux__)
    (void)mlockall(MCL_CURRENT | MCL_FUTURE);
    const struct rlimit noCore{ 0, 0 };
    (void)setrlimit(RLIMIT_CORE, &noCore);
#endif
}

sigil::security::SecureString readPassword(const std::string& prompt)
{
    std::cout << prompt << std::flush;

    std::string line;
    {
        const EchoSuppressor quiet{};
        std::getline(std::cin, line);
    }
    std::cout << "\n";

    auto secret{ sigil::security::secureStringFrom(line) };
    sigil::security::secureWipe(std::span<char>{ line.data(), line.size() });
    return secret;
}

} // namespace sigil::ui::cli
