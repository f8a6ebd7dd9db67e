#include "ConsoleUtils.hpp"
#include "chunkvault/security/MemoryWiper.hpp"

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

namespace chunkvault::ui::cli
{

namespace
{

// Restores the previous echo state on scope exit, also when getline throws.
class EchoGuard final
{
public:
    EchoGuard()
    {
#if defined(_WIN32)
        m_handle = GetStdHandle(STD_INPUT_HANDLE);
        m_active = GetConsoleMode(m_handle, &m_saved) != 0;
        if (m_active)
        {
            SetConsoleMode(m_handle, m_saved & ~static_cast<DWORD>(ENABLE_ECHO_INPUT));
        }
#elif defined(__linux__)
        m_active = tcgetattr(STDIN_FILENO, &m_saved) == 0;
        if (m_active)
        {
            struct termios tty = m_saved;
            tty.c_lflag &= ~static_cast<tcflag_t>(ECHO);
            tcsetattr(STDIN_FILENO, TCSANOW, &tty);
        }
#endif
    }
    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;
    EchoGuard(EchoGuard&&) = delete;
    EchoGuard& operator=(EchoGuard&&) = delete;

    ~EchoGuard() noexcept
    {
        if (!m_active)
        {
            return;
        }
#if defined(_WIN32)
        SetConsoleMode(m_handle, m_saved);
#elif defined(__linux__)
        tcsetattr(STDIN_FILENO, TCSANOW, &m_saved);
#endif
    }

private:
#if defined(_WIN32)
    HANDLE m_handle{ nullptr };
    DWORD m_saved{ 0 };
#elif defined(__linux__)
    struct termios m_saved
    {
    };
#endif
    bool m_active{ false };
};

} // namespace

void lockProcessMemory() noexcept
{
#if defined(__linux__)
    mlockall(MCL_CURRENT | MCL_FUTURE);
    struct rlimit lim
    {
        0, 0
    };
    setrlimit(RLIMIT_CORE, &lim);
#endif
}

chunkvault::security::SecureString readPassphrase(const std::string& prompt)
{
    std::cerr << prompt << std::flush;

    std::string line;
    {
        EchoGuard noEcho{};
        std::getline(std::cin, line);
    }
    std::cerr << "\n";
    if (!line.empty() && line.back() == '\r')
    {
        line.back() = '\0';
        line.pop_back();
    }

    auto sec = chunkvault::security::secureStringFrom(line);
    chunkvault::security::secureWipe(std::as_writable_bytes(std::span<char>{ line.data(), line.size() }));
    return sec;
}

} // namespace chunkvault::ui::cli
