#include "chunkvault/security/SecureRandom.hpp"
#include <cerrno>
#include <cstddef>
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

namespace chunkvault::security
{
bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    if (out.empty())
    {
        return true;
    }
    std::uint8_t* outPtr{ out.data() };
    std::size_t remaining{ out.size() };

#if defined(_WIN32)
    constexpr std::size_t kMaxRequest{ static_cast<std::size_t>(std::numeric_limits<ULONG>::max()) };
    while (remaining > 0U)
    {
        const std::size_t request{ (remaining > kMaxRequest) ? kMaxRequest : remaining };
        const NTSTATUS status{ BCryptGenRandom(nullptr, reinterpret_cast<PUCHAR>(outPtr), static_cast<ULONG>(request),
                                               BCRYPT_USE_SYSTEM_PREFERRED_RNG) };
        if (!BCRYPT_SUCCESS(status))
        {
            return false;
        }
        remaining -= request;
        outPtr += request;
    }
#elif defined(__linux__)
    while (remaining > 0U)
    {
        const ssize_t got{ ::getrandom(outPtr, remaining, 0) };
        if (got > 0)
        {
            const auto received{ static_cast<std::size_t>(got) };
            if (received > remaining)
            {
                return false;
            }
            remaining -= received;
            outPtr += received;
            continue;
        }
        if (got < 0 && errno == EINTR)
        {
            continue;
        }
        return false;
    }
#endif
    return true;
}

} // namespace chunkvault::security
