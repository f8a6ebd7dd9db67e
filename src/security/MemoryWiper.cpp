#include "chunkvault/security/MemoryWiper.hpp"

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__linux__) || defined(__FreeBSD__) || defined(__OpenBSD__)
#include <string.h>
#define CHKV_HAVE_EXPLICIT_BZERO 1
#endif

namespace chunkvault::security
{

void secureWipe(std::span<std::byte> bytes) noexcept
{
    if (bytes.empty())
    {
        return;
    }
#if defined(_WIN32)
    ::SecureZeroMemory(bytes.data(), bytes.size());
#elif defined(CHKV_HAVE_EXPLICIT_BZERO)
    ::explicit_bzero(bytes.data(), bytes.size());
#else
    // Stores through a volatile pointer are observable, so the compiler cannot drop them.
    volatile std::byte* p{ bytes.data() };
    for (std::size_t i{}; i < bytes.size(); ++i)
    {
        p[i] = std::byte{ 0 };
    }
#endif
}

} // namespace chunkvault::security
