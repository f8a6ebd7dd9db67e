#ifndef INCLUDE_CHUNKVAULT_SECURITY_SECUREEQUALS_HPP
#define INCLUDE_CHUNKVAULT_SECURITY_SECUREEQUALS_HPP

#include "chunkvault/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace chunkvault::security
{
// Constant-time for equal-length inputs.
[[nodiscard]] inline bool secureEquals(std::span<const std::byte> a, std::span<const std::byte> b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }

    volatile unsigned char diff{};
    for (std::size_t i{}; i < a.size(); ++i)
    {
        diff |= (std::to_integer<unsigned char>(a[i]) ^ std::to_integer<unsigned char>(b[i]));
    }
    return (diff == 0);
}

[[nodiscard]] inline bool secureEquals(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) noexcept
{
    return secureEquals(std::as_bytes(a), std::as_bytes(b));
}

[[nodiscard]] inline bool secureEquals(const SecureBuffer& a, const SecureBuffer& b) noexcept
{
    return secureEquals(asBytes(a), asBytes(b));
}

} // namespace chunkvault::security

#endif // INCLUDE_CHUNKVAULT_SECURITY_SECUREEQUALS_HPP
