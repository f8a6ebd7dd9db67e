#ifndef INCLUDE_CHUNKVAULT_SECURITY_SECUREBUFFER_HPP
#define INCLUDE_CHUNKVAULT_SECURITY_SECUREBUFFER_HPP

#include "chunkvault/security/ZeroAllocator.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace chunkvault::security
{

// Key bytes, derived subkeys and decrypted chunk plaintext.
using SecureBuffer = std::vector<std::uint8_t, ZeroAllocator<std::uint8_t>>;

[[nodiscard]] inline std::span<std::uint8_t> asSpan(SecureBuffer& b) noexcept
{
    return std::span{ b };
}

[[nodiscard]] inline std::span<const std::uint8_t> asSpan(const SecureBuffer& b) noexcept
{
    return std::span{ b };
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureBuffer& b) noexcept
{
    return std::as_bytes(std::span{ b });
}

[[nodiscard]] inline SecureBuffer secureBufferFrom(std::span<const std::uint8_t> bytes)
{
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureBuffer(bytes.begin(), bytes.end());
}

// Wipes the live bytes and gives the capacity back, leaving `b` empty.
inline void secureRelease(SecureBuffer& b) noexcept
{
    secureWipe(std::span{ b });
    SecureBuffer{}.swap(b);
}

} // namespace chunkvault::security

#endif // INCLUDE_CHUNKVAULT_SECURITY_SECUREBUFFER_HPP
