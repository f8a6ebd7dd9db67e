#ifndef INCLUDE_CHUNKVAULT_SECURITY_SECURESTRING_HPP
#define INCLUDE_CHUNKVAULT_SECURITY_SECURESTRING_HPP

#include "chunkvault/security/ZeroAllocator.hpp"
#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace chunkvault::security
{

// Recipient passphrases and base64 key exports. Not NUL-terminated.
using SecureString = std::vector<char, ZeroAllocator<char>>;

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(s.begin(), s.end());
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    return s.empty() ? std::string_view{} : std::string_view{ s.data(), s.size() };
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureString& s) noexcept
{
    return std::as_bytes(std::span{ s });
}

inline void secureRelease(SecureString& s) noexcept
{
    secureWipe(std::span{ s });
    SecureString{}.swap(s);
}

} // namespace chunkvault::security

#endif // INCLUDE_CHUNKVAULT_SECURITY_SECURESTRING_HPP
