#ifndef INCLUDE_CHUNKVAULT_CORE_BASE64_HPP
#define INCLUDE_CHUNKVAULT_CORE_BASE64_HPP

#include "chunkvault/security/SecureBuffer.hpp"
#include "chunkvault/security/SecureString.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chunkvault::core
{

// RFC 4648 standard alphabet, always padded.
[[nodiscard]] std::string encodeBase64(std::span<const std::uint8_t> data);

// Key material variant: the encoded text lives in wiped memory.
[[nodiscard]] chunkvault::security::SecureString encodeBase64Secure(std::span<const std::uint8_t> data);

// Strict: length must be a multiple of 4, padding only at the end, no whitespace,
// unused trailing bits must be zero. Returns std::nullopt on any violation.
[[nodiscard]] std::optional<std::vector<std::uint8_t>> decodeBase64(std::string_view text);

[[nodiscard]] std::optional<chunkvault::security::SecureBuffer> decodeBase64Secure(std::string_view text);

} // namespace chunkvault::core

#endif // INCLUDE_CHUNKVAULT_CORE_BASE64_HPP
