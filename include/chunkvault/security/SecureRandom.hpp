#ifndef INCLUDE_CHUNKVAULT_SECURITY_SECURERANDOM_HPP
#define INCLUDE_CHUNKVAULT_SECURITY_SECURERANDOM_HPP

#include <cstdint>
#include <span>

namespace chunkvault::security
{

// Fills `out` from the OS CSPRNG. Returns false if the source is unavailable; callers must fail closed.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

} // namespace chunkvault::security

#endif // INCLUDE_CHUNKVAULT_SECURITY_SECURERANDOM_HPP
