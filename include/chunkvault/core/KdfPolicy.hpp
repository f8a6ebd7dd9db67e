#ifndef INCLUDE_CHUNKVAULT_CORE_KDFPOLICY_HPP
#define INCLUDE_CHUNKVAULT_CORE_KDFPOLICY_HPP

#include "chunkvault/crypto/KdfMetadata.hpp"
#include <cstdint>
#include <optional>

namespace chunkvault::core
{

// Argon2id cost used to wrap file keys under a recipient passphrase.
[[nodiscard]] chunkvault::crypto::Argon2idParams defaultArgon2idParams() noexcept;

// Applies non-zero overrides to the defaults. std::nullopt when the result is outside the supported range.
[[nodiscard]] std::optional<chunkvault::crypto::Argon2idParams>
resolveArgon2idParams(std::uint32_t iterationsOverride, std::uint32_t memoryKiBOverride) noexcept;

// Fresh salt per call; std::nullopt when the OS random source fails.
[[nodiscard]] std::optional<chunkvault::crypto::KdfMetadata>
makeKdfMetadata(chunkvault::crypto::Argon2idParams params) noexcept;

} // namespace chunkvault::core

#endif // INCLUDE_CHUNKVAULT_CORE_KDFPOLICY_HPP
