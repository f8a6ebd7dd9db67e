#ifndef INCLUDE_CHUNKVAULT_CRYPTO_KEYDERIVATION_HPP
#define INCLUDE_CHUNKVAULT_CRYPTO_KEYDERIVATION_HPP

#include "chunkvault/crypto/KdfMetadata.hpp"
#include "chunkvault/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace chunkvault::crypto
{

[[nodiscard]] chunkvault::security::SecureBuffer
deriveKeyArgon2id(std::span<const std::byte> passphrase, std::span<const std::byte> salt, Argon2idParams params);

// HKDF (RFC 5869 layout) with keyed BLAKE2b-512 standing in for HMAC.
[[nodiscard]] chunkvault::security::SecureBuffer hkdfBlake2b(std::span<const std::uint8_t> inputKey,
                                                            std::span<const std::byte> salt,
                                                            std::span<const std::byte> info, std::size_t outBytes);

} // namespace chunkvault::crypto

#endif // INCLUDE_CHUNKVAULT_CRYPTO_KEYDERIVATION_HPP
