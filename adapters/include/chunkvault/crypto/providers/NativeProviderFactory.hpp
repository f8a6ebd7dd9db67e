#ifndef INCLUDE_CHUNKVAULT_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
#define INCLUDE_CHUNKVAULT_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP

#include "chunkvault/crypto/ICryptoProvider.hpp"
#include <memory>

namespace chunkvault::crypto::providers
{

// Monocypher backend: ChaCha20-Poly1305 (IETF), HKDF over keyed BLAKE2b, Argon2id.
[[nodiscard]] std::unique_ptr<chunkvault::crypto::ICryptoProvider> makeNativeCryptoProvider();

} // namespace chunkvault::crypto::providers

#endif // INCLUDE_CHUNKVAULT_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
