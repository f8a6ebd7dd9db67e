#ifndef INCLUDE_CHUNKVAULT_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_CHUNKVAULT_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "chunkvault/crypto/ICryptoProvider.hpp"
#include <memory>

namespace chunkvault::crypto::providers
{

// OpenSSL backend: AES-256-GCM and HKDF-SHA256, byte-compatible with WebCrypto clients.
[[nodiscard]] std::unique_ptr<chunkvault::crypto::ICryptoProvider> makeOpenSslCryptoProvider();

} // namespace chunkvault::crypto::providers

#endif // INCLUDE_CHUNKVAULT_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
