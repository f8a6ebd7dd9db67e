#ifndef INCLUDE_CHUNKVAULT_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_CHUNKVAULT_CRYPTO_ICRYPTOPROVIDER_HPP

#include "chunkvault/crypto/KdfMetadata.hpp"
#include "chunkvault/security/SecureBuffer.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace chunkvault::crypto
{

constexpr std::size_t g_aeadKeyBytes{ 32 };
constexpr std::size_t g_aeadNonceBytes{ 12 };
constexpr std::size_t g_aeadTagBytes{ 16 };

// Upper bound for a single deriveSubkey output (one BLAKE2b block, two SHA-256 blocks).
constexpr std::size_t g_maxSubkeyBytes{ 64 };

// AEAD + KDF pair a provider implements. Recorded in every manifest so a blob is never
// decrypted with a primitive it was not sealed with.
enum class CipherSuite : std::uint32_t
{
    Aes256GcmHkdfSha256 = 1U,
    ChaCha20Poly1305Blake2b = 2U,
};

[[nodiscard]] constexpr std::string_view cipherSuiteName(CipherSuite suite) noexcept
{
    switch (suite)
    {
    case CipherSuite::Aes256GcmHkdfSha256:
        return "AES-256-GCM/HKDF-SHA256";
    case CipherSuite::ChaCha20Poly1305Blake2b:
        return "ChaCha20-Poly1305/HKDF-BLAKE2b";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool isKnownCipherSuite(std::uint32_t raw) noexcept
{
    return raw == static_cast<std::uint32_t>(CipherSuite::Aes256GcmHkdfSha256) ||
           raw == static_cast<std::uint32_t>(CipherSuite::ChaCha20Poly1305Blake2b);
}

// Thrown when the OS random source fails. Encryption must not continue without a fresh nonce.
class RandomSourceError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct AeadBox final
{
    std::array<std::uint8_t, g_aeadNonceBytes> nonce{};
    std::array<std::uint8_t, g_aeadTagBytes> tag{};
    std::vector<std::uint8_t> cipherText;
};

class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    [[nodiscard]] virtual CipherSuite suite() const noexcept = 0;

    // Derives a key-encryption key from a passphrase (Argon2id).
    // Contract violations (unsupported algorithm/version/params) throw std::invalid_argument.
    [[nodiscard]] virtual chunkvault::security::SecureBuffer
    deriveKeyEncryptionKey(std::span<const std::byte> passphrase, const KdfMetadata& meta) const = 0;

    // HKDF extract-then-expand over the suite's hash. Deterministic for identical inputs.
    [[nodiscard]] virtual chunkvault::security::SecureBuffer deriveSubkey(std::span<const std::uint8_t> inputKey,
                                                                         std::span<const std::byte> salt,
                                                                         std::span<const std::byte> info,
                                                                         std::size_t outBytes) const = 0;

    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;

    // Generates a fresh random nonce per call; throws RandomSourceError if none can be drawn.
    [[nodiscard]] virtual AeadBox aeadEncrypt(std::span<const std::uint8_t> key, std::span<const std::byte> plainText,
                                              std::span<const std::byte> associatedData) = 0;

    // Returns std::nullopt on authentication failure.
    [[nodiscard]] virtual std::optional<chunkvault::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const AeadBox& box, std::span<const std::byte> associatedData) = 0;
};

} // namespace chunkvault::crypto

#endif // INCLUDE_CHUNKVAULT_CRYPTO_ICRYPTOPROVIDER_HPP
