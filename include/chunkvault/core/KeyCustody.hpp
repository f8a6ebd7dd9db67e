#ifndef INCLUDE_CHUNKVAULT_CORE_KEYCUSTODY_HPP
#define INCLUDE_CHUNKVAULT_CORE_KEYCUSTODY_HPP

#include "chunkvault/core/ChunkError.hpp"
#include "chunkvault/core/KeyManager.hpp"
#include "chunkvault/crypto/ICryptoProvider.hpp"
#include "chunkvault/crypto/KdfMetadata.hpp"
#include "chunkvault/security/SecureString.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace chunkvault::core
{

constexpr std::size_t g_wrappedKeyMagicBytes{ 8U };
constexpr std::array<char, g_wrappedKeyMagicBytes> g_wrappedKeyMagic{ 'C', 'H', 'K', 'V', 'K', 'E', 'Y', '1' };
constexpr std::size_t g_maxRecipientIdBytes{ 1024U };

enum class KeyEncapsulationKind : std::uint32_t
{
    RawKeyExport = 1U,
    PassphraseWrap = 2U,
};

// The unprotected base64 export the web client hands to its backend.
struct RawKeyExport final
{
    chunkvault::security::SecureString base64;
};

// Master key sealed under an Argon2id-derived key-encryption key.
struct PassphraseWrap final
{
    chunkvault::crypto::CipherSuite suite{ chunkvault::crypto::CipherSuite::Aes256GcmHkdfSha256 };
    chunkvault::crypto::KdfMetadata kdf{};
    chunkvault::crypto::AeadBox box{};
};

using KeyEncapsulation = std::variant<RawKeyExport, PassphraseWrap>;

struct WrappedKey final
{
    std::string recipientId;
    KeyEncapsulation encapsulation;

    [[nodiscard]] KeyEncapsulationKind kind() const noexcept
    {
        return std::holds_alternative<RawKeyExport>(encapsulation) ? KeyEncapsulationKind::RawKeyExport
                                                                  : KeyEncapsulationKind::PassphraseWrap;
    }
};

class KeyCustody final
{
public:
    explicit KeyCustody(chunkvault::crypto::ICryptoProvider& crypto) noexcept;

    [[nodiscard]] ChunkResult<chunkvault::security::SecureString> exportRawKey(const MasterKey& master) const noexcept;

    // KeyDerivationFailed unless the text is strict base64 of exactly 32 bytes.
    [[nodiscard]] ChunkResult<MasterKey> importRawKey(std::string_view base64) const noexcept;

    [[nodiscard]] ChunkResult<WrappedKey> wrapRawExport(const MasterKey& master,
                                                        std::string_view recipientId) const noexcept;

    // AAD binds the recipient id, the suite and the full KDF metadata.
    [[nodiscard]] ChunkResult<WrappedKey> wrapForRecipient(const MasterKey& master, std::string_view recipientId,
                                                           const chunkvault::security::SecureString& passphrase,
                                                           const chunkvault::crypto::Argon2idParams& params) noexcept;

    // Raw exports ignore the passphrase. A wrong passphrase or a tampered wrap is AuthenticationFailed.
    [[nodiscard]] ChunkResult<MasterKey> unwrapKey(const WrappedKey& wrapped,
                                                   const chunkvault::security::SecureString& passphrase) noexcept;

private:
    chunkvault::crypto::ICryptoProvider* m_crypto{ nullptr };
};

// magic | kind u32 | recipient (u32 length + bytes) | payload, little-endian.
[[nodiscard]] ChunkResult<std::vector<std::uint8_t>> encodeWrappedKey(const WrappedKey& wrapped) noexcept;
[[nodiscard]] ChunkResult<WrappedKey> decodeWrappedKey(std::span<const std::uint8_t> bytes) noexcept;

[[nodiscard]] bool isWrappedKey(std::span<const std::uint8_t> bytes) noexcept;

} // namespace chunkvault::core

#endif // INCLUDE_CHUNKVAULT_CORE_KEYCUSTODY_HPP
