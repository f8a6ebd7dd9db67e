#include "chunkvault/crypto/KeyDerivation.hpp"
#include "chunkvault/crypto/providers/NativeProviderFactory.hpp"
#include "chunkvault/security/ScopeWipe.hpp"
#include "chunkvault/security/SecureBuffer.hpp"
#include "chunkvault/security/SecureRandom.hpp"
#include "monocypher.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

namespace chunkvault::crypto::providers
{
namespace
{

std::span<const std::uint8_t> asU8(std::span<const std::byte> s) noexcept
{
    return { reinterpret_cast<const std::uint8_t*>(s.data()), s.size() };
}

void requireExactSize(std::span<const std::uint8_t> s, std::size_t expected, const char* what)
{
    if (s.size() != expected)
    {
        throw std::invalid_argument(what);
    }
}

void requirePolicySupported(const chunkvault::crypto::KdfMetadata& meta)
{
    if (meta.policyVersion != chunkvault::crypto::g_kKdfPolicyVersion)
    {
        throw std::invalid_argument("deriveKeyEncryptionKey: unsupported policyVersion");
    }
    if (meta.algorithm != chunkvault::crypto::KdfAlgorithm::Argon2id)
    {
        throw std::invalid_argument("deriveKeyEncryptionKey: unsupported algorithm");
    }
    if (meta.argon2Version != chunkvault::crypto::g_kArgon2VersionV13)
    {
        throw std::invalid_argument("deriveKeyEncryptionKey: unsupported Argon2 version");
    }
    if (meta.derivedKeyBytes != chunkvault::crypto::g_kKekBytes)
    {
        throw std::invalid_argument("deriveKeyEncryptionKey: unsupported derivedKeyBytes");
    }
}

class NativeCryptoProvider final : public chunkvault::crypto::ICryptoProvider
{
public:
    [[nodiscard]] chunkvault::crypto::CipherSuite suite() const noexcept override
    {
        return chunkvault::crypto::CipherSuite::ChaCha20Poly1305Blake2b;
    }

    [[nodiscard]] chunkvault::security::SecureBuffer
    deriveKeyEncryptionKey(std::span<const std::byte> passphrase,
                           const chunkvault::crypto::KdfMetadata& meta) const override
    {
        requirePolicySupported(meta);
        return chunkvault::crypto::deriveKeyArgon2id(passphrase, std::as_bytes(std::span{ meta.salt }),
                                                     meta.argon2id);
    }

    [[nodiscard]] chunkvault::security::SecureBuffer deriveSubkey(std::span<const std::uint8_t> inputKey,
                                                                 std::span<const std::byte> salt,
                                                                 std::span<const std::byte> info,
                                                                 std::size_t outBytes) const override
    {
        return chunkvault::crypto::hkdfBlake2b(inputKey, salt, info, outBytes);
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return chunkvault::security::secureRandomFill(out);
    }

    [[nodiscard]] chunkvault::crypto::AeadBox aeadEncrypt(std::span<const std::uint8_t> key,
                                                          std::span<const std::byte> plainText,
                                                          std::span<const std::byte> associatedData) override
    {
        requireExactSize(key, chunkvault::crypto::g_aeadKeyBytes, "aeadEncrypt: key");

        chunkvault::crypto::AeadBox box{};
        if (!randomBytes(std::span<std::uint8_t>{ box.nonce }))
        {
            throw chunkvault::crypto::RandomSourceError("aeadEncrypt: CSPRNG failure");
        }

        box.cipherText.resize(plainText.size());

        crypto_aead_ctx ctx{};
        auto wipeCtx = chunkvault::security::scopeWipe(std::as_writable_bytes(std::span{ &ctx, 1 }));
        crypto_aead_init_ietf(&ctx, key.data(), box.nonce.data());
        crypto_aead_write(&ctx, box.cipherText.data(), box.tag.data(), asU8(associatedData).data(),
                          associatedData.size(), asU8(plainText).data(), plainText.size());

        return box;
    }

    [[nodiscard]] std::optional<chunkvault::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const chunkvault::crypto::AeadBox& box,
                std::span<const std::byte> associatedData) override
    {
        requireExactSize(key, chunkvault::crypto::g_aeadKeyBytes, "aeadDecrypt: key");

        chunkvault::security::SecureBuffer plainText{};
        plainText.resize(box.cipherText.size());

        crypto_aead_ctx ctx{};
        auto wipeCtx = chunkvault::security::scopeWipe(std::as_writable_bytes(std::span{ &ctx, 1 }));
        crypto_aead_init_ietf(&ctx, key.data(), box.nonce.data());
        const int rc = crypto_aead_read(&ctx, plainText.data(), box.tag.data(), asU8(associatedData).data(),
                                        associatedData.size(), box.cipherText.data(), box.cipherText.size());
        if (rc != 0)
        {
            chunkvault::security::secureRelease(plainText);
            return std::nullopt;
        }

        return plainText;
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<chunkvault::crypto::ICryptoProvider> makeNativeCryptoProvider()
{
    return std::make_unique<NativeCryptoProvider>();
}

} // namespace chunkvault::crypto::providers
