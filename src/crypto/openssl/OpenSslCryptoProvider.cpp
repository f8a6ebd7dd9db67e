#include "chunkvault/crypto/providers/OpenSslProviderFactory.hpp"
#include "chunkvault/security/SecureBuffer.hpp"
#include "chunkvault/security/SecureRandom.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

namespace chunkvault::crypto::providers
{
namespace
{

constexpr const char* g_kKdfParamArgon2Memcost{ "memcost" };
constexpr const char* g_kKdfParamArgon2Lanes{ "lanes" };
constexpr const char* g_kKdfParamThreads{ "threads" };
constexpr const char* g_kKdfParamArgon2Version{ "version" };

void requireExactSize(std::span<const std::uint8_t> s, std::size_t expected, const char* what)
{
    if (s.size() != expected)
    {
        throw std::invalid_argument(what);
    }
}

void requireFitsInt(std::size_t n, const char* what)
{
    if (n > static_cast<std::size_t>(std::numeric_limits<int>::max()))
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

void requireArgon2idParamsSafe(const chunkvault::crypto::Argon2idParams& params)
{
    if (!chunkvault::crypto::isSupportedArgon2idParams(params))
    {
        throw std::invalid_argument("deriveKeyEncryptionKey: unsupported Argon2id parameters");
    }
}

using EvpKdfPtr = std::unique_ptr<EVP_KDF, decltype(&EVP_KDF_free)>;
using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;
using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

EvpKdfPtr fetchKdf(const char* name)
{
    return EvpKdfPtr{ EVP_KDF_fetch(nullptr, name, nullptr), &EVP_KDF_free };
}

enum class GcmDirection : int
{
    Open = 0,
    Seal = 1,
};

// AES-256-GCM context keyed, with a 12-byte IV and the associated data already absorbed.
[[nodiscard]] EvpCipherCtxPtr openGcm(GcmDirection direction, std::span<const std::uint8_t> key,
                                      std::span<const std::uint8_t> nonce, std::span<const std::byte> associatedData)
{
    requireFitsInt(associatedData.size(), "aead: associatedData too large");

    EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
    if (!ctx)
    {
        throw std::runtime_error("aead: EVP_CIPHER_CTX_new failed");
    }
    const int enc{ static_cast<int>(direction) };
    if (EVP_CipherInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr, enc) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) != 1 ||
        EVP_CipherInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data(), enc) != 1)
    {
        throw std::runtime_error("aead: AES-256-GCM init failed");
    }

    int adLen{ 0 };
    if (!associatedData.empty() &&
        EVP_CipherUpdate(ctx.get(), nullptr, &adLen, reinterpret_cast<const unsigned char*>(associatedData.data()),
                         static_cast<int>(associatedData.size())) != 1)
    {
        throw std::runtime_error("aead: absorbing associated data failed");
    }
    return ctx;
}

// GCM emits no bytes on Final, but OpenSSL still wants a writable pointer.
[[nodiscard]] bool finishGcm(EVP_CIPHER_CTX* ctx) noexcept
{
    std::array<unsigned char, 16> scratch{};
    int finalLen{ 0 };
    return EVP_CipherFinal_ex(ctx, scratch.data(), &finalLen) == 1 && finalLen == 0;
}

class OpenSslCryptoProvider final : public chunkvault::crypto::ICryptoProvider
{
public:
    OpenSslCryptoProvider() : m_argon2idKdf{ fetchKdf("ARGON2ID") }, m_hkdf{ fetchKdf("HKDF") }
    {
    }

    [[nodiscard]] chunkvault::crypto::CipherSuite suite() const noexcept override
    {
        return chunkvault::crypto::CipherSuite::Aes256GcmHkdfSha256;
    }

    [[nodiscard]] chunkvault::security::SecureBuffer
    deriveKeyEncryptionKey(std::span<const std::byte> passphrase,
                           const chunkvault::crypto::KdfMetadata& meta) const override
    {
        if (passphrase.empty())
        {
            throw std::invalid_argument("deriveKeyEncryptionKey: empty passphrase");
        }
        requirePolicySupported(meta);
        requireArgon2idParamsSafe(meta.argon2id);

        // Argon2id landed in OpenSSL 3.2; older builds cannot unwrap passphrase-sealed keys.
        if (!m_argon2idKdf)
        {
            throw std::runtime_error("deriveKeyEncryptionKey: OpenSSL Argon2id KDF not available");
        }

        EvpKdfCtxPtr ctx{ EVP_KDF_CTX_new(m_argon2idKdf.get()), &EVP_KDF_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("deriveKeyEncryptionKey: EVP_KDF_CTX_new failed");
        }

        std::uint32_t iter{ meta.argon2id.iterations };
        std::uint32_t memcostKiB{ meta.argon2id.memoryKiB };
        std::uint32_t lanes{ meta.argon2id.parallelism };
        std::uint32_t threads{ meta.argon2id.parallelism };
        std::uint32_t version{ meta.argon2Version };

        // OSSL_PARAM takes non-const pointers even for inputs; hand it private copies.
        chunkvault::security::SecureBuffer passCopy(passphrase.size());
        std::memcpy(passCopy.data(), passphrase.data(), passphrase.size());
        auto saltCopy{ meta.salt };

        OSSL_PARAM params[]{
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD, passCopy.data(), passCopy.size()),
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, saltCopy.data(), saltCopy.size()),
            OSSL_PARAM_construct_uint32(OSSL_KDF_PARAM_ITER, &iter),
            OSSL_PARAM_construct_uint32(g_kKdfParamArgon2Memcost, &memcostKiB),
            OSSL_PARAM_construct_uint32(g_kKdfParamArgon2Lanes, &lanes),
            OSSL_PARAM_construct_uint32(g_kKdfParamThreads, &threads),
            OSSL_PARAM_construct_uint32(g_kKdfParamArgon2Version, &version),
            OSSL_PARAM_construct_end(),
        };

        chunkvault::security::SecureBuffer out(meta.derivedKeyBytes);
        if (EVP_KDF_derive(ctx.get(), out.data(), out.size(), params) <= 0)
        {
            throw std::runtime_error("deriveKeyEncryptionKey: EVP_KDF_derive failed");
        }
        return out;
    }

    [[nodiscard]] chunkvault::security::SecureBuffer deriveSubkey(std::span<const std::uint8_t> inputKey,
                                                                 std::span<const std::byte> salt,
                                                                 std::span<const std::byte> info,
                                                                 std::size_t outBytes) const override
    {
        if (inputKey.empty())
        {
            throw std::invalid_argument("deriveSubkey: empty inputKey");
        }
        if (outBytes == 0U || outBytes > chunkvault::crypto::g_maxSubkeyBytes)
        {
            throw std::invalid_argument("deriveSubkey: invalid outBytes");
        }
        if (!m_hkdf)
        {
            throw std::runtime_error("deriveSubkey: OpenSSL HKDF not available");
        }

        EvpKdfCtxPtr ctx{ EVP_KDF_CTX_new(m_hkdf.get()), &EVP_KDF_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("deriveSubkey: EVP_KDF_CTX_new failed");
        }

        char digestName[]{ "SHA256" };
        chunkvault::security::SecureBuffer keyCopy(inputKey.begin(), inputKey.end());
        std::vector<std::uint8_t> saltCopy(salt.size());
        if (!salt.empty())
        {
            std::memcpy(saltCopy.data(), salt.data(), salt.size());
        }
        std::vector<std::uint8_t> infoCopy(info.size());
        if (!info.empty())
        {
            std::memcpy(infoCopy.data(), info.data(), info.size());
        }

        OSSL_PARAM params[]{
            OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, digestName, 0),
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_KEY, keyCopy.data(), keyCopy.size()),
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, saltCopy.data(), saltCopy.size()),
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_INFO, infoCopy.data(), infoCopy.size()),
            OSSL_PARAM_construct_end(),
        };

        chunkvault::security::SecureBuffer out(outBytes);
        if (EVP_KDF_derive(ctx.get(), out.data(), out.size(), params) <= 0)
        {
            throw std::runtime_error("deriveSubkey: EVP_KDF_derive failed");
        }
        return out;
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
        requireFitsInt(plainText.size(), "aeadEncrypt: plainText too large");

        chunkvault::crypto::AeadBox box{};
        if (!randomBytes(std::span<std::uint8_t>{ box.nonce }))
        {
            throw chunkvault::crypto::RandomSourceError("aeadEncrypt: CSPRNG failure");
        }

        auto ctx{ openGcm(GcmDirection::Seal, key, box.nonce, associatedData) };

        box.cipherText.resize(plainText.size());
        int outLen{ 0 };
        if (!plainText.empty() &&
            EVP_CipherUpdate(ctx.get(), box.cipherText.data(), &outLen,
                             reinterpret_cast<const unsigned char*>(plainText.data()),
                             static_cast<int>(plainText.size())) != 1)
        {
            throw std::runtime_error("aeadEncrypt: encrypt update failed");
        }
        if (outLen < 0 || static_cast<std::size_t>(outLen) != box.cipherText.size())
        {
            throw std::runtime_error("aeadEncrypt: invalid output length");
        }
        if (!finishGcm(ctx.get()))
        {
            throw std::runtime_error("aeadEncrypt: encrypt final failed");
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(box.tag.size()), box.tag.data()) !=
            1)
        {
            throw std::runtime_error("aeadEncrypt: get tag failed");
        }
        return box;
    }

    [[nodiscard]] std::optional<chunkvault::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const chunkvault::crypto::AeadBox& box,
                std::span<const std::byte> associatedData) override
    {
        requireExactSize(key, chunkvault::crypto::g_aeadKeyBytes, "aeadDecrypt: key");
        requireFitsInt(box.cipherText.size(), "aeadDecrypt: cipherText too large");

        auto ctx{ openGcm(GcmDirection::Open, key, box.nonce, associatedData) };

        chunkvault::security::SecureBuffer plainText(box.cipherText.size());
        int outLen{ 0 };
        if (!box.cipherText.empty() &&
            (EVP_CipherUpdate(ctx.get(), plainText.data(), &outLen, box.cipherText.data(),
                              static_cast<int>(box.cipherText.size())) != 1 ||
             static_cast<std::size_t>(outLen) != plainText.size()))
        {
            chunkvault::security::secureRelease(plainText);
            return std::nullopt;
        }

        auto tagCopy{ box.tag };
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(tagCopy.size()), tagCopy.data()) !=
            1)
        {
            throw std::runtime_error("aeadDecrypt: set tag failed");
        }
        // Tag verification happens here; on mismatch nothing decrypted may escape.
        if (!finishGcm(ctx.get()))
        {
            chunkvault::security::secureRelease(plainText);
            return std::nullopt;
        }
        return plainText;
    }

private:
    EvpKdfPtr m_argon2idKdf{ nullptr, &EVP_KDF_free };
    EvpKdfPtr m_hkdf{ nullptr, &EVP_KDF_free };
};

} // namespace

[[nodiscard]] std::unique_ptr<chunkvault::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

} // namespace chunkvault::crypto::providers
