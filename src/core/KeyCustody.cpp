#include "chunkvault/core/KeyCustody.hpp"
#include "chunkvault/core/Base64.hpp"
#include "chunkvault/core/ChunkConstants.hpp"
#include "chunkvault/core/KdfPolicy.hpp"
#include "chunkvault/security/ScopeWipe.hpp"

#include "ByteCursor.hpp"
#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

namespace chunkvault::core
{
namespace
{

using chunkvault::core::detail::ByteReader;
using chunkvault::core::detail::ByteWriter;

constexpr std::array<char, 8> g_kWrapAadPrefix{ 'C', 'H', 'K', 'V', 'W', 'R', 'P', '1' };

[[nodiscard]] std::span<const std::uint8_t> asU8(std::span<const char> s) noexcept
{
    return std::span<const std::uint8_t>{ reinterpret_cast<const std::uint8_t*>(s.data()), s.size() };
}

void writeKdfMetadata(ByteWriter& w, const chunkvault::crypto::KdfMetadata& meta)
{
    w.u32(meta.policyVersion);
    w.u32(static_cast<std::uint32_t>(meta.algorithm));
    w.u32(meta.argon2Version);
    w.u32(meta.derivedKeyBytes);
    w.u32(meta.argon2id.iterations);
    w.u32(meta.argon2id.memoryKiB);
    w.u32(meta.argon2id.parallelism);
    w.raw(meta.salt);
}

[[nodiscard]] chunkvault::crypto::KdfMetadata readKdfMetadata(ByteReader& r) noexcept
{
    chunkvault::crypto::KdfMetadata meta{};
    meta.policyVersion = r.u32();
    meta.algorithm = static_cast<chunkvault::crypto::KdfAlgorithm>(r.u32());
    meta.argon2Version = r.u32();
    meta.derivedKeyBytes = r.u32();
    meta.argon2id.iterations = r.u32();
    meta.argon2id.memoryKiB = r.u32();
    meta.argon2id.parallelism = r.u32();
    const auto salt{ r.raw(meta.salt.size()) };
    std::copy(salt.begin(), salt.end(), meta.salt.begin());
    return meta;
}

void writeString(ByteWriter& w, std::string_view s)
{
    w.u32(static_cast<std::uint32_t>(s.size()));
    w.raw(asU8(std::span<const char>{ s.data(), s.size() }));
}

[[nodiscard]] std::vector<std::uint8_t> encodeWrapAad(std::string_view recipientId,
                                                      chunkvault::crypto::CipherSuite suite,
                                                      const chunkvault::crypto::KdfMetadata& meta)
{
    std::vector<std::uint8_t> aad{};
    ByteWriter w{ aad };
    w.raw(asU8(g_kWrapAadPrefix));
    w.u32(static_cast<std::uint32_t>(suite));
    writeString(w, recipientId);
    writeKdfMetadata(w, meta);
    return aad;
}

[[nodiscard]] ChunkResult<chunkvault::security::SecureBuffer>
deriveKekOrError(const chunkvault::crypto::ICryptoProvider& crypto, const chunkvault::security::SecureString& passphrase,
                 const chunkvault::crypto::KdfMetadata& meta) noexcept
{
    try
    {
        return crypto.deriveKeyEncryptionKey(chunkvault::security::asBytes(passphrase), meta);
    }
    catch (const std::invalid_argument&)
    {
        return fail(ChunkError::KeyDerivationFailed);
    }
    catch (const std::exception&)
    {
        return fail(ChunkError::CryptoError);
    }
}

} // namespace

KeyCustody::KeyCustody(chunkvault::crypto::ICryptoProvider& crypto) noexcept : m_crypto(&crypto)
{
}

[[nodiscard]] ChunkResult<chunkvault::security::SecureString>
KeyCustody::exportRawKey(const MasterKey& master) const noexcept
{
    if (master.bytes().size() != g_masterKeyBytes)
    {
        return fail(ChunkError::KeyDerivationFailed);
    }
    try
    {
        return encodeBase64Secure(master.bytes());
    }
    catch (const std::exception&)
    {
        return fail(ChunkError::CryptoError);
    }
}

[[nodiscard]] ChunkResult<MasterKey> KeyCustody::importRawKey(std::string_view base64) const noexcept
{
    try
    {
        auto raw{ decodeBase64Secure(base64) };
        if (!raw)
        {
            return fail(ChunkError::KeyDerivationFailed);
        }
        auto wipeRaw{ chunkvault::security::scopeWipe(*raw) };
        return KeyManager{ *m_crypto }.importMasterKey(chunkvault::security::asSpan(std::as_const(*raw)));
    }
    catch (const std::exception&)
    {
        return fail(ChunkError::CryptoError);
    }
}

[[nodiscard]] ChunkResult<WrappedKey> KeyCustody::wrapRawExport(const MasterKey& master,
                                                                std::string_view recipientId) const noexcept
{
    if (recipientId.size() > g_maxRecipientIdBytes)
    {
        return fail(ChunkError::MalformedInput);
    }
    auto exported{ exportRawKey(master) };
    if (auto* failure = std::get_if<ChunkFailure>(&exported))
    {
        return *failure;
    }
    try
    {
        return WrappedKey{
            .recipientId = std::string{ recipientId },
            .encapsulation = RawKeyExport{ .base64 = std::move(std::get<chunkvault::security::SecureString>(exported)) },
        };
    }
    catch (const std::exception&)
    {
        return fail(ChunkError::CryptoError);
    }
}

[[nodiscard]] ChunkResult<WrappedKey> KeyCustody::wrapForRecipient(const MasterKey& master,
                                                                   std::string_view recipientId,
                                                                   const chunkvault::security::SecureString& passphrase,
                                                                   const chunkvault::crypto::Argon2idParams& params) noexcept
{
    if (recipientId.size() > g_maxRecipientIdBytes || master.bytes().size() != g_masterKeyBytes)
    {
        return fail(ChunkError::MalformedInput);
    }

    if (!chunkvault::crypto::isSupportedArgon2idParams(params))
    {
        return fail(ChunkError::KeyDerivationFailed);
    }

    const auto metaOpt{ makeKdfMetadata(params) };
    if (!metaOpt)
    {
        return fail(ChunkError::RandomFailed);
    }

    auto kekResult{ deriveKekOrError(*m_crypto, passphrase, *metaOpt) };
    if (auto* failure = std::get_if<ChunkFailure>(&kekResult))
    {
        return *failure;
    }
    auto& kek{ std::get<chunkvault::security::SecureBuffer>(kekResult) };
    auto wipeKek{ chunkvault::security::scopeWipe(kek) };

    try
    {
        const auto suite{ m_crypto->suite() };
        const auto aad{ encodeWrapAad(recipientId, suite, *metaOpt) };
        auto box{ m_crypto->aeadEncrypt(chunkvault::security::asSpan(std::as_const(kek)),
                                        std::as_bytes(master.bytes()), std::as_bytes(std::span{ aad })) };
        return WrappedKey{
            .recipientId = std::string{ recipientId },
            .encapsulation = PassphraseWrap{ .suite = suite, .kdf = *metaOpt, .box = std::move(box) },
        };
    }
    catch (const chunkvault::crypto::RandomSourceError&)
    {
        return fail(ChunkError::RandomFailed);
    }
    catch (const std::exception&)
    {
        return fail(ChunkError::CryptoError);
    }
}

[[nodiscard]] ChunkResult<MasterKey> KeyCustody::unwrapKey(const WrappedKey& wrapped,
                                                           const chunkvault::security::SecureString& passphrase) noexcept
{
    if (const auto* raw = std::get_if<RawKeyExport>(&wrapped.encapsulation))
    {
        return importRawKey(chunkvault::security::asStringView(raw->base64));
    }

    const auto& wrap{ std::get<PassphraseWrap>(wrapped.encapsulation) };
    if (wrap.suite != m_crypto->suite())
    {
        return fail(ChunkError::UnsupportedSuite);
    }

    auto kekResult{ deriveKekOrError(*m_crypto, passphrase, wrap.kdf) };
    if (auto* failure = std::get_if<ChunkFailure>(&kekResult))
    {
        return *failure;
    }
    auto& kek{ std::get<chunkvault::security::SecureBuffer>(kekResult) };
    auto wipeKek{ chunkvault::security::scopeWipe(kek) };

    try
    {
        const auto aad{ encodeWrapAad(wrapped.recipientId, wrap.suite, wrap.kdf) };
        auto plainOpt{ m_crypto->aeadDecrypt(chunkvault::security::asSpan(std::as_const(kek)), wrap.box,
                                             std::as_bytes(std::span{ aad })) };
        if (!plainOpt)
        {
            return fail(ChunkError::AuthenticationFailed);
        }
        auto wipePlain{ chunkvault::security::scopeWipe(*plainOpt) };
        return KeyManager{ *m_crypto }.importMasterKey(chunkvault::security::asSpan(std::as_const(*plainOpt)));
    }
    catch (const std::invalid_argument&)
    {
        return fail(ChunkError::MalformedInput);
    }
    catch (const std::exception&)
    {
        return fail(ChunkError::CryptoError);
    }
}

[[nodiscard]] bool isWrappedKey(std::span<const std::uint8_t> bytes) noexcept
{
    if (bytes.size() < g_wrappedKeyMagicBytes)
    {
        return false;
    }
    return std::equal(g_wrappedKeyMagic.begin(), g_wrappedKeyMagic.end(), bytes.begin(),
                      [](char a, std::uint8_t b) { return static_cast<std::uint8_t>(a) == b; });
}

[[nodiscard]] ChunkResult<std::vector<std::uint8_t>> encodeWrappedKey(const WrappedKey& wrapped) noexcept
{
    if (wrapped.recipientId.size() > g_maxRecipientIdBytes)
    {
        return fail(ChunkError::MalformedInput);
    }

    try
    {
        std::vector<std::uint8_t> out{};
        ByteWriter w{ out };
        w.raw(asU8(g_wrappedKeyMagic));
        w.u32(static_cast<std::uint32_t>(wrapped.kind()));
        writeString(w, wrapped.recipientId);

        if (const auto* raw = std::get_if<RawKeyExport>(&wrapped.encapsulation))
        {
            writeString(w, chunkvault::security::asStringView(raw->base64));
            return out;
        }

        const auto& wrap{ std::get<PassphraseWrap>(wrapped.encapsulation) };
        w.u32(static_cast<std::uint32_t>(wrap.suite));
        writeKdfMetadata(w, wrap.kdf);
        w.raw(wrap.box.nonce);
        w.raw(wrap.box.tag);
        w.u32(static_cast<std::uint32_t>(wrap.box.cipherText.size()));
        w.raw(wrap.box.cipherText);
        return out;
    }
    catch (const std::exception&)
    {
        return fail(ChunkError::CryptoError);
    }
}

[[nodiscard]] ChunkResult<WrappedKey> decodeWrappedKey(std::span<const std::uint8_t> bytes) noexcept
{
    if (!isWrappedKey(bytes))
    {
        return fail(ChunkError::MalformedInput);
    }

    try
    {
        ByteReader r{ bytes };
        static_cast<void>(r.raw(g_wrappedKeyMagicBytes));

        const std::uint32_t kind{ r.u32() };
        const std::uint32_t recipientBytes{ r.u32() };
        if (recipientBytes > g_maxRecipientIdBytes)
        {
            return fail(ChunkError::MalformedInput);
        }
        const auto recipient{ r.raw(recipientBytes) };

        WrappedKey out{};
        out.recipientId.assign(recipient.begin(), recipient.end());

        if (kind == static_cast<std::uint32_t>(KeyEncapsulationKind::RawKeyExport))
        {
            const std::uint32_t textBytes{ r.u32() };
            const auto text{ r.raw(textBytes) };
            if (r.failed() || r.remaining() != 0U)
            {
                return fail(ChunkError::MalformedInput);
            }
            RawKeyExport raw{};
            raw.base64.assign(text.begin(), text.end());
            out.encapsulation = std::move(raw);
            return out;
        }

        if (kind != static_cast<std::uint32_t>(KeyEncapsulationKind::PassphraseWrap))
        {
            return fail(ChunkError::MalformedInput);
        }

        const std::uint32_t rawSuite{ r.u32() };
        PassphraseWrap wrap{};
        wrap.kdf = readKdfMetadata(r);
        const auto nonce{ r.raw(wrap.box.nonce.size()) };
        std::copy(nonce.begin(), nonce.end(), wrap.box.nonce.begin());
        const auto tag{ r.raw(wrap.box.tag.size()) };
        std::copy(tag.begin(), tag.end(), wrap.box.tag.begin());
        const std::uint32_t cipherBytes{ r.u32() };
        if (cipherBytes != g_masterKeyBytes)
        {
            return fail(ChunkError::MalformedInput);
        }
        const auto cipherText{ r.raw(cipherBytes) };
        if (r.failed() || r.remaining() != 0U)
        {
            return fail(ChunkError::MalformedInput);
        }
        if (!chunkvault::crypto::isKnownCipherSuite(rawSuite))
        {
            return fail(ChunkError::UnsupportedSuite);
        }
        wrap.suite = static_cast<chunkvault::crypto::CipherSuite>(rawSuite);
        wrap.box.cipherText.assign(cipherText.begin(), cipherText.end());
        out.encapsulation = std::move(wrap);
        return out;
    }
    catch (const std::exception&)
    {
        return fail(ChunkError::MalformedInput);
    }
}

} // namespace chunkvault::core
