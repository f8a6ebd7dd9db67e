#include "chunkvault/core/KeyCustody.hpp"

#include "chunkvault/core/ChunkConstants.hpp"
#include "chunkvault/crypto/providers/NativeProviderFactory.hpp"
#include "chunkvault/security/SecureEquals.hpp"
#include <gtest/gtest.h>
#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace
{

using chunkvault::core::ChunkError;
using chunkvault::core::ChunkFailure;
using chunkvault::core::KeyCustody;
using chunkvault::core::MasterKey;
using chunkvault::core::WrappedKey;

constexpr chunkvault::crypto::Argon2idParams g_kFastParams{ .iterations = 1U, .memoryKiB = 8U, .parallelism = 1U };

class KeyCustodyTest : public ::testing::Test
{
protected:
    KeyCustodyTest()
        : m_crypto{ chunkvault::crypto::providers::makeNativeCryptoProvider() }, m_custody{ *m_crypto }
    {
        chunkvault::core::KeyManager keys{ *m_crypto };
        auto generated = keys.generateMasterKey();
        EXPECT_TRUE(std::holds_alternative<MasterKey>(generated));
        m_master = std::move(std::get<MasterKey>(generated));
    }

    [[nodiscard]] WrappedKey wrapFor(std::string_view recipient, std::string_view passphrase)
    {
        const auto pass{ chunkvault::security::secureStringFrom(passphrase) };
        auto wrapped = m_custody.wrapForRecipient(m_master, recipient, pass, g_kFastParams);
        EXPECT_TRUE(std::holds_alternative<WrappedKey>(wrapped));
        return std::move(std::get<WrappedKey>(wrapped));
    }

    [[nodiscard]] bool sameAsMaster(const chunkvault::core::ChunkResult<MasterKey>& r) const
    {
        if (!std::holds_alternative<MasterKey>(r))
        {
            return false;
        }
        return chunkvault::security::secureEquals(std::get<MasterKey>(r).bytes(), m_master.bytes());
    }

    std::unique_ptr<chunkvault::crypto::ICryptoProvider> m_crypto;
    KeyCustody m_custody;
    MasterKey m_master;
};

} // namespace

TEST_F(KeyCustodyTest, RawExportRoundTrips)
{
    auto exported = m_custody.exportRawKey(m_master);
    ASSERT_TRUE(std::holds_alternative<chunkvault::security::SecureString>(exported));
    const auto& text = std::get<chunkvault::security::SecureString>(exported);
    EXPECT_EQ(text.size(), 44U);

    EXPECT_TRUE(sameAsMaster(m_custody.importRawKey(chunkvault::security::asStringView(text))));
}

TEST_F(KeyCustodyTest, ImportRejectsWrongLengthAndBadText)
{
    // 16 bytes of zeros.
    auto shortKey = m_custody.importRawKey("AAAAAAAAAAAAAAAAAAAAAA==");
    ASSERT_TRUE(std::holds_alternative<ChunkFailure>(shortKey));
    EXPECT_EQ(std::get<ChunkFailure>(shortKey).error, ChunkError::KeyDerivationFailed);

    auto garbage = m_custody.importRawKey("not base64 at all!");
    ASSERT_TRUE(std::holds_alternative<ChunkFailure>(garbage));
    EXPECT_EQ(std::get<ChunkFailure>(garbage).error, ChunkError::KeyDerivationFailed);
}

TEST_F(KeyCustodyTest, PassphraseWrapRoundTrips)
{
    const auto wrapped{ wrapFor("alice@example.org", "correct horse") };
    EXPECT_EQ(wrapped.kind(), chunkvault::core::KeyEncapsulationKind::PassphraseWrap);
    EXPECT_EQ(wrapped.recipientId, "alice@example.org");

    const auto& wrap = std::get<chunkvault::core::PassphraseWrap>(wrapped.encapsulation);
    EXPECT_EQ(wrap.suite, m_crypto->suite());
    EXPECT_EQ(wrap.kdf.argon2id.iterations, g_kFastParams.iterations);
    EXPECT_EQ(wrap.box.cipherText.size(), chunkvault::core::g_masterKeyBytes);

    const auto pass{ chunkvault::security::secureStringFrom("correct horse") };
    EXPECT_TRUE(sameAsMaster(m_custody.unwrapKey(wrapped, pass)));
}

TEST_F(KeyCustodyTest, TwoWrapsOfTheSameKeyDiffer)
{
    const auto a{ wrapFor("bob", "pw") };
    const auto b{ wrapFor("bob", "pw") };
    const auto& wa = std::get<chunkvault::core::PassphraseWrap>(a.encapsulation);
    const auto& wb = std::get<chunkvault::core::PassphraseWrap>(b.encapsulation);
    EXPECT_NE(wa.kdf.salt, wb.kdf.salt);
    EXPECT_NE(wa.box.cipherText, wb.box.cipherText);
}

TEST_F(KeyCustodyTest, WrongPassphraseIsAuthenticationFailure)
{
    const auto wrapped{ wrapFor("alice", "right") };
    const auto wrong{ chunkvault::security::secureStringFrom("wrong") };

    auto result = m_custody.unwrapKey(wrapped, wrong);
    ASSERT_TRUE(std::holds_alternative<ChunkFailure>(result));
    EXPECT_EQ(std::get<ChunkFailure>(result).error, ChunkError::AuthenticationFailed);
}

TEST_F(KeyCustodyTest, RecipientIdIsBoundToTheWrap)
{
    auto wrapped{ wrapFor("alice", "pw") };
    wrapped.recipientId = "mallory";

    auto result = m_custody.unwrapKey(wrapped, chunkvault::security::secureStringFrom("pw"));
    ASSERT_TRUE(std::holds_alternative<ChunkFailure>(result));
    EXPECT_EQ(std::get<ChunkFailure>(result).error, ChunkError::AuthenticationFailed);
}

TEST_F(KeyCustodyTest, KdfMetadataIsBoundToTheWrap)
{
    auto wrapped{ wrapFor("alice", "pw") };
    std::get<chunkvault::core::PassphraseWrap>(wrapped.encapsulation).kdf.salt[0] ^= 0x01U;

    auto result = m_custody.unwrapKey(wrapped, chunkvault::security::secureStringFrom("pw"));
    ASSERT_TRUE(std::holds_alternative<ChunkFailure>(result));
    EXPECT_EQ(std::get<ChunkFailure>(result).error, ChunkError::AuthenticationFailed);
}

TEST_F(KeyCustodyTest, SuiteMismatchIsUnsupported)
{
    auto wrapped{ wrapFor("alice", "pw") };
    auto& wrap = std::get<chunkvault::core::PassphraseWrap>(wrapped.encapsulation);
    wrap.suite = (wrap.suite == chunkvault::crypto::CipherSuite::Aes256GcmHkdfSha256)
                     ? chunkvault::crypto::CipherSuite::ChaCha20Poly1305Blake2b
                     : chunkvault::crypto::CipherSuite::Aes256GcmHkdfSha256;

    auto result = m_custody.unwrapKey(wrapped, chunkvault::security::secureStringFrom("pw"));
    ASSERT_TRUE(std::holds_alternative<ChunkFailure>(result));
    EXPECT_EQ(std::get<ChunkFailure>(result).error, ChunkError::UnsupportedSuite);
}

TEST_F(KeyCustodyTest, RawWrapIgnoresPassphrase)
{
    auto wrapped = m_custody.wrapRawExport(m_master, "backend");
    ASSERT_TRUE(std::holds_alternative<WrappedKey>(wrapped));
    EXPECT_EQ(std::get<WrappedKey>(wrapped).kind(), chunkvault::core::KeyEncapsulationKind::RawKeyExport);

    const chunkvault::security::SecureString noPassphrase{};
    EXPECT_TRUE(sameAsMaster(m_custody.unwrapKey(std::get<WrappedKey>(wrapped), noPassphrase)));
}

TEST_F(KeyCustodyTest, OversizedRecipientIsRejected)
{
    const std::string recipient(chunkvault::core::g_maxRecipientIdBytes + 1U, 'r');
    auto wrapped = m_custody.wrapRawExport(m_master, recipient);
    ASSERT_TRUE(std::holds_alternative<ChunkFailure>(wrapped));
    EXPECT_EQ(std::get<ChunkFailure>(wrapped).error, ChunkError::MalformedInput);
}

TEST_F(KeyCustodyTest, EncodedWrapSurvivesTheFileFormat)
{
    const auto wrapped{ wrapFor("carol", "pw") };
    auto encoded = chunkvault::core::encodeWrappedKey(wrapped);
    ASSERT_TRUE(std::holds_alternative<std::vector<std::uint8_t>>(encoded));
    const auto& bytes = std::get<std::vector<std::uint8_t>>(encoded);
    EXPECT_TRUE(chunkvault::core::isWrappedKey(bytes));

    auto decoded = chunkvault::core::decodeWrappedKey(bytes);
    ASSERT_TRUE(std::holds_alternative<WrappedKey>(decoded));
    const auto& back = std::get<WrappedKey>(decoded);
    EXPECT_EQ(back.recipientId, "carol");
    EXPECT_TRUE(sameAsMaster(m_custody.unwrapKey(back, chunkvault::security::secureStringFrom("pw"))));
}

TEST_F(KeyCustodyTest, EncodedRawExportSurvivesTheFileFormat)
{
    auto wrapped = m_custody.wrapRawExport(m_master, "");
    ASSERT_TRUE(std::holds_alternative<WrappedKey>(wrapped));
    auto encoded = chunkvault::core::encodeWrappedKey(std::get<WrappedKey>(wrapped));
    ASSERT_TRUE(std::holds_alternative<std::vector<std::uint8_t>>(encoded));

    auto decoded = chunkvault::core::decodeWrappedKey(std::get<std::vector<std::uint8_t>>(encoded));
    ASSERT_TRUE(std::holds_alternative<WrappedKey>(decoded));
    EXPECT_TRUE(std::get<WrappedKey>(decoded).recipientId.empty());
    EXPECT_TRUE(sameAsMaster(m_custody.unwrapKey(std::get<WrappedKey>(decoded), {})));
}

TEST_F(KeyCustodyTest, DecodeRejectsTruncationAndTrailingBytes)
{
    const auto wrapped{ wrapFor("dave", "pw") };
    auto encoded = chunkvault::core::encodeWrappedKey(wrapped);
    ASSERT_TRUE(std::holds_alternative<std::vector<std::uint8_t>>(encoded));
    const auto& bytes = std::get<std::vector<std::uint8_t>>(encoded);

    for (const std::size_t cut : { std::size_t{ 4 }, std::size_t{ 12 }, bytes.size() / 2U, bytes.size() - 1U })
    {
        const std::vector<std::uint8_t> truncated(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(cut));
        auto decoded = chunkvault::core::decodeWrappedKey(truncated);
        ASSERT_TRUE(std::holds_alternative<ChunkFailure>(decoded)) << "cut at " << cut;
        EXPECT_EQ(std::get<ChunkFailure>(decoded).error, ChunkError::MalformedInput);
    }

    auto extended{ bytes };
    extended.push_back(0x00U);
    auto decoded = chunkvault::core::decodeWrappedKey(extended);
    ASSERT_TRUE(std::holds_alternative<ChunkFailure>(decoded));
    EXPECT_EQ(std::get<ChunkFailure>(decoded).error, ChunkError::MalformedInput);
}

TEST_F(KeyCustodyTest, PlainBase64KeyFileIsNotAWrappedKey)
{
    const std::string text{ "AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA=\n" };
    const std::vector<std::uint8_t> bytes(text.begin(), text.end());
    EXPECT_FALSE(chunkvault::core::isWrappedKey(bytes));
}
