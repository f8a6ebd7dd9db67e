#include "chunkvault/core/ChunkCodec.hpp"

#include "chunkvault/core/KeyManager.hpp"
#include "chunkvault/crypto/providers/NativeProviderFactory.hpp"
#include "test_utils/MockCryptoProvider.hpp"
#include <array>
#include <cstdint>
#include <gtest/gtest.h>
#include <memory>
#include <set>
#include <stdexcept>
#include <vector>

namespace
{

using chunkvault::core::ChunkError;
using chunkvault::core::ChunkFailure;
using chunkvault::core::ChunkKey;
using chunkvault::core::EncryptedChunk;
using chunkvault::security::SecureBuffer;

class ChunkCodecTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_crypto = chunkvault::crypto::providers::makeNativeCryptoProvider();
        m_codec = std::make_unique<chunkvault::core::ChunkCodec>(*m_crypto);
        m_key = deriveKey(0x5AU, 0U);
    }

    [[nodiscard]] ChunkKey deriveKey(std::uint8_t seed, std::uint64_t index) const
    {
        chunkvault::core::KeyManager keys{ *m_crypto };
        std::array<std::uint8_t, chunkvault::core::g_masterKeyBytes> raw{};
        raw.fill(seed);
        auto master = keys.importMasterKey(std::span<const std::uint8_t>{ raw });
        auto key = keys.deriveChunkKey(std::get<chunkvault::core::MasterKey>(master), index);
        return std::move(std::get<ChunkKey>(key));
    }

    [[nodiscard]] EncryptedChunk encrypt(const std::vector<std::uint8_t>& plain)
    {
        auto res = m_codec->encryptChunk(plain, m_key);
        EXPECT_TRUE(std::holds_alternative<EncryptedChunk>(res));
        return std::get<EncryptedChunk>(res);
    }

    std::unique_ptr<chunkvault::crypto::ICryptoProvider> m_crypto; // NOLINT
    std::unique_ptr<chunkvault::core::ChunkCodec> m_codec;         // NOLINT
    ChunkKey m_key;                                                // NOLINT
};

} // namespace

TEST_F(ChunkCodecTest, RoundTripAppendsTag)
{
    const std::vector<std::uint8_t> plain{ 'c', 'h', 'u', 'n', 'k' };
    const auto chunk = encrypt(plain);

    EXPECT_EQ(chunk.index, 0U);
    EXPECT_EQ(chunk.cipherText.size(), plain.size() + chunkvault::core::g_chunkTagBytes);

    auto res = m_codec->decryptChunk(chunk.cipherText, m_key, chunk.iv);
    ASSERT_TRUE(std::holds_alternative<SecureBuffer>(res));
    const auto& out = std::get<SecureBuffer>(res);
    EXPECT_EQ(std::vector<std::uint8_t>(out.begin(), out.end()), plain);
}

TEST_F(ChunkCodecTest, EmptyChunkIsTagOnly)
{
    const auto chunk = encrypt({});
    EXPECT_EQ(chunk.cipherText.size(), chunkvault::core::g_chunkTagBytes);

    auto res = m_codec->decryptChunk(chunk.cipherText, m_key, chunk.iv);
    ASSERT_TRUE(std::holds_alternative<SecureBuffer>(res));
    EXPECT_TRUE(std::get<SecureBuffer>(res).empty());
}

TEST_F(ChunkCodecTest, EveryFlippedBitFailsAuthentication)
{
    const std::vector<std::uint8_t> plain(24U, 0xC3U);
    const auto chunk = encrypt(plain);

    for (std::size_t byte{}; byte < chunk.cipherText.size(); ++byte)
    {
        for (unsigned bit{}; bit < 8U; ++bit)
        {
            auto tampered = chunk.cipherText;
            tampered[byte] ^= static_cast<std::uint8_t>(1U << bit);

            auto res = m_codec->decryptChunk(tampered, m_key, chunk.iv);
            ASSERT_TRUE(std::holds_alternative<ChunkFailure>(res)) << "byte " << byte << " bit " << bit;
            EXPECT_EQ(std::get<ChunkFailure>(res).error, ChunkError::AuthenticationFailed);
        }
    }
}

TEST_F(ChunkCodecTest, FlippedIvFailsAuthentication)
{
    const auto chunk = encrypt({ 1U, 2U, 3U });
    auto iv = chunk.iv;
    iv[0] ^= 0x01U;

    auto res = m_codec->decryptChunk(chunk.cipherText, m_key, iv);
    ASSERT_TRUE(std::holds_alternative<ChunkFailure>(res));
    EXPECT_EQ(std::get<ChunkFailure>(res).error, ChunkError::AuthenticationFailed);
}

TEST_F(ChunkCodecTest, KeyForAnotherIndexFailsAuthentication)
{
    const auto chunk = encrypt({ 9U, 9U, 9U });
    const auto otherKey = deriveKey(0x5AU, 1U);

    auto res = m_codec->decryptChunk(chunk.cipherText, otherKey, chunk.iv);
    ASSERT_TRUE(std::holds_alternative<ChunkFailure>(res));
    EXPECT_EQ(std::get<ChunkFailure>(res).error, ChunkError::AuthenticationFailed);
    EXPECT_EQ(std::get<ChunkFailure>(res).chunkIndex, 1U);
}

TEST_F(ChunkCodecTest, IvsAreUniqueAcrossCalls)
{
    constexpr int kCalls{ 1000 };
    std::set<chunkvault::core::ChunkIv> seen{};
    const std::vector<std::uint8_t> plain{ 0x00U };
    for (int i{}; i < kCalls; ++i)
    {
        seen.insert(encrypt(plain).iv);
    }
    EXPECT_EQ(seen.size(), static_cast<std::size_t>(kCalls));
}

TEST_F(ChunkCodecTest, RejectsCipherTextShorterThanTag)
{
    const std::vector<std::uint8_t> tooShort(chunkvault::core::g_chunkTagBytes - 1U, 0x00U);
    const chunkvault::core::ChunkIv iv{};

    auto res = m_codec->decryptChunk(tooShort, m_key, iv);
    ASSERT_TRUE(std::holds_alternative<ChunkFailure>(res));
    EXPECT_EQ(std::get<ChunkFailure>(res).error, ChunkError::MalformedInput);
}

TEST_F(ChunkCodecTest, RejectsWrongIvLength)
{
    const auto chunk = encrypt({ 4U });
    const std::array<std::uint8_t, 24> longIv{};

    auto res = m_codec->decryptChunk(chunk.cipherText, m_key, longIv);
    ASSERT_TRUE(std::holds_alternative<ChunkFailure>(res));
    EXPECT_EQ(std::get<ChunkFailure>(res).error, ChunkError::MalformedInput);
}

TEST(ChunkCodec, RandomSourceFailureIsReported)
{
    chunkvault::test_utils::NiceMockCryptoProvider crypto{};
    chunkvault::core::KeyManager keys{ crypto };
    std::array<std::uint8_t, chunkvault::core::g_masterKeyBytes> raw{};
    auto master = keys.importMasterKey(std::span<const std::uint8_t>{ raw });
    auto key = keys.deriveChunkKey(std::get<chunkvault::core::MasterKey>(master), 5U);
    ASSERT_TRUE(std::holds_alternative<ChunkKey>(key));

    EXPECT_CALL(crypto, aeadEncrypt(::testing::_, ::testing::_, ::testing::_))
        .WillOnce(::testing::Throw(chunkvault::crypto::RandomSourceError("no entropy")));

    chunkvault::core::ChunkCodec codec{ crypto };
    const std::vector<std::uint8_t> plain{ 1U };
    auto res = codec.encryptChunk(plain, std::get<ChunkKey>(key));
    ASSERT_TRUE(std::holds_alternative<ChunkFailure>(res));
    EXPECT_EQ(std::get<ChunkFailure>(res).error, ChunkError::RandomFailed);
    EXPECT_EQ(std::get<ChunkFailure>(res).chunkIndex, 5U);
}
