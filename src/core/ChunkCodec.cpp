#include "chunkvault/core/ChunkCodec.hpp"
#include <algorithm>
#include <exception>
#include <stdexcept>

namespace chunkvault::core
{

ChunkCodec::ChunkCodec(chunkvault::crypto::ICryptoProvider& crypto) noexcept : m_crypto(&crypto)
{
}

[[nodiscard]] ChunkResult<EncryptedChunk> ChunkCodec::encryptChunk(std::span<const std::uint8_t> plainText,
                                                                   const ChunkKey& key) noexcept
{
    try
    {
        // Chunks carry no associated data so blobs stay compatible with the web client.
        auto box{ m_crypto->aeadEncrypt(key.bytes(), std::as_bytes(plainText), std::span<const std::byte>{}) };

        EncryptedChunk out{};
        out.index = key.index();
        std::copy(box.nonce.begin(), box.nonce.end(), out.iv.begin());
        out.cipherText = std::move(box.cipherText);
        out.cipherText.insert(out.cipherText.end(), box.tag.begin(), box.tag.end());
        return out;
    }
    catch (const chunkvault::crypto::RandomSourceError&)
    {
        return failAt(ChunkError::RandomFailed, key.index());
    }
    catch (const std::invalid_argument&)
    {
        return failAt(ChunkError::MalformedInput, key.index());
    }
    catch (const std::exception&)
    {
        return failAt(ChunkError::CryptoError, key.index());
    }
}

[[nodiscard]] ChunkResult<chunkvault::security::SecureBuffer>
ChunkCodec::decryptChunk(std::span<const std::uint8_t> cipherText, const ChunkKey& key,
                         std::span<const std::uint8_t> iv) noexcept
{
    if (cipherText.size() < g_chunkTagBytes || iv.size() != g_chunkIvBytes)
    {
        return failAt(ChunkError::MalformedInput, key.index());
    }

    try
    {
        chunkvault::crypto::AeadBox box{};
        std::copy(iv.begin(), iv.end(), box.nonce.begin());
        const auto bodyBytes{ cipherText.size() - g_chunkTagBytes };
        box.cipherText.assign(cipherText.begin(), cipherText.begin() + static_cast<std::ptrdiff_t>(bodyBytes));
        std::copy(cipherText.begin() + static_cast<std::ptrdiff_t>(bodyBytes), cipherText.end(), box.tag.begin());

        auto plainOpt{ m_crypto->aeadDecrypt(key.bytes(), box, std::span<const std::byte>{}) };
        if (!plainOpt)
        {
            return failAt(ChunkError::AuthenticationFailed, key.index());
        }
        return std::move(*plainOpt);
    }
    catch (const std::invalid_argument&)
    {
        return failAt(ChunkError::MalformedInput, key.index());
    }
    catch (const std::exception&)
    {
        return failAt(ChunkError::CryptoError, key.index());
    }
}

} // namespace chunkvault::core
