#ifndef INCLUDE_CHUNKVAULT_CORE_CHUNKCODEC_HPP
#define INCLUDE_CHUNKVAULT_CORE_CHUNKCODEC_HPP

#include "chunkvault/core/ChunkConstants.hpp"
#include "chunkvault/core/ChunkError.hpp"
#include "chunkvault/core/KeyManager.hpp"
#include "chunkvault/crypto/ICryptoProvider.hpp"
#include "chunkvault/security/SecureBuffer.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace chunkvault::core
{

using ChunkIv = std::array<std::uint8_t, g_chunkIvBytes>;

struct EncryptedChunk final
{
    std::uint64_t index{};
    ChunkIv iv{};
    // Ciphertext followed by the 16-byte tag.
    std::vector<std::uint8_t> cipherText;
};

// Stateless per call: every encryption draws a fresh IV from the provider.
class ChunkCodec final
{
public:
    explicit ChunkCodec(chunkvault::crypto::ICryptoProvider& crypto) noexcept;

    // Fails closed with RandomFailed when no IV can be drawn.
    [[nodiscard]] ChunkResult<EncryptedChunk> encryptChunk(std::span<const std::uint8_t> plainText,
                                                           const ChunkKey& key) noexcept;

    // MalformedInput when the ciphertext cannot hold a tag or the IV has the wrong size;
    // AuthenticationFailed on tag mismatch. No plaintext is returned unless verified.
    [[nodiscard]] ChunkResult<chunkvault::security::SecureBuffer>
    decryptChunk(std::span<const std::uint8_t> cipherText, const ChunkKey& key,
                 std::span<const std::uint8_t> iv) noexcept;

private:
    chunkvault::crypto::ICryptoProvider* m_crypto{ nullptr };
};

} // namespace chunkvault::core

#endif // INCLUDE_CHUNKVAULT_CORE_CHUNKCODEC_HPP
