#ifndef INCLUDE_CHUNKVAULT_CORE_CHUNKCONSTANTS_HPP
#define INCLUDE_CHUNKVAULT_CORE_CHUNKCONSTANTS_HPP

#include "chunkvault/crypto/ICryptoProvider.hpp"
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace chunkvault::core
{

// Plaintext bytes per chunk. Fixed for every file; the decoder rejects manifests that disagree.
constexpr std::uint64_t g_chunkSize{ 1024U * 1024U };
constexpr std::size_t g_chunkTagBytes{ chunkvault::crypto::g_aeadTagBytes };
constexpr std::size_t g_chunkIvBytes{ chunkvault::crypto::g_aeadNonceBytes };
constexpr std::uint64_t g_fullChunkCipherBytes{ g_chunkSize + g_chunkTagBytes };

constexpr std::size_t g_masterKeyBytes{ 32U };
constexpr std::size_t g_chunkKeyBytes{ chunkvault::crypto::g_aeadKeyBytes };

// HKDF salt for chunk keys: constant and public; only the master key is secret.
constexpr std::size_t g_chunkKeySaltBytes{ 16U };
constexpr std::string_view g_chunkKeyInfoPrefix{ "chunk-" };

// Chunk indices are stored as u32 in binary manifests.
constexpr std::uint64_t g_maxChunkIndex{ 0xFFFFFFFFU };

// Empty input still produces one (empty) chunk so a manifest is never empty.
[[nodiscard]] constexpr std::uint64_t chunkCountFor(std::uint64_t plainTextBytes) noexcept
{
    if (plainTextBytes == 0U)
    {
        return 1U;
    }
    return (plainTextBytes / g_chunkSize) + ((plainTextBytes % g_chunkSize) != 0U ? 1U : 0U);
}

[[nodiscard]] constexpr std::uint64_t chunkPlainTextSize(std::uint64_t plainTextBytes, std::uint64_t index) noexcept
{
    const std::uint64_t begin{ index * g_chunkSize };
    if (begin >= plainTextBytes)
    {
        return 0U;
    }
    const std::uint64_t remaining{ plainTextBytes - begin };
    return remaining < g_chunkSize ? remaining : g_chunkSize;
}

} // namespace chunkvault::core

#endif // INCLUDE_CHUNKVAULT_CORE_CHUNKCONSTANTS_HPP
