#ifndef INCLUDE_CHUNKVAULT_CORE_MANIFESTCODEC_HPP
#define INCLUDE_CHUNKVAULT_CORE_MANIFESTCODEC_HPP

#include "chunkvault/core/ChunkError.hpp"
#include "chunkvault/core/ChunkManifest.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chunkvault::core
{

constexpr std::size_t g_manifestMagicBytes{ 8U };
constexpr std::array<char, g_manifestMagicBytes> g_manifestV2Magic{ 'C', 'H', 'K', 'V', 'M', 'A', 'N', '2' };
constexpr std::uint32_t g_manifestVersionV2{ 2U };

// magic | version | suite | chunkSize | plainTextBytes | entryCount
constexpr std::size_t g_manifestV2HeaderBytes{ g_manifestMagicBytes + 4U + 4U + 8U + 8U + 4U };
// iv | cipherTextBytes
constexpr std::size_t g_manifestV2EntryBytes{ g_chunkIvBytes + 8U };

// Base64 IVs in index order, as exchanged with the web client.
[[nodiscard]] std::vector<std::string> encodeIvList(const ChunkManifest& manifest);
[[nodiscard]] ChunkResult<ChunkManifest> decodeIvList(std::span<const std::string> ivs) noexcept;

// Text form of the IV list: one base64 IV per line. Blank lines and a trailing newline are ignored.
[[nodiscard]] std::string encodeLegacyManifest(const ChunkManifest& manifest);
[[nodiscard]] ChunkResult<ChunkManifest> decodeLegacyManifest(std::string_view text) noexcept;

// Requires suite, plaintext size and every per-chunk length; fails with MalformedManifest otherwise.
[[nodiscard]] ChunkResult<std::vector<std::uint8_t>> encodeManifestV2(const ChunkManifest& manifest) noexcept;
[[nodiscard]] ChunkResult<ChunkManifest> decodeManifestV2(std::span<const std::uint8_t> bytes) noexcept;

// Picks the binary decoder when the v2 magic is present, the text decoder otherwise.
[[nodiscard]] ChunkResult<ChunkManifest> decodeManifest(std::span<const std::uint8_t> bytes) noexcept;

[[nodiscard]] bool isManifestV2(std::span<const std::uint8_t> bytes) noexcept;

} // namespace chunkvault::core

#endif // INCLUDE_CHUNKVAULT_CORE_MANIFESTCODEC_HPP
