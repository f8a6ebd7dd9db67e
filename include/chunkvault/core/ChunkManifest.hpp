#ifndef INCLUDE_CHUNKVAULT_CORE_CHUNKMANIFEST_HPP
#define INCLUDE_CHUNKVAULT_CORE_CHUNKMANIFEST_HPP

#include "chunkvault/core/ChunkCodec.hpp"
#include "chunkvault/core/ChunkConstants.hpp"
#include "chunkvault/crypto/ICryptoProvider.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace chunkvault::core
{

struct ChunkManifestEntry final
{
    ChunkIv iv{};
    // Absent for legacy IV-list manifests; decoding then falls back to the fixed-size rule.
    std::optional<std::uint64_t> cipherTextBytes{};
};

// Everything besides the blob and the key needed to reassemble a file.
struct ChunkManifest final
{
    // Absent for legacy manifests, which do not record the suite.
    std::optional<chunkvault::crypto::CipherSuite> suite{};
    std::uint64_t chunkSize{ g_chunkSize };
    std::optional<std::uint64_t> plainTextBytes{};
    std::vector<ChunkManifestEntry> entries;

    [[nodiscard]] std::size_t chunkCount() const noexcept
    {
        return entries.size();
    }

    [[nodiscard]] bool hasExplicitLengths() const noexcept
    {
        if (entries.empty())
        {
            return false;
        }
        for (const auto& e : entries)
        {
            if (!e.cipherTextBytes)
            {
                return false;
            }
        }
        return true;
    }
};

} // namespace chunkvault::core

#endif // INCLUDE_CHUNKVAULT_CORE_CHUNKMANIFEST_HPP
