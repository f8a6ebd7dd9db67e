#include "chunkvault/core/ManifestCodec.hpp"
#include "chunkvault/core/Base64.hpp"

#include "ByteCursor.hpp"
#include <algorithm>
#include <exception>

namespace chunkvault::core
{
namespace
{

using chunkvault::core::detail::ByteReader;
using chunkvault::core::detail::ByteWriter;

[[nodiscard]] std::string_view trim(std::string_view s) noexcept
{
    constexpr std::string_view kWhitespace{ " \t\r\n" };
    const auto first{ s.find_first_not_of(kWhitespace) };
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last{ s.find_last_not_of(kWhitespace) };
    return s.substr(first, last - first + 1U);
}

[[nodiscard]] bool decodeIvInto(std::string_view text, ChunkIv& out)
{
    const auto decoded{ decodeBase64(text) };
    if (!decoded || decoded->size() != out.size())
    {
        return false;
    }
    std::copy(decoded->begin(), decoded->end(), out.begin());
    return true;
}

} // namespace

[[nodiscard]] std::vector<std::string> encodeIvList(const ChunkManifest& manifest)
{
    std::vector<std::string> out{};
    out.reserve(manifest.entries.size());
    for (const auto& entry : manifest.entries)
    {
        out.push_back(encodeBase64(entry.iv));
    }
    return out;
}

[[nodiscard]] ChunkResult<ChunkManifest> decodeIvList(std::span<const std::string> ivs) noexcept
{
    try
    {
        ChunkManifest manifest{};
        manifest.entries.reserve(ivs.size());
        for (std::size_t i{}; i < ivs.size(); ++i)
        {
            ChunkManifestEntry entry{};
            if (!decodeIvInto(trim(ivs[i]), entry.iv))
            {
                return failAt(ChunkError::MalformedManifest, i);
            }
            manifest.entries.push_back(entry);
        }
        return manifest;
    }
    catch (const std::exception&)
    {
        return fail(ChunkError::MalformedManifest);
    }
}

[[nodiscard]] std::string encodeLegacyManifest(const ChunkManifest& manifest)
{
    std::string out{};
    for (const auto& iv : encodeIvList(manifest))
    {
        out += iv;
        out += '\n';
    }
    return out;
}

[[nodiscard]] ChunkResult<ChunkManifest> decodeLegacyManifest(std::string_view text) noexcept
{
    try
    {
        std::vector<std::string> lines{};
        std::size_t pos{};
        while (pos <= text.size())
        {
            const auto eol{ text.find('\n', pos) };
            const auto line{ trim(text.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos)) };
            if (!line.empty())
            {
                lines.emplace_back(line);
            }
            if (eol == std::string_view::npos)
            {
                break;
            }
            pos = eol + 1U;
        }
        return decodeIvList(lines);
    }
    catch (const std::exception&)
    {
        return fail(ChunkError::MalformedManifest);
    }
}

[[nodiscard]] ChunkResult<std::vector<std::uint8_t>> encodeManifestV2(const ChunkManifest& manifest) noexcept
{
    if (!manifest.suite || !manifest.plainTextBytes || !manifest.hasExplicitLengths() ||
        manifest.chunkSize != g_chunkSize || manifest.entries.size() > g_maxChunkIndex)
    {
        return fail(ChunkError::MalformedManifest);
    }

    try
    {
        std::vector<std::uint8_t> out{};
        out.reserve(g_manifestV2HeaderBytes + (manifest.entries.size() * g_manifestV2EntryBytes));

        ByteWriter w{ out };
        w.raw(std::span<const std::uint8_t>{ reinterpret_cast<const std::uint8_t*>(g_manifestV2Magic.data()),
                                             g_manifestMagicBytes });
        w.u32(g_manifestVersionV2);
        w.u32(static_cast<std::uint32_t>(*manifest.suite));
        w.u64(manifest.chunkSize);
        w.u64(*manifest.plainTextBytes);
        w.u32(static_cast<std::uint32_t>(manifest.entries.size()));
        for (const auto& entry : manifest.entries)
        {
            w.raw(entry.iv);
            w.u64(*entry.cipherTextBytes);
        }
        return out;
    }
    catch (const std::exception&)
    {
        return fail(ChunkError::MalformedManifest);
    }
}

[[nodiscard]] bool isManifestV2(std::span<const std::uint8_t> bytes) noexcept
{
    if (bytes.size() < g_manifestMagicBytes)
    {
        return false;
    }
    for (std::size_t i{}; i < g_manifestMagicBytes; ++i)
    {
        if (bytes[i] != static_cast<std::uint8_t>(g_manifestV2Magic[i]))
        {
            return false;
        }
    }
    return true;
}

[[nodiscard]] ChunkResult<ChunkManifest> decodeManifestV2(std::span<const std::uint8_t> bytes) noexcept
{
    if (bytes.size() < g_manifestV2HeaderBytes || !isManifestV2(bytes))
    {
        return fail(ChunkError::MalformedManifest);
    }

    try
    {
        ByteReader r{ bytes };
        static_cast<void>(r.raw(g_manifestMagicBytes));

        if (r.u32() != g_manifestVersionV2)
        {
            return fail(ChunkError::MalformedManifest);
        }
        const std::uint32_t rawSuite{ r.u32() };
        if (!chunkvault::crypto::isKnownCipherSuite(rawSuite))
        {
            return fail(ChunkError::UnsupportedSuite);
        }

        ChunkManifest manifest{};
        manifest.suite = static_cast<chunkvault::crypto::CipherSuite>(rawSuite);
        manifest.chunkSize = r.u64();
        const std::uint64_t plainTextBytes{ r.u64() };
        manifest.plainTextBytes = plainTextBytes;
        const std::uint32_t count{ r.u32() };

        if (count == 0U || manifest.chunkSize != g_chunkSize || count != chunkCountFor(plainTextBytes))
        {
            return fail(ChunkError::MalformedManifest);
        }
        if (r.remaining() != static_cast<std::size_t>(count) * g_manifestV2EntryBytes)
        {
            return fail(ChunkError::MalformedManifest);
        }

        manifest.entries.reserve(count);
        for (std::uint32_t i{}; i < count; ++i)
        {
            ChunkManifestEntry entry{};
            const auto iv{ r.raw(g_chunkIvBytes) };
            std::copy(iv.begin(), iv.end(), entry.iv.begin());
            const std::uint64_t length{ r.u64() };
            if (length != chunkPlainTextSize(plainTextBytes, i) + g_chunkTagBytes)
            {
                return failAt(ChunkError::MalformedManifest, i);
            }
            entry.cipherTextBytes = length;
            manifest.entries.push_back(entry);
        }
        return manifest;
    }
    catch (const std::exception&)
    {
        return fail(ChunkError::MalformedManifest);
    }
}

[[nodiscard]] ChunkResult<ChunkManifest> decodeManifest(std::span<const std::uint8_t> bytes) noexcept
{
    if (isManifestV2(bytes))
    {
        return decodeManifestV2(bytes);
    }
    const std::string_view text{ reinterpret_cast<const char*>(bytes.data()), bytes.size() };
    return decodeLegacyManifest(text);
}

} // namespace chunkvault::core
