#include "chunkvault/core/StreamAssembler.hpp"
#include "chunkvault/core/Base64.hpp"
#include "chunkvault/core/ChunkConstants.hpp"
#include "chunkvault/security/ScopeWipe.hpp"
#include <algorithm>
#include <exception>
#include <string_view>
#include <utility>

namespace chunkvault::core
{
namespace
{

[[nodiscard]] double percentOf(std::uint64_t completed, std::uint64_t total) noexcept
{
    if (total == 0U)
    {
        return 100.0;
    }
    return (static_cast<double>(completed) * 100.0) / static_cast<double>(total);
}

[[nodiscard]] bool isCancelled(const PipelineOptions& options) noexcept
{
    return options.cancellation != nullptr && options.cancellation->isCancelled();
}

template <class Job, class Observer> [[nodiscard]] std::optional<ChunkFailure> drive(Job& job, const Observer& progress)
{
    while (!job.done())
    {
        auto step{ job.next() };
        if (auto* failure = std::get_if<ChunkFailure>(&step))
        {
            return *failure;
        }
        if (progress)
        {
            progress(std::get<ProgressEvent>(step));
        }
    }
    return std::nullopt;
}

} // namespace

[[nodiscard]] ChunkResult<std::vector<ChunkSpan>> planChunkLayout(const ChunkManifest& manifest,
                                                                  std::uint64_t blobSize) noexcept
{
    const std::size_t count{ manifest.entries.size() };
    if (manifest.chunkSize != g_chunkSize)
    {
        return fail(ChunkError::MalformedManifest);
    }
    if (count == 0U)
    {
        if (blobSize != 0U)
        {
            return fail(ChunkError::MalformedManifest);
        }
        return std::vector<ChunkSpan>{};
    }
    if (count - 1U > g_maxChunkIndex)
    {
        return fail(ChunkError::MalformedManifest);
    }

    try
    {
        const bool explicitLengths{ manifest.hasExplicitLengths() };
        // Lengths are all or nothing; a partial set cannot be reconciled with the fixed-size rule.
        if (!explicitLengths && std::any_of(manifest.entries.begin(), manifest.entries.end(),
                                            [](const ChunkManifestEntry& e) { return e.cipherTextBytes.has_value(); }))
        {
            return fail(ChunkError::MalformedManifest);
        }

        std::vector<ChunkSpan> layout{};
        layout.reserve(count);

        std::uint64_t offset{};
        for (std::size_t i{}; i < count; ++i)
        {
            std::uint64_t length{};
            if (explicitLengths)
            {
                length = *manifest.entries[i].cipherTextBytes;
            }
            else if (i + 1U < count)
            {
                length = g_fullChunkCipherBytes;
            }
            else
            {
                length = blobSize > offset ? blobSize - offset : 0U;
            }

            ChunkSpan span{ .index = i, .offset = offset, .length = length, .skip = (length == 0U) };
            if (!span.skip)
            {
                if (length > g_fullChunkCipherBytes || offset > blobSize || length > blobSize - offset)
                {
                    return failAt(ChunkError::MalformedManifest, i);
                }
            }
            layout.push_back(span);
            offset += length;
        }

        if (explicitLengths && offset != blobSize)
        {
            return fail(ChunkError::MalformedManifest);
        }
        return layout;
    }
    catch (const std::exception&)
    {
        return fail(ChunkError::MalformedManifest);
    }
}

[[nodiscard]] std::vector<std::uint8_t> concatenateChunks(std::span<const EncryptedChunk> chunks)
{
    std::size_t total{};
    for (const auto& c : chunks)
    {
        total += c.cipherText.size();
    }

    std::vector<std::uint8_t> blob{};
    blob.reserve(total);
    for (const auto& c : chunks)
    {
        blob.insert(blob.end(), c.cipherText.begin(), c.cipherText.end());
    }
    return blob;
}

EncryptionJob::EncryptionJob(chunkvault::crypto::ICryptoProvider& crypto, IByteSource& source,
                             EncryptedChunkSink sink, PipelineOptions options) noexcept
    : m_crypto(&crypto), m_source(&source), m_sink(std::move(sink)), m_options(options), m_keys(crypto),
      m_codec(crypto), m_totalChunks(chunkCountFor(source.size()))
{
    m_manifest.suite = crypto.suite();
    m_manifest.chunkSize = g_chunkSize;
    m_manifest.plainTextBytes = source.size();
}

[[nodiscard]] bool EncryptionJob::done() const noexcept
{
    return m_failure.has_value() || m_nextIndex >= m_totalChunks;
}

ChunkFailure EncryptionJob::recordFailure(ChunkFailure failure) noexcept
{
    m_failure = failure;
    m_master.reset();
    return failure;
}

[[nodiscard]] ChunkResult<ProgressEvent> EncryptionJob::next() noexcept
{
    if (m_failure)
    {
        return *m_failure;
    }
    if (m_nextIndex >= m_totalChunks)
    {
        return fail(ChunkError::MalformedInput);
    }

    const std::uint64_t index{ m_nextIndex };
    if (index > g_maxChunkIndex)
    {
        return recordFailure(failAt(ChunkError::MalformedInput, index));
    }
    if (isCancelled(m_options))
    {
        return recordFailure(failAt(ChunkError::Cancelled, index));
    }

    if (!m_master)
    {
        auto generated{ m_keys.generateMasterKey() };
        if (auto* failure = std::get_if<ChunkFailure>(&generated))
        {
            return recordFailure(*failure);
        }
        m_master.emplace(std::move(std::get<MasterKey>(generated)));
    }

    try
    {
        const std::uint64_t plainBytes{ chunkPlainTextSize(m_source->size(), index) };
        chunkvault::security::SecureBuffer plain(static_cast<std::size_t>(plainBytes));
        auto wipePlain{ chunkvault::security::scopeWipe(plain) };

        try
        {
            m_source->read(index * g_chunkSize, chunkvault::security::asSpan(plain));
        }
        catch (const std::exception&)
        {
            return recordFailure(failAt(ChunkError::SourceReadFailed, index));
        }

        auto derived{ m_keys.deriveChunkKey(*m_master, index) };
        if (auto* failure = std::get_if<ChunkFailure>(&derived))
        {
            return recordFailure(*failure);
        }
        const auto& key{ std::get<ChunkKey>(derived) };

        auto sealed{ m_codec.encryptChunk(chunkvault::security::asSpan(plain), key) };
        if (auto* failure = std::get_if<ChunkFailure>(&sealed))
        {
            return recordFailure(*failure);
        }
        const auto& chunk{ std::get<EncryptedChunk>(sealed) };

        m_manifest.entries.push_back(ChunkManifestEntry{
            .iv = chunk.iv,
            .cipherTextBytes = static_cast<std::uint64_t>(chunk.cipherText.size()),
        });

        if (m_sink)
        {
            try
            {
                m_sink(chunk);
            }
            catch (const std::exception&)
            {
                return recordFailure(failAt(ChunkError::SinkFailed, index));
            }
        }
    }
    catch (const std::exception&)
    {
        return recordFailure(failAt(ChunkError::CryptoError, index));
    }

    ++m_nextIndex;
    return ProgressEvent{
        .chunkIndex = index,
        .totalChunks = m_totalChunks,
        .percent = percentOf(m_nextIndex, m_totalChunks),
        .skipped = false,
    };
}

[[nodiscard]] ChunkResult<UploadResult> EncryptionJob::finish() noexcept
{
    if (m_failure)
    {
        return *m_failure;
    }
    if (!done() || m_finished || !m_master)
    {
        return fail(ChunkError::MalformedInput);
    }

    try
    {
        UploadResult out{};
        out.exportedKey = encodeBase64Secure(m_master->bytes());
        out.manifest = std::move(m_manifest);
        m_master.reset();
        m_finished = true;
        return out;
    }
    catch (const std::exception&)
    {
        return recordFailure(fail(ChunkError::CryptoError));
    }
}

DecryptionJob::DecryptionJob(chunkvault::crypto::ICryptoProvider& crypto, IByteSource& blob,
                             ChunkManifest manifest, std::vector<ChunkSpan> layout, MasterKey master,
                             PlainTextSink sink, PipelineOptions options) noexcept
    : m_crypto(&crypto), m_blob(&blob), m_manifest(std::move(manifest)), m_layout(std::move(layout)),
      m_master(std::move(master)), m_sink(std::move(sink)), m_options(options), m_keys(crypto), m_codec(crypto)
{
}

[[nodiscard]] bool DecryptionJob::done() const noexcept
{
    if (m_failure)
    {
        return true;
    }
    if (m_layout.empty())
    {
        return m_emptyReported;
    }
    return m_nextIndex >= m_layout.size();
}

ChunkFailure DecryptionJob::recordFailure(ChunkFailure failure) noexcept
{
    m_failure = failure;
    m_master = MasterKey{};
    return failure;
}

[[nodiscard]] ChunkResult<ProgressEvent> DecryptionJob::next() noexcept
{
    if (m_failure)
    {
        return *m_failure;
    }
    if (done())
    {
        return fail(ChunkError::MalformedInput);
    }

    // A zero-entry manifest over an empty blob is an empty file.
    if (m_layout.empty())
    {
        m_emptyReported = true;
        return ProgressEvent{ .chunkIndex = 0U, .totalChunks = 0U, .percent = 100.0, .skipped = false };
    }

    const ChunkSpan span{ m_layout[m_nextIndex] };
    const std::uint64_t total{ m_layout.size() };
    if (isCancelled(m_options))
    {
        return recordFailure(failAt(ChunkError::Cancelled, span.index));
    }

    if (span.skip)
    {
        if (m_options.malformedPolicy == MalformedChunkPolicy::Fail)
        {
            return recordFailure(failAt(ChunkError::MalformedManifest, span.index));
        }
        try
        {
            m_report.skippedChunks.push_back(span.index);
        }
        catch (const std::exception&)
        {
            return recordFailure(failAt(ChunkError::CryptoError, span.index));
        }
        ++m_nextIndex;
        return ProgressEvent{
            .chunkIndex = span.index,
            .totalChunks = total,
            .percent = percentOf(m_nextIndex, total),
            .skipped = true,
        };
    }

    try
    {
        std::vector<std::uint8_t> cipherText(static_cast<std::size_t>(span.length));
        try
        {
            m_blob->read(span.offset, cipherText);
        }
        catch (const std::exception&)
        {
            return recordFailure(failAt(ChunkError::SourceReadFailed, span.index));
        }

        auto derived{ m_keys.deriveChunkKey(m_master, span.index) };
        if (auto* failure = std::get_if<ChunkFailure>(&derived))
        {
            return recordFailure(*failure);
        }

        auto opened{ m_codec.decryptChunk(cipherText, std::get<ChunkKey>(derived),
                                          m_manifest.entries[static_cast<std::size_t>(span.index)].iv) };
        if (auto* failure = std::get_if<ChunkFailure>(&opened))
        {
            if (failure->error == ChunkError::AuthenticationFailed)
            {
                return recordFailure(failAt(ChunkError::DecryptionFailed, span.index));
            }
            return recordFailure(*failure);
        }

        auto& plain{ std::get<chunkvault::security::SecureBuffer>(opened) };
        auto wipePlain{ chunkvault::security::scopeWipe(plain) };
        if (m_sink)
        {
            try
            {
                m_sink(chunkvault::security::asSpan(std::as_const(plain)));
            }
            catch (const std::exception&)
            {
                return recordFailure(failAt(ChunkError::SinkFailed, span.index));
            }
        }
        ++m_report.chunksDecrypted;
        m_report.bytesWritten += plain.size();
    }
    catch (const std::exception&)
    {
        return recordFailure(failAt(ChunkError::CryptoError, span.index));
    }

    ++m_nextIndex;
    return ProgressEvent{
        .chunkIndex = span.index,
        .totalChunks = total,
        .percent = percentOf(m_nextIndex, total),
        .skipped = false,
    };
}

[[nodiscard]] ChunkResult<DownloadReport> DecryptionJob::finish() noexcept
{
    if (m_failure)
    {
        return *m_failure;
    }
    if (!done())
    {
        return fail(ChunkError::MalformedInput);
    }
    m_master = MasterKey{};
    return m_report;
}

StreamAssembler::StreamAssembler(chunkvault::crypto::ICryptoProvider& crypto) noexcept : m_crypto(&crypto)
{
}

[[nodiscard]] EncryptionJob StreamAssembler::beginEncryption(IByteSource& source, EncryptedChunkSink sink,
                                                             const PipelineOptions& options) noexcept
{
    return EncryptionJob{ *m_crypto, source, std::move(sink), options };
}

[[nodiscard]] ChunkResult<DecryptionJob> StreamAssembler::beginDecryption(IByteSource& blob,
                                                                          const ChunkManifest& manifest,
                                                                          std::span<const std::uint8_t> rawKey,
                                                                          PlainTextSink sink,
                                                                          const PipelineOptions& options) noexcept
{
    if (manifest.suite && *manifest.suite != m_crypto->suite())
    {
        return fail(ChunkError::UnsupportedSuite);
    }

    KeyManager keys{ *m_crypto };
    auto imported{ keys.importMasterKey(rawKey) };
    if (auto* failure = std::get_if<ChunkFailure>(&imported))
    {
        return *failure;
    }

    auto planned{ planChunkLayout(manifest, blob.size()) };
    if (auto* failure = std::get_if<ChunkFailure>(&planned))
    {
        return *failure;
    }

    try
    {
        return DecryptionJob{ *m_crypto,
                              blob,
                              manifest,
                              std::move(std::get<std::vector<ChunkSpan>>(planned)),
                              std::move(std::get<MasterKey>(imported)),
                              std::move(sink),
                              options };
    }
    catch (const std::exception&)
    {
        return fail(ChunkError::CryptoError);
    }
}

[[nodiscard]] ChunkResult<UploadResult> StreamAssembler::encryptStream(IByteSource& source,
                                                                       const EncryptedChunkSink& sink,
                                                                       const ProgressObserver& progress,
                                                                       const PipelineOptions& options) noexcept
{
    try
    {
        auto job{ beginEncryption(source, sink, options) };
        if (auto failure = drive(job, progress))
        {
            return *failure;
        }
        return job.finish();
    }
    catch (const std::exception&)
    {
        return fail(ChunkError::CryptoError);
    }
}

[[nodiscard]] ChunkResult<BufferedUpload> StreamAssembler::encryptBuffer(std::span<const std::uint8_t> plainText,
                                                                         const ProgressObserver& progress,
                                                                         const PipelineOptions& options) noexcept
{
    try
    {
        MemoryByteSource source{ plainText };
        std::vector<EncryptedChunk> chunks{};
        auto uploaded{ encryptStream(
            source, [&chunks](const EncryptedChunk& c) { chunks.push_back(c); }, progress, options) };
        if (auto* failure = std::get_if<ChunkFailure>(&uploaded))
        {
            return *failure;
        }
        return BufferedUpload{ .upload = std::move(std::get<UploadResult>(uploaded)), .chunks = std::move(chunks) };
    }
    catch (const std::exception&)
    {
        return fail(ChunkError::CryptoError);
    }
}

[[nodiscard]] ChunkResult<DownloadReport>
StreamAssembler::decryptStream(IByteSource& blob, const ChunkManifest& manifest, std::span<const std::uint8_t> rawKey,
                               const PlainTextSink& sink, const ProgressObserver& progress,
                               const PipelineOptions& options) noexcept
{
    try
    {
        auto begun{ beginDecryption(blob, manifest, rawKey, sink, options) };
        if (auto* failure = std::get_if<ChunkFailure>(&begun))
        {
            return *failure;
        }
        auto& job{ std::get<DecryptionJob>(begun) };
        if (auto failure = drive(job, progress))
        {
            return *failure;
        }
        return job.finish();
    }
    catch (const std::exception&)
    {
        return fail(ChunkError::CryptoError);
    }
}

[[nodiscard]] ChunkResult<BufferedDownload>
StreamAssembler::decryptBuffer(std::span<const std::uint8_t> blob, const ChunkManifest& manifest,
                               std::span<const std::uint8_t> rawKey, const ProgressObserver& progress,
                               const PipelineOptions& options) noexcept
{
    try
    {
        MemoryByteSource source{ blob };
        chunkvault::security::SecureBuffer plainText{};
        auto downloaded{ decryptStream(
            source, manifest, rawKey,
            [&plainText](std::span<const std::uint8_t> chunk) {
                plainText.insert(plainText.end(), chunk.begin(), chunk.end());
            },
            progress, options) };
        if (auto* failure = std::get_if<ChunkFailure>(&downloaded))
        {
            chunkvault::security::secureRelease(plainText);
            return *failure;
        }
        return BufferedDownload{ .plainText = std::move(plainText),
                                 .report = std::move(std::get<DownloadReport>(downloaded)) };
    }
    catch (const std::exception&)
    {
        return fail(ChunkError::CryptoError);
    }
}

[[nodiscard]] ChunkResult<BufferedDownload>
StreamAssembler::decryptBuffer(std::span<const std::uint8_t> blob, const ChunkManifest& manifest,
                               const chunkvault::security::SecureString& base64Key, const ProgressObserver& progress,
                               const PipelineOptions& options) noexcept
{
    std::optional<chunkvault::security::SecureBuffer> rawKey{};
    try
    {
        rawKey = decodeBase64Secure(chunkvault::security::asStringView(base64Key));
    }
    catch (const std::exception&)
    {
        return fail(ChunkError::CryptoError);
    }
    if (!rawKey)
    {
        return fail(ChunkError::KeyDerivationFailed);
    }
    auto wipeKey{ chunkvault::security::scopeWipe(*rawKey) };
    return decryptBuffer(blob, manifest, chunkvault::security::asSpan(std::as_const(*rawKey)), progress, options);
}

} // namespace chunkvault::core
