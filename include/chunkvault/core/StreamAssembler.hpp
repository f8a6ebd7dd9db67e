#ifndef INCLUDE_CHUNKVAULT_CORE_STREAMASSEMBLER_HPP
#define INCLUDE_CHUNKVAULT_CORE_STREAMASSEMBLER_HPP

#include "chunkvault/core/ByteSource.hpp"
#include "chunkvault/core/CancellationToken.hpp"
#include "chunkvault/core/ChunkCodec.hpp"
#include "chunkvault/core/ChunkError.hpp"
#include "chunkvault/core/ChunkManifest.hpp"
#include "chunkvault/core/KeyManager.hpp"
#include "chunkvault/crypto/ICryptoProvider.hpp"
#include "chunkvault/security/SecureBuffer.hpp"
#include "chunkvault/security/SecureString.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <vector>

namespace chunkvault::core
{

enum class MalformedChunkPolicy : std::uint8_t
{
    // A non-positive chunk length aborts the download with MalformedManifest.
    Fail,
    // The chunk is skipped and its index recorded in DownloadReport::skippedChunks.
    SkipAndReport,
};

struct ProgressEvent final
{
    std::uint64_t chunkIndex{};
    std::uint64_t totalChunks{};
    // (chunkIndex + 1) / totalChunks * 100; exactly 100 on the last chunk.
    double percent{};
    bool skipped{ false };
};

using ProgressObserver = std::function<void(const ProgressEvent&)>;

struct PipelineOptions final
{
    MalformedChunkPolicy malformedPolicy{ MalformedChunkPolicy::Fail };
    const CancellationToken* cancellation{ nullptr };
};

struct UploadResult final
{
    ChunkManifest manifest;
    // Base64 of the raw master key.
    chunkvault::security::SecureString exportedKey;
};

struct BufferedUpload final
{
    UploadResult upload;
    std::vector<EncryptedChunk> chunks;
};

struct DownloadReport final
{
    std::uint64_t chunksDecrypted{};
    std::uint64_t bytesWritten{};
    std::vector<std::uint64_t> skippedChunks;
};

struct BufferedDownload final
{
    chunkvault::security::SecureBuffer plainText;
    DownloadReport report;
};

// Where one chunk lives inside the concatenated ciphertext blob.
struct ChunkSpan final
{
    std::uint64_t index{};
    std::uint64_t offset{};
    std::uint64_t length{};
    bool skip{ false };
};

// Resolves every chunk's [offset, offset + length) in a blob of blobSize bytes.
// Uses the manifest's explicit lengths when all entries carry one (they must sum to blobSize);
// otherwise non-final chunks are g_fullChunkCipherBytes and the final chunk takes the remainder.
// A zero length marks the chunk as skip; slices past the blob or longer than a full chunk fail.
[[nodiscard]] ChunkResult<std::vector<ChunkSpan>> planChunkLayout(const ChunkManifest& manifest,
                                                                  std::uint64_t blobSize) noexcept;

[[nodiscard]] std::vector<std::uint8_t> concatenateChunks(std::span<const EncryptedChunk> chunks);

// Upload as a lazy sequence: each next() reads, encrypts and emits exactly one chunk.
// After a failure every further next() returns the same failure; chunks already handed to the
// sink must be discarded by the caller.
class EncryptionJob final
{
public:
    EncryptionJob(chunkvault::crypto::ICryptoProvider& crypto, IByteSource& source, EncryptedChunkSink sink,
                  PipelineOptions options) noexcept;

    [[nodiscard]] bool done() const noexcept;
    [[nodiscard]] std::uint64_t totalChunks() const noexcept
    {
        return m_totalChunks;
    }

    [[nodiscard]] ChunkResult<ProgressEvent> next() noexcept;

    // Exports the master key and hands over the manifest. Only valid once every chunk succeeded.
    [[nodiscard]] ChunkResult<UploadResult> finish() noexcept;

private:
    ChunkFailure recordFailure(ChunkFailure failure) noexcept;

    chunkvault::crypto::ICryptoProvider* m_crypto{ nullptr };
    IByteSource* m_source{ nullptr };
    EncryptedChunkSink m_sink;
    PipelineOptions m_options{};
    KeyManager m_keys;
    ChunkCodec m_codec;

    std::optional<MasterKey> m_master{};
    ChunkManifest m_manifest{};
    std::uint64_t m_totalChunks{};
    std::uint64_t m_nextIndex{};
    std::optional<ChunkFailure> m_failure{};
    bool m_finished{ false };
};

// Download as a lazy sequence: each next() slices, decrypts and emits exactly one chunk, in index order.
class DecryptionJob final
{
public:
    DecryptionJob(chunkvault::crypto::ICryptoProvider& crypto, IByteSource& blob, ChunkManifest manifest,
                  std::vector<ChunkSpan> layout, MasterKey master, PlainTextSink sink,
                  PipelineOptions options) noexcept;

    [[nodiscard]] bool done() const noexcept;
    [[nodiscard]] std::uint64_t totalChunks() const noexcept
    {
        return m_layout.size();
    }

    [[nodiscard]] ChunkResult<ProgressEvent> next() noexcept;

    [[nodiscard]] const DownloadReport& report() const noexcept
    {
        return m_report;
    }

    [[nodiscard]] ChunkResult<DownloadReport> finish() noexcept;

private:
    ChunkFailure recordFailure(ChunkFailure failure) noexcept;

    chunkvault::crypto::ICryptoProvider* m_crypto{ nullptr };
    IByteSource* m_blob{ nullptr };
    ChunkManifest m_manifest;
    std::vector<ChunkSpan> m_layout;
    MasterKey m_master;
    PlainTextSink m_sink;
    PipelineOptions m_options{};
    KeyManager m_keys;
    ChunkCodec m_codec;

    DownloadReport m_report{};
    std::uint64_t m_nextIndex{};
    bool m_emptyReported{ false };
    std::optional<ChunkFailure> m_failure{};
};

class StreamAssembler final
{
public:
    explicit StreamAssembler(chunkvault::crypto::ICryptoProvider& crypto) noexcept;

    [[nodiscard]] EncryptionJob beginEncryption(IByteSource& source, EncryptedChunkSink sink,
                                                const PipelineOptions& options = {}) noexcept;

    // Validates suite, key and layout up front; the job then only fails on per-chunk errors.
    [[nodiscard]] ChunkResult<DecryptionJob> beginDecryption(IByteSource& blob, const ChunkManifest& manifest,
                                                             std::span<const std::uint8_t> rawKey,
                                                             PlainTextSink sink,
                                                             const PipelineOptions& options = {}) noexcept;

    [[nodiscard]] ChunkResult<UploadResult> encryptStream(IByteSource& source, const EncryptedChunkSink& sink,
                                                          const ProgressObserver& progress = {},
                                                          const PipelineOptions& options = {}) noexcept;

    [[nodiscard]] ChunkResult<BufferedUpload> encryptBuffer(std::span<const std::uint8_t> plainText,
                                                            const ProgressObserver& progress = {},
                                                            const PipelineOptions& options = {}) noexcept;

    [[nodiscard]] ChunkResult<DownloadReport> decryptStream(IByteSource& blob, const ChunkManifest& manifest,
                                                            std::span<const std::uint8_t> rawKey,
                                                            const PlainTextSink& sink,
                                                            const ProgressObserver& progress = {},
                                                            const PipelineOptions& options = {}) noexcept;

    [[nodiscard]] ChunkResult<BufferedDownload> decryptBuffer(std::span<const std::uint8_t> blob,
                                                              const ChunkManifest& manifest,
                                                              std::span<const std::uint8_t> rawKey,
                                                              const ProgressObserver& progress = {},
                                                              const PipelineOptions& options = {}) noexcept;

    // Same as above with the key as exchanged at the download boundary (base64).
    [[nodiscard]] ChunkResult<BufferedDownload> decryptBuffer(std::span<const std::uint8_t> blob,
                                                              const ChunkManifest& manifest,
                                                              const chunkvault::security::SecureString& base64Key,
                                                              const ProgressObserver& progress = {},
                                                              const PipelineOptions& options = {}) noexcept;

private:
    chunkvault::crypto::ICryptoProvider* m_crypto{ nullptr };
};

} // namespace chunkvault::core

#endif // INCLUDE_CHUNKVAULT_CORE_STREAMASSEMBLER_HPP
