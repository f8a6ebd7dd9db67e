#ifndef INCLUDE_CHUNKVAULT_CORE_BYTESOURCE_HPP
#define INCLUDE_CHUNKVAULT_CORE_BYTESOURCE_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <span>
#include <stdexcept>

namespace chunkvault::core
{

class SourceReadError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Random-access input of known length. Reads throw SourceReadError on short or failed reads.
class IByteSource
{
public:
    IByteSource() = default;
    IByteSource(const IByteSource&) = delete;
    IByteSource& operator=(const IByteSource&) = delete;
    IByteSource(IByteSource&&) = delete;
    IByteSource& operator=(IByteSource&&) = delete;
    virtual ~IByteSource() = default;

    [[nodiscard]] virtual std::uint64_t size() const noexcept = 0;

    // Fills exactly out.size() bytes starting at offset.
    virtual void read(std::uint64_t offset, std::span<std::uint8_t> out) = 0;
};

// Non-owning view; the bytes must outlive the source.
class MemoryByteSource final : public IByteSource
{
public:
    explicit MemoryByteSource(std::span<const std::uint8_t> bytes) noexcept : m_bytes(bytes)
    {
    }

    [[nodiscard]] std::uint64_t size() const noexcept override
    {
        return m_bytes.size();
    }

    void read(std::uint64_t offset, std::span<std::uint8_t> out) override;

private:
    std::span<const std::uint8_t> m_bytes;
};

class FileByteSource final : public IByteSource
{
public:
    // Throws SourceReadError if the file cannot be opened or sized.
    explicit FileByteSource(const std::filesystem::path& path);

    [[nodiscard]] std::uint64_t size() const noexcept override
    {
        return m_size;
    }

    void read(std::uint64_t offset, std::span<std::uint8_t> out) override;

private:
    std::ifstream m_in;
    std::uint64_t m_size{};
};

struct EncryptedChunk;

// Sinks may throw; the pipeline reports SinkFailed and stops.
using EncryptedChunkSink = std::function<void(const EncryptedChunk&)>;
using PlainTextSink = std::function<void(std::span<const std::uint8_t>)>;

} // namespace chunkvault::core

#endif // INCLUDE_CHUNKVAULT_CORE_BYTESOURCE_HPP
