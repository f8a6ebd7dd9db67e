#ifndef INCLUDE_CHUNKVAULT_CORE_KEYMANAGER_HPP
#define INCLUDE_CHUNKVAULT_CORE_KEYMANAGER_HPP

#include "chunkvault/core/ChunkError.hpp"
#include "chunkvault/crypto/ICryptoProvider.hpp"
#include "chunkvault/security/SecureBuffer.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <utility>

namespace chunkvault::core
{

// 256-bit per-file key. Raw bytes are exportable; wiped on destruction.
class MasterKey final
{
public:
    MasterKey() = default;
    explicit MasterKey(chunkvault::security::SecureBuffer bytes) noexcept : m_bytes(std::move(bytes))
    {
    }
    MasterKey(const MasterKey&) = delete;
    MasterKey& operator=(const MasterKey&) = delete;
    MasterKey(MasterKey&& other) noexcept : m_bytes{}
    {
        m_bytes.swap(other.m_bytes);
    }
    MasterKey& operator=(MasterKey&& other) noexcept
    {
        if (this != &other)
        {
            chunkvault::security::secureRelease(m_bytes);
            m_bytes.swap(other.m_bytes);
        }
        return *this;
    }
    ~MasterKey() noexcept
    {
        chunkvault::security::secureRelease(m_bytes);
    }

    [[nodiscard]] std::span<const std::uint8_t> bytes() const noexcept
    {
        return chunkvault::security::asSpan(m_bytes);
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return m_bytes.empty();
    }

private:
    chunkvault::security::SecureBuffer m_bytes;
};

// Subkey for one chunk index. Recomputed on demand and dropped after that chunk.
class ChunkKey final
{
public:
    ChunkKey() = default;
    ChunkKey(std::uint64_t index, chunkvault::security::SecureBuffer bytes) noexcept
        : m_index(index), m_bytes(std::move(bytes))
    {
    }
    ChunkKey(const ChunkKey&) = delete;
    ChunkKey& operator=(const ChunkKey&) = delete;
    ChunkKey(ChunkKey&& other) noexcept : m_index(other.m_index), m_bytes{}
    {
        m_bytes.swap(other.m_bytes);
    }
    ChunkKey& operator=(ChunkKey&& other) noexcept
    {
        if (this != &other)
        {
            chunkvault::security::secureRelease(m_bytes);
            m_index = other.m_index;
            m_bytes.swap(other.m_bytes);
        }
        return *this;
    }
    ~ChunkKey() noexcept
    {
        chunkvault::security::secureRelease(m_bytes);
    }

    [[nodiscard]] std::uint64_t index() const noexcept
    {
        return m_index;
    }
    [[nodiscard]] std::span<const std::uint8_t> bytes() const noexcept
    {
        return chunkvault::security::asSpan(m_bytes);
    }

private:
    std::uint64_t m_index{};
    chunkvault::security::SecureBuffer m_bytes;
};

class KeyManager final
{
public:
    explicit KeyManager(chunkvault::crypto::ICryptoProvider& crypto) noexcept;

    [[nodiscard]] ChunkResult<MasterKey> generateMasterKey() noexcept;

    // Rejects material that is not exactly 32 bytes with KeyDerivationFailed.
    [[nodiscard]] ChunkResult<MasterKey> importMasterKey(std::span<const std::uint8_t> raw) noexcept;

    // HKDF(master, salt = 16 zero bytes, info = "chunk-<index>"). Bit-identical across calls and processes.
    [[nodiscard]] ChunkResult<ChunkKey> deriveChunkKey(const MasterKey& master, std::uint64_t index) const noexcept;

    [[nodiscard]] static std::string chunkKeyInfo(std::uint64_t index);

private:
    chunkvault::crypto::ICryptoProvider* m_crypto{ nullptr };
};

} // namespace chunkvault::core

#endif // INCLUDE_CHUNKVAULT_CORE_KEYMANAGER_HPP
