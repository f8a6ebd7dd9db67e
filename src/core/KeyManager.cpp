#include "chunkvault/core/KeyManager.hpp"
#include "chunkvault/core/ChunkConstants.hpp"
#include <array>
#include <exception>

namespace chunkvault::core
{
namespace
{

constexpr std::array<std::byte, g_chunkKeySaltBytes> g_kChunkKeySalt{};

[[nodiscard]] std::span<const std::byte> asBytes(const std::string& s) noexcept
{
    return std::as_bytes(std::span<const char>{ s.data(), s.size() });
}

} // namespace

KeyManager::KeyManager(chunkvault::crypto::ICryptoProvider& crypto) noexcept : m_crypto(&crypto)
{
}

[[nodiscard]] ChunkResult<MasterKey> KeyManager::generateMasterKey() noexcept
{
    try
    {
        chunkvault::security::SecureBuffer bytes(g_masterKeyBytes);
        if (!m_crypto->randomBytes(chunkvault::security::asSpan(bytes)))
        {
            chunkvault::security::secureRelease(bytes);
            return fail(ChunkError::KeyGenerationFailed);
        }
        return MasterKey{ std::move(bytes) };
    }
    catch (const std::exception&)
    {
        return fail(ChunkError::KeyGenerationFailed);
    }
}

[[nodiscard]] ChunkResult<MasterKey> KeyManager::importMasterKey(std::span<const std::uint8_t> raw) noexcept
{
    if (raw.size() != g_masterKeyBytes)
    {
        return fail(ChunkError::KeyDerivationFailed);
    }
    try
    {
        return MasterKey{ chunkvault::security::secureBufferFrom(raw) };
    }
    catch (const std::exception&)
    {
        return fail(ChunkError::CryptoError);
    }
}

[[nodiscard]] ChunkResult<ChunkKey> KeyManager::deriveChunkKey(const MasterKey& master,
                                                              std::uint64_t index) const noexcept
{
    if (master.bytes().size() != g_masterKeyBytes || index > g_maxChunkIndex)
    {
        return failAt(ChunkError::KeyDerivationFailed, index);
    }

    try
    {
        const std::string info{ chunkKeyInfo(index) };
        auto bytes{ m_crypto->deriveSubkey(master.bytes(), std::span<const std::byte>{ g_kChunkKeySalt },
                                           asBytes(info), g_chunkKeyBytes) };
        return ChunkKey{ index, std::move(bytes) };
    }
    catch (const std::exception&)
    {
        return failAt(ChunkError::KeyDerivationFailed, index);
    }
}

[[nodiscard]] std::string KeyManager::chunkKeyInfo(std::uint64_t index)
{
    std::string info{ g_chunkKeyInfoPrefix };
    info += std::to_string(index);
    return info;
}

} // namespace chunkvault::core
