#ifndef INCLUDE_CHUNKVAULT_CRYPTO_KDFMETADATA_HPP
#define INCLUDE_CHUNKVAULT_CRYPTO_KDFMETADATA_HPP

#include <array>
#include <cstddef>
#include <cstdint>

namespace chunkvault::crypto
{

constexpr std::size_t g_argon2SaltBytes{ 16 };
constexpr std::size_t g_kKekBytes{ 32 };

constexpr std::uint32_t g_kKdfPolicyVersion{ 1 };

// Argon2 v1.3 (0x13), the only version Monocypher implements.
constexpr std::uint32_t g_kArgon2VersionV13{ 0x13 };

enum class KdfAlgorithm : std::uint32_t
{
    Argon2id = 1U,
};

struct Argon2idParams final
{
    std::uint32_t iterations;
    std::uint32_t memoryKiB;
    std::uint32_t parallelism;
};

constexpr std::uint32_t g_kArgon2MaxIterations{ 10U };
constexpr std::uint32_t g_kArgon2MaxParallelism{ 16U };
constexpr std::uint32_t g_kArgon2MaxMemoryKiB{ 1024U * 1024U };

// Memory must cover 8 KiB per lane and split evenly into 4 KiB blocks per lane.
[[nodiscard]] constexpr bool isSupportedArgon2idParams(const Argon2idParams& p) noexcept
{
    if (p.iterations == 0U || p.iterations > g_kArgon2MaxIterations)
    {
        return false;
    }
    if (p.parallelism == 0U || p.parallelism > g_kArgon2MaxParallelism)
    {
        return false;
    }
    return p.memoryKiB <= g_kArgon2MaxMemoryKiB && p.memoryKiB >= p.parallelism * 8U &&
           (p.memoryKiB % (p.parallelism * 4U)) == 0U;
}

// Parameters for deriving a key-encryption key from a recipient passphrase.
// Stored in clear next to the wrapped file key.
struct KdfMetadata final
{
    std::uint32_t policyVersion{ g_kKdfPolicyVersion };
    KdfAlgorithm algorithm{ KdfAlgorithm::Argon2id };
    std::uint32_t argon2Version{ g_kArgon2VersionV13 };
    std::uint32_t derivedKeyBytes{ static_cast<std::uint32_t>(g_kKekBytes) };

    Argon2idParams argon2id{};
    std::array<std::uint8_t, g_argon2SaltBytes> salt{};
};

} // namespace chunkvault::crypto

#endif // INCLUDE_CHUNKVAULT_CRYPTO_KDFMETADATA_HPP
