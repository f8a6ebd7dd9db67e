#include "chunkvault/core/KdfPolicy.hpp"
#include "chunkvault/security/SecureRandom.hpp"
#include <span>

namespace chunkvault::core
{
namespace
{

constexpr std::uint32_t g_kWrapIterations{ 3U };
constexpr std::uint32_t g_kWrapMemoryKiB{ 64U * 1024U };
constexpr std::uint32_t g_kWrapParallelism{ 1U };

} // namespace

[[nodiscard]] chunkvault::crypto::Argon2idParams defaultArgon2idParams() noexcept
{
    return chunkvault::crypto::Argon2idParams{
        .iterations = g_kWrapIterations,
        .memoryKiB = g_kWrapMemoryKiB,
        .parallelism = g_kWrapParallelism,
    };
}

[[nodiscard]] std::optional<chunkvault::crypto::Argon2idParams>
resolveArgon2idParams(std::uint32_t iterationsOverride, std::uint32_t memoryKiBOverride) noexcept
{
    auto params{ defaultArgon2idParams() };
    if (iterationsOverride != 0U)
    {
        params.iterations = iterationsOverride;
    }
    if (memoryKiBOverride != 0U)
    {
        params.memoryKiB = memoryKiBOverride;
    }
    if (!chunkvault::crypto::isSupportedArgon2idParams(params))
    {
        return std::nullopt;
    }
    return params;
}

[[nodiscard]] std::optional<chunkvault::crypto::KdfMetadata>
makeKdfMetadata(chunkvault::crypto::Argon2idParams params) noexcept
{
    chunkvault::crypto::KdfMetadata meta{};
    meta.argon2id = params;
    if (!chunkvault::security::secureRandomFill(std::span<std::uint8_t>{ meta.salt }))
    {
        return std::nullopt;
    }
    return meta;
}

} // namespace chunkvault::core
