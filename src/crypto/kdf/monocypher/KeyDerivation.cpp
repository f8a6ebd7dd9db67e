#include "chunkvault/crypto/KeyDerivation.hpp"

#include "chunkvault/security/ScopeWipe.hpp"
#include "chunkvault/security/ZeroAllocator.hpp"
#include "monocypher.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>
#include <stdexcept>
#include <vector>

namespace chunkvault::crypto
{
namespace
{

constexpr std::size_t g_kBlake2bHashBytes{ 64U };

void requireArgon2idParamsSafe(const Argon2idParams& params)
{
    if (!isSupportedArgon2idParams(params))
    {
        throw std::invalid_argument("deriveKeyArgon2id: unsupported parameters");
    }
}

} // namespace

[[nodiscard]] chunkvault::security::SecureBuffer
deriveKeyArgon2id(std::span<const std::byte> passphrase, std::span<const std::byte> salt, Argon2idParams params)
{
    if (passphrase.empty())
    {
        throw std::invalid_argument("deriveKeyArgon2id: empty passphrase");
    }
    if (salt.size() != g_argon2SaltBytes)
    {
        throw std::invalid_argument("deriveKeyArgon2id: invalid salt size");
    }
    requireArgon2idParamsSafe(params);

    if (passphrase.size() > std::numeric_limits<std::uint32_t>::max())
    {
        throw std::invalid_argument("deriveKeyArgon2id: passphrase too large");
    }

    constexpr std::size_t kU64WordsPerKiB{ 128U }; // 1024 / sizeof(uint64_t)
    const std::size_t workWords{ static_cast<std::size_t>(params.memoryKiB) * kU64WordsPerKiB };
    std::vector<std::uint64_t, chunkvault::security::ZeroAllocator<std::uint64_t>> workArea(workWords);

    chunkvault::security::SecureBuffer key;
    key.resize(g_kKekBytes);

    const crypto_argon2_config cfg{ .algorithm = CRYPTO_ARGON2_ID,
                                    .nb_blocks = params.memoryKiB,
                                    .nb_passes = params.iterations,
                                    .nb_lanes = params.parallelism };

    const crypto_argon2_inputs inputs{ .pass = reinterpret_cast<const std::uint8_t*>(passphrase.data()),
                                       .salt = reinterpret_cast<const std::uint8_t*>(salt.data()),
                                       .pass_size = static_cast<std::uint32_t>(passphrase.size()),
                                       .salt_size = static_cast<std::uint32_t>(salt.size()) };

    crypto_argon2(key.data(), static_cast<std::uint32_t>(key.size()), workArea.data(), cfg, inputs,
                  crypto_argon2_no_extras);

    return key;
}

[[nodiscard]] chunkvault::security::SecureBuffer hkdfBlake2b(std::span<const std::uint8_t> inputKey,
                                                            std::span<const std::byte> salt,
                                                            std::span<const std::byte> info, std::size_t outBytes)
{
    if (inputKey.empty())
    {
        throw std::invalid_argument("hkdfBlake2b: empty inputKey");
    }
    // Keyed BLAKE2b accepts at most a 64-byte key, which bounds the salt.
    if (salt.size() > g_kBlake2bHashBytes)
    {
        throw std::invalid_argument("hkdfBlake2b: salt too large");
    }
    if (outBytes == 0U || outBytes > g_kBlake2bHashBytes)
    {
        throw std::invalid_argument("hkdfBlake2b: invalid outBytes");
    }

    std::array<std::uint8_t, g_kBlake2bHashBytes> prk{};
    auto wipePrk = chunkvault::security::scopeWipe(std::span<std::uint8_t>{ prk });
    crypto_blake2b_keyed(prk.data(), prk.size(), reinterpret_cast<const std::uint8_t*>(salt.data()), salt.size(),
                         inputKey.data(), inputKey.size());

    // A single expand block covers outBytes <= 64: T(1) = MAC(prk, info || 0x01).
    std::array<std::uint8_t, g_kBlake2bHashBytes> block{};
    auto wipeBlock = chunkvault::security::scopeWipe(std::span<std::uint8_t>{ block });
    crypto_blake2b_ctx ctx{};
    auto wipeCtx = chunkvault::security::scopeWipe(std::as_writable_bytes(std::span{ &ctx, 1 }));
    constexpr std::uint8_t kCounter{ 0x01U };
    crypto_blake2b_keyed_init(&ctx, block.size(), prk.data(), prk.size());
    crypto_blake2b_update(&ctx, reinterpret_cast<const std::uint8_t*>(info.data()), info.size());
    crypto_blake2b_update(&ctx, &kCounter, 1U);
    crypto_blake2b_final(&ctx, block.data());

    chunkvault::security::SecureBuffer out(block.begin(), block.begin() + static_cast<std::ptrdiff_t>(outBytes));
    return out;
}

} // namespace chunkvault::crypto
