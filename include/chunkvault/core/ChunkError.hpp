#ifndef INCLUDE_CHUNKVAULT_CORE_CHUNKERROR_HPP
#define INCLUDE_CHUNKVAULT_CORE_CHUNKERROR_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace chunkvault::core
{

enum class ChunkError : std::uint8_t
{
    KeyGenerationFailed,
    RandomFailed,
    KeyDerivationFailed,
    AuthenticationFailed,
    DecryptionFailed,
    MalformedInput,
    MalformedManifest,
    UnsupportedSuite,
    SourceReadFailed,
    SinkFailed,
    Cancelled,
    CryptoError,
};

struct ChunkFailure final
{
    ChunkError error{ ChunkError::CryptoError };
    std::optional<std::uint64_t> chunkIndex{};
};

template <class T> using ChunkResult = std::variant<T, ChunkFailure>;

[[nodiscard]] std::string_view errorName(ChunkError error) noexcept;

// One user-facing line, including the chunk index when known.
[[nodiscard]] std::string describe(const ChunkFailure& failure);

template <class T> [[nodiscard]] bool succeeded(const ChunkResult<T>& r) noexcept
{
    return std::holds_alternative<T>(r);
}

[[nodiscard]] inline ChunkFailure failAt(ChunkError error, std::uint64_t index) noexcept
{
    return ChunkFailure{ .error = error, .chunkIndex = index };
}

[[nodiscard]] inline ChunkFailure fail(ChunkError error) noexcept
{
    return ChunkFailure{ .error = error, .chunkIndex = std::nullopt };
}

} // namespace chunkvault::core

#endif // INCLUDE_CHUNKVAULT_CORE_CHUNKERROR_HPP
