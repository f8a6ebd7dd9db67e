#include "chunkvault/core/ChunkError.hpp"

namespace chunkvault::core
{

[[nodiscard]] std::string_view errorName(ChunkError error) noexcept
{
    switch (error)
    {
    case ChunkError::KeyGenerationFailed:
        return "KeyGenerationFailed";
    case ChunkError::RandomFailed:
        return "RandomFailed";
    case ChunkError::KeyDerivationFailed:
        return "KeyDerivationFailed";
    case ChunkError::AuthenticationFailed:
        return "AuthenticationFailed";
    case ChunkError::DecryptionFailed:
        return "DecryptionFailed";
    case ChunkError::MalformedInput:
        return "MalformedInput";
    case ChunkError::MalformedManifest:
        return "MalformedManifest";
    case ChunkError::UnsupportedSuite:
        return "UnsupportedSuite";
    case ChunkError::SourceReadFailed:
        return "SourceReadFailed";
    case ChunkError::SinkFailed:
        return "SinkFailed";
    case ChunkError::Cancelled:
        return "Cancelled";
    case ChunkError::CryptoError:
        return "CryptoError";
    }
    return "Unknown";
}

[[nodiscard]] std::string describe(const ChunkFailure& failure)
{
    const std::string at{ failure.chunkIndex ? " at chunk " + std::to_string(*failure.chunkIndex) : std::string{} };

    switch (failure.error)
    {
    case ChunkError::DecryptionFailed:
    case ChunkError::AuthenticationFailed:
        return "Decryption failed" + at + ". The file might be corrupted or the key is incorrect.";
    case ChunkError::KeyGenerationFailed:
    case ChunkError::RandomFailed:
        return "Secure random source unavailable" + at + ".";
    case ChunkError::KeyDerivationFailed:
        return "Key derivation failed" + at + ".";
    case ChunkError::MalformedInput:
        return "Malformed input" + at + ".";
    case ChunkError::MalformedManifest:
        return "Manifest does not match the ciphertext" + at + ".";
    case ChunkError::UnsupportedSuite:
        return "Manifest was sealed with a cipher suite this provider does not implement.";
    case ChunkError::SourceReadFailed:
        return "Failed to read input" + at + ".";
    case ChunkError::SinkFailed:
        return "Failed to write output" + at + ".";
    case ChunkError::Cancelled:
        return "Operation cancelled" + at + ".";
    case ChunkError::CryptoError:
        return "Cryptographic backend error" + at + ".";
    }
    return "Unknown error" + at + ".";
}

} // namespace chunkvault::core
