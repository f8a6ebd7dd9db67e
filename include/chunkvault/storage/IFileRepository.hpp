#ifndef INCLUDE_CHUNKVAULT_STORAGE_IFILEREPOSITORY_HPP
#define INCLUDE_CHUNKVAULT_STORAGE_IFILEREPOSITORY_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace chunkvault::storage
{

// Metadata needed to recover one encrypted file. The ciphertext blob itself lives at blobPath.
struct FileRecord final
{
    std::string fileId;
    std::string fileName;
    std::uint64_t plainTextBytes{};
    std::vector<std::uint8_t> manifest;
    std::vector<std::uint8_t> wrappedKey;
    std::string blobPath;
    std::uint64_t createdAtUnixSeconds{};
};

class IFileRepository
{
public:
    IFileRepository() = default;
    IFileRepository(const IFileRepository&) = delete;
    IFileRepository& operator=(const IFileRepository&) = delete;
    IFileRepository(IFileRepository&&) = delete;
    IFileRepository& operator=(IFileRepository&&) = delete;
    virtual ~IFileRepository() = default;

    // Inserts or replaces the record with the same fileId.
    virtual void storeFile(const FileRecord& record) = 0;

    // Throws FileNotFound when no record has this id.
    [[nodiscard]] virtual FileRecord loadFile(std::string_view fileId) const = 0;

    // Ordered by creation time, then id.
    [[nodiscard]] virtual std::vector<FileRecord> listFiles() const = 0;

    // Returns true if a row was deleted, false if it was not found.
    [[nodiscard]] virtual bool deleteFile(std::string_view fileId) = 0;

    [[nodiscard]] virtual bool fileExists(std::string_view fileId) const = 0;
};

} // namespace chunkvault::storage

#endif // INCLUDE_CHUNKVAULT_STORAGE_IFILEREPOSITORY_HPP
