#ifndef INCLUDE_CHUNKVAULT_STORAGE_SQLITE_SQLITEFILEREPOSITORYFACTORY_HPP
#define INCLUDE_CHUNKVAULT_STORAGE_SQLITE_SQLITEFILEREPOSITORYFACTORY_HPP

#include "chunkvault/storage/IFileRepository.hpp"
#include <filesystem>
#include <memory>

namespace chunkvault::storage::sqlite
{

// Opens (creating if needed) the catalog database at dbPath and ensures its schema.
[[nodiscard]] std::unique_ptr<chunkvault::storage::IFileRepository>
makeSqliteFileRepository(const std::filesystem::path& dbPath);

} // namespace chunkvault::storage::sqlite

#endif // INCLUDE_CHUNKVAULT_STORAGE_SQLITE_SQLITEFILEREPOSITORYFACTORY_HPP
