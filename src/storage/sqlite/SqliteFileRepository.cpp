#include "chunkvault/storage/sqlite/SqliteFileRepositoryFactory.hpp"

#include "chunkvault/storage/IFileRepository.hpp"
#include "chunkvault/storage/StorageErrors.hpp"
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <limits>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <sqlite3.h>

namespace chunkvault::storage::sqlite
{
namespace
{

struct SqliteDbDeleter final
{
    void operator()(sqlite3* db) const noexcept
    {
        if (db != nullptr)
        {
            (void)sqlite3_close_v2(db);
        }
    }
};

struct SqliteStmtDeleter final
{
    void operator()(sqlite3_stmt* stmt) const noexcept
    {
        if (stmt != nullptr)
        {
            (void)sqlite3_finalize(stmt);
        }
    }
};

using SqliteDbPtr = std::unique_ptr<sqlite3, SqliteDbDeleter>;
using SqliteStmtPtr = std::unique_ptr<sqlite3_stmt, SqliteStmtDeleter>;

constexpr const char* g_kSelectColumns =
    "SELECT file_id, file_name, plaintext_bytes, manifest, wrapped_key, blob_path, created_at FROM files";

[[nodiscard]] std::string sqliteErr(sqlite3* db, const char* prefix)
{
    const char* msg = (db != nullptr) ? sqlite3_errmsg(db) : "no-db";
    std::string out{ prefix };
    out.append(": ");
    out.append(msg);
    return out;
}

void exec(sqlite3* db, const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::string msg = sqliteErr(db, "storage: sqlite3_exec failed");
        if (errMsg != nullptr)
        {
            msg.append(" (");
            msg.append(errMsg);
            msg.append(")");
            sqlite3_free(errMsg);
        }
        throw std::runtime_error(msg);
    }
}

[[nodiscard]] SqliteDbPtr openDb(const std::filesystem::path& path, int flags)
{
    sqlite3* raw = nullptr;
    const std::string filename = path.string();
    const int rc = sqlite3_open_v2(filename.c_str(), &raw, flags, nullptr);
    SqliteDbPtr db{ raw };
    if (rc != SQLITE_OK || !db)
    {
        throw std::runtime_error(sqliteErr(raw, "storage: sqlite3_open_v2 failed"));
    }
    return db;
}

[[nodiscard]] SqliteStmtPtr prepare(sqlite3* db, const std::string& sql)
{
    sqlite3_stmt* rawStmt = nullptr;
    const int prepRc = sqlite3_prepare_v2(db, sql.c_str(), -1, &rawStmt, nullptr);
    SqliteStmtPtr stmt{ rawStmt };
    if (prepRc != SQLITE_OK || !stmt)
    {
        throw std::runtime_error(sqliteErr(db, "storage: sqlite3_prepare_v2 failed"));
    }
    return stmt;
}

void ensureSchema(sqlite3* db)
{
    exec(db, "CREATE TABLE IF NOT EXISTS files ("
             " file_id TEXT PRIMARY KEY NOT NULL,"
             " file_name TEXT NOT NULL,"
             " plaintext_bytes INTEGER NOT NULL,"
             " manifest BLOB NOT NULL,"
             " wrapped_key BLOB NOT NULL,"
             " blob_path TEXT NOT NULL,"
             " created_at INTEGER NOT NULL"
             ");");
}

void requireSqliteInt(std::size_t n, const char* what)
{
    if (n > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        throw std::invalid_argument(what);
    }
}

void bindText(sqlite3* db, sqlite3_stmt* stmt, int index, std::string_view text)
{
    requireSqliteInt(text.size(), "storage: text too large");
    if (sqlite3_bind_text(stmt, index, text.data(), static_cast<int>(text.size()), SQLITE_STATIC) != SQLITE_OK)
    {
        throw std::runtime_error(sqliteErr(db, "storage: bind text failed"));
    }
}

// Empty vectors may have a null data(); bind a zero-length blob so NOT NULL holds.
void bindBlob(sqlite3* db, sqlite3_stmt* stmt, int index, std::span<const std::uint8_t> bytes)
{
    requireSqliteInt(bytes.size(), "storage: blob too large");
    const int rc = bytes.empty()
                       ? sqlite3_bind_zeroblob(stmt, index, 0)
                       : sqlite3_bind_blob(stmt, index, bytes.data(), static_cast<int>(bytes.size()), SQLITE_STATIC);
    if (rc != SQLITE_OK)
    {
        throw std::runtime_error(sqliteErr(db, "storage: bind blob failed"));
    }
}

void bindU64(sqlite3* db, sqlite3_stmt* stmt, int index, std::uint64_t v)
{
    if (v > static_cast<std::uint64_t>(std::numeric_limits<sqlite3_int64>::max()))
    {
        throw std::invalid_argument("storage: integer out of range");
    }
    if (sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(v)) != SQLITE_OK)
    {
        throw std::runtime_error(sqliteErr(db, "storage: bind integer failed"));
    }
}

[[nodiscard]] std::string columnText(sqlite3_stmt* stmt, int col)
{
    const unsigned char* ptr = sqlite3_column_text(stmt, col);
    const int bytes = sqlite3_column_bytes(stmt, col);
    if (ptr == nullptr || bytes <= 0)
    {
        return {};
    }
    return std::string{ reinterpret_cast<const char*>(ptr), static_cast<std::size_t>(bytes) };
}

[[nodiscard]] std::vector<std::uint8_t> columnBlob(sqlite3_stmt* stmt, int col)
{
    const void* ptr = sqlite3_column_blob(stmt, col);
    const int bytes = sqlite3_column_bytes(stmt, col);
    std::vector<std::uint8_t> out{};
    if (ptr == nullptr || bytes <= 0)
    {
        return out;
    }
    out.resize(static_cast<std::size_t>(bytes));
    std::memcpy(out.data(), ptr, out.size());
    return out;
}

[[nodiscard]] std::uint64_t columnU64(sqlite3_stmt* stmt, int col)
{
    const sqlite3_int64 v = sqlite3_column_int64(stmt, col);
    if (v < 0)
    {
        throw std::runtime_error("storage: negative integer column");
    }
    return static_cast<std::uint64_t>(v);
}

[[nodiscard]] chunkvault::storage::FileRecord readRow(sqlite3_stmt* stmt)
{
    chunkvault::storage::FileRecord record{};
    record.fileId = columnText(stmt, 0);
    record.fileName = columnText(stmt, 1);
    record.plainTextBytes = columnU64(stmt, 2);
    record.manifest = columnBlob(stmt, 3);
    record.wrappedKey = columnBlob(stmt, 4);
    record.blobPath = columnText(stmt, 5);
    record.createdAtUnixSeconds = columnU64(stmt, 6);
    return record;
}

class SqliteFileRepository final : public chunkvault::storage::IFileRepository
{
public:
    explicit SqliteFileRepository(const std::filesystem::path& dbPath)
        : m_db{ openDb(dbPath, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE) }
    {
        ensureSchema(m_db.get());
    }

    void storeFile(const chunkvault::storage::FileRecord& record) override
    {
        if (record.fileId.empty())
        {
            throw std::invalid_argument("storage: empty file id");
        }

        sqlite3* db = m_db.get();
        auto stmt = prepare(db, "INSERT INTO files(file_id, file_name, plaintext_bytes, manifest, wrapped_key,"
                                " blob_path, created_at) VALUES (?, ?, ?, ?, ?, ?, ?)"
                                " ON CONFLICT(file_id) DO UPDATE SET file_name=excluded.file_name,"
                                " plaintext_bytes=excluded.plaintext_bytes, manifest=excluded.manifest,"
                                " wrapped_key=excluded.wrapped_key, blob_path=excluded.blob_path,"
                                " created_at=excluded.created_at;");

        bindText(db, stmt.get(), 1, record.fileId);
        bindText(db, stmt.get(), 2, record.fileName);
        bindU64(db, stmt.get(), 3, record.plainTextBytes);
        bindBlob(db, stmt.get(), 4, record.manifest);
        bindBlob(db, stmt.get(), 5, record.wrappedKey);
        bindText(db, stmt.get(), 6, record.blobPath);
        bindU64(db, stmt.get(), 7, record.createdAtUnixSeconds);

        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        {
            throw std::runtime_error(sqliteErr(db, "storage: upsert file failed"));
        }
    }

    [[nodiscard]] chunkvault::storage::FileRecord loadFile(std::string_view fileId) const override
    {
        sqlite3* db = m_db.get();
        auto stmt = prepare(db, std::string{ g_kSelectColumns } + " WHERE file_id = ?;");
        bindText(db, stmt.get(), 1, fileId);

        const int stepRc = sqlite3_step(stmt.get());
        if (stepRc == SQLITE_ROW)
        {
            return readRow(stmt.get());
        }
        if (stepRc == SQLITE_DONE)
        {
            throw chunkvault::storage::FileNotFound("storage: no file with id " + std::string{ fileId });
        }
        throw std::runtime_error(sqliteErr(db, "storage: select file failed"));
    }

    [[nodiscard]] std::vector<chunkvault::storage::FileRecord> listFiles() const override
    {
        sqlite3* db = m_db.get();
        auto stmt = prepare(db, std::string{ g_kSelectColumns } + " ORDER BY created_at, file_id;");

        std::vector<chunkvault::storage::FileRecord> out{};
        for (;;)
        {
            const int stepRc = sqlite3_step(stmt.get());
            if (stepRc == SQLITE_ROW)
            {
                out.push_back(readRow(stmt.get()));
                continue;
            }
            if (stepRc == SQLITE_DONE)
            {
                break;
            }
            throw std::runtime_error(sqliteErr(db, "storage: list files failed"));
        }
        return out;
    }

    [[nodiscard]] bool deleteFile(std::string_view fileId) override
    {
        sqlite3* db = m_db.get();
        auto stmt = prepare(db, "DELETE FROM files WHERE file_id = ?;");
        bindText(db, stmt.get(), 1, fileId);

        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        {
            throw std::runtime_error(sqliteErr(db, "storage: delete file failed"));
        }
        return sqlite3_changes(db) > 0;
    }

    [[nodiscard]] bool fileExists(std::string_view fileId) const override
    {
        sqlite3* db = m_db.get();
        auto stmt = prepare(db, "SELECT 1 FROM files WHERE file_id = ? LIMIT 1;");
        bindText(db, stmt.get(), 1, fileId);

        const int stepRc = sqlite3_step(stmt.get());
        if (stepRc == SQLITE_ROW)
        {
            return true;
        }
        if (stepRc == SQLITE_DONE)
        {
            return false;
        }
        throw std::runtime_error(sqliteErr(db, "storage: exists query failed"));
    }

private:
    SqliteDbPtr m_db;
};

} // namespace

[[nodiscard]] std::unique_ptr<chunkvault::storage::IFileRepository>
makeSqliteFileRepository(const std::filesystem::path& dbPath)
{
    return std::make_unique<SqliteFileRepository>(dbPath);
}

} // namespace chunkvault::storage::sqlite
