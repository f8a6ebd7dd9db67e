#include "chunkvault/storage/sqlite/SqliteFileRepositoryFactory.hpp"

#include "chunkvault/storage/StorageErrors.hpp"
#include "test_utils/TestUtils.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

[[nodiscard]] chunkvault::storage::FileRecord makeRecord(const std::string& id, std::uint64_t createdAt)
{
    constexpr std::uint64_t kPlainBytes{ 2500000U };

    chunkvault::storage::FileRecord record{};
    record.fileId = id;
    record.fileName = "report-" + id + ".pdf";
    record.plainTextBytes = kPlainBytes;
    record.manifest = { 'C', 'H', 'K', 'M', 0x02U, 0x00U, 0xFFU };
    record.wrappedKey = { 'C', 'H', 'K', 'V', 0x01U };
    record.blobPath = "/srv/blobs/" + id + ".bin";
    record.createdAtUnixSeconds = createdAt;
    return record;
}

void expectSameRecord(const chunkvault::storage::FileRecord& a, const chunkvault::storage::FileRecord& b)
{
    EXPECT_EQ(a.fileId, b.fileId);
    EXPECT_EQ(a.fileName, b.fileName);
    EXPECT_EQ(a.plainTextBytes, b.plainTextBytes);
    EXPECT_EQ(a.manifest, b.manifest);
    EXPECT_EQ(a.wrappedKey, b.wrappedKey);
    EXPECT_EQ(a.blobPath, b.blobPath);
    EXPECT_EQ(a.createdAtUnixSeconds, b.createdAtUnixSeconds);
}

} // namespace

TEST(SqliteFileRepository, StoreAndLoadRoundtrips)
{
    const chunkvault::test_utils::ScopedTempDir tmp{ "sqlite_files_" };
    ASSERT_TRUE(tmp.valid());
    const auto& dir{ tmp.path() };

    auto repo{ chunkvault::storage::sqlite::makeSqliteFileRepository(dir / "catalog.db") };
    const auto record{ makeRecord("a1b2", 1700000000U) };
    repo->storeFile(record);

    EXPECT_TRUE(repo->fileExists("a1b2"));
    expectSameRecord(repo->loadFile("a1b2"), record);
}

TEST(SqliteFileRepository, RecordsSurviveReopen)
{
    const chunkvault::test_utils::ScopedTempDir tmp{ "sqlite_files_reopen_" };
    ASSERT_TRUE(tmp.valid());
    const auto& dir{ tmp.path() };
    const auto dbPath{ dir / "catalog.db" };

    const auto record{ makeRecord("persist", 42U) };
    {
        auto repo{ chunkvault::storage::sqlite::makeSqliteFileRepository(dbPath) };
        repo->storeFile(record);
    }

    auto reopened{ chunkvault::storage::sqlite::makeSqliteFileRepository(dbPath) };
    expectSameRecord(reopened->loadFile("persist"), record);
}

TEST(SqliteFileRepository, StoreReplacesExistingId)
{
    const chunkvault::test_utils::ScopedTempDir tmp{ "sqlite_files_upsert_" };
    ASSERT_TRUE(tmp.valid());
    const auto& dir{ tmp.path() };

    auto repo{ chunkvault::storage::sqlite::makeSqliteFileRepository(dir / "catalog.db") };
    repo->storeFile(makeRecord("same", 1U));

    auto updated{ makeRecord("same", 2U) };
    updated.fileName = "renamed.txt";
    updated.manifest.clear();
    repo->storeFile(updated);

    const auto all{ repo->listFiles() };
    ASSERT_EQ(all.size(), 1U);
    expectSameRecord(all[0], updated);
}

TEST(SqliteFileRepository, ListIsOrderedByCreationThenId)
{
    const chunkvault::test_utils::ScopedTempDir tmp{ "sqlite_files_list_" };
    ASSERT_TRUE(tmp.valid());
    const auto& dir{ tmp.path() };

    auto repo{ chunkvault::storage::sqlite::makeSqliteFileRepository(dir / "catalog.db") };
    EXPECT_TRUE(repo->listFiles().empty());

    repo->storeFile(makeRecord("zz", 10U));
    repo->storeFile(makeRecord("bb", 20U));
    repo->storeFile(makeRecord("aa", 20U));
    repo->storeFile(makeRecord("cc", 5U));

    const auto all{ repo->listFiles() };
    ASSERT_EQ(all.size(), 4U);
    EXPECT_EQ(all[0].fileId, "cc");
    EXPECT_EQ(all[1].fileId, "zz");
    EXPECT_EQ(all[2].fileId, "aa");
    EXPECT_EQ(all[3].fileId, "bb");
}

TEST(SqliteFileRepository, DeleteReportsWhetherARowWasRemoved)
{
    const chunkvault::test_utils::ScopedTempDir tmp{ "sqlite_files_delete_" };
    ASSERT_TRUE(tmp.valid());
    const auto& dir{ tmp.path() };

    auto repo{ chunkvault::storage::sqlite::makeSqliteFileRepository(dir / "catalog.db") };
    repo->storeFile(makeRecord("k1", 1U));
    repo->storeFile(makeRecord("k2", 2U));

    EXPECT_TRUE(repo->deleteFile("k1"));
    EXPECT_FALSE(repo->deleteFile("k1"));
    EXPECT_FALSE(repo->fileExists("k1"));
    EXPECT_TRUE(repo->fileExists("k2"));
    EXPECT_EQ(repo->listFiles().size(), 1U);
}

TEST(SqliteFileRepository, LoadThrowsFileNotFoundForUnknownId)
{
    const chunkvault::test_utils::ScopedTempDir tmp{ "sqlite_files_missing_" };
    ASSERT_TRUE(tmp.valid());
    const auto& dir{ tmp.path() };

    auto repo{ chunkvault::storage::sqlite::makeSqliteFileRepository(dir / "catalog.db") };
    EXPECT_THROW((void)repo->loadFile("nope"), chunkvault::storage::FileNotFound);
    EXPECT_FALSE(repo->fileExists("nope"));
}

TEST(SqliteFileRepository, StoreRejectsEmptyId)
{
    const chunkvault::test_utils::ScopedTempDir tmp{ "sqlite_files_emptyid_" };
    ASSERT_TRUE(tmp.valid());
    const auto& dir{ tmp.path() };

    auto repo{ chunkvault::storage::sqlite::makeSqliteFileRepository(dir / "catalog.db") };
    EXPECT_THROW(repo->storeFile(makeRecord("", 1U)), std::invalid_argument);
}

TEST(SqliteFileRepository, OpenFailsWhenParentDirectoryIsMissing)
{
    const chunkvault::test_utils::ScopedTempDir tmp{ "sqlite_files_noparent_" };
    ASSERT_TRUE(tmp.valid());
    const auto& dir{ tmp.path() };

    EXPECT_THROW((void)chunkvault::storage::sqlite::makeSqliteFileRepository(dir / "missing" / "catalog.db"),
                 std::runtime_error);
}

TEST(SqliteFileRepository, OpenFailsOnNonDatabaseFile)
{
    const chunkvault::test_utils::ScopedTempDir tmp{ "sqlite_files_garbage_" };
    ASSERT_TRUE(tmp.valid());
    const auto& dir{ tmp.path() };

    const auto dbPath{ dir / "catalog.db" };
    {
        std::ofstream out{ dbPath, std::ios::binary | std::ios::trunc };
        ASSERT_TRUE(static_cast<bool>(out));
        const std::string garbage(4096U, 'x');
        out.write(garbage.data(), static_cast<std::streamsize>(garbage.size()));
    }

    EXPECT_THROW((void)chunkvault::storage::sqlite::makeSqliteFileRepository(dbPath), std::runtime_error);
}
