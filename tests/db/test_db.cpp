// LIQUIDSTAKE - Database Tests
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include <gtest/gtest.h>
#include "liquidstake/db/database.h"
#include "liquidstake/db/leveldb.h"
#include "liquidstake/db/memorydb.h"
#include <filesystem>
#include <random>
#include <utility>
#include <vector>

using namespace liquidstake::db;

namespace {

using Entries = std::vector<std::pair<std::string, std::string>>;

Entries Scan(Database& db, const std::string& prefix) {
    Entries seen;
    Status status = db.ScanPrefix(prefix, [&seen](const std::string& key,
                                                  const std::string& value) {
        seen.emplace_back(key, value);
        return true;
    });
    EXPECT_TRUE(status.ok()) << status.ToString();
    return seen;
}

} // namespace

// ============================================================================
// LevelDB
// ============================================================================

class LevelDBTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        std::mt19937 gen(std::random_device{}());
        dir_ = std::filesystem::temp_directory_path() /
               ("liquidstake_db_test_" + std::to_string(gen() % 1000000));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::unique_ptr<LevelDBDatabase> Open(const OpenOptions& options = OpenOptions()) {
        std::unique_ptr<LevelDBDatabase> db;
        Status status = LevelDBDatabase::Open(dir_ / "state", options, &db);
        EXPECT_TRUE(status.ok()) << status.ToString();
        return db;
    }
};

TEST_F(LevelDBTest, CreatesDirectory) {
    auto db = Open();
    ASSERT_NE(db, nullptr);
    EXPECT_EQ(db->Name(), "leveldb");
    EXPECT_EQ(db->Path().string(), (dir_ / "state").string());
    EXPECT_TRUE(std::filesystem::is_directory(dir_ / "state"));
}

TEST_F(LevelDBTest, PutGetDelete) {
    auto db = Open();
    ASSERT_NE(db, nullptr);

    ASSERT_TRUE(db->Put("pool", "record").ok());
    std::string value;
    ASSERT_TRUE(db->Get("pool", &value).ok());
    EXPECT_EQ(value, "record");
    EXPECT_TRUE(db->Exists("pool"));

    ASSERT_TRUE(db->Delete("pool").ok());
    EXPECT_TRUE(db->Get("pool", &value).IsNotFound());
    EXPECT_FALSE(db->Exists("pool"));
}

TEST_F(LevelDBTest, BatchAppliesInOrder) {
    auto db = Open();
    ASSERT_NE(db, nullptr);
    ASSERT_TRUE(db->Put("stale", "x").ok());

    WriteBatch batch;
    batch.Put("a", "1");
    batch.Delete("stale");
    batch.Put("b", "2");
    batch.Delete("b");
    batch.Put("a", "3");
    EXPECT_EQ(batch.Count(), 5u);
    ASSERT_TRUE(db->Write(batch, true).ok());

    EXPECT_EQ(Scan(*db, ""), (Entries{{"a", "3"}}));
}

TEST_F(LevelDBTest, ScanStopsAtPrefixBoundary) {
    auto db = Open();
    ASSERT_NE(db, nullptr);

    WriteBatch batch;
    batch.Put(MakeKey(prefix::BALANCE, "bob"), "2");
    batch.Put(MakeKey(prefix::BALANCE, "alice"), "1");
    batch.Put(MakeKey(prefix::DELEGATION, "v1"), "9");
    batch.Put(MakeKey(prefix::POOL), "p");
    ASSERT_TRUE(db->Write(batch).ok());

    EXPECT_EQ(Scan(*db, MakeKey(prefix::BALANCE)),
              (Entries{{"balice", "1"}, {"bbob", "2"}}));
    EXPECT_TRUE(Scan(*db, MakeKey(prefix::LP_POSITION)).empty());

    size_t visited = 0;
    ASSERT_TRUE(db->ScanPrefix("", [&visited](const std::string&, const std::string&) {
        ++visited;
        return false;
    }).ok());
    EXPECT_EQ(visited, 1u);
}

TEST_F(LevelDBTest, DataSurvivesReopen) {
    {
        auto db = Open();
        ASSERT_NE(db, nullptr);
        WriteBatch batch;
        batch.Put(MakeKey(prefix::VERSION), "1");
        ASSERT_TRUE(db->Write(batch, true).ok());
    }

    auto db = Open();
    ASSERT_NE(db, nullptr);
    std::string value;
    ASSERT_TRUE(db->Get(MakeKey(prefix::VERSION), &value).ok());
    EXPECT_EQ(value, "1");
}

TEST_F(LevelDBTest, OpenOptionsAreHonoured) {
    {
        auto db = Open();
        ASSERT_NE(db, nullptr);
    }

    OpenOptions exclusive;
    exclusive.errorIfExists = true;
    std::unique_ptr<LevelDBDatabase> db;
    EXPECT_FALSE(LevelDBDatabase::Open(dir_ / "state", exclusive, &db).ok());
    EXPECT_EQ(db, nullptr);

    OpenOptions existing;
    existing.createIfMissing = false;
    existing.cacheSize = 0;
    EXPECT_FALSE(LevelDBDatabase::Open(dir_ / "absent", existing, &db).ok());
    EXPECT_EQ(db, nullptr);
    EXPECT_TRUE(LevelDBDatabase::Open(dir_ / "state", existing, &db).ok());
    EXPECT_NE(db, nullptr);
}

TEST_F(LevelDBTest, DestroyRemovesData) {
    {
        auto db = Open();
        ASSERT_NE(db, nullptr);
        ASSERT_TRUE(db->Put("k", "v").ok());
    }

    ASSERT_TRUE(LevelDBDatabase::Destroy(dir_ / "state").ok());

    auto db = Open();
    ASSERT_NE(db, nullptr);
    EXPECT_FALSE(db->Exists("k"));
}

// ============================================================================
// Memory Database
// ============================================================================

TEST(MemoryDatabaseTest, PutGetDelete) {
    MemoryDatabase db;
    EXPECT_EQ(db.Name(), "memory");

    ASSERT_TRUE(db.Put("key", "value").ok());
    std::string value;
    ASSERT_TRUE(db.Get("key", &value).ok());
    EXPECT_EQ(value, "value");
    EXPECT_EQ(db.Size(), 1u);

    ASSERT_TRUE(db.Delete("key").ok());
    EXPECT_TRUE(db.Get("key", &value).IsNotFound());
    // Deleting a missing key is not an error
    EXPECT_TRUE(db.Delete("key").ok());
    EXPECT_EQ(db.Size(), 0u);
}

TEST(MemoryDatabaseTest, LaterBatchEntriesWin) {
    MemoryDatabase db;
    ASSERT_TRUE(db.Put("stale", "x").ok());

    WriteBatch batch;
    batch.Put("a", "1");
    batch.Delete("stale");
    batch.Put("a", "2");
    ASSERT_TRUE(db.Write(batch).ok());

    EXPECT_EQ(Scan(db, ""), (Entries{{"a", "2"}}));

    batch.Clear();
    EXPECT_EQ(batch.Count(), 0u);
}

TEST(MemoryDatabaseTest, VisitorMayWriteDuringScan) {
    MemoryDatabase db;
    ASSERT_TRUE(db.Put("la", "1").ok());
    ASSERT_TRUE(db.Put("lb", "2").ok());

    ASSERT_TRUE(db.ScanPrefix("l", [&db](const std::string& key, const std::string&) {
        return db.Delete(key).ok() && db.Put("x" + key, "moved").ok();
    }).ok());

    EXPECT_TRUE(Scan(db, "l").empty());
    EXPECT_EQ(Scan(db, "x"), (Entries{{"xla", "moved"}, {"xlb", "moved"}}));
}

// ============================================================================
// Keys and Status
// ============================================================================

TEST(DatabaseKeyTest, PrefixedKeys) {
    EXPECT_EQ(MakeKey(prefix::POOL), "p");
    EXPECT_EQ(MakeKey(prefix::BALANCE, "abc"), "babc");

    std::string key = MakeKey(prefix::LP_POSITION, std::string("\x00\x01", 2));
    ASSERT_EQ(key.size(), 3u);
    EXPECT_EQ(key[0], 'l');
    EXPECT_EQ(key[1], '\0');
}

TEST(DatabaseStatusTest, ToString) {
    EXPECT_EQ(Status::Ok().ToString(), "OK");
    EXPECT_EQ(Status::NotFound().ToString(), "NotFound");
    EXPECT_EQ(Status::NotFound("pool").ToString(), "NotFound: pool");
    EXPECT_EQ(Status::Corruption("bad").ToString(), "Corruption: bad");
    EXPECT_EQ(Status::IOError("disk").code(), Status::IO_ERROR);
    EXPECT_EQ(Status::InvalidArgument("x").message(), "x");
}
