// ZKVOTE - Database Tests
// Copyright (c) 2024 ZKVOTE Developers
// MIT License

#include <gtest/gtest.h>
#include "zkvote/db/database.h"
#include "zkvote/db/leveldb.h"
#include "zkvote/db/memory.h"
#include <filesystem>
#include <random>

using namespace zkvote;
using namespace zkvote::db;

// ============================================================================
// Test Utilities
// ============================================================================

class DatabaseTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;

    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        testDir_ = std::filesystem::temp_directory_path() /
                   ("zkvote_db_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }

    std::unique_ptr<Database> OpenLevelDB(const std::string& name = "db") {
        Options opts;
        opts.block_cache_size = 1024 * 1024;
        auto [status, db] = OpenDatabase(testDir_ / name, opts);
        EXPECT_TRUE(status.ok()) << status.ToString();
        return std::move(db);
    }
};

// ============================================================================
// LevelDB Backend
// ============================================================================

TEST_F(DatabaseTest, OpenAndClose) {
    auto db = OpenLevelDB();
    ASSERT_TRUE(db != nullptr);
    EXPECT_TRUE(std::filesystem::exists(testDir_ / "db"));
    db.reset();

    EXPECT_TRUE(DestroyDatabase(testDir_ / "db").ok());
}

TEST_F(DatabaseTest, ErrorIfExists) {
    ASSERT_TRUE(OpenLevelDB() != nullptr);

    Options opts;
    opts.error_if_exists = true;
    auto [status, db] = OpenDatabase(testDir_ / "db", opts);
    EXPECT_FALSE(status.ok());
    EXPECT_TRUE(db == nullptr);
}

TEST_F(DatabaseTest, PutGetDelete) {
    auto db = OpenLevelDB();
    ASSERT_TRUE(db != nullptr);

    ASSERT_TRUE(db->Put("P1", "proposal").ok());
    std::string value;
    ASSERT_TRUE(db->Get("P1", &value).ok());
    EXPECT_EQ(value, "proposal");
    EXPECT_TRUE(db->Exists("P1"));

    EXPECT_TRUE(db->Get("P2", &value).IsNotFound());

    ASSERT_TRUE(db->Delete("P1").ok());
    EXPECT_TRUE(db->Get("P1", &value).IsNotFound());
    EXPECT_FALSE(db->Exists("P1"));
}

TEST_F(DatabaseTest, WriteBatchIsAtomicUnit) {
    auto db = OpenLevelDB();
    ASSERT_TRUE(db != nullptr);
    ASSERT_TRUE(db->Put("old", "x").ok());

    WriteBatch batch;
    batch.Put("a", "1");
    batch.Put("b", "2");
    batch.Delete("old");
    EXPECT_EQ(batch.Count(), 3u);

    WriteOptions sync;
    sync.sync = true;
    ASSERT_TRUE(db->Write(sync, &batch).ok());

    std::string value;
    EXPECT_TRUE(db->Get("a", &value).ok());
    EXPECT_EQ(value, "1");
    EXPECT_TRUE(db->Get("b", &value).ok());
    EXPECT_FALSE(db->Exists("old"));

    batch.Clear();
    EXPECT_TRUE(batch.Empty());
}

TEST_F(DatabaseTest, IteratorOrderAndSeek) {
    auto db = OpenLevelDB();
    ASSERT_TRUE(db != nullptr);
    for (const char* key : {"V2", "P1", "V1", "R1", "P2"}) {
        ASSERT_TRUE(db->Put(key, key).ok());
    }

    auto it = db->NewIterator();
    std::vector<std::string> keys;
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        keys.push_back(it->key().ToString());
    }
    EXPECT_TRUE(it->status().ok());
    EXPECT_EQ(keys, (std::vector<std::string>{"P1", "P2", "R1", "V1", "V2"}));

    it->Seek("Q");
    ASSERT_TRUE(it->Valid());
    EXPECT_EQ(it->key().ToString(), "R1");
    EXPECT_EQ(it->value().ToString(), "R1");
}

TEST_F(DatabaseTest, DataSurvivesReopen) {
    {
        auto db = OpenLevelDB();
        ASSERT_TRUE(db != nullptr);
        WriteBatch batch;
        batch.Put("key", "persisted");
        ASSERT_TRUE(db->Write(&batch).ok());
    }
    auto db = OpenLevelDB();
    ASSERT_TRUE(db != nullptr);
    std::string value;
    ASSERT_TRUE(db->Get("key", &value).ok());
    EXPECT_EQ(value, "persisted");
}

TEST_F(DatabaseTest, BinaryKeysAndValues) {
    auto db = OpenLevelDB();
    ASSERT_TRUE(db != nullptr);

    std::string key("V\0\0\x01", 4);
    std::string value("\0\xff\0", 3);
    ASSERT_TRUE(db->Put(key, value).ok());

    std::string out;
    ASSERT_TRUE(db->Get(key, &out).ok());
    EXPECT_EQ(out, value);
    EXPECT_FALSE(db->Exists(std::string("V\0\0\x02", 4)));
}

// ============================================================================
// Memory Backend
// ============================================================================

TEST_F(DatabaseTest, MemoryDatabaseBasic) {
    MemoryDatabase db;
    ASSERT_TRUE(db.Put("k", "v").ok());
    EXPECT_EQ(db.Size(), 1u);

    std::string value;
    ASSERT_TRUE(db.Get("k", &value).ok());
    EXPECT_EQ(value, "v");

    ASSERT_TRUE(db.Delete("k").ok());
    EXPECT_TRUE(db.Get("k", &value).IsNotFound());

    ASSERT_TRUE(db.Put("k", "v").ok());
    db.Clear();
    EXPECT_EQ(db.Size(), 0u);
}

TEST_F(DatabaseTest, MemoryIteratorIsSnapshot) {
    MemoryDatabase db;
    ASSERT_TRUE(db.Put("b", "2").ok());
    ASSERT_TRUE(db.Put("a", "1").ok());

    auto it = db.NewIterator();
    ASSERT_TRUE(db.Put("c", "3").ok());

    std::vector<std::string> keys;
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        keys.push_back(it->key().ToString());
    }
    EXPECT_EQ(keys, (std::vector<std::string>{"a", "b"}));

    it->Seek("b");
    ASSERT_TRUE(it->Valid());
    EXPECT_EQ(it->value().ToString(), "2");
    it->Seek("z");
    EXPECT_FALSE(it->Valid());
}

TEST_F(DatabaseTest, MemoryFailWritesRejectsWholeBatch) {
    MemoryDatabase db;
    WriteBatch batch;
    batch.Put("a", "1");
    batch.Put("b", "2");

    db.FailWrites(Status::IOError("disk full"));
    Status s = db.Write(&batch);
    EXPECT_TRUE(s.IsIOError());
    EXPECT_EQ(s.message(), "disk full");
    EXPECT_EQ(db.Size(), 0u);

    db.FailWrites(std::nullopt);
    ASSERT_TRUE(db.Write(&batch).ok());
    EXPECT_EQ(db.Size(), 2u);
}

// ============================================================================
// Serialization Helpers
// ============================================================================

TEST_F(DatabaseTest, SerializeDeserialize) {
    std::string title = "Adopt the new charter";
    std::string encoded = SerializeToString(title);

    std::string decoded;
    ASSERT_TRUE(DeserializeFromString(encoded, decoded));
    EXPECT_EQ(decoded, title);

    // Trailing bytes and truncation are both rejected
    EXPECT_FALSE(DeserializeFromString(encoded + "x", decoded));
    EXPECT_FALSE(DeserializeFromString(encoded.substr(0, encoded.size() - 1), decoded));
}

// ============================================================================
// Status and Slice
// ============================================================================

TEST_F(DatabaseTest, StatusCodes) {
    EXPECT_TRUE(Status::Ok().ok());
    EXPECT_TRUE(Status::NotFound().IsNotFound());
    EXPECT_TRUE(Status::Corruption("bad").IsCorruption());
    EXPECT_TRUE(Status::IOError("io").IsIOError());
    EXPECT_EQ(Status::InvalidArgument().code(), Status::INVALID_ARGUMENT);

    EXPECT_EQ(Status::Ok().ToString(), "OK");
    EXPECT_EQ(Status::NotFound("proposal 3").ToString(), "NotFound: proposal 3");
    EXPECT_EQ(Status::IOError("disk full").ToString(), "IOError: disk full");
}

TEST_F(DatabaseTest, SliceCompare) {
    Slice a("abc");
    Slice b("abd");
    Slice prefix("ab");

    EXPECT_LT(a.compare(b), 0);
    EXPECT_GT(b.compare(a), 0);
    EXPECT_EQ(a.compare(Slice(std::string("abc"))), 0);
    EXPECT_LT(prefix.compare(a), 0);
    EXPECT_TRUE(a.starts_with(prefix));
    EXPECT_FALSE(prefix.starts_with(a));
    EXPECT_TRUE(Slice().empty());
    EXPECT_EQ(a[1], 'b');
}
