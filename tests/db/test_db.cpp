// ZKDROP - Database Tests
// Copyright (c) 2024 ZKDROP Developers
// MIT License

#include <gtest/gtest.h>
#include "zkdrop/db/database.h"
#include "zkdrop/db/leveldb.h"

#include <filesystem>
#include <random>
#include <vector>

using namespace zkdrop;
using namespace zkdrop::db;

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
                   ("zkdrop_db_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }
    
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }
    
    std::unique_ptr<Database> OpenLevelDB(const std::string& name = "test_db") {
        Options opts;
        opts.create_if_missing = true;
        auto [status, db] = OpenDatabase(testDir_ / name, opts);
        EXPECT_TRUE(status.ok()) << status.ToString();
        return std::move(db);
    }
    
    /// Both backends, so behaviour shared by the interface is checked twice
    std::vector<std::unique_ptr<Database>> OpenBoth() {
        std::vector<std::unique_ptr<Database>> dbs;
        dbs.push_back(OpenLevelDB());
        dbs.push_back(OpenMemoryDatabase());
        return dbs;
    }
};

// ============================================================================
// Basic Database Tests
// ============================================================================

TEST_F(DatabaseTest, OpenAndClose) {
    auto db = OpenLevelDB();
    ASSERT_NE(db, nullptr);
    EXPECT_EQ(db->Name(), "leveldb");
    EXPECT_EQ(OpenMemoryDatabase()->Name(), "memory");
}

TEST_F(DatabaseTest, PutAndGet) {
    for (auto& db : OpenBoth()) {
        ASSERT_NE(db, nullptr);
        ASSERT_TRUE(db->Put(Slice("key1"), Slice("value1")).ok());
        
        std::string value;
        Status s = db->Get(Slice("key1"), &value);
        ASSERT_TRUE(s.ok()) << db->Name();
        EXPECT_EQ(value, "value1");
    }
}

TEST_F(DatabaseTest, GetNotFound) {
    for (auto& db : OpenBoth()) {
        ASSERT_NE(db, nullptr);
        std::string value;
        EXPECT_TRUE(db->Get(Slice("nonexistent"), &value).IsNotFound()) << db->Name();
    }
}

TEST_F(DatabaseTest, Delete) {
    for (auto& db : OpenBoth()) {
        ASSERT_NE(db, nullptr);
        ASSERT_TRUE(db->Put(Slice("key1"), Slice("value1")).ok());
        ASSERT_TRUE(db->Delete(Slice("key1")).ok());
        
        std::string value;
        EXPECT_TRUE(db->Get(Slice("key1"), &value).IsNotFound()) << db->Name();
        
        // Deleting a missing key is not an error
        EXPECT_TRUE(db->Delete(Slice("key1")).ok());
    }
}

TEST_F(DatabaseTest, EmptyValueIsStored) {
    for (auto& db : OpenBoth()) {
        ASSERT_NE(db, nullptr);
        ASSERT_TRUE(db->Put(Slice("marker"), Slice()).ok());
        EXPECT_TRUE(db->Exists(Slice("marker"))) << db->Name();
    }
}

TEST_F(DatabaseTest, WriteBatch) {
    for (auto& db : OpenBoth()) {
        ASSERT_NE(db, nullptr);
        
        db::WriteBatch batch;
        batch.Put(Slice("key1"), Slice("value1"));
        batch.Put(Slice("key2"), Slice("value2"));
        batch.Put(Slice("key3"), Slice("value3"));
        batch.Delete(Slice("key2"));  // later operations win
        EXPECT_EQ(batch.Count(), 4u);
        
        ASSERT_TRUE(db->Write(&batch).ok());
        
        std::string value;
        ASSERT_TRUE(db->Get(Slice("key1"), &value).ok());
        EXPECT_EQ(value, "value1");
        EXPECT_TRUE(db->Get(Slice("key2"), &value).IsNotFound());
        ASSERT_TRUE(db->Get(Slice("key3"), &value).ok());
        EXPECT_EQ(value, "value3");
    }
}

TEST_F(DatabaseTest, IteratorVisitsKeysInOrder) {
    for (auto& db : OpenBoth()) {
        ASSERT_NE(db, nullptr);
        db->Put(Slice("c"), Slice("3"));
        db->Put(Slice("a"), Slice("1"));
        db->Put(Slice("b"), Slice("2"));
        
        std::string keys;
        auto iter = db->NewIterator();
        for (iter->SeekToFirst(); iter->Valid(); iter->Next()) {
            keys += iter->key().ToString();
        }
        EXPECT_EQ(keys, "abc") << db->Name();
        EXPECT_TRUE(iter->status().ok());
    }
}

TEST_F(DatabaseTest, IteratorSeekWithPrefix) {
    for (auto& db : OpenBoth()) {
        ASSERT_NE(db, nullptr);
        db->Put(MakeKey(prefix::AIRDROP, Slice("1")), Slice("x"));
        db->Put(MakeKey(prefix::AIRDROP, Slice("2")), Slice("y"));
        db->Put(MakeKey(prefix::NULLIFIER, Slice("1")), Slice(""));
        db->Put(MakeKey(prefix::COUNTER), Slice("3"));
        
        const std::string start = MakeKey(prefix::AIRDROP);
        int count = 0;
        auto iter = db->NewIterator();
        for (iter->Seek(start); iter->Valid() && iter->key().starts_with(start); iter->Next()) {
            ++count;
        }
        EXPECT_EQ(count, 2) << db->Name();
    }
}

TEST_F(DatabaseTest, LevelDBPersistsAcrossReopen) {
    {
        auto db = OpenLevelDB("persist");
        ASSERT_NE(db, nullptr);
        ASSERT_TRUE(db->Put(Slice("durable"), Slice("yes")).ok());
    }
    
    auto db = OpenLevelDB("persist");
    ASSERT_NE(db, nullptr);
    std::string value;
    ASSERT_TRUE(db->Get(Slice("durable"), &value).ok());
    EXPECT_EQ(value, "yes");
}

TEST_F(DatabaseTest, DestroyDatabaseRemovesData) {
    {
        auto db = OpenLevelDB("doomed");
        ASSERT_NE(db, nullptr);
        db->Put(Slice("k"), Slice("v"));
    }
    ASSERT_TRUE(DestroyDatabase(testDir_ / "doomed").ok());
    
    auto db = OpenLevelDB("doomed");
    ASSERT_NE(db, nullptr);
    EXPECT_FALSE(db->Exists(Slice("k")));
}

TEST_F(DatabaseTest, OpenWithoutCreateFailsOnMissingPath) {
    Options opts;
    opts.create_if_missing = false;
    auto [status, db] = OpenDatabase(testDir_ / "missing", opts);
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(db, nullptr);
}

// ============================================================================
// Memory Database Tests
// ============================================================================

TEST_F(DatabaseTest, MemoryDatabaseSize) {
    MemoryDatabase db;
    EXPECT_EQ(db.Size(), 0u);
    db.Put(WriteOptions(), Slice("key"), Slice("value"));
    db.Put(Slice("key2"), Slice("value"));
    EXPECT_EQ(db.Size(), 2u);
    db.Delete(Slice("key"));
    EXPECT_EQ(db.Size(), 1u);
}

TEST_F(DatabaseTest, MemoryIteratorIsSnapshot) {
    MemoryDatabase db;
    db.Put(Slice("a"), Slice("1"));
    auto iter = db.NewIterator();
    db.Put(Slice("b"), Slice("2"));
    
    int count = 0;
    for (iter->SeekToFirst(); iter->Valid(); iter->Next()) {
        ++count;
    }
    EXPECT_EQ(count, 1);
}

// ============================================================================
// Key Tests
// ============================================================================

TEST_F(DatabaseTest, MakeKey) {
    std::string key1 = MakeKey(prefix::COUNTER);
    EXPECT_EQ(key1.size(), 1u);
    EXPECT_EQ(key1[0], prefix::COUNTER);
    
    std::string key2 = MakeKey(prefix::AIRDROP, Slice("test"));
    EXPECT_EQ(key2[0], prefix::AIRDROP);
    EXPECT_EQ(key2.substr(1), "test");
    
    std::array<Byte, 4> raw = {0x00, 0x01, 0xfe, 0xff};
    std::string key3 = MakeKey(prefix::NULLIFIER, raw);
    ASSERT_EQ(key3.size(), 5u);
    EXPECT_EQ(static_cast<Byte>(key3[1]), 0x00);
    EXPECT_EQ(static_cast<Byte>(key3[4]), 0xff);
}

// ============================================================================
// Status Tests
// ============================================================================

TEST_F(DatabaseTest, StatusOk) {
    Status s = Status::Ok();
    EXPECT_TRUE(s.ok());
    EXPECT_FALSE(s.IsNotFound());
    EXPECT_FALSE(s.IsCorruption());
    EXPECT_FALSE(s.IsIOError());
    EXPECT_EQ(s.ToString(), "OK");
}

TEST_F(DatabaseTest, StatusNotFound) {
    Status s = Status::NotFound("key not found");
    EXPECT_FALSE(s.ok());
    EXPECT_TRUE(s.IsNotFound());
    EXPECT_EQ(s.message(), "key not found");
}

TEST_F(DatabaseTest, StatusToString) {
    Status s = Status::Corruption("bad record");
    EXPECT_TRUE(s.IsCorruption());
    EXPECT_EQ(s.ToString(), "Corruption: bad record");
    EXPECT_EQ(Status::IOError("disk full").ToString(), "IOError: disk full");
}

// ============================================================================
// Slice Tests
// ============================================================================

TEST_F(DatabaseTest, SliceBasic) {
    std::string data = "hello world";
    Slice slice(data);
    
    EXPECT_EQ(slice.size(), data.size());
    EXPECT_EQ(slice.ToString(), data);
    EXPECT_FALSE(slice.empty());
    EXPECT_TRUE(slice.starts_with(Slice("hello")));
    EXPECT_FALSE(slice.starts_with(Slice("world")));
}

TEST_F(DatabaseTest, SliceEquality) {
    EXPECT_TRUE(Slice("abc") == Slice("abc"));
    EXPECT_TRUE(Slice("abc") != Slice("abd"));
    EXPECT_TRUE(Slice().empty());
    EXPECT_EQ(Slice().size(), 0u);
}
