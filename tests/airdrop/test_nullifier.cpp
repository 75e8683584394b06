// ZKDROP - Nullifier Ledger Tests
// Copyright (c) 2024 ZKDROP Developers
// MIT License

#include <gtest/gtest.h>

#include <zkdrop/airdrop/nullifier.h>
#include <zkdrop/db/database.h>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

namespace zkdrop {
namespace airdrop {
namespace {

/// Memory database whose writes can be made to fail
class FlakyDatabase : public db::Database {
public:
    FlakyDatabase() : inner_(db::OpenMemoryDatabase()) {}

    using db::Database::Get;
    using db::Database::Put;
    using db::Database::Delete;
    using db::Database::Write;
    using db::Database::NewIterator;

    db::Status Get(const db::ReadOptions& options, const db::Slice& key,
                   std::string* value) override {
        return inner_->Get(options, key, value);
    }

    db::Status Put(const db::WriteOptions& options, const db::Slice& key,
                   const db::Slice& value) override {
        if (failPuts) return db::Status::IOError("injected put failure");
        return inner_->Put(options, key, value);
    }

    db::Status Delete(const db::WriteOptions& options, const db::Slice& key) override {
        if (failDeletes) return db::Status::IOError("injected delete failure");
        return inner_->Delete(options, key);
    }

    db::Status Write(const db::WriteOptions& options, db::WriteBatch* batch) override {
        return inner_->Write(options, batch);
    }

    std::unique_ptr<db::Iterator> NewIterator(const db::ReadOptions& options) override {
        return inner_->NewIterator(options);
    }

    std::string Name() const override { return "flaky"; }

    bool failPuts{false};
    bool failDeletes{false};

private:
    std::unique_ptr<db::Database> inner_;
};

// ============================================================================
// Nullifier Ledger Tests
// ============================================================================

class NullifierTest : public ::testing::Test {
protected:
    NullifierHash n1_{FieldElement(1)};
    NullifierHash n2_{FieldElement(2)};
};

TEST_F(NullifierTest, FreshLedgerIsEmpty) {
    NullifierLedger ledger;
    EXPECT_EQ(ledger.Size(), 0u);
    EXPECT_FALSE(ledger.IsUsed(n1_));
    EXPECT_FALSE(ledger.IsUsed(NullifierHash()));
}

TEST_F(NullifierTest, MarkUsed) {
    NullifierLedger ledger;
    ASSERT_TRUE(ledger.MarkUsed(n1_).ok());
    EXPECT_TRUE(ledger.IsUsed(n1_));
    EXPECT_FALSE(ledger.IsUsed(n2_));
    EXPECT_EQ(ledger.Size(), 1u);
}

TEST_F(NullifierTest, MarkUsedTwiceIsLogicError) {
    NullifierLedger ledger;
    ASSERT_TRUE(ledger.MarkUsed(n1_).ok());
    EXPECT_THROW(ledger.MarkUsed(n1_), std::logic_error);
    EXPECT_EQ(ledger.Size(), 1u);
}

TEST_F(NullifierTest, TryMarkUsed) {
    NullifierLedger ledger;
    EXPECT_EQ(ledger.TryMarkUsed(n1_), NullifierLedger::MarkResult::Marked);
    EXPECT_EQ(ledger.TryMarkUsed(n1_), NullifierLedger::MarkResult::AlreadyUsed);
    EXPECT_EQ(ledger.TryMarkUsed(n2_), NullifierLedger::MarkResult::Marked);
    EXPECT_EQ(ledger.Size(), 2u);
}

TEST_F(NullifierTest, ZeroIsAnOrdinaryNullifier) {
    NullifierLedger ledger;
    EXPECT_EQ(ledger.TryMarkUsed(NullifierHash()), NullifierLedger::MarkResult::Marked);
    EXPECT_TRUE(ledger.IsUsed(NullifierHash()));
}

TEST_F(NullifierTest, Release) {
    NullifierLedger ledger;
    ASSERT_EQ(ledger.TryMarkUsed(n1_), NullifierLedger::MarkResult::Marked);
    ASSERT_TRUE(ledger.Release(n1_).ok());
    EXPECT_FALSE(ledger.IsUsed(n1_));
    EXPECT_EQ(ledger.Size(), 0u);

    EXPECT_EQ(ledger.TryMarkUsed(n1_), NullifierLedger::MarkResult::Marked);
}

TEST_F(NullifierTest, ReleaseUnknownIsNotFound) {
    NullifierLedger ledger;
    EXPECT_TRUE(ledger.Release(n1_).IsNotFound());
}

TEST_F(NullifierTest, MarkResultNames) {
    EXPECT_STREQ(MarkResultToString(NullifierLedger::MarkResult::Marked), "Marked");
    EXPECT_STREQ(MarkResultToString(NullifierLedger::MarkResult::AlreadyUsed), "AlreadyUsed");
    EXPECT_STREQ(MarkResultToString(NullifierLedger::MarkResult::StorageError), "StorageError");
}

TEST_F(NullifierTest, ConcurrentMarkHasSingleWinner) {
    NullifierLedger ledger;
    constexpr int kThreads = 16;
    std::atomic<int> winners{0};
    std::atomic<int> losers{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&]() {
            auto result = ledger.TryMarkUsed(n1_);
            if (result == NullifierLedger::MarkResult::Marked) {
                ++winners;
            } else if (result == NullifierLedger::MarkResult::AlreadyUsed) {
                ++losers;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(losers.load(), kThreads - 1);
    EXPECT_EQ(ledger.Size(), 1u);
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(NullifierTest, DbKeyLayout) {
    std::string key = NullifierLedger::MakeDbKey(n2_);
    ASSERT_EQ(key.size(), 33u);
    EXPECT_EQ(key[0], db::prefix::NULLIFIER);
    EXPECT_EQ(key[32], '\x02');
}

TEST_F(NullifierTest, MarksAreWrittenThrough) {
    auto database = db::OpenMemoryDatabase();
    NullifierLedger ledger(database.get());
    ASSERT_TRUE(ledger.Load().ok());

    ASSERT_EQ(ledger.TryMarkUsed(n1_), NullifierLedger::MarkResult::Marked);
    EXPECT_TRUE(database->Exists(NullifierLedger::MakeDbKey(n1_)));

    ASSERT_TRUE(ledger.Release(n1_).ok());
    EXPECT_FALSE(database->Exists(NullifierLedger::MakeDbKey(n1_)));
}

TEST_F(NullifierTest, ReloadFromDatabase) {
    auto database = db::OpenMemoryDatabase();
    {
        NullifierLedger ledger(database.get());
        ASSERT_TRUE(ledger.MarkUsed(n1_).ok());
        ASSERT_TRUE(ledger.MarkUsed(n2_).ok());
    }

    NullifierLedger reloaded(database.get());
    EXPECT_FALSE(reloaded.IsUsed(n1_));
    ASSERT_TRUE(reloaded.Load().ok());
    EXPECT_EQ(reloaded.Size(), 2u);
    EXPECT_TRUE(reloaded.IsUsed(n1_));
    EXPECT_TRUE(reloaded.IsUsed(n2_));
    EXPECT_EQ(reloaded.TryMarkUsed(n1_), NullifierLedger::MarkResult::AlreadyUsed);
}

TEST_F(NullifierTest, LoadIgnoresOtherPrefixes) {
    auto database = db::OpenMemoryDatabase();
    ASSERT_TRUE(database->Put(db::MakeKey(db::prefix::COUNTER), "x").ok());
    ASSERT_TRUE(database->Put(db::MakeKey(db::prefix::AIRDROP, "12345678"), "y").ok());

    NullifierLedger ledger(database.get());
    ASSERT_TRUE(ledger.Load().ok());
    EXPECT_EQ(ledger.Size(), 0u);
}

TEST_F(NullifierTest, LoadRejectsMalformedKey) {
    auto database = db::OpenMemoryDatabase();
    ASSERT_TRUE(database->Put(db::MakeKey(db::prefix::NULLIFIER, "short"), "").ok());

    NullifierLedger ledger(database.get());
    EXPECT_TRUE(ledger.Load().IsCorruption());
}

TEST_F(NullifierTest, LoadRejectsNonCanonicalNullifier) {
    auto database = db::OpenMemoryDatabase();
    std::string key(1, db::prefix::NULLIFIER);
    key.append(32, '\xff');
    ASSERT_TRUE(database->Put(key, "").ok());

    NullifierLedger ledger(database.get());
    EXPECT_TRUE(ledger.Load().IsCorruption());
}

TEST_F(NullifierTest, FailedWriteLeavesNullifierUnused) {
    FlakyDatabase database;
    NullifierLedger ledger(&database);

    database.failPuts = true;
    EXPECT_EQ(ledger.TryMarkUsed(n1_), NullifierLedger::MarkResult::StorageError);
    EXPECT_FALSE(ledger.IsUsed(n1_));
    EXPECT_FALSE(ledger.MarkUsed(n1_).ok());
    EXPECT_FALSE(ledger.IsUsed(n1_));

    database.failPuts = false;
    EXPECT_EQ(ledger.TryMarkUsed(n1_), NullifierLedger::MarkResult::Marked);
}

TEST_F(NullifierTest, FailedReleaseKeepsNullifierSpent) {
    FlakyDatabase database;
    NullifierLedger ledger(&database);
    ASSERT_EQ(ledger.TryMarkUsed(n1_), NullifierLedger::MarkResult::Marked);

    database.failDeletes = true;
    EXPECT_TRUE(ledger.Release(n1_).IsIOError());
    EXPECT_TRUE(ledger.IsUsed(n1_));
    EXPECT_TRUE(database.Exists(NullifierLedger::MakeDbKey(n1_)));
}

} // namespace
} // namespace airdrop
} // namespace zkdrop
