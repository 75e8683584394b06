// ZKDROP - LevelDB Wrapper
// Copyright (c) 2024 ZKDROP Developers
// MIT License
//
// LevelDB and in-memory implementations of the database interface.

#ifndef ZKDROP_DB_LEVELDB_H
#define ZKDROP_DB_LEVELDB_H

#include "zkdrop/db/database.h"
#include <map>
#include <mutex>

#include <leveldb/db.h>
#include <leveldb/write_batch.h>
#include <leveldb/cache.h>
#include <leveldb/filter_policy.h>

namespace zkdrop {
namespace db {

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBDatabase : public Database {
public:
    /// Takes ownership of db, cache and filter
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter,
                    const std::filesystem::path& path);
    
    ~LevelDBDatabase() override;
    
    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;
    
    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;
    
    std::string Name() const override { return "leveldb"; }
    
    const std::filesystem::path& GetPath() const { return path_; }
    
    /// Convert a LevelDB status to ours
    static Status ConvertStatus(const leveldb::Status& s);

private:
    std::unique_ptr<leveldb::DB> db_;
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filterPolicy_;
    std::filesystem::path path_;
};

// ============================================================================
// In-Memory Database
// ============================================================================

/**
 * Ordered in-memory store. Used by tests and when the service runs without
 * a data directory.
 */
class MemoryDatabase : public Database {
public:
    MemoryDatabase() = default;
    
    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;
    
    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    
    /// Iterates over a snapshot taken at creation
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;
    
    std::string Name() const override { return "memory"; }
    
    size_t Size() const;

private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
};

} // namespace db
} // namespace zkdrop

#endif // ZKDROP_DB_LEVELDB_H
