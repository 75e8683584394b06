// ZKDROP - Database Abstraction Layer
// Copyright (c) 2024 ZKDROP Developers
// MIT License
//
// Abstract key-value store used to persist airdrop records, consumed
// nullifiers and the identifier counter.

#ifndef ZKDROP_DB_DATABASE_H
#define ZKDROP_DB_DATABASE_H

#include "zkdrop/core/types.h"
#include "zkdrop/core/serialize.h"
#include <cstdint>
#include <array>
#include <cstring>
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <filesystem>

namespace zkdrop {
namespace db {

// ============================================================================
// Database Status - Result of database operations
// ============================================================================

/**
 * Status returned by database operations.
 */
class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND = 1,
        CORRUPTION = 2,
        NOT_SUPPORTED = 3,
        INVALID_ARGUMENT = 4,
        IO_ERROR = 5,
    };
    
    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}
    
    static Status Ok() { return Status(); }
    static Status NotFound(const std::string& msg = "") { return Status(NOT_FOUND, msg); }
    static Status Corruption(const std::string& msg = "") { return Status(CORRUPTION, msg); }
    static Status NotSupported(const std::string& msg = "") { return Status(NOT_SUPPORTED, msg); }
    static Status InvalidArgument(const std::string& msg = "") { return Status(INVALID_ARGUMENT, msg); }
    static Status IOError(const std::string& msg = "") { return Status(IO_ERROR, msg); }
    
    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsCorruption() const { return code_ == CORRUPTION; }
    bool IsIOError() const { return code_ == IO_ERROR; }
    
    Code code() const { return code_; }
    const std::string& message() const { return message_; }
    
    std::string ToString() const;

private:
    Code code_;
    std::string message_;
};

// ============================================================================
// Slice - A reference to a byte range
// ============================================================================

/**
 * Non-owning view of a byte range. The underlying buffer must outlive it.
 */
class Slice {
public:
    Slice() : data_(""), size_(0) {}
    Slice(const char* d, size_t n) : data_(d), size_(n) {}
    Slice(const std::string& s) : data_(s.data()), size_(s.size()) {}
    Slice(const char* s) : data_(s), size_(std::strlen(s)) {}
    
    const char* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    
    char operator[](size_t n) const { return data_[n]; }
    
    std::string ToString() const { return std::string(data_, size_); }
    
    bool starts_with(const Slice& x) const {
        return size_ >= x.size_ && std::memcmp(data_, x.data_, x.size_) == 0;
    }
    
    bool operator==(const Slice& b) const {
        return size_ == b.size_ && std::memcmp(data_, b.data_, size_) == 0;
    }
    
    bool operator!=(const Slice& b) const { return !(*this == b); }

private:
    const char* data_;
    size_t size_;
};

// ============================================================================
// Database Options
// ============================================================================

struct Options {
    /// Create the database if it doesn't exist
    bool create_if_missing = true;
    
    /// Fail if the database already exists
    bool error_if_exists = false;
    
    bool paranoid_checks = false;
    
    /// Write buffer size (default 4MB)
    size_t write_buffer_size = 4 * 1024 * 1024;
    
    int max_open_files = 1000;
    
    /// LRU cache size for blocks (default 8MB)
    size_t block_cache_size = 8 * 1024 * 1024;
    
    /// Bloom filter bits per key (0 to disable)
    int bloom_filter_bits = 10;
};

struct ReadOptions {
    bool verify_checksums = false;
    bool fill_cache = true;
};

struct WriteOptions {
    /// Sync write to disk before returning
    bool sync = false;
};

// ============================================================================
// WriteBatch - Atomic batch of write operations
// ============================================================================

class WriteBatch {
public:
    WriteBatch() = default;
    
    void Put(const Slice& key, const Slice& value) {
        operations_.emplace_back(key.ToString(), value.ToString());
    }
    
    void Delete(const Slice& key) {
        operations_.emplace_back(key.ToString(), std::nullopt);
    }
    
    void Clear() { operations_.clear(); }
    
    size_t Count() const { return operations_.size(); }
    
    bool Empty() const { return operations_.empty(); }
    
    /// Visit operations in insertion order; a nullopt value is a delete
    template<typename Func>
    void Iterate(Func&& func) const {
        for (const auto& [key, value] : operations_) {
            func(key, value);
        }
    }

private:
    std::vector<std::pair<std::string, std::optional<std::string>>> operations_;
};

// ============================================================================
// Iterator - Database iterator interface
// ============================================================================

class Iterator {
public:
    virtual ~Iterator() = default;
    
    virtual bool Valid() const = 0;
    
    virtual void SeekToFirst() = 0;
    
    /// Seek to the first key >= target
    virtual void Seek(const Slice& target) = 0;
    
    virtual void Next() = 0;
    
    virtual Slice key() const = 0;
    
    virtual Slice value() const = 0;
    
    virtual Status status() const = 0;
};

// ============================================================================
// Database - Abstract database interface
// ============================================================================

/**
 * Abstract interface for a key-value database.
 */
class Database {
public:
    virtual ~Database() = default;
    
    virtual Status Get(const ReadOptions& options, const Slice& key, std::string* value) = 0;
    
    Status Get(const Slice& key, std::string* value) {
        return Get(ReadOptions(), key, value);
    }
    
    virtual Status Put(const WriteOptions& options, const Slice& key, const Slice& value) = 0;
    
    Status Put(const Slice& key, const Slice& value) {
        return Put(WriteOptions(), key, value);
    }
    
    virtual Status Delete(const WriteOptions& options, const Slice& key) = 0;
    
    Status Delete(const Slice& key) {
        return Delete(WriteOptions(), key);
    }
    
    /// Apply a batch of writes atomically
    virtual Status Write(const WriteOptions& options, WriteBatch* batch) = 0;
    
    Status Write(WriteBatch* batch) {
        return Write(WriteOptions(), batch);
    }
    
    virtual std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) = 0;
    
    std::unique_ptr<Iterator> NewIterator() {
        return NewIterator(ReadOptions());
    }
    
    virtual bool Exists(const Slice& key) {
        std::string value;
        return Get(key, &value).ok();
    }
    
    /// Backend name for logs ("leveldb", "memory")
    virtual std::string Name() const = 0;
};

// ============================================================================
// Database Factory Functions
// ============================================================================

/**
 * Open a LevelDB database at the specified path.
 * @param path Path to the database directory
 * @param options Database options
 * @return Pair of (status, database pointer)
 */
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

/// Create an empty in-memory database
std::unique_ptr<Database> OpenMemoryDatabase();

/// Delete all data of the LevelDB database at path
Status DestroyDatabase(const std::filesystem::path& path);

// ============================================================================
// Key Prefixes for Database Namespacing
// ============================================================================

namespace prefix {
    constexpr char AIRDROP = 'a';         // airdrop id -> airdrop record
    constexpr char NULLIFIER = 'n';       // nullifier hash -> (empty)
    constexpr char COUNTER = 'C';         // -> next airdrop id
    constexpr char VERSION = 'V';         // -> schema version
}

/**
 * Create a prefixed database key.
 */
inline std::string MakeKey(char prefix, const Slice& key) {
    std::string result;
    result.reserve(1 + key.size());
    result.push_back(prefix);
    result.append(key.data(), key.size());
    return result;
}

inline std::string MakeKey(char prefix) {
    return std::string(1, prefix);
}

/// Key for fixed-width data; bytes are copied as-is so keys sort bytewise
template<size_t N>
std::string MakeKey(char prefix, const std::array<Byte, N>& bytes) {
    std::string result(1, prefix);
    result.append(reinterpret_cast<const char*>(bytes.data()), N);
    return result;
}

} // namespace db
} // namespace zkdrop

#endif // ZKDROP_DB_DATABASE_H
