// CHAMA - Database Abstraction Layer
// Copyright (c) 2024 CHAMA Developers
// MIT License
//
// Abstract ordered key-value store used by the event journal, with an
// in-memory implementation. The LevelDB implementation lives in leveldb.h.

#ifndef CHAMA_DB_DATABASE_H
#define CHAMA_DB_DATABASE_H

#include "chama/core/serialize.h"

#include <cstdint>
#include <cstring>
#include <ios>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chama {
namespace db {

// ============================================================================
// Database Status - Result of database operations
// ============================================================================

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

/// Non-owning view; the underlying buffer must outlive the Slice.
class Slice {
public:
    Slice() : data_(nullptr), size_(0) {}
    Slice(const char* d, size_t n) : data_(d), size_(n) {}
    Slice(const std::string& s) : data_(s.data()), size_(s.size()) {}
    Slice(const char* s) : data_(s), size_(std::strlen(s)) {}

    const char* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    std::string ToString() const { return std::string(data_, size_); }

    bool starts_with(const Slice& prefix) const {
        return size_ >= prefix.size_ && std::memcmp(data_, prefix.data_, prefix.size_) == 0;
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
// Options
// ============================================================================

struct Options {
    bool create_if_missing = true;
    bool error_if_exists = false;
    bool paranoid_checks = false;
    size_t write_buffer_size = 4 * 1024 * 1024;
    size_t block_cache_size = 8 * 1024 * 1024;
};

struct ReadOptions {
    bool verify_checksums = false;
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
};

// ============================================================================
// In-Memory Database
// ============================================================================

/// Ordered map store for tests and runs without a data directory.
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

    /// The iterator walks a snapshot taken at creation time
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    size_t Size() const;
    void Clear();

private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Serialization Helpers
// ============================================================================

template<typename T>
std::string SerializeToString(const T& obj) {
    DataStream ss;
    Serialize(ss, obj);
    return std::string(reinterpret_cast<const char*>(ss.data()), ss.size());
}

/// Returns false on truncated or trailing data
template<typename T>
bool DeserializeFromString(const std::string& data, T& obj) {
    try {
        DataStream ss(reinterpret_cast<const uint8_t*>(data.data()), data.size());
        Unserialize(ss, obj);
        return ss.empty();
    } catch (const std::ios_base::failure&) {
        return false;
    }
}

// ============================================================================
// Key Construction
// ============================================================================

namespace prefix {
    constexpr char EVENT = 'e';          // seq (big-endian) -> journal record
    constexpr char JOURNAL_HEAD = 'h';   // -> (next seq, last hash)
}

/// prefix byte followed by an 8-byte big-endian sequence, so keys sort by seq
std::string MakeSeqKey(char prefix, uint64_t seq);

/// Parse a key built by MakeSeqKey; nullopt on wrong prefix or size
std::optional<uint64_t> ParseSeqKey(char prefix, const Slice& key);

} // namespace db
} // namespace chama

#endif // CHAMA_DB_DATABASE_H
