// CHAMA - LevelDB Wrapper
// Copyright (c) 2024 CHAMA Developers
// MIT License
//
// LevelDB implementation of the database interface. Built into the
// chama_store library only when LevelDB is available.

#ifndef CHAMA_DB_LEVELDB_H
#define CHAMA_DB_LEVELDB_H

#include "chama/db/database.h"

#include <filesystem>
#include <memory>
#include <utility>

#include <leveldb/cache.h>
#include <leveldb/db.h>

namespace chama {
namespace db {

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBDatabase : public Database {
public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const std::filesystem::path& path);
    ~LevelDBDatabase() override;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    const std::filesystem::path& GetPath() const { return path_; }

private:
    // Declared before db_ so the cache outlives the database on destruction
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<leveldb::DB> db_;
    std::filesystem::path path_;
};

// ============================================================================
// Database Factory Functions
// ============================================================================

/// Open (or create) a LevelDB database at path.
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

/// Delete all data of the database at path.
Status DestroyDatabase(const std::filesystem::path& path);

} // namespace db
} // namespace chama

#endif // CHAMA_DB_LEVELDB_H
