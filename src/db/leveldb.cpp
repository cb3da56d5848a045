// CHAMA - LevelDB Wrapper Implementation
// Copyright (c) 2024 CHAMA Developers
// MIT License

#include "chama/db/leveldb.h"
#include "chama/util/logging.h"

#include <leveldb/iterator.h>
#include <leveldb/options.h>
#include <leveldb/write_batch.h>

namespace chama {
namespace db {

namespace {

Status ConvertStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsIOError()) return Status::IOError(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

leveldb::ReadOptions MakeReadOptions(const ReadOptions& opts) {
    leveldb::ReadOptions lo;
    lo.verify_checksums = opts.verify_checksums;
    return lo;
}

leveldb::WriteOptions MakeWriteOptions(const WriteOptions& opts) {
    leveldb::WriteOptions lo;
    lo.sync = opts.sync;
    return lo;
}

class LevelDBIterator : public Iterator {
public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}

    bool Valid() const override { return iter_->Valid(); }
    void SeekToFirst() override { iter_->SeekToFirst(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }
    void Next() override { iter_->Next(); }

    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }

    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }

    Status status() const override { return ConvertStatus(iter_->status()); }

private:
    std::unique_ptr<leveldb::Iterator> iter_;
};

} // namespace

// ============================================================================
// LevelDBDatabase
// ============================================================================

LevelDBDatabase::LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                                 const std::filesystem::path& path)
    : cache_(cache), db_(db), path_(path) {}

LevelDBDatabase::~LevelDBDatabase() {
    db_.reset();
    cache_.reset();
}

Status LevelDBDatabase::Get(const ReadOptions& options, const Slice& key, std::string* value) {
    return ConvertStatus(db_->Get(MakeReadOptions(options),
                                  leveldb::Slice(key.data(), key.size()), value));
}

Status LevelDBDatabase::Put(const WriteOptions& options, const Slice& key, const Slice& value) {
    return ConvertStatus(db_->Put(MakeWriteOptions(options),
                                  leveldb::Slice(key.data(), key.size()),
                                  leveldb::Slice(value.data(), value.size())));
}

Status LevelDBDatabase::Delete(const WriteOptions& options, const Slice& key) {
    return ConvertStatus(db_->Delete(MakeWriteOptions(options),
                                     leveldb::Slice(key.data(), key.size())));
}

Status LevelDBDatabase::Write(const WriteOptions& options, WriteBatch* batch) {
    leveldb::WriteBatch lb;
    batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            lb.Put(key, *value);
        } else {
            lb.Delete(key);
        }
    });
    return ConvertStatus(db_->Write(MakeWriteOptions(options), &lb));
}

std::unique_ptr<Iterator> LevelDBDatabase::NewIterator(const ReadOptions& options) {
    return std::make_unique<LevelDBIterator>(db_->NewIterator(MakeReadOptions(options)));
}

// ============================================================================
// Database Factory Functions
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.error_if_exists = options.error_if_exists;
    lo.paranoid_checks = options.paranoid_checks;
    lo.write_buffer_size = options.write_buffer_size;

    leveldb::Cache* cache = nullptr;
    if (options.block_cache_size > 0) {
        cache = leveldb::NewLRUCache(options.block_cache_size);
        lo.block_cache = cache;
    }

    leveldb::DB* db = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &db);
    if (!s.ok()) {
        delete cache;
        LOG_ERROR(util::LogCategory::DB) << "Failed to open " << path.string()
                                         << ": " << s.ToString();
        return {ConvertStatus(s), nullptr};
    }

    LOG_INFO(util::LogCategory::DB) << "Opened LevelDB store at " << path.string();
    return {Status::Ok(), std::make_unique<LevelDBDatabase>(db, cache, path)};
}

Status DestroyDatabase(const std::filesystem::path& path) {
    return ConvertStatus(leveldb::DestroyDB(path.string(), leveldb::Options()));
}

} // namespace db
} // namespace chama
