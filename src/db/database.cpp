// CHAMA - Database Implementation
// Copyright (c) 2024 CHAMA Developers
// MIT License

#include "chama/db/database.h"

namespace chama {
namespace db {

// ============================================================================
// Status
// ============================================================================

std::string Status::ToString() const {
    if (ok()) return "OK";
    std::string result;
    switch (code_) {
        case NOT_FOUND: result = "NotFound: "; break;
        case CORRUPTION: result = "Corruption: "; break;
        case NOT_SUPPORTED: result = "NotSupported: "; break;
        case INVALID_ARGUMENT: result = "InvalidArgument: "; break;
        case IO_ERROR: result = "IOError: "; break;
        default: result = "Unknown: "; break;
    }
    return result + message_;
}

// ============================================================================
// Memory Iterator
// ============================================================================

namespace {

class MemoryIterator : public Iterator {
public:
    explicit MemoryIterator(std::map<std::string, std::string> snapshot)
        : data_(std::move(snapshot)), iter_(data_.end()) {}

    bool Valid() const override { return iter_ != data_.end(); }

    void SeekToFirst() override { iter_ = data_.begin(); }

    void Seek(const Slice& target) override {
        iter_ = data_.lower_bound(target.ToString());
    }

    void Next() override {
        if (iter_ != data_.end()) {
            ++iter_;
        }
    }

    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }
    Status status() const override { return Status::Ok(); }

private:
    std::map<std::string, std::string> data_;
    std::map<std::string, std::string>::const_iterator iter_;
};

} // namespace

// ============================================================================
// MemoryDatabase
// ============================================================================

Status MemoryDatabase::Get(const ReadOptions&, const Slice& key, std::string* value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key.ToString());
    if (it == data_.end()) {
        return Status::NotFound();
    }
    *value = it->second;
    return Status::Ok();
}

Status MemoryDatabase::Put(const WriteOptions&, const Slice& key, const Slice& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key.ToString()] = value.ToString();
    return Status::Ok();
}

Status MemoryDatabase::Delete(const WriteOptions&, const Slice& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.erase(key.ToString());
    return Status::Ok();
}

Status MemoryDatabase::Write(const WriteOptions&, WriteBatch* batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    batch->Iterate([this](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            data_[key] = *value;
        } else {
            data_.erase(key);
        }
    });
    return Status::Ok();
}

std::unique_ptr<Iterator> MemoryDatabase::NewIterator(const ReadOptions&) {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::make_unique<MemoryIterator>(data_);
}

size_t MemoryDatabase::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

void MemoryDatabase::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.clear();
}

// ============================================================================
// Key Construction
// ============================================================================

std::string MakeSeqKey(char prefix, uint64_t seq) {
    std::string key(1 + 8, '\0');
    key[0] = prefix;
    for (int i = 0; i < 8; ++i) {
        key[1 + i] = static_cast<char>((seq >> (56 - 8 * i)) & 0xFF);
    }
    return key;
}

std::optional<uint64_t> ParseSeqKey(char prefix, const Slice& key) {
    if (key.size() != 9 || key.data()[0] != prefix) {
        return std::nullopt;
    }
    uint64_t seq = 0;
    for (int i = 0; i < 8; ++i) {
        seq = (seq << 8) | static_cast<uint8_t>(key.data()[1 + i]);
    }
    return seq;
}

} // namespace db
} // namespace chama
