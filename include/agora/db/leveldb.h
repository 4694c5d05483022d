// AGORA - LevelDB Wrapper
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// LevelDB implementation of the database interface, plus the in-memory
// database used by tests and by builds without LevelDB.

#ifndef AGORA_DB_LEVELDB_H
#define AGORA_DB_LEVELDB_H

#include "agora/db/database.h"
#include <map>
#include <mutex>

#ifdef AGORA_USE_LEVELDB
#include <leveldb/db.h>
#include <leveldb/write_batch.h>
#endif

namespace agora {
namespace db {

#ifdef AGORA_USE_LEVELDB

/// Map a LevelDB status onto ours
inline Status ConvertStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    return Status::IOError(s.ToString());
}

// ============================================================================
// LevelDB Iterator Wrapper
// ============================================================================

class LevelDBIterator : public Iterator {
private:
    std::unique_ptr<leveldb::Iterator> iter_;
    
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
};

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBDatabase : public Database {
private:
    std::unique_ptr<leveldb::DB> db_;
    
public:
    explicit LevelDBDatabase(leveldb::DB* db) : db_(db) {}
    
    using Database::Write;
    
    Status Get(const Slice& key, std::string* value) override {
        return ConvertStatus(db_->Get(leveldb::ReadOptions(),
                                      leveldb::Slice(key.data(), key.size()), value));
    }
    
    Status Put(const Slice& key, const Slice& value) override {
        return ConvertStatus(db_->Put(leveldb::WriteOptions(),
                                      leveldb::Slice(key.data(), key.size()),
                                      leveldb::Slice(value.data(), value.size())));
    }
    
    Status Delete(const Slice& key) override {
        return ConvertStatus(db_->Delete(leveldb::WriteOptions(),
                                         leveldb::Slice(key.data(), key.size())));
    }
    
    Status Write(const WriteOptions& options, WriteBatch* batch) override {
        leveldb::WriteBatch lb;
        batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
            if (value) {
                lb.Put(key, *value);
            } else {
                lb.Delete(key);
            }
        });
        leveldb::WriteOptions lo;
        lo.sync = options.sync;
        return ConvertStatus(db_->Write(lo, &lb));
    }
    
    std::unique_ptr<Iterator> NewIterator() override {
        return std::make_unique<LevelDBIterator>(db_->NewIterator(leveldb::ReadOptions()));
    }
};

#endif // AGORA_USE_LEVELDB

// ============================================================================
// In-Memory Database
// ============================================================================

class MemoryDatabase : public Database {
private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
    
public:
    MemoryDatabase() = default;
    
    using Database::Write;
    
    Status Get(const Slice& key, std::string* value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = data_.find(key.ToString());
        if (it == data_.end()) {
            return Status::NotFound();
        }
        *value = it->second;
        return Status::Ok();
    }
    
    Status Put(const Slice& key, const Slice& value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        data_[key.ToString()] = value.ToString();
        return Status::Ok();
    }
    
    Status Delete(const Slice& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        data_.erase(key.ToString());
        return Status::Ok();
    }
    
    Status Write(const WriteOptions&, WriteBatch* batch) override {
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
    
    std::unique_ptr<Iterator> NewIterator() override;
    
    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }
};

/**
 * Iterator over a snapshot of a MemoryDatabase taken at creation.
 */
class MemoryIterator : public Iterator {
private:
    std::map<std::string, std::string> data_;
    std::map<std::string, std::string>::const_iterator iter_;
    
public:
    explicit MemoryIterator(std::map<std::string, std::string> data)
        : data_(std::move(data)), iter_(data_.end()) {}
    
    bool Valid() const override { return iter_ != data_.end(); }
    void SeekToFirst() override { iter_ = data_.begin(); }
    void Seek(const Slice& target) override { iter_ = data_.lower_bound(target.ToString()); }
    void Next() override {
        if (iter_ != data_.end()) {
            ++iter_;
        }
    }
    
    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }
    Status status() const override { return Status::Ok(); }
};

inline std::unique_ptr<Iterator> MemoryDatabase::NewIterator() {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::make_unique<MemoryIterator>(data_);
}

} // namespace db
} // namespace agora

#endif // AGORA_DB_LEVELDB_H
