// STAKEVOTE - LevelDB Wrapper
// Copyright (c) 2024 STAKEVOTE Developers
// MIT License
//
// This file provides the LevelDB implementation of the database interface,
// and the in-memory implementation used when LevelDB is not built in.

#ifndef STAKEVOTE_DB_LEVELDB_H
#define STAKEVOTE_DB_LEVELDB_H

#include "stakevote/db/database.h"
#include <map>
#include <mutex>

#ifdef STAKEVOTE_USE_LEVELDB
#include <leveldb/db.h>
#include <leveldb/write_batch.h>
#include <leveldb/cache.h>
#endif

namespace stakevote {
namespace db {

#ifdef STAKEVOTE_USE_LEVELDB

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

    Status status() const override;
};

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBDatabase : public Database {
private:
    std::unique_ptr<leveldb::DB> db_;
    std::unique_ptr<leveldb::Cache> cache_;
    std::filesystem::path path_;

public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const std::filesystem::path& path)
        : db_(db), cache_(cache), path_(path) {}

    ~LevelDBDatabase() override {
        // The DB must close before its block cache goes away
        db_.reset();
        cache_.reset();
    }

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
    std::string GetStats() const override;

    /// Translate a LevelDB status into ours
    static Status ConvertStatus(const leveldb::Status& s);
};

#endif // STAKEVOTE_USE_LEVELDB

// ============================================================================
// In-Memory Database (Fallback when LevelDB not available)
// ============================================================================

/**
 * Simple in-memory database for testing or when LevelDB is not available.
 */
class MemoryDatabase : public Database {
private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;

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

    /// The iterator works on a snapshot copy taken at creation time
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    std::string GetStats() const override;

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        data_.clear();
    }
};

/**
 * Iterator over a snapshot of a MemoryDatabase.
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
};

} // namespace db
} // namespace stakevote

#endif // STAKEVOTE_DB_LEVELDB_H
