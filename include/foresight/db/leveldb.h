// FORESIGHT - LevelDB Wrapper
// Copyright (c) 2024 FORESIGHT Developers
// MIT License
//
// LevelDB and in-memory implementations of the database interface.

#ifndef FORESIGHT_DB_LEVELDB_H
#define FORESIGHT_DB_LEVELDB_H

#include "foresight/db/database.h"
#include <map>
#include <mutex>

#include <leveldb/db.h>
#include <leveldb/write_batch.h>
#include <leveldb/cache.h>
#include <leveldb/filter_policy.h>

namespace foresight {
namespace db {

/// Map a LevelDB status onto the database status codes
Status FromLevelDBStatus(const leveldb::Status& s);

// ============================================================================
// LevelDB Iterator Wrapper
// ============================================================================

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

    Status status() const override { return FromLevelDBStatus(iter_->status()); }

private:
    std::unique_ptr<leveldb::Iterator> iter_;
};

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBDatabase : public Database {
public:
    /// Takes ownership of db, cache and filter (cache and filter may be null)
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter)
        : db_(db), cache_(cache), filterPolicy_(filter) {}

    ~LevelDBDatabase() override {
        // The DB references the cache and filter, so it must close first
        db_.reset();
        cache_.reset();
        filterPolicy_.reset();
    }

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

private:
    std::unique_ptr<leveldb::DB> db_;
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filterPolicy_;
};

// ============================================================================
// In-Memory Database
// ============================================================================

/**
 * Ordered in-memory database. Iterators walk a snapshot taken at creation,
 * like LevelDB's implicit iterator snapshot.
 */
class MemoryDatabase : public Database {
public:
    MemoryDatabase() = default;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }

private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
};

/**
 * Iterator over a MemoryDatabase snapshot.
 */
class MemoryIterator : public Iterator {
public:
    explicit MemoryIterator(std::map<std::string, std::string> snapshot)
        : data_(std::move(snapshot)), iter_(data_.end()) {}

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

private:
    std::map<std::string, std::string> data_;
    std::map<std::string, std::string>::const_iterator iter_;
};

} // namespace db
} // namespace foresight

#endif // FORESIGHT_DB_LEVELDB_H
