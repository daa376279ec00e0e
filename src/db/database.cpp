// FORESIGHT - Database Implementation
// Copyright (c) 2024 FORESIGHT Developers
// MIT License

#include "foresight/db/database.h"
#include "foresight/db/leveldb.h"

namespace foresight {
namespace db {

namespace {

leveldb::ReadOptions MakeReadOptions(const ReadOptions& opts) {
    leveldb::ReadOptions lo;
    lo.verify_checksums = opts.verify_checksums;
    lo.fill_cache = opts.fill_cache;
    return lo;
}

leveldb::WriteOptions MakeWriteOptions(const WriteOptions& opts) {
    leveldb::WriteOptions lo;
    lo.sync = opts.sync;
    return lo;
}

leveldb::Slice ToLevelDB(const Slice& s) {
    return leveldb::Slice(s.data(), s.size());
}

} // namespace

Status FromLevelDBStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    return Status::IOError(s.ToString());
}

std::string Status::ToString() const {
    switch (code_) {
        case OK:         return "OK";
        case NOT_FOUND:  return "NotFound: " + message_;
        case CORRUPTION: return "Corruption: " + message_;
        case IO_ERROR:   return "IOError: " + message_;
    }
    return "Unknown: " + message_;
}

Status ForEachWithPrefix(Database& db, const Slice& prefix,
                         const std::function<Status(const Slice& key, const Slice& value)>& visit) {
    auto iter = db.NewIterator();
    for (iter->Seek(prefix); iter->Valid() && iter->key().starts_with(prefix); iter->Next()) {
        Status s = visit(iter->key(), iter->value());
        if (!s.ok()) {
            return s;
        }
    }
    return iter->status();
}

// ============================================================================
// LevelDBDatabase
// ============================================================================

Status LevelDBDatabase::Get(const ReadOptions& options, const Slice& key, std::string* value) {
    return FromLevelDBStatus(db_->Get(MakeReadOptions(options), ToLevelDB(key), value));
}

Status LevelDBDatabase::Put(const WriteOptions& options, const Slice& key, const Slice& value) {
    return FromLevelDBStatus(db_->Put(MakeWriteOptions(options), ToLevelDB(key), ToLevelDB(value)));
}

Status LevelDBDatabase::Delete(const WriteOptions& options, const Slice& key) {
    return FromLevelDBStatus(db_->Delete(MakeWriteOptions(options), ToLevelDB(key)));
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
    return FromLevelDBStatus(db_->Write(MakeWriteOptions(options), &lb));
}

std::unique_ptr<Iterator> LevelDBDatabase::NewIterator(const ReadOptions& options) {
    return std::make_unique<LevelDBIterator>(db_->NewIterator(MakeReadOptions(options)));
}

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

// ============================================================================
// Database Factory Functions
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.paranoid_checks = options.paranoid_checks;
    lo.write_buffer_size = options.write_buffer_size;
    lo.max_open_files = options.max_open_files;
    lo.compression = options.compression ?
        leveldb::kSnappyCompression : leveldb::kNoCompression;

    std::unique_ptr<leveldb::Cache> cache;
    if (options.block_cache_size > 0) {
        cache.reset(leveldb::NewLRUCache(options.block_cache_size));
        lo.block_cache = cache.get();
    }

    std::unique_ptr<const leveldb::FilterPolicy> filter;
    if (options.bloom_filter_bits > 0) {
        filter.reset(leveldb::NewBloomFilterPolicy(options.bloom_filter_bits));
        lo.filter_policy = filter.get();
    }

    if (options.create_if_missing) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path().empty() ? path : path.parent_path(), ec);
        if (ec) {
            return {Status::IOError("cannot create " + path.string() + ": " + ec.message()), nullptr};
        }
    }

    leveldb::DB* raw = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &raw);
    if (!s.ok()) {
        return {FromLevelDBStatus(s), nullptr};
    }

    return {Status::Ok(),
            std::make_unique<LevelDBDatabase>(raw, cache.release(), filter.release())};
}

std::unique_ptr<Database> OpenMemoryDatabase() {
    return std::make_unique<MemoryDatabase>();
}

Status DestroyDatabase(const std::filesystem::path& path) {
    return FromLevelDBStatus(leveldb::DestroyDB(path.string(), leveldb::Options()));
}

} // namespace db
} // namespace foresight
