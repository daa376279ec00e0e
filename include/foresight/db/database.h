// FORESIGHT - Database Abstraction Layer
// Copyright (c) 2024 FORESIGHT Developers
// MIT License
//
// Abstract ordered key-value store used for all persistent market state.
// LevelDB is the on-disk implementation; MemoryDatabase serves tests and
// in-process replays.

#ifndef FORESIGHT_DB_DATABASE_H
#define FORESIGHT_DB_DATABASE_H

#include "foresight/core/types.h"
#include "foresight/core/serialize.h"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace foresight {
namespace db {

// ============================================================================
// Status
// ============================================================================

/**
 * Outcome of a database operation. NotFound is an expected answer for
 * lookups; Corruption and IOError mean the store cannot be trusted.
 */
class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND,
        CORRUPTION,
        IO_ERROR,
    };

    Status() = default;
    Status(Code code, std::string msg) : code_(code), message_(std::move(msg)) {}

    static Status Ok() { return Status(); }
    static Status NotFound(std::string msg = "") { return Status(NOT_FOUND, std::move(msg)); }
    static Status Corruption(std::string msg = "") { return Status(CORRUPTION, std::move(msg)); }
    static Status IOError(std::string msg = "") { return Status(IO_ERROR, std::move(msg)); }

    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsCorruption() const { return code_ == CORRUPTION; }
    bool IsIOError() const { return code_ == IO_ERROR; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    /// "OK" or "<Code>: <message>"
    std::string ToString() const;

private:
    Code code_ = OK;
    std::string message_;
};

// ============================================================================
// Slice
// ============================================================================

/// Non-owning view of a key or value; the referenced bytes must outlive it
class Slice {
public:
    Slice() = default;
    Slice(const char* d, size_t n) : view_(d, n) {}
    Slice(const std::string& s) : view_(s) {}
    Slice(const char* s) : view_(s) {}

    const char* data() const { return view_.data(); }
    size_t size() const { return view_.size(); }
    bool empty() const { return view_.empty(); }

    std::string ToString() const { return std::string(view_); }

    bool starts_with(const Slice& prefix) const {
        return view_.substr(0, prefix.size()) == prefix.view_;
    }

    /// Bytewise three-way comparison (LevelDB's default key order)
    int compare(const Slice& b) const { return view_.compare(b.view_); }

    bool operator==(const Slice& b) const { return view_ == b.view_; }
    bool operator!=(const Slice& b) const { return view_ != b.view_; }
    bool operator<(const Slice& b) const { return view_ < b.view_; }

private:
    std::string_view view_;
};

// ============================================================================
// Options
// ============================================================================

/// Open options; only the knobs the market store tunes
struct Options {
    bool create_if_missing = true;
    bool paranoid_checks = false;
    size_t write_buffer_size = 4 * 1024 * 1024;
    int max_open_files = 1000;
    size_t block_cache_size = 8 * 1024 * 1024;   // 0 disables the block cache
    bool compression = true;
    int bloom_filter_bits = 10;                  // 0 disables the filter
};

struct ReadOptions {
    bool verify_checksums = false;
    bool fill_cache = true;
};

struct WriteOptions {
    /// fsync before the write is acknowledged
    bool sync = false;
};

// ============================================================================
// WriteBatch
// ============================================================================

/// Puts and deletes applied all-or-nothing by Database::Write
class WriteBatch {
public:
    void Put(const Slice& key, const Slice& value) {
        operations_.emplace_back(key.ToString(), value.ToString());
    }

    void Delete(const Slice& key) {
        operations_.emplace_back(key.ToString(), std::nullopt);
    }

    void Clear() { operations_.clear(); }
    size_t Count() const { return operations_.size(); }
    bool Empty() const { return operations_.empty(); }

    /// Visit operations in insertion order; nullopt value means delete
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
// Iterator and Database
// ============================================================================

class Iterator {
public:
    virtual ~Iterator() = default;

    virtual bool Valid() const = 0;
    virtual void SeekToFirst() = 0;
    /// Position at the first key >= target
    virtual void Seek(const Slice& target) = 0;
    virtual void Next() = 0;
    virtual Slice key() const = 0;
    virtual Slice value() const = 0;
    virtual Status status() const = 0;
};

class Database {
public:
    virtual ~Database() = default;

    virtual Status Get(const ReadOptions& options, const Slice& key, std::string* value) = 0;
    virtual Status Put(const WriteOptions& options, const Slice& key, const Slice& value) = 0;
    virtual Status Delete(const WriteOptions& options, const Slice& key) = 0;
    virtual Status Write(const WriteOptions& options, WriteBatch* batch) = 0;
    /// Iterates a consistent snapshot taken at creation
    virtual std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) = 0;

    Status Get(const Slice& key, std::string* value) { return Get(ReadOptions(), key, value); }
    Status Put(const Slice& key, const Slice& value) { return Put(WriteOptions(), key, value); }
    Status Delete(const Slice& key) { return Delete(WriteOptions(), key); }
    Status Write(WriteBatch* batch) { return Write(WriteOptions(), batch); }
    std::unique_ptr<Iterator> NewIterator() { return NewIterator(ReadOptions()); }

    bool Exists(const Slice& key) {
        std::string value;
        return Get(key, &value).ok();
    }
};

/**
 * Visit every entry whose key starts with prefix, in key order. The visitor
 * returns a non-OK status to stop early; that status is returned. Otherwise
 * the iterator's final status is returned.
 */
Status ForEachWithPrefix(Database& db, const Slice& prefix,
                         const std::function<Status(const Slice& key, const Slice& value)>& visit);

// ============================================================================
// Factory Functions
// ============================================================================

/**
 * Open (creating parent directories when create_if_missing is set) a
 * LevelDB database. The pointer is null whenever the status is not OK.
 */
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

std::unique_ptr<Database> OpenMemoryDatabase();

/// Delete all files of the LevelDB database at path
Status DestroyDatabase(const std::filesystem::path& path);

// ============================================================================
// Record Encoding
// ============================================================================

template<typename T>
std::string SerializeToString(const T& obj) {
    DataStream ss;
    Serialize(ss, obj);
    return ss.AsString();
}

/// False on truncated input, malformed fields or trailing bytes
template<typename T>
bool DeserializeFromString(const Slice& data, T& obj) {
    try {
        DataStream ss(reinterpret_cast<const uint8_t*>(data.data()), data.size());
        Unserialize(ss, obj);
        return ss.empty();
    } catch (const std::ios_base::failure&) {
        return false;
    }
}

// ============================================================================
// Key Prefixes
// ============================================================================

namespace prefix {
    constexpr char ROUND = 'R';          // asset, round id -> round
    constexpr char PREDICTION = 'P';     // asset, round id, principal -> prediction
    constexpr char AGGREGATE = 'A';      // asset, round id -> sentiment aggregate
    constexpr char REPUTATION = 'U';     // principal -> reputation
    constexpr char STATS = 'S';          // -> market stats
    constexpr char PARAMS = 'C';         // -> market params
    constexpr char JOURNAL = 'J';        // sequence -> journal entry
    constexpr char JOURNAL_HEAD = 'H';   // -> journal head
    constexpr char LEDGER = 'L';         // -> reference ledger snapshot
}

inline std::string MakeKey(char prefix, const Slice& key = Slice()) {
    std::string result(1, prefix);
    result.append(key.data(), key.size());
    return result;
}

} // namespace db
} // namespace foresight

#endif // FORESIGHT_DB_DATABASE_H
