// LIQUIDSTAKE - State Database
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// Ordered key-value store behind the state store. The pool is persisted as
// one atomic batch per commit and read back by key prefix, so that is all
// a backend has to offer.

#ifndef LIQUIDSTAKE_DB_DATABASE_H
#define LIQUIDSTAKE_DB_DATABASE_H

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace liquidstake {
namespace db {

/// Outcome of a database call
class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND,
        CORRUPTION,
        INVALID_ARGUMENT,
        IO_ERROR,
    };

    Status() = default;
    Status(Code code, std::string message) : code_(code), message_(std::move(message)) {}

    static Status Ok() { return Status(); }
    static Status NotFound(std::string what = "") { return {NOT_FOUND, std::move(what)}; }
    static Status Corruption(std::string what) { return {CORRUPTION, std::move(what)}; }
    static Status InvalidArgument(std::string what) { return {INVALID_ARGUMENT, std::move(what)}; }
    static Status IOError(std::string what) { return {IO_ERROR, std::move(what)}; }

    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsCorruption() const { return code_ == CORRUPTION; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    /// "Corruption: bad record" style text
    std::string ToString() const;

private:
    Code code_{OK};
    std::string message_;
};

struct OpenOptions {
    bool createIfMissing{true};
    bool errorIfExists{false};
    bool paranoidChecks{false};
    size_t writeBufferSize{4 << 20};
    int maxOpenFiles{64};
    /// Block cache in bytes, 0 for none
    size_t cacheSize{8 << 20};
    bool compression{true};
};

/// Puts and deletes applied together by Database::Write
class WriteBatch {
public:
    void Put(std::string key, std::string value) {
        ops_.emplace_back(std::move(key), std::move(value));
    }
    void Delete(std::string key) { ops_.emplace_back(std::move(key), std::nullopt); }

    size_t Count() const { return ops_.size(); }
    void Clear() { ops_.clear(); }

    /// In insertion order; a missing value is a delete
    void ForEach(const std::function<void(const std::string&,
                                          const std::optional<std::string>&)>& visit) const {
        for (const auto& op : ops_) {
            visit(op.first, op.second);
        }
    }

private:
    std::vector<std::pair<std::string, std::optional<std::string>>> ops_;
};

class Database {
public:
    /// Return false to stop the scan
    using Visitor = std::function<bool(const std::string& key, const std::string& value)>;

    virtual ~Database() = default;

    virtual Status Get(const std::string& key, std::string* value) = 0;

    /// All or nothing; sync waits for the write to reach disk
    virtual Status Write(const WriteBatch& batch, bool sync = false) = 0;

    /// Visit keys starting with prefix, in key order
    virtual Status ScanPrefix(const std::string& prefix, const Visitor& visit) = 0;

    /// "leveldb" or "memory"
    virtual std::string Name() const = 0;

    Status Put(const std::string& key, const std::string& value) {
        WriteBatch batch;
        batch.Put(key, value);
        return Write(batch);
    }

    Status Delete(const std::string& key) {
        WriteBatch batch;
        batch.Delete(key);
        return Write(batch);
    }

    bool Exists(const std::string& key) {
        std::string ignored;
        return Get(key, &ignored).ok();
    }
};

/// One-byte key prefixes of the state records
namespace prefix {
    constexpr char POOL = 'p';
    constexpr char RATES = 'r';
    constexpr char SUPPLY = 's';
    /// + staker address
    constexpr char LP_POSITION = 'l';
    constexpr char LP_CARRY = 'c';
    /// + owner address + asset kind
    constexpr char BALANCE = 'b';
    /// + owner address + asset kind
    constexpr char FROZEN = 'f';
    /// + validator address
    constexpr char DELEGATION = 'd';
    constexpr char VERSION = 'V';
}

inline std::string MakeKey(char prefix, const std::string& suffix = std::string()) {
    std::string key(1, prefix);
    key += suffix;
    return key;
}

} // namespace db
} // namespace liquidstake

#endif // LIQUIDSTAKE_DB_DATABASE_H
