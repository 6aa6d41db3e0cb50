// LIQUIDSTAKE - In-Memory Database
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#ifndef LIQUIDSTAKE_DB_MEMORYDB_H
#define LIQUIDSTAKE_DB_MEMORYDB_H

#include "liquidstake/db/database.h"

#include <map>
#include <mutex>

namespace liquidstake {
namespace db {

/// Volatile backend for tests and "-dbbackend=memory"
class MemoryDatabase : public Database {
public:
    Status Get(const std::string& key, std::string* value) override;
    Status Write(const WriteBatch& batch, bool sync = false) override;

    /// The visitor sees a snapshot and may write to this database
    Status ScanPrefix(const std::string& prefix, const Visitor& visit) override;

    std::string Name() const override { return "memory"; }

    size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> entries_;
};

} // namespace db
} // namespace liquidstake

#endif // LIQUIDSTAKE_DB_MEMORYDB_H
