// LIQUIDSTAKE - LevelDB Backend
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#ifndef LIQUIDSTAKE_DB_LEVELDB_H
#define LIQUIDSTAKE_DB_LEVELDB_H

#include "liquidstake/db/database.h"

#include <filesystem>
#include <memory>

namespace leveldb {
class Cache;
class DB;
}

namespace liquidstake {
namespace db {

/// Default on-disk backend of the daemon
class LevelDBDatabase : public Database {
public:
    /**
     * Open (or create) the database directory.
     * @param[out] out Set only when the returned status is ok
     */
    static Status Open(const std::filesystem::path& path, const OpenOptions& options,
                       std::unique_ptr<LevelDBDatabase>* out);

    /// Remove every file of the database at path
    static Status Destroy(const std::filesystem::path& path);

    ~LevelDBDatabase() override;

    LevelDBDatabase(const LevelDBDatabase&) = delete;
    LevelDBDatabase& operator=(const LevelDBDatabase&) = delete;

    Status Get(const std::string& key, std::string* value) override;
    Status Write(const WriteBatch& batch, bool sync = false) override;
    Status ScanPrefix(const std::string& prefix, const Visitor& visit) override;

    std::string Name() const override { return "leveldb"; }

    const std::filesystem::path& Path() const { return path_; }

private:
    LevelDBDatabase(std::filesystem::path path, std::unique_ptr<leveldb::Cache> cache,
                    std::unique_ptr<leveldb::DB> db);

    std::filesystem::path path_;
    /// Declared before db_ so the database is closed first
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<leveldb::DB> db_;
};

} // namespace db
} // namespace liquidstake

#endif // LIQUIDSTAKE_DB_LEVELDB_H
