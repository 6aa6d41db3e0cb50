// LIQUIDSTAKE - LevelDB Backend Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/db/leveldb.h"
#include "liquidstake/util/logging.h"

#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/iterator.h>
#include <leveldb/write_batch.h>

#include <system_error>
#include <utility>

namespace liquidstake {
namespace db {

namespace {

Status FromLevelDB(const leveldb::Status& s) {
    if (s.ok()) {
        return Status::Ok();
    }
    if (s.IsNotFound()) {
        return Status::NotFound(s.ToString());
    }
    if (s.IsCorruption()) {
        return Status::Corruption(s.ToString());
    }
    if (s.IsInvalidArgument()) {
        return Status::InvalidArgument(s.ToString());
    }
    return Status::IOError(s.ToString());
}

} // namespace

LevelDBDatabase::LevelDBDatabase(std::filesystem::path path,
                                 std::unique_ptr<leveldb::Cache> cache,
                                 std::unique_ptr<leveldb::DB> db)
    : path_(std::move(path)), cache_(std::move(cache)), db_(std::move(db)) {}

LevelDBDatabase::~LevelDBDatabase() = default;

Status LevelDBDatabase::Open(const std::filesystem::path& path, const OpenOptions& options,
                             std::unique_ptr<LevelDBDatabase>* out) {
    if (options.createIfMissing) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            return Status::IOError("cannot create " + path.string() + ": " + ec.message());
        }
    }

    std::unique_ptr<leveldb::Cache> cache;
    leveldb::Options settings;
    settings.create_if_missing = options.createIfMissing;
    settings.error_if_exists = options.errorIfExists;
    settings.paranoid_checks = options.paranoidChecks;
    settings.write_buffer_size = options.writeBufferSize;
    settings.max_open_files = options.maxOpenFiles;
    settings.compression = options.compression ? leveldb::kSnappyCompression
                                               : leveldb::kNoCompression;
    if (options.cacheSize > 0) {
        cache.reset(leveldb::NewLRUCache(options.cacheSize));
        settings.block_cache = cache.get();
    }

    leveldb::DB* raw = nullptr;
    Status status = FromLevelDB(leveldb::DB::Open(settings, path.string(), &raw));
    if (!status.ok()) {
        return status;
    }
    std::unique_ptr<leveldb::DB> handle(raw);

    LOG_INFO(util::LogCategory::DB) << "Opened state database " << path.string();
    out->reset(new LevelDBDatabase(path, std::move(cache), std::move(handle)));
    return Status::Ok();
}

Status LevelDBDatabase::Destroy(const std::filesystem::path& path) {
    return FromLevelDB(leveldb::DestroyDB(path.string(), leveldb::Options()));
}

Status LevelDBDatabase::Get(const std::string& key, std::string* value) {
    return FromLevelDB(db_->Get(leveldb::ReadOptions(), key, value));
}

Status LevelDBDatabase::Write(const WriteBatch& batch, bool sync) {
    leveldb::WriteBatch updates;
    batch.ForEach([&updates](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            updates.Put(key, *value);
        } else {
            updates.Delete(key);
        }
    });
    leveldb::WriteOptions options;
    options.sync = sync;
    return FromLevelDB(db_->Write(options, &updates));
}

Status LevelDBDatabase::ScanPrefix(const std::string& prefix, const Visitor& visit) {
    std::unique_ptr<leveldb::Iterator> it(db_->NewIterator(leveldb::ReadOptions()));
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        if (!visit(it->key().ToString(), it->value().ToString())) {
            break;
        }
    }
    return FromLevelDB(it->status());
}

} // namespace db
} // namespace liquidstake
