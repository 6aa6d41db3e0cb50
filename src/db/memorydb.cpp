// LIQUIDSTAKE - In-Memory Database Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/db/memorydb.h"

namespace liquidstake {
namespace db {

Status MemoryDatabase::Get(const std::string& key, std::string* value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = entries_.find(key);
    if (found == entries_.end()) {
        return Status::NotFound();
    }
    *value = found->second;
    return Status::Ok();
}

Status MemoryDatabase::Write(const WriteBatch& batch, bool) {
    std::lock_guard<std::mutex> lock(mutex_);
    batch.ForEach([this](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            entries_[key] = *value;
        } else {
            entries_.erase(key);
        }
    });
    return Status::Ok();
}

Status MemoryDatabase::ScanPrefix(const std::string& prefix, const Visitor& visit) {
    std::map<std::string, std::string> matching;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = entries_.lower_bound(prefix);
             it != entries_.end() && it->first.compare(0, prefix.size(), prefix) == 0; ++it) {
            matching.insert(*it);
        }
    }
    for (const auto& entry : matching) {
        if (!visit(entry.first, entry.second)) {
            break;
        }
    }
    return Status::Ok();
}

size_t MemoryDatabase::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace db
} // namespace liquidstake
