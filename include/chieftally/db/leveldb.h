// CHIEFTALLY - LevelDB Wrapper
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License
//
// LevelDB and in-memory implementations of the database interface.

#ifndef CHIEFTALLY_DB_LEVELDB_H
#define CHIEFTALLY_DB_LEVELDB_H

#include "chieftally/db/database.h"

#include <map>
#include <mutex>

#include <leveldb/db.h>
#include <leveldb/cache.h>
#include <leveldb/filter_policy.h>

namespace chieftally {
namespace db {

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBDatabase : public Database {
public:
    /// Takes ownership of all three; cache and filter may be null
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter,
                    const std::filesystem::path& path);
    ~LevelDBDatabase() override;

    LevelDBDatabase(const LevelDBDatabase&) = delete;
    LevelDBDatabase& operator=(const LevelDBDatabase&) = delete;

    Status Get(const Slice& key, std::string* value) override;
    Status Put(const Slice& key, const Slice& value) override;

    const std::filesystem::path& GetPath() const { return path_; }

    static Status ConvertStatus(const leveldb::Status& s);

private:
    // Destroyed in reverse order: db before cache and filter
    std::unique_ptr<const leveldb::FilterPolicy> filterPolicy_;
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<leveldb::DB> db_;
    std::filesystem::path path_;
};

// ============================================================================
// In-Memory Database
// ============================================================================

/**
 * Map-backed database for tests and for runs with caching disabled.
 */
class MemoryDatabase : public Database {
public:
    MemoryDatabase() = default;

    Status Get(const Slice& key, std::string* value) override;
    Status Put(const Slice& key, const Slice& value) override;

    size_t Size() const;

private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
};

} // namespace db
} // namespace chieftally

#endif // CHIEFTALLY_DB_LEVELDB_H
