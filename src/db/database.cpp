// CHIEFTALLY - Database Implementation
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License

#include "chieftally/db/database.h"
#include "chieftally/db/leveldb.h"
#include "chieftally/util/logging.h"

namespace chieftally {
namespace db {

std::string Status::ToString() const {
    switch (code_) {
        case OK: return "OK";
        case NOT_FOUND: return "NotFound: " + message_;
        case CORRUPTION: return "Corruption: " + message_;
        case IO_ERROR: return "IOError: " + message_;
    }
    return "Unknown: " + message_;
}

// ============================================================================
// LevelDBDatabase
// ============================================================================

LevelDBDatabase::LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                                 const leveldb::FilterPolicy* filter,
                                 const std::filesystem::path& path)
    : filterPolicy_(filter), cache_(cache), db_(db), path_(path) {}

LevelDBDatabase::~LevelDBDatabase() {
    db_.reset();
}

Status LevelDBDatabase::ConvertStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    return Status::IOError(s.ToString());
}

Status LevelDBDatabase::Get(const Slice& key, std::string* value) {
    return ConvertStatus(db_->Get(leveldb::ReadOptions(),
                                  leveldb::Slice(key.data(), key.size()), value));
}

Status LevelDBDatabase::Put(const Slice& key, const Slice& value) {
    return ConvertStatus(db_->Put(leveldb::WriteOptions(),
                                  leveldb::Slice(key.data(), key.size()),
                                  leveldb::Slice(value.data(), value.size())));
}

// ============================================================================
// MemoryDatabase
// ============================================================================

Status MemoryDatabase::Get(const Slice& key, std::string* value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key.ToString());
    if (it == data_.end()) {
        return Status::NotFound(key.ToString());
    }
    *value = it->second;
    return Status::Ok();
}

Status MemoryDatabase::Put(const Slice& key, const Slice& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key.ToString()] = value.ToString();
    return Status::Ok();
}

size_t MemoryDatabase::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

// ============================================================================
// Factory
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
    if (options.create_if_missing) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            return {Status::IOError(path.string() + ": " + ec.message()), nullptr};
        }
    }

    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.write_buffer_size = options.write_buffer_size;
    lo.max_open_files = options.max_open_files;

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

    leveldb::DB* db = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &db);
    if (!s.ok()) {
        LOG_WARN(util::LogCategory::DB) << "Cannot open " << path.string() << ": " << s.ToString();
        return {LevelDBDatabase::ConvertStatus(s), nullptr};
    }

    LOG_DEBUG(util::LogCategory::DB) << "Opened cache database at " << path.string();
    return {Status::Ok(),
            std::make_unique<LevelDBDatabase>(db, cache.release(), filter.release(), path)};
}

} // namespace db
} // namespace chieftally
