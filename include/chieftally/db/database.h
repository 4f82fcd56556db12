// CHIEFTALLY - Database Abstraction Layer
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License
//
// Key-value store behind the on-disk caches (resolved slates, contract
// interfaces). Production uses LevelDB; tests use MemoryDatabase.

#ifndef CHIEFTALLY_DB_DATABASE_H
#define CHIEFTALLY_DB_DATABASE_H

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>

namespace chieftally {
namespace db {

// ============================================================================
// Status
// ============================================================================

class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND = 1,
        CORRUPTION = 2,
        IO_ERROR = 3,
    };

    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}

    static Status Ok() { return Status(); }
    static Status NotFound(const std::string& msg = "") { return Status(NOT_FOUND, msg); }
    static Status Corruption(const std::string& msg = "") { return Status(CORRUPTION, msg); }
    static Status IOError(const std::string& msg = "") { return Status(IO_ERROR, msg); }

    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    /// e.g. "NotFound: missing key"
    std::string ToString() const;

private:
    Code code_;
    std::string message_;
};

// ============================================================================
// Slice
// ============================================================================

/**
 * Non-owning view of a key or value.
 * The underlying buffer must outlive the Slice.
 */
class Slice {
public:
    Slice() : data_(""), size_(0) {}
    Slice(const char* d, size_t n) : data_(d), size_(n) {}
    Slice(const std::string& s) : data_(s.data()), size_(s.size()) {}
    Slice(const char* s) : data_(s), size_(std::strlen(s)) {}

    const char* data() const { return data_; }
    size_t size() const { return size_; }

    std::string ToString() const { return std::string(data_, size_); }

private:
    const char* data_;
    size_t size_;
};

// ============================================================================
// Options
// ============================================================================

struct Options {
    bool create_if_missing = true;

    /// Cache entries are small and written once
    size_t write_buffer_size = 1024 * 1024;
    int max_open_files = 64;

    /// LRU block cache, 0 to disable
    size_t block_cache_size = 4 * 1024 * 1024;

    /// Bloom filter bits per key, 0 to disable
    int bloom_filter_bits = 10;
};

// ============================================================================
// Database
// ============================================================================

/**
 * Minimal key-value interface used by the caches.
 * Implementations must be safe to call from several worker threads.
 */
class Database {
public:
    virtual ~Database() = default;

    /// NotFound when the key is absent
    virtual Status Get(const Slice& key, std::string* value) = 0;
    virtual Status Put(const Slice& key, const Slice& value) = 0;
};

// ============================================================================
// Key Prefixes
// ============================================================================

namespace prefix {
    /// Resolved slate: 's' + 32-byte slate id -> concatenated 20-byte addresses
    constexpr char SLATE = 's';

    /// Contract interface: 'a' + 20-byte address -> ABI JSON text
    constexpr char INTERFACE = 'a';
}

/// Build a key from a one-byte prefix and a raw identifier
inline std::string MakeKey(char p, const uint8_t* id, size_t len) {
    std::string key;
    key.reserve(1 + len);
    key.push_back(p);
    key.append(reinterpret_cast<const char*>(id), len);
    return key;
}

/**
 * Open a LevelDB database at path, creating missing directories when
 * create_if_missing is set.
 * @return Pair of (status, database pointer)
 */
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

} // namespace db
} // namespace chieftally

#endif // CHIEFTALLY_DB_DATABASE_H
