// CHIEFTALLY - Slate Resolution
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License
//
// A slate is an immutable, content-addressed list of proposals. Resolution
// walks slates(hash, i) until the contract reports the index out of range.

#ifndef CHIEFTALLY_CHIEF_SLATES_H
#define CHIEFTALLY_CHIEF_SLATES_H

#include "chieftally/chief/contract.h"
#include "chieftally/chief/types.h"
#include "chieftally/db/database.h"
#include "chieftally/util/threadpool.h"

#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace chieftally {
namespace chief {

using SlateMap = std::map<Hash256, std::vector<Proposal>>;

// ============================================================================
// Slate Cache
// ============================================================================

/**
 * Resolved slates, kept in memory for the run and written through to a
 * persistent store. Thread-safe.
 */
class SlateCache {
public:
    /// The store must outlive the cache
    explicit SlateCache(db::Database& store);

    SlateCache(const SlateCache&) = delete;
    SlateCache& operator=(const SlateCache&) = delete;

    /// Cached member list, checking memory first and then the store
    std::optional<std::vector<Proposal>> Get(const Hash256& slate);

    /// Record a complete resolution; empty slates stay in memory only
    void Put(const Hash256& slate, const std::vector<Proposal>& members);

    /// Slates held in memory
    size_t Size() const;

    /// Store encoding: concatenated 20-byte addresses
    static std::string Serialize(const std::vector<Proposal>& members);
    static std::optional<std::vector<Proposal>> Deserialize(const std::string& value);

private:
    db::Database& store_;
    mutable std::mutex mutex_;
    SlateMap memory_;
};

// ============================================================================
// Slate Resolver
// ============================================================================

class SlateResolver {
public:
    /// Both collaborators must outlive the resolver
    SlateResolver(ChiefContract& chief, SlateCache& cache);

    /**
     * Member list of a slate, in lookup order.
     * Stops at the first out-of-range index or zero address. Fails with
     * Network or Decode if a lookup fails for another reason.
     */
    eth::Result<std::vector<Proposal>> Resolve(const Hash256& slate);

    /// Resolve, logging a warning and returning an empty list on failure
    std::vector<Proposal> ResolveOrEmpty(const Hash256& slate);

    /**
     * Resolve distinct slates concurrently on the pool.
     * A failed slate maps to an empty list. Throws ChiefError(Network) if
     * the batch is non-empty and every slate failed.
     */
    SlateMap ResolveAll(const std::vector<Hash256>& slates, util::ThreadPool& pool);

private:
    ChiefContract& chief_;
    SlateCache& cache_;
};

} // namespace chief
} // namespace chieftally

#endif // CHIEFTALLY_CHIEF_SLATES_H
