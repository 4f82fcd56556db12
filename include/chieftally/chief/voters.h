// CHIEFTALLY - Voter State
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License
//
// Replays vote events into per-voter state and attaches live deposits.

#ifndef CHIEFTALLY_CHIEF_VOTERS_H
#define CHIEFTALLY_CHIEF_VOTERS_H

#include "chieftally/chief/contract.h"
#include "chieftally/chief/types.h"
#include "chieftally/util/threadpool.h"

#include <functional>
#include <map>
#include <vector>

namespace chieftally {
namespace chief {

/// Slate hash -> member list, used for slates not resolved up front
using SlateLookup = std::function<std::vector<Proposal>(const Hash256&)>;

// ============================================================================
// Voter State Builder
// ============================================================================

/**
 * Sequential last-write-wins replay of vote events.
 *
 * Slates found in the pre-resolved map are used directly; any other slate
 * goes through the lookup once and is then reused for the rest of the
 * replay.
 */
class VoterStateBuilder {
public:
    VoterStateBuilder(const std::map<Hash256, std::vector<Proposal>>& resolved, SlateLookup lookup);

    /**
     * Replay events in log order. Undecodable events are skipped and
     * leave the voter's earlier state untouched.
     */
    VoterMap Build(const std::vector<VoteEvent>& events);

    /// Events skipped by the last Build
    size_t GetSkipped() const { return skipped_; }

    /// Slates resolved through the lookup during the last Build
    size_t GetOnDemandSlates() const { return onDemand_; }

private:
    std::map<Hash256, std::vector<Proposal>> slates_;
    SlateLookup lookup_;
    size_t skipped_{0};
    size_t onDemand_{0};

    const std::vector<Proposal>& SlateMembers(const Hash256& slate);
};

// ============================================================================
// Weight Resolver
// ============================================================================

class WeightResolver {
public:
    /// The contract must outlive the resolver
    explicit WeightResolver(ChiefContract& chief);

    /**
     * Set every voter's weight to its current deposit, querying voters
     * concurrently on the pool. Throws ChiefError(Network) if any lookup
     * fails.
     */
    void Resolve(VoterMap& voters, util::ThreadPool& pool);

private:
    ChiefContract& chief_;
};

} // namespace chief
} // namespace chieftally

#endif // CHIEFTALLY_CHIEF_VOTERS_H
