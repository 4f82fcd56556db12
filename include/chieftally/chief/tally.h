// CHIEFTALLY - Tally Engine
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License

#ifndef CHIEFTALLY_CHIEF_TALLY_H
#define CHIEFTALLY_CHIEF_TALLY_H

#include "chieftally/chief/types.h"

#include <vector>

namespace chieftally {
namespace chief {

/**
 * Total weight behind every proposal that appears in some voter's yays.
 * Each voter counts once per distinct proposal. Sorted by descending
 * total, ties by ascending proposal bytes.
 */
std::vector<TallyEntry> Tally(const VoterMap& voters);

/**
 * Voters with positive weight whose yays contain the proposal. Sorted by
 * descending weight, ties by ascending address bytes.
 */
std::vector<VoterWeight> VotersFor(const Proposal& proposal, const VoterMap& voters);

/// Sum of all totals
BigNum SumTotals(const std::vector<TallyEntry>& results);

} // namespace chief
} // namespace chieftally

#endif // CHIEFTALLY_CHIEF_TALLY_H
