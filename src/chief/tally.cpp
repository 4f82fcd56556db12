// CHIEFTALLY - Tally Engine Implementation
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License

#include "chieftally/chief/tally.h"
#include "chieftally/util/logging.h"

#include <algorithm>
#include <map>
#include <set>

namespace chieftally {
namespace chief {

std::vector<TallyEntry> Tally(const VoterMap& voters) {
    std::map<Proposal, BigNum> totals;
    for (const auto& [address, voter] : voters) {
        std::set<Proposal> distinct(voter.yays.begin(), voter.yays.end());
        for (const auto& proposal : distinct) {
            totals[proposal] += voter.weight;
        }
    }

    std::vector<TallyEntry> results;
    results.reserve(totals.size());
    for (auto& [proposal, total] : totals) {
        results.push_back(TallyEntry{proposal, std::move(total)});
    }
    std::sort(results.begin(), results.end(), [](const TallyEntry& a, const TallyEntry& b) {
        int cmp = a.total.Compare(b.total);
        if (cmp != 0) return cmp > 0;
        return a.proposal < b.proposal;
    });

    LOG_DEBUG(util::LogCategory::TALLY) << "Tallied " << results.size() << " proposals from "
                                        << voters.size() << " voters";
    return results;
}

std::vector<VoterWeight> VotersFor(const Proposal& proposal, const VoterMap& voters) {
    std::vector<VoterWeight> supporters;
    for (const auto& [address, voter] : voters) {
        if (voter.weight.IsZero()) continue;
        if (std::find(voter.yays.begin(), voter.yays.end(), proposal) == voter.yays.end()) continue;
        supporters.push_back(VoterWeight{address, voter.weight});
    }
    std::sort(supporters.begin(), supporters.end(), [](const VoterWeight& a, const VoterWeight& b) {
        int cmp = a.weight.Compare(b.weight);
        if (cmp != 0) return cmp > 0;
        return a.voter < b.voter;
    });
    return supporters;
}

BigNum SumTotals(const std::vector<TallyEntry>& results) {
    BigNum sum;
    for (const auto& entry : results) {
        sum += entry.total;
    }
    return sum;
}

} // namespace chief
} // namespace chieftally
