// CHIEFTALLY - Voter State Implementation
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License

#include "chieftally/chief/voters.h"
#include "chieftally/util/logging.h"

#include <algorithm>

namespace chieftally {
namespace chief {

// ============================================================================
// VoterStateBuilder
// ============================================================================

VoterStateBuilder::VoterStateBuilder(const std::map<Hash256, std::vector<Proposal>>& resolved,
                                     SlateLookup lookup)
    : slates_(resolved), lookup_(std::move(lookup)) {}

const std::vector<Proposal>& VoterStateBuilder::SlateMembers(const Hash256& slate) {
    auto it = slates_.find(slate);
    if (it != slates_.end()) {
        return it->second;
    }
    ++onDemand_;
    LOG_DEBUG(util::LogCategory::VOTERS) << "Resolving unannounced slate " << slate.ToHex();
    std::vector<Proposal> members;
    if (lookup_) {
        members = lookup_(slate);
    }
    return slates_.emplace(slate, std::move(members)).first->second;
}

VoterMap VoterStateBuilder::Build(const std::vector<VoteEvent>& events) {
    skipped_ = 0;
    onDemand_ = 0;

    std::vector<const VoteEvent*> ordered;
    ordered.reserve(events.size());
    for (const auto& event : events) {
        ordered.push_back(&event);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const VoteEvent* a, const VoteEvent* b) { return a->position < b->position; });

    VoterMap voters;
    for (const VoteEvent* event : ordered) {
        if (const auto* undecoded = std::get_if<UndecodedVote>(&event->choice)) {
            ++skipped_;
            LOG_DEBUG(util::LogCategory::VOTERS) << "Skipping vote by " << event->voter.ToChecksumHex()
                                                 << " in block " << event->position.blockNumber
                                                 << ": " << undecoded->reason;
            continue;
        }

        Voter& voter = voters[event->voter];
        if (const auto* inlineVote = std::get_if<InlineVote>(&event->choice)) {
            voter.yays = inlineVote->yays;
        } else {
            voter.yays = SlateMembers(std::get<SlateVote>(event->choice).slate);
        }
    }

    LOG_DEBUG(util::LogCategory::VOTERS) << "Replayed " << events.size() << " votes into "
                                         << voters.size() << " voters, skipped " << skipped_;
    return voters;
}

// ============================================================================
// WeightResolver
// ============================================================================

WeightResolver::WeightResolver(ChiefContract& chief) : chief_(chief) {}

void WeightResolver::Resolve(VoterMap& voters, util::ThreadPool& pool) {
    CHIEFTALLY_LOG_TIMER(util::LogCategory::VOTERS, "resolve weights");

    std::vector<Address> addresses;
    addresses.reserve(voters.size());
    for (const auto& entry : voters) {
        addresses.push_back(entry.first);
    }

    auto deposits = util::ParallelMap(pool, addresses,
        [this](const Address& voter) { return chief_.Deposits(voter); });

    for (size_t i = 0; i < addresses.size(); ++i) {
        if (!deposits[i]) {
            throw ChiefError(eth::ErrorKind::Network,
                             "deposit of " + addresses[i].ToChecksumHex() + ": " +
                             deposits[i].GetError().message);
        }
        voters[addresses[i]].weight = deposits[i].Value();
    }
}

} // namespace chief
} // namespace chieftally
