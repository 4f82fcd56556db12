// CHIEFTALLY - Tally Pipeline Implementation
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License

#include "chieftally/chief/pipeline.h"
#include "chieftally/chief/contract.h"
#include "chieftally/chief/events.h"
#include "chieftally/chief/spell.h"
#include "chieftally/chief/tally.h"
#include "chieftally/chief/voters.h"
#include "chieftally/util/logging.h"
#include "chieftally/util/threadpool.h"

namespace chieftally {
namespace chief {

Pipeline::Pipeline(eth::NodeClient& node, eth::InterfaceCache& interfaces, SlateCache& slates,
                   const PipelineOptions& options)
    : node_(node), interfaces_(interfaces), slates_(slates), options_(options) {}

Report Pipeline::Run() {
    CHIEFTALLY_LOG_TIMER(util::LogCategory::BENCH, "tally");

    ChiefContract chief(node_, options_.chief);
    auto iface = interfaces_.GetInterface(options_.chief);
    if (!iface) {
        throw ChiefError(iface.GetError().kind == eth::ErrorKind::Decode
                             ? eth::ErrorKind::InterfaceMismatch : iface.GetError().kind,
                         "chief interface: " + iface.GetError().message);
    }
    chief.VerifyInterface(*iface.Value());
    LOG_INFO(util::LogCategory::CHIEF) << "got chief";

    EventLogReader reader(node_, options_.chief, options_.fromBlock);
    std::vector<Hash256> slateHashes = UniqueSlates(reader.ReadEtches());
    LOG_INFO(util::LogCategory::SLATES) << "got slates";

    SlateResolver resolver(chief, slates_);
    SlateMap resolved;
    {
        util::ThreadPool pool(util::ThreadPool::Config{options_.workers, 100000, "slates"});
        resolved = resolver.ResolveAll(slateHashes, pool);
    }
    LOG_INFO(util::LogCategory::SLATES) << "got yays";

    std::vector<VoteEvent> votes = reader.ReadVotes();
    LOG_INFO(util::LogCategory::VOTERS) << "got notes";

    VoterStateBuilder builder(resolved,
        [&resolver](const Hash256& slate) { return resolver.ResolveOrEmpty(slate); });
    Report report;
    report.voters = builder.Build(votes);
    {
        util::ThreadPool pool(util::ThreadPool::Config{options_.workers, 100000, "weights"});
        WeightResolver(chief).Resolve(report.voters, pool);
    }
    LOG_INFO(util::LogCategory::VOTERS) << "got voters";

    report.results = Tally(report.voters);
    LOG_INFO(util::LogCategory::TALLY) << "got results";

    std::vector<Proposal> candidates;
    for (const auto& entry : report.results) {
        if (options_.maxSpells != 0 && candidates.size() >= options_.maxSpells) break;
        candidates.push_back(entry.proposal);
    }
    report.spells = SpellDecoder(node_, interfaces_).DecodeAll(candidates);
    LOG_INFO(util::LogCategory::SPELL) << "got spells";

    auto hat = chief.Hat();
    if (!hat) {
        throw ChiefError(eth::ErrorKind::Network, "hat: " + hat.GetError().message);
    }
    report.hat = hat.Value();
    LOG_INFO(util::LogCategory::CHIEF) << "got hat";

    return report;
}

} // namespace chief
} // namespace chieftally
