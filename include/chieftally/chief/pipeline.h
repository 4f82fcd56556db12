// CHIEFTALLY - Tally Pipeline
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License
//
// Runs the phases of a tally in order:
//   chief interface -> slates -> votes -> voters -> weights -> tally
//   -> spells -> hat
// Each fan-out phase gets its own worker pool, joined before the next
// phase starts.

#ifndef CHIEFTALLY_CHIEF_PIPELINE_H
#define CHIEFTALLY_CHIEF_PIPELINE_H

#include "chieftally/chief/slates.h"
#include "chieftally/chief/types.h"
#include "chieftally/eth/explorer.h"
#include "chieftally/eth/node.h"

#include <map>
#include <vector>

namespace chieftally {
namespace chief {

/// Everything the renderers need
struct Report {
    Proposal hat;
    std::vector<TallyEntry> results;
    VoterMap voters;
    std::map<Proposal, Spell> spells;
};

struct PipelineOptions {
    Address chief;
    uint64_t fromBlock{0};
    size_t workers{10};
    /// 0 means all ranked proposals
    size_t maxSpells{0};
};

class Pipeline {
public:
    /// All collaborators must outlive the pipeline
    Pipeline(eth::NodeClient& node, eth::InterfaceCache& interfaces, SlateCache& slates,
             const PipelineOptions& options);

    /// Run every phase; throws ChiefError on fatal failure
    Report Run();

private:
    eth::NodeClient& node_;
    eth::InterfaceCache& interfaces_;
    SlateCache& slates_;
    PipelineOptions options_;
};

} // namespace chief
} // namespace chieftally

#endif // CHIEFTALLY_CHIEF_PIPELINE_H
