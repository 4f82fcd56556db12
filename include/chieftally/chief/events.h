// CHIEFTALLY - Event Log Reader
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License
//
// Reads slate creations (Etch) and ds-note vote logs from the chief.

#ifndef CHIEFTALLY_CHIEF_EVENTS_H
#define CHIEFTALLY_CHIEF_EVENTS_H

#include "chieftally/chief/types.h"
#include "chieftally/eth/node.h"

#include <cstdint>
#include <vector>

namespace chieftally {
namespace chief {

/**
 * Decode the calldata carried by a ds-note LogNote entry.
 *
 * The log data is abi(uint256 wad, bytes fax); fax holds the calldata of
 * the noted call. Anything other than a well-formed vote(address[]) or
 * vote(bytes32) yields UndecodedVote.
 */
VoteChoice DecodeVoteNote(const Bytes& logData);

/// Decode vote calldata (selector + arguments)
VoteChoice DecodeVoteCalldata(const Bytes& calldata);

/// Distinct slate hashes in first-seen order
std::vector<Hash256> UniqueSlates(const std::vector<EtchEvent>& etches);

class EventLogReader {
public:
    /// The node must outlive the reader
    EventLogReader(eth::NodeClient& node, const Address& chief, uint64_t fromBlock);

    /// Etch events in log order; throws ChiefError(Network) on failure
    std::vector<EtchEvent> ReadEtches();

    /// Vote notes in log order; throws ChiefError(Network) on failure
    std::vector<VoteEvent> ReadVotes();

private:
    eth::NodeClient& node_;
    Address chief_;
    uint64_t fromBlock_;

    std::vector<eth::LogEntry> Fetch(std::vector<Hash256> topic0, const char* what);
};

} // namespace chief
} // namespace chieftally

#endif // CHIEFTALLY_CHIEF_EVENTS_H
