// CHIEFTALLY - Event Log Reader Implementation
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License

#include "chieftally/chief/events.h"
#include "chieftally/chief/contract.h"
#include "chieftally/core/hex.h"
#include "chieftally/util/logging.h"

#include <algorithm>
#include <cstring>
#include <set>

namespace chieftally {
namespace chief {

namespace {

// LogNote data layout: wad, offset of fax, fax length, fax bytes
constexpr size_t FAX_LENGTH_OFFSET = 64;
constexpr size_t FAX_OFFSET = 96;

} // namespace

VoteChoice DecodeVoteCalldata(const Bytes& calldata) {
    if (calldata.size() < 4) {
        return UndecodedVote{"calldata shorter than a selector"};
    }
    eth::Selector selector;
    std::memcpy(selector.data(), calldata.data(), selector.size());
    const Byte* args = calldata.data() + 4;
    size_t argsLen = calldata.size() - 4;

    static const eth::Selector voteYays = eth::FunctionSelector(sig::VOTE_YAYS);
    static const eth::Selector voteSlate = eth::FunctionSelector(sig::VOTE_SLATE);

    if (selector == voteYays) {
        auto values = eth::DecodeParams({"address[]"}, args, argsLen);
        if (!values) return UndecodedVote{values.GetError().message};
        InlineVote vote;
        for (const auto& item : values.Value()[0].GetItems()) {
            vote.yays.push_back(item.GetAddress());
        }
        return vote;
    }
    if (selector == voteSlate) {
        auto values = eth::DecodeParams({"bytes32"}, args, argsLen);
        if (!values) return UndecodedVote{values.GetError().message};
        const Bytes& raw = values.Value()[0].GetBytes();
        return SlateVote{Hash256(raw.data(), raw.size())};
    }
    return UndecodedVote{"unknown selector " + BytesToHex(selector.data(), selector.size())};
}

VoteChoice DecodeVoteNote(const Bytes& logData) {
    if (logData.size() < FAX_OFFSET) {
        return UndecodedVote{"note data too short"};
    }
    uint64_t faxLen = 0;
    for (size_t i = FAX_LENGTH_OFFSET; i < FAX_OFFSET; ++i) {
        if (i < FAX_OFFSET - 8 && logData[i] != 0) {
            return UndecodedVote{"fax length out of range"};
        }
        faxLen = (faxLen << 8) | logData[i];
    }
    size_t available = logData.size() - FAX_OFFSET;
    if (faxLen > available) {
        return UndecodedVote{"fax truncated"};
    }
    Bytes calldata(logData.begin() + FAX_OFFSET, logData.begin() + FAX_OFFSET + faxLen);
    return DecodeVoteCalldata(calldata);
}

std::vector<Hash256> UniqueSlates(const std::vector<EtchEvent>& etches) {
    std::vector<Hash256> slates;
    std::set<Hash256> seen;
    for (const auto& etch : etches) {
        if (seen.insert(etch.slate).second) {
            slates.push_back(etch.slate);
        }
    }
    return slates;
}

// ============================================================================
// EventLogReader
// ============================================================================

EventLogReader::EventLogReader(eth::NodeClient& node, const Address& chief, uint64_t fromBlock)
    : node_(node), chief_(chief), fromBlock_(fromBlock) {}

std::vector<eth::LogEntry> EventLogReader::Fetch(std::vector<Hash256> topic0, const char* what) {
    eth::LogFilter filter;
    filter.address = chief_;
    filter.topics.push_back(std::move(topic0));
    filter.fromBlock = fromBlock_;

    auto logs = node_.GetLogs(filter);
    if (!logs) {
        throw ChiefError(eth::ErrorKind::Network,
                         std::string("cannot read ") + what + ": " + logs.GetError().message);
    }
    std::vector<eth::LogEntry> entries = std::move(logs.Value());
    std::stable_sort(entries.begin(), entries.end());
    LOG_DEBUG(util::LogCategory::CHIEF) << "Read " << entries.size() << " " << what
                                        << " logs from block " << fromBlock_;
    return entries;
}

std::vector<EtchEvent> EventLogReader::ReadEtches() {
    std::vector<EtchEvent> etches;
    for (const auto& log : Fetch({eth::EventTopic(sig::ETCH)}, "Etch")) {
        if (log.topics.size() < 2) {
            LOG_WARN(util::LogCategory::SLATES) << "Etch log without slate topic in block "
                                                << log.blockNumber;
            continue;
        }
        etches.push_back(EtchEvent{log.topics[1], LogPosition{log.blockNumber, log.logIndex}});
    }
    return etches;
}

std::vector<VoteEvent> EventLogReader::ReadVotes() {
    std::vector<VoteEvent> votes;
    auto logs = Fetch({eth::NoteTopic(sig::VOTE_YAYS), eth::NoteTopic(sig::VOTE_SLATE)}, "vote");
    votes.reserve(logs.size());
    for (const auto& log : logs) {
        if (log.topics.size() < 2) {
            LOG_WARN(util::LogCategory::VOTERS) << "Vote note without sender topic in block "
                                                << log.blockNumber;
            continue;
        }
        VoteEvent vote;
        vote.voter = Address::FromWord(log.topics[1]);
        vote.choice = DecodeVoteNote(log.data);
        vote.position = LogPosition{log.blockNumber, log.logIndex};
        votes.push_back(std::move(vote));
    }
    return votes;
}

} // namespace chief
} // namespace chieftally
