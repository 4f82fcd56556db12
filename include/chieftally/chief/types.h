// CHIEFTALLY - Governance Types
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License
//
// Types shared by the tally pipeline: vote events, voter state, tally
// results and decoded spells.

#ifndef CHIEFTALLY_CHIEF_TYPES_H
#define CHIEFTALLY_CHIEF_TYPES_H

#include "chieftally/core/bignum.h"
#include "chieftally/core/types.h"
#include "chieftally/eth/abi.h"
#include "chieftally/eth/result.h"

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace chieftally {
namespace chief {

/// A proposal is identified by its contract address
using Proposal = Address;

/// Decimals of the deposited governance token
constexpr unsigned WEIGHT_DECIMALS = 18;

// ============================================================================
// Errors
// ============================================================================

/**
 * Fatal pipeline failure. Carries the taxonomy kind of the error that
 * aborted the run.
 */
class ChiefError : public std::runtime_error {
public:
    ChiefError(eth::ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(eth::ErrorKindToString(kind)) + ": " + message),
          kind_(kind) {}

    explicit ChiefError(const eth::Error& error) : ChiefError(error.kind, error.message) {}

    eth::ErrorKind GetKind() const { return kind_; }

private:
    eth::ErrorKind kind_;
};

// ============================================================================
// Events
// ============================================================================

/// vote(address[])
struct InlineVote {
    std::vector<Proposal> yays;
};

/// vote(bytes32)
struct SlateVote {
    Hash256 slate;
};

/// Calldata that matches no vote signature
struct UndecodedVote {
    std::string reason;
};

using VoteChoice = std::variant<InlineVote, SlateVote, UndecodedVote>;

/// Position of a log in the chain's total order
struct LogPosition {
    uint64_t blockNumber{0};
    uint64_t logIndex{0};

    bool operator<(const LogPosition& other) const {
        if (blockNumber != other.blockNumber) return blockNumber < other.blockNumber;
        return logIndex < other.logIndex;
    }
};

struct VoteEvent {
    Address voter;
    VoteChoice choice;
    LogPosition position;
};

/// Slate creation
struct EtchEvent {
    Hash256 slate;
    LogPosition position;
};

// ============================================================================
// Voter State
// ============================================================================

struct Voter {
    /// Choice set of the last decodable vote
    std::vector<Proposal> yays;

    /// Deposit in wei
    BigNum weight;
};

using VoterMap = std::map<Address, Voter>;

/// Exact decimal rendering of a wei amount, e.g. "1234.5"
inline std::string FormatWeight(const BigNum& wei) {
    return FormatUnits(wei, WEIGHT_DECIMALS);
}

// ============================================================================
// Tally
// ============================================================================

struct TallyEntry {
    Proposal proposal;
    BigNum total;
};

struct VoterWeight {
    Address voter;
    BigNum weight;
};

// ============================================================================
// Spell
// ============================================================================

/// Pending governance action decoded from a proposal contract
struct Spell {
    std::string name;
    std::vector<std::pair<std::string, eth::AbiValue>> args;
    std::optional<std::string> desc;
};

} // namespace chief
} // namespace chieftally

#endif // CHIEFTALLY_CHIEF_TYPES_H
