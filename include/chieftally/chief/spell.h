// CHIEFTALLY - Spell Decoder
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License
//
// A spell (DSSpell) is a proposal contract that will call `whom` with
// `data` once cast. Decoding recovers the call against whom's declared ABI.

#ifndef CHIEFTALLY_CHIEF_SPELL_H
#define CHIEFTALLY_CHIEF_SPELL_H

#include "chieftally/chief/types.h"
#include "chieftally/core/bignum.h"
#include "chieftally/eth/explorer.h"
#include "chieftally/eth/node.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace chieftally {
namespace chief {

/// Seconds in a 365-day year
constexpr uint64_t SECONDS_PER_YEAR = 60 * 60 * 24 * 365;

/// 10^27 as a decimal string
constexpr const char* RAY_DECIMAL = "1000000000000000000000000000";

/// ds-math rpow: x^n in 27-decimal fixed point, rounding each product
BigNum RayPow(const BigNum& x, uint64_t n);

/**
 * Annualized percentage of a per-second ray rate, two decimals,
 * e.g. "5.00%". Computes rate^SECONDS_PER_YEAR * 100 - 100.
 */
std::string AnnualPercentage(const BigNum& ray);

/// Description for known actions; nullopt otherwise
std::optional<std::string> DescribeAction(const eth::DecodedCall& call);

class SpellDecoder {
public:
    /// Both collaborators must outlive the decoder
    SpellDecoder(eth::NodeClient& node, eth::InterfaceCache& interfaces);

    /**
     * Decode the spell behind a proposal. Any failure comes back as an
     * error; callers treat it as "no spell".
     */
    eth::Result<Spell> Decode(const Proposal& proposal);

    /// Decode each proposal, keeping only successes
    std::map<Proposal, Spell> DecodeAll(const std::vector<Proposal>& proposals);

private:
    eth::NodeClient& node_;
    eth::InterfaceCache& interfaces_;
};

} // namespace chief
} // namespace chieftally

#endif // CHIEFTALLY_CHIEF_SPELL_H
