// CHIEFTALLY - Chief Contract
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License
//
// Typed read-only bindings for the governance contract (DSChief).

#ifndef CHIEFTALLY_CHIEF_CONTRACT_H
#define CHIEFTALLY_CHIEF_CONTRACT_H

#include "chieftally/chief/types.h"
#include "chieftally/eth/abi.h"
#include "chieftally/eth/node.h"

#include <cstdint>

namespace chieftally {
namespace chief {

/// Mainnet chief and its deployment block
constexpr const char* DEFAULT_CHIEF_ADDRESS = "0x9eF05f7F6deB616fd37aC3c959a2dDD25A54E4F5";
constexpr uint64_t DEFAULT_CHIEF_BLOCK = 7705361;

/// Signatures the pipeline relies on
namespace sig {
    constexpr const char* VOTE_YAYS = "vote(address[])";
    constexpr const char* VOTE_SLATE = "vote(bytes32)";
    constexpr const char* SLATES = "slates(bytes32,uint256)";
    constexpr const char* DEPOSITS = "deposits(address)";
    constexpr const char* HAT = "hat()";
    constexpr const char* ETCH = "Etch(bytes32)";

    // Spell (DSSpell) and mom
    constexpr const char* WHOM = "whom()";
    constexpr const char* DATA = "data()";
    constexpr const char* SET_FEE = "setFee(uint256)";
}

class ChiefContract {
public:
    /// The node must outlive this object
    ChiefContract(eth::NodeClient& node, const Address& address);

    const Address& GetAddress() const { return address_; }
    eth::NodeClient& GetNode() { return node_; }

    /**
     * Check that the declared interface exposes every function the
     * pipeline calls. Throws ChiefError(InterfaceMismatch) otherwise.
     */
    void VerifyInterface(const eth::ContractInterface& iface) const;

    /// slates(slate, index); ErrorKind::Range past the end
    eth::Result<Proposal> SlateMember(const Hash256& slate, uint64_t index);

    /// deposits(voter) in wei
    eth::Result<BigNum> Deposits(const Address& voter);

    /// hat()
    eth::Result<Proposal> Hat();

private:
    eth::NodeClient& node_;
    Address address_;
};

} // namespace chief
} // namespace chieftally

#endif // CHIEFTALLY_CHIEF_CONTRACT_H
