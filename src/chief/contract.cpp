// CHIEFTALLY - Chief Contract Implementation
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License

#include "chieftally/chief/contract.h"
#include "chieftally/util/logging.h"

namespace chieftally {
namespace chief {

ChiefContract::ChiefContract(eth::NodeClient& node, const Address& address)
    : node_(node), address_(address) {}

void ChiefContract::VerifyInterface(const eth::ContractInterface& iface) const {
    static const char* const required[] = {
        sig::VOTE_YAYS, sig::VOTE_SLATE, sig::SLATES, sig::DEPOSITS, sig::HAT,
    };
    for (const char* signature : required) {
        if (!iface.HasFunction(signature)) {
            throw ChiefError(eth::ErrorKind::InterfaceMismatch,
                             "chief " + address_.ToChecksumHex() + " does not declare " + signature);
        }
    }
    LOG_DEBUG(util::LogCategory::CHIEF) << "Verified interface of " << address_.ToChecksumHex();
}

eth::Result<Proposal> ChiefContract::SlateMember(const Hash256& slate, uint64_t index) {
    auto ret = node_.Call(address_, eth::EncodeCall(sig::SLATES, {slate, eth::UintWord(index)}));
    if (!ret) return ret.GetError();
    return eth::DecodeAddress(ret.Value());
}

eth::Result<BigNum> ChiefContract::Deposits(const Address& voter) {
    auto ret = node_.Call(address_, eth::EncodeCall(sig::DEPOSITS, {voter.ToWord()}));
    if (!ret) return ret.GetError();
    return eth::DecodeUint(ret.Value());
}

eth::Result<Proposal> ChiefContract::Hat() {
    auto ret = node_.Call(address_, eth::EncodeCall(sig::HAT));
    if (!ret) return ret.GetError();
    return eth::DecodeAddress(ret.Value());
}

} // namespace chief
} // namespace chieftally
