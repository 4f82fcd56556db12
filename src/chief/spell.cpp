// CHIEFTALLY - Spell Decoder Implementation
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License

#include "chieftally/chief/spell.h"
#include "chieftally/chief/contract.h"
#include "chieftally/util/logging.h"

namespace chieftally {
namespace chief {

// ============================================================================
// Rate Math
// ============================================================================

namespace {

const BigNum& Ray() {
    static const BigNum ray = BigNum::FromDecimal(RAY_DECIMAL);
    return ray;
}

BigNum RayMul(const BigNum& x, const BigNum& y) {
    static const BigNum half = Ray() / BigNum(2);
    return (x * y + half) / Ray();
}

} // namespace

BigNum RayPow(const BigNum& x, uint64_t n) {
    BigNum base = x;
    BigNum z = (n % 2 != 0) ? base : Ray();
    for (n /= 2; n != 0; n /= 2) {
        base = RayMul(base, base);
        if (n % 2 != 0) {
            z = RayMul(z, base);
        }
    }
    return z;
}

std::string AnnualPercentage(const BigNum& ray) {
    // Growth factor in hundredths of a percent, rounded half up
    const BigNum scale(10000);
    BigNum factor = (RayPow(ray, SECONDS_PER_YEAR) * scale + Ray() / BigNum(2)) / Ray();

    bool negative = factor < scale;
    BigNum hundredths = negative ? scale - factor : factor - scale;
    std::string cents = (hundredths % BigNum(100)).ToDecimal();
    if (cents.size() < 2) cents.insert(0, "0");

    return (negative ? "-" : "") + (hundredths / BigNum(100)).ToDecimal() + "." + cents + "%";
}

std::optional<std::string> DescribeAction(const eth::DecodedCall& call) {
    if (call.signature == sig::SET_FEE) {
        const eth::AbiValue* ray = call.Find("ray");
        if (!ray && !call.args.empty()) ray = &call.args.front().second;
        if (ray && ray->GetKind() == eth::AbiValue::Kind::Uint) {
            return AnnualPercentage(ray->GetNumber());
        }
    }
    return std::nullopt;
}

// ============================================================================
// SpellDecoder
// ============================================================================

SpellDecoder::SpellDecoder(eth::NodeClient& node, eth::InterfaceCache& interfaces)
    : node_(node), interfaces_(interfaces) {}

eth::Result<Spell> SpellDecoder::Decode(const Proposal& proposal) {
    auto spellIface = interfaces_.GetInterface(proposal);
    if (!spellIface) return spellIface.GetError();
    if (!spellIface.Value()->HasFunction(sig::WHOM) || !spellIface.Value()->HasFunction(sig::DATA)) {
        return eth::Result<Spell>::Fail(eth::ErrorKind::InterfaceMismatch, "not a spell");
    }

    auto whomRet = node_.Call(proposal, eth::EncodeCall(sig::WHOM));
    if (!whomRet) return whomRet.GetError();
    auto whom = eth::DecodeAddress(whomRet.Value());
    if (!whom) return whom.GetError();

    auto dataRet = node_.Call(proposal, eth::EncodeCall(sig::DATA));
    if (!dataRet) return dataRet.GetError();
    auto calldata = eth::DecodeDynamicBytes(dataRet.Value());
    if (!calldata) return calldata.GetError();

    auto momIface = interfaces_.GetInterface(whom.Value());
    if (!momIface) return momIface.GetError();

    auto call = momIface.Value()->DecodeFunctionInput(calldata.Value());
    if (!call) return call.GetError();

    Spell spell;
    spell.name = call.Value().name;
    spell.desc = DescribeAction(call.Value());
    spell.args = std::move(call.Value().args);
    return spell;
}

std::map<Proposal, Spell> SpellDecoder::DecodeAll(const std::vector<Proposal>& proposals) {
    CHIEFTALLY_LOG_TIMER(util::LogCategory::SPELL, "decode spells");

    std::map<Proposal, Spell> spells;
    for (const auto& proposal : proposals) {
        auto spell = Decode(proposal);
        if (!spell) {
            LOG_DEBUG(util::LogCategory::SPELL) << "No spell for " << proposal.ToChecksumHex()
                                                << ": " << spell.GetError().ToString();
            continue;
        }
        spells.emplace(proposal, std::move(spell.Value()));
    }
    return spells;
}

} // namespace chief
} // namespace chieftally
