// CHIEFTALLY - Report Rendering Implementation
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License

#include "chieftally/chief/report.h"
#include "chieftally/chief/tally.h"

#include <sstream>

namespace chieftally {
namespace chief {

namespace {

namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* MAGENTA = "\033[35m";
}

std::string ArgsToString(const Spell& spell) {
    std::string out = "{";
    for (size_t i = 0; i < spell.args.size(); ++i) {
        if (i > 0) out += ", ";
        out += spell.args[i].first + ": " + spell.args[i].second.ToString();
    }
    return out + "}";
}

} // namespace

rpc::JSONValue SpellToJSON(const Spell& spell) {
    rpc::JSONValue obj{rpc::JSONValue::Object{}};
    obj["name"] = spell.name;
    rpc::JSONValue args{rpc::JSONValue::Object{}};
    for (const auto& [name, value] : spell.args) {
        args[name] = value.ToJSON();
    }
    obj["args"] = std::move(args);
    obj["desc"] = spell.desc ? rpc::JSONValue(*spell.desc) : rpc::JSONValue();
    return obj;
}

rpc::JSONValue ReportToJSON(const Report& report) {
    rpc::JSONValue doc{rpc::JSONValue::Object{}};
    doc["hat"] = report.hat.ToChecksumHex();

    rpc::JSONValue proposals{rpc::JSONValue::Object{}};
    for (const auto& entry : report.results) {
        rpc::JSONValue item{rpc::JSONValue::Object{}};
        item["total"] = FormatWeight(entry.total);

        rpc::JSONValue voters{rpc::JSONValue::Object{}};
        for (const auto& supporter : VotersFor(entry.proposal, report.voters)) {
            voters[supporter.voter.ToChecksumHex()] = FormatWeight(supporter.weight);
        }
        item["voters"] = std::move(voters);

        auto spell = report.spells.find(entry.proposal);
        item["spell"] = spell != report.spells.end() ? SpellToJSON(spell->second) : rpc::JSONValue();

        proposals[entry.proposal.ToChecksumHex()] = std::move(item);
    }
    doc["proposals"] = std::move(proposals);
    return doc;
}

std::string RenderJSON(const Report& report) {
    return ReportToJSON(report).ToJSON(true) + "\n";
}

std::string RenderText(const Report& report, bool color) {
    std::ostringstream out;
    size_t rank = 0;
    for (const auto& entry : report.results) {
        ++rank;
        std::string line = std::to_string(rank) + ". " + entry.proposal.ToChecksumHex() + " " +
                           FormatWeight(entry.total);
        if (color) {
            out << (entry.proposal == report.hat ? ansi::GREEN : ansi::YELLOW) << ansi::BOLD
                << line << ansi::RESET << "\n";
        } else {
            out << line << "\n";
        }

        auto spell = report.spells.find(entry.proposal);
        if (spell != report.spells.end()) {
            const Spell& s = spell->second;
            std::string spellLine = "spell: " + s.name + " " + (s.desc ? *s.desc + " " : "") +
                                    ArgsToString(s);
            if (color) {
                out << ansi::MAGENTA << spellLine << ansi::RESET << "\n";
            } else {
                out << spellLine << "\n";
            }
        }

        for (const auto& supporter : VotersFor(entry.proposal, report.voters)) {
            out << "  " << supporter.voter.ToChecksumHex() << " " << FormatWeight(supporter.weight) << "\n";
        }
        out << "\n";
    }
    return out.str();
}

} // namespace chief
} // namespace chieftally
