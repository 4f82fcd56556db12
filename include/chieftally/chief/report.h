// CHIEFTALLY - Report Rendering
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License

#ifndef CHIEFTALLY_CHIEF_REPORT_H
#define CHIEFTALLY_CHIEF_REPORT_H

#include "chieftally/chief/pipeline.h"
#include "chieftally/rpc/json.h"

#include <string>

namespace chieftally {
namespace chief {

/// Spell as {name, args, desc}
rpc::JSONValue SpellToJSON(const Spell& spell);

/// {hat, proposals: {proposal: {total, voters, spell}}} in ranked order
rpc::JSONValue ReportToJSON(const Report& report);

/// Pretty-printed JSON document with a trailing newline
std::string RenderJSON(const Report& report);

/**
 * Ranked text listing. Each proposal line is followed by its spell (if
 * decoded), its supporters and a blank line. The hat is highlighted when
 * colors are enabled.
 */
std::string RenderText(const Report& report, bool color);

} // namespace chief
} // namespace chieftally

#endif // CHIEFTALLY_CHIEF_REPORT_H
