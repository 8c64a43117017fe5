#pragma once

#include <string>
#include <vector>

#include "cataphract/core/audit.h"
#include "cataphract/util/json.h"

namespace cataphract {

// One flat object per entry:
//   seq, day, part, tick, subsystem, context, order_id, subject_id,
//   seed, dice, modifiers, fixed_override, faces, raw, total, effect
// Decision entries (no dice) carry dice="" and empty arrays.
json::Value audit_entry_to_json(const AuditEntry& e);

// Format audit entries as CSV. Modifiers are rendered "name:+v;name:-v" and
// faces "3;5". Entries are exported in the order provided.
std::string audit_to_csv(const std::vector<AuditEntry>& entries);

// A JSON array, pretty-printed, with a trailing newline.
std::string audit_to_json(const std::vector<AuditEntry>& entries);

// JSON Lines: one object per line, convenient for grep / jq pipelines.
std::string audit_to_jsonl(const std::vector<AuditEntry>& entries);

} // namespace cataphract
