#include "cataphract/core/state_validation.h"

#include <cstdint>
#include <sstream>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "cataphract/core/errors.h"
#include "cataphract/util/sorted_keys.h"

namespace cataphract {

namespace {

void push(std::vector<std::string>& out, std::string msg) { out.push_back(std::move(msg)); }

template <typename... Parts>
std::string join(Parts&&... parts) {
  std::ostringstream ss;
  (ss << ... << std::forward<Parts>(parts));
  return ss.str();
}

unsigned long long id_u64(Id id) { return static_cast<unsigned long long>(id); }

template <typename Map>
void check_keys(const Map& m, const char* what, Id& max_id, std::vector<std::string>& errors) {
  for (const auto& [id, v] : m) {
    if (id > max_id) max_id = id;
    if (v.id != id) push(errors, join(what, " id mismatch: key=", id_u64(id), " value.id=", id_u64(v.id)));
  }
}

} // namespace

std::vector<std::string> validate_campaign(const Campaign& c) {
  std::vector<std::string> errors;

  auto has_hex = [&](Id id) { return c.map.hexes.count(id) != 0; };
  auto has_army = [&](Id id) { return c.armies.count(id) != 0; };
  auto has_faction = [&](Id id) { return c.factions.count(id) != 0; };

  // --- Arena keys + monotonic ids ---
  Id max_id = 0;
  check_keys(c.map.hexes, "Hex", max_id, errors);
  check_keys(c.factions, "Faction", max_id, errors);
  check_keys(c.commanders, "Commander", max_id, errors);
  check_keys(c.unit_types, "UnitType", max_id, errors);
  check_keys(c.armies, "Army", max_id, errors);
  check_keys(c.strongholds, "Stronghold", max_id, errors);
  check_keys(c.sieges, "Siege", max_id, errors);
  check_keys(c.ships, "Ship", max_id, errors);
  check_keys(c.messages, "Message", max_id, errors);
  check_keys(c.operations, "Operation", max_id, errors);
  check_keys(c.projects, "RecruitmentProject", max_id, errors);
  check_keys(c.contracts, "MercenaryContract", max_id, errors);
  check_keys(c.orders, "Order", max_id, errors);
  if (max_id != kInvalidId && c.next_id <= max_id) {
    push(errors, join("next_id is not monotonic: next_id=", id_u64(c.next_id), " max_existing_id=", id_u64(max_id)));
  }
  if (c.current_day < 0) push(errors, join("current_day is negative: ", c.current_day));

  // --- Armies ---
  for (Id id : util::sorted_keys(c.armies)) {
    const Army& a = c.armies.at(id);
    if (!has_hex(a.hex_id)) push(errors, join("Army ", id_u64(id), " is at unknown hex ", id_u64(a.hex_id)));
    if (a.supplies_current < 0) push(errors, join("Army ", id_u64(id), " has negative supplies ", a.supplies_current));
    if (a.supplies_current > a.supplies_capacity) {
      push(errors, join("Army ", id_u64(id), " supplies ", a.supplies_current, " exceed capacity ",
                        a.supplies_capacity));
    }
    if (a.loot < 0) push(errors, join("Army ", id_u64(id), " has negative loot ", a.loot));
    if (a.noncombatants < 0) push(errors, join("Army ", id_u64(id), " has negative noncombatants"));
    if (a.movement_points_remaining < 0.0) push(errors, join("Army ", id_u64(id), " has negative movement points"));
    if (!has_faction(a.faction_id)) {
      push(errors, join("Army ", id_u64(id), " references unknown faction ", id_u64(a.faction_id)));
    }
    for (const auto& d : a.detachments) {
      if (d.soldiers < 0 || d.wagons < 0) {
        push(errors, join("Army ", id_u64(id), " detachment ", id_u64(d.id), " has negative strength"));
      }
    }
    if (a.commander_id != kInvalidId) {
      const Commander* cmd = find_ptr(c.commanders, a.commander_id);
      if (!cmd) {
        push(errors, join("Army ", id_u64(id), " references unknown commander ", id_u64(a.commander_id)));
      } else if (cmd->army_id != id) {
        push(errors, join("Army ", id_u64(id), " commander ", id_u64(cmd->id), " leads army ", id_u64(cmd->army_id)));
      }
    }
    if (a.ship_id != kInvalidId && !c.ships.count(a.ship_id)) {
      push(errors, join("Army ", id_u64(id), " is aboard unknown ship ", id_u64(a.ship_id)));
    }
    for (Id oid : a.order_queue) {
      const Order* o = find_ptr(c.orders, oid);
      if (!o || o->status != OrderStatus::Pending) {
        push(errors, join("Army ", id_u64(id), " queue holds non-pending order ", id_u64(oid)));
      }
    }
  }

  // --- Commanders ---
  for (Id id : util::sorted_keys(c.commanders)) {
    const Commander& cmd = c.commanders.at(id);
    if (cmd.army_id != kInvalidId && !has_army(cmd.army_id)) {
      push(errors, join("Commander ", id_u64(id), " leads unknown army ", id_u64(cmd.army_id)));
    }
  }

  // --- Strongholds + sieges ---
  for (Id id : util::sorted_keys(c.strongholds)) {
    const Stronghold& s = c.strongholds.at(id);
    if (!has_hex(s.hex_id)) push(errors, join("Stronghold ", id_u64(id), " is at unknown hex ", id_u64(s.hex_id)));
    if (s.current_threshold < 0) {
      push(errors, join("Stronghold ", id_u64(id), " has negative threshold ", s.current_threshold));
    }
    if (s.siege_id != kInvalidId) {
      const Siege* siege = find_ptr(c.sieges, s.siege_id);
      if (!siege || siege->status != SiegeStatus::Ongoing || siege->stronghold_id != id) {
        push(errors, join("Stronghold ", id_u64(id), " points at inactive siege ", id_u64(s.siege_id)));
      }
    }
  }
  for (Id id : util::sorted_keys(c.sieges)) {
    const Siege& siege = c.sieges.at(id);
    if (siege.status != SiegeStatus::Ongoing) continue;
    const Stronghold* s = find_ptr(c.strongholds, siege.stronghold_id);
    if (!s || s->siege_id != id) push(errors, join("Ongoing siege ", id_u64(id), " is detached from its stronghold"));
  }

  // --- Ships ---
  for (Id id : util::sorted_keys(c.ships)) {
    const Ship& ship = c.ships.at(id);
    if (!has_hex(ship.hex_id)) push(errors, join("Ship ", id_u64(id), " is at unknown hex ", id_u64(ship.hex_id)));
    for (Id aid : ship.embarked_army_ids) {
      const Army* a = find_ptr(c.armies, aid);
      if (!a || a->ship_id != id) push(errors, join("Ship ", id_u64(id), " carries stray army ", id_u64(aid)));
    }
  }

  // --- Orders ---
  std::unordered_set<std::uint64_t> seqs;
  for (Id id : util::sorted_keys(c.orders)) {
    const Order& o = c.orders.at(id);
    if (!seqs.insert(o.submission_seq).second) {
      push(errors, join("Order ", id_u64(id), " reuses submission_seq ", o.submission_seq));
    }
    if (is_terminal(o.status) && !o.finished_at) push(errors, join("Order ", id_u64(id), " is terminal without finish"));
  }

  // --- Audit log ---
  std::uint64_t prev = 0;
  for (const auto& e : c.audit_log) {
    if (e.seq <= prev) {
      push(errors, join("Audit entry ", e.seq, " is out of order"));
      break;
    }
    prev = e.seq;
  }
  if (!c.audit_log.empty() && c.next_audit_seq <= c.audit_log.back().seq) {
    push(errors, "next_audit_seq does not follow the audit log");
  }

  return errors;
}

void require_valid_campaign(const Campaign& c) {
  const std::vector<std::string> errors = validate_campaign(c);
  if (errors.empty()) return;
  std::string msg = "campaign invariants violated: " + errors.front();
  if (errors.size() > 1) msg += " (+" + std::to_string(errors.size() - 1) + " more)";
  throw InvariantViolation(msg);
}

} // namespace cataphract
