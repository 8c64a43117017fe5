#include "cataphract/util/digest.h"

#include <cstdint>
#include <cstring>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "cataphract/util/sorted_keys.h"

namespace cataphract {
namespace {

// FNV-1a 64-bit.
class Digest64 {
 public:
  void add_u8(std::uint8_t b) {
    h_ ^= static_cast<std::uint64_t>(b);
    h_ *= kPrime;
  }

  void add_u64(std::uint64_t v) {
    // Little-endian bytes regardless of host.
    for (int i = 0; i < 8; ++i) add_u8(static_cast<std::uint8_t>((v >> (i * 8)) & 0xFFu));
  }

  void add_i64(std::int64_t v) { add_u64(static_cast<std::uint64_t>(v)); }
  void add_size(std::size_t n) { add_u64(static_cast<std::uint64_t>(n)); }
  void add_bool(bool b) { add_u8(static_cast<std::uint8_t>(b ? 1 : 0)); }

  template <typename E, typename = std::enable_if_t<std::is_enum_v<E>>>
  void add_enum(E e) {
    using U = std::underlying_type_t<E>;
    add_u64(static_cast<std::uint64_t>(static_cast<U>(e)));
  }

  void add_string(const std::string& s) {
    add_size(s.size());
    for (unsigned char ch : s) add_u8(static_cast<std::uint8_t>(ch));
  }

  void add_double(double v) {
    std::uint64_t u = 0;
    static_assert(sizeof(u) == sizeof(v));
    std::memcpy(&u, &v, sizeof(u));
    if ((u << 1) == 0) u = 0; // -0.0
    add_u64(u);
  }

  void add_opt_int(const std::optional<int>& v) {
    add_bool(v.has_value());
    if (v) add_i64(*v);
  }

  void add_ids(const std::vector<Id>& ids) {
    add_size(ids.size());
    for (Id id : ids) add_u64(id);
  }

  void add_tick(const TickStamp& t) { add_i64(t.index()); }

  std::uint64_t value() const { return h_; }

 private:
  static constexpr std::uint64_t kOffset = 1469598103934665603ull;
  static constexpr std::uint64_t kPrime = 1099511628211ull;

  std::uint64_t h_{kOffset};
};

void hash_params(Digest64& d, const OrderParams& params) {
  d.add_size(params.index());
  std::visit(
      [&](const auto& o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, MoveOrder>) {
          d.add_enum(o.pace);
          d.add_size(o.legs.size());
          for (const auto& leg : o.legs) {
            d.add_u64(leg.to_hex_id);
            d.add_double(leg.distance_miles);
            d.add_bool(leg.on_road);
            d.add_bool(leg.has_river_ford);
            d.add_bool(leg.is_night);
            d.add_bool(leg.has_fork);
            d.add_u64(leg.alternate_hex_id);
            d.add_opt_int(leg.fixed_roll);
          }
        } else if constexpr (std::is_same_v<T, RestOrder>) {
          d.add_i64(o.duration_days);
        } else if constexpr (std::is_same_v<T, ForageOrder> || std::is_same_v<T, TorchOrder>) {
          d.add_ids(o.hex_ids);
          d.add_opt_int(o.fixed_roll);
        } else if constexpr (std::is_same_v<T, SupplyTransferOrder>) {
          d.add_u64(o.target_army_id);
          d.add_i64(o.amount);
        } else if constexpr (std::is_same_v<T, BesiegeOrder>) {
          d.add_u64(o.stronghold_id);
          d.add_i64(o.siege_engines);
        } else if constexpr (std::is_same_v<T, AssaultOrder>) {
          d.add_u64(o.stronghold_id);
          d.add_i64(o.attacker_modifier);
          d.add_i64(o.defender_modifier);
          d.add_opt_int(o.attacker_fixed_roll);
          d.add_opt_int(o.defender_fixed_roll);
          d.add_opt_int(o.escape_fixed_roll);
          d.add_bool(o.pillage);
        } else if constexpr (std::is_same_v<T, EmbarkOrder> || std::is_same_v<T, DisembarkOrder>) {
          d.add_u64(o.ship_id);
        } else if constexpr (std::is_same_v<T, NavalMoveOrder>) {
          d.add_u64(o.ship_id);
          d.add_ids(o.route);
        } else if constexpr (std::is_same_v<T, SendMessageOrder>) {
          d.add_u64(o.recipient_commander_id);
          d.add_string(o.content);
          d.add_enum(o.territory);
          d.add_opt_int(o.fixed_roll);
        } else if constexpr (std::is_same_v<T, LaunchOperationOrder>) {
          d.add_u64(o.operation_id);
          d.add_enum(o.type);
          d.add_enum(o.complexity);
          d.add_enum(o.territory);
          d.add_i64(o.difficulty_modifier);
          d.add_enum(o.target_kind);
          d.add_u64(o.target_id);
          d.add_i64(o.loot_cost);
          d.add_opt_int(o.fixed_roll);
          d.add_opt_int(o.exposure_fixed_roll);
        } else if constexpr (std::is_same_v<T, RaiseArmyOrder>) {
          d.add_u64(o.project_id);
          d.add_u64(o.stronghold_id);
          d.add_size(o.composition.size());
          for (const auto& u : o.composition) {
            d.add_u64(u.unit_type_id);
            d.add_i64(u.soldiers);
            d.add_i64(u.wagons);
          }
          d.add_u64(o.rally_hex_id);
          d.add_string(o.army_name);
          d.add_opt_int(o.revolt_fixed_roll);
        } else if constexpr (std::is_same_v<T, HarryOrder>) {
          d.add_ids(o.detachment_ids);
          d.add_u64(o.target_army_id);
          d.add_enum(o.objective);
          d.add_opt_int(o.fixed_roll);
        }
      },
      params);
}

void hash_result(Digest64& d, const std::optional<OrderResult>& r) {
  d.add_bool(r.has_value());
  if (!r) return;
  d.add_bool(r->partial);
  d.add_string(r->summary);
  d.add_bool(r->in_progress);
  d.add_enum(r->error);
  d.add_string(r->error_detail);
  d.add_u64(r->continuation_id);
  d.add_ids(r->created_ids);
}

void hash_army(Digest64& d, const Army& a) {
  d.add_u64(a.id);
  d.add_string(a.name);
  d.add_u64(a.faction_id);
  d.add_u64(a.commander_id);
  d.add_u64(a.hex_id);
  d.add_enum(a.status);
  d.add_size(a.detachments.size());
  for (const auto& det : a.detachments) {
    d.add_u64(det.id);
    d.add_string(det.name);
    d.add_u64(det.unit_type_id);
    d.add_enum(det.category);
    d.add_i64(det.soldiers);
    d.add_i64(det.wagons);
    d.add_bool(det.is_mercenary);
  }
  d.add_i64(a.noncombatants);
  d.add_i64(a.supplies_current);
  d.add_i64(a.supplies_capacity);
  d.add_i64(a.morale_current);
  d.add_double(a.movement_points_remaining);
  d.add_i64(a.loot);
  d.add_i64(a.days_without_supplies);
  d.add_bool(a.starved_today);
  d.add_bool(a.harried_today);
  d.add_i64(a.rest_until_day);
  d.add_u64(a.rest_order_id);
  d.add_u64(a.ship_id);
  d.add_u64(a.siege_id);
  d.add_ids(a.order_queue);
}

void hash_audit(Digest64& d, const AuditEntry& e) {
  d.add_u64(e.seq);
  d.add_tick(e.tick);
  d.add_string(e.subsystem);
  d.add_string(e.context);
  d.add_u64(e.order_id);
  d.add_u64(e.subject_id);
  d.add_u64(e.seed);
  d.add_i64(e.dice_count);
  d.add_i64(e.dice_sides);
  d.add_size(e.modifiers.size());
  for (const auto& [name, v] : e.modifiers) {
    d.add_string(name);
    d.add_i64(v);
  }
  d.add_opt_int(e.fixed_override);
  d.add_size(e.faces.size());
  for (int f : e.faces) d.add_i64(f);
  d.add_i64(e.raw);
  d.add_i64(e.total);
  d.add_string(e.effect);
}

} // namespace

std::uint64_t digest_campaign64(const Campaign& c, const DigestOptions& opt) {
  Digest64 d;
  d.add_u64(c.id);
  d.add_string(c.name);
  d.add_u64(c.seed);
  d.add_i64(c.current_day);
  d.add_enum(c.current_part);
  d.add_enum(c.season);
  d.add_enum(c.status);
  d.add_u64(c.next_id);
  d.add_u64(c.next_order_seq);
  d.add_u64(c.next_audit_seq);

  for (Id id : util::sorted_keys(c.map.hexes)) {
    const Hex& h = c.map.hexes.at(id);
    d.add_u64(id);
    d.add_i64(h.q);
    d.add_i64(h.r);
    d.add_enum(h.terrain);
    d.add_i64(h.settlement);
    d.add_bool(h.good_country);
    d.add_u64(h.controlling_faction_id);
    d.add_i64(h.foraging_times_remaining);
    d.add_i64(h.last_foraged_day);
    d.add_i64(h.torched_until_day);
    d.add_i64(h.last_revolt_day);
    d.add_i64(h.last_recruited_day);
    d.add_i64(h.last_control_change_day);
  }
  d.add_size(c.map.roads.size());
  for (const auto& r : c.map.roads) {
    d.add_u64(r.a);
    d.add_u64(r.b);
    d.add_double(r.cost_modifier);
  }
  d.add_size(c.map.river_crossings.size());
  for (const auto& x : c.map.river_crossings) {
    d.add_u64(x.a);
    d.add_u64(x.b);
  }
  d.add_size(c.map.sea_lanes.size());
  for (const auto& l : c.map.sea_lanes) {
    d.add_u64(l.a);
    d.add_u64(l.b);
    d.add_double(l.miles);
  }

  for (Id id : util::sorted_keys(c.commanders)) {
    const Commander& cmd = c.commanders.at(id);
    d.add_u64(id);
    d.add_string(cmd.name);
    d.add_u64(cmd.faction_id);
    d.add_u64(cmd.army_id);
    d.add_u64(cmd.hex_id);
    d.add_enum(cmd.status);
    d.add_ids(cmd.order_queue);
  }
  for (Id id : util::sorted_keys(c.armies)) hash_army(d, c.armies.at(id));
  for (Id id : util::sorted_keys(c.strongholds)) {
    const Stronghold& s = c.strongholds.at(id);
    d.add_u64(id);
    d.add_enum(s.type);
    d.add_u64(s.hex_id);
    d.add_u64(s.controlling_faction_id);
    d.add_i64(s.base_threshold);
    d.add_i64(s.current_threshold);
    d.add_i64(s.defensive_bonus);
    d.add_u64(s.garrison_army_id);
    d.add_u64(s.defending_commander_id);
    d.add_i64(s.loot);
    d.add_i64(s.supplies);
    d.add_u64(s.siege_id);
  }
  for (Id id : util::sorted_keys(c.sieges)) {
    const Siege& s = c.sieges.at(id);
    d.add_u64(id);
    d.add_u64(s.stronghold_id);
    d.add_u64(s.attacker_faction_id);
    d.add_ids(s.attacker_army_ids);
    d.add_i64(s.siege_engines);
    d.add_i64(s.reduction_per_part);
    d.add_tick(s.started);
    d.add_i64(s.parts_elapsed);
    d.add_enum(s.status);
  }
  for (Id id : util::sorted_keys(c.ships)) {
    const Ship& s = c.ships.at(id);
    d.add_u64(id);
    d.add_u64(s.faction_id);
    d.add_u64(s.hex_id);
    d.add_i64(s.capacity_soldiers);
    d.add_ids(s.embarked_army_ids);
    d.add_ids(s.route);
    d.add_double(s.progress_miles);
    d.add_enum(s.status);
    d.add_u64(s.voyage_order_id);
  }
  for (Id id : util::sorted_keys(c.messages)) {
    const Message& m = c.messages.at(id);
    d.add_u64(id);
    d.add_u64(m.sender_commander_id);
    d.add_u64(m.recipient_commander_id);
    d.add_string(m.content);
    d.add_enum(m.territory);
    d.add_double(m.distance_miles);
    d.add_tick(m.dispatched);
    d.add_tick(m.delivery);
    d.add_bool(m.delivered);
    d.add_enum(m.status);
  }
  for (Id id : util::sorted_keys(c.operations)) {
    const Operation& op = c.operations.at(id);
    d.add_u64(id);
    d.add_u64(op.commander_id);
    d.add_enum(op.type);
    d.add_enum(op.complexity);
    d.add_enum(op.territory);
    d.add_i64(op.difficulty_modifier);
    d.add_enum(op.target_kind);
    d.add_u64(op.target_id);
    d.add_i64(op.loot_cost);
    d.add_i64(op.stages_total);
    d.add_i64(op.stages_done);
    d.add_tick(op.last_stage);
    d.add_enum(op.status);
    d.add_enum(op.outcome);
    d.add_string(op.report);
  }
  for (Id id : util::sorted_keys(c.projects)) {
    const RecruitmentProject& p = c.projects.at(id);
    d.add_u64(id);
    d.add_u64(p.stronghold_id);
    d.add_u64(p.commander_id);
    d.add_u64(p.rally_hex_id);
    d.add_i64(p.progress);
    d.add_i64(p.progress_required);
    d.add_enum(p.status);
    d.add_u64(p.spawned_army_id);
  }
  for (Id id : util::sorted_keys(c.contracts)) {
    const MercenaryContract& k = c.contracts.at(id);
    d.add_u64(id);
    d.add_u64(k.army_id);
    d.add_u64(k.detachment_id);
    d.add_i64(k.daily_upkeep);
    d.add_i64(k.last_upkeep_day);
    d.add_i64(k.unpaid_days);
    d.add_bool(k.active);
  }
  for (Id id : util::sorted_keys(c.orders)) {
    const Order& o = c.orders.at(id);
    d.add_u64(id);
    d.add_u64(o.commander_id);
    d.add_u64(o.army_id);
    hash_params(d, o.params);
    d.add_opt_int(o.execute_day);
    d.add_bool(o.execute_part.has_value());
    if (o.execute_part) d.add_enum(*o.execute_part);
    d.add_i64(o.priority);
    d.add_u64(o.submission_seq);
    d.add_enum(o.status);
    hash_result(d, o.result);
    d.add_tick(o.submitted_at);
    d.add_bool(o.finished_at.has_value());
    if (o.finished_at) d.add_tick(*o.finished_at);
  }
  for (const auto& [day, w] : c.weather_by_day) {
    d.add_i64(day);
    d.add_enum(w);
  }

  if (opt.include_audit) {
    d.add_size(c.audit_log.size());
    for (const auto& e : c.audit_log) hash_audit(d, e);
  }
  return d.value();
}

std::string digest64_to_hex(std::uint64_t v) {
  std::ostringstream ss;
  ss << std::hex << std::setw(16) << std::setfill('0') << v;
  return ss.str();
}

} // namespace cataphract
