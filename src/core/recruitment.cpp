#include "cataphract/core/recruitment.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include "cataphract/core/army_rules.h"
#include "cataphract/core/errors.h"
#include "cataphract/util/log.h"
#include "cataphract/util/sorted_keys.h"

namespace cataphract {
namespace {

std::string project_ctx(Id id) { return "project:" + std::to_string(id); }

void validate_composition(const Campaign& c, const std::vector<UnitComposition>& composition) {
  if (composition.empty()) throw ValidationError("raise_army needs at least one unit");
  for (const auto& u : composition) {
    if (!c.unit_types.count(u.unit_type_id)) {
      throw NotFoundError("unit type " + std::to_string(u.unit_type_id) + " not found");
    }
    if (u.soldiers <= 0 || u.wagons < 0) throw ValidationError("unit composition needs positive soldiers");
  }
}

Army& spawn_army(ResolveContext& ctx, RecruitmentProject& p, Commander& cmd) {
  Campaign& c = ctx.campaign;
  const SupplyRules& sr = ctx.rules.supply;

  Army a;
  a.id = allocate_id(c);
  a.name = p.army_name.empty() ? cmd.name + "'s army" : p.army_name;
  a.faction_id = p.faction_id;
  a.commander_id = cmd.id;
  a.hex_id = p.rally_hex_id;
  for (const auto& u : p.composition) {
    const UnitType& ut = c.unit_types.at(u.unit_type_id);
    Detachment d;
    d.id = allocate_id(c);
    d.name = ut.name;
    d.unit_type_id = ut.id;
    d.category = ut.category;
    d.soldiers = u.soldiers;
    d.wagons = u.wagons;
    a.detachments.push_back(d);
  }
  a.noncombatants = static_cast<int>(std::floor(army_soldiers(a) * sr.noncombatant_ratio));
  a.morale_current = ctx.rules.recruitment.starting_morale;
  a.movement_points_remaining = 0.0;
  refresh_supply_capacity(a, sr);
  a.supplies_current = std::min(a.supplies_capacity, army_daily_consumption(a, sr) * sr.starting_supply_days);

  cmd.army_id = a.id;
  cmd.hex_id = a.hex_id;
  const Id id = a.id;
  c.armies[id] = std::move(a);
  return c.armies.at(id);
}

// The hex rises against its new masters: a rebel faction, its leader and a
// levy of infantry appear on the spot. Returns the ids it created.
std::vector<Id> raise_rebels(ResolveContext& ctx, Hex& hex) {
  Campaign& c = ctx.campaign;
  const RecruitmentRules& rr = ctx.rules.recruitment;
  const SupplyRules& sr = ctx.rules.supply;
  const std::string tag = "revolt:hex:" + std::to_string(hex.id);
  std::vector<Id> created;

  Faction f;
  f.id = allocate_id(c);
  f.name = "Rebels of Hex " + std::to_string(hex.id);
  const Id faction_id = f.id;
  c.factions[faction_id] = std::move(f);
  created.push_back(faction_id);

  Commander leader;
  leader.id = allocate_id(c);
  leader.name = "Rebel Leader " + std::to_string(hex.id);
  leader.faction_id = faction_id;
  leader.hex_id = hex.id;
  const Id leader_id = leader.id;
  c.commanders[leader_id] = std::move(leader);
  created.push_back(leader_id);

  hex.controlling_faction_id = faction_id;
  hex.last_revolt_day = c.current_day;
  hex.last_control_change_day = c.current_day;

  const UnitType* infantry = nullptr;
  for (Id id : util::sorted_keys(c.unit_types)) {
    if (c.unit_types.at(id).category == UnitCategory::Infantry) {
      infantry = &c.unit_types.at(id);
      break;
    }
  }
  if (!infantry) {
    ctx.dice.note("recruitment", tag, "rebels rose but no infantry type exists to arm them", ctx.order_id, leader_id);
    return created;
  }

  const auto size = ctx.dice.d(rr.rebel_infantry_die, "recruitment", tag + ":size", std::nullopt, ctx.order_id, hex.id);
  Army a;
  a.id = allocate_id(c);
  a.name = "Rebels of Hex " + std::to_string(hex.id);
  a.faction_id = faction_id;
  a.commander_id = leader_id;
  a.hex_id = hex.id;
  Detachment d;
  d.id = allocate_id(c);
  d.name = infantry->name;
  d.unit_type_id = infantry->id;
  d.category = infantry->category;
  d.soldiers = std::max(rr.rebel_min_infantry, size.total * rr.rebel_infantry_per_pip);
  a.detachments.push_back(d);
  a.noncombatants = static_cast<int>(std::floor(d.soldiers * sr.noncombatant_ratio));
  a.morale_current = ctx.rules.morale.resting;
  a.movement_points_remaining = 0.0;
  refresh_supply_capacity(a, sr);
  a.supplies_current = std::min(a.supplies_capacity, army_daily_consumption(a, sr) * sr.starting_supply_days);

  c.commanders.at(leader_id).army_id = a.id;
  const Id army_id = a.id;
  ctx.dice.note("recruitment", tag, "rebel army " + std::to_string(army_id) + " of " + std::to_string(d.soldiers) +
                                        " infantry",
                ctx.order_id, army_id);
  log::info("Revolt in hex " + std::to_string(hex.id) + ": " + std::to_string(d.soldiers) + " rebels under arms");
  c.armies[army_id] = std::move(a);
  created.push_back(army_id);
  return created;
}

} // namespace

int levy_revolt_chance(const Hex& hex, int current_day, const RecruitmentRules& r) {
  if (hex.last_recruited_day < 0 || current_day - hex.last_recruited_day > r.cooldown_days) return 0;
  const bool recently_conquered = hex.controlling_faction_id != kInvalidId && hex.last_control_change_day >= 0 &&
                                  current_day - hex.last_control_change_day <= r.recently_conquered_days;
  return std::min(6, recently_conquered ? r.revolt_chance * 2 : r.revolt_chance);
}

int recruitment_rate(StrongholdType t, const RecruitmentRules& r) {
  switch (t) {
    case StrongholdType::Town: return r.town_rate;
    case StrongholdType::City: return r.city_rate;
    case StrongholdType::Fortress: return r.fortress_rate;
  }
  return r.town_rate;
}

const RecruitmentProject* open_project_for(const Campaign& c, Id stronghold_id, Id commander_id) {
  for (Id id : util::sorted_keys(c.projects)) {
    const RecruitmentProject& p = c.projects.at(id);
    if (p.stronghold_id != stronghold_id || p.commander_id != commander_id) continue;
    if (p.status == ProjectStatus::Active || p.status == ProjectStatus::Suspended) return &p;
  }
  return nullptr;
}

OrderResult resolve_raise_army(ResolveContext& ctx, const Commander& cmd, const RaiseArmyOrder& order) {
  Campaign& c = ctx.campaign;
  OrderResult res;

  if (order.project_id != kInvalidId) {
    RecruitmentProject* p = find_ptr(c.projects, order.project_id);
    if (!p) throw NotFoundError("recruitment project " + std::to_string(order.project_id) + " not found");
    if (p->commander_id != cmd.id) throw AuthorizationError("project belongs to another commander");
    if (p->status == ProjectStatus::Completed || p->status == ProjectStatus::Cancelled) {
      throw InvalidStateError("project " + std::to_string(p->id) + " is " + project_status_label(p->status));
    }
    const Stronghold& s = c.strongholds.at(p->stronghold_id);
    if (s.controlling_faction_id != p->faction_id) {
      throw InvalidStateError(s.name + " is not held by the project's faction");
    }
    const bool resumed = p->status == ProjectStatus::Suspended;
    p->status = ProjectStatus::Active;
    res.continuation_id = p->id;
    res.summary = std::string(resumed ? "resumed" : "continuing") + " recruitment at " + s.name + " (" +
                  std::to_string(p->progress) + "/" + std::to_string(p->progress_required) + ")";
    ctx.dice.note("recruitment", project_ctx(p->id), res.summary, ctx.order_id, p->id);
    return res;
  }

  const Stronghold* s = find_ptr(c.strongholds, order.stronghold_id);
  if (!s) throw NotFoundError("stronghold " + std::to_string(order.stronghold_id) + " not found");
  if (s->controlling_faction_id != cmd.faction_id) {
    throw AuthorizationError(s->name + " is not held by the commander's faction");
  }
  if (cmd.army_id != kInvalidId) throw InvalidStateError(cmd.name + " already leads an army");
  if (open_project_for(c, s->id, cmd.id)) {
    throw ConflictError("a recruitment project is already open at " + s->name + " for " + cmd.name);
  }
  validate_composition(c, order.composition);

  const Id rally = order.rally_hex_id != kInvalidId ? order.rally_hex_id : s->hex_id;
  if (!ctx.map.has_hex(rally)) throw NotFoundError("rally hex " + std::to_string(rally) + " not found");
  if (ctx.map.node(rally)->terrain == Terrain::Water) throw InvalidRouteError("cannot rally an army at sea");

  if (Hex* hex = find_ptr(c.map.hexes, s->hex_id)) {
    const int chance = levy_revolt_chance(*hex, c.current_day, ctx.rules.recruitment);
    if (chance > 0) {
      const auto roll = ctx.dice.d(6, "recruitment", "revolt:hex:" + std::to_string(hex->id), order.revolt_fixed_roll,
                                   ctx.order_id, hex->id);
      if (roll.total <= chance) {
        res.created_ids = raise_rebels(ctx, *hex);
        res.partial = true;
        res.summary = "levy at " + s->name + " provoked a revolt (roll " + std::to_string(roll.total) +
                      " <= " + std::to_string(chance) + "); recruitment abandoned";
        ctx.dice.note("recruitment", "revolt:hex:" + std::to_string(hex->id), res.summary, ctx.order_id, cmd.id);
        return res;
      }
    }
    hex->last_recruited_day = c.current_day;
  }

  RecruitmentProject p;
  p.id = allocate_id(c);
  p.stronghold_id = s->id;
  p.commander_id = cmd.id;
  p.faction_id = cmd.faction_id;
  p.composition = order.composition;
  p.rally_hex_id = rally;
  p.army_name = order.army_name;
  p.progress_required = ctx.rules.recruitment.progress_required;
  const Id id = p.id;
  c.projects[id] = std::move(p);

  res.continuation_id = id;
  res.created_ids.push_back(id);
  res.summary = "recruitment started at " + s->name;
  ctx.dice.note("recruitment", project_ctx(id), res.summary, ctx.order_id, id);
  log::debug("Recruitment project " + std::to_string(id) + " opened at " + s->name);
  return res;
}

void tick_recruitment(ResolveContext& ctx) {
  Campaign& c = ctx.campaign;
  for (Id id : util::sorted_keys(c.projects)) {
    RecruitmentProject& p = c.projects.at(id);
    if (p.status != ProjectStatus::Active) continue;

    for_entity(ctx, "recruitment", project_ctx(id), id, [&] {
      const Stronghold* s = find_ptr(c.strongholds, p.stronghold_id);
      if (!s || s->controlling_faction_id != p.faction_id) {
        p.status = ProjectStatus::Suspended;
        ctx.dice.note("recruitment", project_ctx(id), "suspended: stronghold lost", kInvalidId, id);
        return;
      }
      Commander* cmd = find_ptr(c.commanders, p.commander_id);
      if (!cmd || cmd->status != CommanderStatus::Active) {
        p.status = ProjectStatus::Cancelled;
        ctx.dice.note("recruitment", project_ctx(id), "cancelled: commander unavailable", kInvalidId, id);
        return;
      }

      p.progress = std::min(p.progress_required, p.progress + recruitment_rate(s->type, ctx.rules.recruitment));
      if (p.progress < p.progress_required) return;

      if (cmd->army_id != kInvalidId) {
        p.status = ProjectStatus::Cancelled;
        ctx.dice.note("recruitment", project_ctx(id), "cancelled: commander already leads an army", kInvalidId, id);
        return;
      }
      Army& a = spawn_army(ctx, p, *cmd);
      p.status = ProjectStatus::Completed;
      p.spawned_army_id = a.id;
      ctx.dice.note("recruitment", project_ctx(id),
                    "raised army " + std::to_string(a.id) + " (" + std::to_string(army_soldiers(a)) + " soldiers)",
                    kInvalidId, a.id);
      log::info("Army " + a.name + " raised at " + s->name);
    });
  }
}

int mercenary_daily_upkeep(const Detachment& d, const MercenaryRules& r) {
  const int per_hundred = d.category == UnitCategory::Cavalry ? r.cavalry_upkeep : r.infantry_upkeep;
  return (d.soldiers * per_hundred + 99) / 100;
}

void tick_mercenary_upkeep(ResolveContext& ctx) {
  Campaign& c = ctx.campaign;
  const MercenaryRules& mr = ctx.rules.mercenaries;
  for (Id id : util::sorted_keys(c.contracts)) {
    MercenaryContract& k = c.contracts.at(id);
    if (!k.active) continue;
    const int days_due = c.current_day - k.last_upkeep_day;
    if (days_due <= 0) continue;

    for_entity(ctx, "mercenaries", "contract:" + std::to_string(id), id, [&] {
      Army* a = find_ptr(c.armies, k.army_id);
      Detachment* d = a ? find_detachment(*a, k.detachment_id) : nullptr;
      if (!a || !d || a->status == ArmyStatus::Routed) {
        k.active = false;
        ctx.dice.note("mercenaries", "contract:" + std::to_string(id), "contract lapsed", kInvalidId, id);
        return;
      }
      k.last_upkeep_day = c.current_day;

      const int daily = k.daily_upkeep > 0 ? k.daily_upkeep : mercenary_daily_upkeep(*d, mr);
      const int owed = daily * days_due;
      if (a->loot >= owed) {
        a->loot -= owed;
        k.unpaid_days = 0;
        ctx.dice.note("mercenaries", "contract:" + std::to_string(id), "paid " + std::to_string(owed) + " loot",
                      kInvalidId, a->id);
        return;
      }

      k.unpaid_days += days_due;
      adjust_morale(*a, -mr.unpaid_morale_penalty, ctx.rules.morale);
      ctx.dice.note("mercenaries", "contract:" + std::to_string(id),
                    "unpaid for " + std::to_string(k.unpaid_days) + " days", kInvalidId, a->id);
      if (k.unpaid_days <= mr.grace_days) return;

      const auto roll = ctx.dice.d(6, "mercenaries", "desertion:contract:" + std::to_string(id), std::nullopt,
                                   kInvalidId, a->id);
      if (roll.total > mr.desertion_chance) return;

      const std::string name = d->name;
      const int soldiers = d->soldiers;
      a->detachments.erase(std::remove_if(a->detachments.begin(), a->detachments.end(),
                                          [&](const Detachment& x) { return x.id == k.detachment_id; }),
                           a->detachments.end());
      refresh_supply_capacity(*a, ctx.rules.supply);
      k.active = false;
      ctx.dice.note("mercenaries", "contract:" + std::to_string(id),
                    name + " deserted with " + std::to_string(soldiers) + " soldiers", kInvalidId, a->id);
      log::info("Mercenaries " + name + " deserted army " + a->name);
    });
  }
}

} // namespace cataphract
