#include "cataphract/core/combat.h"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "cataphract/core/army_rules.h"
#include "cataphract/core/errors.h"
#include "cataphract/util/log.h"
#include "cataphract/util/sorted_keys.h"

namespace cataphract {
namespace {

std::string sh_ctx(const Stronghold& s) { return "stronghold:" + std::to_string(s.id); }

Stronghold& require_stronghold(Campaign& c, Id id) {
  Stronghold* s = find_ptr(c.strongholds, id);
  if (!s) throw NotFoundError("stronghold " + std::to_string(id) + " not found");
  return *s;
}

void require_in_reach(const ResolveContext& ctx, const Army& army, const Stronghold& s) {
  const int d = ctx.map.distance(army.hex_id, s.hex_id);
  if (d < 0 || d > 1) {
    throw InvalidStateError("army " + std::to_string(army.id) + " is not at " +
                            (s.name.empty() ? sh_ctx(s) : s.name));
  }
}

// Attackers still present, besieging, and able to fight.
std::vector<Id> live_attackers(const ResolveContext& ctx, const Siege& siege, const Stronghold& s) {
  std::vector<Id> out;
  for (Id aid : siege.attacker_army_ids) {
    const Army* a = find_ptr(ctx.campaign.armies, aid);
    if (!a || a->status == ArmyStatus::Routed || a->siege_id != siege.id) continue;
    const int d = ctx.map.distance(a->hex_id, s.hex_id);
    if (d < 0 || d > 1) continue;
    out.push_back(aid);
  }
  return out;
}

void end_siege(Campaign& c, Siege& siege, Stronghold& s, SiegeStatus status) {
  siege.status = status;
  for (Id aid : siege.attacker_army_ids) {
    Army* a = find_ptr(c.armies, aid);
    if (!a || a->siege_id != siege.id) continue;
    a->siege_id = kInvalidId;
    if (a->status == ArmyStatus::Besieging) a->status = ArmyStatus::Idle;
  }
  s.siege_id = kInvalidId;
}

// Losses and morale shift of one side of a battle. Supplies are lost in the
// same proportion as soldiers. Returns the soldiers lost.
int apply_battle_result(Army& a, double losses, int morale_delta, const RulesConfig& rules) {
  const double f = std::clamp(losses, 0.0, 1.0);
  a.supplies_current -= static_cast<int>(std::floor(a.supplies_current * f));
  const int lost = apply_casualties(a, f, rules.supply);
  adjust_morale(a, morale_delta, rules.morale);
  return lost;
}

int category_bonus(const Detachment& d, const HarryRules& r) {
  if (d.category == UnitCategory::Cavalry) return r.cavalry_bonus;
  if (d.category == UnitCategory::Skirmisher) return r.skirmisher_bonus;
  return 0;
}

} // namespace

int siege_reduction_per_part(const Campaign& c, const Siege& siege, const SiegeRules& r) {
  int soldiers = 0;
  for (Id aid : siege.attacker_army_ids) {
    if (const Army* a = find_ptr(c.armies, aid)) soldiers += army_soldiers(*a);
  }
  int rate = r.base_reduction_per_part + siege.siege_engines * r.engine_reduction;
  if (r.soldiers_per_extra_reduction > 0) rate += soldiers / r.soldiers_per_extra_reduction;
  return std::max(1, rate);
}

int numeric_advantage(int own_soldiers, int other_soldiers, const BattleRules& r) {
  if (own_soldiers <= 0 || other_soldiers <= 0 || own_soldiers <= other_soldiers) return 0;
  const double ratio = static_cast<double>(own_soldiers) / static_cast<double>(other_soldiers);
  return std::min(r.max_numeric_bonus, static_cast<int>((ratio - 1.0) / 0.1 + 1e-9));
}

const CasualtyBand& casualty_band(int margin, const BattleRules& r) {
  static const CasualtyBand kNone;
  for (const auto& b : r.casualty_bands) {
    if (margin >= b.min_margin) return b;
  }
  return r.casualty_bands.empty() ? kNone : r.casualty_bands.back();
}

int morale_advantage(int morale, const MoraleRules& m, const BattleRules& r) {
  // Integer division truncates toward zero, matching (morale - resting) / 2.
  return std::clamp((morale - m.resting) / 2, -r.morale_bonus_cap, r.morale_bonus_cap);
}

OrderResult resolve_besiege(ResolveContext& ctx, Army& army, const BesiegeOrder& order) {
  require_field_ready(army);
  Campaign& c = ctx.campaign;
  Stronghold& s = require_stronghold(c, order.stronghold_id);
  if (s.controlling_faction_id == army.faction_id) {
    throw InvalidStateError("cannot besiege a stronghold held by the army's own faction");
  }
  require_in_reach(ctx, army, s);

  Siege* siege = find_ptr(c.sieges, s.siege_id);
  OrderResult res;
  if (siege && siege->status == SiegeStatus::Ongoing) {
    if (siege->attacker_faction_id != army.faction_id) {
      throw ConflictError("stronghold is already besieged by another faction");
    }
    if (std::find(siege->attacker_army_ids.begin(), siege->attacker_army_ids.end(), army.id) ==
        siege->attacker_army_ids.end()) {
      siege->attacker_army_ids.push_back(army.id);
    }
    siege->siege_engines += order.siege_engines;
  } else {
    const Id sid = allocate_id(c);
    Siege ns;
    ns.id = sid;
    ns.stronghold_id = s.id;
    ns.attacker_faction_id = army.faction_id;
    ns.attacker_army_ids.push_back(army.id);
    ns.siege_engines = order.siege_engines;
    ns.started = c.now();
    c.sieges[sid] = ns;
    s.siege_id = sid;
    siege = &c.sieges[sid];
    res.created_ids.push_back(sid);
  }

  army.status = ArmyStatus::Besieging;
  army.siege_id = siege->id;
  siege->reduction_per_part = siege_reduction_per_part(c, *siege, ctx.rules.siege);

  std::ostringstream ss;
  ss << "besieging " << (s.name.empty() ? sh_ctx(s) : s.name) << ": threshold " << s.current_threshold
     << ", -" << siege->reduction_per_part << " per part with " << siege->siege_engines << " engines";
  res.summary = ss.str();
  ctx.dice.note("siege", sh_ctx(s), res.summary, ctx.order_id, army.id);
  return res;
}

OrderResult resolve_assault(ResolveContext& ctx, Army& army, const AssaultOrder& order) {
  require_field_ready(army);
  Campaign& c = ctx.campaign;
  Stronghold& s = require_stronghold(c, order.stronghold_id);
  if (s.controlling_faction_id == army.faction_id) {
    throw InvalidStateError("cannot assault a stronghold held by the army's own faction");
  }
  require_in_reach(ctx, army, s);

  const BattleRules& br = ctx.rules.battle;
  Army* garrison = find_ptr(c.armies, s.garrison_army_id);
  if (garrison && garrison->status == ArmyStatus::Routed) garrison = nullptr;
  const int att_soldiers = army_soldiers(army);
  const int def_soldiers = garrison ? army_soldiers(*garrison) : 0;

  int engines = 0;
  if (const Siege* siege = find_ptr(c.sieges, s.siege_id)) {
    if (siege->status == SiegeStatus::Ongoing && siege->attacker_faction_id == army.faction_id) {
      engines = siege->siege_engines;
    }
  }

  RollSpec att;
  att.subsystem = "combat";
  att.context = "assault:" + sh_ctx(s) + ":attacker";
  att.count = br.dice;
  att.sides = br.sides;
  att.fixed = order.attacker_fixed_roll;
  att.order_id = ctx.order_id;
  att.subject_id = army.id;
  att.purpose = "assault attacker roll";
  att.modifiers = {{"attacker_modifier", order.attacker_modifier},
                   {"assault", br.assault_modifier},
                   {"numeric", numeric_advantage(att_soldiers, def_soldiers, br)},
                   {"morale", morale_advantage(army.morale_current, ctx.rules.morale, br)}};

  RollSpec def;
  def.subsystem = "combat";
  def.context = "assault:" + sh_ctx(s) + ":defender";
  def.count = br.dice;
  def.sides = br.sides;
  def.fixed = order.defender_fixed_roll;
  def.order_id = ctx.order_id;
  def.subject_id = s.id;
  def.purpose = "assault defender roll";
  def.modifiers = {{"defender_modifier", order.defender_modifier},
                   {"fortifications", std::max(0, s.defensive_bonus - engines)},
                   {"numeric", numeric_advantage(def_soldiers, att_soldiers, br)}};
  if (garrison) def.modifiers.push_back({"morale", morale_advantage(garrison->morale_current, ctx.rules.morale, br)});

  const RollResult ar = ctx.dice.roll(att);
  const RollResult dr = ctx.dice.roll(def);
  const bool captured = ar.total > dr.total;
  const int margin = std::abs(ar.total - dr.total);
  const CasualtyBand& band = casualty_band(margin, br);

  std::ostringstream ss;
  ss << "assault on " << (s.name.empty() ? sh_ctx(s) : s.name) << ": attacker " << ar.total << " vs defender "
     << dr.total << " => " << (captured ? "captured" : "repulsed");
  ctx.dice.note("combat", "assault:" + sh_ctx(s), ss.str(), ctx.order_id, army.id);

  // Both sides pay by the margin; a repulsed attacker pays extra.
  const double att_losses = captured ? band.winner_losses : band.loser_losses + br.failed_assault_losses;
  const int att_morale = captured ? band.winner_morale : band.loser_morale - ctx.rules.morale.failed_assault_penalty;
  const int att_lost = apply_battle_result(army, att_losses, att_morale, ctx.rules);
  int def_lost = 0;
  if (garrison) {
    def_lost = apply_battle_result(*garrison, captured ? band.loser_losses : band.winner_losses,
                                   captured ? band.loser_morale : band.winner_morale, ctx.rules);
  }
  std::ostringstream losses;
  losses << "margin " << margin << ": attacker lost " << att_lost << ", defender lost " << def_lost;
  ctx.dice.note("combat", "assault:" + sh_ctx(s), losses.str(), ctx.order_id, army.id);
  ss << "; attacker lost " << att_lost << " soldiers, defender lost " << def_lost;

  OrderResult res;
  if (captured) {
    capture_stronghold(ctx, s, army, order.pillage, order.escape_fixed_roll);
    if (order.pillage) ss << " and pillaged";
  } else {
    if (army_soldiers(army) <= 0) {
      rout_army(ctx, army, "destroyed in a failed assault");
    } else if (army.morale_current <= ctx.rules.morale.rout_threshold) {
      rout_army(ctx, army, "broken by a failed assault");
    }
    if (garrison && garrison->morale_current <= ctx.rules.morale.rout_threshold) {
      rout_army(ctx, *garrison, "broken while holding the walls");
    }
  }
  res.summary = ss.str();
  return res;
}

void capture_stronghold(ResolveContext& ctx, Stronghold& s, Army& army, bool pillage,
                        std::optional<int> escape_fixed_roll) {
  Campaign& c = ctx.campaign;
  const Id previous = s.controlling_faction_id;

  if (Siege* siege = find_ptr(c.sieges, s.siege_id)) end_siege(c, *siege, s, SiegeStatus::Captured);
  s.siege_id = kInvalidId;
  s.controlling_faction_id = army.faction_id;
  s.current_threshold = 0;
  if (Hex* h = find_ptr(c.map.hexes, s.hex_id)) {
    h->controlling_faction_id = army.faction_id;
    h->last_control_change_day = c.current_day;
  }

  if (Army* garrison = find_ptr(c.armies, s.garrison_army_id)) {
    apply_casualties(*garrison, ctx.rules.battle.garrison_capture_losses, ctx.rules.supply);
    rout_army(ctx, *garrison, "garrison of a fallen stronghold");
  }
  s.garrison_army_id = kInvalidId;

  if (Commander* cmd = find_ptr(c.commanders, s.defending_commander_id)) {
    const auto roll = ctx.dice.d(6, "combat", "escape:commander:" + std::to_string(cmd->id), escape_fixed_roll,
                                 ctx.order_id, cmd->id);
    if (roll.total <= ctx.rules.battle.commander_escape_chance) {
      ctx.dice.note("combat", sh_ctx(s), cmd->name + " escaped", ctx.order_id, cmd->id);
    } else {
      cmd->status = CommanderStatus::Captured;
      ctx.dice.note("combat", sh_ctx(s), cmd->name + " captured", ctx.order_id, cmd->id);
    }
  }
  s.defending_commander_id = kInvalidId;

  if (pillage) {
    const int loot = s.loot / 2;
    const int room = std::max(0, army.supplies_capacity - army.supplies_current);
    const int supplies = std::min(room, s.supplies / 2);
    army.loot += loot;
    army.supplies_current += supplies;
    s.loot -= loot;
    s.supplies -= supplies;
    adjust_morale(army, ctx.rules.morale.pillage_bonus, ctx.rules.morale);
    ctx.dice.note("combat", sh_ctx(s),
                  "pillaged " + std::to_string(loot) + " loot and " + std::to_string(supplies) + " supplies",
                  ctx.order_id, army.id);
  } else {
    adjust_morale(army, ctx.rules.morale.capture_bonus, ctx.rules.morale);
    // Held back from the spoils.
    morale_check(ctx, army, "restraint");
  }

  if (army.status == ArmyStatus::Besieging) army.status = ArmyStatus::Idle;
  army.siege_id = kInvalidId;

  ctx.dice.note("siege", sh_ctx(s),
                "control passed from faction " + std::to_string(previous) + " to faction " +
                    std::to_string(army.faction_id),
                ctx.order_id, army.id);
  log::info("Stronghold " + (s.name.empty() ? sh_ctx(s) : s.name) + " captured by army " + army.name);
}

void advance_sieges(ResolveContext& ctx) {
  Campaign& c = ctx.campaign;
  for (Id sid : util::sorted_keys(c.sieges)) {
    Siege& siege = c.sieges.at(sid);
    if (siege.status != SiegeStatus::Ongoing) continue;
    Stronghold* s = find_ptr(c.strongholds, siege.stronghold_id);
    if (!s) {
      siege.status = SiegeStatus::Lifted;
      continue;
    }

    const std::vector<Id> attackers = live_attackers(ctx, siege, *s);
    if (attackers.empty()) {
      end_siege(c, siege, *s, SiegeStatus::Lifted);
      s->current_threshold = s->base_threshold;
      ctx.dice.note("siege", sh_ctx(*s), "siege lifted; threshold reset to " + std::to_string(s->base_threshold),
                    kInvalidId, s->id);
      continue;
    }
    siege.attacker_army_ids = attackers;

    siege.reduction_per_part = siege_reduction_per_part(c, siege, ctx.rules.siege);
    const int before = s->current_threshold;
    s->current_threshold = std::max(0, before - siege.reduction_per_part);
    siege.parts_elapsed += 1;
    ctx.dice.note("siege", sh_ctx(*s),
                  "threshold " + std::to_string(before) + " -> " + std::to_string(s->current_threshold), kInvalidId,
                  s->id);

    if (s->current_threshold == 0) {
      for_entity(ctx, "siege", sh_ctx(*s), s->id, [&] {
        Army& lead = c.armies.at(attackers.front());
        capture_stronghold(ctx, *s, lead, false);
      });
    }
  }
}

OrderResult resolve_harry(ResolveContext& ctx, Army& army, const HarryOrder& order) {
  require_field_ready(army);
  Campaign& c = ctx.campaign;
  Army* target = find_ptr(c.armies, order.target_army_id);
  if (!target) throw NotFoundError("army " + std::to_string(order.target_army_id) + " not found");
  if (target->faction_id == army.faction_id) throw InvalidStateError("cannot harry a friendly army");
  const int d = ctx.map.distance(army.hex_id, target->hex_id);
  if (d < 0 || d > 1) throw InvalidStateError("target army is out of reach");

  const HarryRules& hr = ctx.rules.harry;
  int raiders = 0;
  int bonus = 0;
  for (Id did : order.detachment_ids) {
    const Detachment* det = find_detachment(army, did);
    if (!det) throw NotFoundError("detachment " + std::to_string(did) + " not found in army");
    raiders += det->soldiers;
    bonus = std::max(bonus, category_bonus(*det, hr));
  }
  if (raiders <= 0) throw InvalidStateError("harrying detachments have no soldiers");

  const int target_number = std::min(6, hr.base_success + bonus);
  const std::string context = "harry:army:" + std::to_string(target->id);
  const auto roll = ctx.dice.d(6, "harry", context, order.fixed_roll, ctx.order_id, army.id);
  const bool success = roll.total <= target_number;
  target->harried_today = true;
  army.status = ArmyStatus::Harrying;

  std::ostringstream ss;
  ss << harry_objective_label(order.objective) << " raid on army " << target->id << " (roll " << roll.total
     << " vs " << target_number << "): ";
  if (!success) {
    int lost = 0;
    for (Id did : order.detachment_ids) lost += apply_detachment_losses(army, did, hr.failure_loss_fraction, ctx.rules.supply);
    ss << "driven off, lost " << lost << " soldiers";
  } else {
    switch (order.objective) {
      case HarryObjective::Kill: {
        const int lost = apply_casualties(*target, hr.kill_fraction, ctx.rules.supply);
        ss << "killed " << lost;
        if (army_soldiers(*target) <= 0) rout_army(ctx, *target, "destroyed by raiders");
        break;
      }
      case HarryObjective::Torch: {
        RollSpec burn;
        burn.subsystem = "harry";
        burn.context = context + ":torch";
        burn.count = 2;
        burn.modifiers = {{"raider_bonus", bonus}};
        burn.order_id = ctx.order_id;
        burn.subject_id = target->id;
        burn.purpose = "supplies burned per raider";
        const int per = std::max(0, ctx.dice.roll(burn).total);
        const int burned = std::min(target->supplies_current, raiders * per);
        target->supplies_current -= burned;
        ss << "burned " << burned << " supplies";
        break;
      }
      case HarryObjective::Steal: {
        RollSpec take;
        take.subsystem = "harry";
        take.context = context + ":steal";
        take.count = 1;
        take.modifiers = {{"raider_bonus", bonus}};
        take.order_id = ctx.order_id;
        take.subject_id = target->id;
        take.purpose = "loot taken per raider";
        const int per = std::max(0, ctx.dice.roll(take).total);
        int budget = raiders * per;
        const int loot = std::min(target->loot, budget);
        target->loot -= loot;
        army.loot += loot;
        budget -= loot;
        const int room = std::max(0, army.supplies_capacity - army.supplies_current);
        const int supplies = std::min({target->supplies_current, budget, room});
        target->supplies_current -= supplies;
        army.supplies_current += supplies;
        ss << "stole " << loot << " loot and " << supplies << " supplies";
        break;
      }
    }
  }
  ctx.dice.note("harry", context, ss.str(), ctx.order_id, army.id);

  OrderResult res;
  res.summary = ss.str();
  return res;
}

} // namespace cataphract
