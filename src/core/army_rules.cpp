#include "cataphract/core/army_rules.h"

#include <algorithm>
#include <cmath>

#include "cataphract/core/errors.h"
#include "cataphract/util/log.h"

namespace cataphract {

int army_supply_capacity(const Army& a, const SupplyRules& r) {
  int cap = 0;
  for (const auto& d : a.detachments) {
    cap += d.soldiers * (d.category == UnitCategory::Cavalry ? r.cavalry_capacity : r.infantry_capacity);
    cap += d.wagons * r.wagon_capacity;
  }
  return cap;
}

int army_daily_consumption(const Army& a, const SupplyRules& r) {
  int use = a.noncombatants * r.infantry_consumption;
  for (const auto& d : a.detachments) {
    use += d.soldiers * (d.category == UnitCategory::Cavalry ? r.cavalry_consumption : r.infantry_consumption);
    use += d.wagons * r.wagon_consumption;
  }
  return use;
}

void refresh_supply_capacity(Army& a, const SupplyRules& r) {
  a.supplies_capacity = army_supply_capacity(a, r);
  a.supplies_current = std::clamp(a.supplies_current, 0, a.supplies_capacity);
}

int supply_radius(const Army& a, Weather w, const SupplyRules& r) {
  int radius = r.base_supply_radius;
  if (army_soldiers(a, UnitCategory::Cavalry) > 0) radius += r.cavalry_radius_bonus;
  if (w == Weather::Rain) radius -= 1;
  if (w == Weather::Storm) radius -= 2;
  return std::max(0, radius);
}

int adjust_morale(Army& a, int delta, const MoraleRules& r) {
  a.morale_current = std::clamp(a.morale_current + delta, r.min, r.max);
  return a.morale_current;
}

namespace {

int losses_for(int count, double fraction) {
  if (count <= 0 || fraction <= 0.0) return 0;
  // The epsilon keeps 4000 * (0.2 + 0.1) at 1200, not 1201.
  return std::min(count, static_cast<int>(std::ceil(count * std::min(1.0, fraction) - 1e-9)));
}

void drop_empty_detachments(Army& a) {
  a.detachments.erase(std::remove_if(a.detachments.begin(), a.detachments.end(),
                                     [](const Detachment& d) { return d.soldiers <= 0; }),
                      a.detachments.end());
}

} // namespace

int apply_casualties(Army& a, double fraction, const SupplyRules& r) {
  int lost = 0;
  for (auto& d : a.detachments) {
    const int n = losses_for(d.soldiers, fraction);
    d.soldiers -= n;
    lost += n;
  }
  a.noncombatants -= losses_for(a.noncombatants, fraction);
  drop_empty_detachments(a);
  refresh_supply_capacity(a, r);
  return lost;
}

int apply_detachment_losses(Army& a, Id detachment_id, double fraction, const SupplyRules& r) {
  Detachment* d = find_detachment(a, detachment_id);
  if (!d) return 0;
  const int n = losses_for(d->soldiers, fraction);
  d->soldiers -= n;
  drop_empty_detachments(a);
  refresh_supply_capacity(a, r);
  return n;
}

const char* morale_consequence_label(MoraleConsequence c) {
  switch (c) {
    case MoraleConsequence::None: return "none";
    case MoraleConsequence::CampFollowers: return "camp_followers";
    case MoraleConsequence::DetachmentDeparts: return "detachment_departs";
    case MoraleConsequence::Desertion: return "desertion";
    case MoraleConsequence::MajorDesertion: return "major_desertion";
    case MoraleConsequence::MassDesertion: return "mass_desertion";
    case MoraleConsequence::Mutiny: return "mutiny";
  }
  return "none";
}

MoraleConsequence morale_consequence_for_roll(int roll) {
  if (roll <= 2) return MoraleConsequence::Mutiny;
  if (roll == 3) return MoraleConsequence::MassDesertion;
  if (roll == 4) return MoraleConsequence::MajorDesertion;
  if (roll <= 6) return MoraleConsequence::Desertion;
  if (roll == 7) return MoraleConsequence::DetachmentDeparts;
  if (roll <= 9) return MoraleConsequence::CampFollowers;
  return MoraleConsequence::None;
}

void rout_army(ResolveContext& ctx, Army& a, const std::string& reason) {
  if (a.status == ArmyStatus::Routed) return;
  a.status = ArmyStatus::Routed;
  a.movement_points_remaining = 0.0;
  a.siege_id = kInvalidId;
  ctx.dice.note("morale", "army:" + std::to_string(a.id), "routed (" + reason + ")", ctx.order_id, a.id);
  log::info("Army " + a.name + " routed: " + reason);
}

MoraleCheckResult morale_check(ResolveContext& ctx, Army& a, const std::string& reason) {
  const std::string context = "army:" + std::to_string(a.id) + ":" + reason;

  MoraleCheckResult out;
  RollSpec check;
  check.subsystem = "morale";
  check.context = context;
  check.count = 2;
  check.sides = 6;
  check.order_id = ctx.order_id;
  check.subject_id = a.id;
  check.purpose = "morale check vs " + std::to_string(a.morale_current);
  out.roll = ctx.dice.roll(check).total;
  out.passed = out.roll <= a.morale_current;
  if (out.passed) return out;

  RollSpec table = check;
  table.context = context + ":consequence";
  table.purpose = "morale consequence";
  out.consequence = morale_consequence_for_roll(ctx.dice.roll(table).total);

  const int before = army_soldiers(a);
  switch (out.consequence) {
    case MoraleConsequence::Mutiny:
      rout_army(ctx, a, "mutiny");
      break;
    case MoraleConsequence::MassDesertion:
      apply_casualties(a, 0.30, ctx.rules.supply);
      break;
    case MoraleConsequence::MajorDesertion:
      apply_casualties(a, 0.20, ctx.rules.supply);
      break;
    case MoraleConsequence::Desertion:
      apply_casualties(a, 0.10, ctx.rules.supply);
      break;
    case MoraleConsequence::DetachmentDeparts:
      if (a.detachments.size() > 1) {
        a.detachments.pop_back();
        refresh_supply_capacity(a, ctx.rules.supply);
      }
      break;
    case MoraleConsequence::CampFollowers:
      a.noncombatants += static_cast<int>(std::ceil(army_soldiers(a) * 0.05));
      break;
    case MoraleConsequence::None:
      break;
  }
  out.soldiers_lost = before - army_soldiers(a);

  ctx.dice.note("morale", context,
                std::string(morale_consequence_label(out.consequence)) + ", lost " + std::to_string(out.soldiers_lost),
                ctx.order_id, a.id);

  if (army_soldiers(a) <= 0) rout_army(ctx, a, "no soldiers left");
  if (a.morale_current <= ctx.rules.morale.rout_threshold) rout_army(ctx, a, "morale collapsed");
  return out;
}

void require_field_ready(const Army& a) {
  if (a.status == ArmyStatus::Routed) throw InvalidStateError("army " + std::to_string(a.id) + " is routed");
  if (a.status == ArmyStatus::Embarked || a.ship_id != kInvalidId) {
    throw InvalidStateError("army " + std::to_string(a.id) + " is embarked");
  }
}

} // namespace cataphract
