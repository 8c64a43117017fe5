#include "cataphract/core/logistics.h"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "cataphract/core/army_rules.h"
#include "cataphract/core/errors.h"
#include "cataphract/util/log.h"
#include "cataphract/util/sorted_keys.h"

namespace cataphract {
namespace {

constexpr double kEps = 1e-9;

std::string hex_ref(Id id) { return "hex " + std::to_string(id); }

// Hostile ground makes the locals quicker to rise.
int revolt_chance(const Army& army, const Hex& hex, int base, const SupplyRules& r) {
  int chance = base;
  if (hex.controlling_faction_id != kInvalidId && hex.controlling_faction_id != army.faction_id) {
    chance += r.hostile_revolt_bonus;
  }
  return chance;
}

bool roll_revolt(ResolveContext& ctx, const Army& army, Hex& hex, int chance, std::optional<int> fixed,
                 const char* cause) {
  const auto roll = ctx.dice.d(6, "logistics", std::string(cause) + ":hex:" + std::to_string(hex.id), fixed,
                               ctx.order_id, hex.id);
  if (roll.total > chance) return false;
  hex.controlling_faction_id = kInvalidId;
  hex.last_revolt_day = ctx.campaign.current_day;
  hex.last_control_change_day = ctx.campaign.current_day;
  ctx.dice.note("logistics", std::string(cause) + ":hex:" + std::to_string(hex.id),
                "revolt in " + (hex.name.empty() ? hex_ref(hex.id) : hex.name) + " (roll " +
                    std::to_string(roll.total) + " <= " + std::to_string(chance) + ")",
                ctx.order_id, army.id);
  return true;
}

// Every target hex must exist and lie inside the army's supply radius.
void check_supply_reach(const ResolveContext& ctx, const Army& army, const std::vector<Id>& hex_ids) {
  const int radius = supply_radius(army, ctx.weather(), ctx.rules.supply);
  for (Id h : hex_ids) {
    if (!ctx.map.has_hex(h)) throw InvalidRouteError(hex_ref(h) + " does not exist");
    const int d = ctx.map.distance(army.hex_id, h);
    if (d < 0 || d > radius) {
      throw InvalidRouteError(hex_ref(h) + " is " + std::to_string(d) + " hexes away, beyond supply radius " +
                              std::to_string(radius));
    }
  }
}

} // namespace

double effective_speed(const MoveLeg& leg, MarchPace pace, bool cavalry_only, Weather weather,
                       const MovementRules& r, const Road* road) {
  double speed = r.base_miles_per_day;
  if (leg.on_road) {
    speed *= r.road_modifier * (road ? road->cost_modifier : 1.0);
  } else {
    speed *= r.offroad_modifier;
  }
  if (leg.is_night) speed *= r.night_modifier;
  if (pace == MarchPace::Forced) speed *= cavalry_only ? r.cavalry_forced_multiplier : r.forced_multiplier;

  if (r.weather_mode == WeatherMode::Multiplicative) {
    if (weather == Weather::Rain) speed *= r.rain_factor;
    if (weather == Weather::Storm) speed *= r.storm_factor;
  } else {
    if (weather == Weather::Rain) speed += r.rain_miles;
    if (weather == Weather::Storm) speed += r.storm_miles;
  }
  return std::max(1.0, speed);
}

int march_supply_cost(const Army& a, double miles, const SupplyRules& r) {
  const double soldiers = static_cast<double>(army_soldiers(a) + a.noncombatants);
  const double cost = miles * soldiers / 1000.0 * r.march_supply_per_mile_per_1000;
  return std::max(0, static_cast<int>(std::ceil(cost - kEps)));
}

int fork_misdirection_chance(const MoveLeg& leg, const MovementRules& r) {
  int chance = r.fork_base_chance;
  if (!leg.on_road) chance += r.fork_offroad_bonus;
  if (leg.is_night) chance += r.fork_night_bonus;
  return std::clamp(chance, 0, 6);
}

OrderResult resolve_move(ResolveContext& ctx, Army& army, const MoveOrder& order) {
  require_field_ready(army);
  if (army.status == ArmyStatus::Resting && army.rest_until_day > ctx.campaign.current_day) {
    throw InvalidStateError("army " + std::to_string(army.id) + " is resting until day " +
                            std::to_string(army.rest_until_day));
  }
  if (order.legs.empty()) throw ValidationError("move requires at least one leg");

  // Validate the intended path up front; nothing moves if any leg is impossible.
  Id from = army.hex_id;
  for (std::size_t i = 0; i < order.legs.size(); ++i) {
    const MoveLeg& leg = order.legs[i];
    const std::string where = "leg " + std::to_string(i + 1) + ": ";
    if (!ctx.map.has_hex(leg.to_hex_id)) throw InvalidRouteError(where + hex_ref(leg.to_hex_id) + " does not exist");
    if (leg.has_fork && !ctx.map.has_hex(leg.alternate_hex_id)) {
      throw InvalidRouteError(where + "alternate " + hex_ref(leg.alternate_hex_id) + " does not exist");
    }
    if (leg.has_river_ford && !ctx.map.has_ford(from, leg.to_hex_id)) {
      throw InvalidRouteError(where + "no river ford between " + hex_ref(from) + " and " + hex_ref(leg.to_hex_id));
    }
    if (leg.on_road && !ctx.map.road_between(from, leg.to_hex_id)) {
      throw InvalidRouteError(where + "no road between " + hex_ref(from) + " and " + hex_ref(leg.to_hex_id));
    }
    from = leg.to_hex_id;
  }

  const bool cavalry_only = army_cavalry_only(army);
  const Weather weather = ctx.weather();

  OrderResult res;
  std::size_t done = 0;
  bool diverted = false;
  std::string stop_reason;
  double miles = 0.0;
  int supplies_used = 0;

  for (const MoveLeg& leg : order.legs) {
    const Road* road = leg.on_road ? ctx.map.road_between(army.hex_id, leg.to_hex_id) : nullptr;
    const double speed = effective_speed(leg, order.pace, cavalry_only, weather, ctx.rules.movement, road);
    const double points = leg.distance_miles / speed;
    const int supply = march_supply_cost(army, leg.distance_miles, ctx.rules.supply);

    if (points > army.movement_points_remaining + kEps) {
      stop_reason = "out of movement";
      break;
    }
    if (supply > army.supplies_current) {
      stop_reason = "out of supplies";
      break;
    }

    army.movement_points_remaining = std::max(0.0, army.movement_points_remaining - points);
    army.supplies_current -= supply;
    supplies_used += supply;
    miles += leg.distance_miles;

    Id dest = leg.to_hex_id;
    if (leg.has_fork) {
      const int chance = fork_misdirection_chance(leg, ctx.rules.movement);
      const auto roll = ctx.dice.d(6, "logistics", "fork:army:" + std::to_string(army.id) + ":leg:" +
                                                       std::to_string(done + 1),
                                   leg.fixed_roll, ctx.order_id, army.id);
      if (roll.total <= chance) {
        dest = leg.alternate_hex_id;
        diverted = true;
      }
      ctx.dice.note("logistics", "fork:army:" + std::to_string(army.id),
                    (diverted ? "misdirected to " : "took the right road to ") + hex_ref(dest) + " (roll " +
                        std::to_string(roll.total) + " vs " + std::to_string(chance) + ")",
                    ctx.order_id, army.id);
    }
    army.hex_id = dest;
    ++done;

    if (order.pace == MarchPace::Forced) army.status = ArmyStatus::ForcedMarch;
    else if (leg.is_night) army.status = ArmyStatus::NightMarch;
    else army.status = ArmyStatus::Marching;

    if (diverted) {
      stop_reason = "diverted at a fork";
      break;
    }
  }

  if (done > 0 && army.siege_id != kInvalidId) army.siege_id = kInvalidId;
  if (done > 0 && order.pace == MarchPace::Forced) {
    adjust_morale(army, -ctx.rules.movement.forced_march_morale_cost, ctx.rules.morale);
  }

  std::ostringstream ss;
  ss << "marched " << done << "/" << order.legs.size() << " legs (" << miles << " mi, " << supplies_used
     << " supplies), now at " << hex_ref(army.hex_id);
  if (!stop_reason.empty() && done < order.legs.size()) ss << "; stopped: " << stop_reason;
  else if (diverted) ss << "; " << stop_reason;
  res.summary = ss.str();
  res.partial = done < order.legs.size() || diverted;
  return res;
}

OrderResult resolve_forage(ResolveContext& ctx, Army& army, const ForageOrder& order) {
  require_field_ready(army);
  check_supply_reach(ctx, army, order.hex_ids);

  const SupplyRules& r = ctx.rules.supply;
  const int day = ctx.campaign.current_day;
  int gained = 0;
  int yielded = 0;
  std::vector<std::string> notes;

  for (Id hid : order.hex_ids) {
    Hex* hex = find_ptr(ctx.campaign.map.hexes, hid);
    if (!hex) throw InvalidRouteError(hex_ref(hid) + " does not exist");

    if (day < hex->torched_until_day) {
      notes.push_back(hex_ref(hid) + " torched");
      continue;
    }
    if (hex->foraging_times_remaining <= 0) {
      notes.push_back(hex_ref(hid) + " exhausted");
      continue;
    }
    if (hex->settlement <= 0) {
      notes.push_back(hex_ref(hid) + " barren");
      continue;
    }

    const bool recently = hex->last_foraged_day >= 0 && day - hex->last_foraged_day < r.revolt_cooldown_days;
    hex->last_foraged_day = day;
    if (recently) {
      const int chance = revolt_chance(army, *hex, r.forage_revolt_chance, r);
      if (roll_revolt(ctx, army, *hex, chance, order.fixed_roll, "forage")) {
        notes.push_back(hex_ref(hid) + " revolted");
        continue;
      }
    }

    hex->foraging_times_remaining -= 1;
    const int room = army.supplies_capacity - army.supplies_current;
    const int gain = std::max(0, std::min(room, hex->settlement * r.foraging_multiplier));
    army.supplies_current += gain;
    gained += gain;
    ++yielded;
  }

  army.status = ArmyStatus::Foraging;

  OrderResult res;
  std::ostringstream ss;
  ss << "foraged " << gained << " supplies from " << yielded << "/" << order.hex_ids.size() << " hexes";
  for (const auto& n : notes) ss << "; " << n;
  res.summary = ss.str();
  res.partial = yielded < static_cast<int>(order.hex_ids.size());
  return res;
}

OrderResult resolve_torch(ResolveContext& ctx, Army& army, const TorchOrder& order) {
  require_field_ready(army);
  check_supply_reach(ctx, army, order.hex_ids);

  const SupplyRules& r = ctx.rules.supply;
  int revolts = 0;
  for (Id hid : order.hex_ids) {
    Hex* hex = find_ptr(ctx.campaign.map.hexes, hid);
    if (!hex) throw InvalidRouteError(hex_ref(hid) + " does not exist");
    hex->torched_until_day = std::max(hex->torched_until_day, ctx.campaign.current_day + r.torch_duration_days);
    ctx.dice.note("logistics", "torch:hex:" + std::to_string(hid),
                  "torched until day " + std::to_string(hex->torched_until_day), ctx.order_id, army.id);
    if (hex->settlement > 0) {
      const int chance = revolt_chance(army, *hex, r.torch_revolt_chance, r);
      if (roll_revolt(ctx, army, *hex, chance, order.fixed_roll, "torch")) ++revolts;
    }
  }
  army.status = ArmyStatus::Torching;

  OrderResult res;
  res.summary = "torched " + std::to_string(order.hex_ids.size()) + " hexes";
  if (revolts > 0) res.summary += "; " + std::to_string(revolts) + " revolted";
  return res;
}

OrderResult resolve_rest(ResolveContext& ctx, Army& army, const RestOrder& order) {
  require_field_ready(army);
  if (army.harried_today) throw InvalidStateError("army " + std::to_string(army.id) + " was harried today");
  if (order.duration_days <= 0) throw ValidationError("rest duration must be positive");

  finish_executing_order(ctx.campaign, army.rest_order_id, "superseded");
  army.status = ArmyStatus::Resting;
  army.rest_until_day = ctx.campaign.current_day + order.duration_days;
  army.rest_order_id = ctx.order_id;
  army.movement_points_remaining = 0.0;
  army.siege_id = kInvalidId;
  if (army.morale_current < ctx.rules.morale.resting) {
    adjust_morale(army, ctx.rules.morale.resting - army.morale_current, ctx.rules.morale);
  }

  OrderResult res;
  res.summary = "resting until day " + std::to_string(army.rest_until_day);
  res.in_progress = true;
  return res;
}

OrderResult resolve_supply_transfer(ResolveContext& ctx, Army& army, const SupplyTransferOrder& order) {
  require_field_ready(army);
  Army* target = find_ptr(ctx.campaign.armies, order.target_army_id);
  if (!target) throw NotFoundError("army " + std::to_string(order.target_army_id) + " not found");
  if (target->id == army.id) throw InvalidStateError("cannot transfer supplies to the same army");
  if (target->faction_id != army.faction_id) throw InvalidStateError("target army belongs to another faction");
  if (target->hex_id != army.hex_id) throw InvalidStateError("target army is not in the same hex");
  if (target->status == ArmyStatus::Routed) throw InvalidStateError("target army is routed");

  const int room = std::max(0, target->supplies_capacity - target->supplies_current);
  const int moved = std::max(0, std::min({order.amount, army.supplies_current, room}));
  army.supplies_current -= moved;
  target->supplies_current += moved;

  OrderResult res;
  res.summary = "transferred " + std::to_string(moved) + "/" + std::to_string(order.amount) + " supplies to army " +
                std::to_string(target->id);
  res.partial = moved < order.amount;
  return res;
}

void start_of_day(ResolveContext& ctx) {
  Campaign& c = ctx.campaign;
  const int day = c.current_day;

  const Season season = season_for_day(day, ctx.rules.calendar.days_per_season, ctx.rules.calendar.start_season);
  if (season != c.season) {
    c.season = season;
    if (season == Season::Spring) {
      for (auto& [_, h] : c.map.hexes) h.foraging_times_remaining = ctx.rules.supply.foraging_limit;
    }
    ctx.dice.note("calendar", "season", std::string("season is now ") + season_label(season));
  }

  for (Id id : util::sorted_keys(c.armies)) {
    Army& a = c.armies.at(id);
    a.harried_today = false;
    a.starved_today = false;

    if (a.status == ArmyStatus::Resting && a.rest_until_day > day) {
      a.movement_points_remaining = 0.0;
      continue;
    }
    if (a.status == ArmyStatus::Resting) {
      a.status = ArmyStatus::Idle;
      a.rest_until_day = -1;
      finish_executing_order(c, a.rest_order_id, "rest complete");
      a.rest_order_id = kInvalidId;
    }
    if (a.status == ArmyStatus::Routed) {
      a.movement_points_remaining = 0.0;
      continue;
    }
    a.movement_points_remaining = ctx.rules.movement.movement_points_per_day;
    switch (a.status) {
      case ArmyStatus::Marching:
      case ArmyStatus::ForcedMarch:
      case ArmyStatus::NightMarch:
      case ArmyStatus::Foraging:
      case ArmyStatus::Torching:
      case ArmyStatus::Harrying:
        a.status = ArmyStatus::Idle;
        break;
      default:
        break;
    }
  }

  for (Id id : util::sorted_keys(c.strongholds)) {
    Stronghold& s = c.strongholds.at(id);
    if (s.siege_id != kInvalidId) continue;
    if (s.current_threshold < s.base_threshold) {
      s.current_threshold = std::min(s.base_threshold, s.current_threshold + ctx.rules.siege.recovery_per_day);
    }
  }
}

void drain_supplies(ResolveContext& ctx) {
  Campaign& c = ctx.campaign;
  const int part = static_cast<int>(c.current_part);

  for (Id id : util::sorted_keys(c.armies)) {
    Army& a = c.armies.at(id);
    if (a.status == ArmyStatus::Routed) continue;

    // Split the daily figure so that four parts sum to exactly one day.
    const int daily = army_daily_consumption(a, ctx.rules.supply);
    const int drain = daily * (part + 1) / kPartsPerDay - daily * part / kPartsPerDay;
    if (a.supplies_current >= drain) {
      a.supplies_current -= drain;
    } else {
      a.supplies_current = 0;
      a.starved_today = true;
    }
  }

  if (c.current_part != DayPart::Night) return;

  for (Id id : util::sorted_keys(c.armies)) {
    Army& a = c.armies.at(id);
    if (a.status == ArmyStatus::Routed) continue;
    if (!a.starved_today) {
      a.days_without_supplies = 0;
      continue;
    }
    for_entity(ctx, "logistics", "starvation:army:" + std::to_string(a.id), a.id, [&] {
      a.days_without_supplies += 1;
      adjust_morale(a, -ctx.rules.morale.starvation_loss, ctx.rules.morale);
      ctx.dice.note("logistics", "starvation:army:" + std::to_string(a.id),
                    "starving for " + std::to_string(a.days_without_supplies) + " days, morale " +
                        std::to_string(a.morale_current),
                    kInvalidId, a.id);
      if (a.days_without_supplies >= ctx.rules.morale.dissolution_days) {
        rout_army(ctx, a, "dissolved from starvation");
        return;
      }
      morale_check(ctx, a, "starvation");
    });
  }
}

} // namespace cataphract
