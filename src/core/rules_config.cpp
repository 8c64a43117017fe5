#include "cataphract/core/rules_config.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "cataphract/util/log.h"
#include "cataphract/util/strings.h"

namespace cataphract {
namespace {

const char* weather_mode_label(WeatherMode m) {
  return m == WeatherMode::Additive ? "additive" : "multiplicative";
}

// Single field table shared by the reader and the writer.
template <typename Cfg, typename F>
void for_each_field(Cfg& c, F&& f) {
  f("supply", "infantry_capacity", c.supply.infantry_capacity);
  f("supply", "cavalry_capacity", c.supply.cavalry_capacity);
  f("supply", "wagon_capacity", c.supply.wagon_capacity);
  f("supply", "infantry_consumption", c.supply.infantry_consumption);
  f("supply", "cavalry_consumption", c.supply.cavalry_consumption);
  f("supply", "wagon_consumption", c.supply.wagon_consumption);
  f("supply", "noncombatant_ratio", c.supply.noncombatant_ratio);
  f("supply", "foraging_multiplier", c.supply.foraging_multiplier);
  f("supply", "foraging_limit", c.supply.foraging_limit);
  f("supply", "torch_duration_days", c.supply.torch_duration_days);
  f("supply", "revolt_cooldown_days", c.supply.revolt_cooldown_days);
  f("supply", "forage_revolt_chance", c.supply.forage_revolt_chance);
  f("supply", "torch_revolt_chance", c.supply.torch_revolt_chance);
  f("supply", "hostile_revolt_bonus", c.supply.hostile_revolt_bonus);
  f("supply", "base_supply_radius", c.supply.base_supply_radius);
  f("supply", "cavalry_radius_bonus", c.supply.cavalry_radius_bonus);
  f("supply", "march_supply_per_mile_per_1000", c.supply.march_supply_per_mile_per_1000);
  f("supply", "starting_supply_days", c.supply.starting_supply_days);

  f("movement", "base_miles_per_day", c.movement.base_miles_per_day);
  f("movement", "road_modifier", c.movement.road_modifier);
  f("movement", "offroad_modifier", c.movement.offroad_modifier);
  f("movement", "night_modifier", c.movement.night_modifier);
  f("movement", "forced_multiplier", c.movement.forced_multiplier);
  f("movement", "cavalry_forced_multiplier", c.movement.cavalry_forced_multiplier);
  f("movement", "forced_march_morale_cost", c.movement.forced_march_morale_cost);
  f("movement", "weather_mode", c.movement.weather_mode);
  f("movement", "rain_factor", c.movement.rain_factor);
  f("movement", "storm_factor", c.movement.storm_factor);
  f("movement", "rain_miles", c.movement.rain_miles);
  f("movement", "storm_miles", c.movement.storm_miles);
  f("movement", "fork_base_chance", c.movement.fork_base_chance);
  f("movement", "fork_offroad_bonus", c.movement.fork_offroad_bonus);
  f("movement", "fork_night_bonus", c.movement.fork_night_bonus);
  f("movement", "movement_points_per_day", c.movement.movement_points_per_day);

  f("morale", "resting", c.morale.resting);
  f("morale", "max", c.morale.max);
  f("morale", "min", c.morale.min);
  f("morale", "rout_threshold", c.morale.rout_threshold);
  f("morale", "starvation_loss", c.morale.starvation_loss);
  f("morale", "dissolution_days", c.morale.dissolution_days);
  f("morale", "failed_assault_penalty", c.morale.failed_assault_penalty);
  f("morale", "capture_bonus", c.morale.capture_bonus);
  f("morale", "pillage_bonus", c.morale.pillage_bonus);
  f("morale", "assassination_penalty", c.morale.assassination_penalty);

  f("battle", "dice", c.battle.dice);
  f("battle", "sides", c.battle.sides);
  f("battle", "max_numeric_bonus", c.battle.max_numeric_bonus);
  f("battle", "morale_bonus_cap", c.battle.morale_bonus_cap);
  f("battle", "assault_modifier", c.battle.assault_modifier);
  f("battle", "casualty_bands", c.battle.casualty_bands);
  f("battle", "failed_assault_losses", c.battle.failed_assault_losses);
  f("battle", "garrison_capture_losses", c.battle.garrison_capture_losses);
  f("battle", "commander_escape_chance", c.battle.commander_escape_chance);

  f("siege", "town_threshold", c.siege.town_threshold);
  f("siege", "city_threshold", c.siege.city_threshold);
  f("siege", "fortress_threshold", c.siege.fortress_threshold);
  f("siege", "town_defense", c.siege.town_defense);
  f("siege", "city_defense", c.siege.city_defense);
  f("siege", "fortress_defense", c.siege.fortress_defense);
  f("siege", "base_reduction_per_part", c.siege.base_reduction_per_part);
  f("siege", "engine_reduction", c.siege.engine_reduction);
  f("siege", "soldiers_per_extra_reduction", c.siege.soldiers_per_extra_reduction);
  f("siege", "recovery_per_day", c.siege.recovery_per_day);

  f("messaging", "hex_miles", c.messaging.hex_miles);
  f("messaging", "friendly_speed", c.messaging.friendly_speed);
  f("messaging", "neutral_speed", c.messaging.neutral_speed);
  f("messaging", "hostile_speed", c.messaging.hostile_speed);
  f("messaging", "friendly_success", c.messaging.friendly_success);
  f("messaging", "friendly_denominator", c.messaging.friendly_denominator);
  f("messaging", "neutral_success", c.messaging.neutral_success);
  f("messaging", "neutral_denominator", c.messaging.neutral_denominator);
  f("messaging", "hostile_success", c.messaging.hostile_success);
  f("messaging", "hostile_denominator", c.messaging.hostile_denominator);

  f("naval", "miles_per_day", c.naval.miles_per_day);

  f("operations", "base_target", c.operations.base_target);
  f("operations", "simple_modifier", c.operations.simple_modifier);
  f("operations", "standard_modifier", c.operations.standard_modifier);
  f("operations", "complex_modifier", c.operations.complex_modifier);
  f("operations", "friendly_modifier", c.operations.friendly_modifier);
  f("operations", "neutral_modifier", c.operations.neutral_modifier);
  f("operations", "hostile_modifier", c.operations.hostile_modifier);
  f("operations", "intelligence_modifier", c.operations.intelligence_modifier);
  f("operations", "sabotage_modifier", c.operations.sabotage_modifier);
  f("operations", "assassination_modifier", c.operations.assassination_modifier);
  f("operations", "min_target", c.operations.min_target);
  f("operations", "max_target", c.operations.max_target);
  f("operations", "exposure_chance", c.operations.exposure_chance);
  f("operations", "hostile_exposure_bonus", c.operations.hostile_exposure_bonus);
  f("operations", "sabotage_supply_fraction", c.operations.sabotage_supply_fraction);
  f("operations", "sabotage_threshold_damage", c.operations.sabotage_threshold_damage);
  f("operations", "default_loot_cost", c.operations.default_loot_cost);

  f("recruitment", "progress_required", c.recruitment.progress_required);
  f("recruitment", "town_rate", c.recruitment.town_rate);
  f("recruitment", "fortress_rate", c.recruitment.fortress_rate);
  f("recruitment", "city_rate", c.recruitment.city_rate);
  f("recruitment", "starting_morale", c.recruitment.starting_morale);
  f("recruitment", "cooldown_days", c.recruitment.cooldown_days);
  f("recruitment", "revolt_chance", c.recruitment.revolt_chance);
  f("recruitment", "recently_conquered_days", c.recruitment.recently_conquered_days);
  f("recruitment", "rebel_infantry_die", c.recruitment.rebel_infantry_die);
  f("recruitment", "rebel_infantry_per_pip", c.recruitment.rebel_infantry_per_pip);
  f("recruitment", "rebel_min_infantry", c.recruitment.rebel_min_infantry);

  f("mercenaries", "infantry_upkeep", c.mercenaries.infantry_upkeep);
  f("mercenaries", "cavalry_upkeep", c.mercenaries.cavalry_upkeep);
  f("mercenaries", "grace_days", c.mercenaries.grace_days);
  f("mercenaries", "unpaid_morale_penalty", c.mercenaries.unpaid_morale_penalty);
  f("mercenaries", "desertion_chance", c.mercenaries.desertion_chance);

  f("harry", "base_success", c.harry.base_success);
  f("harry", "skirmisher_bonus", c.harry.skirmisher_bonus);
  f("harry", "cavalry_bonus", c.harry.cavalry_bonus);
  f("harry", "kill_fraction", c.harry.kill_fraction);
  f("harry", "failure_loss_fraction", c.harry.failure_loss_fraction);

  f("calendar", "days_per_season", c.calendar.days_per_season);
  f("calendar", "start_season", c.calendar.start_season);
}

std::string field_name(const char* section, const char* key) { return std::string(section) + "." + key; }

void read_field(const json::Value& v, const char* section, const char* key, int& out) {
  const double* d = v.as_number();
  if (!d || std::floor(*d) != *d) throw std::runtime_error("rules: " + field_name(section, key) + " must be an integer");
  if (*d < std::numeric_limits<int>::min() || *d > std::numeric_limits<int>::max()) {
    throw std::runtime_error("rules: " + field_name(section, key) + " is out of range");
  }
  out = static_cast<int>(*d);
}

void read_field(const json::Value& v, const char* section, const char* key, double& out) {
  const double* d = v.as_number();
  if (!d) throw std::runtime_error("rules: " + field_name(section, key) + " must be a number");
  out = *d;
}

void read_field(const json::Value& v, const char* section, const char* key, std::vector<CasualtyBand>& out) {
  const json::Array* rows = v.as_array();
  if (!rows || rows->empty()) {
    throw std::runtime_error("rules: " + field_name(section, key) + " must be a non-empty array");
  }
  std::vector<CasualtyBand> bands;
  for (const auto& row : *rows) {
    if (!row.is_object()) throw std::runtime_error("rules: " + field_name(section, key) + " rows must be objects");
    CasualtyBand b;
    const auto opt = [&](const char* name, auto& field) {
      if (const json::Value* f = row.find(name)) read_field(*f, section, key, field);
    };
    opt("min_margin", b.min_margin);
    opt("winner_losses", b.winner_losses);
    opt("loser_losses", b.loser_losses);
    opt("winner_morale", b.winner_morale);
    opt("loser_morale", b.loser_morale);
    if (b.min_margin < 0 || b.winner_losses < 0.0 || b.winner_losses > 1.0 || b.loser_losses < 0.0 ||
        b.loser_losses > 1.0) {
      throw std::runtime_error("rules: " + field_name(section, key) + " has a row out of range");
    }
    bands.push_back(b);
  }
  std::stable_sort(bands.begin(), bands.end(),
                   [](const CasualtyBand& a, const CasualtyBand& b) { return a.min_margin > b.min_margin; });
  out = std::move(bands);
}

void read_field(const json::Value& v, const char* section, const char* key, WeatherMode& out) {
  const std::string s = to_lower(v.string_value());
  if (s == "additive") out = WeatherMode::Additive;
  else if (s == "multiplicative") out = WeatherMode::Multiplicative;
  else throw std::runtime_error("rules: " + field_name(section, key) + " must be 'additive' or 'multiplicative'");
}

void read_field(const json::Value& v, const char* section, const char* key, Season& out) {
  if (!parse_season(v.string_value(), &out)) {
    throw std::runtime_error("rules: " + field_name(section, key) + " must be a season name");
  }
}

json::Value write_field(int v) { return static_cast<double>(v); }
json::Value write_field(double v) { return v; }
json::Value write_field(const std::vector<CasualtyBand>& bands) {
  json::Array rows;
  for (const auto& b : bands) {
    json::Object row;
    row["min_margin"] = static_cast<double>(b.min_margin);
    row["winner_losses"] = b.winner_losses;
    row["loser_losses"] = b.loser_losses;
    row["winner_morale"] = static_cast<double>(b.winner_morale);
    row["loser_morale"] = static_cast<double>(b.loser_morale);
    rows.push_back(std::move(row));
  }
  return rows;
}
json::Value write_field(WeatherMode m) { return std::string(weather_mode_label(m)); }
json::Value write_field(Season s) { return std::string(season_label(s)); }

} // namespace

int stronghold_base_threshold(const SiegeRules& r, StrongholdType t) {
  switch (t) {
    case StrongholdType::Town: return r.town_threshold;
    case StrongholdType::City: return r.city_threshold;
    case StrongholdType::Fortress: return r.fortress_threshold;
  }
  return r.town_threshold;
}

int stronghold_defense(const SiegeRules& r, StrongholdType t) {
  switch (t) {
    case StrongholdType::Town: return r.town_defense;
    case StrongholdType::City: return r.city_defense;
    case StrongholdType::Fortress: return r.fortress_defense;
  }
  return r.town_defense;
}

RulesConfig rules_config_from_json(const json::Value& v, RulesConfig base) {
  const json::Object& root = v.object();

  std::set<std::string> known;
  for_each_field(base, [&](const char* section, const char* key, auto& field) {
    known.insert(field_name(section, key));
    const json::Value* sec = v.find(section);
    if (!sec) return;
    if (!sec->is_object()) throw std::runtime_error(std::string("rules: section '") + section + "' must be an object");
    const json::Value* f = sec->find(key);
    if (f) read_field(*f, section, key, field);
  });

  for (const auto& [section, body] : root) {
    const json::Object* o = body.as_object();
    if (!o) {
      log::warn("rules: ignoring unknown top-level key '" + section + "'");
      continue;
    }
    for (const auto& [key, _] : *o) {
      if (!known.count(section + "." + key)) log::warn("rules: ignoring unknown key '" + section + "." + key + "'");
    }
  }
  return base;
}

RulesConfig load_rules_config_json(const std::string& text, RulesConfig base) {
  return rules_config_from_json(json::parse(text), std::move(base));
}

json::Value rules_config_to_json(const RulesConfig& cfg) {
  json::Object root;
  for_each_field(cfg, [&](const char* section, const char* key, const auto& field) {
    json::Value& sec = root[section];
    if (!sec.is_object()) sec = json::Object{};
    std::get<json::Object>(sec)[key] = write_field(field);
  });
  return root;
}

} // namespace cataphract
