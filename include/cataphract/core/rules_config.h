#pragma once

#include <string>
#include <vector>

#include "cataphract/core/calendar.h"
#include "cataphract/core/entities.h"
#include "cataphract/util/json.h"

namespace cataphract {

// Numeric constants of the ruleset. Balancing is the host's concern: every
// value here can be overridden from a JSON overlay (see load_rules_config_json).

struct SupplyRules {
  // Carrying capacity per soldier / wagon.
  int infantry_capacity{15};
  int cavalry_capacity{75};
  int wagon_capacity{1000};

  // Daily consumption per soldier / wagon. Noncombatants eat like infantry.
  int infantry_consumption{1};
  int cavalry_consumption{10};
  int wagon_consumption{10};

  double noncombatant_ratio{0.25};

  // Forage gain per point of hex settlement.
  int foraging_multiplier{500};
  int foraging_limit{5};

  int torch_duration_days{90};

  // Revolt checks roll 1d6; revolt when roll <= chance.
  int revolt_cooldown_days{365};
  int forage_revolt_chance{2};
  int torch_revolt_chance{1};
  int hostile_revolt_bonus{1};

  int base_supply_radius{1};
  int cavalry_radius_bonus{1};

  // Marching cost: supplies per mile per 1000 soldiers (rounded up).
  int march_supply_per_mile_per_1000{1};

  int starting_supply_days{14};
};

enum class WeatherMode { Multiplicative, Additive };

struct MovementRules {
  double base_miles_per_day{12.0};
  double road_modifier{1.0};
  double offroad_modifier{0.5};
  double night_modifier{0.5};
  double forced_multiplier{1.5};
  double cavalry_forced_multiplier{2.0};
  int forced_march_morale_cost{1};

  WeatherMode weather_mode{WeatherMode::Multiplicative};
  double rain_factor{0.75};
  double storm_factor{0.5};
  double rain_miles{-2.0};
  double storm_miles{-4.0};

  // Fork misdirection: 1d6 <= chance sends the column down the wrong branch.
  int fork_base_chance{1};
  int fork_offroad_bonus{1};
  int fork_night_bonus{1};

  double movement_points_per_day{1.0};
};

struct MoraleRules {
  int resting{9};
  int max{12};
  int min{0};
  int rout_threshold{2};
  int starvation_loss{1};
  int dissolution_days{14};
  // Applied to a repulsed attacker on top of its battle band.
  int failed_assault_penalty{1};
  int capture_bonus{1};
  int pillage_bonus{2};
  int assassination_penalty{2};
};

// One row of the battle outcome table. The first row whose min_margin the
// difference between the two totals reaches applies.
struct CasualtyBand {
  int min_margin{0};
  double winner_losses{0.0};
  double loser_losses{0.0};
  int winner_morale{0};
  int loser_morale{0};
};

struct BattleRules {
  int dice{2};
  int sides{6};
  int max_numeric_bonus{4};
  int morale_bonus_cap{2};

  // Added to every assaulting side's roll.
  int assault_modifier{-1};

  // Sorted by descending min_margin.
  std::vector<CasualtyBand> casualty_bands{
      {6, 0.05, 0.20, 2, -2},
      {4, 0.05, 0.15, 2, -2},
      {2, 0.05, 0.10, 1, -2},
      {1, 0.10, 0.10, 0, -1},
      {0, 0.05, 0.05, -1, 0},
  };

  // Extra losses of a repulsed assault, on top of its band.
  double failed_assault_losses{0.10};
  double garrison_capture_losses{0.20};
  int commander_escape_chance{3};
};

struct SiegeRules {
  int town_threshold{40};
  int city_threshold{60};
  int fortress_threshold{80};

  int town_defense{2};
  int city_defense{3};
  int fortress_defense{4};

  int base_reduction_per_part{1};
  int engine_reduction{1};
  int soldiers_per_extra_reduction{5000};

  // Threshold regained per day by a stronghold no longer under siege.
  int recovery_per_day{4};
};

struct MessagingRules {
  double hex_miles{6.0};
  double friendly_speed{48.0};
  double neutral_speed{42.0};
  double hostile_speed{36.0};

  // Delivery succeeds when 1dN <= numerator.
  int friendly_success{19};
  int friendly_denominator{20};
  int neutral_success{9};
  int neutral_denominator{10};
  int hostile_success{5};
  int hostile_denominator{6};
};

struct NavalRules {
  double miles_per_day{48.0};
};

struct OperationRules {
  int base_target{7};
  int simple_modifier{2};
  int standard_modifier{0};
  int complex_modifier{-2};
  int friendly_modifier{1};
  int neutral_modifier{0};
  int hostile_modifier{-1};
  int intelligence_modifier{1};
  int sabotage_modifier{0};
  int assassination_modifier{-1};
  int min_target{2};
  int max_target{12};

  // Per intermediate stage: 1d6 <= chance exposes the agents.
  int exposure_chance{1};
  int hostile_exposure_bonus{1};

  double sabotage_supply_fraction{0.25};
  int sabotage_threshold_damage{8};
  int default_loot_cost{100};
};

struct RecruitmentRules {
  int progress_required{120};
  int town_rate{1};
  int fortress_rate{2};
  int city_rate{3};
  int starting_morale{9};

  // A second levy from the same hex within the cooldown risks a revolt of
  // `revolt_chance` in 6, doubled while the hex is recently conquered.
  int cooldown_days{365};
  int revolt_chance{1};
  int recently_conquered_days{90};
  int rebel_infantry_die{20};
  int rebel_infantry_per_pip{500};
  int rebel_min_infantry{500};
};

struct MercenaryRules {
  // Loot per 100 soldiers per day.
  int infantry_upkeep{1};
  int cavalry_upkeep{3};
  int grace_days{3};
  int unpaid_morale_penalty{1};
  int desertion_chance{1};
};

struct HarryRules {
  int base_success{2};
  int skirmisher_bonus{1};
  int cavalry_bonus{2};
  double kill_fraction{0.20};
  double failure_loss_fraction{0.20};
};

struct CalendarRules {
  int days_per_season{91};
  Season start_season{Season::Spring};
};

struct RulesConfig {
  SupplyRules supply;
  MovementRules movement;
  MoraleRules morale;
  BattleRules battle;
  SiegeRules siege;
  MessagingRules messaging;
  NavalRules naval;
  OperationRules operations;
  RecruitmentRules recruitment;
  MercenaryRules mercenaries;
  HarryRules harry;
  CalendarRules calendar;
};

// Engine-level switches that are not part of the ruleset.
struct EngineConfig {
  // Accept caller-supplied fixed rolls on orders. When false, orders carrying
  // one are rejected with ValidationError.
  bool allow_fixed_rolls{true};

  // Run validate_campaign after every day-part and abort the part on failure.
  bool validate_invariants{true};
};

int stronghold_base_threshold(const SiegeRules& r, StrongholdType t);
int stronghold_defense(const SiegeRules& r, StrongholdType t);

// Overlay any subset of keys from `v` onto `base`. Sections and keys use the
// field names above ("supply": {"foraging_multiplier": 400}, ...).
// Unknown keys are logged and ignored; mistyped values throw std::runtime_error.
RulesConfig rules_config_from_json(const json::Value& v, RulesConfig base = {});
RulesConfig load_rules_config_json(const std::string& text, RulesConfig base = {});

json::Value rules_config_to_json(const RulesConfig& cfg);

} // namespace cataphract
