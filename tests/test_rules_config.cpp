#include <iostream>
#include <stdexcept>
#include <string>

#include "cataphract/core/rules_config.h"
#include "cataphract/util/json.h"
#include "cataphract/util/log.h"

#define CATA_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_rules_config() {
  using namespace cataphract;

  const RulesConfig defaults;
  CATA_ASSERT(defaults.supply.infantry_capacity == 15);
  CATA_ASSERT(defaults.supply.cavalry_capacity == 75);
  CATA_ASSERT(defaults.supply.wagon_capacity == 1000);
  CATA_ASSERT(defaults.morale.resting == 9);
  CATA_ASSERT(defaults.recruitment.progress_required == 120);

  CATA_ASSERT(stronghold_base_threshold(defaults.siege, StrongholdType::Town) == 40);
  CATA_ASSERT(stronghold_base_threshold(defaults.siege, StrongholdType::City) == 60);
  CATA_ASSERT(stronghold_base_threshold(defaults.siege, StrongholdType::Fortress) == 80);
  CATA_ASSERT(stronghold_defense(defaults.siege, StrongholdType::Fortress) == 4);

  const log::Level saved = log::level();
  log::set_level(log::Level::Off);

  // A partial overlay only touches the keys it names; unknown keys are ignored.
  {
    const RulesConfig r = load_rules_config_json(
        "{\"supply\": {\"foraging_multiplier\": 400}, \"movement\": {\"weather_mode\": \"additive\"},"
        " \"calendar\": {\"start_season\": \"winter\"}, \"bogus\": {\"x\": 1}}");
    CATA_ASSERT(r.supply.foraging_multiplier == 400);
    CATA_ASSERT(r.supply.wagon_capacity == 1000);
    CATA_ASSERT(r.movement.weather_mode == WeatherMode::Additive);
    CATA_ASSERT(r.calendar.start_season == Season::Winter);
    CATA_ASSERT(r.siege.fortress_threshold == 80);
  }

  // Overlays stack on a non-default base.
  {
    RulesConfig base;
    base.siege.town_threshold = 30;
    const RulesConfig r = load_rules_config_json("{\"siege\": {\"city_threshold\": 50}}", base);
    CATA_ASSERT(r.siege.town_threshold == 30);
    CATA_ASSERT(r.siege.city_threshold == 50);
  }

  // Mistyped values are errors, not silent defaults.
  {
    bool threw = false;
    try {
      (void)load_rules_config_json("{\"supply\": {\"wagon_capacity\": 1.5}}");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    CATA_ASSERT(threw);
  }
  {
    std::string msg;
    try {
      (void)load_rules_config_json("{\"siege\": {\"town_threshold\": 4e9}}");
    } catch (const std::runtime_error& e) {
      msg = e.what();
    }
    CATA_ASSERT(msg.find("out of range") != std::string::npos);
  }
  {
    bool threw = false;
    try {
      (void)load_rules_config_json("{\"supply\": 3}");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    CATA_ASSERT(threw);
  }

  // Casualty bands load in any order and are kept widest margin first.
  {
    const RulesConfig r = load_rules_config_json(
        "{\"battle\": {\"assault_modifier\": -2, \"casualty_bands\": ["
        "{\"min_margin\": 0, \"loser_losses\": 0.1},"
        "{\"min_margin\": 5, \"winner_losses\": 0.02, \"loser_losses\": 0.3, \"loser_morale\": -3}]}}");
    CATA_ASSERT(r.battle.assault_modifier == -2);
    CATA_ASSERT(r.battle.casualty_bands.size() == 2);
    CATA_ASSERT(r.battle.casualty_bands[0].min_margin == 5);
    CATA_ASSERT(r.battle.casualty_bands[0].loser_morale == -3);
    CATA_ASSERT(r.battle.casualty_bands[1].loser_losses == 0.1);

    const RulesConfig back = rules_config_from_json(rules_config_to_json(r));
    CATA_ASSERT(back.battle.casualty_bands.size() == 2);
    CATA_ASSERT(back.battle.casualty_bands[0].winner_losses == 0.02);

    bool threw = false;
    try {
      (void)load_rules_config_json("{\"battle\": {\"casualty_bands\": [{\"loser_losses\": 1.5}]}}");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    CATA_ASSERT(threw);
  }

  // Exported rules load back to the same values.
  {
    RulesConfig tuned;
    tuned.messaging.hostile_success = 4;
    tuned.movement.rain_factor = 0.6;
    const json::Value v = rules_config_to_json(tuned);
    CATA_ASSERT(v.at("messaging").at("hostile_success").int_value() == 4);
    const RulesConfig back = rules_config_from_json(v);
    CATA_ASSERT(back.messaging.hostile_success == 4);
    CATA_ASSERT(back.movement.rain_factor == 0.6);
    CATA_ASSERT(back.supply.noncombatant_ratio == 0.25);
  }

  log::set_level(saved);
  return 0;
}
