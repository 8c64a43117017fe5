#pragma once

// Shared setup for the resolver tests: the demo campaign plus a scripted dice
// source and a ResolveContext bound to it.

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "cataphract/core/campaign.h"
#include "cataphract/core/map_graph.h"
#include "cataphract/core/resolve_context.h"
#include "cataphract/core/rolls.h"
#include "cataphract/core/rules_config.h"
#include "cataphract/core/scenario.h"

namespace cataphract::test {

struct Harness {
  // Unscripted rolls come up `fallback`.
  explicit Harness(std::vector<int> faces = {}, int fallback = 1, std::uint64_t seed = 7)
      : c(make_demo_campaign(seed, rules, &ids)),
        map(c.map, rules.messaging.hex_miles),
        rolls(std::move(faces), fallback),
        dice(c, rolls),
        ctx{c, map, rules, dice} {}

  Harness(const Harness&) = delete;
  Harness& operator=(const Harness&) = delete;

  Army& legion() { return c.armies.at(ids.first_legion); }
  Army& guard() { return c.armies.at(ids.thornwall_guard); }
  Id hex(int q, int r) const { return demo_hex(c, q, r); }

  RulesConfig rules;
  ScenarioIds ids;
  Campaign c;
  MapGraph map;
  ScriptedRollSource rolls;
  Dice dice;
  ResolveContext ctx;
};

inline bool has_entry(const Campaign& c, const std::string& subsystem, const std::string& needle) {
  for (const auto& e : c.audit_log) {
    if (e.subsystem == subsystem && e.effect.find(needle) != std::string::npos) return true;
  }
  return false;
}

} // namespace cataphract::test
