#pragma once

#include <string>

#include "cataphract/core/entities.h"
#include "cataphract/core/resolve_context.h"
#include "cataphract/core/rules_config.h"

namespace cataphract {

int army_supply_capacity(const Army& a, const SupplyRules& r);
int army_daily_consumption(const Army& a, const SupplyRules& r);

// Recompute capacity after the army's composition changed; clamps supplies.
void refresh_supply_capacity(Army& a, const SupplyRules& r);

// Foraging/torching reach in hexes.
int supply_radius(const Army& a, Weather w, const SupplyRules& r);

// Clamp to [min, max]. Returns the new morale.
int adjust_morale(Army& a, int delta, const MoraleRules& r);

// Remove `fraction` of every detachment (and of the camp followers).
// Returns soldiers lost. Empty detachments are dropped.
int apply_casualties(Army& a, double fraction, const SupplyRules& r);

int apply_detachment_losses(Army& a, Id detachment_id, double fraction, const SupplyRules& r);

enum class MoraleConsequence {
  None,
  CampFollowers,
  DetachmentDeparts,
  Desertion,
  MajorDesertion,
  MassDesertion,
  Mutiny,
};

const char* morale_consequence_label(MoraleConsequence c);

// Consequence table indexed by a 2d6 roll.
MoraleConsequence morale_consequence_for_roll(int roll);

struct MoraleCheckResult {
  bool passed{true};
  int roll{0};
  MoraleConsequence consequence{MoraleConsequence::None};
  int soldiers_lost{0};
};

// 2d6 against current morale; on a failure rolls and applies a consequence.
// Armies that fall to the rout threshold or lose every soldier are routed.
MoraleCheckResult morale_check(ResolveContext& ctx, Army& a, const std::string& reason);

void rout_army(ResolveContext& ctx, Army& a, const std::string& reason);

// Routed, embarked, or otherwise unable to take field orders.
void require_field_ready(const Army& a);

} // namespace cataphract
