#pragma once

#include <optional>

#include "cataphract/core/orders.h"
#include "cataphract/core/resolve_context.h"

namespace cataphract {

// Threshold points removed per day-part by the siege's current attackers.
int siege_reduction_per_part(const Campaign& c, const Siege& siege, const SiegeRules& r);

// int((ratio - 1) / 0.1) for the larger side, capped; 0 when either side is empty.
int numeric_advantage(int own_soldiers, int other_soldiers, const BattleRules& r);
int morale_advantage(int morale, const MoraleRules& m, const BattleRules& r);

// Row of the outcome table for a margin between the two totals.
const CasualtyBand& casualty_band(int margin, const BattleRules& r);

OrderResult resolve_besiege(ResolveContext& ctx, Army& army, const BesiegeOrder& order);

// Ties favor the defender. Both sides take losses and morale shifts from the
// casualty band of the margin; a repulsed attacker pays failed_assault_losses
// and failed_assault_penalty on top.
OrderResult resolve_assault(ResolveContext& ctx, Army& army, const AssaultOrder& order);

OrderResult resolve_harry(ResolveContext& ctx, Army& army, const HarryOrder& order);

// Transfer control to `army`'s faction and apply capture effects.
// `escape_fixed_roll` replaces the defending commander's escape roll.
void capture_stronghold(ResolveContext& ctx, Stronghold& s, Army& army, bool pillage,
                        std::optional<int> escape_fixed_roll = std::nullopt);

// Step (c): reduce thresholds, lift abandoned sieges, capture at zero.
void advance_sieges(ResolveContext& ctx);

} // namespace cataphract
