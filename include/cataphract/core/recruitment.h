#pragma once

#include "cataphract/core/orders.h"
#include "cataphract/core/resolve_context.h"

namespace cataphract {

// Progress points a stronghold contributes per day-part.
int recruitment_rate(StrongholdType t, const RecruitmentRules& r);

// Chance in 6 that levying from `hex` today provokes a revolt; zero outside
// the cooldown since its last levy.
int levy_revolt_chance(const Hex& hex, int current_day, const RecruitmentRules& r);

// The active or suspended project for (stronghold, commander), if any.
const RecruitmentProject* open_project_for(const Campaign& c, Id stronghold_id, Id commander_id);

// Starts a project (no army is spawned yet) or, with order.project_id set,
// resumes a suspended one. A repeat levy within the cooldown may instead
// raise a rebel army in the stronghold's hex and abandon the recruitment.
OrderResult resolve_raise_army(ResolveContext& ctx, const Commander& cmd, const RaiseArmyOrder& order);

// Step (d): suspend projects whose stronghold changed hands, advance the rest
// and spawn the army of every project that completes.
void tick_recruitment(ResolveContext& ctx);

// Loot per day owed for a mercenary detachment.
int mercenary_daily_upkeep(const Detachment& d, const MercenaryRules& r);

// Step (d): charge each contract once per day for the days elapsed.
void tick_mercenary_upkeep(ResolveContext& ctx);

} // namespace cataphract
