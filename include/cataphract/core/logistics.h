#pragma once

#include "cataphract/core/orders.h"
#include "cataphract/core/resolve_context.h"

namespace cataphract {

// Miles per day for one leg. Road may be null for off-road legs.
double effective_speed(const MoveLeg& leg, MarchPace pace, bool cavalry_only, Weather weather,
                       const MovementRules& r, const Road* road);

// Supplies consumed by marching `miles` (proportional to column size).
int march_supply_cost(const Army& a, double miles, const SupplyRules& r);

// 1d6 <= chance sends the column down the wrong branch at a fork.
int fork_misdirection_chance(const MoveLeg& leg, const MovementRules& r);

OrderResult resolve_move(ResolveContext& ctx, Army& army, const MoveOrder& order);
OrderResult resolve_forage(ResolveContext& ctx, Army& army, const ForageOrder& order);
OrderResult resolve_torch(ResolveContext& ctx, Army& army, const TorchOrder& order);
OrderResult resolve_rest(ResolveContext& ctx, Army& army, const RestOrder& order);
OrderResult resolve_supply_transfer(ResolveContext& ctx, Army& army, const SupplyTransferOrder& order);

// Morning housekeeping: movement points, rest expiry, season, stronghold
// recovery.
void start_of_day(ResolveContext& ctx);

// Step (b): the part's share of each army's daily consumption. On the night
// part, starved armies lose morale and test it.
void drain_supplies(ResolveContext& ctx);

} // namespace cataphract
