#pragma once

#include "cataphract/core/orders.h"
#include "cataphract/core/resolve_context.h"

namespace cataphract {

int embarked_soldiers(const Campaign& c, const Ship& ship);

// Sailing miles for `route` starting at `from`. Throws InvalidRouteError on a
// non-sea hex or a missing sea lane.
double validate_sea_route(const MapGraph& map, Id from, const std::vector<Id>& route);

OrderResult resolve_embark(ResolveContext& ctx, Army& army, const EmbarkOrder& order);
OrderResult resolve_disembark(ResolveContext& ctx, Army& army, const DisembarkOrder& order);

// Sets the ship under way; the order stays executing until arrival.
OrderResult resolve_naval_move(ResolveContext& ctx, const Commander& cmd, const NavalMoveOrder& order);

// Moves sailing ships (and their passengers) by one part's worth of miles.
void advance_ships(ResolveContext& ctx);

} // namespace cataphract
