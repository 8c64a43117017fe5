#pragma once

#include "cataphract/core/orders.h"
#include "cataphract/core/resolve_context.h"

namespace cataphract {

double courier_speed(TerritoryType t, const MessagingRules& r);

// Probability that a courier through `t` is intercepted.
double interception_probability(TerritoryType t, const MessagingRules& r);

// Parts of a day needed to cover `miles`, at least one.
int courier_travel_parts(double miles, TerritoryType t, const MessagingRules& r);

// The commander's army hex, falling back to the commander's own hex.
Id last_known_hex(const Campaign& c, const Commander& cmd);

// Computes the delivery tick and rolls interception once, at dispatch.
OrderResult resolve_send_message(ResolveContext& ctx, const Commander& sender, const SendMessageOrder& order);

// Step (e).
void deliver_due_messages(ResolveContext& ctx);

} // namespace cataphract
