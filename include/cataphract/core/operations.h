#pragma once

#include "cataphract/core/orders.h"
#include "cataphract/core/resolve_context.h"

namespace cataphract {

int operation_stages(OperationComplexity c);

// Summed modifier for (type, complexity, territory, difficulty).
int operation_modifier(OperationType type, OperationComplexity complexity, TerritoryType territory,
                       int difficulty_modifier, const OperationRules& r);

// 2d6 target number; the final stage succeeds when the roll meets it.
int operation_target(int modifier, const OperationRules& r);

// P(2d6 >= target).
double operation_success_probability(int target);

// Starts a new operation (paying loot_cost up front) or resumes the one named
// by order.operation_id. Each call performs exactly one stage.
OrderResult resolve_launch_operation(ResolveContext& ctx, const Commander& cmd, const LaunchOperationOrder& order);

} // namespace cataphract
