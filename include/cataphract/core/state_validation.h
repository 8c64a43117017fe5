#pragma once

#include <string>
#include <vector>

#include "cataphract/core/campaign.h"

namespace cataphract {

// Checks the cross-entity invariants that must hold between day-parts.
// Returns one human-readable line per problem; empty means valid.
std::vector<std::string> validate_campaign(const Campaign& c);

// Throws InvariantViolation listing the first problems, if any.
void require_valid_campaign(const Campaign& c);

} // namespace cataphract
