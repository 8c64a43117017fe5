#pragma once

#include <exception>
#include <string>

#include "cataphract/core/campaign.h"
#include "cataphract/core/errors.h"
#include "cataphract/core/map_graph.h"
#include "cataphract/core/rolls.h"
#include "cataphract/core/rules_config.h"
#include "cataphract/util/log.h"

namespace cataphract {

// Everything a resolver may touch during one day-part. Resolvers mutate
// `campaign` in place; the tick engine owns the transaction around them.
struct ResolveContext {
  Campaign& campaign;
  const MapGraph& map;
  const RulesConfig& rules;
  Dice& dice;

  // The order being resolved, if any; stamped on audit entries.
  Id order_id{kInvalidId};

  TickStamp now() const { return campaign.now(); }
  Weather weather() const { return campaign.weather_on(campaign.current_day); }
};

// Runs one entity's share of an upkeep step. A failure is logged and audited
// against that entity and does not stop the step for the others; invariant
// violations still propagate.
template <typename Fn>
void for_entity(ResolveContext& ctx, const std::string& subsystem, const std::string& context, Id subject_id, Fn&& fn) {
  try {
    fn();
  } catch (const InvariantViolation&) {
    throw;
  } catch (const std::exception& e) {
    log::warn(subsystem + " " + context + ": " + e.what());
    ctx.dice.note(subsystem, context, std::string("failed: ") + e.what(), kInvalidId, subject_id);
  }
}

} // namespace cataphract
