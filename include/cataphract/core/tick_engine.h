#pragma once

#include <cstdint>

#include "cataphract/core/campaign.h"
#include "cataphract/core/rolls.h"
#include "cataphract/core/rules_config.h"
#include "cataphract/core/scheduler.h"

namespace cataphract {

// What one day-part did, for logs and the CLI.
struct PartReport {
  TickStamp tick;
  int orders_dispatched{0};
  int orders_failed{0};
  std::uint64_t audit_entries{0};
};

// Drives the (day, part) clock. Each part runs, in order:
//   morning only: daily reset
//   (a) dispatch due orders, then move ships under way
//   (b) supply drain
//   (c) sieges
//   (d) recruitment projects and mercenary upkeep
//   (e) courier deliveries
// followed by the invariant check and the clock advance.
class TickEngine {
 public:
  explicit TickEngine(RulesConfig rules = {}, EngineConfig cfg = {}) : rules_(rules), scheduler_(cfg) {}

  // Mutates `c` in place. On InvariantViolation `c` is left half-updated and
  // must be discarded by the caller.
  PartReport run_part(Campaign& c, RollSource& rolls) const;

  const RulesConfig& rules() const { return rules_; }
  const OrderScheduler& scheduler() const { return scheduler_; }

 private:
  RulesConfig rules_;
  OrderScheduler scheduler_;
};

} // namespace cataphract
