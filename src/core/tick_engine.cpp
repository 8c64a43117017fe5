#include "cataphract/core/tick_engine.h"

#include "cataphract/core/combat.h"
#include "cataphract/core/errors.h"
#include "cataphract/core/logistics.h"
#include "cataphract/core/map_graph.h"
#include "cataphract/core/messaging.h"
#include "cataphract/core/naval.h"
#include "cataphract/core/recruitment.h"
#include "cataphract/core/state_validation.h"
#include "cataphract/util/log.h"

namespace cataphract {

PartReport TickEngine::run_part(Campaign& c, RollSource& rolls) const {
  if (c.status != CampaignStatus::Active) throw InvalidStateError("campaign is not active");

  const MapGraph graph(c.map, rules_.messaging.hex_miles);
  Dice dice(c, rolls);
  ResolveContext ctx{c, graph, rules_, dice};

  PartReport report;
  report.tick = c.now();
  const std::uint64_t audit_before = c.next_audit_seq;

  if (c.current_part == DayPart::Morning) start_of_day(ctx);

  const auto due = scheduler_.due_orders(c);
  scheduler_.dispatch_due(ctx);
  for (Id id : due) {
    const Order* o = find_ptr(c.orders, id);
    if (!o || o->status == OrderStatus::Pending) continue;
    report.orders_dispatched += 1;
    if (o->status == OrderStatus::Failed) report.orders_failed += 1;
  }
  advance_ships(ctx);

  drain_supplies(ctx);
  advance_sieges(ctx);
  tick_recruitment(ctx);
  tick_mercenary_upkeep(ctx);
  deliver_due_messages(ctx);

  if (scheduler_.config().validate_invariants) {
    try {
      require_valid_campaign(c);
    } catch (const InvariantViolation& e) {
      log::error(std::string("Aborting ") + report.tick.to_string() + ": " + e.what());
      throw;
    }
  }

  const TickStamp next = c.now().next();
  c.current_day = next.day;
  c.current_part = next.part;
  report.audit_entries = c.next_audit_seq - audit_before;

  if (report.orders_failed > 0) {
    log::debug(report.tick.to_string() + ": " + std::to_string(report.orders_failed) + " of " +
               std::to_string(report.orders_dispatched) + " orders failed");
  }
  return report;
}

} // namespace cataphract
