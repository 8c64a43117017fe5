#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "cataphract/core/campaign.h"
#include "cataphract/core/orders.h"
#include "cataphract/core/resolve_context.h"
#include "cataphract/core/rules_config.h"

namespace cataphract {

// What the host submits. army_id may be left unset for army orders, in which
// case the commander's current army acts.
struct OrderRequest {
  Id commander_id{kInvalidId};
  Id army_id{kInvalidId};
  OrderParams params;
  std::optional<int> execute_day;
  std::optional<DayPart> execute_part;
  int priority{0};
};

// (tick, priority descending, submission ascending). Unscheduled orders are
// keyed at `now`.
struct DispatchKey {
  std::int64_t tick{0};
  int priority{0};
  std::uint64_t seq{0};
};

bool operator<(const DispatchKey& a, const DispatchKey& b);

DispatchKey dispatch_key(const Order& o, TickStamp now);

// Owns the order state machine: pending -> executing -> completed | failed |
// cancelled. Stateless apart from the engine switches; all order state lives
// in the Campaign.
class OrderScheduler {
 public:
  explicit OrderScheduler(EngineConfig cfg = {}) : cfg_(cfg) {}

  // Validates and enqueues. Throws ValidationError, AuthorizationError,
  // NotFoundError or ConflictError; nothing is changed on failure.
  Order& submit(Campaign& c, const OrderRequest& req) const;

  // pending/executing -> cancelled. Throws InvalidStateError on a terminal
  // order and NotFoundError on an unknown id.
  Order& cancel(Campaign& c, Id order_id) const;

  // Pending orders due at the campaign's current tick, in dispatch-key order.
  std::vector<Id> due_orders(const Campaign& c) const;

  // Step (a). Resolver errors become failed orders; only InvariantViolation
  // escapes.
  void dispatch_due(ResolveContext& ctx) const;

  const EngineConfig& config() const { return cfg_; }

 private:
  void execute(ResolveContext& ctx, Order& order) const;

  EngineConfig cfg_;
};

} // namespace cataphract
