#include "cataphract/core/scheduler.h"

#include <algorithm>
#include <type_traits>
#include <variant>

#include "cataphract/core/combat.h"
#include "cataphract/core/errors.h"
#include "cataphract/core/logistics.h"
#include "cataphract/core/messaging.h"
#include "cataphract/core/naval.h"
#include "cataphract/core/operations.h"
#include "cataphract/core/recruitment.h"
#include "cataphract/util/log.h"
#include "cataphract/util/sorted_keys.h"

namespace cataphract {
namespace {

std::string order_ctx(const Order& o) {
  return std::string(order_type_label(order_type(o.params))) + ":" + std::to_string(o.id);
}

void require_army_exists(const Campaign& c, Id id) {
  if (!c.armies.count(id)) throw NotFoundError("army " + std::to_string(id) + " not found");
}

void require_stronghold_exists(const Campaign& c, Id id) {
  if (!c.strongholds.count(id)) throw NotFoundError("stronghold " + std::to_string(id) + " not found");
}

const Ship& require_ship_exists(const Campaign& c, Id id) {
  const Ship* s = find_ptr(c.ships, id);
  if (!s) throw NotFoundError("ship " + std::to_string(id) + " not found");
  return *s;
}

// Structural checks for typed submissions; the JSON path enforces the same
// rules while parsing.
void check_shape(const OrderParams& params) {
  std::visit(
      [](const auto& o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, MoveOrder>) {
          if (o.legs.empty()) throw ValidationError("move: at least one leg is required");
          for (const auto& leg : o.legs) {
            if (leg.to_hex_id == kInvalidId) throw ValidationError("move: leg needs to_hex_id");
            if (leg.distance_miles <= 0.0) throw ValidationError("move: leg distance must be positive");
            if (leg.has_fork && leg.alternate_hex_id == kInvalidId) {
              throw ValidationError("move: fork leg needs alternate_hex_id");
            }
          }
        } else if constexpr (std::is_same_v<T, RestOrder>) {
          if (o.duration_days <= 0) throw ValidationError("rest: duration_days must be positive");
        } else if constexpr (std::is_same_v<T, ForageOrder> || std::is_same_v<T, TorchOrder>) {
          if (o.hex_ids.empty()) throw ValidationError("at least one hex is required");
        } else if constexpr (std::is_same_v<T, SupplyTransferOrder>) {
          if (o.target_army_id == kInvalidId) throw ValidationError("supply_transfer: target_army_id is required");
          if (o.amount <= 0) throw ValidationError("supply_transfer: amount must be positive");
        } else if constexpr (std::is_same_v<T, BesiegeOrder>) {
          if (o.stronghold_id == kInvalidId) throw ValidationError("besiege: stronghold_id is required");
          if (o.siege_engines < 0) throw ValidationError("besiege: siege_engines must not be negative");
        } else if constexpr (std::is_same_v<T, AssaultOrder>) {
          if (o.stronghold_id == kInvalidId) throw ValidationError("assault: stronghold_id is required");
        } else if constexpr (std::is_same_v<T, EmbarkOrder> || std::is_same_v<T, DisembarkOrder>) {
          if (o.ship_id == kInvalidId) throw ValidationError("ship_id is required");
        } else if constexpr (std::is_same_v<T, NavalMoveOrder>) {
          if (o.ship_id == kInvalidId) throw ValidationError("naval_move: ship_id is required");
          if (o.route.empty()) throw ValidationError("naval_move: route is empty");
        } else if constexpr (std::is_same_v<T, SendMessageOrder>) {
          if (o.recipient_commander_id == kInvalidId) throw ValidationError("send_message: recipient_id is required");
        } else if constexpr (std::is_same_v<T, LaunchOperationOrder>) {
          if (o.operation_id == kInvalidId && o.target_id == kInvalidId) {
            throw ValidationError("launch_operation: target_id is required");
          }
          if (o.operation_id == kInvalidId && o.type == OperationType::Assassination &&
              o.target_kind != TargetKind::Commander) {
            throw ValidationError("launch_operation: assassination requires a commander target");
          }
        } else if constexpr (std::is_same_v<T, RaiseArmyOrder>) {
          if (o.project_id == kInvalidId) {
            if (o.stronghold_id == kInvalidId) throw ValidationError("raise_army: stronghold_id is required");
            if (o.composition.empty()) throw ValidationError("raise_army: at least one unit is required");
            for (const auto& u : o.composition) {
              if (u.soldiers <= 0 || u.wagons < 0) throw ValidationError("raise_army: bad unit composition");
            }
          }
        } else if constexpr (std::is_same_v<T, HarryOrder>) {
          if (o.detachment_ids.empty()) throw ValidationError("harry: at least one detachment is required");
          if (o.target_army_id == kInvalidId) throw ValidationError("harry: target_army_id is required");
        }
      },
      params);
}

bool pending_raise_for(const Campaign& c, Id commander_id, Id stronghold_id) {
  for (const auto& [_, o] : c.orders) {
    if (o.status != OrderStatus::Pending || o.commander_id != commander_id) continue;
    const auto* r = std::get_if<RaiseArmyOrder>(&o.params);
    if (r && r->project_id == kInvalidId && r->stronghold_id == stronghold_id) return true;
  }
  return false;
}

// Referenced entities must exist when the order is accepted.
void check_references(const Campaign& c, const Commander& cmd, const Army* army, const OrderParams& params) {
  std::visit(
      [&](const auto& o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, SupplyTransferOrder>) {
          require_army_exists(c, o.target_army_id);
        } else if constexpr (std::is_same_v<T, BesiegeOrder> || std::is_same_v<T, AssaultOrder>) {
          require_stronghold_exists(c, o.stronghold_id);
        } else if constexpr (std::is_same_v<T, EmbarkOrder> || std::is_same_v<T, DisembarkOrder>) {
          require_ship_exists(c, o.ship_id);
        } else if constexpr (std::is_same_v<T, NavalMoveOrder>) {
          const Ship& ship = require_ship_exists(c, o.ship_id);
          if (ship.faction_id != cmd.faction_id) {
            throw AuthorizationError("commander " + cmd.name + " does not control ship " + ship.name);
          }
        } else if constexpr (std::is_same_v<T, SendMessageOrder>) {
          if (!c.commanders.count(o.recipient_commander_id)) {
            throw NotFoundError("commander " + std::to_string(o.recipient_commander_id) + " not found");
          }
        } else if constexpr (std::is_same_v<T, LaunchOperationOrder>) {
          if (o.operation_id != kInvalidId) {
            const Operation* op = find_ptr(c.operations, o.operation_id);
            if (!op) throw NotFoundError("operation " + std::to_string(o.operation_id) + " not found");
            if (op->commander_id != cmd.id) throw AuthorizationError("operation belongs to another commander");
            return;
          }
          switch (o.target_kind) {
            case TargetKind::Army: require_army_exists(c, o.target_id); break;
            case TargetKind::Stronghold: require_stronghold_exists(c, o.target_id); break;
            case TargetKind::Commander:
              if (!c.commanders.count(o.target_id)) {
                throw NotFoundError("commander " + std::to_string(o.target_id) + " not found");
              }
              break;
          }
        } else if constexpr (std::is_same_v<T, RaiseArmyOrder>) {
          if (o.project_id != kInvalidId) {
            const RecruitmentProject* p = find_ptr(c.projects, o.project_id);
            if (!p) throw NotFoundError("recruitment project " + std::to_string(o.project_id) + " not found");
            if (p->commander_id != cmd.id) throw AuthorizationError("project belongs to another commander");
            return;
          }
          require_stronghold_exists(c, o.stronghold_id);
          for (const auto& u : o.composition) {
            if (!c.unit_types.count(u.unit_type_id)) {
              throw NotFoundError("unit type " + std::to_string(u.unit_type_id) + " not found");
            }
          }
          if (open_project_for(c, o.stronghold_id, cmd.id) || pending_raise_for(c, cmd.id, o.stronghold_id)) {
            throw ConflictError("recruitment already under way at stronghold " + std::to_string(o.stronghold_id) +
                                " for " + cmd.name + "; resubmit with its project_id");
          }
        } else if constexpr (std::is_same_v<T, HarryOrder>) {
          require_army_exists(c, o.target_army_id);
          for (Id did : o.detachment_ids) {
            if (!army || !find_detachment(*army, did)) {
              throw NotFoundError("detachment " + std::to_string(did) + " not found in acting army");
            }
          }
        }
      },
      params);
}

std::vector<Id>& queue_for(Campaign& c, const Order& o) {
  if (Army* a = find_ptr(c.armies, o.army_id)) return a->order_queue;
  return c.commanders.at(o.commander_id).order_queue;
}

void drop_from_queues(Campaign& c, const Order& o) {
  auto drop = [&](std::vector<Id>& q) { q.erase(std::remove(q.begin(), q.end(), o.id), q.end()); };
  if (Army* a = find_ptr(c.armies, o.army_id)) drop(a->order_queue);
  if (Commander* cmd = find_ptr(c.commanders, o.commander_id)) drop(cmd->order_queue);
}

} // namespace

bool operator<(const DispatchKey& a, const DispatchKey& b) {
  if (a.tick != b.tick) return a.tick < b.tick;
  if (a.priority != b.priority) return a.priority > b.priority;
  return a.seq < b.seq;
}

DispatchKey dispatch_key(const Order& o, TickStamp now) {
  DispatchKey k;
  k.tick = o.execute_day ? TickStamp{*o.execute_day, o.execute_part.value_or(DayPart::Morning)}.index() : now.index();
  k.priority = o.priority;
  k.seq = o.submission_seq;
  return k;
}

Order& OrderScheduler::submit(Campaign& c, const OrderRequest& req) const {
  if (c.status != CampaignStatus::Active) {
    throw InvalidStateError("campaign is not active");
  }
  check_shape(req.params);

  const OrderType type = order_type(req.params);
  if (req.execute_part && !req.execute_day) throw ValidationError("execute_part requires execute_day");
  if (req.execute_day && *req.execute_day < 0) throw ValidationError("execute_day must not be negative");
  if (!cfg_.allow_fixed_rolls && order_has_fixed_rolls(req.params)) {
    throw ValidationError("fixed rolls are disabled for this engine");
  }

  const Commander* cmd = find_ptr(c.commanders, req.commander_id);
  if (!cmd) throw NotFoundError("commander " + std::to_string(req.commander_id) + " not found");
  if (cmd->status != CommanderStatus::Active) {
    throw AuthorizationError("commander " + cmd->name + " cannot issue orders");
  }

  Id army_id = req.army_id;
  if (army_id == kInvalidId && order_requires_army(type)) army_id = cmd->army_id;
  if (order_requires_army(type) && army_id == kInvalidId) {
    throw ValidationError(std::string(order_type_label(type)) + " requires an acting army");
  }
  const Army* army = nullptr;
  if (army_id != kInvalidId) {
    army = find_ptr(c.armies, army_id);
    if (!army) throw NotFoundError("army " + std::to_string(army_id) + " not found");
    if (army->commander_id != cmd->id) {
      throw AuthorizationError("commander " + cmd->name + " does not control army " + army->name);
    }
  }
  check_references(c, *cmd, army, req.params);

  Order o;
  o.id = allocate_id(c);
  o.commander_id = cmd->id;
  o.army_id = army_id;
  o.params = req.params;
  o.execute_day = req.execute_day;
  o.execute_part = req.execute_part;
  o.priority = req.priority;
  o.submission_seq = c.next_order_seq++;
  o.submitted_at = c.now();
  const Id id = o.id;
  Order& stored = c.orders[id] = std::move(o);

  // Keep each queue in dispatch-key order.
  std::vector<Id>& q = queue_for(c, stored);
  const TickStamp now = c.now();
  const DispatchKey key = dispatch_key(stored, now);
  auto pos = std::upper_bound(q.begin(), q.end(), key, [&](const DispatchKey& k, Id other) {
    const Order* oo = find_ptr(c.orders, other);
    return oo ? k < dispatch_key(*oo, now) : true;
  });
  q.insert(pos, id);

  log::debug("Order submitted: " + order_to_string(stored));
  return stored;
}

Order& OrderScheduler::cancel(Campaign& c, Id order_id) const {
  Order* o = find_ptr(c.orders, order_id);
  if (!o) throw NotFoundError("order " + std::to_string(order_id) + " not found");
  if (is_terminal(o->status)) {
    throw InvalidStateError("order " + std::to_string(order_id) + " is already " + order_status_label(o->status));
  }

  if (o->status == OrderStatus::Executing) {
    if (Army* a = find_ptr(c.armies, o->army_id); a && a->rest_order_id == o->id) {
      a->rest_order_id = kInvalidId;
      a->rest_until_day = -1;
      if (a->status == ArmyStatus::Resting) a->status = ArmyStatus::Idle;
    }
    for (auto& [_, ship] : c.ships) {
      if (ship.voyage_order_id != o->id) continue;
      // The voyage stops at the last hex reached.
      ship.voyage_order_id = kInvalidId;
      ship.route.clear();
      ship.progress_miles = 0.0;
      ship.status = ShipStatus::Docked;
    }
  }

  o->status = OrderStatus::Cancelled;
  o->finished_at = c.now();
  drop_from_queues(c, *o);
  log::debug("Order cancelled: " + order_to_string(*o));
  return *o;
}

std::vector<Id> OrderScheduler::due_orders(const Campaign& c) const {
  const TickStamp now = c.now();
  std::vector<std::pair<DispatchKey, Id>> due;
  for (Id id : util::sorted_keys(c.orders)) {
    const Order& o = c.orders.at(id);
    if (o.status != OrderStatus::Pending) continue;
    const DispatchKey k = dispatch_key(o, now);
    if (k.tick > now.index()) continue;
    due.emplace_back(k, id);
  }
  std::sort(due.begin(), due.end(), [](const auto& a, const auto& b) { return a.first < b.first; });

  std::vector<Id> out;
  out.reserve(due.size());
  for (const auto& d : due) out.push_back(d.second);
  return out;
}

void OrderScheduler::dispatch_due(ResolveContext& ctx) const {
  Campaign& c = ctx.campaign;
  for (Id id : due_orders(c)) {
    Order* o = find_ptr(c.orders, id);
    // An earlier order this part may have cancelled or consumed it.
    if (!o || o->status != OrderStatus::Pending) continue;
    execute(ctx, *o);
  }
}

void OrderScheduler::execute(ResolveContext& ctx, Order& order) const {
  Campaign& c = ctx.campaign;
  const Id order_id = order.id;
  order.status = OrderStatus::Executing;
  drop_from_queues(c, order);

  ResolveContext octx{ctx.campaign, ctx.map, ctx.rules, ctx.dice, order_id};
  const std::string context = order_ctx(order);

  OrderResult res;
  try {
    const Commander* cmd = find_ptr(c.commanders, order.commander_id);
    if (!cmd) throw NotFoundError("commander " + std::to_string(order.commander_id) + " not found");
    if (cmd->status != CommanderStatus::Active) throw AuthorizationError("commander " + cmd->name + " is unavailable");

    Army* army = nullptr;
    if (order.army_id != kInvalidId) {
      army = find_ptr(c.armies, order.army_id);
      if (!army) throw NotFoundError("army " + std::to_string(order.army_id) + " no longer exists");
      if (army->commander_id != cmd->id) throw AuthorizationError(cmd->name + " no longer commands " + army->name);
    }

    res = std::visit(
        [&](const auto& p) -> OrderResult {
          using T = std::decay_t<decltype(p)>;
          if constexpr (std::is_same_v<T, MoveOrder>) return resolve_move(octx, *army, p);
          else if constexpr (std::is_same_v<T, RestOrder>) return resolve_rest(octx, *army, p);
          else if constexpr (std::is_same_v<T, ForageOrder>) return resolve_forage(octx, *army, p);
          else if constexpr (std::is_same_v<T, TorchOrder>) return resolve_torch(octx, *army, p);
          else if constexpr (std::is_same_v<T, SupplyTransferOrder>) return resolve_supply_transfer(octx, *army, p);
          else if constexpr (std::is_same_v<T, BesiegeOrder>) return resolve_besiege(octx, *army, p);
          else if constexpr (std::is_same_v<T, AssaultOrder>) return resolve_assault(octx, *army, p);
          else if constexpr (std::is_same_v<T, EmbarkOrder>) return resolve_embark(octx, *army, p);
          else if constexpr (std::is_same_v<T, DisembarkOrder>) return resolve_disembark(octx, *army, p);
          else if constexpr (std::is_same_v<T, NavalMoveOrder>) return resolve_naval_move(octx, *cmd, p);
          else if constexpr (std::is_same_v<T, SendMessageOrder>) return resolve_send_message(octx, *cmd, p);
          else if constexpr (std::is_same_v<T, LaunchOperationOrder>) return resolve_launch_operation(octx, *cmd, p);
          else if constexpr (std::is_same_v<T, RaiseArmyOrder>) return resolve_raise_army(octx, *cmd, p);
          else return resolve_harry(octx, *army, p);
        },
        order.params);
  } catch (const InvariantViolation&) {
    throw;
  } catch (const EngineError& e) {
    res = OrderResult{};
    res.error = e.kind();
    res.error_detail = e.what();
  } catch (const std::exception& e) {
    res = OrderResult{};
    res.error = ErrorKind::Internal;
    res.error_detail = e.what();
  }

  Order& o = order;
  const bool failed = res.error != ErrorKind::None;
  const bool running = !failed && res.in_progress;
  o.status = failed ? OrderStatus::Failed : (running ? OrderStatus::Executing : OrderStatus::Completed);
  if (!running) o.finished_at = c.now();
  o.result = res;

  if (failed) {
    ctx.dice.note("scheduler", context,
                  std::string("failed: ") + error_kind_label(res.error) + ": " + res.error_detail, order_id,
                  o.army_id);
    log::warn("Order " + order_to_string(o));
  } else {
    ctx.dice.note("scheduler", context,
                  std::string(running ? "executing: " : "completed: ") + (res.partial ? "(partial) " : "") +
                      res.summary,
                  order_id, o.army_id);
  }
}

} // namespace cataphract
