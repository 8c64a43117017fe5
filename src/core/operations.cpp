#include "cataphract/core/operations.h"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "cataphract/core/army_rules.h"
#include "cataphract/core/errors.h"
#include "cataphract/core/messaging.h"
#include "cataphract/util/log.h"

namespace cataphract {
namespace {

std::string op_ctx(const Operation& op) { return "operation:" + std::to_string(op.id); }

void require_target(const Campaign& c, TargetKind kind, Id id) {
  bool found = false;
  switch (kind) {
    case TargetKind::Army: found = c.armies.count(id) != 0; break;
    case TargetKind::Stronghold: found = c.strongholds.count(id) != 0; break;
    case TargetKind::Commander: found = c.commanders.count(id) != 0; break;
  }
  if (!found) throw NotFoundError(std::string(target_kind_label(kind)) + " " + std::to_string(id) + " not found");
}

std::string describe_target(const Campaign& c, const Operation& op) {
  std::ostringstream ss;
  switch (op.target_kind) {
    case TargetKind::Army: {
      const Army& a = c.armies.at(op.target_id);
      ss << "army " << a.name << " at hex " << a.hex_id << ": " << army_soldiers(a) << " soldiers, supplies "
         << a.supplies_current << "/" << a.supplies_capacity << ", morale " << a.morale_current << ", "
         << army_status_label(a.status);
      break;
    }
    case TargetKind::Stronghold: {
      const Stronghold& s = c.strongholds.at(op.target_id);
      ss << stronghold_type_label(s.type) << " " << s.name << ": faction " << s.controlling_faction_id
         << ", threshold " << s.current_threshold << "/" << s.base_threshold << ", garrison " << s.garrison_army_id;
      break;
    }
    case TargetKind::Commander: {
      const Commander& cmd = c.commanders.at(op.target_id);
      ss << "commander " << cmd.name << ": army " << cmd.army_id << ", hex " << last_known_hex(c, cmd);
      break;
    }
  }
  return ss.str();
}

std::string apply_sabotage(ResolveContext& ctx, const Operation& op) {
  Campaign& c = ctx.campaign;
  const OperationRules& r = ctx.rules.operations;
  Army* army = nullptr;
  if (op.target_kind == TargetKind::Army) army = find_ptr(c.armies, op.target_id);
  if (op.target_kind == TargetKind::Commander) {
    if (const Commander* cmd = find_ptr(c.commanders, op.target_id)) army = find_ptr(c.armies, cmd->army_id);
  }
  if (op.target_kind == TargetKind::Stronghold) {
    Stronghold& s = c.strongholds.at(op.target_id);
    const int before = s.current_threshold;
    // Sabotage weakens the walls but only a siege or an assault takes them.
    s.current_threshold = std::max(std::min(before, 1), before - r.sabotage_threshold_damage);
    return "threshold " + std::to_string(before) + " -> " + std::to_string(s.current_threshold);
  }
  if (!army) return "target has no army to sabotage";
  const int burned = static_cast<int>(std::floor(army->supplies_current * r.sabotage_supply_fraction));
  army->supplies_current -= burned;
  return "destroyed " + std::to_string(burned) + " supplies of army " + std::to_string(army->id);
}

std::string apply_assassination(ResolveContext& ctx, const Operation& op) {
  Campaign& c = ctx.campaign;
  Commander& victim = c.commanders.at(op.target_id);
  victim.status = CommanderStatus::Dead;
  std::string effect = victim.name + " assassinated";
  if (Army* a = find_ptr(c.armies, victim.army_id)) {
    adjust_morale(*a, -ctx.rules.morale.assassination_penalty, ctx.rules.morale);
    a->commander_id = kInvalidId;
    effect += "; army " + std::to_string(a->id) + " leaderless";
  }
  victim.army_id = kInvalidId;
  log::info("Commander " + victim.name + " assassinated");
  return effect;
}

OrderResult run_stage(ResolveContext& ctx, Operation& op, const LaunchOperationOrder& order) {
  Campaign& c = ctx.campaign;
  const OperationRules& r = ctx.rules.operations;

  op.stages_done += 1;
  op.last_stage = c.now();

  OrderResult res;
  res.continuation_id = op.id;
  std::ostringstream ss;
  ss << operation_type_label(op.type) << " operation " << op.id << " stage " << op.stages_done << "/"
     << op.stages_total << ": ";

  if (op.stages_done < op.stages_total) {
    int chance = r.exposure_chance;
    if (op.territory == TerritoryType::Hostile) chance += r.hostile_exposure_bonus;
    const auto roll = ctx.dice.d(6, "operations", op_ctx(op) + ":exposure", order.exposure_fixed_roll, ctx.order_id,
                                 op.id);
    if (roll.total <= chance) {
      op.status = OperationStatus::Resolved;
      op.outcome = OperationOutcome::Interrupted;
      ss << "agents exposed (roll " << roll.total << " <= " << chance << ")";
    } else {
      ss << "undetected; resume with operation_id " << op.id;
    }
  } else {
    const int modifier = operation_modifier(op.type, op.complexity, op.territory, op.difficulty_modifier, r);
    const int target = operation_target(modifier, r);
    RollSpec spec;
    spec.subsystem = "operations";
    spec.context = op_ctx(op) + ":outcome";
    spec.count = 2;
    spec.sides = 6;
    spec.fixed = order.fixed_roll;
    spec.order_id = ctx.order_id;
    spec.subject_id = op.id;
    spec.purpose = "operation success vs target " + std::to_string(target);
    const auto roll = ctx.dice.roll(spec);

    op.status = OperationStatus::Resolved;
    if (roll.total >= target) {
      op.outcome = OperationOutcome::Success;
      switch (op.type) {
        case OperationType::Intelligence: op.report = describe_target(c, op); break;
        case OperationType::Sabotage: op.report = apply_sabotage(ctx, op); break;
        case OperationType::Assassination: op.report = apply_assassination(ctx, op); break;
      }
      ss << "success (roll " << roll.total << " >= " << target << "): " << op.report;
    } else {
      op.outcome = OperationOutcome::Failure;
      ss << "failure (roll " << roll.total << " < " << target << ")";
    }
  }

  res.summary = ss.str();
  ctx.dice.note("operations", op_ctx(op), res.summary, ctx.order_id, op.id);
  return res;
}

} // namespace

int operation_stages(OperationComplexity c) {
  switch (c) {
    case OperationComplexity::Simple: return 1;
    case OperationComplexity::Standard: return 2;
    case OperationComplexity::Complex: return 3;
  }
  return 1;
}

int operation_modifier(OperationType type, OperationComplexity complexity, TerritoryType territory,
                       int difficulty_modifier, const OperationRules& r) {
  int mod = difficulty_modifier;
  switch (complexity) {
    case OperationComplexity::Simple: mod += r.simple_modifier; break;
    case OperationComplexity::Standard: mod += r.standard_modifier; break;
    case OperationComplexity::Complex: mod += r.complex_modifier; break;
  }
  switch (territory) {
    case TerritoryType::Friendly: mod += r.friendly_modifier; break;
    case TerritoryType::Neutral: mod += r.neutral_modifier; break;
    case TerritoryType::Hostile: mod += r.hostile_modifier; break;
  }
  switch (type) {
    case OperationType::Intelligence: mod += r.intelligence_modifier; break;
    case OperationType::Sabotage: mod += r.sabotage_modifier; break;
    case OperationType::Assassination: mod += r.assassination_modifier; break;
  }
  return mod;
}

int operation_target(int modifier, const OperationRules& r) {
  return std::clamp(r.base_target - modifier, r.min_target, r.max_target);
}

double operation_success_probability(int target) {
  int hits = 0;
  for (int a = 1; a <= 6; ++a) {
    for (int b = 1; b <= 6; ++b) {
      if (a + b >= target) ++hits;
    }
  }
  return hits / 36.0;
}

OrderResult resolve_launch_operation(ResolveContext& ctx, const Commander& cmd, const LaunchOperationOrder& order) {
  Campaign& c = ctx.campaign;

  if (order.operation_id != kInvalidId) {
    Operation* op = find_ptr(c.operations, order.operation_id);
    if (!op) throw NotFoundError("operation " + std::to_string(order.operation_id) + " not found");
    if (op->commander_id != cmd.id) throw AuthorizationError("operation belongs to another commander");
    if (op->status != OperationStatus::InProgress) {
      throw InvalidStateError("operation " + std::to_string(op->id) + " already " +
                              operation_outcome_label(op->outcome));
    }
    if (!(op->last_stage < c.now())) throw InvalidStateError("operation already advanced this part");
    require_target(c, op->target_kind, op->target_id);
    return run_stage(ctx, *op, order);
  }

  if (order.type == OperationType::Assassination && order.target_kind != TargetKind::Commander) {
    throw ValidationError("assassination requires a commander target");
  }
  require_target(c, order.target_kind, order.target_id);

  Army* purse = find_ptr(c.armies, cmd.army_id);
  const int cost = order.loot_cost >= 0 ? order.loot_cost : ctx.rules.operations.default_loot_cost;
  if (cost > 0) {
    if (!purse) throw InvalidStateError("commander has no army to pay for the operation");
    if (purse->loot < cost) {
      throw InvalidStateError("operation costs " + std::to_string(cost) + " loot, army holds " +
                              std::to_string(purse->loot));
    }
    purse->loot -= cost;
  }

  Operation op;
  op.id = allocate_id(c);
  op.commander_id = cmd.id;
  op.type = order.type;
  op.complexity = order.complexity;
  op.territory = order.territory;
  op.difficulty_modifier = order.difficulty_modifier;
  op.target_kind = order.target_kind;
  op.target_id = order.target_id;
  op.loot_cost = cost;
  op.stages_total = operation_stages(order.complexity);
  const Id id = op.id;
  c.operations[id] = op;
  ctx.dice.note("operations", op_ctx(op), "launched, paid " + std::to_string(cost) + " loot", ctx.order_id, id);

  OrderResult res = run_stage(ctx, c.operations.at(id), order);
  res.created_ids.push_back(id);
  return res;
}

} // namespace cataphract
