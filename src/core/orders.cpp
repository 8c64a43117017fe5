#include "cataphract/core/orders.h"

#include <cmath>
#include <limits>
#include <sstream>
#include <type_traits>
#include <utility>

#include "cataphract/util/strings.h"

namespace cataphract {
namespace {

constexpr int kOrderTypeCount = 14;

// Largest id a JSON number can carry exactly.
constexpr double kMaxJsonId = 9007199254740991.0;

// Bound on fixed rolls and roll modifiers so their sums stay well inside int.
constexpr int kRollLimit = 1000000;

// Reads typed fields out of a parameter object, naming the offending field in
// every ValidationError.
class ParamReader {
 public:
  ParamReader(const json::Value& v, std::string where) : v_(v), where_(std::move(where)) {
    if (!v_.is_object()) fail("", "parameters must be an object");
  }

  bool has(const std::string& key) const {
    const json::Value* f = v_.find(key);
    return f && !f->is_null();
  }

  Id id(const std::string& key) const {
    const json::Value& f = require(key);
    const double* d = f.as_number();
    if (!d || *d < 1 || std::floor(*d) != *d) fail(key, "must be a positive integer id");
    if (*d > kMaxJsonId) fail(key, "out of range");
    return static_cast<Id>(*d);
  }

  Id opt_id(const std::string& key) const { return has(key) ? id(key) : kInvalidId; }

  int integer(const std::string& key, int lo = std::numeric_limits<int>::min(),
              int hi = std::numeric_limits<int>::max()) const {
    const json::Value& f = require(key);
    const double* d = f.as_number();
    if (!d || std::floor(*d) != *d) fail(key, "must be an integer");
    if (*d < lo || *d > hi) fail(key, "out of range");
    return static_cast<int>(*d);
  }

  int opt_integer(const std::string& key, int def) const { return has(key) ? integer(key) : def; }

  int opt_modifier(const std::string& key) const { return has(key) ? integer(key, -kRollLimit, kRollLimit) : 0; }

  std::optional<int> opt_roll(const std::string& key) const {
    if (!has(key)) return std::nullopt;
    return integer(key, -kRollLimit, kRollLimit);
  }

  double number(const std::string& key) const {
    const double* d = require(key).as_number();
    if (!d) fail(key, "must be a number");
    return *d;
  }

  bool opt_bool(const std::string& key, bool def) const {
    if (!has(key)) return def;
    const bool* b = v_.at(key).as_bool();
    if (!b) fail(key, "must be a boolean");
    return *b;
  }

  std::string string(const std::string& key) const {
    const std::string* s = require(key).as_string();
    if (!s) fail(key, "must be a string");
    return *s;
  }

  std::string opt_string(const std::string& key, const std::string& def) const {
    return has(key) ? string(key) : def;
  }

  const json::Array& array(const std::string& key) const {
    const json::Array* a = require(key).as_array();
    if (!a) fail(key, "must be an array");
    return *a;
  }

  std::vector<Id> id_list(const std::string& key) const {
    std::vector<Id> out;
    for (const auto& e : array(key)) {
      const double* d = e.as_number();
      if (!d || *d < 1 || std::floor(*d) != *d) fail(key, "must contain positive integer ids");
      if (*d > kMaxJsonId) fail(key, "out of range");
      out.push_back(static_cast<Id>(*d));
    }
    return out;
  }

  template <typename E>
  E enumerated(const std::string& key, bool (*parse)(const std::string&, E*), E def) const {
    if (!has(key)) return def;
    E out = def;
    if (!parse(string(key), &out)) fail(key, "unrecognized value '" + string(key) + "'");
    return out;
  }

  [[noreturn]] void fail(const std::string& key, const std::string& msg) const {
    std::string text = where_;
    if (!key.empty()) text += "." + key;
    throw ValidationError(text + ": " + msg);
  }

 private:
  const json::Value& require(const std::string& key) const {
    const json::Value* f = v_.find(key);
    if (!f || f->is_null()) fail(key, "is required");
    return *f;
  }

  const json::Value& v_;
  std::string where_;
};

bool parse_pace(const std::string& s, MarchPace* out) {
  const std::string v = to_lower(s);
  if (v == "standard") *out = MarchPace::Standard;
  else if (v == "forced") *out = MarchPace::Forced;
  else return false;
  return true;
}

bool parse_objective(const std::string& s, HarryObjective* out) {
  const std::string v = to_lower(s);
  if (v == "kill") *out = HarryObjective::Kill;
  else if (v == "torch") *out = HarryObjective::Torch;
  else if (v == "steal") *out = HarryObjective::Steal;
  else return false;
  return true;
}

MoveOrder parse_move(const ParamReader& p) {
  MoveOrder o;
  o.pace = p.enumerated<MarchPace>("movement_type", parse_pace, MarchPace::Standard);
  const auto& legs = p.array("legs");
  if (legs.empty()) p.fail("legs", "at least one leg is required");
  for (std::size_t i = 0; i < legs.size(); ++i) {
    const ParamReader lp(legs[i], "move.legs[" + std::to_string(i) + "]");
    MoveLeg leg;
    leg.to_hex_id = lp.id("to_hex_id");
    leg.distance_miles = lp.number("distance");
    if (leg.distance_miles <= 0.0) lp.fail("distance", "must be positive");
    leg.on_road = lp.opt_bool("on_road", false);
    leg.has_river_ford = lp.opt_bool("has_river_ford", false);
    leg.is_night = lp.opt_bool("is_night", false);
    leg.has_fork = lp.opt_bool("has_fork", false);
    leg.alternate_hex_id = lp.opt_id("alternate_hex_id");
    if (leg.has_fork && leg.alternate_hex_id == kInvalidId) {
      lp.fail("alternate_hex_id", "is required when has_fork is set");
    }
    leg.fixed_roll = lp.opt_roll("fixed_roll");
    o.legs.push_back(leg);
  }
  return o;
}

std::vector<UnitComposition> parse_composition(const ParamReader& p) {
  std::vector<UnitComposition> out;
  const auto& arr = p.array("composition");
  if (arr.empty()) p.fail("composition", "at least one unit is required");
  for (std::size_t i = 0; i < arr.size(); ++i) {
    const ParamReader up(arr[i], "raise_army.composition[" + std::to_string(i) + "]");
    UnitComposition u;
    u.unit_type_id = up.id("unit_type_id");
    u.soldiers = up.integer("soldiers");
    u.wagons = up.opt_integer("wagons", 0);
    if (u.soldiers <= 0) up.fail("soldiers", "must be positive");
    if (u.wagons < 0) up.fail("wagons", "must not be negative");
    out.push_back(u);
  }
  return out;
}

} // namespace

const char* order_type_label(OrderType t) {
  switch (t) {
    case OrderType::Move: return "move";
    case OrderType::Rest: return "rest";
    case OrderType::Forage: return "forage";
    case OrderType::Torch: return "torch";
    case OrderType::SupplyTransfer: return "supply_transfer";
    case OrderType::Besiege: return "besiege";
    case OrderType::Assault: return "assault";
    case OrderType::Embark: return "embark";
    case OrderType::Disembark: return "disembark";
    case OrderType::NavalMove: return "naval_move";
    case OrderType::SendMessage: return "send_message";
    case OrderType::LaunchOperation: return "launch_operation";
    case OrderType::RaiseArmy: return "raise_army";
    case OrderType::Harry: return "harry";
  }
  return "unknown";
}

bool parse_order_type(const std::string& s, OrderType* out) {
  for (int i = 0; i < kOrderTypeCount; ++i) {
    const auto t = static_cast<OrderType>(i);
    if (s == order_type_label(t)) {
      if (out) *out = t;
      return true;
    }
  }
  return false;
}

const char* order_status_label(OrderStatus s) {
  switch (s) {
    case OrderStatus::Pending: return "pending";
    case OrderStatus::Executing: return "executing";
    case OrderStatus::Completed: return "completed";
    case OrderStatus::Failed: return "failed";
    case OrderStatus::Cancelled: return "cancelled";
  }
  return "unknown";
}

const char* harry_objective_label(HarryObjective o) {
  switch (o) {
    case HarryObjective::Kill: return "kill";
    case HarryObjective::Torch: return "torch";
    case HarryObjective::Steal: return "steal";
  }
  return "kill";
}

bool order_requires_army(OrderType t) {
  switch (t) {
    case OrderType::Move:
    case OrderType::Rest:
    case OrderType::Forage:
    case OrderType::Torch:
    case OrderType::SupplyTransfer:
    case OrderType::Besiege:
    case OrderType::Assault:
    case OrderType::Embark:
    case OrderType::Disembark:
    case OrderType::Harry:
      return true;
    case OrderType::NavalMove:
    case OrderType::SendMessage:
    case OrderType::LaunchOperation:
    case OrderType::RaiseArmy:
      return false;
  }
  return false;
}

bool order_has_fixed_rolls(const OrderParams& p) {
  return std::visit(
      [](const auto& o) -> bool {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, MoveOrder>) {
          for (const auto& leg : o.legs) {
            if (leg.fixed_roll) return true;
          }
          return false;
        } else if constexpr (std::is_same_v<T, AssaultOrder>) {
          return o.attacker_fixed_roll.has_value() || o.defender_fixed_roll.has_value() ||
                 o.escape_fixed_roll.has_value();
        } else if constexpr (std::is_same_v<T, LaunchOperationOrder>) {
          return o.fixed_roll.has_value() || o.exposure_fixed_roll.has_value();
        } else if constexpr (std::is_same_v<T, RaiseArmyOrder>) {
          return o.revolt_fixed_roll.has_value();
        } else if constexpr (std::is_same_v<T, ForageOrder> || std::is_same_v<T, TorchOrder> ||
                             std::is_same_v<T, SendMessageOrder> || std::is_same_v<T, HarryOrder>) {
          return o.fixed_roll.has_value();
        } else {
          return false;
        }
      },
      p);
}

std::string order_to_string(const Order& o) {
  std::ostringstream ss;
  ss << "#" << o.id << " " << order_type_label(order_type(o.params)) << " [" << order_status_label(o.status) << "]";
  if (o.army_id != kInvalidId) ss << " army=" << o.army_id;
  ss << " by=" << o.commander_id;
  if (o.execute_day) {
    ss << " at day " << *o.execute_day;
    if (o.execute_part) ss << " " << day_part_label(*o.execute_part);
  }
  if (o.priority != 0) ss << " prio=" << o.priority;
  if (o.result && !o.result->summary.empty()) ss << " : " << o.result->summary;
  if (o.result && o.result->error != ErrorKind::None) {
    ss << " : " << error_kind_label(o.result->error) << ": " << o.result->error_detail;
  }
  return ss.str();
}

OrderParams parse_order_parameters(const std::string& type_name, const json::Value& params) {
  OrderType type;
  if (!parse_order_type(type_name, &type)) throw ValidationError("unrecognized order_type '" + type_name + "'");
  const ParamReader p(params, type_name);

  switch (type) {
    case OrderType::Move: return parse_move(p);
    case OrderType::Rest: {
      RestOrder o;
      o.duration_days = p.opt_integer("duration_days", 1);
      if (o.duration_days <= 0) p.fail("duration_days", "must be positive");
      return o;
    }
    case OrderType::Forage: {
      ForageOrder o;
      o.hex_ids = p.id_list("hex_ids");
      if (o.hex_ids.empty()) p.fail("hex_ids", "at least one hex is required");
      o.fixed_roll = p.opt_roll("fixed_roll");
      return o;
    }
    case OrderType::Torch: {
      TorchOrder o;
      o.hex_ids = p.id_list("hex_ids");
      if (o.hex_ids.empty()) p.fail("hex_ids", "at least one hex is required");
      o.fixed_roll = p.opt_roll("fixed_roll");
      return o;
    }
    case OrderType::SupplyTransfer: {
      SupplyTransferOrder o;
      o.target_army_id = p.id("target_army_id");
      o.amount = p.integer("amount");
      if (o.amount <= 0) p.fail("amount", "must be positive");
      return o;
    }
    case OrderType::Besiege: {
      BesiegeOrder o;
      o.stronghold_id = p.id("stronghold_id");
      o.siege_engines = p.opt_integer("siege_engines", 0);
      if (o.siege_engines < 0) p.fail("siege_engines", "must not be negative");
      return o;
    }
    case OrderType::Assault: {
      AssaultOrder o;
      o.stronghold_id = p.id("stronghold_id");
      o.attacker_modifier = p.opt_modifier("attacker_modifier");
      o.defender_modifier = p.opt_modifier("defender_modifier");
      o.attacker_fixed_roll = p.opt_roll("attacker_fixed_roll");
      o.defender_fixed_roll = p.opt_roll("defender_fixed_roll");
      o.escape_fixed_roll = p.opt_roll("escape_fixed_roll");
      o.pillage = p.opt_bool("pillage", false);
      return o;
    }
    case OrderType::Embark: {
      EmbarkOrder o;
      o.ship_id = p.id("ship_id");
      return o;
    }
    case OrderType::Disembark: {
      DisembarkOrder o;
      o.ship_id = p.id("ship_id");
      return o;
    }
    case OrderType::NavalMove: {
      NavalMoveOrder o;
      o.ship_id = p.id("ship_id");
      o.route = p.id_list("route");
      if (o.route.empty()) p.fail("route", "at least one hex is required");
      return o;
    }
    case OrderType::SendMessage: {
      SendMessageOrder o;
      o.recipient_commander_id = p.id("recipient_id");
      o.content = p.string("content");
      o.territory = p.enumerated<TerritoryType>("territory_type", parse_territory, TerritoryType::Friendly);
      o.fixed_roll = p.opt_roll("fixed_roll");
      return o;
    }
    case OrderType::LaunchOperation: {
      LaunchOperationOrder o;
      o.operation_id = p.opt_id("operation_id");
      if (o.operation_id == kInvalidId) {
        if (!p.has("operation_type")) p.fail("operation_type", "is required");
        o.type = p.enumerated<OperationType>("operation_type", parse_operation_type, OperationType::Intelligence);
        o.complexity = p.enumerated<OperationComplexity>("complexity", parse_operation_complexity,
                                                          OperationComplexity::Simple);
        o.territory = p.enumerated<TerritoryType>("territory_type", parse_territory, TerritoryType::Neutral);
        o.difficulty_modifier = p.opt_modifier("difficulty_modifier");
        o.target_kind = p.enumerated<TargetKind>("target_type", parse_target_kind, TargetKind::Army);
        o.target_id = p.id("target_id");
        o.loot_cost = p.opt_integer("loot_cost", -1);
      }
      o.fixed_roll = p.opt_roll("fixed_roll");
      o.exposure_fixed_roll = p.opt_roll("exposure_fixed_roll");
      return o;
    }
    case OrderType::RaiseArmy: {
      RaiseArmyOrder o;
      o.project_id = p.opt_id("project_id");
      if (o.project_id == kInvalidId) {
        o.stronghold_id = p.id("stronghold_id");
        o.composition = parse_composition(p);
        o.rally_hex_id = p.id("rally_hex_id");
        o.army_name = p.opt_string("army_name", "");
        o.revolt_fixed_roll = p.opt_roll("revolt_fixed_roll");
      }
      return o;
    }
    case OrderType::Harry: {
      HarryOrder o;
      o.detachment_ids = p.id_list("detachment_ids");
      if (o.detachment_ids.empty()) p.fail("detachment_ids", "at least one detachment is required");
      o.target_army_id = p.id("target_army_id");
      o.objective = p.enumerated<HarryObjective>("objective", parse_objective, HarryObjective::Kill);
      o.fixed_roll = p.opt_roll("fixed_roll");
      return o;
    }
  }
  throw ValidationError("unrecognized order_type '" + type_name + "'");
}

} // namespace cataphract
