#include <iostream>
#include <string>
#include <variant>

#include "cataphract/core/errors.h"
#include "cataphract/core/orders.h"
#include "cataphract/util/json.h"

#define CATA_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

// Empty string when parsing succeeds, else the ValidationError message.
std::string rejection(const std::string& type, const std::string& params) {
  try {
    (void)cataphract::parse_order_parameters(type, cataphract::json::parse(params));
  } catch (const cataphract::ValidationError& e) {
    return e.what();
  }
  return {};
}

} // namespace

int test_orders() {
  using namespace cataphract;

  {
    const OrderParams p = parse_order_parameters(
        "move", json::parse("{\"movement_type\": \"forced\", \"legs\": ["
                            "{\"to_hex_id\": 10, \"distance\": 6, \"on_road\": true},"
                            "{\"to_hex_id\": 11, \"distance\": 6, \"has_fork\": true, \"alternate_hex_id\": 17,"
                            " \"fixed_roll\": 4}]}"));
    CATA_ASSERT(order_type(p) == OrderType::Move);
    const auto& mv = std::get<MoveOrder>(p);
    CATA_ASSERT(mv.pace == MarchPace::Forced);
    CATA_ASSERT(mv.legs.size() == 2);
    CATA_ASSERT(mv.legs[0].on_road);
    CATA_ASSERT(!mv.legs[0].fixed_roll.has_value());
    CATA_ASSERT(mv.legs[1].has_fork);
    CATA_ASSERT(mv.legs[1].alternate_hex_id == 17);
    CATA_ASSERT(mv.legs[1].fixed_roll.value_or(0) == 4);
    CATA_ASSERT(order_has_fixed_rolls(p));
    CATA_ASSERT(order_requires_army(OrderType::Move));
  }

  {
    const OrderParams p = parse_order_parameters(
        "launch_operation", json::parse("{\"operation_type\": \"sabotage\", \"complexity\": \"complex\","
                                        " \"territory_type\": \"hostile\", \"target_type\": \"stronghold\","
                                        " \"target_id\": 40}"));
    const auto& op = std::get<LaunchOperationOrder>(p);
    CATA_ASSERT(op.type == OperationType::Sabotage);
    CATA_ASSERT(op.complexity == OperationComplexity::Complex);
    CATA_ASSERT(op.territory == TerritoryType::Hostile);
    CATA_ASSERT(op.target_kind == TargetKind::Stronghold);
    CATA_ASSERT(op.loot_cost == -1);
    CATA_ASSERT(!order_has_fixed_rolls(p));
    CATA_ASSERT(!order_requires_army(OrderType::LaunchOperation));
  }

  // Resuming an operation needs nothing but its id.
  {
    const OrderParams p = parse_order_parameters("launch_operation", json::parse("{\"operation_id\": 12}"));
    CATA_ASSERT(std::get<LaunchOperationOrder>(p).operation_id == 12);
  }

  {
    const OrderParams p = parse_order_parameters(
        "raise_army", json::parse("{\"stronghold_id\": 40, \"rally_hex_id\": 9, \"army_name\": \"Reserve\","
                                  " \"composition\": [{\"unit_type_id\": 27, \"soldiers\": 800, \"wagons\": 2}]}"));
    const auto& ra = std::get<RaiseArmyOrder>(p);
    CATA_ASSERT(ra.composition.size() == 1);
    CATA_ASSERT(ra.composition[0].soldiers == 800);
    CATA_ASSERT(ra.composition[0].wagons == 2);
    CATA_ASSERT(ra.army_name == "Reserve");
  }

  {
    const OrderParams p = parse_order_parameters(
        "send_message", json::parse("{\"recipient_id\": 31, \"content\": \"hold\", \"territory_type\": \"neutral\"}"));
    const auto& m = std::get<SendMessageOrder>(p);
    CATA_ASSERT(m.territory == TerritoryType::Neutral);
    CATA_ASSERT(m.content == "hold");
  }

  {
    const OrderParams p = parse_order_parameters("rest", json::parse("{}"));
    CATA_ASSERT(std::get<RestOrder>(p).duration_days == 1);
  }

  // Rejections name the offending field.
  CATA_ASSERT(rejection("charge", "{}").find("unrecognized order_type") != std::string::npos);
  CATA_ASSERT(rejection("move", "{\"legs\": []}").find("legs") != std::string::npos);
  CATA_ASSERT(rejection("move", "{\"legs\": [{\"to_hex_id\": 3}]}").find("distance") != std::string::npos);
  CATA_ASSERT(rejection("move", "{\"legs\": [{\"to_hex_id\": 3, \"distance\": 6, \"has_fork\": true}]}")
                  .find("alternate_hex_id") != std::string::npos);
  CATA_ASSERT(rejection("forage", "{\"hex_ids\": [1, -2]}").find("hex_ids") != std::string::npos);
  CATA_ASSERT(rejection("besiege", "{}").find("stronghold_id") != std::string::npos);
  CATA_ASSERT(rejection("assault", "{\"stronghold_id\": 4, \"pillage\": \"yes\"}").find("pillage") !=
              std::string::npos);
  CATA_ASSERT(rejection("supply_transfer", "{\"target_army_id\": 5, \"amount\": 0}").find("amount") !=
              std::string::npos);
  CATA_ASSERT(rejection("launch_operation", "{\"target_id\": 5}").find("operation_type") != std::string::npos);
  CATA_ASSERT(rejection("launch_operation", "{\"operation_type\": \"bribery\", \"target_id\": 5}")
                  .find("operation_type") != std::string::npos);
  CATA_ASSERT(rejection("raise_army", "{\"stronghold_id\": 4, \"rally_hex_id\": 9, \"composition\": "
                                      "[{\"unit_type_id\": 2, \"soldiers\": 0}]}")
                  .find("soldiers") != std::string::npos);
  CATA_ASSERT(rejection("harry", "{\"detachment_ids\": [], \"target_army_id\": 3}").find("detachment_ids") !=
              std::string::npos);
  CATA_ASSERT(rejection("rest", "[]").find("object") != std::string::npos);
  CATA_ASSERT(rejection("rest", "{\"duration_days\": 2}").empty());

  // Numbers that do not fit the target field are rejected, not truncated.
  CATA_ASSERT(rejection("assault", "{\"stronghold_id\": 3, \"attacker_fixed_roll\": 3e9}")
                  .find("attacker_fixed_roll: out of range") != std::string::npos);
  CATA_ASSERT(rejection("assault", "{\"stronghold_id\": 3, \"attacker_modifier\": 5e9}")
                  .find("attacker_modifier: out of range") != std::string::npos);
  CATA_ASSERT(rejection("assault", "{\"stronghold_id\": 3, \"defender_modifier\": -2000000}")
                  .find("defender_modifier") != std::string::npos);
  CATA_ASSERT(rejection("rest", "{\"duration_days\": 1e12}").find("out of range") != std::string::npos);
  CATA_ASSERT(rejection("besiege", "{\"stronghold_id\": 1e300}").find("stronghold_id: out of range") !=
              std::string::npos);
  CATA_ASSERT(rejection("forage", "{\"hex_ids\": [2, 1e20]}").find("hex_ids: out of range") != std::string::npos);
  {
    const OrderParams p = parse_order_parameters(
        "assault", json::parse("{\"stronghold_id\": 3, \"attacker_fixed_roll\": 12, \"attacker_modifier\": -7}"));
    const auto& as = std::get<AssaultOrder>(p);
    CATA_ASSERT(as.attacker_fixed_roll.value_or(0) == 12);
    CATA_ASSERT(as.attacker_modifier == -7);
  }

  {
    OrderType t = OrderType::Move;
    CATA_ASSERT(parse_order_type("naval_move", &t));
    CATA_ASSERT(t == OrderType::NavalMove);
    CATA_ASSERT(std::string(order_type_label(OrderType::SupplyTransfer)) == "supply_transfer");
  }

  return 0;
}
