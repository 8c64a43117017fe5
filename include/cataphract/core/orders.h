#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "cataphract/core/calendar.h"
#include "cataphract/core/entities.h"
#include "cataphract/core/errors.h"
#include "cataphract/core/ids.h"
#include "cataphract/util/json.h"

namespace cataphract {

// One hex-to-hex segment of a march.
struct MoveLeg {
  Id to_hex_id{kInvalidId};
  double distance_miles{6.0};
  bool on_road{false};
  bool has_river_ford{false};
  bool is_night{false};

  // At a fork the column may take the wrong branch and end up at alternate_hex_id.
  bool has_fork{false};
  Id alternate_hex_id{kInvalidId};
  std::optional<int> fixed_roll;
};

enum class MarchPace { Standard, Forced };

struct MoveOrder {
  std::vector<MoveLeg> legs;
  MarchPace pace{MarchPace::Standard};
};

struct RestOrder {
  int duration_days{1};
};

struct ForageOrder {
  std::vector<Id> hex_ids;
  // Applies to every revolt check this order makes.
  std::optional<int> fixed_roll;
};

struct TorchOrder {
  std::vector<Id> hex_ids;
  std::optional<int> fixed_roll;
};

struct SupplyTransferOrder {
  Id target_army_id{kInvalidId};
  int amount{0};
};

struct BesiegeOrder {
  Id stronghold_id{kInvalidId};
  int siege_engines{0};
};

struct AssaultOrder {
  Id stronghold_id{kInvalidId};
  int attacker_modifier{0};
  int defender_modifier{0};
  std::optional<int> attacker_fixed_roll;
  std::optional<int> defender_fixed_roll;
  // Defending commander's escape roll when the stronghold falls.
  std::optional<int> escape_fixed_roll;
  bool pillage{false};
};

struct EmbarkOrder {
  Id ship_id{kInvalidId};
};

struct DisembarkOrder {
  Id ship_id{kInvalidId};
};

struct NavalMoveOrder {
  Id ship_id{kInvalidId};
  // Hexes to sail through, excluding the ship's current hex.
  std::vector<Id> route;
};

struct SendMessageOrder {
  Id recipient_commander_id{kInvalidId};
  std::string content;
  TerritoryType territory{TerritoryType::Friendly};
  std::optional<int> fixed_roll;
};

// operation_id != kInvalidId resumes an existing operation; the remaining
// fields are only read when starting a new one.
struct LaunchOperationOrder {
  Id operation_id{kInvalidId};
  OperationType type{OperationType::Intelligence};
  OperationComplexity complexity{OperationComplexity::Simple};
  TerritoryType territory{TerritoryType::Neutral};
  int difficulty_modifier{0};
  TargetKind target_kind{TargetKind::Army};
  Id target_id{kInvalidId};
  int loot_cost{-1}; // <0 => RulesConfig default
  // Success roll of the final stage.
  std::optional<int> fixed_roll;
  // Exposure roll of an intermediate stage.
  std::optional<int> exposure_fixed_roll;
};

// project_id != kInvalidId continues an existing project.
struct RaiseArmyOrder {
  Id project_id{kInvalidId};
  Id stronghold_id{kInvalidId};
  std::vector<UnitComposition> composition;
  Id rally_hex_id{kInvalidId};
  std::string army_name;
  // Applies to every recruitment revolt check this order makes.
  std::optional<int> revolt_fixed_roll;
};

enum class HarryObjective { Kill, Torch, Steal };

struct HarryOrder {
  std::vector<Id> detachment_ids;
  Id target_army_id{kInvalidId};
  HarryObjective objective{HarryObjective::Kill};
  std::optional<int> fixed_roll;
};

using OrderParams = std::variant<MoveOrder, RestOrder, ForageOrder, TorchOrder, SupplyTransferOrder, BesiegeOrder,
                                 AssaultOrder, EmbarkOrder, DisembarkOrder, NavalMoveOrder, SendMessageOrder,
                                 LaunchOperationOrder, RaiseArmyOrder, HarryOrder>;

// Index-aligned with OrderParams alternatives.
enum class OrderType {
  Move,
  Rest,
  Forage,
  Torch,
  SupplyTransfer,
  Besiege,
  Assault,
  Embark,
  Disembark,
  NavalMove,
  SendMessage,
  LaunchOperation,
  RaiseArmy,
  Harry,
};

enum class OrderStatus { Pending, Executing, Completed, Failed, Cancelled };

struct OrderResult {
  // Completed orders may still be partial (e.g. a march cut short by supply).
  bool partial{false};
  std::string summary;

  // The order keeps running after dispatch (rest periods, voyages) and stays
  // `executing` until the tick engine finishes it.
  bool in_progress{false};

  ErrorKind error{ErrorKind::None};
  std::string error_detail;

  // Operation or recruitment project id for multi-tick orders.
  Id continuation_id{kInvalidId};
  std::vector<Id> created_ids;
};

struct Order {
  Id id{kInvalidId};
  Id commander_id{kInvalidId};
  Id army_id{kInvalidId};
  OrderParams params;

  // Unset => "as soon as reached in queue".
  std::optional<int> execute_day;
  std::optional<DayPart> execute_part;

  // Tie-break within the same tick, higher first.
  int priority{0};
  std::uint64_t submission_seq{0};

  OrderStatus status{OrderStatus::Pending};
  std::optional<OrderResult> result;

  TickStamp submitted_at;
  std::optional<TickStamp> finished_at;
};

inline OrderType order_type(const OrderParams& p) { return static_cast<OrderType>(p.index()); }

const char* order_type_label(OrderType t);
bool parse_order_type(const std::string& s, OrderType* out);

const char* order_status_label(OrderStatus s);
const char* harry_objective_label(HarryObjective o);

inline bool is_terminal(OrderStatus s) {
  return s == OrderStatus::Completed || s == OrderStatus::Failed || s == OrderStatus::Cancelled;
}

// Order types that act through an army; the issuing commander must lead it.
bool order_requires_army(OrderType t);

// True when any caller-supplied fixed roll is present.
bool order_has_fixed_rolls(const OrderParams& p);

// Human-readable one-liner for logs and the CLI.
std::string order_to_string(const Order& o);

// Convert the host layer's open parameter mapping into a typed order.
// Throws ValidationError on an unknown order type or a missing/malformed field.
OrderParams parse_order_parameters(const std::string& order_type, const json::Value& params);

} // namespace cataphract
