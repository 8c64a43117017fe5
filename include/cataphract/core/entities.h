#pragma once

#include <string>
#include <vector>

#include "cataphract/core/calendar.h"
#include "cataphract/core/ids.h"

namespace cataphract {

enum class Terrain { Flat, Hills, Forest, Mountains, Marsh, Coast, Water };

enum class Weather { Clear, Rain, Storm };

enum class CampaignStatus { Active, Paused, Completed };

// Governs courier risk and covert-operation difficulty.
enum class TerritoryType { Friendly, Neutral, Hostile };

enum class ArmyStatus {
  Idle,
  Marching,
  ForcedMarch,
  NightMarch,
  Resting,
  Foraging,
  Torching,
  Besieging,
  Harrying,
  Routed,
  Embarked,
};

enum class CommanderStatus { Active, Captured, Dead };

enum class UnitCategory { Infantry, Cavalry, Skirmisher };

enum class StrongholdType { Town, City, Fortress };

enum class SiegeStatus { Ongoing, Captured, Lifted };

enum class ShipStatus { Docked, Sailing };

enum class MessageStatus { InTransit, Delivered, Lost };

enum class OperationType { Intelligence, Sabotage, Assassination };

enum class OperationComplexity { Simple, Standard, Complex };

enum class OperationStatus { InProgress, Resolved };

enum class OperationOutcome { Pending, Success, Failure, Interrupted };

enum class ProjectStatus { Active, Suspended, Completed, Cancelled };

enum class TargetKind { Army, Stronghold, Commander };

// --- Topology ---

struct Hex {
  Id id{kInvalidId};
  std::string name;

  // Axial coordinates.
  int q{0};
  int r{0};

  Terrain terrain{Terrain::Flat};

  // Population score; drives forage yield and recruitment.
  int settlement{0};
  bool good_country{false};

  Id controlling_faction_id{kInvalidId};

  int foraging_times_remaining{5};
  int last_foraged_day{-1};

  // Foraging yields nothing while current_day < torched_until_day.
  int torched_until_day{-1};
  int last_revolt_day{-1};
  int last_recruited_day{-1};
  int last_control_change_day{-1};

  bool is_sea() const { return terrain == Terrain::Water || terrain == Terrain::Coast; }
};

struct Road {
  Id a{kInvalidId};
  Id b{kInvalidId};
  // Multiplies the on-road speed (1.0 = good road, <1.0 = degraded).
  double cost_modifier{1.0};
};

// A ford point between two hexes.
struct RiverCrossing {
  Id a{kInvalidId};
  Id b{kInvalidId};
};

struct SeaLane {
  Id a{kInvalidId};
  Id b{kInvalidId};
  double miles{24.0};
};

// --- Actors ---

struct Faction {
  Id id{kInvalidId};
  std::string name;
};

struct Commander {
  Id id{kInvalidId};
  std::string name;
  Id faction_id{kInvalidId};

  // At most one army at a time.
  Id army_id{kInvalidId};

  // Used as the courier endpoint when the commander has no army.
  Id hex_id{kInvalidId};

  CommanderStatus status{CommanderStatus::Active};

  // Pending orders that have no acting army.
  std::vector<Id> order_queue;
};

struct UnitType {
  Id id{kInvalidId};
  std::string name;
  UnitCategory category{UnitCategory::Infantry};
};

struct Detachment {
  Id id{kInvalidId};
  std::string name;
  Id unit_type_id{kInvalidId};
  UnitCategory category{UnitCategory::Infantry};
  int soldiers{0};
  int wagons{0};
  bool is_mercenary{false};
};

struct Army {
  Id id{kInvalidId};
  std::string name;
  Id faction_id{kInvalidId};
  Id commander_id{kInvalidId};

  Id hex_id{kInvalidId};
  ArmyStatus status{ArmyStatus::Idle};

  std::vector<Detachment> detachments;
  int noncombatants{0};

  int supplies_current{0};
  int supplies_capacity{0};

  int morale_current{9};

  // Fraction of a day's march still available; reset every morning.
  double movement_points_remaining{1.0};

  int loot{0};

  int days_without_supplies{0};
  bool starved_today{false};
  bool harried_today{false};
  int rest_until_day{-1};
  // Executing rest order, completed when the rest period ends.
  Id rest_order_id{kInvalidId};

  Id ship_id{kInvalidId};
  Id siege_id{kInvalidId};

  std::vector<Id> order_queue;
};

struct MercenaryContract {
  Id id{kInvalidId};
  Id army_id{kInvalidId};
  Id detachment_id{kInvalidId};
  int daily_upkeep{0};
  int last_upkeep_day{0};
  int unpaid_days{0};
  bool active{true};
};

struct Stronghold {
  Id id{kInvalidId};
  std::string name;
  StrongholdType type{StrongholdType::Town};
  Id hex_id{kInvalidId};

  // kInvalidId means uncontrolled.
  Id controlling_faction_id{kInvalidId};

  int base_threshold{0};
  int current_threshold{0};
  int defensive_bonus{0};

  Id garrison_army_id{kInvalidId};
  Id defending_commander_id{kInvalidId};

  int loot{0};
  int supplies{0};

  Id siege_id{kInvalidId};
};

struct Siege {
  Id id{kInvalidId};
  Id stronghold_id{kInvalidId};
  Id attacker_faction_id{kInvalidId};
  std::vector<Id> attacker_army_ids;
  int siege_engines{0};
  int reduction_per_part{0};
  TickStamp started;
  int parts_elapsed{0};
  SiegeStatus status{SiegeStatus::Ongoing};
};

struct Ship {
  Id id{kInvalidId};
  std::string name;
  Id faction_id{kInvalidId};
  Id hex_id{kInvalidId};
  int capacity_soldiers{0};
  std::vector<Id> embarked_army_ids;

  // Remaining hexes to sail through, front first.
  std::vector<Id> route;
  double progress_miles{0.0};
  ShipStatus status{ShipStatus::Docked};

  // Executing naval_move order, completed on arrival.
  Id voyage_order_id{kInvalidId};
};

struct Message {
  Id id{kInvalidId};
  Id sender_commander_id{kInvalidId};
  Id recipient_commander_id{kInvalidId};
  std::string content;
  TerritoryType territory{TerritoryType::Friendly};
  double distance_miles{0.0};
  TickStamp dispatched;
  TickStamp delivery;
  bool delivered{false};
  MessageStatus status{MessageStatus::InTransit};
};

struct Operation {
  Id id{kInvalidId};
  Id commander_id{kInvalidId};
  OperationType type{OperationType::Intelligence};
  OperationComplexity complexity{OperationComplexity::Simple};
  TerritoryType territory{TerritoryType::Neutral};
  int difficulty_modifier{0};
  TargetKind target_kind{TargetKind::Army};
  Id target_id{kInvalidId};
  int loot_cost{0};

  int stages_total{1};
  int stages_done{0};
  TickStamp last_stage;

  OperationStatus status{OperationStatus::InProgress};
  OperationOutcome outcome{OperationOutcome::Pending};
  std::string report;
};

struct UnitComposition {
  Id unit_type_id{kInvalidId};
  int soldiers{0};
  int wagons{0};
};

struct RecruitmentProject {
  Id id{kInvalidId};
  Id stronghold_id{kInvalidId};
  Id commander_id{kInvalidId};
  Id faction_id{kInvalidId};
  std::vector<UnitComposition> composition;
  Id rally_hex_id{kInvalidId};
  std::string army_name;
  int progress{0};
  int progress_required{0};
  ProjectStatus status{ProjectStatus::Active};
  Id spawned_army_id{kInvalidId};
};

// Helpers over the value types above.
int army_soldiers(const Army& a);
int army_soldiers(const Army& a, UnitCategory cat);
int army_wagons(const Army& a);
bool army_cavalry_only(const Army& a);
Detachment* find_detachment(Army& a, Id detachment_id);
const Detachment* find_detachment(const Army& a, Id detachment_id);

const char* terrain_label(Terrain t);
const char* weather_label(Weather w);
const char* territory_label(TerritoryType t);
const char* army_status_label(ArmyStatus s);
const char* unit_category_label(UnitCategory c);
const char* stronghold_type_label(StrongholdType t);
const char* siege_status_label(SiegeStatus s);
const char* message_status_label(MessageStatus s);
const char* operation_type_label(OperationType t);
const char* operation_complexity_label(OperationComplexity c);
const char* operation_outcome_label(OperationOutcome o);
const char* project_status_label(ProjectStatus s);
const char* target_kind_label(TargetKind k);

bool parse_terrain(const std::string& s, Terrain* out);
bool parse_weather(const std::string& s, Weather* out);
bool parse_territory(const std::string& s, TerritoryType* out);
bool parse_unit_category(const std::string& s, UnitCategory* out);
bool parse_stronghold_type(const std::string& s, StrongholdType* out);
bool parse_operation_type(const std::string& s, OperationType* out);
bool parse_operation_complexity(const std::string& s, OperationComplexity* out);
bool parse_target_kind(const std::string& s, TargetKind* out);

} // namespace cataphract
