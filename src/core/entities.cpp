#include "cataphract/core/entities.h"

#include "cataphract/util/strings.h"

namespace cataphract {
namespace {

// Linear scan over an enum's labels; the enums here are all tiny.
template <typename E, typename LabelFn>
bool parse_by_label(const std::string& s, int count, LabelFn label, E* out) {
  const std::string v = to_lower(s);
  for (int i = 0; i < count; ++i) {
    const E e = static_cast<E>(i);
    if (v == label(e)) {
      if (out) *out = e;
      return true;
    }
  }
  return false;
}

} // namespace

int army_soldiers(const Army& a) {
  int n = 0;
  for (const auto& d : a.detachments) n += d.soldiers;
  return n;
}

int army_soldiers(const Army& a, UnitCategory cat) {
  int n = 0;
  for (const auto& d : a.detachments) {
    if (d.category == cat) n += d.soldiers;
  }
  return n;
}

int army_wagons(const Army& a) {
  int n = 0;
  for (const auto& d : a.detachments) n += d.wagons;
  return n;
}

bool army_cavalry_only(const Army& a) {
  if (a.detachments.empty()) return false;
  for (const auto& d : a.detachments) {
    if (d.category != UnitCategory::Cavalry && d.soldiers > 0) return false;
  }
  return true;
}

Detachment* find_detachment(Army& a, Id detachment_id) {
  for (auto& d : a.detachments) {
    if (d.id == detachment_id) return &d;
  }
  return nullptr;
}

const Detachment* find_detachment(const Army& a, Id detachment_id) {
  for (const auto& d : a.detachments) {
    if (d.id == detachment_id) return &d;
  }
  return nullptr;
}

const char* terrain_label(Terrain t) {
  switch (t) {
    case Terrain::Flat: return "flat";
    case Terrain::Hills: return "hills";
    case Terrain::Forest: return "forest";
    case Terrain::Mountains: return "mountains";
    case Terrain::Marsh: return "marsh";
    case Terrain::Coast: return "coast";
    case Terrain::Water: return "water";
  }
  return "flat";
}

const char* weather_label(Weather w) {
  switch (w) {
    case Weather::Clear: return "clear";
    case Weather::Rain: return "rain";
    case Weather::Storm: return "storm";
  }
  return "clear";
}

const char* territory_label(TerritoryType t) {
  switch (t) {
    case TerritoryType::Friendly: return "friendly";
    case TerritoryType::Neutral: return "neutral";
    case TerritoryType::Hostile: return "hostile";
  }
  return "neutral";
}

const char* army_status_label(ArmyStatus s) {
  switch (s) {
    case ArmyStatus::Idle: return "idle";
    case ArmyStatus::Marching: return "marching";
    case ArmyStatus::ForcedMarch: return "forced_march";
    case ArmyStatus::NightMarch: return "night_march";
    case ArmyStatus::Resting: return "resting";
    case ArmyStatus::Foraging: return "foraging";
    case ArmyStatus::Torching: return "torching";
    case ArmyStatus::Besieging: return "besieging";
    case ArmyStatus::Harrying: return "harrying";
    case ArmyStatus::Routed: return "routed";
    case ArmyStatus::Embarked: return "embarked";
  }
  return "idle";
}

const char* unit_category_label(UnitCategory c) {
  switch (c) {
    case UnitCategory::Infantry: return "infantry";
    case UnitCategory::Cavalry: return "cavalry";
    case UnitCategory::Skirmisher: return "skirmisher";
  }
  return "infantry";
}

const char* stronghold_type_label(StrongholdType t) {
  switch (t) {
    case StrongholdType::Town: return "town";
    case StrongholdType::City: return "city";
    case StrongholdType::Fortress: return "fortress";
  }
  return "town";
}

const char* siege_status_label(SiegeStatus s) {
  switch (s) {
    case SiegeStatus::Ongoing: return "ongoing";
    case SiegeStatus::Captured: return "captured";
    case SiegeStatus::Lifted: return "lifted";
  }
  return "ongoing";
}

const char* message_status_label(MessageStatus s) {
  switch (s) {
    case MessageStatus::InTransit: return "in_transit";
    case MessageStatus::Delivered: return "delivered";
    case MessageStatus::Lost: return "lost";
  }
  return "in_transit";
}

const char* operation_type_label(OperationType t) {
  switch (t) {
    case OperationType::Intelligence: return "intelligence";
    case OperationType::Sabotage: return "sabotage";
    case OperationType::Assassination: return "assassination";
  }
  return "intelligence";
}

const char* operation_complexity_label(OperationComplexity c) {
  switch (c) {
    case OperationComplexity::Simple: return "simple";
    case OperationComplexity::Standard: return "standard";
    case OperationComplexity::Complex: return "complex";
  }
  return "simple";
}

const char* operation_outcome_label(OperationOutcome o) {
  switch (o) {
    case OperationOutcome::Pending: return "pending";
    case OperationOutcome::Success: return "success";
    case OperationOutcome::Failure: return "failure";
    case OperationOutcome::Interrupted: return "interrupted";
  }
  return "pending";
}

const char* project_status_label(ProjectStatus s) {
  switch (s) {
    case ProjectStatus::Active: return "active";
    case ProjectStatus::Suspended: return "suspended";
    case ProjectStatus::Completed: return "completed";
    case ProjectStatus::Cancelled: return "cancelled";
  }
  return "active";
}

const char* target_kind_label(TargetKind k) {
  switch (k) {
    case TargetKind::Army: return "army";
    case TargetKind::Stronghold: return "stronghold";
    case TargetKind::Commander: return "commander";
  }
  return "army";
}

bool parse_terrain(const std::string& s, Terrain* out) { return parse_by_label(s, 7, terrain_label, out); }
bool parse_weather(const std::string& s, Weather* out) { return parse_by_label(s, 3, weather_label, out); }
bool parse_territory(const std::string& s, TerritoryType* out) { return parse_by_label(s, 3, territory_label, out); }
bool parse_unit_category(const std::string& s, UnitCategory* out) {
  return parse_by_label(s, 3, unit_category_label, out);
}
bool parse_stronghold_type(const std::string& s, StrongholdType* out) {
  return parse_by_label(s, 3, stronghold_type_label, out);
}
bool parse_operation_type(const std::string& s, OperationType* out) {
  return parse_by_label(s, 3, operation_type_label, out);
}
bool parse_operation_complexity(const std::string& s, OperationComplexity* out) {
  return parse_by_label(s, 3, operation_complexity_label, out);
}
bool parse_target_kind(const std::string& s, TargetKind* out) { return parse_by_label(s, 3, target_kind_label, out); }

} // namespace cataphract
