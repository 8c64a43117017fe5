#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "cataphract/core/audit.h"
#include "cataphract/core/calendar.h"
#include "cataphract/core/entities.h"
#include "cataphract/core/ids.h"
#include "cataphract/core/orders.h"

namespace cataphract {

// Static per-campaign topology. Mutable per-hex yield state lives on Hex.
struct CampaignMap {
  std::unordered_map<Id, Hex> hexes;
  std::vector<Road> roads;
  std::vector<RiverCrossing> river_crossings;
  std::vector<SeaLane> sea_lanes;
};

// The single root of mutation for one campaign.
struct Campaign {
  Id id{kInvalidId};
  std::string name;
  std::uint64_t seed{0};

  int current_day{0};
  DayPart current_part{DayPart::Morning};
  Season season{Season::Spring};
  CampaignStatus status{CampaignStatus::Active};

  Id next_id{1};
  std::uint64_t next_order_seq{1};
  std::uint64_t next_audit_seq{1};

  CampaignMap map;

  std::unordered_map<Id, Faction> factions;
  std::unordered_map<Id, Commander> commanders;
  std::unordered_map<Id, UnitType> unit_types;
  std::unordered_map<Id, Army> armies;
  std::unordered_map<Id, Stronghold> strongholds;
  std::unordered_map<Id, Siege> sieges;
  std::unordered_map<Id, Ship> ships;
  std::unordered_map<Id, Message> messages;
  std::unordered_map<Id, Operation> operations;
  std::unordered_map<Id, RecruitmentProject> projects;
  std::unordered_map<Id, MercenaryContract> contracts;
  std::unordered_map<Id, Order> orders;

  // Host-supplied weather; days without an entry are clear.
  std::map<int, Weather> weather_by_day;

  std::vector<AuditEntry> audit_log;

  TickStamp now() const { return TickStamp{current_day, current_part}; }
  Weather weather_on(int day) const;
};

inline Id allocate_id(Campaign& c) { return c.next_id++; }

// Move an `executing` order to `completed`, appending `note` to its summary.
// No-op for unknown or already terminal orders.
void finish_executing_order(Campaign& c, Id order_id, const std::string& note);

template <typename Map>
auto* find_ptr(Map& m, const typename Map::key_type& k) {
  auto it = m.find(k);
  return (it == m.end()) ? nullptr : &it->second;
}

template <typename Map>
const auto* find_ptr(const Map& m, const typename Map::key_type& k) {
  auto it = m.find(k);
  return (it == m.end()) ? nullptr : &it->second;
}

} // namespace cataphract
