#pragma once

#include <cstdint>
#include <vector>

#include "cataphract/core/campaign.h"
#include "cataphract/core/rules_config.h"
#include "cataphract/core/scheduler.h"

namespace cataphract {

// Ids of the notable entities in the demo campaign.
struct ScenarioIds {
  Id league{kInvalidId};
  Id marches{kInvalidId};

  Id infantry{kInvalidId};
  Id cavalry{kInvalidId};
  Id skirmishers{kInvalidId};

  Id valens{kInvalidId};   // leads the First Legion
  Id marcia{kInvalidId};   // armyless, at Aurel
  Id orso{kInvalidId};     // armyless spymaster
  Id brannoc{kInvalidId};  // leads the Thornwall garrison
  Id isolde{kInvalidId};   // armyless, at Saltmere

  Id first_legion{kInvalidId};
  Id thornwall_guard{kInvalidId};
  Id mercenaries{kInvalidId}; // detachment of the First Legion
  Id contract{kInvalidId};

  Id aurel{kInvalidId};     // city
  Id thornwall{kInvalidId}; // fortress
  Id saltmere{kInvalidId};  // town, on the coast

  Id sea_hawk{kInvalidId};
};

// Axial (q, r) -> hex id for the demo map, which spans q in [0, 5] and r in
// [0, 3]. Column 4 is coast and column 5 open water.
Id demo_hex(const Campaign& c, int q, int r);

// Two factions on a 6x4 hex map with roads, a ford, sea lanes, three
// strongholds, two armies and a ship.
Campaign make_demo_campaign(std::uint64_t seed, const RulesConfig& rules = {}, ScenarioIds* ids = nullptr);

// Opening orders used by the CLI: the legion marches on Thornwall and lays
// siege, a courier goes out, a spy mission starts and Marcia begins raising
// a second army.
std::vector<OrderRequest> make_demo_orders(const Campaign& c, const ScenarioIds& ids);

} // namespace cataphract
