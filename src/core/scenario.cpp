#include "cataphract/core/scenario.h"

#include <algorithm>
#include <string>
#include <utility>

#include "cataphract/core/army_rules.h"
#include "cataphract/core/errors.h"

namespace cataphract {
namespace {

constexpr int kCols = 6;
constexpr int kRows = 4;

Terrain demo_terrain(int q, int r) {
  if (q == 5) return Terrain::Water;
  if (q == 4) return Terrain::Coast;
  if (q == 1 && r == 2) return Terrain::Hills;
  if (q == 2 && r == 2) return Terrain::Forest;
  if (q == 3 && r == 0) return Terrain::Mountains;
  if (q == 0 && r == 3) return Terrain::Marsh;
  return Terrain::Flat;
}

Id add_unit_type(Campaign& c, const std::string& name, UnitCategory cat) {
  UnitType t;
  t.id = allocate_id(c);
  t.name = name;
  t.category = cat;
  c.unit_types[t.id] = t;
  return t.id;
}

Id add_commander(Campaign& c, const std::string& name, Id faction, Id hex) {
  Commander cmd;
  cmd.id = allocate_id(c);
  cmd.name = name;
  cmd.faction_id = faction;
  cmd.hex_id = hex;
  c.commanders[cmd.id] = cmd;
  return cmd.id;
}

Detachment make_detachment(Campaign& c, const UnitType& t, int soldiers, int wagons) {
  Detachment d;
  d.id = allocate_id(c);
  d.name = t.name;
  d.unit_type_id = t.id;
  d.category = t.category;
  d.soldiers = soldiers;
  d.wagons = wagons;
  return d;
}

Army& add_army(Campaign& c, const RulesConfig& rules, const std::string& name, Id faction, Id commander, Id hex,
               std::vector<Detachment> detachments) {
  Army a;
  a.id = allocate_id(c);
  a.name = name;
  a.faction_id = faction;
  a.commander_id = commander;
  a.hex_id = hex;
  a.detachments = std::move(detachments);
  a.noncombatants = static_cast<int>(army_soldiers(a) * rules.supply.noncombatant_ratio);
  a.morale_current = rules.morale.resting;
  refresh_supply_capacity(a, rules.supply);
  a.supplies_current =
      std::min(a.supplies_capacity, army_daily_consumption(a, rules.supply) * rules.supply.starting_supply_days);
  c.commanders.at(commander).army_id = a.id;
  const Id id = a.id;
  c.armies[id] = std::move(a);
  return c.armies.at(id);
}

Id add_stronghold(Campaign& c, const RulesConfig& rules, const std::string& name, StrongholdType type, Id hex,
                  Id faction) {
  Stronghold s;
  s.id = allocate_id(c);
  s.name = name;
  s.type = type;
  s.hex_id = hex;
  s.controlling_faction_id = faction;
  s.base_threshold = stronghold_base_threshold(rules.siege, type);
  s.current_threshold = s.base_threshold;
  s.defensive_bonus = stronghold_defense(rules.siege, type);
  c.strongholds[s.id] = s;
  return s.id;
}

} // namespace

Id demo_hex(const Campaign& c, int q, int r) {
  for (const auto& [id, h] : c.map.hexes) {
    if (h.q == q && h.r == r) return id;
  }
  throw NotFoundError("demo map has no hex at (" + std::to_string(q) + ", " + std::to_string(r) + ")");
}

Campaign make_demo_campaign(std::uint64_t seed, const RulesConfig& rules, ScenarioIds* ids_out) {
  Campaign c;
  c.id = 1;
  c.name = "The Thornwall Campaign";
  c.seed = seed;
  c.season = rules.calendar.start_season;
  ScenarioIds ids;

  // --- Factions ---
  ids.league = allocate_id(c);
  c.factions[ids.league] = Faction{ids.league, "Aurelian League"};
  ids.marches = allocate_id(c);
  c.factions[ids.marches] = Faction{ids.marches, "Kestrel Marches"};

  // --- Map ---
  Id grid[kCols][kRows];
  for (int r = 0; r < kRows; ++r) {
    for (int q = 0; q < kCols; ++q) {
      Hex h;
      h.id = allocate_id(c);
      h.name = "hex " + std::to_string(q) + "," + std::to_string(r);
      h.q = q;
      h.r = r;
      h.terrain = demo_terrain(q, r);
      h.foraging_times_remaining = rules.supply.foraging_limit;
      if (!h.is_sea() || h.terrain == Terrain::Coast) {
        h.settlement = (q + r) % 3 + 1;
        h.good_country = h.terrain == Terrain::Flat && r != 3;
      }
      if (h.terrain != Terrain::Water) {
        if (q <= 1) h.controlling_faction_id = ids.league;
        else if (q >= 3) h.controlling_faction_id = ids.marches;
      }
      grid[q][r] = h.id;
      c.map.hexes[h.id] = h;
    }
  }

  // The old road runs east along r = 1; the stretch past the ford is badly kept.
  for (int q = 0; q + 1 < 5; ++q) {
    c.map.roads.push_back(Road{grid[q][1], grid[q + 1][1], q == 2 ? 0.5 : 1.0});
  }
  c.map.river_crossings.push_back(RiverCrossing{grid[1][2], grid[2][2]});
  for (int r = 0; r + 1 < kRows; ++r) {
    c.map.sea_lanes.push_back(SeaLane{grid[4][r], grid[4][r + 1], 24.0});
    c.map.sea_lanes.push_back(SeaLane{grid[5][r], grid[5][r + 1], 24.0});
  }
  for (int r = 0; r < kRows; ++r) c.map.sea_lanes.push_back(SeaLane{grid[4][r], grid[5][r], 12.0});

  // --- Units ---
  ids.infantry = add_unit_type(c, "Infantry", UnitCategory::Infantry);
  ids.cavalry = add_unit_type(c, "Cavalry", UnitCategory::Cavalry);
  ids.skirmishers = add_unit_type(c, "Skirmishers", UnitCategory::Skirmisher);

  // --- Commanders ---
  ids.valens = add_commander(c, "Valens", ids.league, grid[1][1]);
  ids.marcia = add_commander(c, "Marcia", ids.league, grid[0][1]);
  ids.orso = add_commander(c, "Orso", ids.league, grid[0][1]);
  ids.brannoc = add_commander(c, "Brannoc", ids.marches, grid[3][1]);
  ids.isolde = add_commander(c, "Isolde", ids.marches, grid[4][2]);

  // --- Strongholds ---
  ids.aurel = add_stronghold(c, rules, "Aurel", StrongholdType::City, grid[0][1], ids.league);
  ids.thornwall = add_stronghold(c, rules, "Thornwall", StrongholdType::Fortress, grid[3][1], ids.marches);
  ids.saltmere = add_stronghold(c, rules, "Saltmere", StrongholdType::Town, grid[4][2], ids.marches);
  c.strongholds.at(ids.aurel).loot = 2000;
  c.strongholds.at(ids.aurel).supplies = 40000;
  c.strongholds.at(ids.thornwall).loot = 1200;
  c.strongholds.at(ids.thornwall).supplies = 30000;
  c.strongholds.at(ids.saltmere).loot = 600;
  c.strongholds.at(ids.saltmere).supplies = 8000;

  // --- Armies ---
  const UnitType& inf = c.unit_types.at(ids.infantry);
  const UnitType& cav = c.unit_types.at(ids.cavalry);
  const UnitType& skr = c.unit_types.at(ids.skirmishers);

  std::vector<Detachment> legion;
  legion.push_back(make_detachment(c, inf, 4000, 20));
  legion.push_back(make_detachment(c, cav, 600, 0));
  Detachment merc = make_detachment(c, skr, 400, 0);
  merc.name = "Free Company";
  merc.is_mercenary = true;
  ids.mercenaries = merc.id;
  legion.push_back(merc);
  Army& first = add_army(c, rules, "First Legion", ids.league, ids.valens, grid[1][1], std::move(legion));
  first.loot = 300;
  ids.first_legion = first.id;

  std::vector<Detachment> guard;
  guard.push_back(make_detachment(c, inf, 2000, 4));
  Army& garrison = add_army(c, rules, "Thornwall Guard", ids.marches, ids.brannoc, grid[3][1], std::move(guard));
  ids.thornwall_guard = garrison.id;
  c.strongholds.at(ids.thornwall).garrison_army_id = garrison.id;
  c.strongholds.at(ids.thornwall).defending_commander_id = ids.brannoc;

  MercenaryContract k;
  k.id = allocate_id(c);
  k.army_id = ids.first_legion;
  k.detachment_id = ids.mercenaries;
  ids.contract = k.id;
  c.contracts[k.id] = k;

  // --- Ships ---
  Ship hawk;
  hawk.id = allocate_id(c);
  hawk.name = "Sea Hawk";
  hawk.faction_id = ids.league;
  hawk.hex_id = grid[4][0];
  hawk.capacity_soldiers = 3000;
  ids.sea_hawk = hawk.id;
  c.ships[hawk.id] = hawk;

  c.weather_by_day[2] = Weather::Rain;
  c.weather_by_day[5] = Weather::Storm;

  if (ids_out) *ids_out = ids;
  return c;
}

std::vector<OrderRequest> make_demo_orders(const Campaign& c, const ScenarioIds& ids) {
  std::vector<OrderRequest> out;

  // March east along the road to the walls of Thornwall.
  {
    MoveOrder mv;
    MoveLeg a;
    a.to_hex_id = demo_hex(c, 2, 1);
    a.distance_miles = 6.0;
    a.on_road = true;
    MoveLeg b;
    b.to_hex_id = demo_hex(c, 3, 1);
    b.distance_miles = 6.0;
    b.on_road = true;
    mv.legs = {a, b};
    OrderRequest req;
    req.commander_id = ids.valens;
    req.params = mv;
    out.push_back(req);
  }
  {
    BesiegeOrder b;
    b.stronghold_id = ids.thornwall;
    b.siege_engines = 2;
    OrderRequest req;
    req.commander_id = ids.valens;
    req.params = b;
    req.execute_day = 1;
    out.push_back(req);
  }
  {
    SendMessageOrder m;
    m.recipient_commander_id = ids.marcia;
    m.content = "Thornwall is invested. Send the second army east.";
    m.territory = TerritoryType::Friendly;
    OrderRequest req;
    req.commander_id = ids.valens;
    req.params = m;
    req.execute_day = 1;
    req.execute_part = DayPart::Evening;
    out.push_back(req);
  }
  {
    LaunchOperationOrder op;
    op.type = OperationType::Intelligence;
    op.complexity = OperationComplexity::Standard;
    op.territory = TerritoryType::Hostile;
    op.target_kind = TargetKind::Stronghold;
    op.target_id = ids.saltmere;
    op.loot_cost = 0;
    OrderRequest req;
    req.commander_id = ids.orso;
    req.params = op;
    out.push_back(req);
  }
  {
    RaiseArmyOrder ra;
    ra.stronghold_id = ids.aurel;
    ra.composition = {UnitComposition{ids.infantry, 1500, 6}, UnitComposition{ids.cavalry, 200, 0}};
    ra.rally_hex_id = demo_hex(c, 0, 1);
    ra.army_name = "Second Legion";
    OrderRequest req;
    req.commander_id = ids.marcia;
    req.params = ra;
    out.push_back(req);
  }
  return out;
}

} // namespace cataphract
