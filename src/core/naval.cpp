#include "cataphract/core/naval.h"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "cataphract/core/army_rules.h"
#include "cataphract/core/errors.h"
#include "cataphract/util/sorted_keys.h"

namespace cataphract {
namespace {

Ship& require_ship(Campaign& c, Id id) {
  Ship* s = find_ptr(c.ships, id);
  if (!s) throw NotFoundError("ship " + std::to_string(id) + " not found");
  return *s;
}

void move_passengers(Campaign& c, const Ship& ship) {
  for (Id aid : ship.embarked_army_ids) {
    if (Army* a = find_ptr(c.armies, aid)) a->hex_id = ship.hex_id;
  }
}

} // namespace

int embarked_soldiers(const Campaign& c, const Ship& ship) {
  int n = 0;
  for (Id aid : ship.embarked_army_ids) {
    if (const Army* a = find_ptr(c.armies, aid)) n += army_soldiers(*a);
  }
  return n;
}

double validate_sea_route(const MapGraph& map, Id from, const std::vector<Id>& route) {
  if (route.empty()) throw InvalidRouteError("route is empty");
  double miles = 0.0;
  Id cur = from;
  for (Id next : route) {
    const MapGraph::Node* n = map.node(next);
    if (!n) throw InvalidRouteError("hex " + std::to_string(next) + " does not exist");
    if (!n->is_sea) throw InvalidRouteError("hex " + std::to_string(next) + " is not a sea hex");
    const SeaLane* lane = map.sea_lane(cur, next);
    if (!lane) {
      throw InvalidRouteError("no sea lane between hex " + std::to_string(cur) + " and hex " + std::to_string(next));
    }
    miles += lane->miles;
    cur = next;
  }
  return miles;
}

OrderResult resolve_embark(ResolveContext& ctx, Army& army, const EmbarkOrder& order) {
  require_field_ready(army);
  Campaign& c = ctx.campaign;
  Ship& ship = require_ship(c, order.ship_id);
  if (ship.faction_id != army.faction_id) throw InvalidStateError("ship belongs to another faction");
  if (ship.status == ShipStatus::Sailing) throw InvalidStateError("ship is under way");
  if (ship.hex_id != army.hex_id) throw InvalidStateError("army and ship are not in the same hex");

  const int aboard = embarked_soldiers(c, ship);
  const int soldiers = army_soldiers(army);
  if (aboard + soldiers > ship.capacity_soldiers) {
    throw InvalidRouteError("ship capacity " + std::to_string(ship.capacity_soldiers) + " cannot take " +
                            std::to_string(soldiers) + " more soldiers (" + std::to_string(aboard) + " aboard)");
  }

  ship.embarked_army_ids.push_back(army.id);
  army.ship_id = ship.id;
  army.status = ArmyStatus::Embarked;
  army.movement_points_remaining = 0.0;
  army.siege_id = kInvalidId;

  OrderResult res;
  res.summary = "embarked " + std::to_string(soldiers) + " soldiers on " + ship.name;
  ctx.dice.note("naval", "ship:" + std::to_string(ship.id), res.summary, ctx.order_id, army.id);
  return res;
}

OrderResult resolve_disembark(ResolveContext& ctx, Army& army, const DisembarkOrder& order) {
  if (army.status == ArmyStatus::Routed) throw InvalidStateError("army is routed");
  Campaign& c = ctx.campaign;
  Ship& ship = require_ship(c, order.ship_id);
  if (army.ship_id != ship.id) throw InvalidStateError("army is not aboard ship " + std::to_string(ship.id));
  if (ship.status == ShipStatus::Sailing) throw InvalidStateError("ship is under way");

  ship.embarked_army_ids.erase(std::remove(ship.embarked_army_ids.begin(), ship.embarked_army_ids.end(), army.id),
                               ship.embarked_army_ids.end());
  army.ship_id = kInvalidId;
  army.hex_id = ship.hex_id;
  army.status = ArmyStatus::Idle;
  army.movement_points_remaining = 0.0;

  OrderResult res;
  res.summary = "disembarked at hex " + std::to_string(ship.hex_id);
  ctx.dice.note("naval", "ship:" + std::to_string(ship.id), res.summary, ctx.order_id, army.id);
  return res;
}

OrderResult resolve_naval_move(ResolveContext& ctx, const Commander& cmd, const NavalMoveOrder& order) {
  Campaign& c = ctx.campaign;
  Ship& ship = require_ship(c, order.ship_id);
  if (ship.faction_id != cmd.faction_id) throw AuthorizationError("commander does not control ship " + ship.name);
  if (ship.status == ShipStatus::Sailing) throw InvalidStateError("ship is already under way");

  const double miles = validate_sea_route(ctx.map, ship.hex_id, order.route);
  const double per_part = ctx.rules.naval.miles_per_day / kPartsPerDay;
  const int parts = std::max(1, static_cast<int>(std::ceil(miles / std::max(1e-6, per_part) - 1e-9)));

  ship.route = order.route;
  ship.progress_miles = 0.0;
  ship.status = ShipStatus::Sailing;
  ship.voyage_order_id = ctx.order_id;

  std::ostringstream ss;
  ss << ship.name << " sailing " << order.route.size() << " hexes (" << miles << " mi), expected "
     << c.now().plus_parts(parts).to_string();
  ctx.dice.note("naval", "ship:" + std::to_string(ship.id), ss.str(), ctx.order_id, ship.id);

  OrderResult res;
  res.summary = ss.str();
  res.in_progress = true;
  return res;
}

void advance_ships(ResolveContext& ctx) {
  Campaign& c = ctx.campaign;
  const double per_part = ctx.rules.naval.miles_per_day / kPartsPerDay;
  for (Id id : util::sorted_keys(c.ships)) {
    Ship& ship = c.ships.at(id);
    if (ship.status != ShipStatus::Sailing) continue;

    ship.progress_miles += per_part;
    while (!ship.route.empty()) {
      const SeaLane* lane = ctx.map.sea_lane(ship.hex_id, ship.route.front());
      // Lanes were validated at dispatch; topology is static for the campaign.
      const double leg = lane ? lane->miles : ctx.map.hex_miles();
      if (ship.progress_miles + 1e-9 < leg) break;
      ship.progress_miles -= leg;
      ship.hex_id = ship.route.front();
      ship.route.erase(ship.route.begin());
      move_passengers(c, ship);
    }

    if (ship.route.empty()) {
      ship.status = ShipStatus::Docked;
      ship.progress_miles = 0.0;
      ctx.dice.note("naval", "ship:" + std::to_string(id), ship.name + " arrived at hex " + std::to_string(ship.hex_id),
                    ship.voyage_order_id, id);
      finish_executing_order(c, ship.voyage_order_id, "arrived at hex " + std::to_string(ship.hex_id));
      ship.voyage_order_id = kInvalidId;
    }
  }
}

} // namespace cataphract
