#include <iostream>
#include <string>

#include "cataphract/core/army_rules.h"
#include "cataphract/core/errors.h"
#include "cataphract/core/naval.h"
#include "cataphract/core/scheduler.h"
#include "test_fixtures.h"

#define CATA_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

// A 600-horse League column waiting on the quay at (4,0).
cataphract::Id add_marines(cataphract::test::Harness& h) {
  cataphract::Army a = h.legion();
  a.id = cataphract::allocate_id(h.c);
  a.name = "Marines";
  a.commander_id = cataphract::kInvalidId;
  a.order_queue.clear();
  a.detachments = {h.legion().detachments.at(1)};
  a.hex_id = h.hex(4, 0);
  cataphract::refresh_supply_capacity(a, h.rules.supply);
  h.c.armies[a.id] = a;
  return a.id;
}

} // namespace

int test_naval() {
  using namespace cataphract;
  using cataphract::test::Harness;

  {
    Harness h;
    const Ship& hawk = h.c.ships.at(h.ids.sea_hawk);
    CATA_ASSERT(validate_sea_route(h.map, hawk.hex_id, {h.hex(4, 1)}) == 24.0);
    CATA_ASSERT(validate_sea_route(h.map, hawk.hex_id, {h.hex(5, 0), h.hex(5, 1)}) == 36.0);

    bool threw = false;
    try {
      validate_sea_route(h.map, hawk.hex_id, {h.hex(3, 0)});
    } catch (const InvalidRouteError&) {
      threw = true;
    }
    CATA_ASSERT(threw);
    threw = false;
    try {
      validate_sea_route(h.map, hawk.hex_id, {h.hex(4, 2)});
    } catch (const InvalidRouteError&) {
      threw = true;
    }
    CATA_ASSERT(threw);
  }

  // The whole legion does not fit.
  {
    Harness h;
    h.legion().hex_id = h.hex(4, 0);
    EmbarkOrder e;
    e.ship_id = h.ids.sea_hawk;
    bool threw = false;
    try {
      resolve_embark(h.ctx, h.legion(), e);
    } catch (const InvalidRouteError&) {
      threw = true;
    }
    CATA_ASSERT(threw);
    CATA_ASSERT(h.c.ships.at(h.ids.sea_hawk).embarked_army_ids.empty());
    CATA_ASSERT(h.legion().ship_id == kInvalidId);
  }

  // Embark, sail one lane, disembark.
  {
    Harness h;
    const Id marines = add_marines(h);
    EmbarkOrder e;
    e.ship_id = h.ids.sea_hawk;
    resolve_embark(h.ctx, h.c.armies.at(marines), e);
    CATA_ASSERT(h.c.armies.at(marines).status == ArmyStatus::Embarked);
    CATA_ASSERT(embarked_soldiers(h.c, h.c.ships.at(h.ids.sea_hawk)) == 600);

    const OrderScheduler s;
    NavalMoveOrder nm;
    nm.ship_id = h.ids.sea_hawk;
    nm.route = {h.hex(4, 1)};
    OrderRequest req;
    req.commander_id = h.ids.valens;
    req.params = nm;
    const Id oid = s.submit(h.c, req).id;
    s.dispatch_due(h.ctx);
    CATA_ASSERT(h.c.orders.at(oid).status == OrderStatus::Executing);
    CATA_ASSERT(h.c.ships.at(h.ids.sea_hawk).status == ShipStatus::Sailing);

    // Boarding a ship under way is refused.
    h.legion().hex_id = h.hex(4, 0);
    bool threw = false;
    try {
      resolve_embark(h.ctx, h.legion(), e);
    } catch (const InvalidStateError&) {
      threw = true;
    }
    CATA_ASSERT(threw);

    advance_ships(h.ctx);
    CATA_ASSERT(h.c.ships.at(h.ids.sea_hawk).hex_id == h.hex(4, 0));
    advance_ships(h.ctx);
    const Ship& hawk = h.c.ships.at(h.ids.sea_hawk);
    CATA_ASSERT(hawk.hex_id == h.hex(4, 1));
    CATA_ASSERT(hawk.status == ShipStatus::Docked);
    CATA_ASSERT(hawk.route.empty());
    CATA_ASSERT(h.c.armies.at(marines).hex_id == h.hex(4, 1));
    CATA_ASSERT(h.c.orders.at(oid).status == OrderStatus::Completed);

    DisembarkOrder d;
    d.ship_id = h.ids.sea_hawk;
    resolve_disembark(h.ctx, h.c.armies.at(marines), d);
    CATA_ASSERT(h.c.armies.at(marines).status == ArmyStatus::Idle);
    CATA_ASSERT(h.c.armies.at(marines).ship_id == kInvalidId);
    CATA_ASSERT(h.c.ships.at(h.ids.sea_hawk).embarked_army_ids.empty());
  }

  // Marches commanders cannot sail the Sea Hawk.
  {
    Harness h;
    NavalMoveOrder nm;
    nm.ship_id = h.ids.sea_hawk;
    nm.route = {h.hex(4, 1)};
    bool threw = false;
    try {
      resolve_naval_move(h.ctx, h.c.commanders.at(h.ids.isolde), nm);
    } catch (const AuthorizationError&) {
      threw = true;
    }
    CATA_ASSERT(threw);
  }

  return 0;
}
