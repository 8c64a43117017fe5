#include <iostream>
#include <string>

#include "cataphract/core/errors.h"
#include "cataphract/core/messaging.h"
#include "test_fixtures.h"

#define CATA_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_messaging() {
  using namespace cataphract;
  using cataphract::test::Harness;

  {
    const MessagingRules r;
    const double friendly = interception_probability(TerritoryType::Friendly, r);
    const double neutral = interception_probability(TerritoryType::Neutral, r);
    const double hostile = interception_probability(TerritoryType::Hostile, r);
    CATA_ASSERT(friendly > 0.0);
    CATA_ASSERT(neutral > friendly);
    CATA_ASSERT(hostile > neutral);
    CATA_ASSERT(hostile < 1.0);

    CATA_ASSERT(courier_travel_parts(0.0, TerritoryType::Friendly, r) == 1);
    CATA_ASSERT(courier_travel_parts(6.0, TerritoryType::Friendly, r) == 1);
    CATA_ASSERT(courier_travel_parts(48.0, TerritoryType::Friendly, r) == 4);
    CATA_ASSERT(courier_travel_parts(100.0, TerritoryType::Friendly, r) == 9);
    CATA_ASSERT(courier_travel_parts(100.0, TerritoryType::Hostile, r) == 12);
  }

  // Orso writes to Valens one hex away: due the next part.
  {
    Harness h;
    const Commander& orso = h.c.commanders.at(h.ids.orso);
    CATA_ASSERT(last_known_hex(h.c, orso) == h.hex(0, 1));
    CATA_ASSERT(last_known_hex(h.c, h.c.commanders.at(h.ids.valens)) == h.hex(1, 1));

    SendMessageOrder m;
    m.recipient_commander_id = h.ids.valens;
    m.content = "march at dawn";
    const OrderResult res = resolve_send_message(h.ctx, orso, m);
    CATA_ASSERT(res.created_ids.size() == 1);
    const Id mid = res.created_ids[0];
    const Message& msg = h.c.messages.at(mid);
    CATA_ASSERT(msg.status == MessageStatus::InTransit);
    CATA_ASSERT(msg.delivery == (TickStamp{0, DayPart::Midday}));
    CATA_ASSERT(msg.distance_miles == 6.0);

    deliver_due_messages(h.ctx);
    CATA_ASSERT(h.c.messages.at(mid).status == MessageStatus::InTransit);

    h.c.current_part = DayPart::Midday;
    deliver_due_messages(h.ctx);
    CATA_ASSERT(h.c.messages.at(mid).status == MessageStatus::Delivered);
    CATA_ASSERT(h.c.messages.at(mid).delivered);
    CATA_ASSERT(cataphract::test::has_entry(h.c, "messaging", "delivered"));
  }

  // Interception is decided at dispatch.
  {
    Harness h;
    const Commander& orso = h.c.commanders.at(h.ids.orso);
    SendMessageOrder m;
    m.recipient_commander_id = h.ids.valens;
    m.fixed_roll = 20;
    const Id lost = resolve_send_message(h.ctx, orso, m).created_ids.at(0);
    CATA_ASSERT(h.c.messages.at(lost).status == MessageStatus::Lost);

    m.territory = TerritoryType::Hostile;
    m.fixed_roll = 5;
    const Id kept = resolve_send_message(h.ctx, orso, m).created_ids.at(0);
    CATA_ASSERT(h.c.messages.at(kept).status == MessageStatus::InTransit);
    m.fixed_roll = 6;
    const Id taken = resolve_send_message(h.ctx, orso, m).created_ids.at(0);
    CATA_ASSERT(h.c.messages.at(taken).status == MessageStatus::Lost);

    h.c.current_day = 3;
    deliver_due_messages(h.ctx);
    CATA_ASSERT(h.c.messages.at(lost).status == MessageStatus::Lost);
    CATA_ASSERT(!h.c.messages.at(lost).delivered);
    CATA_ASSERT(h.c.messages.at(kept).status == MessageStatus::Delivered);
  }

  {
    Harness h;
    SendMessageOrder m;
    m.recipient_commander_id = 999999;
    bool threw = false;
    try {
      resolve_send_message(h.ctx, h.c.commanders.at(h.ids.orso), m);
    } catch (const NotFoundError&) {
      threw = true;
    }
    CATA_ASSERT(threw);
    CATA_ASSERT(h.c.messages.empty());
  }

  return 0;
}
