#include "cataphract/core/messaging.h"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "cataphract/core/errors.h"
#include "cataphract/util/sorted_keys.h"

namespace cataphract {
namespace {

struct Odds {
  int success{1};
  int denominator{1};
};

Odds delivery_odds(TerritoryType t, const MessagingRules& r) {
  switch (t) {
    case TerritoryType::Friendly: return {r.friendly_success, r.friendly_denominator};
    case TerritoryType::Neutral: return {r.neutral_success, r.neutral_denominator};
    case TerritoryType::Hostile: return {r.hostile_success, r.hostile_denominator};
  }
  return {1, 1};
}

} // namespace

double courier_speed(TerritoryType t, const MessagingRules& r) {
  switch (t) {
    case TerritoryType::Friendly: return r.friendly_speed;
    case TerritoryType::Neutral: return r.neutral_speed;
    case TerritoryType::Hostile: return r.hostile_speed;
  }
  return r.neutral_speed;
}

double interception_probability(TerritoryType t, const MessagingRules& r) {
  const Odds o = delivery_odds(t, r);
  if (o.denominator <= 0) return 0.0;
  const double p = 1.0 - static_cast<double>(o.success) / static_cast<double>(o.denominator);
  return std::clamp(p, 0.0, 1.0);
}

int courier_travel_parts(double miles, TerritoryType t, const MessagingRules& r) {
  const double speed = std::max(1.0, courier_speed(t, r));
  const double parts = miles / speed * kPartsPerDay;
  return std::max(1, static_cast<int>(std::ceil(parts - 1e-9)));
}

Id last_known_hex(const Campaign& c, const Commander& cmd) {
  if (const Army* a = find_ptr(c.armies, cmd.army_id)) return a->hex_id;
  return cmd.hex_id;
}

OrderResult resolve_send_message(ResolveContext& ctx, const Commander& sender, const SendMessageOrder& order) {
  Campaign& c = ctx.campaign;
  const Commander* recipient = find_ptr(c.commanders, order.recipient_commander_id);
  if (!recipient) throw NotFoundError("commander " + std::to_string(order.recipient_commander_id) + " not found");

  const Id from = last_known_hex(c, sender);
  const Id to = last_known_hex(c, *recipient);
  if (!ctx.map.has_hex(from)) throw InvalidStateError("sender has no known location");
  if (!ctx.map.has_hex(to)) throw InvalidStateError("recipient has no known location");

  const auto miles = ctx.map.shortest_path_miles(from, to);
  if (!miles) throw InvalidRouteError("no overland route between hex " + std::to_string(from) + " and hex " +
                                      std::to_string(to));

  const int parts = courier_travel_parts(*miles, order.territory, ctx.rules.messaging);
  const Odds odds = delivery_odds(order.territory, ctx.rules.messaging);

  Message m;
  m.id = allocate_id(c);
  m.sender_commander_id = sender.id;
  m.recipient_commander_id = recipient->id;
  m.content = order.content;
  m.territory = order.territory;
  m.distance_miles = *miles;
  m.dispatched = c.now();
  m.delivery = c.now().plus_parts(parts);

  const auto roll = ctx.dice.d(std::max(1, odds.denominator), "messaging",
                               "courier:message:" + std::to_string(m.id), order.fixed_roll, ctx.order_id, m.id);
  const bool intercepted = roll.total > odds.success;
  if (intercepted) m.status = MessageStatus::Lost;

  std::ostringstream ss;
  ss << "message " << m.id << " to " << recipient->name << " (" << territory_label(order.territory) << ", "
     << *miles << " mi): ";
  if (intercepted) {
    ss << "intercepted (roll " << roll.total << " > " << odds.success << ")";
  } else {
    ss << "due " << m.delivery.to_string();
  }
  ctx.dice.note("messaging", "courier:message:" + std::to_string(m.id), ss.str(), ctx.order_id, m.id);

  OrderResult res;
  res.summary = ss.str();
  res.created_ids.push_back(m.id);
  c.messages[m.id] = std::move(m);
  return res;
}

void deliver_due_messages(ResolveContext& ctx) {
  Campaign& c = ctx.campaign;
  const TickStamp now = c.now();
  for (Id id : util::sorted_keys(c.messages)) {
    Message& m = c.messages.at(id);
    if (m.status != MessageStatus::InTransit || now < m.delivery) continue;
    m.delivered = true;
    m.status = MessageStatus::Delivered;
    ctx.dice.note("messaging", "courier:message:" + std::to_string(id), "delivered", kInvalidId, id);
  }
}

} // namespace cataphract
