#include "cataphract/core/campaign.h"

namespace cataphract {

Weather Campaign::weather_on(int day) const {
  auto it = weather_by_day.find(day);
  return it == weather_by_day.end() ? Weather::Clear : it->second;
}

void finish_executing_order(Campaign& c, Id order_id, const std::string& note) {
  Order* o = find_ptr(c.orders, order_id);
  if (!o || o->status != OrderStatus::Executing) return;
  if (!o->result) o->result = OrderResult{};
  o->result->in_progress = false;
  if (!note.empty()) {
    if (!o->result->summary.empty()) o->result->summary += "; ";
    o->result->summary += note;
  }
  o->status = OrderStatus::Completed;
  o->finished_at = c.now();
}

} // namespace cataphract
