#include "cataphract/core/calendar.h"

#include <stdexcept>

#include "cataphract/util/strings.h"

namespace cataphract {

TickStamp TickStamp::from_index(std::int64_t idx) {
  if (idx < 0) idx = 0;
  TickStamp t;
  t.day = static_cast<int>(idx / kPartsPerDay);
  t.part = static_cast<DayPart>(idx % kPartsPerDay);
  return t;
}

std::string TickStamp::to_string() const {
  return "day " + std::to_string(day) + " " + day_part_label(part);
}

const char* day_part_label(DayPart p) {
  switch (p) {
    case DayPart::Morning: return "morning";
    case DayPart::Midday: return "midday";
    case DayPart::Evening: return "evening";
    case DayPart::Night: return "night";
  }
  return "unknown";
}

const char* season_label(Season s) {
  switch (s) {
    case Season::Spring: return "spring";
    case Season::Summer: return "summer";
    case Season::Fall: return "fall";
    case Season::Winter: return "winter";
  }
  return "unknown";
}

bool parse_day_part(const std::string& s, DayPart* out) {
  const std::string v = to_lower(s);
  for (int i = 0; i < kPartsPerDay; ++i) {
    const auto p = static_cast<DayPart>(i);
    if (v == day_part_label(p)) {
      if (out) *out = p;
      return true;
    }
  }
  return false;
}

bool parse_season(const std::string& s, Season* out) {
  const std::string v = to_lower(s);
  for (int i = 0; i < 4; ++i) {
    const auto season = static_cast<Season>(i);
    if (v == season_label(season) || (v == "autumn" && season == Season::Fall)) {
      if (out) *out = season;
      return true;
    }
  }
  return false;
}

Season season_for_day(int day, int days_per_season, Season start) {
  if (days_per_season <= 0 || day < 0) return start;
  const int offset = (day / days_per_season) % 4;
  return static_cast<Season>((static_cast<int>(start) + offset) % 4);
}

TickStamp parse_tick_stamp(const std::string& s) {
  const auto colon = s.find(':');
  const std::string day_part = s.substr(0, colon);
  if (day_part.empty()) throw std::runtime_error("Invalid tick, expected DAY[:PART]: " + s);
  for (char c : day_part) {
    if (c < '0' || c > '9') throw std::runtime_error("Invalid tick day: " + s);
  }
  TickStamp t;
  t.day = std::stoi(day_part);
  if (colon != std::string::npos) {
    if (!parse_day_part(s.substr(colon + 1), &t.part)) {
      throw std::runtime_error("Invalid day part in tick: " + s);
    }
  }
  return t;
}

} // namespace cataphract
