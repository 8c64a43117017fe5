#pragma once

#include <cstdint>
#include <string>

namespace cataphract {

enum class DayPart : std::uint8_t { Morning = 0, Midday = 1, Evening = 2, Night = 3 };
constexpr int kPartsPerDay = 4;

enum class Season : std::uint8_t { Spring = 0, Summer = 1, Fall = 2, Winter = 3 };

// A (day, part) position on the campaign clock. Ordered lexicographically.
struct TickStamp {
  int day{0};
  DayPart part{DayPart::Morning};

  // Parts elapsed since day 0 morning.
  std::int64_t index() const { return static_cast<std::int64_t>(day) * kPartsPerDay + static_cast<int>(part); }

  static TickStamp from_index(std::int64_t idx);

  TickStamp next() const { return from_index(index() + 1); }
  TickStamp plus_parts(std::int64_t n) const { return from_index(index() + n); }

  std::string to_string() const;
};

inline bool operator==(const TickStamp& a, const TickStamp& b) { return a.index() == b.index(); }
inline bool operator!=(const TickStamp& a, const TickStamp& b) { return a.index() != b.index(); }
inline bool operator<(const TickStamp& a, const TickStamp& b) { return a.index() < b.index(); }
inline bool operator<=(const TickStamp& a, const TickStamp& b) { return a.index() <= b.index(); }
inline bool operator>(const TickStamp& a, const TickStamp& b) { return a.index() > b.index(); }
inline bool operator>=(const TickStamp& a, const TickStamp& b) { return a.index() >= b.index(); }

const char* day_part_label(DayPart p);
const char* season_label(Season s);

// Case-insensitive. Returns false on unknown names.
bool parse_day_part(const std::string& s, DayPart* out);
bool parse_season(const std::string& s, Season* out);

// Seasons advance every `days_per_season` days starting from `start`.
Season season_for_day(int day, int days_per_season, Season start = Season::Spring);

// Parses "12:evening" or "12" (morning). Throws std::runtime_error on bad input.
TickStamp parse_tick_stamp(const std::string& s);

} // namespace cataphract
