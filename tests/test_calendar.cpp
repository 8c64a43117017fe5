#include <iostream>
#include <stdexcept>
#include <string>

#include "cataphract/core/calendar.h"
#include "cataphract/core/campaign.h"

#define CATA_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_calendar() {
  using namespace cataphract;

  const TickStamp start{0, DayPart::Morning};
  CATA_ASSERT(start.next() == (TickStamp{0, DayPart::Midday}));
  CATA_ASSERT((TickStamp{0, DayPart::Night}).next() == (TickStamp{1, DayPart::Morning}));
  CATA_ASSERT((TickStamp{2, DayPart::Evening}).index() == 10);
  CATA_ASSERT(TickStamp::from_index(10) == (TickStamp{2, DayPart::Evening}));
  CATA_ASSERT(start.plus_parts(-20) == start);
  CATA_ASSERT((TickStamp{1, DayPart::Night}) < (TickStamp{2, DayPart::Morning}));
  CATA_ASSERT((TickStamp{3, DayPart::Midday}).to_string() == "day 3 midday");

  DayPart p = DayPart::Morning;
  CATA_ASSERT(parse_day_part("Evening", &p));
  CATA_ASSERT(p == DayPart::Evening);
  CATA_ASSERT(!parse_day_part("dusk", &p));
  CATA_ASSERT(p == DayPart::Evening);

  Season s = Season::Spring;
  CATA_ASSERT(parse_season("autumn", &s));
  CATA_ASSERT(s == Season::Fall);

  CATA_ASSERT(season_for_day(0, 91) == Season::Spring);
  CATA_ASSERT(season_for_day(90, 91) == Season::Spring);
  CATA_ASSERT(season_for_day(91, 91) == Season::Summer);
  CATA_ASSERT(season_for_day(273, 91) == Season::Winter);
  CATA_ASSERT(season_for_day(364, 91) == Season::Spring);
  CATA_ASSERT(season_for_day(0, 91, Season::Winter) == Season::Winter);
  CATA_ASSERT(season_for_day(91, 91, Season::Winter) == Season::Spring);

  CATA_ASSERT(parse_tick_stamp("12:evening") == (TickStamp{12, DayPart::Evening}));
  CATA_ASSERT(parse_tick_stamp("3") == (TickStamp{3, DayPart::Morning}));
  {
    bool threw = false;
    try {
      (void)parse_tick_stamp("3:dusk");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    CATA_ASSERT(threw);
  }
  {
    bool threw = false;
    try {
      (void)parse_tick_stamp("x");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    CATA_ASSERT(threw);
  }

  // Weather is host-supplied per day; unset days are clear.
  {
    Campaign c;
    c.weather_by_day[2] = Weather::Rain;
    CATA_ASSERT(c.weather_on(2) == Weather::Rain);
    CATA_ASSERT(c.weather_on(3) == Weather::Clear);
  }

  return 0;
}
