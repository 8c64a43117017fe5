#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "cataphract/core/campaign.h"
#include "cataphract/core/rolls.h"
#include "cataphract/core/scenario.h"
#include "cataphract/util/audit_export.h"
#include "cataphract/util/digest.h"
#include "cataphract/util/json.h"

#define CATA_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

std::vector<std::string> lines_of(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) out.push_back(line);
  return out;
}

} // namespace

int test_audit_export() {
  using namespace cataphract;

  Campaign c;
  c.current_day = 2;
  c.current_part = DayPart::Night;
  ScriptedRollSource src({3, 5});
  Dice dice(c, src);

  RollSpec spec;
  spec.subsystem = "combat";
  spec.context = "assault, east gate";
  spec.count = 2;
  spec.sides = 6;
  spec.modifiers = {{"numeric", 2}, {"morale", -1}};
  spec.order_id = 12;
  (void)dice.roll(spec);
  (void)dice.note("siege", "stronghold:4", "walls \"breached\"", 12, 4);

  // CSV
  {
    const std::vector<std::string> rows = lines_of(audit_to_csv(c.audit_log));
    CATA_ASSERT(rows.size() == 3);
    CATA_ASSERT(rows[0].rfind("seq,day,part,subsystem,context,", 0) == 0);
    CATA_ASSERT(rows[1].rfind("1,2,night,combat,\"assault, east gate\",12,0,", 0) == 0);
    CATA_ASSERT(rows[1].find(",2d6,numeric:+2;morale:-1,,3;5,8,9,") != std::string::npos);
    CATA_ASSERT(rows[2].find("\"walls \"\"breached\"\"\"") != std::string::npos);
    CATA_ASSERT(rows[2].rfind("2,2,night,siege,", 0) == 0);
  }

  // JSON array
  {
    const json::Value doc = json::parse(audit_to_json(c.audit_log));
    CATA_ASSERT(doc.is_array());
    CATA_ASSERT(doc.array().size() == 2);
    const json::Value& roll = doc.array()[0];
    CATA_ASSERT(roll.at("seed").is_string());
    CATA_ASSERT(roll.at("seed").string_value() == std::to_string(c.audit_log[0].seed));
    CATA_ASSERT(roll.at("dice").string_value() == "2d6");
    CATA_ASSERT(roll.at("faces").array().size() == 2);
    CATA_ASSERT(roll.at("modifiers").array()[1].at("value").int_value() == -1);
    CATA_ASSERT(roll.at("total").int_value() == 9);
    CATA_ASSERT(roll.at("tick").string_value() == "day 2 night");
    CATA_ASSERT(roll.at("fixed_override").is_null());
    const json::Value& note = doc.array()[1];
    CATA_ASSERT(note.at("dice").string_value().empty());
    CATA_ASSERT(note.at("effect").string_value() == "walls \"breached\"");
    CATA_ASSERT(note.at("subject_id").int_value() == 4);
  }

  // JSON Lines
  {
    const std::vector<std::string> rows = lines_of(audit_to_jsonl(c.audit_log));
    CATA_ASSERT(rows.size() == 2);
    for (const auto& r : rows) CATA_ASSERT(json::parse(r).is_object());
    CATA_ASSERT(json::parse(rows[1]).at("seq").int_value() == 2);
    CATA_ASSERT(audit_to_jsonl({}) == "\n");
  }

  // Digests: stable, sensitive, and the audit log can be left out.
  {
    const Campaign a = make_demo_campaign(11);
    const Campaign b = make_demo_campaign(11);
    CATA_ASSERT(digest_campaign64(a) == digest_campaign64(b));
    CATA_ASSERT(digest64_to_hex(digest_campaign64(a)).size() == 16);

    Campaign moved = a;
    moved.armies.begin()->second.supplies_current -= 1;
    CATA_ASSERT(digest_campaign64(moved) != digest_campaign64(a));

    Campaign audited = a;
    ScriptedRollSource s2({4});
    Dice d2(audited, s2);
    (void)d2.note("calendar", "season", "noted");
    audited.next_audit_seq = a.next_audit_seq;
    DigestOptions no_audit;
    no_audit.include_audit = false;
    CATA_ASSERT(digest_campaign64(audited) != digest_campaign64(a));
    CATA_ASSERT(digest_campaign64(audited, no_audit) == digest_campaign64(a, no_audit));
  }

  return 0;
}
