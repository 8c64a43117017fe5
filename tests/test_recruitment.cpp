#include <iostream>
#include <string>

#include "cataphract/core/errors.h"
#include "cataphract/core/recruitment.h"
#include "cataphract/core/state_validation.h"
#include "test_fixtures.h"

#define CATA_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

cataphract::RaiseArmyOrder levy(const cataphract::test::Harness& h, cataphract::Id stronghold) {
  cataphract::RaiseArmyOrder o;
  o.stronghold_id = stronghold;
  o.composition = {cataphract::UnitComposition{h.ids.infantry, 800, 0}};
  o.army_name = "Reserve";
  return o;
}

template <typename E, typename Fn>
bool throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

} // namespace

int test_recruitment() {
  using namespace cataphract;
  using cataphract::test::Harness;
  using cataphract::test::has_entry;

  {
    const RecruitmentRules r;
    CATA_ASSERT(recruitment_rate(StrongholdType::Town, r) == 1);
    CATA_ASSERT(recruitment_rate(StrongholdType::Fortress, r) == 2);
    CATA_ASSERT(recruitment_rate(StrongholdType::City, r) == 3);
  }

  // Aurel raises 800 men for Marcia in forty parts.
  {
    Harness h;
    const OrderResult res = resolve_raise_army(h.ctx, h.c.commanders.at(h.ids.marcia), levy(h, h.ids.aurel));
    CATA_ASSERT(res.created_ids.size() == 1);
    const Id pid = res.created_ids[0];
    CATA_ASSERT(open_project_for(h.c, h.ids.aurel, h.ids.marcia) != nullptr);
    CATA_ASSERT(h.c.projects.at(pid).rally_hex_id == h.hex(0, 1));

    for (int i = 0; i < 39; ++i) tick_recruitment(h.ctx);
    CATA_ASSERT(h.c.projects.at(pid).progress == 117);
    CATA_ASSERT(h.c.commanders.at(h.ids.marcia).army_id == kInvalidId);

    tick_recruitment(h.ctx);
    const RecruitmentProject& p = h.c.projects.at(pid);
    CATA_ASSERT(p.status == ProjectStatus::Completed);
    CATA_ASSERT(p.spawned_army_id != kInvalidId);
    const Army& a = h.c.armies.at(p.spawned_army_id);
    CATA_ASSERT(a.name == "Reserve");
    CATA_ASSERT(a.faction_id == h.ids.league);
    CATA_ASSERT(a.commander_id == h.ids.marcia);
    CATA_ASSERT(a.hex_id == h.hex(0, 1));
    CATA_ASSERT(army_soldiers(a) == 800);
    CATA_ASSERT(a.noncombatants == 200);
    CATA_ASSERT(a.morale_current == 9);
    CATA_ASSERT(a.movement_points_remaining == 0.0);
    CATA_ASSERT(a.supplies_capacity == 12000);
    CATA_ASSERT(a.supplies_current == 12000);
    CATA_ASSERT(h.c.commanders.at(h.ids.marcia).army_id == a.id);
    CATA_ASSERT(open_project_for(h.c, h.ids.aurel, h.ids.marcia) == nullptr);
    CATA_ASSERT(has_entry(h.c, "recruitment", "raised army"));
  }

  // Refusals.
  {
    Harness h;
    CATA_ASSERT(throws<InvalidStateError>([&] {
      resolve_raise_army(h.ctx, h.c.commanders.at(h.ids.valens), levy(h, h.ids.aurel));
    }));
    CATA_ASSERT(throws<AuthorizationError>([&] {
      resolve_raise_army(h.ctx, h.c.commanders.at(h.ids.marcia), levy(h, h.ids.saltmere));
    }));
    RaiseArmyOrder at_sea = levy(h, h.ids.aurel);
    at_sea.rally_hex_id = h.hex(5, 0);
    CATA_ASSERT(throws<InvalidRouteError>([&] {
      resolve_raise_army(h.ctx, h.c.commanders.at(h.ids.marcia), at_sea);
    }));
    RaiseArmyOrder odd = levy(h, h.ids.aurel);
    odd.composition[0].unit_type_id = 999999;
    CATA_ASSERT(throws<NotFoundError>([&] {
      resolve_raise_army(h.ctx, h.c.commanders.at(h.ids.marcia), odd);
    }));
    CATA_ASSERT(h.c.projects.empty());
  }

  // Losing the stronghold suspends the project; retaking it allows a resume.
  {
    Harness h;
    const Id pid =
        resolve_raise_army(h.ctx, h.c.commanders.at(h.ids.marcia), levy(h, h.ids.aurel)).created_ids.at(0);
    tick_recruitment(h.ctx);
    tick_recruitment(h.ctx);
    CATA_ASSERT(h.c.projects.at(pid).progress == 6);

    h.c.strongholds.at(h.ids.aurel).controlling_faction_id = h.ids.marches;
    tick_recruitment(h.ctx);
    CATA_ASSERT(h.c.projects.at(pid).status == ProjectStatus::Suspended);
    CATA_ASSERT(h.c.projects.at(pid).progress == 6);
    CATA_ASSERT(has_entry(h.c, "recruitment", "suspended"));

    RaiseArmyOrder resume;
    resume.project_id = pid;
    CATA_ASSERT(throws<InvalidStateError>([&] {
      resolve_raise_army(h.ctx, h.c.commanders.at(h.ids.marcia), resume);
    }));
    CATA_ASSERT(throws<AuthorizationError>([&] {
      resolve_raise_army(h.ctx, h.c.commanders.at(h.ids.orso), resume);
    }));

    h.c.strongholds.at(h.ids.aurel).controlling_faction_id = h.ids.league;
    const OrderResult res = resolve_raise_army(h.ctx, h.c.commanders.at(h.ids.marcia), resume);
    CATA_ASSERT(res.summary.find("resumed") != std::string::npos);
    CATA_ASSERT(h.c.projects.at(pid).status == ProjectStatus::Active);
    tick_recruitment(h.ctx);
    CATA_ASSERT(h.c.projects.at(pid).progress == 9);

    h.c.commanders.at(h.ids.marcia).status = CommanderStatus::Captured;
    tick_recruitment(h.ctx);
    CATA_ASSERT(h.c.projects.at(pid).status == ProjectStatus::Cancelled);
  }

  // Mercenary pay: four loot a day for the Free Company.
  {
    Harness h;
    const Detachment* merc = find_detachment(h.legion(), h.ids.mercenaries);
    CATA_ASSERT(merc != nullptr);
    CATA_ASSERT(mercenary_daily_upkeep(*merc, h.rules.mercenaries) == 4);

    tick_mercenary_upkeep(h.ctx);
    CATA_ASSERT(h.legion().loot == 300);

    h.c.current_day = 3;
    tick_mercenary_upkeep(h.ctx);
    CATA_ASSERT(h.legion().loot == 288);
    CATA_ASSERT(h.c.contracts.at(h.ids.contract).last_upkeep_day == 3);
    // Once per day.
    tick_mercenary_upkeep(h.ctx);
    CATA_ASSERT(h.legion().loot == 288);
  }

  // Unpaid mercenaries sulk, then walk away.
  {
    Harness h({6});
    h.legion().loot = 0;
    h.c.current_day = 1;
    tick_mercenary_upkeep(h.ctx);
    const MercenaryContract& k = h.c.contracts.at(h.ids.contract);
    CATA_ASSERT(k.unpaid_days == 1);
    CATA_ASSERT(h.legion().morale_current == 8);
    CATA_ASSERT(h.c.next_audit_seq == 2);

    // Past the grace period the first desertion roll is a 6: they stay.
    h.c.current_day = 4;
    tick_mercenary_upkeep(h.ctx);
    CATA_ASSERT(k.unpaid_days == 4);
    CATA_ASSERT(k.active);
    CATA_ASSERT(h.legion().detachments.size() == 3);

    // The next comes up 1.
    h.c.current_day = 5;
    tick_mercenary_upkeep(h.ctx);
    CATA_ASSERT(!k.active);
    CATA_ASSERT(h.legion().detachments.size() == 2);
    CATA_ASSERT(find_detachment(h.legion(), h.ids.mercenaries) == nullptr);
    CATA_ASSERT(h.legion().supplies_capacity == 125000);
    CATA_ASSERT(has_entry(h.c, "mercenaries", "Free Company deserted with 400 soldiers"));
  }

  // Repeat levies within a year risk a revolt; recent conquest doubles it.
  {
    const RecruitmentRules r;
    Hex hex;
    CATA_ASSERT(levy_revolt_chance(hex, 10, r) == 0);
    hex.last_recruited_day = 0;
    CATA_ASSERT(levy_revolt_chance(hex, 365, r) == 1);
    CATA_ASSERT(levy_revolt_chance(hex, 366, r) == 0);
    hex.controlling_faction_id = 3;
    hex.last_control_change_day = 10;
    CATA_ASSERT(levy_revolt_chance(hex, 100, r) == 2);
    CATA_ASSERT(levy_revolt_chance(hex, 101, r) == 1);
    RecruitmentRules restless;
    restless.revolt_chance = 4;
    CATA_ASSERT(levy_revolt_chance(hex, 50, restless) == 6);
  }

  // The first levy marks the hex; a second one inside the cooldown that rolls
  // above the chance still opens its project.
  {
    Harness h;
    resolve_raise_army(h.ctx, h.c.commanders.at(h.ids.marcia), levy(h, h.ids.aurel));
    const Hex& hex = h.c.map.hexes.at(h.hex(0, 1));
    CATA_ASSERT(hex.last_recruited_day == 0);
    CATA_ASSERT(!has_entry(h.c, "recruitment", "revolt"));

    h.c.current_day = 30;
    RaiseArmyOrder second = levy(h, h.ids.aurel);
    second.revolt_fixed_roll = 2;
    const OrderResult res = resolve_raise_army(h.ctx, h.c.commanders.at(h.ids.orso), second);
    CATA_ASSERT(!res.partial);
    CATA_ASSERT(open_project_for(h.c, h.ids.aurel, h.ids.orso) != nullptr);
    CATA_ASSERT(hex.last_recruited_day == 30);
  }

  // A roll of 1 raises the countryside instead.
  {
    Harness h({7});
    Hex& hex = h.c.map.hexes.at(h.hex(0, 1));
    hex.last_recruited_day = 10;
    h.c.current_day = 40;
    const std::size_t factions = h.c.factions.size();
    RaiseArmyOrder o = levy(h, h.ids.aurel);
    o.revolt_fixed_roll = 1;
    const OrderResult res = resolve_raise_army(h.ctx, h.c.commanders.at(h.ids.orso), o);
    CATA_ASSERT(res.partial);
    CATA_ASSERT(res.summary.find("revolt") != std::string::npos);
    CATA_ASSERT(res.created_ids.size() == 3);
    CATA_ASSERT(open_project_for(h.c, h.ids.aurel, h.ids.orso) == nullptr);
    CATA_ASSERT(h.c.factions.size() == factions + 1);

    const Faction& rebels = h.c.factions.at(res.created_ids[0]);
    CATA_ASSERT(rebels.name == "Rebels of Hex " + std::to_string(hex.id));
    const Commander& leader = h.c.commanders.at(res.created_ids[1]);
    CATA_ASSERT(leader.name == "Rebel Leader " + std::to_string(hex.id));
    const Army& a = h.c.armies.at(res.created_ids[2]);
    CATA_ASSERT(leader.army_id == a.id);
    CATA_ASSERT(a.faction_id == rebels.id);
    CATA_ASSERT(a.hex_id == hex.id);
    CATA_ASSERT(army_soldiers(a) == 3500);
    CATA_ASSERT(a.noncombatants == 875);
    CATA_ASSERT(a.morale_current == 9);
    CATA_ASSERT(a.supplies_current > 0 && a.supplies_current <= a.supplies_capacity);
    CATA_ASSERT(hex.controlling_faction_id == rebels.id);
    CATA_ASSERT(hex.last_revolt_day == 40);
    CATA_ASSERT(hex.last_recruited_day == 10);
    CATA_ASSERT(validate_campaign(h.c).empty());
  }

  // In a recently conquered hex a 2 is enough; the smallest band is 500.
  {
    Harness h({1});
    Hex& hex = h.c.map.hexes.at(h.hex(0, 1));
    hex.controlling_faction_id = h.ids.league;
    hex.last_recruited_day = 10;
    hex.last_control_change_day = 35;
    h.c.current_day = 40;
    RaiseArmyOrder o = levy(h, h.ids.aurel);
    o.revolt_fixed_roll = 2;
    const OrderResult res = resolve_raise_army(h.ctx, h.c.commanders.at(h.ids.orso), o);
    CATA_ASSERT(res.created_ids.size() == 3);
    CATA_ASSERT(army_soldiers(h.c.armies.at(res.created_ids[2])) == 500);
    CATA_ASSERT(validate_campaign(h.c).empty());
  }

  return 0;
}
