#include <iostream>
#include <string>

#include "cataphract/core/army_rules.h"
#include "cataphract/core/combat.h"
#include "cataphract/core/errors.h"
#include "test_fixtures.h"

#define CATA_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_siege() {
  using namespace cataphract;
  using cataphract::test::Harness;
  using cataphract::test::has_entry;

  {
    const BattleRules br;
    const MoraleRules mr;
    CATA_ASSERT(numeric_advantage(5000, 2000, br) == 4);
    CATA_ASSERT(numeric_advantage(1100, 1000, br) == 1);
    CATA_ASSERT(numeric_advantage(1000, 1000, br) == 0);
    CATA_ASSERT(numeric_advantage(1000, 0, br) == 0);
    CATA_ASSERT(morale_advantage(9, mr, br) == 0);
    CATA_ASSERT(morale_advantage(12, mr, br) == 1);
    CATA_ASSERT(morale_advantage(0, mr, br) == -2);

    CATA_ASSERT(casualty_band(9, br).min_margin == 6);
    CATA_ASSERT(casualty_band(5, br).min_margin == 4);
    CATA_ASSERT(casualty_band(2, br).loser_losses == 0.10);
    CATA_ASSERT(casualty_band(1, br).winner_losses == 0.10);
    CATA_ASSERT(casualty_band(0, br).winner_morale == -1);
    BattleRules one_row;
    one_row.casualty_bands = {{3, 0.0, 0.5, 0, -3}};
    // Below every row: the last row applies.
    CATA_ASSERT(casualty_band(1, one_row).loser_morale == -3);
  }

  // Without engines the walls still fall every part.
  {
    Harness h;
    h.legion().hex_id = h.hex(2, 1);
    BesiegeOrder b;
    b.stronghold_id = h.ids.thornwall;
    b.siege_engines = 0;
    resolve_besiege(h.ctx, h.legion(), b);
    const Stronghold& s = h.c.strongholds.at(h.ids.thornwall);
    int last = s.current_threshold;
    for (int part = 0; part < 12; ++part) {
      advance_sieges(h.ctx);
      CATA_ASSERT(s.current_threshold < last);
      last = s.current_threshold;
    }
    CATA_ASSERT(s.current_threshold == 80 - 24);

    // A lone company with no engines and no bonus rate still makes progress.
    h.rules.siege.soldiers_per_extra_reduction = 0;
    for (auto& d : h.legion().detachments) d.soldiers = 1;
    for (int part = 0; part < 4; ++part) {
      advance_sieges(h.ctx);
      CATA_ASSERT(s.current_threshold < last);
      last = s.current_threshold;
    }
  }

  // Besieging Thornwall from the next hex.
  {
    Harness h;
    h.legion().hex_id = h.hex(2, 1);
    BesiegeOrder b;
    b.stronghold_id = h.ids.thornwall;
    b.siege_engines = 2;
    const OrderResult res = resolve_besiege(h.ctx, h.legion(), b);
    CATA_ASSERT(res.created_ids.size() == 1);
    const Id sid = res.created_ids[0];
    const Siege& siege = h.c.sieges.at(sid);
    CATA_ASSERT(siege.reduction_per_part == 4);
    CATA_ASSERT(siege.attacker_faction_id == h.ids.league);
    CATA_ASSERT(h.legion().status == ArmyStatus::Besieging);
    CATA_ASSERT(h.legion().siege_id == sid);
    Stronghold& s = h.c.strongholds.at(h.ids.thornwall);
    CATA_ASSERT(s.siege_id == sid);

    // The threshold falls every part.
    int last = s.current_threshold;
    for (int i = 0; i < 3; ++i) {
      advance_sieges(h.ctx);
      CATA_ASSERT(s.current_threshold < last);
      last = s.current_threshold;
    }
    CATA_ASSERT(s.current_threshold == 80 - 12);
    CATA_ASSERT(h.c.sieges.at(sid).parts_elapsed == 3);

    // At zero the lead attacker takes it without pillage.
    s.current_threshold = 3;
    advance_sieges(h.ctx);
    CATA_ASSERT(s.current_threshold == 0);
    CATA_ASSERT(s.controlling_faction_id == h.ids.league);
    CATA_ASSERT(s.siege_id == kInvalidId);
    CATA_ASSERT(h.c.sieges.at(sid).status == SiegeStatus::Captured);
    CATA_ASSERT(h.guard().status == ArmyStatus::Routed);
    CATA_ASSERT(army_soldiers(h.guard()) == 1600);
    CATA_ASSERT(s.garrison_army_id == kInvalidId);
    // Unscripted dice come up 1: Brannoc escapes.
    CATA_ASSERT(h.c.commanders.at(h.ids.brannoc).status == CommanderStatus::Active);
    CATA_ASSERT(has_entry(h.c, "combat", "escaped"));
    CATA_ASSERT(h.legion().morale_current == 10);
    CATA_ASSERT(h.legion().siege_id == kInvalidId);
    CATA_ASSERT(h.legion().status == ArmyStatus::Idle);
  }

  // Walking away lifts the siege and restores the walls.
  {
    Harness h;
    h.legion().hex_id = h.hex(2, 1);
    BesiegeOrder b;
    b.stronghold_id = h.ids.thornwall;
    const Id sid = resolve_besiege(h.ctx, h.legion(), b).created_ids.at(0);
    advance_sieges(h.ctx);
    CATA_ASSERT(h.c.strongholds.at(h.ids.thornwall).current_threshold == 78);

    h.legion().hex_id = h.hex(0, 1);
    advance_sieges(h.ctx);
    CATA_ASSERT(h.c.sieges.at(sid).status == SiegeStatus::Lifted);
    CATA_ASSERT(h.c.strongholds.at(h.ids.thornwall).current_threshold == 80);
    CATA_ASSERT(h.c.strongholds.at(h.ids.thornwall).siege_id == kInvalidId);
    CATA_ASSERT(has_entry(h.c, "siege", "siege lifted"));
  }

  // Own strongholds and distant ones cannot be besieged.
  {
    Harness h;
    BesiegeOrder own;
    own.stronghold_id = h.ids.aurel;
    bool threw = false;
    try {
      resolve_besiege(h.ctx, h.legion(), own);
    } catch (const InvalidStateError&) {
      threw = true;
    }
    CATA_ASSERT(threw);

    BesiegeOrder far;
    far.stronghold_id = h.ids.saltmere;
    threw = false;
    try {
      resolve_besiege(h.ctx, h.legion(), far);
    } catch (const InvalidStateError&) {
      threw = true;
    }
    CATA_ASSERT(threw);
    CATA_ASSERT(h.c.sieges.empty());
  }

  // A successful assault with pillage; Brannoc is taken.
  {
    Harness h({6});
    h.legion().hex_id = h.hex(2, 1);
    h.legion().supplies_current = h.legion().supplies_capacity - 5000;
    AssaultOrder a;
    a.stronghold_id = h.ids.thornwall;
    a.attacker_fixed_roll = 12;
    a.defender_fixed_roll = 2;
    a.pillage = true;
    const OrderResult res = resolve_assault(h.ctx, h.legion(), a);
    CATA_ASSERT(res.summary.find("captured") != std::string::npos);
    CATA_ASSERT(res.summary.find("pillaged") != std::string::npos);
    const Stronghold& s = h.c.strongholds.at(h.ids.thornwall);
    CATA_ASSERT(s.controlling_faction_id == h.ids.league);
    CATA_ASSERT(h.guard().status == ArmyStatus::Routed);
    CATA_ASSERT(h.c.commanders.at(h.ids.brannoc).status == CommanderStatus::Captured);
    CATA_ASSERT(h.legion().loot == 300 + 600);
    CATA_ASSERT(s.loot == 600);
    CATA_ASSERT(h.legion().supplies_current == h.legion().supplies_capacity);
    // Margin 15 - 6: the winner loses 5% of soldiers and supplies, the garrison 20%.
    CATA_ASSERT(army_soldiers(h.legion()) == 4750);
    CATA_ASSERT(army_soldiers(h.guard()) == 1280);
    CATA_ASSERT(s.supplies == 30000 - 5750);
    CATA_ASSERT(h.legion().morale_current == 12);
  }

  // A heavy repulse: the worst band plus the failed-assault surcharge.
  {
    Harness h;
    h.legion().hex_id = h.hex(2, 1);
    AssaultOrder a;
    a.stronghold_id = h.ids.thornwall;
    a.attacker_fixed_roll = 2;
    a.defender_fixed_roll = 12;
    const OrderResult res = resolve_assault(h.ctx, h.legion(), a);
    CATA_ASSERT(res.summary.find("repulsed") != std::string::npos);
    CATA_ASSERT(army_soldiers(h.legion()) == 3500);
    CATA_ASSERT(h.legion().morale_current == 6);
    CATA_ASSERT(army_soldiers(h.guard()) == 1900);
    CATA_ASSERT(h.guard().morale_current == 11);
    CATA_ASSERT(h.c.strongholds.at(h.ids.thornwall).controlling_faction_id == h.ids.marches);
    CATA_ASSERT(h.guard().status != ArmyStatus::Routed);
  }

  // A scripted escape roll overrides the dice: 6 beats the escape chance.
  {
    Harness h;
    h.legion().hex_id = h.hex(2, 1);
    AssaultOrder a;
    a.stronghold_id = h.ids.thornwall;
    a.attacker_fixed_roll = 12;
    a.defender_fixed_roll = 2;
    a.escape_fixed_roll = 6;
    resolve_assault(h.ctx, h.legion(), a);
    CATA_ASSERT(h.c.commanders.at(h.ids.brannoc).status == CommanderStatus::Captured);
    CATA_ASSERT(has_entry(h.c, "combat", "Brannoc captured"));
  }

  // Ties go to the defender: 3 - 1 + 4 numeric against 2 + 4 walls.
  {
    Harness h;
    h.legion().hex_id = h.hex(2, 1);
    AssaultOrder a;
    a.stronghold_id = h.ids.thornwall;
    a.attacker_fixed_roll = 3;
    a.defender_fixed_roll = 2;
    const OrderResult res = resolve_assault(h.ctx, h.legion(), a);
    CATA_ASSERT(res.summary.find("attacker 6 vs defender 6") != std::string::npos);
    CATA_ASSERT(res.summary.find("repulsed") != std::string::npos);
  }

  // Harrying the guard with the cavalry.
  {
    Harness h;
    h.legion().hex_id = h.hex(2, 1);
    const Id cav = h.legion().detachments.at(1).id;
    HarryOrder raid;
    raid.detachment_ids = {cav};
    raid.target_army_id = h.ids.thornwall_guard;
    raid.fixed_roll = 4;
    resolve_harry(h.ctx, h.legion(), raid);
    CATA_ASSERT(army_soldiers(h.guard()) == 1600);
    CATA_ASSERT(h.guard().harried_today);
    CATA_ASSERT(h.legion().status == ArmyStatus::Harrying);

    raid.fixed_roll = 5;
    resolve_harry(h.ctx, h.legion(), raid);
    CATA_ASSERT(h.legion().detachments.at(1).soldiers == 480);
    CATA_ASSERT(has_entry(h.c, "harry", "driven off"));
  }

  return 0;
}
