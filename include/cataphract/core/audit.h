#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "cataphract/core/calendar.h"
#include "cataphract/core/ids.h"

namespace cataphract {

// One append-only record. Roll entries carry the dice inputs and outputs;
// decision entries (dice empty) carry the resolved effect so that every
// stochastic outcome can be replayed from the log alone.
struct AuditEntry {
  std::uint64_t seq{0};
  TickStamp tick;

  // "logistics", "combat", "siege", "messaging", "naval", "operations",
  // "recruitment", "morale", "mercenaries", "harry", "scheduler".
  std::string subsystem;
  std::string context;

  Id order_id{kInvalidId};
  Id subject_id{kInvalidId};

  std::uint64_t seed{0};
  int dice_count{0};
  int dice_sides{0};
  std::vector<std::pair<std::string, int>> modifiers;
  std::optional<int> fixed_override;

  std::vector<int> faces;
  int raw{0};
  int total{0};

  std::string effect;

  bool is_roll() const { return dice_count > 0; }
  std::string dice_notation() const;
};

} // namespace cataphract
