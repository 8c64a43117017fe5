#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "cataphract/core/audit.h"
#include "cataphract/core/calendar.h"
#include "cataphract/core/ids.h"

namespace cataphract {

struct Campaign;

// What a resolver asks for. `draw` is the audit sequence number the roll will
// occupy, which makes every draw individually addressable.
struct RollRequest {
  TickStamp tick;
  std::string subsystem;
  std::string context;
  std::uint64_t draw{0};
  int count{1};
  int sides{6};
};

struct RolledDice {
  std::uint64_t seed{0};
  std::vector<int> faces;
};

// Source of dice faces. Injected into every resolver call; never global.
class RollSource {
 public:
  virtual ~RollSource() = default;
  virtual RolledDice roll(const RollRequest& req) = 0;
};

// Deterministic: faces depend only on the campaign seed and the request, not
// on how many rolls other subsystems made before.
class SeededRollSource : public RollSource {
 public:
  explicit SeededRollSource(std::uint64_t seed) : seed_(seed) {}
  RolledDice roll(const RollRequest& req) override;

  std::uint64_t seed() const { return seed_; }

 private:
  std::uint64_t seed_;
};

// Hands out pre-scripted faces in order (clamped to [1, sides]), falling back
// to `fallback_face` once the script runs out. For tests.
class ScriptedRollSource : public RollSource {
 public:
  explicit ScriptedRollSource(std::vector<int> faces, int fallback_face = 1)
      : faces_(faces.begin(), faces.end()), fallback_(fallback_face) {}

  RolledDice roll(const RollRequest& req) override;

  void push(int face) { faces_.push_back(face); }
  std::size_t remaining() const { return faces_.size(); }

 private:
  std::deque<int> faces_;
  int fallback_;
};

struct RollSpec {
  std::string subsystem;
  std::string context;
  int count{1};
  int sides{6};
  std::vector<std::pair<std::string, int>> modifiers;

  // Substitutes the raw dice total when set.
  std::optional<int> fixed;

  Id order_id{kInvalidId};
  Id subject_id{kInvalidId};

  // Short description stored on the audit entry ("fork check", ...).
  std::string purpose;
};

struct RollResult {
  int raw{0};
  int total{0};
  std::uint64_t audit_seq{0};
};

// Rolls through a RollSource and appends an AuditEntry for every draw and
// decision to the campaign log.
class Dice {
 public:
  Dice(Campaign& campaign, RollSource& source) : campaign_(campaign), source_(source) {}

  RollResult roll(const RollSpec& spec);

  // Convenience: one die, no modifiers.
  RollResult d(int sides, const std::string& subsystem, const std::string& context, std::optional<int> fixed = {},
               Id order_id = kInvalidId, Id subject_id = kInvalidId);

  // Record a resolved effect. Returns the entry's sequence number.
  std::uint64_t note(const std::string& subsystem, const std::string& context, const std::string& effect,
                     Id order_id = kInvalidId, Id subject_id = kInvalidId);

  Campaign& campaign() { return campaign_; }

 private:
  AuditEntry& append(const std::string& subsystem, const std::string& context, Id order_id, Id subject_id);

  Campaign& campaign_;
  RollSource& source_;
};

} // namespace cataphract
