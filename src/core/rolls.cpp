#include "cataphract/core/rolls.h"

#include <algorithm>

#include "cataphract/core/campaign.h"
#include "cataphract/util/hash_rng.h"

namespace cataphract {

std::string AuditEntry::dice_notation() const {
  if (dice_count <= 0) return "";
  return std::to_string(dice_count) + "d" + std::to_string(dice_sides);
}

RolledDice SeededRollSource::roll(const RollRequest& req) {
  std::uint64_t s = util::mix_seed(seed_, static_cast<std::uint64_t>(req.tick.index()));
  s = util::mix_seed(s, req.draw);
  s = util::mix_seed(s, req.subsystem);
  s = util::mix_seed(s, req.context);

  RolledDice out;
  out.seed = s;
  util::DieStream dice(s);
  for (int i = 0; i < req.count; ++i) out.faces.push_back(dice.face(req.sides));
  return out;
}

RolledDice ScriptedRollSource::roll(const RollRequest& req) {
  RolledDice out;
  for (int i = 0; i < req.count; ++i) {
    int face = fallback_;
    if (!faces_.empty()) {
      face = faces_.front();
      faces_.pop_front();
    }
    out.faces.push_back(std::clamp(face, 1, std::max(1, req.sides)));
  }
  return out;
}

AuditEntry& Dice::append(const std::string& subsystem, const std::string& context, Id order_id, Id subject_id) {
  AuditEntry e;
  e.seq = campaign_.next_audit_seq++;
  e.tick = campaign_.now();
  e.subsystem = subsystem;
  e.context = context;
  e.order_id = order_id;
  e.subject_id = subject_id;
  campaign_.audit_log.push_back(std::move(e));
  return campaign_.audit_log.back();
}

RollResult Dice::roll(const RollSpec& spec) {
  const std::uint64_t seq = campaign_.next_audit_seq;

  RolledDice dice;
  if (!spec.fixed) {
    RollRequest req;
    req.tick = campaign_.now();
    req.subsystem = spec.subsystem;
    req.context = spec.context;
    req.draw = seq;
    req.count = std::max(1, spec.count);
    req.sides = std::max(1, spec.sides);
    dice = source_.roll(req);
  }

  RollResult r;
  if (spec.fixed) {
    r.raw = *spec.fixed;
  } else {
    for (int f : dice.faces) r.raw += f;
  }
  r.total = r.raw;
  for (const auto& [_, v] : spec.modifiers) r.total += v;

  AuditEntry& e = append(spec.subsystem, spec.context, spec.order_id, spec.subject_id);
  e.seed = dice.seed;
  e.dice_count = std::max(1, spec.count);
  e.dice_sides = std::max(1, spec.sides);
  e.modifiers = spec.modifiers;
  e.fixed_override = spec.fixed;
  e.faces = dice.faces;
  e.raw = r.raw;
  e.total = r.total;
  e.effect = spec.purpose;
  r.audit_seq = e.seq;
  return r;
}

RollResult Dice::d(int sides, const std::string& subsystem, const std::string& context, std::optional<int> fixed,
                   Id order_id, Id subject_id) {
  RollSpec spec;
  spec.subsystem = subsystem;
  spec.context = context;
  spec.count = 1;
  spec.sides = sides;
  spec.fixed = fixed;
  spec.order_id = order_id;
  spec.subject_id = subject_id;
  return roll(spec);
}

std::uint64_t Dice::note(const std::string& subsystem, const std::string& context, const std::string& effect,
                         Id order_id, Id subject_id) {
  AuditEntry& e = append(subsystem, context, order_id, subject_id);
  e.effect = effect;
  return e.seq;
}

} // namespace cataphract
