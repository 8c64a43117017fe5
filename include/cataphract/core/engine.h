#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "cataphract/core/campaign.h"
#include "cataphract/core/rolls.h"
#include "cataphract/core/rules_config.h"
#include "cataphract/core/scheduler.h"
#include "cataphract/core/tick_engine.h"
#include "cataphract/util/json.h"

namespace cataphract {

struct CampaignSnapshot {
  Campaign campaign;
  std::uint64_t digest{0};
  TickStamp tick;
};

// Called with the post-part state before it replaces the live campaign. If it
// throws, the part is not applied and the exception propagates.
// Runs while advance() holds the engine lock: the callback must not call back
// into the same CampaignEngine (any method would deadlock). Persist or copy
// the campaign it is handed instead.
using CommitFn = std::function<void(const Campaign&)>;

// Host-facing owner of one campaign. Every call takes the campaign's lock, so
// mutations of one campaign are serialized; separate engines share nothing and
// may run on separate threads.
class CampaignEngine {
 public:
  // `rolls` defaults to a SeededRollSource over campaign.seed.
  explicit CampaignEngine(Campaign campaign, RulesConfig rules = {}, EngineConfig cfg = {},
                          std::unique_ptr<RollSource> rolls = nullptr);

  void set_commit_callback(CommitFn fn);

  Order submit_order(const OrderRequest& req);

  // Order parameters as an open mapping keyed by order type.
  Order submit_order(Id commander_id, Id army_id, const std::string& order_type, const json::Value& params,
                     std::optional<int> execute_day = std::nullopt,
                     std::optional<DayPart> execute_part = std::nullopt, int priority = 0);

  Order cancel_order(Id order_id);

  // Runs days * 4 day-parts. Each part is committed on its own; a failure
  // leaves every earlier part applied. Throws ValidationError when days < 1
  // or days * 4 would overflow an int.
  CampaignSnapshot advance(int days);

  // Entries stamped at or after `since`.
  std::vector<AuditEntry> get_audit_log(TickStamp since = {}) const;

  CampaignSnapshot snapshot() const;

  // Host-supplied weather for a day.
  void set_weather(int day, Weather w);

  std::vector<std::string> validate() const;

  const RulesConfig& rules() const { return engine_.rules(); }

 private:
  CampaignSnapshot snapshot_locked() const;

  mutable std::mutex mu_;
  Campaign campaign_;
  TickEngine engine_;
  std::unique_ptr<RollSource> rolls_;
  CommitFn commit_;
};

} // namespace cataphract
