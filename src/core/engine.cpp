#include "cataphract/core/engine.h"

#include <limits>
#include <string>
#include <utility>

#include "cataphract/core/errors.h"
#include "cataphract/core/state_validation.h"
#include "cataphract/util/digest.h"
#include "cataphract/util/log.h"

namespace cataphract {

CampaignEngine::CampaignEngine(Campaign campaign, RulesConfig rules, EngineConfig cfg,
                               std::unique_ptr<RollSource> rolls)
    : campaign_(std::move(campaign)), engine_(rules, cfg), rolls_(std::move(rolls)) {
  if (!rolls_) rolls_ = std::make_unique<SeededRollSource>(campaign_.seed);
}

void CampaignEngine::set_commit_callback(CommitFn fn) {
  std::lock_guard<std::mutex> lock(mu_);
  commit_ = std::move(fn);
}

Order CampaignEngine::submit_order(const OrderRequest& req) {
  std::lock_guard<std::mutex> lock(mu_);
  return engine_.scheduler().submit(campaign_, req);
}

Order CampaignEngine::submit_order(Id commander_id, Id army_id, const std::string& order_type,
                                   const json::Value& params, std::optional<int> execute_day,
                                   std::optional<DayPart> execute_part, int priority) {
  OrderRequest req;
  req.commander_id = commander_id;
  req.army_id = army_id;
  req.params = parse_order_parameters(order_type, params);
  req.execute_day = execute_day;
  req.execute_part = execute_part;
  req.priority = priority;
  return submit_order(req);
}

Order CampaignEngine::cancel_order(Id order_id) {
  std::lock_guard<std::mutex> lock(mu_);
  return engine_.scheduler().cancel(campaign_, order_id);
}

CampaignSnapshot CampaignEngine::advance(int days) {
  if (days < 1) throw ValidationError("advance requires at least one day");
  if (days > std::numeric_limits<int>::max() / kPartsPerDay) {
    throw ValidationError("advance of " + std::to_string(days) + " days is out of range");
  }
  std::lock_guard<std::mutex> lock(mu_);

  const int parts = days * kPartsPerDay;
  for (int i = 0; i < parts; ++i) {
    Campaign working = campaign_;
    const PartReport report = engine_.run_part(working, *rolls_);
    if (commit_) commit_(working);
    campaign_ = std::move(working);
    log::debug("Committed " + report.tick.to_string() + ": " + std::to_string(report.orders_dispatched) +
               " orders, " + std::to_string(report.audit_entries) + " audit entries");
  }
  return snapshot_locked();
}

std::vector<AuditEntry> CampaignEngine::get_audit_log(TickStamp since) const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<AuditEntry> out;
  for (const auto& e : campaign_.audit_log) {
    if (e.tick >= since) out.push_back(e);
  }
  return out;
}

CampaignSnapshot CampaignEngine::snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return snapshot_locked();
}

CampaignSnapshot CampaignEngine::snapshot_locked() const {
  CampaignSnapshot s;
  s.campaign = campaign_;
  s.digest = digest_campaign64(campaign_);
  s.tick = campaign_.now();
  return s;
}

void CampaignEngine::set_weather(int day, Weather w) {
  std::lock_guard<std::mutex> lock(mu_);
  campaign_.weather_by_day[day] = w;
}

std::vector<std::string> CampaignEngine::validate() const {
  std::lock_guard<std::mutex> lock(mu_);
  return validate_campaign(campaign_);
}

} // namespace cataphract
