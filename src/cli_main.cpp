#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "cataphract/core/engine.h"
#include "cataphract/core/rules_config.h"
#include "cataphract/core/scenario.h"
#include "cataphract/util/audit_export.h"
#include "cataphract/util/digest.h"
#include "cataphract/util/file_io.h"
#include "cataphract/util/json.h"
#include "cataphract/util/log.h"
#include "cataphract/util/sorted_keys.h"

namespace {

#ifndef CATAPHRACT_VERSION
#define CATAPHRACT_VERSION "unknown"
#endif

int get_int_arg(int argc, char** argv, const std::string& key, int def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stoi(argv[i + 1]);
  }
  return def;
}

std::uint64_t get_u64_arg(int argc, char** argv, const std::string& key, std::uint64_t def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stoull(argv[i + 1]);
  }
  return def;
}

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

void print_usage(const char* exe) {
  std::cout << "Cataphract CLI v" << CATAPHRACT_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "cataphract_cli") << " [options]\n\n";
  std::cout << "Runs the demo campaign for N days and prints a summary.\n\n";
  std::cout << "Options:\n";
  std::cout << "  --days N             Days to advance (default: 3, must be >= 1)\n";
  std::cout << "  --seed N             Campaign RNG seed (default: 1)\n";
  std::cout << "  --rules PATH         Rules overlay JSON (any subset of keys)\n";
  std::cout << "  --orders PATH        Extra orders JSON: array of {commander_id, army_id?, order_type,\n";
  std::cout << "                       parameters, execute_day?, execute_part?, priority?}\n";
  std::cout << "  --no-demo-orders     Skip the scripted opening orders\n";
  std::cout << "  --no-fixed-rolls     Reject orders that carry fixed rolls\n";
  std::cout << "  --audit-csv PATH     Export the audit log as CSV\n";
  std::cout << "  --audit-json PATH    Export the audit log as JSON\n";
  std::cout << "  --audit-jsonl PATH   Export the audit log as JSON Lines\n";
  std::cout << "  --audit-since TICK   Only export entries at or after TICK (e.g. 2:evening)\n";
  std::cout << "  --dump-rules         Print the effective rules JSON and exit\n";
  std::cout << "  --list-orders        Print every order and its result\n";
  std::cout << "  --log-level LEVEL    debug|info|warn|error|off (default: info)\n";
  std::cout << "  --quiet              Only print the digest\n";
  std::cout << "  -h, --help           Show this help\n";
  std::cout << "  --version            Print version and exit\n";
}

std::optional<int> opt_int(const cataphract::json::Value& v, const std::string& key) {
  const cataphract::json::Value* f = v.find(key);
  if (!f || f->is_null()) return std::nullopt;
  const double* d = f->as_number();
  if (!d || std::floor(*d) != *d || *d < std::numeric_limits<int>::min() || *d > std::numeric_limits<int>::max()) {
    throw cataphract::ValidationError(key + " must be an integer in range");
  }
  return static_cast<int>(*d);
}

// Submits every entry of an orders file; rejected entries are reported and
// skipped.
int submit_orders_file(cataphract::CampaignEngine& engine, const std::string& path) {
  const auto doc = cataphract::json::parse(cataphract::read_text_file(path));
  if (!doc.is_array()) throw std::runtime_error(path + ": expected an array of orders");

  int rejected = 0;
  for (std::size_t i = 0; i < doc.array().size(); ++i) {
    const auto& entry = doc.array()[i];
    try {
      const auto commander = static_cast<cataphract::Id>(entry.at("commander_id").int_value());
      const auto army = static_cast<cataphract::Id>(opt_int(entry, "army_id").value_or(0));
      std::optional<cataphract::DayPart> part;
      if (const auto* p = entry.find("execute_part"); p && p->is_string()) {
        cataphract::DayPart dp;
        if (!cataphract::parse_day_part(p->string_value(), &dp)) {
          throw cataphract::ValidationError("unknown execute_part '" + p->string_value() + "'");
        }
        part = dp;
      }
      const auto* params = entry.find("parameters");
      const cataphract::json::Value no_params = cataphract::json::Object{};
      const cataphract::Order o = engine.submit_order(
          commander, army, entry.at("order_type").string_value(), params ? *params : no_params,
          opt_int(entry, "execute_day"), part, opt_int(entry, "priority").value_or(0));
      cataphract::log::info("Accepted " + cataphract::order_to_string(o));
    } catch (const std::exception& e) {
      ++rejected;
      std::cerr << path << "[" << i << "]: rejected: " << e.what() << "\n";
    }
  }
  return rejected;
}

void print_summary(const cataphract::CampaignSnapshot& snap) {
  using namespace cataphract;
  const Campaign& c = snap.campaign;
  std::cout << c.name << " at " << snap.tick.to_string() << " (" << season_label(c.season) << ")\n\n";

  std::cout << "Armies:\n";
  for (Id id : util::sorted_keys(c.armies)) {
    const Army& a = c.armies.at(id);
    std::cout << "  #" << id << " " << std::left << std::setw(16) << a.name << std::right << " hex " << a.hex_id
              << "  " << std::setw(6) << army_soldiers(a) << " soldiers  supplies " << a.supplies_current << "/"
              << a.supplies_capacity << "  morale " << a.morale_current << "  loot " << a.loot << "  ["
              << army_status_label(a.status) << "]\n";
  }

  std::cout << "\nStrongholds:\n";
  for (Id id : util::sorted_keys(c.strongholds)) {
    const Stronghold& s = c.strongholds.at(id);
    const Faction* f = find_ptr(c.factions, s.controlling_faction_id);
    std::cout << "  #" << id << " " << std::left << std::setw(12) << s.name << std::right << " "
              << stronghold_type_label(s.type) << "  threshold " << s.current_threshold << "/" << s.base_threshold
              << "  held by " << (f ? f->name : std::string("nobody"))
              << (s.siege_id != kInvalidId ? "  (under siege)" : "") << "\n";
  }

  int by_status[5] = {0, 0, 0, 0, 0};
  for (const auto& [_, o] : c.orders) by_status[static_cast<int>(o.status)] += 1;
  std::cout << "\nOrders: " << by_status[0] << " pending, " << by_status[1] << " executing, " << by_status[2]
            << " completed, " << by_status[3] << " failed, " << by_status[4] << " cancelled\n";

  int delivered = 0;
  int lost = 0;
  for (const auto& [_, m] : c.messages) {
    if (m.status == MessageStatus::Delivered) ++delivered;
    if (m.status == MessageStatus::Lost) ++lost;
  }
  std::cout << "Messages: " << c.messages.size() << " sent, " << delivered << " delivered, " << lost << " lost\n";
  std::cout << "Audit entries: " << c.audit_log.size() << "\n";
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << CATAPHRACT_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    const std::string level_name = get_str_arg(argc, argv, "--log-level", "info");
    cataphract::log::Level level = cataphract::log::Level::Info;
    if (!cataphract::log::parse_level(level_name, &level)) {
      std::cerr << "Unknown --log-level: '" << level_name << "'\n\n";
      print_usage(argv[0]);
      return 2;
    }
    const bool quiet = has_flag(argc, argv, "--quiet");
    cataphract::log::set_level(quiet ? cataphract::log::Level::Warn : level);

    const int days = get_int_arg(argc, argv, "--days", 3);
    const std::uint64_t seed = get_u64_arg(argc, argv, "--seed", 1);
    const std::string rules_path = get_str_arg(argc, argv, "--rules", "");
    const std::string orders_path = get_str_arg(argc, argv, "--orders", "");
    const std::string audit_csv_path = get_str_arg(argc, argv, "--audit-csv", "");
    const std::string audit_json_path = get_str_arg(argc, argv, "--audit-json", "");
    const std::string audit_jsonl_path = get_str_arg(argc, argv, "--audit-jsonl", "");
    const std::string audit_since = get_str_arg(argc, argv, "--audit-since", "0");

    if (days < 1) {
      std::cerr << "--days must be at least 1\n\n";
      print_usage(argv[0]);
      return 2;
    }

    cataphract::RulesConfig rules;
    if (!rules_path.empty()) rules = cataphract::load_rules_config_json(cataphract::read_text_file(rules_path));

    if (has_flag(argc, argv, "--dump-rules")) {
      std::cout << cataphract::json::stringify(cataphract::rules_config_to_json(rules), 2) << "\n";
      return 0;
    }

    cataphract::EngineConfig cfg;
    cfg.allow_fixed_rolls = !has_flag(argc, argv, "--no-fixed-rolls");

    cataphract::ScenarioIds ids;
    cataphract::Campaign campaign = cataphract::make_demo_campaign(seed, rules, &ids);
    const auto opening = cataphract::make_demo_orders(campaign, ids);
    cataphract::CampaignEngine engine(std::move(campaign), rules, cfg);

    if (!has_flag(argc, argv, "--no-demo-orders")) {
      for (const auto& req : opening) {
        const cataphract::Order o = engine.submit_order(req);
        cataphract::log::debug("Demo order " + cataphract::order_to_string(o));
      }
    }

    int rejected = 0;
    if (!orders_path.empty()) rejected = submit_orders_file(engine, orders_path);

    const cataphract::CampaignSnapshot snap = engine.advance(days);

    if (quiet) {
      std::cout << cataphract::digest64_to_hex(snap.digest) << "\n";
    } else {
      print_summary(snap);
      std::cout << "Digest: " << cataphract::digest64_to_hex(snap.digest) << "\n";
    }

    if (has_flag(argc, argv, "--list-orders")) {
      std::cout << "\n";
      for (cataphract::Id id : cataphract::util::sorted_keys(snap.campaign.orders)) {
        std::cout << cataphract::order_to_string(snap.campaign.orders.at(id)) << "\n";
      }
    }

    const auto entries = engine.get_audit_log(cataphract::parse_tick_stamp(audit_since));
    if (!audit_csv_path.empty()) {
      cataphract::write_text_file(audit_csv_path, cataphract::audit_to_csv(entries));
      if (!quiet) std::cout << "Wrote audit CSV to " << audit_csv_path << "\n";
    }
    if (!audit_json_path.empty()) {
      cataphract::write_text_file(audit_json_path, cataphract::audit_to_json(entries));
      if (!quiet) std::cout << "Wrote audit JSON to " << audit_json_path << "\n";
    }
    if (!audit_jsonl_path.empty()) {
      cataphract::write_text_file(audit_jsonl_path, cataphract::audit_to_jsonl(entries));
      if (!quiet) std::cout << "Wrote audit JSONL to " << audit_jsonl_path << "\n";
    }

    return rejected > 0 ? 1 : 0;
  } catch (const std::exception& e) {
    cataphract::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
