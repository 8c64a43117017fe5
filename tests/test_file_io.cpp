#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "cataphract/core/rules_config.h"
#include "cataphract/util/file_io.h"

#define CATA_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_file_io() {
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::path dir = fs::temp_directory_path(ec);
  if (ec || dir.empty()) dir = fs::path(".");

  const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
  dir /= "cataphract_test_file_io";
  dir /= std::to_string(static_cast<long long>(nonce));

  // Parent directories are created on demand.
  const fs::path target = dir / "exports" / "audit.csv";
  cataphract::write_text_file(target.string(), "seq,day\n");
  CATA_ASSERT(cataphract::read_text_file(target.string()) == "seq,day\n");

  cataphract::write_text_file(target.string(), "seq,day,part\n");
  CATA_ASSERT(cataphract::read_text_file(target.string()) == "seq,day,part\n");

  // No temp siblings are left behind.
  const std::string tmp_prefix = target.filename().string() + ".tmp";
  for (const auto& entry : fs::directory_iterator(target.parent_path())) {
    const std::string name = entry.path().filename().string();
    CATA_ASSERT(name.rfind(tmp_prefix, 0) != 0);
  }

  // A rules overlay read back from disk.
  const fs::path rules_path = dir / "rules.json";
  cataphract::write_text_file(rules_path.string(), "{\"siege\": {\"fortress_threshold\": 100}}\n");
  const cataphract::RulesConfig rules =
      cataphract::load_rules_config_json(cataphract::read_text_file(rules_path.string()));
  CATA_ASSERT(rules.siege.fortress_threshold == 100);
  CATA_ASSERT(rules.siege.town_threshold == 40);

  bool threw = false;
  try {
    (void)cataphract::read_text_file((dir / "missing.json").string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  CATA_ASSERT(threw);

  fs::remove_all(dir, ec);
  return 0;
}
