#include "cataphract/util/log.h"

#include <iostream>
#include <mutex>

#include "cataphract/util/strings.h"

namespace cataphract::log {
namespace {
std::mutex g_mu;
Level g_level = Level::Info;

const char* const kLabels[] = {"DEBUG", "INFO", "WARN", "ERROR"};

void emit(Level l, const std::string& msg) {
  std::lock_guard<std::mutex> lock(g_mu);
  if (l == Level::Off || g_level == Level::Off || l < g_level) return;
  std::cerr << '[' << kLabels[static_cast<int>(l)] << "] " << msg << '\n';
}

} // namespace

void set_level(Level lvl) {
  std::lock_guard<std::mutex> lock(g_mu);
  g_level = lvl;
}

Level level() {
  std::lock_guard<std::mutex> lock(g_mu);
  return g_level;
}

bool parse_level(const std::string& name, Level* out) {
  const std::string n = to_lower(name);
  Level l;
  if (n == "debug") l = Level::Debug;
  else if (n == "info") l = Level::Info;
  else if (n == "warn" || n == "warning") l = Level::Warn;
  else if (n == "error") l = Level::Error;
  else if (n == "off" || n == "none") l = Level::Off;
  else return false;
  if (out) *out = l;
  return true;
}

void debug(const std::string& msg) { emit(Level::Debug, msg); }
void info(const std::string& msg) { emit(Level::Info, msg); }
void warn(const std::string& msg) { emit(Level::Warn, msg); }
void error(const std::string& msg) { emit(Level::Error, msg); }

} // namespace cataphract::log
