#include "partplan/util/log.h"

#include <iostream>
#include <mutex>

#include "partplan/util/strings.h"

namespace partplan::log {
namespace {
std::mutex g_mu;
Level g_level = Level::Info;

const char* label(Level l) {
  switch (l) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    default: return "";
  }
}

void emit(Level l, const std::string& msg) {
  std::lock_guard<std::mutex> lock(g_mu);
  if (g_level == Level::Off || l < g_level) return;
  std::cerr << "[" << label(l) << "] " << msg << "\n";
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

bool parse_level(const std::string& s, Level& out) {
  const std::string t = to_lower(trim_copy(s));
  if (t == "debug") {
    out = Level::Debug;
  } else if (t == "info") {
    out = Level::Info;
  } else if (t == "warn" || t == "warning") {
    out = Level::Warn;
  } else if (t == "error" || t == "err") {
    out = Level::Error;
  } else if (t == "off" || t == "none") {
    out = Level::Off;
  } else {
    return false;
  }
  return true;
}

void debug(const std::string& msg) { emit(Level::Debug, msg); }
void info(const std::string& msg) { emit(Level::Info, msg); }
void warn(const std::string& msg) { emit(Level::Warn, msg); }
void error(const std::string& msg) { emit(Level::Error, msg); }

} // namespace partplan::log
