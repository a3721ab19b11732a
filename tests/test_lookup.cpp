#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

#include "partplan/util/log.h"
#include "partplan/util/lookup.h"

#define PARTPLAN_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_lookup() {
  using namespace partplan;

  std::unordered_map<std::string, double> qty;
  util::accumulate(qty, "C1", 2.5);
  util::accumulate(qty, "C1", 1.5);
  PARTPLAN_ASSERT(util::value_or_zero(qty, "C1") == 4.0);
  PARTPLAN_ASSERT(util::value_or_zero(qty, "C2") == 0.0);
  // Lookups never insert.
  PARTPLAN_ASSERT(qty.size() == 1);

  const std::unordered_map<std::string, std::vector<int>> lines = {{"P1", {1, 2}}};
  PARTPLAN_ASSERT(util::find_or_empty(lines, "P1").size() == 2);
  PARTPLAN_ASSERT(util::find_or_empty(lines, "P2").empty());

  log::Level lvl = log::Level::Info;
  PARTPLAN_ASSERT(log::parse_level("WARNING", lvl) && lvl == log::Level::Warn);
  PARTPLAN_ASSERT(log::parse_level(" debug ", lvl) && lvl == log::Level::Debug);
  PARTPLAN_ASSERT(log::parse_level("off", lvl) && lvl == log::Level::Off);
  PARTPLAN_ASSERT(!log::parse_level("loud", lvl));
  PARTPLAN_ASSERT(lvl == log::Level::Off);

  const log::Level saved = log::level();
  log::set_level(log::Level::Error);
  PARTPLAN_ASSERT(log::level() == log::Level::Error);
  log::set_level(saved);

  return 0;
}
