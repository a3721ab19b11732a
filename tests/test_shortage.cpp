#include <cstdint>
#include <iostream>
#include <optional>
#include <vector>

#include "partplan/core/shortage.h"

#define PARTPLAN_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

std::vector<partplan::DailyQty> series(const partplan::Date& start, const std::vector<double>& qty) {
  std::vector<partplan::DailyQty> out;
  for (std::size_t i = 0; i < qty.size(); ++i) {
    out.push_back(partplan::DailyQty{start.add_days(static_cast<std::int64_t>(i)), qty[i]});
  }
  return out;
}

} // namespace

int test_shortage() {
  using namespace partplan;

  const Date d0 = Date::from_ymd(2025, 3, 1);

  // 100 available against 40/day: short on day 3, 20 units down.
  {
    const auto r = detect_shortage(100.0, series(d0, {40.0, 40.0, 40.0}));
    PARTPLAN_ASSERT(r.date == d0.add_days(2));
    PARTPLAN_ASSERT(r.qty == -20.0);
    PARTPLAN_ASSERT(r.is_short());
  }

  // Exactly used up counts as the shortage day, but qty 0 isn't short.
  {
    const auto r = detect_shortage(80.0, series(d0, {40.0, 40.0, 0.0}));
    PARTPLAN_ASSERT(r.date == d0.add_days(1));
    PARTPLAN_ASSERT(r.qty == 0.0);
    PARTPLAN_ASSERT(!r.is_short());
  }

  // Enough stock: no date, positive remainder.
  {
    const auto r = detect_shortage(500.0, series(d0, {40.0, 40.0, 40.0}));
    PARTPLAN_ASSERT(!r.date);
    PARTPLAN_ASSERT(r.qty == 380.0);
  }

  // Negative stock with no demand is short from day one.
  {
    const auto r = detect_shortage(-3.0, series(d0, {0.0, 0.0}));
    PARTPLAN_ASSERT(r.date == d0);
    PARTPLAN_ASSERT(r.qty == -3.0);
  }

  // The date is the first crossing, qty the end-of-horizon total.
  {
    const auto r = detect_shortage(10.0, series(d0, {0.0, 10.0, 0.0, 25.0}));
    PARTPLAN_ASSERT(r.date == d0.add_days(1));
    PARTPLAN_ASSERT(r.qty == -25.0);
  }

  // Empty horizon.
  {
    const auto r = detect_shortage(0.0, std::vector<DailyQty>{});
    PARTPLAN_ASSERT(!r.date);
    PARTPLAN_ASSERT(r.qty == 0.0);
  }

  // Dense-series overload agrees with the pair-list form.
  {
    const DemandSeries s{"C1", {40.0, 40.0, 40.0}};
    const auto r = detect_shortage(100.0, d0, s);
    PARTPLAN_ASSERT(r.date == d0.add_days(2));
    PARTPLAN_ASSERT(r.qty == -20.0);
  }

  // Raising supply never moves the shortage date earlier.
  {
    const auto demand = series(d0, {5.0, 0.0, 12.0, 3.0, 9.0, 1.0});
    std::optional<Date> prev = detect_shortage(0.0, demand).date;
    for (double avail = 1.0; avail <= 40.0; avail += 1.0) {
      const auto r = detect_shortage(avail, demand);
      if (prev && r.date) PARTPLAN_ASSERT(*r.date >= *prev);
      if (!prev) PARTPLAN_ASSERT(!r.date);
      prev = r.date;
    }
  }

  return 0;
}
