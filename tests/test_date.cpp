#include <ctime>
#include <iostream>
#include <stdexcept>

#include "partplan/core/date.h"

#define PARTPLAN_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_date() {
  using partplan::Date;
  auto d = Date::from_ymd(1970, 1, 1);
  PARTPLAN_ASSERT(d.days_since_epoch() == 0);
  PARTPLAN_ASSERT(d.to_string() == "1970-01-01");

  auto d2 = Date::parse_iso_ymd("2025-12-31");
  auto ymd = d2.to_ymd();
  PARTPLAN_ASSERT(ymd.year == 2025);
  PARTPLAN_ASSERT(ymd.month == 12);
  PARTPLAN_ASSERT(ymd.day == 31);
  PARTPLAN_ASSERT(d2.add_days(1).to_string() == "2026-01-01");
  PARTPLAN_ASSERT(Date::from_ymd(2026, 1, 1).days_since(d2) == 1);

  // Leap years.
  PARTPLAN_ASSERT(partplan::days_in_month(2024, 2) == 29);
  PARTPLAN_ASSERT(partplan::days_in_month(2025, 2) == 28);
  PARTPLAN_ASSERT(partplan::days_in_month(2100, 2) == 28);
  PARTPLAN_ASSERT(partplan::days_in_month(2000, 2) == 29);
  PARTPLAN_ASSERT(partplan::days_in_month(2025, 13) == 0);
  PARTPLAN_ASSERT(Date::from_ymd(2024, 2, 28).add_days(1).to_string() == "2024-02-29");

  // Non-existent days.
  PARTPLAN_ASSERT(!Date::try_from_ymd(2025, 4, 31));
  PARTPLAN_ASSERT(!Date::try_from_ymd(2025, 2, 29));
  PARTPLAN_ASSERT(Date::try_from_ymd(2024, 2, 29).has_value());
  bool threw = false;
  try {
    (void)Date::from_ymd(2025, 11, 31);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  PARTPLAN_ASSERT(threw);

  threw = false;
  try {
    (void)Date::parse_iso_ymd("2025/10/01");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  PARTPLAN_ASSERT(threw);

  // Lenient ingestion forms.
  const auto oct1 = Date::from_ymd(2025, 10, 1);
  PARTPLAN_ASSERT(Date::try_parse("2025-10-01") == oct1);
  PARTPLAN_ASSERT(Date::try_parse("2025/10/01") == oct1);
  PARTPLAN_ASSERT(Date::try_parse("2025-10-01 00:00:00") == oct1);
  PARTPLAN_ASSERT(Date::try_parse("2025-10-01T08:30:00") == oct1);
  PARTPLAN_ASSERT(Date::try_parse("  2025-10-01") == oct1);
  PARTPLAN_ASSERT(!Date::try_parse("2025-10-1"));
  PARTPLAN_ASSERT(!Date::try_parse("2025/10-01"));
  PARTPLAN_ASSERT(!Date::try_parse("2025-02-30"));
  PARTPLAN_ASSERT(!Date::try_parse("2025-10-01x"));
  PARTPLAN_ASSERT(!Date::try_parse(""));

  PARTPLAN_ASSERT(Date::from_ymd(2025, 10, 2) > oct1);
  PARTPLAN_ASSERT(oct1 <= oct1);

  // Local date is the UTC day give or take the zone offset.
  const std::int64_t utc_day = static_cast<std::int64_t>(std::time(nullptr)) / 86400;
  const std::int64_t local_day = Date::local_today().days_since_epoch();
  PARTPLAN_ASSERT(local_day >= utc_day - 1 && local_day <= utc_day + 1);

  return 0;
}
