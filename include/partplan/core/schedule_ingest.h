#pragma once

#include <optional>
#include <string>
#include <vector>

#include "partplan/core/date.h"
#include "partplan/core/entities.h"

namespace partplan {

// Counters for everything the ingester dropped. Nothing here is an error; the
// schedule sheet routinely carries empty cells and "day 31" columns for
// 30-day months.
struct ScheduleIngestStats {
  int rows_read{0};
  int rows_bad_month{0};
  int rows_outside_horizon{0};
  int rows_missing_parent{0};
  int cells_non_positive{0};
  int cells_bad_day{0};
  int cells_outside_horizon{0};
};

struct ScheduleIngestResult {
  std::vector<ProductionPlanEntry> entries;
  ScheduleIngestStats stats;
};

struct YearMonth {
  int year{0};
  int month{0};
};

// "2025/10", "2025-10", "2025/1" -> {2025, 10}. nullopt if malformed.
std::optional<YearMonth> parse_year_month(const std::string& s);

// Day-of-month from a day column name: the trailing digit run, so "計01",
// "01" and "day 7" all work. nullopt if the name has no trailing digits or the
// number is outside 1..31.
std::optional<int> parse_day_column(const std::string& name);

// True if any day of the month falls inside [first, last].
bool month_overlaps(const YearMonth& ym, const Date& first, const Date& last);

// Converts the day-as-column schedule into (parent, date, qty) entries
// restricted to [today, today + horizon_days]. Cells with a non-positive
// quantity or a day that doesn't exist in the month are dropped.
ScheduleIngestResult ingest_schedule(const std::vector<ScheduleRow>& rows, const Date& today, int horizon_days);

// Keeps plan entries with a positive quantity inside [today, today + horizon_days].
// Returns how many entries were removed.
int restrict_plan_to_horizon(std::vector<ProductionPlanEntry>& plan, const Date& today, int horizon_days);

} // namespace partplan
