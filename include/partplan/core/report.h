#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "partplan/core/bom_explosion.h"
#include "partplan/core/date.h"
#include "partplan/core/entities.h"
#include "partplan/core/inventory.h"
#include "partplan/core/order_reconcile.h"
#include "partplan/core/plan_config.h"
#include "partplan/core/work_calendar.h"

namespace partplan {

// One line of the shortage report.
struct ReportRow {
  std::string part;
  std::string part_id;
  std::string name;
  // Comma-joined routing step codes.
  std::string routing;
  std::string category;

  double on_hand{0.0};
  double theoretical{0.0};
  double external{0.0};

  std::optional<Date> shortage_date;
  std::optional<Date> due_date;
  double shortage_qty{0.0};

  double backlog{0.0};
  double startable{0.0};
  double horizon_demand{0.0};

  // One value per horizon day, aligned with Report::dates().
  std::vector<double> daily;
};

struct Report {
  Date as_of;
  Date horizon_start;
  int days{0};
  std::vector<ReportRow> rows;

  // Parts evaluated / parts dropped because they never run short.
  int parts_considered{0};
  int parts_without_shortage{0};

  std::vector<Date> dates() const;
};

// Joins per-part results into the report.
//
// - One candidate row per part in `universe`.
// - Parts whose shortage quantity is >= 0 are dropped.
// - due = calendar.back_offset(shortage date, lead_workdays), never before `today`.
// - Rows are sorted by shortage date (missing dates last), then part key.
Report assemble_report(const std::vector<PartMaster>& universe, const DemandTable& demand,
                       const InventoryAggregator& inventory,
                       const std::unordered_map<std::string, ReconcileResult>& reconciled, const WorkCalendar& calendar,
                       const PlanConfig& cfg, const Date& today);

// Category tag for a routing, or "" when it doesn't include the terminal step.
std::string category_for_routing(const std::vector<std::string>& routing_steps, const PlanConfig& cfg);

// Fixed report column names, in output order (day columns follow).
const std::vector<std::string>& report_fixed_columns();

// CSV with a header row. Output ends with a trailing newline.
std::string report_to_csv(const Report& report);

// JSON object: as_of, horizon_start, days, dates, rows[]. Ends with a newline.
std::string report_to_json(const Report& report);

// Child requirements table: part, then one column per horizon day.
std::string demand_table_to_csv(const DemandTable& table);

} // namespace partplan
