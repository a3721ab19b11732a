#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "partplan/core/bom_explosion.h"
#include "partplan/core/date.h"
#include "partplan/core/entities.h"
#include "partplan/core/order_reconcile.h"
#include "partplan/core/plan_config.h"
#include "partplan/core/report.h"
#include "partplan/core/schedule_ingest.h"
#include "partplan/core/work_calendar.h"

namespace partplan {

// Fully materialized snapshots for one planning run. Part keys in every table
// are already normalized (the loader does this).
struct PlanInputs {
  // Snapshot date recorded by the extractor, if any.
  std::optional<Date> as_of;

  // Parent plan, either as the raw day-column schedule, as explicit entries, or
  // both (they are concatenated).
  std::vector<ScheduleRow> schedule;
  std::vector<ProductionPlanEntry> plan;

  std::vector<BomLine> bom;
  std::vector<PartMaster> parts;

  std::vector<OnHandStockLine> stock;
  std::vector<PartQuantity> shelf_theory;
  std::vector<PartQuantity> external_stock;

  std::vector<CalendarEntry> calendar;

  std::vector<OpenManufacturingOrder> mfg_orders;
  std::vector<MaterialPurchaseLine> purchase_lines;
  std::vector<MaterialReceiptLine> receipts;
};

struct PlanStats {
  ScheduleIngestStats schedule;
  int plan_entries{0};
  int plan_entries_dropped{0};
  ExplosionStats explosion;
  int demand_out_of_horizon{0};
  int universe_parts{0};
  // Child parts with demand that aren't in the part master.
  int demand_parts_outside_universe{0};
  int foreign_warehouse_lines{0};
  ReconcileStats reconcile;
  int workdays{0};
  int report_rows{0};
};

struct PlanResult {
  Date today;
  std::vector<PartMaster> universe;
  DemandTable demand;
  WorkCalendar calendar;
  std::unordered_map<std::string, ReconcileResult> reconciled;
  Report report;
  PlanStats stats;
};

// Merges duplicate master rows per key (first non-empty id/name/warehouse,
// union of routing steps) and applies cfg.routing_steps. With an empty master,
// every part in `demand` forms the universe. Sorted by key.
std::vector<PartMaster> build_universe(const std::vector<PartMaster>& parts, const PlanConfig& cfg,
                                       const DemandTable& demand);

// Runs the whole pipeline for `today`:
// schedule ingest -> explosion -> densify -> inventory -> reconcile -> report.
// Throws std::runtime_error only for an invalid config; data anomalies are
// absorbed and counted in PlanResult::stats.
PlanResult run_plan(const PlanInputs& in, const PlanConfig& cfg, const Date& today);

// Reconciliation trace for `part` over the same open orders run_plan used.
// A part outside res.universe is traced over every order and flagged.
ReconcileTrace explain_part(const PlanInputs& in, const PlanConfig& cfg, const PlanResult& res,
                            const std::string& part);

// One-line summary of the run for logs.
std::string format_plan_stats(const PlanStats& st);

} // namespace partplan
