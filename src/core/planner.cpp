#include "partplan/core/planner.h"

#include <algorithm>
#include <map>
#include <sstream>
#include <unordered_set>

#include "partplan/core/inventory.h"
#include "partplan/core/part_key.h"
#include "partplan/util/log.h"

namespace partplan {
namespace {

std::vector<std::string> sorted_unique(std::vector<std::string> v) {
  std::sort(v.begin(), v.end());
  v.erase(std::unique(v.begin(), v.end()), v.end());
  return v;
}

ReconcileOptions reconcile_options(const PlanConfig& cfg) {
  ReconcileOptions opt;
  opt.open_status_threshold = cfg.order_status_open_threshold;
  opt.receipt_key_includes_order = cfg.receipt_key_includes_order;
  return opt;
}

bool in_universe(const std::vector<PartMaster>& universe, const std::string& key) {
  return std::any_of(universe.begin(), universe.end(), [&](const PartMaster& p) { return p.key == key; });
}

} // namespace

std::vector<PartMaster> build_universe(const std::vector<PartMaster>& parts, const PlanConfig& cfg,
                                       const DemandTable& demand) {
  std::vector<PartMaster> out;

  if (parts.empty()) {
    out.reserve(demand.series.size());
    for (const auto& s : demand.series) {
      PartMaster pm;
      pm.key = s.part;
      pm.raw_id = s.part;
      out.push_back(std::move(pm));
    }
    return out;
  }

  std::map<std::string, PartMaster> merged;
  for (const auto& p : parts) {
    if (p.key.empty()) continue;
    auto [it, inserted] = merged.try_emplace(p.key, p);
    if (inserted) continue;

    PartMaster& m = it->second;
    if (m.raw_id.empty()) m.raw_id = p.raw_id;
    if (m.name.empty()) m.name = p.name;
    if (m.warehouse.empty()) m.warehouse = p.warehouse;
    m.routing_steps.insert(m.routing_steps.end(), p.routing_steps.begin(), p.routing_steps.end());
  }

  const std::unordered_set<std::string> step_filter(cfg.routing_steps.begin(), cfg.routing_steps.end());
  out.reserve(merged.size());
  for (auto& entry : merged) {
    PartMaster& m = entry.second;
    std::vector<std::string> steps = sorted_unique(std::move(m.routing_steps));
    if (!step_filter.empty()) {
      steps.erase(std::remove_if(steps.begin(), steps.end(),
                                 [&](const std::string& s) { return step_filter.count(s) == 0; }),
                  steps.end());
      if (steps.empty()) continue;
    }
    m.routing_steps = std::move(steps);
    out.push_back(std::move(m));
  }
  return out;
}

PlanResult run_plan(const PlanInputs& in, const PlanConfig& cfg, const Date& today) {
  validate_plan_config(cfg);

  PlanResult res;
  res.today = today;
  PlanStats& st = res.stats;

  // Parent plan.
  ScheduleIngestResult ingested = ingest_schedule(in.schedule, today, cfg.horizon_days);
  st.schedule = ingested.stats;

  std::vector<ProductionPlanEntry> plan = in.plan;
  st.plan_entries_dropped = restrict_plan_to_horizon(plan, today, cfg.horizon_days);
  plan.insert(plan.end(), ingested.entries.begin(), ingested.entries.end());
  st.plan_entries = static_cast<int>(plan.size());
  if (plan.empty()) log::warn("No production plan entries inside the horizon; no demand will be generated");

  // Child demand.
  const BomIndex bom(in.bom);
  if (bom.parent_count() == 0) log::warn("BOM is empty; no demand will be generated");
  const auto exploded = explode(plan, bom, &st.explosion);
  res.demand = densify(exploded, today, cfg.horizon_days);
  st.demand_out_of_horizon = res.demand.dropped_out_of_horizon;

  // Planning universe.
  res.universe = build_universe(in.parts, cfg, res.demand);
  st.universe_parts = static_cast<int>(res.universe.size());

  std::unordered_set<std::string> universe_keys;
  std::unordered_map<std::string, std::string> home_warehouse;
  for (const auto& p : res.universe) {
    universe_keys.insert(p.key);
    const std::string wh = normalize_part_key(p.warehouse);
    if (!wh.empty()) home_warehouse.emplace(p.key, wh);
  }
  for (const auto& s : res.demand.series) {
    if (universe_keys.count(s.part) == 0) ++st.demand_parts_outside_universe;
  }
  if (st.demand_parts_outside_universe > 0) {
    log::debug(std::to_string(st.demand_parts_outside_universe) + " child parts with demand are outside the part master");
  }

  // Supply.
  const InventoryAggregator inventory(in.stock, in.shelf_theory, in.external_stock, home_warehouse);
  st.foreign_warehouse_lines = inventory.foreign_warehouse_lines();

  // Workdays.
  res.calendar = WorkCalendar::from_entries(in.calendar);
  st.workdays = static_cast<int>(res.calendar.size());
  if (res.calendar.empty()) log::warn("Work calendar is empty; due dates will equal shortage dates");

  // Open orders vs. material.
  std::vector<OpenManufacturingOrder> orders;
  orders.reserve(in.mfg_orders.size());
  for (const auto& o : in.mfg_orders) {
    if (universe_keys.count(o.part) != 0) orders.push_back(o);
  }
  res.reconciled = reconcile(orders, in.purchase_lines, in.receipts, reconcile_options(cfg), &st.reconcile);

  res.report = assemble_report(res.universe, res.demand, inventory, res.reconciled, res.calendar, cfg, today);
  st.report_rows = static_cast<int>(res.report.rows.size());

  log::info(format_plan_stats(st));
  return res;
}

ReconcileTrace explain_part(const PlanInputs& in, const PlanConfig& cfg, const PlanResult& res,
                            const std::string& part) {
  const std::string key = normalize_part_key(part);
  if (!in_universe(res.universe, key)) {
    ReconcileTrace trace = trace_reconcile(key, in.mfg_orders, in.purchase_lines, in.receipts, reconcile_options(cfg));
    trace.outside_universe = true;
    return trace;
  }

  std::vector<OpenManufacturingOrder> orders;
  for (const auto& o : in.mfg_orders) {
    if (o.part == key) orders.push_back(o);
  }
  return trace_reconcile(key, orders, in.purchase_lines, in.receipts, reconcile_options(cfg));
}

std::string format_plan_stats(const PlanStats& st) {
  std::ostringstream ss;
  ss << "plan entries " << st.plan_entries << " (dropped " << st.plan_entries_dropped + st.schedule.cells_bad_day
     << "), demand records " << st.explosion.demand_records << ", parts " << st.universe_parts
     << ", open order lines " << st.reconcile.orders_open << ", workdays " << st.workdays << ", shortages "
     << st.report_rows;
  return ss.str();
}

} // namespace partplan
