#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "partplan/core/planner.h"
#include "partplan/core/serialization.h"
#include "partplan/util/file_io.h"

#define PARTPLAN_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

partplan::Date d(int m, int day) { return partplan::Date::from_ymd(2025, m, day); }

const partplan::ReportRow* find_row(const partplan::Report& r, const std::string& part) {
  for (const auto& row : r.rows) {
    if (row.part == part) return &row;
  }
  return nullptr;
}

} // namespace

int test_planner() {
  using namespace partplan;

  const PlanInputs in = load_plan_inputs_from_json(read_text_file("data/sample_snapshot.json"));
  PARTPLAN_ASSERT(in.as_of == d(10, 1));

  const PlanConfig cfg = plan_config_from_json(read_text_file("data/sample_config.json"));
  const PlanResult res = run_plan(in, cfg, *in.as_of);

  PARTPLAN_ASSERT(res.demand.days == 61);
  PARTPLAN_ASSERT(res.demand.series.size() == 3);
  PARTPLAN_ASSERT(res.universe.size() == 4);
  PARTPLAN_ASSERT(res.stats.foreign_warehouse_lines == 1);
  PARTPLAN_ASSERT(res.stats.schedule.cells_non_positive == 1);
  PARTPLAN_ASSERT(res.stats.plan_entries == 8);
  PARTPLAN_ASSERT(res.report.rows.size() == 3);
  PARTPLAN_ASSERT(res.stats.report_rows == 3);

  // Negative stock with no demand comes first, then by shortage date.
  PARTPLAN_ASSERT(res.report.rows[0].part == "C-4");
  PARTPLAN_ASSERT(res.report.rows[1].part == "C-1");
  PARTPLAN_ASSERT(res.report.rows[2].part == "C-3");

  const ReportRow* c1 = find_row(res.report, "C-1");
  PARTPLAN_ASSERT(c1 != nullptr);
  PARTPLAN_ASSERT(c1->on_hand == 30.0);
  PARTPLAN_ASSERT(c1->theoretical == 5.0);
  PARTPLAN_ASSERT(c1->horizon_demand == 274.0);
  PARTPLAN_ASSERT(c1->shortage_date == d(10, 3));
  PARTPLAN_ASSERT(c1->shortage_qty == -239.0);
  // Five workdays before Oct 3 is Sep 26, which is before today.
  PARTPLAN_ASSERT(c1->due_date == d(10, 1));
  PARTPLAN_ASSERT(c1->category == "paint");
  PARTPLAN_ASSERT(c1->backlog == 60.0);
  PARTPLAN_ASSERT(c1->startable == 30.0);

  const ReportRow* c3 = find_row(res.report, "C-3");
  PARTPLAN_ASSERT(c3 != nullptr);
  PARTPLAN_ASSERT(c3->shortage_date == d(10, 6));
  PARTPLAN_ASSERT(c3->shortage_qty == -8.0);
  PARTPLAN_ASSERT(c3->startable == 20.0);

  PARTPLAN_ASSERT(find_row(res.report, "C-2") == nullptr);

  // Shorter lead time: due dates land on real workdays ahead of the shortage.
  {
    PlanConfig short_lead = cfg;
    short_lead.lead_workdays = 1;
    const PlanResult r = run_plan(in, short_lead, *in.as_of);
    PARTPLAN_ASSERT(find_row(r.report, "C-1")->due_date == d(10, 2));
    PARTPLAN_ASSERT(find_row(r.report, "C-3")->due_date == d(10, 3));
    for (const auto& row : r.report.rows) PARTPLAN_ASSERT(r.calendar.is_workday(*row.due_date));
  }

  // Routing filter narrows the universe; orders outside it are ignored.
  {
    PlanConfig painted = cfg;
    painted.routing_steps = {"050"};
    const PlanResult r = run_plan(in, painted, *in.as_of);
    PARTPLAN_ASSERT(r.universe.size() == 2);
    PARTPLAN_ASSERT(r.report.rows.size() == 2);
    PARTPLAN_ASSERT(find_row(r.report, "C-4") == nullptr);
    PARTPLAN_ASSERT(r.stats.demand_parts_outside_universe == 1);
  }

  // Explaining a planned part reproduces its report figures.
  {
    const ReconcileTrace t = explain_part(in, cfg, res, " C-1 ");
    PARTPLAN_ASSERT(!t.outside_universe);
    PARTPLAN_ASSERT(t.part == "C-1");
    PARTPLAN_ASSERT(t.result.backlog == c1->backlog);
    PARTPLAN_ASSERT(t.result.startable == c1->startable);
  }

  // A part outside the master is flagged, and its orders never reach the report.
  {
    PlanInputs extra = in;
    OpenManufacturingOrder o;
    o.order_id = "B77";
    o.line_id = "1";
    o.part = "Z-9";
    o.ordered_qty = 12.0;
    o.status = 2;
    extra.mfg_orders.push_back(o);
    const PlanResult r = run_plan(extra, cfg, *extra.as_of);
    PARTPLAN_ASSERT(r.reconciled.count("Z-9") == 0);

    const ReconcileTrace t = explain_part(extra, cfg, r, "Z-9");
    PARTPLAN_ASSERT(t.outside_universe);
    PARTPLAN_ASSERT(t.result.backlog == 12.0);
    PARTPLAN_ASSERT(format_reconcile_trace(t).find("not in the planning universe") != std::string::npos);
  }

  // Later planning date: the October schedule mostly falls behind today.
  {
    const PlanResult r = run_plan(in, cfg, d(11, 4));
    PARTPLAN_ASSERT(r.report.as_of == d(11, 4));
    const ReportRow* late = find_row(r.report, "C-1");
    PARTPLAN_ASSERT(late != nullptr);
    // Only the Nov 20 build (60) remains against 35.
    PARTPLAN_ASSERT(late->horizon_demand == 60.0);
    PARTPLAN_ASSERT(late->shortage_date == d(11, 20));
    PARTPLAN_ASSERT(late->due_date == d(11, 13));
  }

  // No part master: the universe is whatever has demand.
  {
    PlanInputs bare = in;
    bare.parts.clear();
    const auto universe = build_universe(bare.parts, cfg, res.demand);
    PARTPLAN_ASSERT(universe.size() == 3);
    PARTPLAN_ASSERT(universe[0].key == "C-1");
  }

  // Duplicate master rows merge.
  {
    PartMaster a;
    a.key = "X";
    a.routing_steps = {"050"};
    PartMaster b;
    b.key = "X";
    b.name = "Bracket";
    b.routing_steps = {"041", "050"};
    const auto universe = build_universe({a, b}, PlanConfig{}, DemandTable{});
    PARTPLAN_ASSERT(universe.size() == 1);
    PARTPLAN_ASSERT(universe[0].name == "Bracket");
    PARTPLAN_ASSERT(universe[0].routing_steps == (std::vector<std::string>{"041", "050"}));
  }

  // Nothing to plan is not an error.
  {
    const PlanResult r = run_plan(PlanInputs{}, PlanConfig{}, d(10, 1));
    PARTPLAN_ASSERT(r.report.rows.empty());
    PARTPLAN_ASSERT(r.demand.days == 61);
  }

  // Invalid config is.
  {
    PlanConfig bad;
    bad.horizon_days = -5;
    bool threw = false;
    try {
      (void)run_plan(in, bad, d(10, 1));
    } catch (const std::runtime_error&) {
      threw = true;
    }
    PARTPLAN_ASSERT(threw);
  }

  PARTPLAN_ASSERT(!format_plan_stats(res.stats).empty());
  return 0;
}
