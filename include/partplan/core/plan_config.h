#pragma once

#include <string>
#include <vector>

namespace partplan {

// Which stock sources count as supply when netting demand.
enum class AvailabilityBasis {
  // On-hand + theoretical shelf count + external warehouse.
  All,
  // On-hand ERP stock only (how the plant sheet was computed historically).
  OnHandOnly,
};

struct PlanConfig {
  // Demand horizon in days. The horizon covers [today, today + horizon_days],
  // so a 60 day horizon produces 61 daily buckets.
  int horizon_days{60};

  // Workdays between the order due date and the shortage date.
  int lead_workdays{5};

  // Manufacturing orders are open while status < this value.
  int order_status_open_threshold{6};

  // A part whose routing includes this step gets `terminal_step_tag` in the
  // category column. Empty disables tagging.
  std::string terminal_step_code{"050"};
  std::string terminal_step_tag{"paint"};

  AvailabilityBasis availability_basis{AvailabilityBasis::All};

  // When non-empty, only parts routed through at least one of these steps are
  // part of the planning universe.
  std::vector<std::string> routing_steps;

  // Calendar entries whose day_type equals this are workdays; other day types
  // are shutdown days. Entries that carry an explicit "shutdown" flag ignore it.
  std::string workday_type{"MPS"};

  // Aggregate receipts per (order, po, release) instead of (po, release).
  bool receipt_key_includes_order{false};
};

// Throws std::runtime_error for values the engine can't run with (negative
// horizon or lead time).
void validate_plan_config(const PlanConfig& cfg);

const char* availability_basis_to_string(AvailabilityBasis b);

// Accepts "all" and "on_hand". Returns false on anything else.
bool availability_basis_from_string(const std::string& s, AvailabilityBasis& out);

} // namespace partplan
