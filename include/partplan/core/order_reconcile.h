#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "partplan/core/entities.h"

namespace partplan {

struct ReconcileOptions {
  // Manufacturing order lines are open while status < this value.
  int open_status_threshold{6};

  // Aggregate receipts per (order, po, release) instead of (po, release).
  bool receipt_key_includes_order{false};
};

// Startable-quantity breakdown for one part.
//
//   A = sum of open backlog over the part's order lines
//   B = sum of purchase-line ordered qty, each (order, po, release) once
//   C = sum of receipts against those purchase lines
//   startable = max(0, A - (B - C))
struct ReconcileResult {
  std::string part;
  double backlog{0.0};
  double purchase_ordered{0.0};
  double received{0.0};
  double startable{0.0};
  int open_lines{0};
  // Distinct purchase lines matched to the part's open order lines.
  int matched_purchase_lines{0};

  double unfulfilled_material() const { return purchase_ordered - received; }
  bool has_material_tracking() const { return matched_purchase_lines > 0; }
};

struct ReconcileStats {
  int orders_read{0};
  int orders_open{0};
  int purchase_lines{0};
  int receipt_rows{0};
  // Distinct (po, release[, order]) receipt keys after pre-aggregation.
  int receipt_keys{0};
  // Line numbers that failed to parse and were mapped to the sentinel.
  int sentinel_order_lines{0};
  int sentinel_purchase_lines{0};
  // Extra matches collapsed by the (order, po, release) dedup.
  int duplicate_purchase_matches{0};
  // Receipt totals reached again through another purchase line of the same part.
  int shared_receipt_keys{0};
};

// Nets open manufacturing backlog against outstanding material purchases.
//
// Order lines join purchase lines on (canonical order key, canonical line key);
// purchase lines join pre-aggregated receipts on (po, release). A part with no
// purchase match at all gets startable = max(0, A). Only parts with at least
// one open order line appear in the result.
std::unordered_map<std::string, ReconcileResult> reconcile(const std::vector<OpenManufacturingOrder>& orders,
                                                           const std::vector<MaterialPurchaseLine>& purchases,
                                                           const std::vector<MaterialReceiptLine>& receipts,
                                                           const ReconcileOptions& opt = {},
                                                           ReconcileStats* stats = nullptr);

// part -> startable quantity.
std::unordered_map<std::string, double> startable_by_part(const std::vector<OpenManufacturingOrder>& orders,
                                                          const std::vector<MaterialPurchaseLine>& purchases,
                                                          const std::vector<MaterialReceiptLine>& receipts,
                                                          const ReconcileOptions& opt = {});

// One row of the order -> purchase -> receipt left join for a single part.
struct ReconcileTraceRow {
  std::string order_key;
  std::string line_key;
  double backlog{0.0};
  bool matched{false};
  std::string po_number;
  std::string release_number;
  double purchase_ordered{0.0};
  // Receipts against (po, release) after pre-aggregation.
  double received{0.0};
  // Raw receipt rows behind `received`.
  int receipt_rows{0};
};

// Diagnostic view of how a part's startable quantity was reached, including
// what a naive three-way join (no dedup, no receipt pre-aggregation) would
// have produced.
struct ReconcileTrace {
  std::string part;
  std::vector<ReconcileTraceRow> rows;
  ReconcileResult result;

  double naive_purchase_ordered{0.0};
  double naive_startable{0.0};
  int unmatched_lines{0};
  // Set when the part isn't planned, so the report never uses these figures.
  bool outside_universe{false};
};

ReconcileTrace trace_reconcile(const std::string& part, const std::vector<OpenManufacturingOrder>& orders,
                               const std::vector<MaterialPurchaseLine>& purchases,
                               const std::vector<MaterialReceiptLine>& receipts, const ReconcileOptions& opt = {});

// Multi-line human-readable rendering of a trace (CLI --explain).
std::string format_reconcile_trace(const ReconcileTrace& trace);

} // namespace partplan
