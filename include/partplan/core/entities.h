#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "partplan/core/date.h"

namespace partplan {

// Part keys below are always normalize_part_key() output.

// "Build `quantity` units of `parent` on `date`."
struct ProductionPlanEntry {
  std::string parent;
  Date date;
  double quantity{0.0};
};

// One row of the external assembly schedule: a parent part and one quantity
// cell per day-of-month column ("計01".."計31") for a "YYYY/MM" month.
struct ScheduleRow {
  std::string year_month;
  std::string parent;
  std::vector<std::pair<std::string, double>> cells;
};

struct BomLine {
  std::string parent;
  std::string child;
  double per_unit_qty{0.0};
};

struct ChildDemandEntry {
  std::string child;
  Date date;
  double quantity{0.0};
};

// One day of a demand series.
struct DailyQty {
  Date date;
  double qty{0.0};
};

// Item master row for a part in the planning universe.
struct PartMaster {
  std::string key;
  std::string raw_id;
  std::string name;
  std::string warehouse;
  // Sorted, unique routing step (work center) codes.
  std::vector<std::string> routing_steps;
};

struct OnHandStockLine {
  std::string part;
  std::string warehouse;
  double qty{0.0};
};

// Single-source keyed quantity (theoretical shelf count, external warehouse).
struct PartQuantity {
  std::string part;
  double qty{0.0};
};

struct CalendarEntry {
  Date date;
  bool shutdown{false};
};

// Shop-floor production order line.
struct OpenManufacturingOrder {
  std::string order_id;
  std::string line_id;
  std::string part;
  double ordered_qty{0.0};
  double delivered_qty{0.0};
  int status{0};

  // Not clamped: over-delivered lines go negative.
  double backlog() const { return ordered_qty - delivered_qty; }
};

// Raw-material purchase line raised for a production order operation.
struct MaterialPurchaseLine {
  std::string order_id;
  std::string line_id;
  std::string po_number;
  std::string release_number;
  double ordered_qty{0.0};
};

// One (possibly partial) delivery against a purchase line.
struct MaterialReceiptLine {
  std::string order_id;
  std::string po_number;
  std::string release_number;
  double delivered_qty{0.0};
  std::optional<Date> receipt_date;
};

} // namespace partplan
