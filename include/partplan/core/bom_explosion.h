#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "partplan/core/date.h"
#include "partplan/core/entities.h"

namespace partplan {

// Single-level BOM grouped by parent key.
class BomIndex {
 public:
  BomIndex() = default;
  explicit BomIndex(const std::vector<BomLine>& lines);

  // Child lines for `parent`; empty when the parent has no BOM.
  const std::vector<BomLine>& children_of(const std::string& parent) const;

  bool has_parent(const std::string& parent) const { return by_parent_.count(parent) != 0; }
  std::size_t parent_count() const { return by_parent_.size(); }
  std::size_t line_count() const { return line_count_; }

 private:
  std::unordered_map<std::string, std::vector<BomLine>> by_parent_;
  std::size_t line_count_{0};
};

struct ExplosionStats {
  int plan_entries{0};
  // Plan entries whose parent has no BOM lines (no demand generated).
  int parents_without_bom{0};
  int demand_records{0};
};

// Explodes plan entries through one BOM level.
//
// quantity = per_unit_qty * plan quantity, summed per (child, date). The result
// is sorted by (child, date) and holds one record per pair.
std::vector<ChildDemandEntry> explode(const std::vector<ProductionPlanEntry>& plan, const BomIndex& bom,
                                      ExplosionStats* stats = nullptr);

std::vector<ChildDemandEntry> explode(const std::vector<ProductionPlanEntry>& plan, const std::vector<BomLine>& bom);

// Dense daily demand for one child part over the horizon.
struct DemandSeries {
  std::string part;
  // qty[i] is the demand on start + i days.
  std::vector<double> qty;

  double total() const;
};

// Daily demand for every child over [start, start + days - 1].
struct DemandTable {
  Date start;
  int days{0};
  // Sorted by part key.
  std::vector<DemandSeries> series;
  // Demand records that fell outside the horizon and were discarded.
  int dropped_out_of_horizon{0};

  Date date_at(int i) const { return start.add_days(i); }

  // Null when the part has no series.
  const DemandSeries* find(const std::string& part) const;

  // The part's series as (date, qty) pairs; all zeros when the part has none.
  std::vector<DailyQty> daily_for(const std::string& part) const;
};

// Densifies aggregated child demand over [today, today + horizon_days]: every
// child that appears in `entries` gets exactly horizon_days + 1 values in
// ascending date order, zero where nothing is required.
DemandTable densify(const std::vector<ChildDemandEntry>& entries, const Date& today, int horizon_days);

} // namespace partplan
