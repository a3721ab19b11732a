#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "partplan/core/entities.h"
#include "partplan/core/plan_config.h"

namespace partplan {

// Per-part supply figures from three independent sources. No netting happens
// here; a part missing from a source contributes 0 from that source.
class InventoryAggregator {
 public:
  InventoryAggregator() = default;

  // `home_warehouse` maps part key -> the warehouse its on-hand stock is
  // booked in. On-hand lines for a part with a home warehouse only count when
  // their warehouse matches; parts without one count every warehouse.
  InventoryAggregator(const std::vector<OnHandStockLine>& on_hand, const std::vector<PartQuantity>& theoretical,
                      const std::vector<PartQuantity>& external,
                      const std::unordered_map<std::string, std::string>& home_warehouse = {});

  double on_hand(const std::string& part) const;
  double theoretical(const std::string& part) const;
  double external(const std::string& part) const;

  double total_available(const std::string& part) const;

  // Supply used for shortage netting under `basis`.
  double available(const std::string& part, AvailabilityBasis basis) const;

  // On-hand lines skipped because their warehouse wasn't the part's home.
  int foreign_warehouse_lines() const { return foreign_warehouse_lines_; }

 private:
  std::unordered_map<std::string, double> on_hand_;
  std::unordered_map<std::string, double> theoretical_;
  std::unordered_map<std::string, double> external_;
  int foreign_warehouse_lines_{0};
};

} // namespace partplan
