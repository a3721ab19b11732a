#include "partplan/core/inventory.h"

#include "partplan/core/part_key.h"
#include "partplan/util/lookup.h"

namespace partplan {

InventoryAggregator::InventoryAggregator(const std::vector<OnHandStockLine>& on_hand,
                                         const std::vector<PartQuantity>& theoretical,
                                         const std::vector<PartQuantity>& external,
                                         const std::unordered_map<std::string, std::string>& home_warehouse) {
  for (const auto& line : on_hand) {
    if (line.part.empty()) continue;
    const std::string& home = util::find_or_empty(home_warehouse, line.part);
    if (!home.empty() && normalize_part_key(line.warehouse) != home) {
      ++foreign_warehouse_lines_;
      continue;
    }
    util::accumulate(on_hand_, line.part, line.qty);
  }
  for (const auto& q : theoretical) {
    if (!q.part.empty()) util::accumulate(theoretical_, q.part, q.qty);
  }
  for (const auto& q : external) {
    if (!q.part.empty()) util::accumulate(external_, q.part, q.qty);
  }
}

double InventoryAggregator::on_hand(const std::string& part) const { return util::value_or_zero(on_hand_, part); }

double InventoryAggregator::theoretical(const std::string& part) const {
  return util::value_or_zero(theoretical_, part);
}

double InventoryAggregator::external(const std::string& part) const { return util::value_or_zero(external_, part); }

double InventoryAggregator::total_available(const std::string& part) const {
  return on_hand(part) + theoretical(part) + external(part);
}

double InventoryAggregator::available(const std::string& part, AvailabilityBasis basis) const {
  switch (basis) {
    case AvailabilityBasis::OnHandOnly: return on_hand(part);
    case AvailabilityBasis::All: break;
  }
  return total_available(part);
}

} // namespace partplan
