#include <iostream>
#include <unordered_map>
#include <vector>

#include "partplan/core/inventory.h"

#define PARTPLAN_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_inventory() {
  using namespace partplan;

  const std::vector<OnHandStockLine> on_hand = {
      {"C1", "W1", 30.0},
      {"C1", "W1", 5.0},
      {"C1", "W9", 100.0},
      {"C2", "W9", 7.0},
      {"C3", "W1", -4.0},
      {"", "W1", 99.0},
  };
  const std::vector<PartQuantity> theoretical = {{"C1", 2.5}, {"C4", 1.0}};
  const std::vector<PartQuantity> external = {{"C1", 10.0}, {"C1", 1.0}};

  // C1 is booked in W1; C2 has no home so every warehouse counts.
  const std::unordered_map<std::string, std::string> home = {{"C1", "W1"}, {"C3", "W1"}};
  const InventoryAggregator inv(on_hand, theoretical, external, home);

  PARTPLAN_ASSERT(inv.on_hand("C1") == 35.0);
  PARTPLAN_ASSERT(inv.theoretical("C1") == 2.5);
  PARTPLAN_ASSERT(inv.external("C1") == 11.0);
  PARTPLAN_ASSERT(inv.total_available("C1") == 48.5);
  PARTPLAN_ASSERT(inv.foreign_warehouse_lines() == 1);

  PARTPLAN_ASSERT(inv.on_hand("C2") == 7.0);
  PARTPLAN_ASSERT(inv.total_available("C3") == -4.0);

  // Absent from some or all sources -> zero from each.
  PARTPLAN_ASSERT(inv.total_available("C4") == 1.0);
  PARTPLAN_ASSERT(inv.on_hand("C4") == 0.0);
  PARTPLAN_ASSERT(inv.total_available("nope") == 0.0);

  PARTPLAN_ASSERT(inv.available("C1", AvailabilityBasis::All) == 48.5);
  PARTPLAN_ASSERT(inv.available("C1", AvailabilityBasis::OnHandOnly) == 35.0);

  // No home map: everything counts.
  const InventoryAggregator flat(on_hand, {}, {});
  PARTPLAN_ASSERT(flat.on_hand("C1") == 135.0);
  PARTPLAN_ASSERT(flat.foreign_warehouse_lines() == 0);

  return 0;
}
