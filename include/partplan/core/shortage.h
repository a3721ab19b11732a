#pragma once

#include <optional>
#include <vector>

#include "partplan/core/bom_explosion.h"
#include "partplan/core/date.h"
#include "partplan/core/entities.h"

namespace partplan {

struct ShortageResult {
  // First day cumulative demand uses up the available quantity; empty if that
  // never happens inside the horizon.
  std::optional<Date> date;

  // available - (total demand over the whole horizon). Negative means a
  // shortfall. This is the end-of-horizon figure, not the deficit on `date`.
  double qty{0.0};

  bool is_short() const { return qty < 0.0; }
};

// Walks `daily` (ascending dates) accumulating demand. The first day where
// available - cumulative <= 0 becomes the shortage date and is never moved by
// later days. The walk always runs to the end so `qty` reflects the full
// horizon.
ShortageResult detect_shortage(double available, const std::vector<DailyQty>& daily);

// Same walk over a dense series starting at `start`.
ShortageResult detect_shortage(double available, const Date& start, const DemandSeries& series);

} // namespace partplan
