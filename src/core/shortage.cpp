#include "partplan/core/shortage.h"

namespace partplan {

ShortageResult detect_shortage(double available, const std::vector<DailyQty>& daily) {
  ShortageResult out;
  double cum = 0.0;
  for (const auto& d : daily) {
    cum += d.qty;
    if (!out.date && available - cum <= 0.0) out.date = d.date;
  }
  out.qty = available - cum;
  return out;
}

ShortageResult detect_shortage(double available, const Date& start, const DemandSeries& series) {
  ShortageResult out;
  double cum = 0.0;
  for (std::size_t i = 0; i < series.qty.size(); ++i) {
    cum += series.qty[i];
    if (!out.date && available - cum <= 0.0) out.date = start.add_days(static_cast<std::int64_t>(i));
  }
  out.qty = available - cum;
  return out;
}

} // namespace partplan
