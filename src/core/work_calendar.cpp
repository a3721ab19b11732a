#include "partplan/core/work_calendar.h"

#include <algorithm>
#include <iterator>

namespace partplan {

WorkCalendar WorkCalendar::from_entries(const std::vector<CalendarEntry>& entries) {
  std::vector<Date> days;
  days.reserve(entries.size());
  for (const auto& e : entries) {
    if (!e.shutdown) days.push_back(e.date);
  }
  return from_workdays(std::move(days));
}

WorkCalendar WorkCalendar::from_workdays(std::vector<Date> workdays) {
  std::sort(workdays.begin(), workdays.end());
  workdays.erase(std::unique(workdays.begin(), workdays.end()), workdays.end());
  WorkCalendar cal;
  cal.days_ = std::move(workdays);
  return cal;
}

bool WorkCalendar::is_workday(const Date& d) const {
  return std::binary_search(days_.begin(), days_.end(), d);
}

Date WorkCalendar::nearest_workday(const Date& d) const {
  if (days_.empty()) return d;
  if (d <= days_.front()) return days_.front();
  if (d >= days_.back()) return days_.back();

  // front < d < back, so both neighbours exist.
  const auto it = std::lower_bound(days_.begin(), days_.end(), d);
  if (*it == d) return d;
  const Date after = *it;
  const Date before = *std::prev(it);
  if (d.days_since(before) <= after.days_since(d)) return before;
  return after;
}

Date WorkCalendar::back_offset(const Date& d, int n) const {
  if (days_.empty()) return d;
  const Date snapped = nearest_workday(d);
  const auto it = std::lower_bound(days_.begin(), days_.end(), snapped);
  const auto idx = static_cast<std::ptrdiff_t>(std::distance(days_.begin(), it));
  const auto last = static_cast<std::ptrdiff_t>(days_.size()) - 1;
  const std::ptrdiff_t due = std::clamp<std::ptrdiff_t>(idx - n, 0, last);
  return days_[static_cast<std::size_t>(due)];
}

} // namespace partplan
