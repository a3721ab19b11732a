#pragma once

#include <cstddef>
#include <vector>

#include "partplan/core/date.h"
#include "partplan/core/entities.h"

namespace partplan {

// Ordered set of plant working days.
//
// Dates outside the known range clamp to the first/last workday instead of
// failing. An empty calendar is a no-op: nearest_workday() and back_offset()
// return their input unchanged.
class WorkCalendar {
 public:
  WorkCalendar() = default;

  // Keeps entries with shutdown == false. Order and duplicates don't matter.
  static WorkCalendar from_entries(const std::vector<CalendarEntry>& entries);

  // Every date in `workdays` is a workday. Order and duplicates don't matter.
  static WorkCalendar from_workdays(std::vector<Date> workdays);

  bool empty() const { return days_.empty(); }
  std::size_t size() const { return days_.size(); }
  const std::vector<Date>& workdays() const { return days_; }

  bool is_workday(const Date& d) const;

  // Closest workday to `d`; ties go to the earlier day.
  Date nearest_workday(const Date& d) const;

  // Snaps `d` to its nearest workday, then steps `n` workdays back. Never goes
  // before the first known workday.
  Date back_offset(const Date& d, int n) const;

 private:
  std::vector<Date> days_;
};

} // namespace partplan
