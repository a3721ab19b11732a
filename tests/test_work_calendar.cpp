#include <iostream>
#include <vector>

#include "partplan/core/work_calendar.h"

#define PARTPLAN_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

partplan::Date d(int y, int m, int day) { return partplan::Date::from_ymd(y, m, day); }

} // namespace

int test_work_calendar() {
  using partplan::CalendarEntry;
  using partplan::WorkCalendar;

  // Mon 2025-10-06 .. Fri 10-10 and Mon 10-13 .. Wed 10-15; the weekend is a shutdown.
  std::vector<CalendarEntry> entries;
  for (int day = 6; day <= 15; ++day) {
    const bool weekend = (day == 11 || day == 12);
    entries.push_back(CalendarEntry{d(2025, 10, day), weekend});
  }
  // Shuffled duplicate.
  entries.push_back(CalendarEntry{d(2025, 10, 8), false});

  const WorkCalendar cal = WorkCalendar::from_entries(entries);
  PARTPLAN_ASSERT(cal.size() == 8);
  PARTPLAN_ASSERT(cal.is_workday(d(2025, 10, 10)));
  PARTPLAN_ASSERT(!cal.is_workday(d(2025, 10, 11)));
  PARTPLAN_ASSERT(cal.workdays().front() == d(2025, 10, 6));
  PARTPLAN_ASSERT(cal.workdays().back() == d(2025, 10, 15));

  // Snapping: Saturday is one day from Friday, Sunday one from Monday.
  PARTPLAN_ASSERT(cal.nearest_workday(d(2025, 10, 11)) == d(2025, 10, 10));
  PARTPLAN_ASSERT(cal.nearest_workday(d(2025, 10, 12)) == d(2025, 10, 13));
  PARTPLAN_ASSERT(cal.nearest_workday(d(2025, 10, 9)) == d(2025, 10, 9));
  PARTPLAN_ASSERT(cal.nearest_workday(d(2025, 9, 1)) == d(2025, 10, 6));
  PARTPLAN_ASSERT(cal.nearest_workday(d(2025, 12, 1)) == d(2025, 10, 15));

  // Ties go to the earlier workday.
  const WorkCalendar gap = WorkCalendar::from_workdays({d(2025, 10, 10), d(2025, 10, 14)});
  PARTPLAN_ASSERT(gap.nearest_workday(d(2025, 10, 12)) == d(2025, 10, 10));
  PARTPLAN_ASSERT(gap.nearest_workday(d(2025, 10, 13)) == d(2025, 10, 14));

  // Stepping back over the weekend.
  PARTPLAN_ASSERT(cal.back_offset(d(2025, 10, 14), 2) == d(2025, 10, 10));
  PARTPLAN_ASSERT(cal.back_offset(d(2025, 10, 15), 5) == d(2025, 10, 8));
  PARTPLAN_ASSERT(cal.back_offset(d(2025, 10, 13), 0) == d(2025, 10, 13));
  // Sunday snaps to Monday first.
  PARTPLAN_ASSERT(cal.back_offset(d(2025, 10, 12), 1) == d(2025, 10, 10));

  // Clamped at the first known workday.
  PARTPLAN_ASSERT(cal.back_offset(d(2025, 10, 7), 5) == d(2025, 10, 6));
  PARTPLAN_ASSERT(cal.back_offset(d(2025, 8, 1), 3) == d(2025, 10, 6));

  // Negative offsets step forward and clamp at the last workday.
  PARTPLAN_ASSERT(cal.back_offset(d(2025, 10, 14), -1) == d(2025, 10, 15));
  PARTPLAN_ASSERT(cal.back_offset(d(2025, 10, 14), -10) == d(2025, 10, 15));

  // An empty calendar passes dates through.
  const WorkCalendar none;
  PARTPLAN_ASSERT(none.empty());
  PARTPLAN_ASSERT(none.nearest_workday(d(2025, 10, 11)) == d(2025, 10, 11));
  PARTPLAN_ASSERT(none.back_offset(d(2025, 10, 11), 5) == d(2025, 10, 11));

  // All-shutdown input behaves like an empty calendar.
  const WorkCalendar closed = WorkCalendar::from_entries({CalendarEntry{d(2025, 10, 11), true}});
  PARTPLAN_ASSERT(closed.empty());

  return 0;
}
