#include "partplan/core/schedule_ingest.h"

#include <algorithm>
#include <cctype>

#include "partplan/core/part_key.h"
#include "partplan/util/strings.h"

namespace partplan {
namespace {

bool all_digits(const std::string& s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

std::optional<YearMonth> parse_year_month(const std::string& raw) {
  const std::string s = trim_copy(raw);
  const auto sep = s.find_first_of("/-");
  if (sep == std::string::npos) return std::nullopt;

  const std::string ys = s.substr(0, sep);
  const std::string ms = s.substr(sep + 1);
  if (ys.size() != 4 || !all_digits(ys)) return std::nullopt;
  if (ms.empty() || ms.size() > 2 || !all_digits(ms)) return std::nullopt;

  YearMonth ym{std::stoi(ys), std::stoi(ms)};
  if (ym.month < 1 || ym.month > 12) return std::nullopt;
  return ym;
}

std::optional<int> parse_day_column(const std::string& raw) {
  const std::string s = trim_copy(raw);
  std::size_t b = s.size();
  while (b > 0 && std::isdigit(static_cast<unsigned char>(s[b - 1]))) --b;
  const std::string digits = s.substr(b);
  if (digits.empty() || digits.size() > 2) return std::nullopt;

  const int day = std::stoi(digits);
  if (day < 1 || day > 31) return std::nullopt;
  return day;
}

bool month_overlaps(const YearMonth& ym, const Date& first, const Date& last) {
  const auto m_first = Date::try_from_ymd(ym.year, ym.month, 1);
  const auto m_last = Date::try_from_ymd(ym.year, ym.month, days_in_month(ym.year, ym.month));
  if (!m_first || !m_last) return false;
  return !(*m_last < first || *m_first > last);
}

ScheduleIngestResult ingest_schedule(const std::vector<ScheduleRow>& rows, const Date& today, int horizon_days) {
  ScheduleIngestResult out;
  auto& st = out.stats;
  const Date last = today.add_days(horizon_days);

  for (const auto& row : rows) {
    ++st.rows_read;

    const auto ym = parse_year_month(row.year_month);
    if (!ym) {
      ++st.rows_bad_month;
      continue;
    }
    if (!month_overlaps(*ym, today, last)) {
      ++st.rows_outside_horizon;
      continue;
    }
    const std::string parent = normalize_part_key(row.parent);
    if (parent.empty()) {
      ++st.rows_missing_parent;
      continue;
    }

    for (const auto& [column, qty] : row.cells) {
      if (!(qty > 0.0)) {
        ++st.cells_non_positive;
        continue;
      }
      const auto day = parse_day_column(column);
      const auto date = day ? Date::try_from_ymd(ym->year, ym->month, *day) : std::nullopt;
      if (!date) {
        ++st.cells_bad_day;
        continue;
      }
      if (*date < today || *date > last) {
        ++st.cells_outside_horizon;
        continue;
      }
      out.entries.push_back(ProductionPlanEntry{parent, *date, qty});
    }
  }
  return out;
}

int restrict_plan_to_horizon(std::vector<ProductionPlanEntry>& plan, const Date& today, int horizon_days) {
  const Date last = today.add_days(horizon_days);
  const auto before = plan.size();
  plan.erase(std::remove_if(plan.begin(), plan.end(),
                            [&](const ProductionPlanEntry& e) {
                              return e.parent.empty() || !(e.quantity > 0.0) || e.date < today || e.date > last;
                            }),
             plan.end());
  return static_cast<int>(before - plan.size());
}

} // namespace partplan
