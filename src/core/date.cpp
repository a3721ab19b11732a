#include "partplan/core/date.h"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace partplan {
namespace {

// Howard Hinnant's algorithms (public domain):
// https://howardhinnant.github.io/date_algorithms.html
// days_from_civil returns days since 1970-01-01.
constexpr std::int64_t days_from_civil(int y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return static_cast<std::int64_t>(era) * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

constexpr Date::YMD civil_from_days(std::int64_t z) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp + (mp < 10 ? 3 : -9);
  return Date::YMD{static_cast<int>(y + (m <= 2)), static_cast<int>(m), static_cast<int>(d)};
}

bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

// Reads exactly `n` digits at `pos`.
bool read_fixed_digits(const std::string& s, std::size_t pos, std::size_t n, int& out) {
  if (pos + n > s.size()) return false;
  int v = 0;
  for (std::size_t k = pos; k < pos + n; ++k) {
    if (!std::isdigit(static_cast<unsigned char>(s[k]))) return false;
    v = v * 10 + (s[k] - '0');
  }
  out = v;
  return true;
}

} // namespace

int days_in_month(int year, int month) {
  static constexpr int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month < 1 || month > 12) return 0;
  if (month == 2 && is_leap(year)) return 29;
  return kDays[month - 1];
}

Date Date::from_ymd(int year, int month, int day) {
  if (month < 1 || month > 12) throw std::runtime_error("month out of range");
  if (day < 1 || day > days_in_month(year, month)) throw std::runtime_error("day out of range");
  return Date(days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)));
}

std::optional<Date> Date::try_from_ymd(int year, int month, int day) {
  if (month < 1 || month > 12) return std::nullopt;
  if (day < 1 || day > days_in_month(year, month)) return std::nullopt;
  return Date(days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)));
}

Date Date::local_today() {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &now);
#else
  localtime_r(&now, &tm);
#endif
  return from_ymd(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
}

Date Date::parse_iso_ymd(const std::string& iso) {
  int y = 0, m = 0, d = 0;
  if (iso.size() != 10 || iso[4] != '-' || iso[7] != '-' || !read_fixed_digits(iso, 0, 4, y) ||
      !read_fixed_digits(iso, 5, 2, m) || !read_fixed_digits(iso, 8, 2, d)) {
    throw std::runtime_error("Invalid date format, expected YYYY-MM-DD: " + iso);
  }
  return from_ymd(y, m, d);
}

std::optional<Date> Date::try_parse(const std::string& raw) {
  std::size_t b = 0;
  while (b < raw.size() && std::isspace(static_cast<unsigned char>(raw[b]))) ++b;
  const std::string s = raw.substr(b);

  if (s.size() < 10) return std::nullopt;
  const char sep = s[4];
  if ((sep != '-' && sep != '/') || s[7] != sep) return std::nullopt;

  int y = 0, m = 0, d = 0;
  if (!read_fixed_digits(s, 0, 4, y) || !read_fixed_digits(s, 5, 2, m) || !read_fixed_digits(s, 8, 2, d)) {
    return std::nullopt;
  }
  if (s.size() > 10) {
    const char next = s[10];
    if (next != ' ' && next != 'T') return std::nullopt;
  }
  return try_from_ymd(y, m, d);
}

Date::YMD Date::to_ymd() const { return civil_from_days(days_); }

std::string Date::to_string() const {
  const auto ymd = to_ymd();
  std::ostringstream ss;
  ss << std::setfill('0') << std::setw(4) << ymd.year << '-' << std::setw(2) << ymd.month << '-' << std::setw(2)
     << ymd.day;
  return ss.str();
}

} // namespace partplan
