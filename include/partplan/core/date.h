#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace partplan {

// Whole calendar days since 1970-01-01. Plant planning never needs a time of day.
class Date {
 public:
  // Throws std::runtime_error when month/day are out of range for that month.
  static Date from_ymd(int year, int month, int day);

  // Like from_ymd, but returns nullopt for days that don't exist (Apr 31, Feb 29
  // in a common year).
  static std::optional<Date> try_from_ymd(int year, int month, int day);

  // Strict "YYYY-MM-DD". Throws std::runtime_error on anything else.
  static Date parse_iso_ymd(const std::string& iso);

  // Lenient form used at the ingestion boundary. Accepts "YYYY-MM-DD" or
  // "YYYY/MM/DD", optionally followed by a time part (" 00:00:00" or
  // "T00:00:00"). Returns nullopt for malformed or non-existent dates.
  static std::optional<Date> try_parse(const std::string& s);

  // The current date in the local time zone.
  static Date local_today();

  Date() = default;
  explicit Date(std::int64_t days_since_epoch) : days_(days_since_epoch) {}

  std::int64_t days_since_epoch() const { return days_; }
  Date add_days(std::int64_t delta) const { return Date(days_ + delta); }

  // Signed distance in days (this - other).
  std::int64_t days_since(const Date& other) const { return days_ - other.days_; }

  struct YMD {
    int year;
    int month;
    int day;
  };

  YMD to_ymd() const;
  std::string to_string() const;

  friend bool operator==(const Date& a, const Date& b) { return a.days_ == b.days_; }
  friend bool operator!=(const Date& a, const Date& b) { return a.days_ != b.days_; }
  friend bool operator<(const Date& a, const Date& b) { return a.days_ < b.days_; }
  friend bool operator<=(const Date& a, const Date& b) { return a.days_ <= b.days_; }
  friend bool operator>(const Date& a, const Date& b) { return a.days_ > b.days_; }
  friend bool operator>=(const Date& a, const Date& b) { return a.days_ >= b.days_; }

 private:
  std::int64_t days_{0};
};

// 28..31. Returns 0 for a month outside 1..12.
int days_in_month(int year, int month);

} // namespace partplan
