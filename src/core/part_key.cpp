#include "partplan/core/part_key.h"

#include <cctype>
#include <cmath>
#include <cstdint>

#include "partplan/util/strings.h"

namespace partplan {
namespace {

// UTF-8 encoding of U+3000.
constexpr unsigned char kIdeoSpace0 = 0xE3;
constexpr unsigned char kIdeoSpace1 = 0x80;
constexpr unsigned char kIdeoSpace2 = 0x80;

bool integral_in_range(double v) { return std::isfinite(v) && std::fabs(v) < 9.0e18; }

} // namespace

std::string normalize_part_key(const std::string& raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const auto c = static_cast<unsigned char>(raw[i]);
    if (std::isspace(c)) continue;
    if (c == kIdeoSpace0 && i + 2 < raw.size() && static_cast<unsigned char>(raw[i + 1]) == kIdeoSpace1 &&
        static_cast<unsigned char>(raw[i + 2]) == kIdeoSpace2) {
      i += 2;
      continue;
    }
    out.push_back(raw[i]);
  }
  return out;
}

std::string canonical_line_key(double v) {
  if (!integral_in_range(v)) return kSentinelLineKey;
  return std::to_string(static_cast<std::int64_t>(std::trunc(v)));
}

std::string canonical_line_key(const std::string& raw) {
  double v = 0.0;
  if (!parse_number(raw, v)) return kSentinelLineKey;
  return canonical_line_key(v);
}

std::string canonical_order_key(const std::string& raw) {
  double v = 0.0;
  if (parse_number(raw, v) && integral_in_range(v)) return canonical_line_key(v);
  return normalize_part_key(raw);
}

} // namespace partplan
