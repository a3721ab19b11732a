#include "partplan/util/strings.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace partplan {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::string trim_copy(const std::string& s) {
  const auto not_space = [](unsigned char c) { return !std::isspace(c); };
  auto b = std::find_if(s.begin(), s.end(), not_space);
  auto e = std::find_if(s.rbegin(), s.rend(), not_space).base();
  if (b >= e) return {};
  return std::string(b, e);
}

bool parse_number(const std::string& s, double& out) {
  const std::string t = trim_copy(s);
  if (t.empty()) return false;

  // strtod would also accept "nan", "inf" and hex floats; database exports never
  // contain those, so anything that isn't plain decimal notation is rejected.
  for (char c : t) {
    const bool ok = std::isdigit(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.' ||
                    c == 'e' || c == 'E';
    if (!ok) return false;
  }

  errno = 0;
  char* end = nullptr;
  const double v = std::strtod(t.c_str(), &end);
  if (end == t.c_str() || *end != '\0' || errno == ERANGE) return false;
  if (!std::isfinite(v)) return false;
  out = v;
  return true;
}

std::string csv_escape(const std::string& s) {
  const bool needs_quotes = s.find_first_of(",\"\r\n") != std::string::npos;
  if (!needs_quotes) return s;

  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (char c : s) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::string format_quantity(double v) {
  if (!std::isfinite(v)) return "0";
  const double r = std::round(v);
  if (std::fabs(v - r) < 1e-9 && std::fabs(r) < 9.0e15) {
    // Avoid printing "-0".
    const auto i = static_cast<std::int64_t>(r);
    return std::to_string(i);
  }

  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.4f", v);
  std::string out(buf);
  while (!out.empty() && out.back() == '0') out.pop_back();
  if (!out.empty() && out.back() == '.') out.pop_back();
  if (out == "-0") out = "0";
  return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i) out += sep;
    out += parts[i];
  }
  return out;
}

} // namespace partplan
