#pragma once

#include <string>
#include <vector>

namespace partplan {

std::string to_lower(std::string s);

// Strips leading/trailing ASCII whitespace.
std::string trim_copy(const std::string& s);

// Parses a whole (trimmed) string as a finite number. Accepts integers,
// decimals and exponents ("10", "10.0", " 10 ", "1e1"). Returns false for
// empty input, trailing garbage, NaN and infinities.
bool parse_number(const std::string& s, double& out);

// Escapes a string for safe inclusion in a CSV cell.
//
// If the string contains a comma, quote, or newline, the result will be wrapped
// in double-quotes and any internal quotes will be doubled.
std::string csv_escape(const std::string& s);

// Formats a quantity for tabular output: integral values print without a
// fraction ("12", "-20"), others with up to 4 decimals and no trailing zeros.
std::string format_quantity(double v);

// Joins with a separator ("041,050").
std::string join(const std::vector<std::string>& parts, const std::string& sep);

} // namespace partplan
