#pragma once

#include <string>

namespace partplan {

// Canonical text for an order-line number that could not be parsed. Sentinel
// keys compare equal only to other sentinel keys.
inline constexpr const char* kSentinelLineKey = "-1";

// Part numbers arrive padded differently from each source system (trailing
// blanks from fixed-width ERP columns, full-width spaces typed into
// spreadsheets). The normalized key strips every ASCII whitespace character and
// every U+3000 IDEOGRAPHIC SPACE; two raw ids with the same key are the same
// part.
std::string normalize_part_key(const std::string& raw);

// Canonical join key for an order-line / operation number.
//
// "10", "10.0", " 10 ", "1e1" and 10.0 all become "10". The value is truncated
// toward zero before rendering. Anything that doesn't parse as a finite number
// becomes kSentinelLineKey.
std::string canonical_line_key(const std::string& raw);
std::string canonical_line_key(double v);

// Canonical join key for a production-order number. Numeric ids render like
// canonical_line_key(); non-numeric ids fall back to normalize_part_key() so
// alphanumeric order numbers still join on their text.
std::string canonical_order_key(const std::string& raw);

// True when `key` is the sentinel produced for an unparsable line number.
inline bool is_sentinel_line_key(const std::string& key) { return key == kSentinelLineKey; }

} // namespace partplan
