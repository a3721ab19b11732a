#include <iostream>

#include "partplan/core/part_key.h"

#define PARTPLAN_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_part_key() {
  using partplan::canonical_line_key;
  using partplan::canonical_order_key;
  using partplan::normalize_part_key;

  // ASCII whitespace anywhere, plus the ideographic space U+3000.
  PARTPLAN_ASSERT(normalize_part_key("  AB-12 ") == "AB-12");
  PARTPLAN_ASSERT(normalize_part_key("AB 12\t") == "AB12");
  PARTPLAN_ASSERT(normalize_part_key("AB\xE3\x80\x80" "12") == "AB12");
  PARTPLAN_ASSERT(normalize_part_key("\xE3\x80\x80\xE3\x80\x80") == "");
  PARTPLAN_ASSERT(normalize_part_key("") == "");
  // Other multi-byte characters survive untouched.
  PARTPLAN_ASSERT(normalize_part_key("\xE9\x83\xA8\xE5\x93\x81") == "\xE9\x83\xA8\xE5\x93\x81");
  // Idempotent.
  PARTPLAN_ASSERT(normalize_part_key(normalize_part_key(" A\xE3\x80\x80 B ")) == "AB");

  // Line numbers: "10", "10.0" and 10 all join.
  PARTPLAN_ASSERT(canonical_line_key("10") == "10");
  PARTPLAN_ASSERT(canonical_line_key("10.0") == "10");
  PARTPLAN_ASSERT(canonical_line_key(" 10 ") == "10");
  PARTPLAN_ASSERT(canonical_line_key(10.0) == "10");
  PARTPLAN_ASSERT(canonical_line_key(10.7) == "10");
  PARTPLAN_ASSERT(canonical_line_key("-2.5") == "-2");

  // Unparsable values map to the sentinel.
  PARTPLAN_ASSERT(canonical_line_key("abc") == partplan::kSentinelLineKey);
  PARTPLAN_ASSERT(canonical_line_key("") == "-1");
  PARTPLAN_ASSERT(partplan::is_sentinel_line_key(canonical_line_key("1O")));
  PARTPLAN_ASSERT(!partplan::is_sentinel_line_key("1"));

  // Order numbers are numeric when they look numeric, otherwise trimmed text.
  PARTPLAN_ASSERT(canonical_order_key("000123") == "123");
  PARTPLAN_ASSERT(canonical_order_key("123.0") == "123");
  PARTPLAN_ASSERT(canonical_order_key(" A-77 ") == "A-77");

  return 0;
}
