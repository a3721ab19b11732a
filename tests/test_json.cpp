#include <iostream>
#include <stdexcept>
#include <string>

#include "partplan/util/json.h"

#define PARTPLAN_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

std::string parse_error_message(const std::string& text) {
  try {
    (void)partplan::json::parse(text);
  } catch (const std::runtime_error& e) {
    return std::string(e.what());
  }
  return {};
}

} // namespace

int test_json() {
  using namespace partplan;

  const auto v = json::parse(R"({"part": "C-1", "qty": 12.5, "line": 10, "tags": ["041", "050"], "open": true, "x": null})");
  PARTPLAN_ASSERT(v.is_object());
  PARTPLAN_ASSERT(v.at("part").string_value() == "C-1");
  PARTPLAN_ASSERT(v.at("qty").number_value() == 12.5);
  PARTPLAN_ASSERT(v.at("line").int_value() == 10);
  PARTPLAN_ASSERT(v.at("tags").array().size() == 2);
  PARTPLAN_ASSERT(v.at("open").bool_value());
  PARTPLAN_ASSERT(v.at("x").is_null());
  PARTPLAN_ASSERT(v.find("missing") == nullptr);
  PARTPLAN_ASSERT(v.at("part").find("part") == nullptr);

  // Wrong-type accessors fall back to the default.
  PARTPLAN_ASSERT(v.at("part").number_value(-1.0) == -1.0);

  // Escapes and \u sequences decode to UTF-8.
  const auto s = json::parse(R"(["a\"b", "\u3000", "\ud83d\ude00"])");
  PARTPLAN_ASSERT(s.array()[0].string_value() == "a\"b");
  PARTPLAN_ASSERT(s.array()[1].string_value() == "\xE3\x80\x80");
  PARTPLAN_ASSERT(s.array()[2].string_value() == "\xF0\x9F\x98\x80");

  // Leading BOM from spreadsheet exports.
  const auto bom = json::parse("\xEF\xBB\xBF{\"a\": 1}");
  PARTPLAN_ASSERT(bom.at("a").int_value() == 1);

  // Keys come out sorted; integral numbers print without a fraction.
  json::Object o;
  o["b"] = 2.0;
  o["a"] = 0.5;
  o["c"] = std::string("x");
  PARTPLAN_ASSERT(json::stringify(json::object(o), 0) == R"({"a":0.5,"b":2,"c":"x"})");

  // Re-parsing stringified output yields the same tree.
  const std::string text = json::stringify(v, 2);
  PARTPLAN_ASSERT(json::stringify(json::parse(text), 2) == text);

  {
    const std::string msg = parse_error_message("[\n  1,\n  ,\n  2\n]\n");
    PARTPLAN_ASSERT(msg.find("line 3, col 3") != std::string::npos);
  }
  {
    const std::string msg = parse_error_message("[\r\n  1,\r\n  ,\r\n  2\r\n]\r\n");
    PARTPLAN_ASSERT(msg.find("line 3, col 3") != std::string::npos);
  }
  PARTPLAN_ASSERT(!parse_error_message("{\"a\": 1").empty());
  PARTPLAN_ASSERT(!parse_error_message("{\"a\": 1} x").empty());
  PARTPLAN_ASSERT(!parse_error_message("[01x]").empty());
  PARTPLAN_ASSERT(!parse_error_message("").empty());

  bool threw = false;
  try {
    (void)v.at("tags").object();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  PARTPLAN_ASSERT(threw);

  return 0;
}
