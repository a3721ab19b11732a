#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace partplan::json {

struct Value;
using Array = std::vector<Value>;
using Object = std::unordered_map<std::string, Value>;

// Minimal JSON value type (null, bool, number, string, array, object).
struct Value : std::variant<std::nullptr_t, bool, double, std::string, Array, Object> {
  using variant::variant;

  bool is_null() const;
  bool is_bool() const;
  bool is_number() const;
  bool is_string() const;
  bool is_array() const;
  bool is_object() const;

  const bool* as_bool() const;
  const double* as_number() const;
  const std::string* as_string() const;
  const Array* as_array() const;
  const Object* as_object() const;

  // Throws std::runtime_error if not present / wrong type.
  const Value& at(const std::string& key) const;

  // Null when this is not an object or the key is absent.
  const Value* find(const std::string& key) const;

  bool bool_value(bool def = false) const;
  double number_value(double def = 0.0) const;
  std::int64_t int_value(std::int64_t def = 0) const;
  std::string string_value(const std::string& def = "") const;

  // Convenience casts (throw on wrong type)
  const Object& object() const;
  const Array& array() const;
};

// Parse a JSON document into a tree. A leading UTF-8 BOM is skipped.
// Throws std::runtime_error with line/column on malformed input.
Value parse(const std::string& text);

// Convert a JSON value to text. Object keys are emitted sorted.
std::string stringify(const Value& v, int indent = 2);

Value object(Object o);
Value array(Array a);

} // namespace partplan::json
