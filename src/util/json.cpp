#include "partplan/util/json.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace partplan::json {
namespace {

bool has_utf8_bom(const std::string& s) {
  return s.size() >= 3 && static_cast<unsigned char>(s[0]) == 0xEF && static_cast<unsigned char>(s[1]) == 0xBB &&
         static_cast<unsigned char>(s[2]) == 0xBF;
}

struct Parser {
  const std::string& s;
  std::size_t i{0};

  char peek() const { return i < s.size() ? s[i] : '\0'; }
  char get() { return i < s.size() ? s[i++] : '\0'; }

  void skip_ws() {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  }

  [[noreturn]] void fail(const std::string& msg) const {
    const std::size_t pos = std::min(i, s.size());
    int line = 1;
    int col = 1;
    for (std::size_t k = has_utf8_bom(s) ? 3 : 0; k < pos; ++k) {
      if (s[k] == '\n') {
        ++line;
        col = 1;
      } else if (s[k] != '\r') {
        ++col;
      }
    }
    std::ostringstream ss;
    ss << "JSON parse error at line " << line << ", col " << col << ": " << msg;
    throw std::runtime_error(ss.str());
  }

  bool consume(char c) {
    skip_ws();
    if (peek() == c) {
      ++i;
      return true;
    }
    return false;
  }

  void expect(char c) {
    skip_ws();
    if (get() != c) fail(std::string("expected '") + c + "'");
  }

  unsigned parse_hex4() {
    if (i + 4 > s.size()) fail("bad unicode escape");
    unsigned code = 0;
    for (int k = 0; k < 4; ++k) {
      const char c = get();
      code <<= 4;
      if (c >= '0' && c <= '9') {
        code |= static_cast<unsigned>(c - '0');
      } else if (c >= 'a' && c <= 'f') {
        code |= static_cast<unsigned>(c - 'a' + 10);
      } else if (c >= 'A' && c <= 'F') {
        code |= static_cast<unsigned>(c - 'A' + 10);
      } else {
        fail("bad unicode escape");
      }
    }
    return code;
  }

  static void append_utf8(std::uint32_t cp, std::string& out) {
    if (cp <= 0x7F) {
      out.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
      out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
      out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  Value parse_value() {
    skip_ws();
    const char c = peek();
    if (c == 'n') return parse_literal("null", nullptr);
    if (c == 't') return parse_literal("true", true);
    if (c == 'f') return parse_literal("false", false);
    if (c == '"') return parse_string();
    if (c == '[') return parse_array();
    if (c == '{') return parse_object();
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();
    fail("unexpected character");
  }

  Value parse_literal(const char* lit, Value v) {
    for (const char* p = lit; *p; ++p) {
      if (get() != *p) fail("invalid literal");
    }
    return v;
  }

  Value parse_number() {
    const std::size_t start = i;
    const auto digits = [&]() {
      if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
      while (std::isdigit(static_cast<unsigned char>(peek()))) ++i;
    };
    if (peek() == '-') ++i;
    digits();
    if (peek() == '.') {
      ++i;
      digits();
    }
    if (peek() == 'e' || peek() == 'E') {
      ++i;
      if (peek() == '+' || peek() == '-') ++i;
      digits();
    }
    const double v = std::strtod(s.c_str() + start, nullptr);
    if (!std::isfinite(v)) fail("number out of range");
    return v;
  }

  Value parse_string() {
    expect('"');
    std::string out;
    while (true) {
      if (i >= s.size()) fail("unterminated string");
      const char c = get();
      if (c == '"') break;
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      const char e = get();
      switch (e) {
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/': out.push_back('/'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u': {
          const unsigned hi = parse_hex4();
          if (hi >= 0xD800 && hi <= 0xDBFF) {
            if (get() != '\\' || get() != 'u') fail("expected low surrogate");
            const unsigned lo = parse_hex4();
            if (lo < 0xDC00 || lo > 0xDFFF) fail("invalid low surrogate");
            append_utf8(0x10000u + (((hi - 0xD800u) << 10u) | (lo - 0xDC00u)), out);
          } else if (hi >= 0xDC00 && hi <= 0xDFFF) {
            fail("unexpected low surrogate");
          } else {
            append_utf8(hi, out);
          }
          break;
        }
        default: fail("unknown escape");
      }
    }
    return out;
  }

  Value parse_array() {
    expect('[');
    Array arr;
    if (consume(']')) return arr;
    while (true) {
      arr.push_back(parse_value());
      if (consume(']')) break;
      expect(',');
    }
    return arr;
  }

  Value parse_object() {
    expect('{');
    Object obj;
    if (consume('}')) return obj;
    while (true) {
      skip_ws();
      if (peek() != '"') fail("expected string key");
      std::string key = std::get<std::string>(parse_string());
      expect(':');
      obj[std::move(key)] = parse_value();
      if (consume('}')) break;
      expect(',');
    }
    return obj;
  }
};

void write_escaped(const std::string& in, std::ostringstream& out) {
  out << '"';
  for (char c : in) {
    switch (c) {
      case '"': out << "\\\""; break;
      case '\\': out << "\\\\"; break;
      case '\n': out << "\\n"; break;
      case '\r': out << "\\r"; break;
      case '\t': out << "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          out << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c) << std::dec
              << std::setfill(' ');
        } else {
          out << c;
        }
    }
  }
  out << '"';
}

void stringify_impl(const Value& v, std::ostringstream& out, int indent, int depth) {
  const auto newline = [&](int d) {
    if (indent <= 0) return;
    out << '\n' << std::string(static_cast<std::size_t>(d * indent), ' ');
  };

  if (v.is_null()) {
    out << "null";
  } else if (const auto* b = v.as_bool()) {
    out << (*b ? "true" : "false");
  } else if (const auto* d = v.as_number()) {
    if (std::fabs(*d - std::round(*d)) < 1e-9 && std::fabs(*d) < 9.0e15) {
      out << static_cast<std::int64_t>(std::llround(*d));
    } else {
      out << std::setprecision(15) << *d;
    }
  } else if (const auto* str = v.as_string()) {
    write_escaped(*str, out);
  } else if (const auto* a = v.as_array()) {
    out << '[';
    for (std::size_t k = 0; k < a->size(); ++k) {
      if (k) out << ',';
      newline(depth + 1);
      stringify_impl((*a)[k], out, indent, depth + 1);
    }
    if (!a->empty()) newline(depth);
    out << ']';
  } else {
    const auto& o = v.object();
    std::vector<std::string> keys;
    keys.reserve(o.size());
    for (const auto& [k, _] : o) keys.push_back(k);
    std::sort(keys.begin(), keys.end());

    out << '{';
    for (std::size_t k = 0; k < keys.size(); ++k) {
      if (k) out << ',';
      newline(depth + 1);
      write_escaped(keys[k], out);
      out << (indent > 0 ? ": " : ":");
      stringify_impl(o.at(keys[k]), out, indent, depth + 1);
    }
    if (!keys.empty()) newline(depth);
    out << '}';
  }
}

} // namespace

bool Value::is_null() const { return std::holds_alternative<std::nullptr_t>(*this); }
bool Value::is_bool() const { return std::holds_alternative<bool>(*this); }
bool Value::is_number() const { return std::holds_alternative<double>(*this); }
bool Value::is_string() const { return std::holds_alternative<std::string>(*this); }
bool Value::is_array() const { return std::holds_alternative<Array>(*this); }
bool Value::is_object() const { return std::holds_alternative<Object>(*this); }

const bool* Value::as_bool() const { return std::get_if<bool>(this); }
const double* Value::as_number() const { return std::get_if<double>(this); }
const std::string* Value::as_string() const { return std::get_if<std::string>(this); }
const Array* Value::as_array() const { return std::get_if<Array>(this); }
const Object* Value::as_object() const { return std::get_if<Object>(this); }

const Value& Value::at(const std::string& key) const {
  const Value* v = find(key);
  if (!v) {
    if (!is_object()) throw std::runtime_error("JSON value is not an object");
    throw std::runtime_error("JSON object missing key: " + key);
  }
  return *v;
}

const Value* Value::find(const std::string& key) const {
  const auto* o = as_object();
  if (!o) return nullptr;
  const auto it = o->find(key);
  return it == o->end() ? nullptr : &it->second;
}

bool Value::bool_value(bool def) const {
  if (auto p = as_bool()) return *p;
  return def;
}

double Value::number_value(double def) const {
  if (auto p = as_number()) return *p;
  return def;
}

std::int64_t Value::int_value(std::int64_t def) const {
  if (auto p = as_number()) return static_cast<std::int64_t>(*p);
  return def;
}

std::string Value::string_value(const std::string& def) const {
  if (auto p = as_string()) return *p;
  return def;
}

const Object& Value::object() const {
  const auto* o = as_object();
  if (!o) throw std::runtime_error("JSON value is not an object");
  return *o;
}

const Array& Value::array() const {
  const auto* a = as_array();
  if (!a) throw std::runtime_error("JSON value is not an array");
  return *a;
}

Value parse(const std::string& text) {
  Parser p{text};
  if (has_utf8_bom(text)) p.i = 3;

  Value v = p.parse_value();
  p.skip_ws();
  if (p.i != text.size()) p.fail("trailing characters after JSON document");
  return v;
}

std::string stringify(const Value& v, int indent) {
  std::ostringstream out;
  stringify_impl(v, out, indent, 0);
  return out.str();
}

Value object(Object o) { return Value(std::move(o)); }
Value array(Array a) { return Value(std::move(a)); }

} // namespace partplan::json
