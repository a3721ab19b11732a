#include "partplan/core/serialization.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <initializer_list>
#include <limits>
#include <stdexcept>

#include "partplan/core/date.h"
#include "partplan/core/part_key.h"
#include "partplan/util/log.h"
#include "partplan/util/strings.h"

namespace partplan {
namespace {

using json::Array;
using json::Object;
using json::Value;

const Value& null_value() {
  static const Value kNull = nullptr;
  return kNull;
}

const Value& field(const Value& row, const char* key) {
  const Value* v = row.find(key);
  return v ? *v : null_value();
}

// First present key wins ("item" and "parent" both name the schedule parent).
const Value& field_any(const Value& row, std::initializer_list<const char*> keys) {
  for (const char* k : keys) {
    if (const Value* v = row.find(k)) return *v;
  }
  return null_value();
}

std::string text(const Value& row, const char* key) { return json_scalar_text(field(row, key)); }
double number(const Value& row, const char* key) { return json_scalar_number(field(row, key)); }
std::string part_key(const Value& row, const char* key) { return normalize_part_key(text(row, key)); }

const Array* section(const Object& root, const char* name) {
  const auto it = root.find(name);
  if (it == root.end() || it->second.is_null()) return nullptr;
  if (!it->second.is_array()) {
    throw std::runtime_error(std::string("snapshot section '") + name + "' must be an array");
  }
  return &it->second.array();
}

// Calls fn(row) for every object row in the section; anything else is counted
// as malformed and skipped.
template <typename Fn>
void for_each_row(const Object& root, const char* name, LoadStats& st, Fn&& fn) {
  const Array* rows = section(root, name);
  if (!rows) return;
  for (const auto& row : *rows) {
    if (!row.is_object()) {
      ++st.rows_malformed;
      continue;
    }
    fn(row);
  }
}

std::vector<std::string> routing_codes(const Value& v) {
  std::vector<std::string> out;
  if (const auto* a = v.as_array()) {
    for (const auto& code : *a) {
      std::string c = trim_copy(json_scalar_text(code));
      if (!c.empty()) out.push_back(std::move(c));
    }
    return out;
  }
  // "041,050" form.
  const std::string s = json_scalar_text(v);
  std::size_t pos = 0;
  while (pos <= s.size()) {
    const std::size_t comma = s.find(',', pos);
    std::string c = trim_copy(comma == std::string::npos ? s.substr(pos) : s.substr(pos, comma - pos));
    if (!c.empty()) out.push_back(std::move(c));
    if (comma == std::string::npos) break;
    pos = comma + 1;
  }
  return out;
}

bool is_shutdown(const Value& row, const std::string& workday_type) {
  const Value& flag = field(row, "shutdown");
  if (const auto* b = flag.as_bool()) return *b;
  if (const auto* n = flag.as_number()) return *n != 0.0;

  const Value& type = field(row, "day_type");
  if (type.is_null()) return false;
  return trim_copy(json_scalar_text(type)) != workday_type;
}

int config_int(const Value& v, const char* key) {
  const auto* n = v.as_number();
  if (!n || !std::isfinite(*n) || std::fabs(*n - std::round(*n)) > 1e-9) {
    throw std::runtime_error(std::string("config '") + key + "' must be an integer");
  }
  if (*n < static_cast<double>(std::numeric_limits<int>::min()) ||
      *n > static_cast<double>(std::numeric_limits<int>::max())) {
    throw std::runtime_error(std::string("config '") + key + "' is out of range");
  }
  return static_cast<int>(std::llround(*n));
}

// Status codes outside int range can't be a real ERP status; load them as closed.
int order_status(const Value& row, LoadStats& st) {
  const double v = number(row, "status");
  if (!std::isfinite(v) || v < static_cast<double>(std::numeric_limits<int>::min()) ||
      v > static_cast<double>(std::numeric_limits<int>::max())) {
    ++st.status_out_of_range;
    return std::numeric_limits<int>::max();
  }
  return static_cast<int>(v);
}

std::string config_string(const Value& v, const char* key) {
  const auto* s = v.as_string();
  if (!s) throw std::runtime_error(std::string("config '") + key + "' must be a string");
  return *s;
}

} // namespace

std::string json_scalar_text(const json::Value& v) {
  if (const auto* s = v.as_string()) return *s;
  if (const auto* n = v.as_number()) {
    const double r = std::round(*n);
    if (std::fabs(*n - r) < 1e-9 && std::fabs(r) < 9.0e15) return std::to_string(static_cast<std::int64_t>(r));
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.15g", *n);
    return std::string(buf);
  }
  return {};
}

double json_scalar_number(const json::Value& v) {
  if (const auto* n = v.as_number()) return *n;
  if (const auto* s = v.as_string()) {
    double out = 0.0;
    if (parse_number(*s, out)) return out;
  }
  return 0.0;
}

PlanInputs load_plan_inputs_from_json(const std::string& json_text, const std::string& workday_type,
                                      LoadStats* stats) {
  const Value doc = json::parse(json_text);
  if (!doc.is_object()) throw std::runtime_error("snapshot root must be a JSON object");
  const Object& root = doc.object();

  LoadStats st;
  PlanInputs in;

  if (const auto it = root.find("as_of"); it != root.end() && !it->second.is_null()) {
    in.as_of = Date::try_parse(json_scalar_text(it->second));
    if (!in.as_of) log::warn("snapshot as_of is not a date: " + json_scalar_text(it->second));
  }

  for_each_row(root, "schedule", st, [&](const Value& row) {
    ScheduleRow r;
    r.year_month = text(row, "year_month");
    r.parent = json_scalar_text(field_any(row, {"item", "parent", "part"}));
    if (const auto* days = field(row, "days").as_object()) {
      for (const auto& [column, qty] : *days) r.cells.emplace_back(column, json_scalar_number(qty));
    }
    in.schedule.push_back(std::move(r));
  });

  for_each_row(root, "plan", st, [&](const Value& row) {
    const auto date = Date::try_parse(text(row, "date"));
    if (!date) {
      ++st.plan_bad_date;
      return;
    }
    ProductionPlanEntry e;
    e.parent = normalize_part_key(json_scalar_text(field_any(row, {"part", "parent", "item"})));
    e.date = *date;
    e.quantity = number(row, "qty");
    in.plan.push_back(std::move(e));
  });

  for_each_row(root, "bom", st, [&](const Value& row) {
    BomLine l;
    l.parent = part_key(row, "parent");
    l.child = part_key(row, "child");
    l.per_unit_qty = std::max(0.0, number(row, "qty"));
    if (l.parent.empty() || l.child.empty()) {
      ++st.rows_missing_part;
      return;
    }
    in.bom.push_back(std::move(l));
  });

  for_each_row(root, "parts", st, [&](const Value& row) {
    PartMaster p;
    p.raw_id = text(row, "part");
    p.key = normalize_part_key(p.raw_id);
    if (p.key.empty()) {
      ++st.rows_missing_part;
      return;
    }
    p.name = text(row, "name");
    p.warehouse = trim_copy(text(row, "warehouse"));
    p.routing_steps = routing_codes(field(row, "routing"));
    in.parts.push_back(std::move(p));
  });

  for_each_row(root, "stock", st, [&](const Value& row) {
    OnHandStockLine s;
    s.part = part_key(row, "part");
    s.warehouse = trim_copy(text(row, "warehouse"));
    s.qty = number(row, "qty");
    if (s.part.empty()) {
      ++st.rows_missing_part;
      return;
    }
    in.stock.push_back(std::move(s));
  });

  const auto load_quantities = [&](const char* name, std::vector<PartQuantity>& out) {
    for_each_row(root, name, st, [&](const Value& row) {
      PartQuantity q{part_key(row, "part"), number(row, "qty")};
      if (q.part.empty()) {
        ++st.rows_missing_part;
        return;
      }
      out.push_back(std::move(q));
    });
  };
  load_quantities("shelf_theory", in.shelf_theory);
  load_quantities("external_stock", in.external_stock);

  for_each_row(root, "calendar", st, [&](const Value& row) {
    const auto date = Date::try_parse(text(row, "date"));
    if (!date) {
      ++st.calendar_bad_date;
      return;
    }
    in.calendar.push_back(CalendarEntry{*date, is_shutdown(row, workday_type)});
  });

  for_each_row(root, "mfg_orders", st, [&](const Value& row) {
    OpenManufacturingOrder o;
    o.order_id = text(row, "order");
    o.line_id = text(row, "line");
    o.part = part_key(row, "part");
    o.ordered_qty = number(row, "ordered");
    o.delivered_qty = number(row, "delivered");
    o.status = order_status(row, st);
    if (o.part.empty()) {
      ++st.rows_missing_part;
      return;
    }
    in.mfg_orders.push_back(std::move(o));
  });

  for_each_row(root, "purchase_lines", st, [&](const Value& row) {
    MaterialPurchaseLine p;
    p.order_id = text(row, "order");
    p.line_id = text(row, "line");
    p.po_number = text(row, "po");
    p.release_number = text(row, "release");
    p.ordered_qty = number(row, "ordered");
    in.purchase_lines.push_back(std::move(p));
  });

  for_each_row(root, "receipts", st, [&](const Value& row) {
    MaterialReceiptLine r;
    r.order_id = text(row, "order");
    r.po_number = text(row, "po");
    r.release_number = text(row, "release");
    r.delivered_qty = number(row, "delivered");
    const std::string raw_date = text(row, "date");
    if (!raw_date.empty()) {
      r.receipt_date = Date::try_parse(raw_date);
      if (!r.receipt_date) ++st.receipt_bad_date;
    }
    in.receipts.push_back(std::move(r));
  });

  if (st.plan_bad_date + st.calendar_bad_date + st.rows_missing_part + st.rows_malformed > 0) {
    log::debug("snapshot: dropped plan rows with bad dates=" + std::to_string(st.plan_bad_date) +
               ", calendar rows with bad dates=" + std::to_string(st.calendar_bad_date) +
               ", rows without a part=" + std::to_string(st.rows_missing_part) +
               ", malformed rows=" + std::to_string(st.rows_malformed));
  }
  if (stats) *stats = st;
  return in;
}

PlanConfig plan_config_from_json(const std::string& json_text, PlanConfig base) {
  const Value doc = json::parse(json_text);
  if (!doc.is_object()) throw std::runtime_error("config root must be a JSON object");

  PlanConfig cfg = std::move(base);
  for (const auto& [key, v] : doc.object()) {
    if (key == "horizon_days") {
      cfg.horizon_days = config_int(v, "horizon_days");
    } else if (key == "lead_workdays") {
      cfg.lead_workdays = config_int(v, "lead_workdays");
    } else if (key == "order_status_open_threshold") {
      cfg.order_status_open_threshold = config_int(v, "order_status_open_threshold");
    } else if (key == "terminal_step_code") {
      cfg.terminal_step_code = trim_copy(config_string(v, "terminal_step_code"));
    } else if (key == "terminal_step_tag") {
      cfg.terminal_step_tag = config_string(v, "terminal_step_tag");
    } else if (key == "availability_basis") {
      const std::string s = config_string(v, "availability_basis");
      if (!availability_basis_from_string(s, cfg.availability_basis)) {
        throw std::runtime_error("config 'availability_basis' must be \"all\" or \"on_hand\" (got \"" + s + "\")");
      }
    } else if (key == "routing_steps") {
      if (!v.is_array()) throw std::runtime_error("config 'routing_steps' must be an array");
      cfg.routing_steps.clear();
      for (const auto& code : v.array()) cfg.routing_steps.push_back(trim_copy(config_string(code, "routing_steps")));
    } else if (key == "workday_type") {
      cfg.workday_type = trim_copy(config_string(v, "workday_type"));
    } else if (key == "receipt_key_includes_order") {
      const auto* b = v.as_bool();
      if (!b) throw std::runtime_error("config 'receipt_key_includes_order' must be a boolean");
      cfg.receipt_key_includes_order = *b;
    } else {
      log::warn("Ignoring unknown config key: " + key);
    }
  }

  validate_plan_config(cfg);
  return cfg;
}

json::Value plan_config_to_json(const PlanConfig& cfg) {
  Object o;
  o["horizon_days"] = static_cast<double>(cfg.horizon_days);
  o["lead_workdays"] = static_cast<double>(cfg.lead_workdays);
  o["order_status_open_threshold"] = static_cast<double>(cfg.order_status_open_threshold);
  o["terminal_step_code"] = cfg.terminal_step_code;
  o["terminal_step_tag"] = cfg.terminal_step_tag;
  o["availability_basis"] = std::string(availability_basis_to_string(cfg.availability_basis));
  Array steps;
  for (const auto& s : cfg.routing_steps) steps.push_back(s);
  o["routing_steps"] = json::array(std::move(steps));
  o["workday_type"] = cfg.workday_type;
  o["receipt_key_includes_order"] = cfg.receipt_key_includes_order;
  return json::object(std::move(o));
}

} // namespace partplan
