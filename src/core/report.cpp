#include "partplan/core/report.h"

#include <algorithm>

#include "partplan/core/shortage.h"
#include "partplan/util/json.h"
#include "partplan/util/strings.h"

namespace partplan {
namespace {

std::string date_or_empty(const std::optional<Date>& d) { return d ? d->to_string() : std::string{}; }

json::Value date_or_null(const std::optional<Date>& d) {
  if (!d) return nullptr;
  return d->to_string();
}

bool row_less(const ReportRow& a, const ReportRow& b) {
  if (a.shortage_date.has_value() != b.shortage_date.has_value()) return a.shortage_date.has_value();
  if (a.shortage_date && *a.shortage_date != *b.shortage_date) return *a.shortage_date < *b.shortage_date;
  return a.part < b.part;
}

} // namespace

std::vector<Date> Report::dates() const {
  std::vector<Date> out;
  out.reserve(static_cast<std::size_t>(days));
  for (int i = 0; i < days; ++i) out.push_back(horizon_start.add_days(i));
  return out;
}

std::string category_for_routing(const std::vector<std::string>& routing_steps, const PlanConfig& cfg) {
  if (cfg.terminal_step_code.empty()) return {};
  const bool has_step =
      std::find(routing_steps.begin(), routing_steps.end(), cfg.terminal_step_code) != routing_steps.end();
  return has_step ? cfg.terminal_step_tag : std::string{};
}

Report assemble_report(const std::vector<PartMaster>& universe, const DemandTable& demand,
                       const InventoryAggregator& inventory,
                       const std::unordered_map<std::string, ReconcileResult>& reconciled, const WorkCalendar& calendar,
                       const PlanConfig& cfg, const Date& today) {
  Report report;
  report.as_of = today;
  report.horizon_start = demand.start;
  report.days = demand.days;

  for (const auto& part : universe) {
    ++report.parts_considered;

    ReportRow row;
    row.part = part.key;
    row.part_id = part.raw_id.empty() ? part.key : part.raw_id;
    row.name = part.name;
    row.routing = join(part.routing_steps, ",");
    row.category = category_for_routing(part.routing_steps, cfg);

    row.on_hand = inventory.on_hand(part.key);
    row.theoretical = inventory.theoretical(part.key);
    row.external = inventory.external(part.key);

    const auto daily = demand.daily_for(part.key);
    row.daily.reserve(daily.size());
    for (const auto& d : daily) {
      row.daily.push_back(d.qty);
      row.horizon_demand += d.qty;
    }

    const ShortageResult shortage = detect_shortage(inventory.available(part.key, cfg.availability_basis), daily);
    if (shortage.qty >= 0.0) {
      ++report.parts_without_shortage;
      continue;
    }
    row.shortage_qty = shortage.qty;
    row.shortage_date = shortage.date;
    if (shortage.date) {
      Date due = calendar.back_offset(*shortage.date, cfg.lead_workdays);
      if (due < today) due = today;
      row.due_date = due;
    }

    const auto it = reconciled.find(part.key);
    if (it != reconciled.end()) {
      row.backlog = it->second.backlog;
      row.startable = it->second.startable;
    }

    report.rows.push_back(std::move(row));
  }

  std::sort(report.rows.begin(), report.rows.end(), row_less);
  return report;
}

const std::vector<std::string>& report_fixed_columns() {
  static const std::vector<std::string> kColumns = {
      "part_id",      "part_name",    "routing",      "category",    "on_hand",
      "shelf_theory", "external",     "shortage_date", "due_date",   "shortage_qty",
      "mfg_backlog",  "startable_qty", "horizon_demand",
  };
  return kColumns;
}

std::string report_to_csv(const Report& report) {
  const auto dates = report.dates();

  std::string csv;
  csv += join(report_fixed_columns(), ",");
  for (const auto& d : dates) csv += "," + d.to_string();
  csv += "\n";

  for (const auto& r : report.rows) {
    csv += csv_escape(r.part_id);
    csv += ",";
    csv += csv_escape(r.name);
    csv += ",";
    csv += csv_escape(r.routing);
    csv += ",";
    csv += csv_escape(r.category);
    csv += ",";
    csv += format_quantity(r.on_hand);
    csv += ",";
    csv += format_quantity(r.theoretical);
    csv += ",";
    csv += format_quantity(r.external);
    csv += ",";
    csv += date_or_empty(r.shortage_date);
    csv += ",";
    csv += date_or_empty(r.due_date);
    csv += ",";
    csv += format_quantity(r.shortage_qty);
    csv += ",";
    csv += format_quantity(r.backlog);
    csv += ",";
    csv += format_quantity(r.startable);
    csv += ",";
    csv += format_quantity(r.horizon_demand);
    for (double q : r.daily) {
      csv += ",";
      csv += format_quantity(q);
    }
    csv += "\n";
  }
  return csv;
}

std::string report_to_json(const Report& report) {
  json::Array dates;
  for (const auto& d : report.dates()) dates.push_back(d.to_string());

  json::Array rows;
  rows.reserve(report.rows.size());
  for (const auto& r : report.rows) {
    json::Object o;
    o["part_id"] = r.part_id;
    o["part_key"] = r.part;
    o["part_name"] = r.name;
    o["routing"] = r.routing;
    o["category"] = r.category;
    o["on_hand"] = r.on_hand;
    o["shelf_theory"] = r.theoretical;
    o["external"] = r.external;
    o["shortage_date"] = date_or_null(r.shortage_date);
    o["due_date"] = date_or_null(r.due_date);
    o["shortage_qty"] = r.shortage_qty;
    o["mfg_backlog"] = r.backlog;
    o["startable_qty"] = r.startable;
    o["horizon_demand"] = r.horizon_demand;

    json::Array daily;
    daily.reserve(r.daily.size());
    for (double q : r.daily) daily.push_back(q);
    o["daily"] = json::array(std::move(daily));
    rows.push_back(json::object(std::move(o)));
  }

  json::Object root;
  root["as_of"] = report.as_of.to_string();
  root["horizon_start"] = report.horizon_start.to_string();
  root["days"] = static_cast<double>(report.days);
  root["dates"] = json::array(std::move(dates));
  root["rows"] = json::array(std::move(rows));
  return json::stringify(json::object(std::move(root)), 2) + "\n";
}

std::string demand_table_to_csv(const DemandTable& table) {
  std::string csv = "part";
  for (int i = 0; i < table.days; ++i) csv += "," + table.date_at(i).to_string();
  csv += "\n";

  for (const auto& s : table.series) {
    csv += csv_escape(s.part);
    for (double q : s.qty) {
      csv += ",";
      csv += format_quantity(q);
    }
    csv += "\n";
  }
  return csv;
}

} // namespace partplan
