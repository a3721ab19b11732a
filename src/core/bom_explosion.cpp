#include "partplan/core/bom_explosion.h"

#include <algorithm>
#include <map>
#include <tuple>
#include <utility>

#include "partplan/util/log.h"
#include "partplan/util/lookup.h"

namespace partplan {

BomIndex::BomIndex(const std::vector<BomLine>& lines) {
  for (const auto& l : lines) {
    if (l.parent.empty() || l.child.empty()) continue;
    by_parent_[l.parent].push_back(l);
    ++line_count_;
  }
}

const std::vector<BomLine>& BomIndex::children_of(const std::string& parent) const {
  return util::find_or_empty(by_parent_, parent);
}

std::vector<ChildDemandEntry> explode(const std::vector<ProductionPlanEntry>& plan, const BomIndex& bom,
                                      ExplosionStats* stats) {
  ExplosionStats local;
  std::map<std::pair<std::string, std::int64_t>, double> agg;

  for (const auto& entry : plan) {
    ++local.plan_entries;
    const auto& lines = bom.children_of(entry.parent);
    if (lines.empty()) {
      ++local.parents_without_bom;
      continue;
    }
    for (const auto& line : lines) {
      agg[{line.child, entry.date.days_since_epoch()}] += line.per_unit_qty * entry.quantity;
    }
  }

  std::vector<ChildDemandEntry> out;
  out.reserve(agg.size());
  for (const auto& [key, qty] : agg) {
    out.push_back(ChildDemandEntry{key.first, Date(key.second), qty});
  }
  local.demand_records = static_cast<int>(out.size());

  if (local.parents_without_bom > 0) {
    log::debug("explode: " + std::to_string(local.parents_without_bom) + " plan entries have no BOM lines");
  }
  if (stats) *stats = local;
  return out;
}

std::vector<ChildDemandEntry> explode(const std::vector<ProductionPlanEntry>& plan, const std::vector<BomLine>& bom) {
  return explode(plan, BomIndex(bom));
}

double DemandSeries::total() const {
  double t = 0.0;
  for (double q : qty) t += q;
  return t;
}

const DemandSeries* DemandTable::find(const std::string& part) const {
  const auto it = std::lower_bound(series.begin(), series.end(), part,
                                   [](const DemandSeries& s, const std::string& p) { return s.part < p; });
  if (it == series.end() || it->part != part) return nullptr;
  return &*it;
}

std::vector<DailyQty> DemandTable::daily_for(const std::string& part) const {
  const DemandSeries* s = find(part);
  std::vector<DailyQty> out;
  out.reserve(static_cast<std::size_t>(days));
  for (int i = 0; i < days; ++i) {
    out.push_back(DailyQty{date_at(i), s ? s->qty[static_cast<std::size_t>(i)] : 0.0});
  }
  return out;
}

DemandTable densify(const std::vector<ChildDemandEntry>& entries, const Date& today, int horizon_days) {
  DemandTable table;
  table.start = today;
  table.days = std::max(0, horizon_days) + 1;

  std::map<std::string, std::vector<double>> by_part;
  for (const auto& e : entries) {
    auto& qty = by_part[e.child];
    if (qty.empty()) qty.assign(static_cast<std::size_t>(table.days), 0.0);

    const std::int64_t offset = e.date.days_since(today);
    if (offset < 0 || offset >= table.days) {
      ++table.dropped_out_of_horizon;
      continue;
    }
    qty[static_cast<std::size_t>(offset)] += e.quantity;
  }

  table.series.reserve(by_part.size());
  for (auto& [part, qty] : by_part) {
    table.series.push_back(DemandSeries{part, std::move(qty)});
  }
  return table;
}

} // namespace partplan
