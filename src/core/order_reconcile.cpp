#include "partplan/core/order_reconcile.h"

#include <algorithm>
#include <sstream>
#include <unordered_set>

#include "partplan/core/part_key.h"
#include "partplan/util/log.h"
#include "partplan/util/lookup.h"
#include "partplan/util/strings.h"

namespace partplan {
namespace {

// Unit separator; never appears in ERP key columns.
constexpr char kSep = '\x1f';

std::string join_key(const std::string& a, const std::string& b) {
  std::string k;
  k.reserve(a.size() + b.size() + 1);
  k += a;
  k += kSep;
  k += b;
  return k;
}

std::string join_key(const std::string& a, const std::string& b, const std::string& c) {
  return join_key(join_key(a, b), c);
}

struct PurchaseRef {
  std::string order_key;
  std::string po;
  std::string release;
  double ordered{0.0};
};

struct OpenLine {
  std::string order_key;
  std::string line_key;
  double backlog{0.0};
};

// Purchase lines by (order, line) plus receipts summed per (po, release).
struct MaterialIndex {
  bool receipt_key_includes_order{false};
  std::unordered_map<std::string, std::vector<PurchaseRef>> by_order_line;
  std::unordered_map<std::string, double> receipt_sum;
  std::unordered_map<std::string, int> receipt_rows;

  std::string receipt_key(const std::string& order_key, const std::string& po, const std::string& release) const {
    return receipt_key_includes_order ? join_key(order_key, po, release) : join_key(po, release);
  }
  std::string receipt_key(const PurchaseRef& p) const { return receipt_key(p.order_key, p.po, p.release); }

  const std::vector<PurchaseRef>& matches(const OpenLine& line) const {
    return util::find_or_empty(by_order_line, join_key(line.order_key, line.line_key));
  }
};

MaterialIndex build_material_index(const std::vector<MaterialPurchaseLine>& purchases,
                                   const std::vector<MaterialReceiptLine>& receipts, const ReconcileOptions& opt,
                                   ReconcileStats& st) {
  MaterialIndex idx;
  idx.receipt_key_includes_order = opt.receipt_key_includes_order;

  for (const auto& p : purchases) {
    ++st.purchase_lines;
    const std::string line_key = canonical_line_key(p.line_id);
    if (is_sentinel_line_key(line_key)) ++st.sentinel_purchase_lines;

    PurchaseRef ref;
    ref.order_key = canonical_order_key(p.order_id);
    ref.po = normalize_part_key(p.po_number);
    ref.release = normalize_part_key(p.release_number);
    ref.ordered = p.ordered_qty;
    idx.by_order_line[join_key(ref.order_key, line_key)].push_back(std::move(ref));
  }

  // Partial deliveries collapse to one figure per purchase line before any join.
  for (const auto& r : receipts) {
    ++st.receipt_rows;
    const std::string key = idx.receipt_key(canonical_order_key(r.order_id), normalize_part_key(r.po_number),
                                            normalize_part_key(r.release_number));
    util::accumulate(idx.receipt_sum, key, r.delivered_qty);
    ++idx.receipt_rows[key];
  }
  st.receipt_keys = static_cast<int>(idx.receipt_sum.size());
  return idx;
}

std::unordered_map<std::string, std::vector<OpenLine>> open_lines_by_part(
    const std::vector<OpenManufacturingOrder>& orders, const ReconcileOptions& opt, ReconcileStats& st) {
  std::unordered_map<std::string, std::vector<OpenLine>> out;
  for (const auto& o : orders) {
    ++st.orders_read;
    if (o.status >= opt.open_status_threshold) continue;
    if (o.part.empty()) continue;
    ++st.orders_open;

    OpenLine line;
    line.order_key = canonical_order_key(o.order_id);
    line.line_key = canonical_line_key(o.line_id);
    line.backlog = o.backlog();
    if (is_sentinel_line_key(line.line_key)) ++st.sentinel_order_lines;
    out[o.part].push_back(std::move(line));
  }
  return out;
}

ReconcileResult reconcile_part(const std::string& part, const std::vector<OpenLine>& lines,
                               const MaterialIndex& idx, ReconcileStats& st) {
  ReconcileResult r;
  r.part = part;
  r.open_lines = static_cast<int>(lines.size());
  for (const auto& line : lines) r.backlog += line.backlog;

  // A purchase line can be reached from several order lines (duplicate SFC
  // rows); count its ordered quantity once. Receipt totals are keyed more
  // coarsely than purchase lines, so each is added at most once per part.
  std::unordered_set<std::string> seen;
  std::unordered_set<std::string> seen_receipts;
  for (const auto& line : lines) {
    for (const auto& p : idx.matches(line)) {
      if (!seen.insert(join_key(p.order_key, p.po, p.release)).second) {
        ++st.duplicate_purchase_matches;
        continue;
      }
      r.purchase_ordered += p.ordered;
      const std::string rkey = idx.receipt_key(p);
      if (!seen_receipts.insert(rkey).second) {
        ++st.shared_receipt_keys;
        continue;
      }
      r.received += util::value_or_zero(idx.receipt_sum, rkey);
    }
  }
  r.matched_purchase_lines = static_cast<int>(seen.size());

  if (r.has_material_tracking()) {
    r.startable = std::max(0.0, r.backlog - r.unfulfilled_material());
  } else {
    r.startable = std::max(0.0, r.backlog);
  }
  return r;
}

} // namespace

std::unordered_map<std::string, ReconcileResult> reconcile(const std::vector<OpenManufacturingOrder>& orders,
                                                           const std::vector<MaterialPurchaseLine>& purchases,
                                                           const std::vector<MaterialReceiptLine>& receipts,
                                                           const ReconcileOptions& opt, ReconcileStats* stats) {
  ReconcileStats st;
  const MaterialIndex idx = build_material_index(purchases, receipts, opt, st);
  const auto lines = open_lines_by_part(orders, opt, st);

  std::unordered_map<std::string, ReconcileResult> out;
  out.reserve(lines.size());
  for (const auto& [part, part_lines] : lines) {
    out.emplace(part, reconcile_part(part, part_lines, idx, st));
  }

  if (st.sentinel_order_lines > 0 || st.sentinel_purchase_lines > 0) {
    log::debug("reconcile: unparsable line numbers (orders=" + std::to_string(st.sentinel_order_lines) +
               ", purchase lines=" + std::to_string(st.sentinel_purchase_lines) + ") mapped to sentinel");
  }
  if (st.shared_receipt_keys > 0) {
    log::debug("reconcile: " + std::to_string(st.shared_receipt_keys) +
               " receipt totals shared between purchase lines counted once");
  }
  if (st.duplicate_purchase_matches > 0) {
    log::debug("reconcile: collapsed " + std::to_string(st.duplicate_purchase_matches) +
               " duplicate purchase-line matches");
  }
  if (stats) *stats = st;
  return out;
}

std::unordered_map<std::string, double> startable_by_part(const std::vector<OpenManufacturingOrder>& orders,
                                                          const std::vector<MaterialPurchaseLine>& purchases,
                                                          const std::vector<MaterialReceiptLine>& receipts,
                                                          const ReconcileOptions& opt) {
  std::unordered_map<std::string, double> out;
  for (const auto& [part, r] : reconcile(orders, purchases, receipts, opt)) out.emplace(part, r.startable);
  return out;
}

ReconcileTrace trace_reconcile(const std::string& part, const std::vector<OpenManufacturingOrder>& orders,
                               const std::vector<MaterialPurchaseLine>& purchases,
                               const std::vector<MaterialReceiptLine>& receipts, const ReconcileOptions& opt) {
  ReconcileTrace trace;
  trace.part = part;
  trace.result.part = part;

  ReconcileStats st;
  const MaterialIndex idx = build_material_index(purchases, receipts, opt, st);
  const auto by_part = open_lines_by_part(orders, opt, st);
  const auto it = by_part.find(part);
  if (it == by_part.end()) return trace;

  std::vector<OpenLine> lines = it->second;
  std::stable_sort(lines.begin(), lines.end(), [](const OpenLine& a, const OpenLine& b) {
    if (a.order_key != b.order_key) return a.order_key < b.order_key;
    return a.line_key < b.line_key;
  });

  trace.result = reconcile_part(part, lines, idx, st);

  double naive_received = 0.0;
  for (const auto& line : lines) {
    const auto& matches = idx.matches(line);
    if (matches.empty()) {
      ++trace.unmatched_lines;
      ReconcileTraceRow row;
      row.order_key = line.order_key;
      row.line_key = line.line_key;
      row.backlog = line.backlog;
      trace.rows.push_back(std::move(row));
      continue;
    }
    for (const auto& p : matches) {
      ReconcileTraceRow row;
      row.order_key = line.order_key;
      row.line_key = line.line_key;
      row.backlog = line.backlog;
      row.matched = true;
      row.po_number = p.po;
      row.release_number = p.release;
      row.purchase_ordered = p.ordered;
      row.received = util::value_or_zero(idx.receipt_sum, idx.receipt_key(p));
      row.receipt_rows = util::value_or_zero(idx.receipt_rows, idx.receipt_key(p));

      // Joined against raw receipts, the purchase line repeats once per receipt row.
      trace.naive_purchase_ordered += p.ordered * std::max(1, row.receipt_rows);
      naive_received += row.received;
      trace.rows.push_back(std::move(row));
    }
  }
  trace.naive_startable =
      std::max(0.0, trace.result.backlog - (trace.naive_purchase_ordered - naive_received));
  return trace;
}

std::string format_reconcile_trace(const ReconcileTrace& t) {
  std::ostringstream ss;
  ss << "Part " << t.part << ": " << t.result.open_lines << " open order lines, " << t.unmatched_lines
     << " without a purchase line\n";
  if (t.outside_universe) ss << "  (not in the planning universe; the report does not use these figures)\n";
  for (const auto& r : t.rows) {
    ss << "  order " << r.order_key << " line " << r.line_key << " backlog " << format_quantity(r.backlog);
    if (!r.matched) {
      ss << "  (no purchase line)\n";
      continue;
    }
    ss << "  po " << r.po_number << "/" << r.release_number << " ordered " << format_quantity(r.purchase_ordered)
       << " received " << format_quantity(r.received) << " (" << r.receipt_rows << " receipts)\n";
  }
  ss << "  A backlog            = " << format_quantity(t.result.backlog) << "\n";
  ss << "  B ordered (naive)    = " << format_quantity(t.naive_purchase_ordered) << "\n";
  ss << "  B ordered (dedup)    = " << format_quantity(t.result.purchase_ordered) << "\n";
  ss << "  C received           = " << format_quantity(t.result.received) << "\n";
  ss << "  startable (naive)    = " << format_quantity(t.naive_startable) << "\n";
  ss << "  startable            = " << format_quantity(t.result.startable) << "\n";
  return ss.str();
}

} // namespace partplan
