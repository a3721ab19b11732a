#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

#include "partplan/core/date.h"
#include "partplan/core/order_reconcile.h"
#include "partplan/core/plan_config.h"
#include "partplan/core/planner.h"
#include "partplan/core/report.h"
#include "partplan/core/serialization.h"
#include "partplan/util/file_io.h"
#include "partplan/util/log.h"
#include "partplan/util/strings.h"

namespace {

#ifndef PARTPLAN_VERSION
#define PARTPLAN_VERSION "unknown"
#endif

// Thrown for bad command lines; main() maps it to exit code 2.
struct UsageError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

int get_int_arg(int argc, char** argv, const std::string& key, int def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] != key) continue;
    double v = 0.0;
    if (!partplan::parse_number(argv[i + 1], v) || std::fabs(v) > 1e9 || v != std::trunc(v)) {
      throw UsageError(key + " expects an integer (got \"" + std::string(argv[i + 1]) + "\")");
    }
    return static_cast<int>(v);
  }
  return def;
}

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_kv_arg(int argc, char** argv, const std::string& key) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return true;
  }
  return false;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

void print_usage(const char* exe) {
  std::cout << "partplan CLI v" << PARTPLAN_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "partplan_cli") << " --snapshot PATH [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --snapshot PATH        Plant snapshot JSON (required)\n";
  std::cout << "  --config PATH          Planning config JSON (optional)\n";
  std::cout << "  --today YYYY-MM-DD     Planning date (default: snapshot as_of, else the local date)\n";
  std::cout << "  --horizon N            Demand horizon in days (default: 60)\n";
  std::cout << "  --lead N               Lead time in workdays before the shortage (default: 5)\n";
  std::cout << "  --status-threshold N   Orders are open while status < N (default: 6)\n";
  std::cout << "  --out PATH             Write the shortage report CSV here (default: stdout)\n";
  std::cout << "  --json PATH            Also write the report as JSON\n";
  std::cout << "  --demand-csv PATH      Also write the child requirements table as CSV\n";
  std::cout << "  --archive-dir DIR      Keep timestamped copies of every file written\n";
  std::cout << "  --explain PART         Print how PART's startable quantity was reached\n";
  std::cout << "  --log-level LEVEL      debug|info|warn|error|off (default: info)\n";
  std::cout << "  --quiet                Only log errors\n";
  std::cout << "  -h, --help             Show this help\n";
  std::cout << "  --version              Print version and exit\n";
}

int run(int argc, char** argv) {
  const std::string snapshot_path = get_str_arg(argc, argv, "--snapshot", "");
  if (snapshot_path.empty()) throw UsageError("--snapshot is required");

  const std::string config_path = get_str_arg(argc, argv, "--config", "");
  const std::string out_path = get_str_arg(argc, argv, "--out", "");
  const std::string json_path = get_str_arg(argc, argv, "--json", "");
  const std::string demand_path = get_str_arg(argc, argv, "--demand-csv", "");
  const std::string archive_dir = get_str_arg(argc, argv, "--archive-dir", "");
  const std::string explain_target = get_str_arg(argc, argv, "--explain", "");

  partplan::PlanConfig cfg;
  if (!config_path.empty()) cfg = partplan::plan_config_from_json(partplan::read_text_file(config_path));
  cfg.horizon_days = get_int_arg(argc, argv, "--horizon", cfg.horizon_days);
  cfg.lead_workdays = get_int_arg(argc, argv, "--lead", cfg.lead_workdays);
  cfg.order_status_open_threshold =
      get_int_arg(argc, argv, "--status-threshold", cfg.order_status_open_threshold);
  partplan::validate_plan_config(cfg);

  partplan::LoadStats load_stats;
  const auto inputs =
      partplan::load_plan_inputs_from_json(partplan::read_text_file(snapshot_path), cfg.workday_type, &load_stats);
  if (load_stats.status_out_of_range > 0) {
    partplan::log::warn(std::to_string(load_stats.status_out_of_range) +
                        " order rows carry an out-of-range status; loaded as closed");
  }
  if (load_stats.receipt_bad_date > 0) {
    partplan::log::warn(std::to_string(load_stats.receipt_bad_date) + " receipt rows carry an unparsable date");
  }

  partplan::Date today;
  if (has_kv_arg(argc, argv, "--today")) {
    const auto parsed = partplan::Date::try_parse(get_str_arg(argc, argv, "--today", ""));
    if (!parsed) throw UsageError("--today expects YYYY-MM-DD");
    today = *parsed;
  } else if (inputs.as_of) {
    today = *inputs.as_of;
  } else {
    today = partplan::Date::local_today();
  }
  partplan::log::info("Planning as of " + today.to_string() + " over " + std::to_string(cfg.horizon_days) +
                      " days (lead " + std::to_string(cfg.lead_workdays) + " workdays)");

  const auto result = partplan::run_plan(inputs, cfg, today);

  const std::string stamp = archive_dir.empty() ? std::string() : partplan::archive_timestamp();
  const auto write_output = [&](const std::string& path, const std::string& text) {
    partplan::write_text_file(path, text);
    partplan::log::info("Wrote " + path);
    if (!archive_dir.empty()) {
      partplan::log::info("Archived " + partplan::archive_copy(path, archive_dir, stamp));
    }
  };

  const std::string csv = partplan::report_to_csv(result.report);
  if (out_path.empty()) {
    std::cout << csv;
  } else {
    write_output(out_path, csv);
  }
  if (!json_path.empty()) write_output(json_path, partplan::report_to_json(result.report));
  if (!demand_path.empty()) write_output(demand_path, partplan::demand_table_to_csv(result.demand));

  if (!explain_target.empty()) {
    const auto trace = partplan::explain_part(inputs, cfg, result, explain_target);
    if (trace.outside_universe) partplan::log::warn("--explain: " + trace.part + " is outside the planning universe");
    std::cerr << partplan::format_reconcile_trace(trace);
  }
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  if (has_flag(argc, argv, "--version")) {
    std::cout << PARTPLAN_VERSION << "\n";
    return 0;
  }
  if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
    print_usage(argv[0]);
    return 0;
  }

  if (has_flag(argc, argv, "--quiet")) partplan::log::set_level(partplan::log::Level::Error);
  if (has_kv_arg(argc, argv, "--log-level")) {
    partplan::log::Level lvl;
    if (!partplan::log::parse_level(get_str_arg(argc, argv, "--log-level", ""), lvl)) {
      std::cerr << "Unknown --log-level (expected debug|info|warn|error|off)\n\n";
      print_usage(argv[0]);
      return 2;
    }
    partplan::log::set_level(lvl);
  }

  try {
    return run(argc, argv);
  } catch (const UsageError& e) {
    std::cerr << e.what() << "\n\n";
    print_usage(argv[0]);
    return 2;
  } catch (const std::exception& e) {
    partplan::log::error(e.what());
    return 1;
  }
}
