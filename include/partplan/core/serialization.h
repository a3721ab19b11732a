#pragma once

#include <string>

#include "partplan/core/plan_config.h"
#include "partplan/core/planner.h"
#include "partplan/util/json.h"

namespace partplan {

// Rows the loader discarded. Per-row problems never fail a load.
struct LoadStats {
  int plan_bad_date{0};
  int calendar_bad_date{0};
  int receipt_bad_date{0};
  int rows_missing_part{0};
  int rows_malformed{0};
  // Order status beyond int range, loaded as closed.
  int status_out_of_range{0};
};

// Parse a plant snapshot (see data/sample_snapshot.json for the layout).
//
// Every section is optional. Numeric fields accept numbers or numeric strings;
// anything unparsable loads as 0. Part, warehouse and order identifiers accept
// strings or numbers. Calendar entries use "shutdown" when present, otherwise
// compare "day_type" against `workday_type`.
//
// Throws std::runtime_error if the text isn't JSON, the root isn't an object,
// or a present section isn't an array.
PlanInputs load_plan_inputs_from_json(const std::string& json_text, const std::string& workday_type = "MPS",
                                      LoadStats* stats = nullptr);

// Apply the keys of a config document on top of `base`. Unknown keys are
// logged and ignored; a known key with the wrong type throws
// std::runtime_error. The result is validated.
PlanConfig plan_config_from_json(const std::string& json_text, PlanConfig base = {});

json::Value plan_config_to_json(const PlanConfig& cfg);

// Text form of a scalar JSON field: strings as-is, integral numbers without a
// fraction ("10"), other numbers with up to 15 significant digits, everything
// else "".
std::string json_scalar_text(const json::Value& v);

// Numeric form of a scalar JSON field: numbers as-is, numeric strings parsed,
// everything else 0.
double json_scalar_number(const json::Value& v);

} // namespace partplan
