#include "partplan/core/plan_config.h"

#include <stdexcept>

#include "partplan/util/strings.h"

namespace partplan {

void validate_plan_config(const PlanConfig& cfg) {
  if (cfg.horizon_days < 0) {
    throw std::runtime_error("horizon_days must be >= 0 (got " + std::to_string(cfg.horizon_days) + ")");
  }
  // Guards the daily bucket allocation.
  if (cfg.horizon_days > 3660) {
    throw std::runtime_error("horizon_days too large (got " + std::to_string(cfg.horizon_days) + ")");
  }
  if (cfg.lead_workdays < 0) {
    throw std::runtime_error("lead_workdays must be >= 0 (got " + std::to_string(cfg.lead_workdays) + ")");
  }
}

const char* availability_basis_to_string(AvailabilityBasis b) {
  switch (b) {
    case AvailabilityBasis::All: return "all";
    case AvailabilityBasis::OnHandOnly: return "on_hand";
  }
  return "all";
}

bool availability_basis_from_string(const std::string& s, AvailabilityBasis& out) {
  const std::string t = to_lower(trim_copy(s));
  if (t == "all") {
    out = AvailabilityBasis::All;
    return true;
  }
  if (t == "on_hand" || t == "onhand") {
    out = AvailabilityBasis::OnHandOnly;
    return true;
  }
  return false;
}

} // namespace partplan
