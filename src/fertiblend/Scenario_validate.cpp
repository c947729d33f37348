// Scenario_validate.cpp - Range validation for fertiblend::ScenarioParameters
#include "fertiblend/Scenario.h"

#include <cmath>
#include <sstream>

namespace fertiblend {

bool ValidateScenario(const ScenarioParameters& params, Error* err) {
  auto fail = [&](const char* name, double value, const char* rule) {
    std::ostringstream oss;
    oss << "scenario";
    if (!params.tag.empty()) oss << " '" << params.tag << "'";
    oss << ": " << name << " = " << value << " " << rule;
    return SetError(err, ErrorKind::kInvalidParameters, oss.str());
  };

  if (!std::isfinite(params.tolerance) || params.tolerance < 0.0 || params.tolerance >= 1.0) {
    return fail("tolerance", params.tolerance, "must be within [0, 1)");
  }
  if (!std::isfinite(params.nitrogen_cap) || params.nitrogen_cap < 0.0) {
    return fail("nitrogen_cap", params.nitrogen_cap, "must be >= 0 (0 disables)");
  }
  if (!std::isfinite(params.mix_capacity) || params.mix_capacity < 0.0) {
    return fail("mix_capacity", params.mix_capacity, "must be >= 0 (0 disables)");
  }
  if (!std::isfinite(params.application_cost) || params.application_cost < 0.0) {
    return fail("application_cost", params.application_cost, "must be >= 0");
  }
  if (!std::isfinite(params.time_limit_seconds) || params.time_limit_seconds < 0.0) {
    return fail("time_limit_seconds", params.time_limit_seconds, "must be >= 0 (0 disables)");
  }

  // Tags become part of file names.
  for (char c : params.tag) {
    if (c == '/' || c == '\\' || c == '\0') {
      return SetError(err, ErrorKind::kInvalidParameters,
                      "scenario tag '" + params.tag + "' must not contain path separators");
    }
  }
  return true;
}

} // namespace fertiblend
