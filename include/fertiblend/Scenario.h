// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <vector>

#include "fertiblend/Errors.h"

namespace fertiblend {

// One complete parameter set. Passed by value into the pipeline; nothing is
// read from process-wide state, so scenario runs stay independent.
struct ScenarioParameters {
  std::string tag;                   // namespaces output files, e.g. "A"
  double nitrogen_cap = 0.0;         // kg N/ha, 0 = disabled
  double mix_capacity = 0.0;         // total kg/ha of all products, 0 = disabled
  double tolerance = 0.02;           // fraction of requirement allowed unmet, [0,1)
  double application_cost = 0.0;     // per tonne applied, 0 = none
  std::string requirements_override; // alternate requirement table (e.g. soil-adjusted)
  double time_limit_seconds = 0.0;   // LP wall-clock limit, 0 = unlimited

  bool HasNitrogenCap() const { return nitrogen_cap > 0.0; }
  bool HasMixCapacity() const { return mix_capacity > 0.0; }
  bool HasTimeLimit() const { return time_limit_seconds > 0.0; }
};

// Range checks independent of how the parameters were obtained.
bool ValidateScenario(const ScenarioParameters& params, Error* err);

// Scenario files hold {"scenarios": [{"tag": "A", "nmax": 300, ...}, ...]}.
// Keys: tag, nmax, mixmax, tol | tol_pct, costoap, requirements, time_limit.
bool LoadScenariosFromJsonString(const std::string& json,
                                 std::vector<ScenarioParameters>* out,
                                 Error* err);
bool LoadScenariosFromFile(const std::string& path,
                           std::vector<ScenarioParameters>* out,
                           Error* err);

} // namespace fertiblend
