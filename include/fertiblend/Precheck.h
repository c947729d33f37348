// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <vector>

#include "fertiblend/Errors.h"
#include "fertiblend/Scenario.h"
#include "fertiblend/Tables.h"

namespace fertiblend {

// Optimistic per-nutrient bounds for one field.
struct FieldBounds {
  std::string field;
  NutrientVector required{{0.0, 0.0, 0.0}};   // requirement x (1 - tolerance)
  NutrientVector achievable{{0.0, 0.0, 0.0}}; // upper bound on deliverable kg/ha
};

struct PrecheckReport {
  std::vector<FieldBounds> fields;       // one entry per field, input order
  double min_dose_sum = 0.0;             // sum of every product's dose_min
  std::vector<std::string> diagnostics;  // empty when nothing was flagged

  bool feasible() const { return diagnostics.empty(); }
};

// Conservative screen run before the LP. Each nutrient is bounded on its own
// (sum of dose_max x fraction, tightened to mix_capacity x best fraction, N
// clamped to the nitrogen cap). Every bound is a relaxation, so a finding
// always means the LP is infeasible; coupled limits can still slip through
// and surface as SolverNonOptimal. It also flags minimum doses that alone
// overflow the mix capacity.
//
// Fills report (when non-null) either way; returns false with
// PrecheckInfeasible and the diagnostics copied into err on any finding.
bool RunPrecheck(const InputTables& tables, const ScenarioParameters& params,
                 PrecheckReport* report, Error* err);

} // namespace fertiblend
