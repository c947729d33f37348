// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <vector>

#include "fertiblend/Errors.h"
#include "fertiblend/Scenario.h"
#include "fertiblend/Tables.h"

namespace fertiblend {

struct OptimizerOptions {
  bool debug = false; // print model size and solve status to stdout
};

// Raw LP outcome. dose[f][p] follows tables.fields x tables.product_order.
struct BlendSolution {
  std::vector<std::vector<double>> dose;
  double objective = 0.0;
  std::string status;     // solver status name, "OPTIMAL" on success
  double wall_time_ms = 0.0;
  int num_variables = 0;
  int num_constraints = 0;
};

// Monetary cost of one kg of product applied: product price plus the optional
// application cost, both per tonne. The objective and the reported total use
// this same term.
double CostPerKg(const Product& product, const ScenarioParameters& params);

// Error kind for a finished solve, from the solver status name and elapsed
// time: kNone for OPTIMAL, SolverTimeout when the solver stopped without a
// proof (NOT_SOLVED or FEASIBLE) after reaching the time limit,
// SolverNonOptimal otherwise.
ErrorKind ClassifySolveStatus(const std::string& status, double wall_ms, const ScenarioParameters& params);

// Builds and solves the blend LP:
//   min  sum_f sum_p x[f,p] * area[f] * CostPerKg(p)
//   s.t. sum_p x[f,p] * frac_n(p) >= req_n(crop f) * (1 - tolerance)   per nutrient n
//        sum_p x[f,p] <= mix_capacity                                   if set
//        sum_p x[f,p] * frac_N(p) <= nitrogen_cap                       if set
//        dose_min(p) <= x[f,p] <= dose_max(p)
// Any status other than OPTIMAL is an error, classified by
// ClassifySolveStatus. out is untouched on failure.
bool SolveBlend(const InputTables& tables, const ScenarioParameters& params,
                const OptimizerOptions& opt, BlendSolution* out, Error* err);

} // namespace fertiblend
