// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#include "fertiblend/Optimizer.h"

#include <cmath>
#include <cstdint>
#include <iostream>
#include <memory>
#include <sstream>

#include "absl/time/time.h"
#include "ortools/linear_solver/linear_solver.h"

namespace fertiblend {

namespace {

using operations_research::MPConstraint;
using operations_research::MPObjective;
using operations_research::MPSolver;
using operations_research::MPSolverParameters;
using operations_research::MPVariable;

const char* StatusName(MPSolver::ResultStatus status) {
  switch (status) {
    case MPSolver::OPTIMAL: return "OPTIMAL";
    case MPSolver::FEASIBLE: return "FEASIBLE";
    case MPSolver::INFEASIBLE: return "INFEASIBLE";
    case MPSolver::UNBOUNDED: return "UNBOUNDED";
    case MPSolver::ABNORMAL: return "ABNORMAL";
    case MPSolver::MODEL_INVALID: return "MODEL_INVALID";
    case MPSolver::NOT_SOLVED: return "NOT_SOLVED";
  }
  return "UNKNOWN";
}

} // namespace

ErrorKind ClassifySolveStatus(const std::string& status, double wall_ms, const ScenarioParameters& params) {
  if (status == "OPTIMAL") return ErrorKind::kNone;
  // GLOP stops at a limit without a proof: no solution yet or a feasible one.
  const bool stopped_early = status == "NOT_SOLVED" || status == "FEASIBLE";
  if (stopped_early && params.HasTimeLimit() && wall_ms >= params.time_limit_seconds * 1000.0) {
    return ErrorKind::kSolverTimeout;
  }
  return ErrorKind::kSolverNonOptimal;
}

double CostPerKg(const Product& product, const ScenarioParameters& params) {
  double per_tonne = product.price_per_tonne;
  if (params.application_cost > 0.0) per_tonne += params.application_cost;
  return per_tonne / kKgPerTonne;
}

bool SolveBlend(const InputTables& tables, const ScenarioParameters& params,
                const OptimizerOptions& opt, BlendSolution* out, Error* err) {
  if (!out) return SetError(err, ErrorKind::kSolverNonOptimal, "null output solution");
  if (tables.fields.empty() || tables.product_order.empty()) {
    return SetError(err, ErrorKind::kInvalidInput, "blend model needs at least one field and one product");
  }

  std::unique_ptr<MPSolver> solver(MPSolver::CreateSolver("GLOP"));
  if (!solver) {
    return SetError(err, ErrorKind::kSolverNonOptimal, "GLOP linear solver is not available in this OR-Tools build");
  }
  const double infinity = solver->infinity();

  // Same algorithm every run so repeated solves land on the same vertex.
  MPSolverParameters solve_params;
  solve_params.SetIntegerParam(MPSolverParameters::LP_ALGORITHM, MPSolverParameters::DUAL_SIMPLEX);
  if (params.HasTimeLimit()) {
    solver->SetTimeLimit(absl::Milliseconds(static_cast<int64_t>(std::ceil(params.time_limit_seconds * 1000.0))));
  }

  const std::size_t F = tables.fields.size();
  const std::size_t P = tables.product_order.size();
  std::vector<std::vector<MPVariable*>> x(F, std::vector<MPVariable*>(P, nullptr));
  MPObjective* const objective = solver->MutableObjective();
  objective->SetMinimization();

  for (std::size_t f = 0; f < F; ++f) {
    const Field& field = tables.fields[f];
    const CropRequirement* req = tables.FindRequirement(field.crop);
    if (!req) {
      return SetError(err, ErrorKind::kUnknownCrop,
                      "field '" + field.id + "' references crop '" + field.crop + "' absent from the requirement table");
    }

    for (std::size_t p = 0; p < P; ++p) {
      const Product& product = tables.products.at(tables.product_order[p]);
      x[f][p] = solver->MakeNumVar(product.dose_min, product.dose_max, "x_" + field.id + "_" + product.id);
      objective->SetCoefficient(x[f][p], field.area_ha * CostPerKg(product, params));
    }

    for (Nutrient n : kAllNutrients) {
      const double required = req->kg_per_ha[NutrientIndex(n)] * (1.0 - params.tolerance);
      MPConstraint* const row = solver->MakeRowConstraint(required, infinity, std::string(NutrientName(n)) + "_min_" + field.id);
      for (std::size_t p = 0; p < P; ++p) {
        row->SetCoefficient(x[f][p], tables.products.at(tables.product_order[p]).Fraction(n));
      }
    }

    if (params.HasMixCapacity()) {
      MPConstraint* const mix = solver->MakeRowConstraint(-infinity, params.mix_capacity, "mix_" + field.id);
      for (std::size_t p = 0; p < P; ++p) mix->SetCoefficient(x[f][p], 1.0);
    }

    if (params.HasNitrogenCap()) {
      MPConstraint* const ncap = solver->MakeRowConstraint(-infinity, params.nitrogen_cap, "N_max_" + field.id);
      for (std::size_t p = 0; p < P; ++p) {
        ncap->SetCoefficient(x[f][p], tables.products.at(tables.product_order[p]).Fraction(Nutrient::kN));
      }
    }
  }

  if (opt.debug) {
    std::cout << "[lp] scenario=" << (params.tag.empty() ? "-" : params.tag)
              << " vars=" << solver->NumVariables() << " rows=" << solver->NumConstraints()
              << " tol=" << params.tolerance << " mix=" << params.mix_capacity
              << " nmax=" << params.nitrogen_cap << "\n";
  }

  const MPSolver::ResultStatus status = solver->Solve(solve_params);
  const double wall_ms = static_cast<double>(solver->wall_time());

  if (opt.debug) {
    std::cout << "[lp] status=" << StatusName(status) << " wall_ms=" << wall_ms;
    if (status == MPSolver::OPTIMAL) std::cout << " objective=" << objective->Value();
    std::cout << "\n";
  }

  const ErrorKind kind = ClassifySolveStatus(StatusName(status), wall_ms, params);
  if (kind == ErrorKind::kSolverTimeout) {
    std::ostringstream oss;
    oss << "LP solve stopped at the " << params.time_limit_seconds << " s time limit with status "
        << StatusName(status);
    return SetError(err, kind, oss.str());
  }
  if (kind != ErrorKind::kNone) {
    return SetError(err, kind, std::string("LP solve returned status ") + StatusName(status));
  }

  BlendSolution sol;
  sol.dose.assign(F, std::vector<double>(P, 0.0));
  for (std::size_t f = 0; f < F; ++f) {
    for (std::size_t p = 0; p < P; ++p) sol.dose[f][p] = x[f][p]->solution_value();
  }
  sol.objective = objective->Value();
  sol.status = StatusName(status);
  sol.wall_time_ms = wall_ms;
  sol.num_variables = solver->NumVariables();
  sol.num_constraints = solver->NumConstraints();
  *out = std::move(sol);
  return true;
}

} // namespace fertiblend
