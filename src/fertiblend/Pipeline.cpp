// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#include "fertiblend/Pipeline.h"

#include <iomanip>
#include <iostream>
#include <utility>

#include "fertiblend/Optimizer.h"

namespace fertiblend {

namespace {

void LogPrecheck(const PrecheckReport& report) {
  const std::ios::fmtflags flags = std::cout.flags();
  const std::streamsize precision = std::cout.precision();
  std::cout << std::fixed << std::setprecision(2);
  for (const auto& fb : report.fields) {
    std::cout << "[precheck] field=" << fb.field;
    for (Nutrient n : kAllNutrients) {
      const std::size_t i = NutrientIndex(n);
      std::cout << " " << NutrientName(n) << "=" << fb.required[i] << "/" << fb.achievable[i];
    }
    std::cout << "\n";
  }
  std::cout << "[precheck] min_dose_sum=" << report.min_dose_sum
            << " findings=" << report.diagnostics.size() << "\n";
  std::cout.flags(flags);
  std::cout.precision(precision);
}

} // namespace

bool RunScenario(const InputTables& tables, ScenarioParameters params,
                 const PipelineOptions& opt, ScenarioResult* out, Error* err,
                 PrecheckReport* precheck) {
  if (!out) return SetError(err, ErrorKind::kInvalidParameters, "null output result");
  if (!ValidateScenario(params, err)) return false;
  if (!ValidateCropReferences(tables, err)) return false;

  PrecheckReport report;
  const bool feasible = RunPrecheck(tables, params, &report, err);
  if (opt.debug) LogPrecheck(report);
  if (precheck) *precheck = report;
  if (!feasible) return false;

  OptimizerOptions oopt;
  oopt.debug = opt.debug;
  BlendSolution solution;
  if (!SolveBlend(tables, params, oopt, &solution, err)) return false;

  ScenarioResult result;
  if (!ExtractResult(tables, params, solution, &result, err)) return false;
  if (opt.debug) {
    std::cout << "[extract] scenario=" << (params.tag.empty() ? "-" : params.tag)
              << " rows=" << result.doses.size() << " total_cost=" << result.total_cost_rounded
              << " objective=" << result.objective << "\n";
  }
  *out = std::move(result);
  return true;
}

bool RunScenarioFromFiles(const InputPaths& inputs, const ScenarioParameters& params,
                          const OutputPaths& outputs, const PipelineOptions& opt,
                          ScenarioResult* out, Error* err) {
  if (!ValidateScenario(params, err)) return false;
  if (!RemoveOutputs(outputs, err)) return false;

  InputPaths effective = inputs;
  if (!params.requirements_override.empty()) effective.requirements = params.requirements_override;

  InputTables tables;
  if (!LoadInputTables(effective, &tables, err)) return false;
  if (opt.debug) {
    std::cout << "[load] fields=" << tables.fields.size() << " crops=" << tables.requirements.size()
              << " products=" << tables.products.size() << " requirements=" << effective.requirements << "\n";
  }

  ScenarioResult result;
  if (!RunScenario(tables, params, opt, &result, err)) return false;
  if (!WriteScenarioOutputs(result, params, outputs, err)) return false;
  if (out) *out = std::move(result);
  return true;
}

void RunScenarioBatch(const InputPaths& inputs, const std::vector<ScenarioParameters>& scenarios,
                      const std::string& out_dir, bool write_report, const PipelineOptions& opt,
                      BatchOutcome* out) {
  if (!out) return;
  BatchOutcome outcome;
  for (const auto& params : scenarios) {
    OutputPaths paths = DefaultOutputPaths(out_dir, params.tag);
    if (write_report) paths.report_json = DefaultReportPath(out_dir, params.tag);
    ScenarioResult result;
    Error err;
    if (RunScenarioFromFiles(inputs, params, paths, opt, &result, &err)) {
      outcome.results.push_back(std::move(result));
    } else {
      outcome.failures.push_back(ScenarioFailure{params.tag, std::move(err)});
    }
  }
  *out = std::move(outcome);
}

bool CompareFirstTwo(const BatchOutcome& outcome, ScenarioComparison* out) {
  if (outcome.results.size() < 2) return false;
  if (out) *out = CompareScenarios(outcome.results[0], outcome.results[1]);
  return true;
}

} // namespace fertiblend
