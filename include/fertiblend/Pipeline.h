// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <vector>

#include "fertiblend/Compare.h"
#include "fertiblend/Errors.h"
#include "fertiblend/Loader.h"
#include "fertiblend/Precheck.h"
#include "fertiblend/Result.h"
#include "fertiblend/ResultWriter.h"
#include "fertiblend/Scenario.h"
#include "fertiblend/Tables.h"

namespace fertiblend {

struct PipelineOptions {
  bool debug = false; // bracket-tagged progress lines on stdout
};

// Precheck -> LP -> extraction for one scenario. No I/O besides optional
// debug output; the same inputs always give the same cost. `precheck` (when
// non-null) receives the bound analysis even if the run fails.
bool RunScenario(const InputTables& tables, ScenarioParameters params,
                 const PipelineOptions& opt, ScenarioResult* out, Error* err,
                 PrecheckReport* precheck = nullptr);

// File-level run: removes the scenario's stale outputs, loads inputs (using
// params.requirements_override for the requirement table when set), runs the
// scenario and writes the outputs. Nothing is written on failure.
bool RunScenarioFromFiles(const InputPaths& inputs, const ScenarioParameters& params,
                          const OutputPaths& outputs, const PipelineOptions& opt,
                          ScenarioResult* out, Error* err);

struct ScenarioFailure {
  std::string tag;
  Error error;
};

struct BatchOutcome {
  std::vector<ScenarioResult> results;   // successful runs, scenario order
  std::vector<ScenarioFailure> failures; // failed runs, scenario order

  bool all_ok() const { return failures.empty(); }
};

// Runs every scenario with outputs named by its tag under out_dir (plus
// reporte_<tag>.json when write_report is set). A failing scenario does not
// stop the ones after it.
void RunScenarioBatch(const InputPaths& inputs, const std::vector<ScenarioParameters>& scenarios,
                      const std::string& out_dir, bool write_report, const PipelineOptions& opt,
                      BatchOutcome* out);

// Comparison of the first two successful scenarios. False when fewer than two
// succeeded.
bool CompareFirstTwo(const BatchOutcome& outcome, ScenarioComparison* out);

} // namespace fertiblend
