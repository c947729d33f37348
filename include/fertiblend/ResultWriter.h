// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <vector>

#include "fertiblend/Errors.h"
#include "fertiblend/Result.h"
#include "fertiblend/Scenario.h"
#include "fertiblend/Tables.h"

namespace fertiblend {

struct OutputPaths {
  std::string dose_csv;    // potrero,producto,kg_ha
  std::string summary_txt; // "Costo total (CLP): <int>"
  std::string report_json; // optional, empty = not written
};

// <dir>/resultados_dosis_<tag>.csv and <dir>/_resumen_<tag>.txt; untagged
// runs drop the suffix.
OutputPaths DefaultOutputPaths(const std::string& dir, const std::string& tag);
std::string DefaultReportPath(const std::string& dir, const std::string& tag); // reporte_<tag>.json

// Deletes any existing output files so a failed run never leaves stale ones.
bool RemoveOutputs(const OutputPaths& paths, Error* err);

std::string FormatCostSummary(long long total_cost);

bool WriteDoseTable(const ScenarioResult& result, const std::string& path, Error* err);
bool WriteCostSummary(const ScenarioResult& result, const std::string& path, Error* err);

// JSON report with parameters, status, cost, doses and per-field supply.
bool WriteRunReport(const ScenarioResult& result, const ScenarioParameters& params,
                    const std::string& path, Error* err);

// Writes every non-empty path of `paths`; removes what it wrote if a later
// write fails.
bool WriteScenarioOutputs(const ScenarioResult& result, const ScenarioParameters& params,
                          const OutputPaths& paths, Error* err);

// Reads a dose table written by WriteDoseTable (or any table with the same
// columns, synonyms accepted).
bool ReadDoseTable(const std::string& path, std::vector<DoseRow>* out, Error* err);

// Extracts the integer amount from a cost summary by collecting its digits.
bool ReadCostSummary(const std::string& path, long long* out, Error* err);

} // namespace fertiblend
