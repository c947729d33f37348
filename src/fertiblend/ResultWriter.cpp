// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#include "fertiblend/ResultWriter.h"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

#include <picojson.h>

#include "fertiblend/Loader.h"
#include "fertiblend/TableFormats.h"

namespace fertiblend {

namespace {

std::string JoinPath(const std::string& dir, const std::string& name) {
  if (dir.empty()) return name;
  return (std::filesystem::path(dir) / name).string();
}

bool EnsureParentDir(const std::string& path, Error* err) {
  const auto parent = std::filesystem::path(path).parent_path();
  if (parent.empty()) return true;
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) return SetError(err, ErrorKind::kIo, "cannot create directory '" + parent.string() + "': " + ec.message());
  return true;
}

bool WriteTextFile(const std::string& path, const std::string& body, Error* err) {
  if (!EnsureParentDir(path, err)) return false;
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) return SetError(err, ErrorKind::kIo, "failed to open '" + path + "' for writing");
  out << body;
  out.flush();
  if (!out) return SetError(err, ErrorKind::kIo, "failed to write '" + path + "'");
  return true;
}

// CSV cells with a delimiter or quote are quoted.
std::string CsvCell(const std::string& s) {
  if (s.find_first_of(",\"\n") == std::string::npos) return s;
  std::string quoted = "\"";
  for (char c : s) {
    if (c == '"') quoted.push_back('"');
    quoted.push_back(c);
  }
  quoted.push_back('"');
  return quoted;
}

// Two decimals, or as many as needed (up to six) for a dose pinned to an
// off-grid product bound.
std::string FormatDose(double kg_ha) {
  std::ostringstream oss;
  oss << std::fixed;
  if (kg_ha == RoundDose(kg_ha)) {
    oss << std::setprecision(2) << kg_ha;
    return oss.str();
  }
  oss << std::setprecision(6) << kg_ha;
  std::string text = oss.str();
  while (text.back() == '0') text.pop_back();
  if (text.back() == '.') text.pop_back();
  return text;
}

picojson::value NutrientObject(const NutrientVector& v) {
  picojson::object o;
  for (Nutrient n : kAllNutrients) o[NutrientName(n)] = picojson::value(v[NutrientIndex(n)]);
  return picojson::value(o);
}

} // namespace

OutputPaths DefaultOutputPaths(const std::string& dir, const std::string& tag) {
  OutputPaths paths;
  if (tag.empty()) {
    paths.dose_csv = JoinPath(dir, "resultados_dosis.csv");
    paths.summary_txt = JoinPath(dir, "_resumen.txt");
  } else {
    paths.dose_csv = JoinPath(dir, "resultados_dosis_" + tag + ".csv");
    paths.summary_txt = JoinPath(dir, "_resumen_" + tag + ".txt");
  }
  return paths;
}

std::string DefaultReportPath(const std::string& dir, const std::string& tag) {
  return JoinPath(dir, tag.empty() ? "reporte.json" : "reporte_" + tag + ".json");
}

bool RemoveOutputs(const OutputPaths& paths, Error* err) {
  for (const std::string* p : {&paths.dose_csv, &paths.summary_txt, &paths.report_json}) {
    if (p->empty()) continue;
    std::error_code ec;
    std::filesystem::remove(*p, ec);
    if (ec) return SetError(err, ErrorKind::kIo, "cannot remove stale output '" + *p + "': " + ec.message());
  }
  return true;
}

std::string FormatCostSummary(long long total_cost) {
  return "Costo total (CLP): " + std::to_string(total_cost) + "\n";
}

bool WriteDoseTable(const ScenarioResult& result, const std::string& path, Error* err) {
  std::ostringstream oss;
  oss << columns::kField << ',' << columns::kProduct << ',' << columns::kDose << '\n';
  for (const auto& row : result.doses) {
    oss << CsvCell(row.field) << ',' << CsvCell(row.product) << ',' << FormatDose(row.kg_ha) << '\n';
  }
  return WriteTextFile(path, oss.str(), err);
}

bool WriteCostSummary(const ScenarioResult& result, const std::string& path, Error* err) {
  return WriteTextFile(path, FormatCostSummary(result.total_cost_rounded), err);
}

bool WriteRunReport(const ScenarioResult& result, const ScenarioParameters& params,
                    const std::string& path, Error* err) {
  picojson::object parameters;
  parameters["nmax"] = picojson::value(params.nitrogen_cap);
  parameters["mixmax"] = picojson::value(params.mix_capacity);
  parameters["tol"] = picojson::value(params.tolerance);
  parameters["costoap"] = picojson::value(params.application_cost);
  parameters["time_limit"] = picojson::value(params.time_limit_seconds);
  if (!params.requirements_override.empty()) {
    parameters["requirements"] = picojson::value(params.requirements_override);
  }

  picojson::array doses;
  for (const auto& row : result.doses) {
    picojson::object o;
    o[columns::kField] = picojson::value(row.field);
    o[columns::kProduct] = picojson::value(row.product);
    o[columns::kDose] = picojson::value(row.kg_ha);
    doses.push_back(picojson::value(o));
  }

  picojson::array supply;
  for (const auto& s : result.supply) {
    picojson::object o;
    o["field"] = picojson::value(s.field);
    o["supplied"] = NutrientObject(s.supplied);
    o["required"] = NutrientObject(s.required);
    o["total_mix"] = picojson::value(s.total_mix);
    supply.push_back(picojson::value(o));
  }

  picojson::array product_mix;
  for (const auto& m : result.product_mix) {
    picojson::object o;
    o[columns::kProduct] = picojson::value(m.product);
    o[columns::kDose] = picojson::value(m.kg_ha);
    o["contribution"] = NutrientObject(m.contribution);
    o["share_pct"] = picojson::value(m.share_pct);
    product_mix.push_back(picojson::value(o));
  }

  picojson::object root;
  root["tag"] = picojson::value(result.tag);
  root["parameters"] = picojson::value(parameters);
  root["status"] = picojson::value(result.solver_status);
  root["objective"] = picojson::value(result.objective);
  root["total_cost"] = picojson::value(static_cast<double>(result.total_cost_rounded));
  root["doses"] = picojson::value(doses);
  root["supply"] = picojson::value(supply);
  root["product_mix"] = picojson::value(product_mix);
  return WriteTextFile(path, picojson::value(root).serialize(true), err);
}

bool WriteScenarioOutputs(const ScenarioResult& result, const ScenarioParameters& params,
                          const OutputPaths& paths, Error* err) {
  bool ok = WriteDoseTable(result, paths.dose_csv, err) &&
            WriteCostSummary(result, paths.summary_txt, err);
  if (ok && !paths.report_json.empty()) ok = WriteRunReport(result, params, paths.report_json, err);
  if (ok) return true;
  Error cleanup;
  if (!RemoveOutputs(paths, &cleanup) && err) {
    err->diagnostics.push_back(cleanup.message);
  }
  return false;
}

bool ReadDoseTable(const std::string& path, std::vector<DoseRow>* out, Error* err) {
  RawTable table;
  if (!ReadTableFromFile(path, "doses", &table, err)) return false;
  NormalizeColumns(&table);
  if (!RequireColumns(table, {columns::kField, columns::kProduct, columns::kDose}, err)) return false;
  const int c_field = table.ColumnIndex(columns::kField);
  const int c_product = table.ColumnIndex(columns::kProduct);
  const int c_dose = table.ColumnIndex(columns::kDose);
  std::vector<DoseRow> rows;
  for (std::size_t r = 0; r < table.rows.size(); ++r) {
    const auto& cells = table.rows[r];
    DoseRow row;
    row.field = cells[static_cast<std::size_t>(c_field)];
    row.product = cells[static_cast<std::size_t>(c_product)];
    if (!ParseNumber(cells[static_cast<std::size_t>(c_dose)], table.delimiter, &row.kg_ha)) {
      return SetError(err, ErrorKind::kInvalidInput,
                      "doses row " + std::to_string(r + 2) + " in '" + path + "' has a non-numeric dose");
    }
    rows.push_back(std::move(row));
  }
  *out = std::move(rows);
  return true;
}

bool ReadCostSummary(const std::string& path, long long* out, Error* err) {
  std::ifstream in(path);
  if (!in) return SetError(err, ErrorKind::kIo, "failed to open cost summary '" + path + "'");
  std::string digits;
  char c = 0;
  while (in.get(c)) {
    if (std::isdigit(static_cast<unsigned char>(c))) digits.push_back(c);
  }
  if (digits.empty() || digits.size() > 18) {
    return SetError(err, ErrorKind::kInvalidInput, "cost summary '" + path + "' contains no readable amount");
  }
  *out = std::stoll(digits);
  return true;
}

} // namespace fertiblend
