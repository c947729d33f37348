// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#include "fertiblend/Scenario.h"

#include <fstream>
#include <sstream>
#include <string>

#include <picojson.h>

namespace fertiblend {

static bool get_string(const picojson::object& o, const char* key, std::string* out) {
  auto it = o.find(key); if (it == o.end()) return false; if (!it->second.is<std::string>()) return false; *out = it->second.get<std::string>(); return true;
}
static bool get_number(const picojson::object& o, const char* key, double* out) {
  auto it = o.find(key); if (it == o.end()) return false; if (!it->second.is<double>()) return false; *out = it->second.get<double>(); return true;
}

static bool reject_non_number(const picojson::object& o, const char* key, const std::string& where, Error* err) {
  auto it = o.find(key);
  if (it == o.end() || it->second.is<double>()) return true;
  return SetError(err, ErrorKind::kInvalidParameters, where + ": '" + key + "' must be a number");
}

static bool parse_scenario(const picojson::object& obj, std::size_t index,
                           ScenarioParameters* out, Error* err) {
  ScenarioParameters p;
  const std::string where = "scenarios[" + std::to_string(index) + "]";
  for (const char* key : {"nmax", "mixmax", "tol", "tol_pct", "costoap", "time_limit"}) {
    if (!reject_non_number(obj, key, where, err)) return false;
  }
  if (!get_string(obj, "tag", &p.tag)) {
    p.tag = std::string(1, static_cast<char>('A' + static_cast<int>(index % 26)));
  }
  get_number(obj, "nmax", &p.nitrogen_cap);
  get_number(obj, "mixmax", &p.mix_capacity);
  double tol_pct = 0.0;
  if (get_number(obj, "tol_pct", &tol_pct)) {
    p.tolerance = tol_pct / 100.0;
  }
  get_number(obj, "tol", &p.tolerance);
  get_number(obj, "costoap", &p.application_cost);
  get_number(obj, "time_limit", &p.time_limit_seconds);
  get_string(obj, "requirements", &p.requirements_override);
  if (!ValidateScenario(p, err)) return false;
  *out = p;
  return true;
}

bool LoadScenariosFromJsonString(const std::string& json,
                                 std::vector<ScenarioParameters>* out,
                                 Error* err) {
  if (!out) return SetError(err, ErrorKind::kInvalidParameters, "null output scenarios");
  picojson::value root;
  std::string parse_err = picojson::parse(root, json);
  if (!parse_err.empty()) {
    return SetError(err, ErrorKind::kInvalidParameters, "scenario JSON parse error: " + parse_err);
  }
  if (!root.is<picojson::object>()) {
    return SetError(err, ErrorKind::kInvalidParameters, "scenario JSON root must be an object");
  }
  const auto& obj = root.get<picojson::object>();
  auto it = obj.find("scenarios");
  if (it == obj.end() || !it->second.is<picojson::array>()) {
    return SetError(err, ErrorKind::kInvalidParameters, "scenario JSON requires a 'scenarios' array");
  }
  const auto& arr = it->second.get<picojson::array>();
  if (arr.empty()) {
    return SetError(err, ErrorKind::kInvalidParameters, "scenario JSON 'scenarios' array is empty");
  }
  std::vector<ScenarioParameters> scenarios;
  for (std::size_t i = 0; i < arr.size(); ++i) {
    if (!arr[i].is<picojson::object>()) {
      return SetError(err, ErrorKind::kInvalidParameters,
                      "scenarios[" + std::to_string(i) + "] must be an object");
    }
    ScenarioParameters p;
    if (!parse_scenario(arr[i].get<picojson::object>(), i, &p, err)) return false;
    for (const auto& prev : scenarios) {
      if (prev.tag == p.tag) {
        return SetError(err, ErrorKind::kInvalidParameters, "duplicate scenario tag '" + p.tag + "'");
      }
    }
    scenarios.push_back(p);
  }
  *out = std::move(scenarios);
  return true;
}

bool LoadScenariosFromFile(const std::string& path,
                           std::vector<ScenarioParameters>* out,
                           Error* err) {
  std::ifstream in(path);
  if (!in) return SetError(err, ErrorKind::kIo, "failed to open scenario file '" + path + "'");
  std::stringstream ss;
  ss << in.rdbuf();
  return LoadScenariosFromJsonString(ss.str(), out, err);
}

} // namespace fertiblend
