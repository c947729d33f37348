// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "fertiblend/Compare.h"
#include "fertiblend/Pipeline.h"
#include "fertiblend/Scenario.h"

namespace {

struct CliOptions {
  fertiblend::InputPaths inputs{"data/potreros.csv", "data/requerimientos.csv", "data/productos.csv"};
  fertiblend::ScenarioParameters params;
  std::string out_dir = "data";
  std::string out_csv;
  std::string out_txt;
  bool report = false;
  std::string scenarios_file;
  bool debug = false;
};

void PrintUsage(const char* argv0) {
  std::cerr << "usage: " << argv0 << " [options]\n"
            << "  --nmax <kg/ha>         nitrogen ceiling per field (0 = off)\n"
            << "  --mixmax <kg/ha>       total mix ceiling per field (0 = off)\n"
            << "  --tol <fraction>       share of the requirement allowed unmet (default 0.02)\n"
            << "  --costoap <per t>      application cost per tonne applied (default 0)\n"
            << "  --tag <name>           scenario tag used in output file names\n"
            << "  --fields <path>        fields table (default data/potreros.csv)\n"
            << "  --requirements <path>  crop requirement table (default data/requerimientos.csv)\n"
            << "  --products <path>      product table (default data/productos.csv)\n"
            << "  --req-override <path>  alternate requirement table for this scenario\n"
            << "  --out-dir <dir>        output directory (default data)\n"
            << "  --out-csv <path>       dose table path (overrides --out-dir naming)\n"
            << "  --out-txt <path>       cost summary path (overrides --out-dir naming)\n"
            << "  --report               also write reporte_<tag>.json\n"
            << "  --time-limit <s>       LP time limit in seconds (0 = none)\n"
            << "  --scenarios <json>     run every scenario in the file and compare the first two\n"
            << "  --debug                progress lines on stdout\n";
}

bool ParseDoubleArg(const std::string& flag, const char* text, double* out) {
  char* end = nullptr;
  double v = std::strtod(text, &end);
  if (end == text || *end != '\0') {
    std::cerr << "error: " << flag << " expects a number, got '" << text << "'\n";
    return false;
  }
  *out = v;
  return true;
}

// Returns 0 on success, 2 on usage error, -1 when --help was printed.
int ParseArgs(int argc, char** argv, CliOptions* opt) {
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--help" || a == "-h") {
      PrintUsage(argv[0]);
      return -1;
    }
    if (a == "--debug") { opt->debug = true; continue; }
    if (a == "--report") { opt->report = true; continue; }
    if (i + 1 >= argc) {
      std::cerr << "error: " << a << " needs a value\n";
      return 2;
    }
    const char* v = argv[++i];
    bool ok = true;
    if (a == "--nmax") ok = ParseDoubleArg(a, v, &opt->params.nitrogen_cap);
    else if (a == "--mixmax") ok = ParseDoubleArg(a, v, &opt->params.mix_capacity);
    else if (a == "--tol") ok = ParseDoubleArg(a, v, &opt->params.tolerance);
    else if (a == "--costoap") ok = ParseDoubleArg(a, v, &opt->params.application_cost);
    else if (a == "--time-limit") ok = ParseDoubleArg(a, v, &opt->params.time_limit_seconds);
    else if (a == "--tag") opt->params.tag = v;
    else if (a == "--fields") opt->inputs.fields = v;
    else if (a == "--requirements") opt->inputs.requirements = v;
    else if (a == "--products") opt->inputs.products = v;
    else if (a == "--req-override") opt->params.requirements_override = v;
    else if (a == "--out-dir") opt->out_dir = v;
    else if (a == "--out-csv") opt->out_csv = v;
    else if (a == "--out-txt") opt->out_txt = v;
    else if (a == "--scenarios") opt->scenarios_file = v;
    else {
      std::cerr << "error: unknown option '" << a << "'\n";
      return 2;
    }
    if (!ok) return 2;
  }
  return 0;
}

fertiblend::OutputPaths OutputsFor(const CliOptions& opt, const std::string& tag, bool allow_overrides) {
  fertiblend::OutputPaths paths = fertiblend::DefaultOutputPaths(opt.out_dir, tag);
  if (allow_overrides && !opt.out_csv.empty()) paths.dose_csv = opt.out_csv;
  if (allow_overrides && !opt.out_txt.empty()) paths.summary_txt = opt.out_txt;
  if (opt.report) paths.report_json = fertiblend::DefaultReportPath(opt.out_dir, tag);
  return paths;
}

void PrintFailure(const std::string& tag, const fertiblend::Error& err) {
  std::cerr << "error [" << fertiblend::ErrorKindName(err.kind) << "]";
  if (!tag.empty()) std::cerr << " scenario " << tag;
  std::cerr << ": " << err.message << "\n";
  for (const auto& line : err.diagnostics) std::cerr << "  - " << line << "\n";
}

void PrintSuccess(const fertiblend::OutputPaths& outputs, const fertiblend::ScenarioResult& result) {
  std::cout << "OK -> " << outputs.dose_csv << " | " << outputs.summary_txt
            << " | total cost " << result.total_cost_rounded << "\n";
}

} // namespace

int main(int argc, char** argv) {
  CliOptions opt;
  const int parsed = ParseArgs(argc, argv, &opt);
  if (parsed == -1) return 0;
  if (parsed != 0) {
    PrintUsage(argv[0]);
    return 2;
  }

  fertiblend::PipelineOptions popt;
  popt.debug = opt.debug;

  if (opt.scenarios_file.empty()) {
    const fertiblend::OutputPaths outputs = OutputsFor(opt, opt.params.tag, true);
    fertiblend::ScenarioResult result;
    fertiblend::Error err;
    if (!fertiblend::RunScenarioFromFiles(opt.inputs, opt.params, outputs, popt, &result, &err)) {
      PrintFailure(opt.params.tag, err);
      return 1;
    }
    PrintSuccess(outputs, result);
    return 0;
  }

  std::vector<fertiblend::ScenarioParameters> scenarios;
  fertiblend::Error err;
  if (!fertiblend::LoadScenariosFromFile(opt.scenarios_file, &scenarios, &err)) {
    PrintFailure("", err);
    return 1;
  }
  fertiblend::BatchOutcome outcome;
  fertiblend::RunScenarioBatch(opt.inputs, scenarios, opt.out_dir, opt.report, popt, &outcome);
  for (const auto& result : outcome.results) PrintSuccess(OutputsFor(opt, result.tag, false), result);
  for (const auto& failure : outcome.failures) PrintFailure(failure.tag, failure.error);
  fertiblend::ScenarioComparison cmp;
  if (fertiblend::CompareFirstTwo(outcome, &cmp)) std::cout << fertiblend::FormatComparison(cmp);
  return outcome.all_ok() ? 0 : 1;
}
