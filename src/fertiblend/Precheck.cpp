// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#include "fertiblend/Precheck.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace fertiblend {

namespace {

constexpr double kCompareEps = 1e-9;

double SumMaxContribution(const InputTables& tables, Nutrient n) {
  double total = 0.0;
  for (const auto& id : tables.product_order) {
    const Product& p = tables.products.at(id);
    total += p.dose_max * p.Fraction(n);
  }
  return total;
}

double BestFraction(const InputTables& tables, Nutrient n) {
  double best = 0.0;
  for (const auto& kv : tables.products) best = std::max(best, kv.second.Fraction(n));
  return best;
}

// Achievable bound shared by every field: only requirements differ per field.
NutrientVector AchievableBounds(const InputTables& tables, const ScenarioParameters& params,
                                std::vector<std::string>* limit_labels) {
  NutrientVector bound{{0.0, 0.0, 0.0}};
  limit_labels->assign(kNutrientCount, "dose_max");
  for (Nutrient n : kAllNutrients) {
    const std::size_t i = NutrientIndex(n);
    bound[i] = SumMaxContribution(tables, n);
    if (params.HasMixCapacity()) {
      // Single best product filling the whole mix.
      const double mix_bound = params.mix_capacity * BestFraction(tables, n);
      if (mix_bound < bound[i]) {
        bound[i] = mix_bound;
        (*limit_labels)[i] = "mix_capacity";
      }
    }
    if (n == Nutrient::kN && params.HasNitrogenCap() && params.nitrogen_cap < bound[i]) {
      bound[i] = params.nitrogen_cap;
      (*limit_labels)[i] = "nitrogen_cap";
    }
  }
  return bound;
}

} // namespace

bool RunPrecheck(const InputTables& tables, const ScenarioParameters& params,
                 PrecheckReport* report, Error* err) {
  PrecheckReport local;
  std::vector<std::string> limit_labels;
  const NutrientVector achievable = AchievableBounds(tables, params, &limit_labels);

  for (const auto& field : tables.fields) {
    const CropRequirement* req = tables.FindRequirement(field.crop);
    if (!req) {
      return SetError(err, ErrorKind::kUnknownCrop,
                      "field '" + field.id + "' references crop '" + field.crop + "' absent from the requirement table");
    }
    FieldBounds fb;
    fb.field = field.id;
    fb.achievable = achievable;
    for (Nutrient n : kAllNutrients) {
      const std::size_t i = NutrientIndex(n);
      fb.required[i] = req->kg_per_ha[i] * (1.0 - params.tolerance);
      if (fb.required[i] > fb.achievable[i] + kCompareEps) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1)
            << field.id << ": " << NutrientName(n) << " required " << fb.required[i]
            << " > max achievable " << fb.achievable[i] << " (" << limit_labels[i] << ")";
        local.diagnostics.push_back(oss.str());
      }
    }
    local.fields.push_back(fb);
  }

  for (const auto& kv : tables.products) local.min_dose_sum += kv.second.dose_min;
  if (params.HasMixCapacity() && local.min_dose_sum > params.mix_capacity + kCompareEps) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1)
        << "minimum doses sum " << local.min_dose_sum << " > mix capacity " << params.mix_capacity;
    local.diagnostics.push_back(oss.str());
  }

  const bool feasible = local.feasible();
  if (!feasible && err) {
    std::ostringstream oss;
    oss << local.diagnostics.size() << " feasibility check(s) failed before solving";
    SetError(err, ErrorKind::kPrecheckInfeasible, oss.str());
    err->diagnostics = local.diagnostics;
  }
  if (report) *report = std::move(local);
  return feasible;
}

} // namespace fertiblend
