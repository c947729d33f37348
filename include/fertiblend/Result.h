// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <vector>

#include "fertiblend/Errors.h"
#include "fertiblend/Optimizer.h"
#include "fertiblend/Scenario.h"
#include "fertiblend/Tables.h"

namespace fertiblend {

struct DoseRow {
  std::string field;
  std::string product;
  double kg_ha = 0.0; // rounded to two decimals, kept within the product's bounds
};

// Delivered nutrients on one field, computed from the rounded dose table.
struct FieldSupply {
  std::string field;
  NutrientVector supplied{{0.0, 0.0, 0.0}}; // kg/ha
  NutrientVector required{{0.0, 0.0, 0.0}}; // effective requirement, tolerance applied
  double total_mix = 0.0;                   // kg/ha of all products
};

// Per-product view of the blend summed over fields.
struct ProductMix {
  std::string product;
  double kg_ha = 0.0;                           // sum of per-field doses
  NutrientVector contribution{{0.0, 0.0, 0.0}}; // kg/ha delivered per nutrient
  double share_pct = 0.0;                       // of the summed mix
};

// Output of one scenario. Immutable once produced.
struct ScenarioResult {
  std::string tag;
  std::vector<DoseRow> doses;          // sorted by field, then product
  double total_cost = 0.0;             // recomputed from doses
  long long total_cost_rounded = 0;    // value written to the cost summary
  std::vector<FieldSupply> supply;     // one per field, input order
  std::vector<ProductMix> product_mix; // largest summed dose first
  std::string solver_status;
  double objective = 0.0;              // LP objective before rounding, for reference
};

// Half away from zero, two decimals.
double RoundDose(double kg_ha);

// RoundDose, moved toward the interior when rounding would cross a dose bound.
// Bounds with no two-decimal value between them give back the bound itself.
double RoundDoseWithin(double kg_ha, const Product& product);

// sum(dose x area x CostPerKg) over the given rows. Unknown field or product
// rows are skipped.
double ComputeTotalCost(const InputTables& tables, const ScenarioParameters& params,
                        const std::vector<DoseRow>& doses);

std::vector<FieldSupply> ComputeFieldSupply(const InputTables& tables, const ScenarioParameters& params,
                                            const std::vector<DoseRow>& doses);

std::vector<ProductMix> SummarizeProductMix(const InputTables& tables, const std::vector<DoseRow>& doses);

// Filters doses <= kDoseEpsilon, rounds the rest, then recomputes the cost from
// the filtered table so the dose CSV and the cost summary reconcile exactly.
bool ExtractResult(const InputTables& tables, const ScenarioParameters& params,
                   const BlendSolution& solution, ScenarioResult* out, Error* err);

} // namespace fertiblend
