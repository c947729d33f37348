// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#include "fertiblend/Result.h"

#include <algorithm>
#include <cmath>
#include <map>

namespace fertiblend {

double RoundDose(double kg_ha) {
  return std::round(kg_ha * 100.0) / 100.0;
}

double RoundDoseWithin(double kg_ha, const Product& product) {
  constexpr double kGridSlack = 1e-9;
  double r = RoundDose(kg_ha);
  if (r > product.dose_max) {
    r = std::floor(product.dose_max * 100.0 + kGridSlack) / 100.0;
    if (r < product.dose_min) r = product.dose_max;
  } else if (r < product.dose_min) {
    r = std::ceil(product.dose_min * 100.0 - kGridSlack) / 100.0;
    if (r > product.dose_max) r = product.dose_min;
  }
  return r;
}

double ComputeTotalCost(const InputTables& tables, const ScenarioParameters& params,
                        const std::vector<DoseRow>& doses) {
  double total = 0.0;
  for (const auto& row : doses) {
    const Field* field = tables.FindField(row.field);
    const Product* product = tables.FindProduct(row.product);
    if (!field || !product) continue;
    total += row.kg_ha * field->area_ha * CostPerKg(*product, params);
  }
  return total;
}

std::vector<FieldSupply> ComputeFieldSupply(const InputTables& tables, const ScenarioParameters& params,
                                            const std::vector<DoseRow>& doses) {
  std::vector<FieldSupply> out;
  out.reserve(tables.fields.size());
  for (const auto& f : tables.fields) {
    FieldSupply s;
    s.field = f.id;
    if (const CropRequirement* req = tables.FindRequirement(f.crop)) {
      for (std::size_t i = 0; i < kNutrientCount; ++i) s.required[i] = req->kg_per_ha[i] * (1.0 - params.tolerance);
    }
    out.push_back(s);
  }
  for (const auto& row : doses) {
    auto it = tables.field_index.find(row.field);
    const Product* product = tables.FindProduct(row.product);
    if (it == tables.field_index.end() || !product) continue;
    FieldSupply& s = out[it->second];
    s.total_mix += row.kg_ha;
    for (Nutrient n : kAllNutrients) s.supplied[NutrientIndex(n)] += row.kg_ha * product->Fraction(n);
  }
  return out;
}

std::vector<ProductMix> SummarizeProductMix(const InputTables& tables, const std::vector<DoseRow>& doses) {
  std::map<std::string, ProductMix> by_product;
  double total = 0.0;
  for (const auto& row : doses) {
    const Product* product = tables.FindProduct(row.product);
    if (!product) continue;
    ProductMix& m = by_product[row.product];
    m.product = row.product;
    m.kg_ha += row.kg_ha;
    for (Nutrient n : kAllNutrients) m.contribution[NutrientIndex(n)] += row.kg_ha * product->Fraction(n);
    total += row.kg_ha;
  }
  std::vector<ProductMix> out;
  for (auto& kv : by_product) {
    kv.second.share_pct = total > 0.0 ? 100.0 * kv.second.kg_ha / total : 0.0;
    out.push_back(kv.second);
  }
  std::stable_sort(out.begin(), out.end(), [](const ProductMix& a, const ProductMix& b) {
    return a.kg_ha > b.kg_ha;
  });
  return out;
}

bool ExtractResult(const InputTables& tables, const ScenarioParameters& params,
                   const BlendSolution& solution, ScenarioResult* out, Error* err) {
  if (!out) return SetError(err, ErrorKind::kInvalidInput, "null output result");
  if (solution.dose.size() != tables.fields.size()) {
    return SetError(err, ErrorKind::kInvalidInput, "solution does not match the field table");
  }
  ScenarioResult result;
  result.tag = params.tag;
  result.solver_status = solution.status;
  result.objective = solution.objective;
  for (std::size_t f = 0; f < tables.fields.size(); ++f) {
    if (solution.dose[f].size() != tables.product_order.size()) {
      return SetError(err, ErrorKind::kInvalidInput, "solution does not match the product table");
    }
    for (std::size_t p = 0; p < tables.product_order.size(); ++p) {
      const double v = solution.dose[f][p];
      if (!(v > kDoseEpsilon)) continue;
      const Product& product = tables.products.at(tables.product_order[p]);
      result.doses.push_back(DoseRow{tables.fields[f].id, product.id, RoundDoseWithin(v, product)});
    }
  }
  std::sort(result.doses.begin(), result.doses.end(), [](const DoseRow& a, const DoseRow& b) {
    if (a.field != b.field) return a.field < b.field;
    return a.product < b.product;
  });
  result.total_cost = ComputeTotalCost(tables, params, result.doses);
  result.total_cost_rounded = std::llround(result.total_cost);
  result.supply = ComputeFieldSupply(tables, params, result.doses);
  result.product_mix = SummarizeProductMix(tables, result.doses);
  *out = std::move(result);
  return true;
}

} // namespace fertiblend
