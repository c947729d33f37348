// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <vector>

#include "fertiblend/Result.h"

namespace fertiblend {

struct FieldDelta {
  std::string field;
  double total_a = 0.0; // kg/ha, all products
  double total_b = 0.0;
  double delta = 0.0;   // b - a
};

struct ProductDelta {
  std::string product;
  double dose_a = 0.0;
  double dose_b = 0.0;
  double delta = 0.0;   // b - a
};

struct ScenarioComparison {
  std::string tag_a = "A";
  std::string tag_b = "B";
  long long cost_a = 0;
  long long cost_b = 0;
  long long cost_delta = 0;       // b - a; positive means B is more expensive
  std::vector<FieldDelta> fields; // union of fields in either table, sorted
  std::string largest_increase;   // field with max delta, empty if no fields
  std::string largest_decrease;   // field with min delta
};

ScenarioComparison CompareScenarios(const std::vector<DoseRow>& doses_a, long long cost_a,
                                    const std::vector<DoseRow>& doses_b, long long cost_b);
ScenarioComparison CompareScenarios(const ScenarioResult& a, const ScenarioResult& b);

// Per-product doses on one field, union of products, sorted by product.
std::vector<ProductDelta> CompareFieldMix(const std::vector<DoseRow>& doses_a,
                                          const std::vector<DoseRow>& doses_b,
                                          const std::string& field);

// Plain-text rendering used by the CLI and the compare tool.
std::string FormatComparison(const ScenarioComparison& cmp);
std::string FormatFieldMix(const std::string& field, const std::vector<ProductDelta>& mix);

} // namespace fertiblend
