// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#include "fertiblend/Compare.h"

#include <iomanip>
#include <map>
#include <sstream>
#include <utility>

namespace fertiblend {

namespace {

// CLP amounts with dot thousands separators: $1.234.567
std::string FormatMoney(long long amount) {
  const bool negative = amount < 0;
  std::string digits = std::to_string(negative ? -amount : amount);
  std::string out;
  int count = 0;
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    if (count > 0 && count % 3 == 0) out.insert(out.begin(), '.');
    out.insert(out.begin(), *it);
    ++count;
  }
  return (negative ? "-$" : "$") + out;
}

} // namespace

ScenarioComparison CompareScenarios(const std::vector<DoseRow>& doses_a, long long cost_a,
                                    const std::vector<DoseRow>& doses_b, long long cost_b) {
  ScenarioComparison cmp;
  cmp.cost_a = cost_a;
  cmp.cost_b = cost_b;
  cmp.cost_delta = cost_b - cost_a;

  std::map<std::string, std::pair<double, double>> totals;
  for (const auto& row : doses_a) totals[row.field].first += row.kg_ha;
  for (const auto& row : doses_b) totals[row.field].second += row.kg_ha;

  for (const auto& kv : totals) {
    FieldDelta d;
    d.field = kv.first;
    d.total_a = kv.second.first;
    d.total_b = kv.second.second;
    d.delta = d.total_b - d.total_a;
    cmp.fields.push_back(d);
  }
  if (!cmp.fields.empty()) {
    const FieldDelta* up = &cmp.fields.front();
    const FieldDelta* down = &cmp.fields.front();
    for (const auto& d : cmp.fields) {
      if (d.delta > up->delta) up = &d;
      if (d.delta < down->delta) down = &d;
    }
    cmp.largest_increase = up->field;
    cmp.largest_decrease = down->field;
  }
  return cmp;
}

ScenarioComparison CompareScenarios(const ScenarioResult& a, const ScenarioResult& b) {
  ScenarioComparison cmp = CompareScenarios(a.doses, a.total_cost_rounded, b.doses, b.total_cost_rounded);
  if (!a.tag.empty()) cmp.tag_a = a.tag;
  if (!b.tag.empty()) cmp.tag_b = b.tag;
  return cmp;
}

std::vector<ProductDelta> CompareFieldMix(const std::vector<DoseRow>& doses_a,
                                          const std::vector<DoseRow>& doses_b,
                                          const std::string& field) {
  std::map<std::string, std::pair<double, double>> by_product;
  for (const auto& row : doses_a) {
    if (row.field == field) by_product[row.product].first += row.kg_ha;
  }
  for (const auto& row : doses_b) {
    if (row.field == field) by_product[row.product].second += row.kg_ha;
  }
  std::vector<ProductDelta> out;
  for (const auto& kv : by_product) {
    ProductDelta d;
    d.product = kv.first;
    d.dose_a = kv.second.first;
    d.dose_b = kv.second.second;
    d.delta = d.dose_b - d.dose_a;
    out.push_back(d);
  }
  return out;
}

std::string FormatComparison(const ScenarioComparison& cmp) {
  std::ostringstream oss;
  oss << "cost " << cmp.tag_a << " = " << FormatMoney(cmp.cost_a)
      << ", cost " << cmp.tag_b << " = " << FormatMoney(cmp.cost_b)
      << ", difference (" << cmp.tag_b << " - " << cmp.tag_a << ") = " << FormatMoney(cmp.cost_delta);
  if (cmp.cost_delta > 0) {
    oss << " (" << cmp.tag_b << " is more expensive)";
  } else if (cmp.cost_delta < 0) {
    oss << " (" << cmp.tag_b << " is cheaper)";
  } else {
    oss << " (same cost)";
  }
  oss << "\n";
  oss << std::fixed << std::setprecision(2);
  oss << "field,total_" << cmp.tag_a << ",total_" << cmp.tag_b << ",delta\n";
  for (const auto& d : cmp.fields) {
    oss << d.field << "," << d.total_a << "," << d.total_b << "," << d.delta << "\n";
  }
  if (!cmp.fields.empty()) {
    oss << "largest increase: " << cmp.largest_increase << ", largest decrease: " << cmp.largest_decrease << "\n";
  }
  return oss.str();
}

std::string FormatFieldMix(const std::string& field, const std::vector<ProductDelta>& mix) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2);
  oss << "mix on " << field << ":\n";
  if (mix.empty()) {
    oss << "  (no doses)\n";
    return oss.str();
  }
  const ProductDelta* up = &mix.front();
  const ProductDelta* down = &mix.front();
  for (const auto& d : mix) {
    oss << "  " << d.product << ": " << d.dose_a << " -> " << d.dose_b << " (" << std::showpos << d.delta
        << std::noshowpos << ")\n";
    if (d.delta > up->delta) up = &d;
    if (d.delta < down->delta) down = &d;
  }
  oss << "  largest increase: " << up->product << ", largest decrease: " << down->product << "\n";
  return oss.str();
}

} // namespace fertiblend
