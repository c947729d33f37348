// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace fertiblend {

// Nutrient axes, in the order used by every per-nutrient array.
enum class Nutrient : int {
  kN = 0,
  kP2O5 = 1,
  kK2O = 2,
};

constexpr std::size_t kNutrientCount = 3;
constexpr std::array<Nutrient, kNutrientCount> kAllNutrients = {
    Nutrient::kN, Nutrient::kP2O5, Nutrient::kK2O};

using NutrientVector = std::array<double, kNutrientCount>;

inline std::size_t NutrientIndex(Nutrient n) { return static_cast<std::size_t>(n); }
const char* NutrientName(Nutrient n);

// Prices are per tonne, doses per kg/ha.
constexpr double kKgPerTonne = 1000.0;
// Stand-in for "no maximum dose"; large but finite so it can bound an LP column.
constexpr double kUnboundedDose = 1e6;
// Doses at or below this are numerically zero.
constexpr double kDoseEpsilon = 1e-6;

struct Field {
  std::string id;        // management unit identifier
  std::string crop;      // key into InputTables::requirements
  double area_ha = 0.0;  // > 0
};

struct CropRequirement {
  std::string crop;
  NutrientVector kg_per_ha{{0.0, 0.0, 0.0}}; // N, P2O5, K2O requirement
};

struct Product {
  std::string id;
  NutrientVector percent{{0.0, 0.0, 0.0}}; // content in % by weight, each in [0,100]
  double price_per_tonne = 0.0;
  double dose_min = 0.0;            // kg/ha
  double dose_max = kUnboundedDose; // kg/ha

  double Fraction(Nutrient n) const { return percent[NutrientIndex(n)] / 100.0; }
  bool HasUnboundedMax() const { return dose_max >= kUnboundedDose; }
};

// Normalised inputs for one pipeline run. Built once by the loader and only
// read afterwards; lookups go through the keyed maps.
struct InputTables {
  std::vector<Field> fields;                           // file order
  std::map<std::string, CropRequirement> requirements; // crop -> requirement
  std::map<std::string, Product> products;             // product id -> product
  std::vector<std::string> product_order;              // product ids, file order
  std::map<std::string, std::size_t> field_index;      // field id -> position in fields

  const CropRequirement* FindRequirement(const std::string& crop) const {
    auto it = requirements.find(crop);
    return it == requirements.end() ? nullptr : &it->second;
  }

  const Product* FindProduct(const std::string& id) const {
    auto it = products.find(id);
    return it == products.end() ? nullptr : &it->second;
  }

  const Field* FindField(const std::string& id) const {
    auto it = field_index.find(id);
    return it == field_index.end() ? nullptr : &fields[it->second];
  }

  // Rebuilds field_index from fields; the loader calls it once.
  void IndexFields() {
    field_index.clear();
    for (std::size_t i = 0; i < fields.size(); ++i) field_index[fields[i].id] = i;
  }
};

} // namespace fertiblend
