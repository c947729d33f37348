// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#include "fertiblend/Tables.h"

namespace fertiblend {

const char* NutrientName(Nutrient n) {
  switch (n) {
    case Nutrient::kN: return "N";
    case Nutrient::kP2O5: return "P2O5";
    case Nutrient::kK2O: return "K2O";
  }
  return "?";
}

} // namespace fertiblend
