// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#include "fertiblend/Loader.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <map>
#include <set>
#include <sstream>

namespace fertiblend {

namespace {

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
  return s;
}

// Keys are lowercase; lookups lowercase the header first.
const std::map<std::string, std::string>& ColumnAliases() {
  static const std::map<std::string, std::string> aliases = {
      {"potrero", columns::kField},
      {"field", columns::kField},
      {"field_id", columns::kField},
      {"cultivo", columns::kCrop},
      {"crop", columns::kCrop},
      {"superficie_ha", columns::kArea},
      {"superficie", columns::kArea},
      {"area_ha", columns::kArea},
      {"area", columns::kArea},
      {"n_req_kg_ha", columns::kReqN},
      {"n_req", columns::kReqN},
      {"p2o5_req_kg_ha", columns::kReqP},
      {"p205_req_kg_ha", columns::kReqP},
      {"p2o5_req", columns::kReqP},
      {"p205_req", columns::kReqP},
      {"k2o_req_kg_ha", columns::kReqK},
      {"k20_req_kg_ha", columns::kReqK},
      {"k2o_req", columns::kReqK},
      {"k20_req", columns::kReqK},
      {"producto", columns::kProduct},
      {"product", columns::kProduct},
      {"product_id", columns::kProduct},
      {"n_pct", columns::kPctN},
      {"p2o5_pct", columns::kPctP},
      {"p205_pct", columns::kPctP},
      {"k2o_pct", columns::kPctK},
      {"k20_pct", columns::kPctK},
      {"precio_clp_ton", columns::kPrice},
      {"precio_ton", columns::kPrice},
      {"price_per_ton", columns::kPrice},
      {"price_per_tonne", columns::kPrice},
      {"dosis_min_kg_ha", columns::kDoseMin},
      {"dose_min_kg_ha", columns::kDoseMin},
      {"dose_min", columns::kDoseMin},
      {"dosis_max_kg_ha", columns::kDoseMax},
      {"dose_max_kg_ha", columns::kDoseMax},
      {"dose_max", columns::kDoseMax},
      {"kg_ha", columns::kDose},
      {"dose_kg_ha", columns::kDose},
  };
  return aliases;
}

std::string RowLabel(const RawTable& table, std::size_t row) {
  // +2: one for the header, one for 1-based numbering.
  return table.name + " row " + std::to_string(row + 2);
}

const std::string& Cell(const RawTable& table, std::size_t row, int col) {
  static const std::string kEmpty;
  if (col < 0) return kEmpty;
  return table.rows[row][static_cast<std::size_t>(col)];
}

double NumberOr(const RawTable& table, std::size_t row, int col, double fallback) {
  double value = 0.0;
  if (ParseNumber(Cell(table, row, col), table.delimiter, &value)) return value;
  return fallback;
}

bool RejectDuplicate(std::set<std::string>* seen, const std::string& id,
                     const RawTable& table, std::size_t row, Error* err) {
  if (seen->insert(id).second) return true;
  return SetError(err, ErrorKind::kInvalidInput,
                  RowLabel(table, row) + ": duplicate identifier '" + id + "'");
}

} // namespace

std::string CanonicalColumnName(const std::string& header) {
  const auto& aliases = ColumnAliases();
  auto it = aliases.find(ToLower(header));
  return it == aliases.end() ? header : it->second;
}

void NormalizeColumns(RawTable* table) {
  if (!table) return;
  for (auto& col : table->columns) {
    const std::string canonical = CanonicalColumnName(col);
    if (canonical == col) continue;
    if (table->ColumnIndex(canonical) >= 0) continue;
    col = canonical;
  }
}

bool RequireColumns(const RawTable& table, const std::vector<std::string>& required, Error* err) {
  for (const auto& name : required) {
    if (table.ColumnIndex(name) < 0) {
      return SetError(err, ErrorKind::kMissingColumn,
                      "table '" + table.name + "' is missing required column '" + name + "'");
    }
  }
  return true;
}

bool ParseNumber(const std::string& cell, char delimiter, double* out) {
  std::string token = cell;
  token.erase(std::remove_if(token.begin(), token.end(), [](unsigned char c) { return std::isspace(c); }), token.end());
  if (token.empty()) return false;
  if (delimiter != ',' && token.find('.') == std::string::npos) {
    std::replace(token.begin(), token.end(), ',', '.');
  }
  const char* begin = token.c_str();
  char* end = nullptr;
  double value = std::strtod(begin, &end);
  if (end == begin || *end != '\0' || !std::isfinite(value)) return false;
  *out = value;
  return true;
}

bool BuildFields(const RawTable& table, std::vector<Field>* out, Error* err) {
  if (!RequireColumns(table, {columns::kField, columns::kCrop, columns::kArea}, err)) return false;
  const int c_id = table.ColumnIndex(columns::kField);
  const int c_crop = table.ColumnIndex(columns::kCrop);
  const int c_area = table.ColumnIndex(columns::kArea);
  std::vector<Field> fields;
  std::set<std::string> seen;
  for (std::size_t r = 0; r < table.rows.size(); ++r) {
    Field f;
    f.id = Cell(table, r, c_id);
    f.crop = Cell(table, r, c_crop);
    if (f.id.empty()) {
      return SetError(err, ErrorKind::kInvalidInput, RowLabel(table, r) + ": empty field identifier");
    }
    if (!RejectDuplicate(&seen, f.id, table, r, err)) return false;
    if (!ParseNumber(Cell(table, r, c_area), table.delimiter, &f.area_ha) || f.area_ha <= 0.0) {
      return SetError(err, ErrorKind::kInvalidInput,
                      RowLabel(table, r) + ": field '" + f.id + "' area must be a positive number, got '" +
                          Cell(table, r, c_area) + "'");
    }
    fields.push_back(std::move(f));
  }
  if (fields.empty()) {
    return SetError(err, ErrorKind::kInvalidInput, "table '" + table.name + "' has no rows");
  }
  *out = std::move(fields);
  return true;
}

bool BuildRequirements(const RawTable& table, std::map<std::string, CropRequirement>* out, Error* err) {
  if (!RequireColumns(table, {columns::kCrop, columns::kReqN, columns::kReqP, columns::kReqK}, err)) return false;
  const int c_crop = table.ColumnIndex(columns::kCrop);
  const int c_req[kNutrientCount] = {table.ColumnIndex(columns::kReqN),
                                     table.ColumnIndex(columns::kReqP),
                                     table.ColumnIndex(columns::kReqK)};
  std::map<std::string, CropRequirement> reqs;
  std::set<std::string> seen;
  for (std::size_t r = 0; r < table.rows.size(); ++r) {
    CropRequirement req;
    req.crop = Cell(table, r, c_crop);
    if (req.crop.empty()) {
      return SetError(err, ErrorKind::kInvalidInput, RowLabel(table, r) + ": empty crop name");
    }
    if (!RejectDuplicate(&seen, req.crop, table, r, err)) return false;
    for (Nutrient n : kAllNutrients) {
      const std::size_t i = NutrientIndex(n);
      req.kg_per_ha[i] = NumberOr(table, r, c_req[i], 0.0);
      if (req.kg_per_ha[i] < 0.0) {
        return SetError(err, ErrorKind::kInvalidInput,
                        RowLabel(table, r) + ": crop '" + req.crop + "' has negative " +
                            NutrientName(n) + " requirement");
      }
    }
    reqs[req.crop] = req;
  }
  *out = std::move(reqs);
  return true;
}

bool BuildProducts(const RawTable& table, std::map<std::string, Product>* out,
                   std::vector<std::string>* order, Error* err) {
  if (!RequireColumns(table, {columns::kProduct, columns::kPctN, columns::kPctP, columns::kPctK, columns::kPrice}, err)) {
    return false;
  }
  const int c_id = table.ColumnIndex(columns::kProduct);
  const int c_pct[kNutrientCount] = {table.ColumnIndex(columns::kPctN),
                                     table.ColumnIndex(columns::kPctP),
                                     table.ColumnIndex(columns::kPctK)};
  const int c_price = table.ColumnIndex(columns::kPrice);
  const int c_min = table.ColumnIndex(columns::kDoseMin); // optional
  const int c_max = table.ColumnIndex(columns::kDoseMax); // optional
  std::map<std::string, Product> products;
  std::vector<std::string> ids;
  std::set<std::string> seen;
  for (std::size_t r = 0; r < table.rows.size(); ++r) {
    Product p;
    p.id = Cell(table, r, c_id);
    if (p.id.empty()) {
      return SetError(err, ErrorKind::kInvalidInput, RowLabel(table, r) + ": empty product identifier");
    }
    if (!RejectDuplicate(&seen, p.id, table, r, err)) return false;
    for (Nutrient n : kAllNutrients) {
      const std::size_t i = NutrientIndex(n);
      p.percent[i] = NumberOr(table, r, c_pct[i], 0.0);
      if (p.percent[i] < 0.0 || p.percent[i] > 100.0) {
        return SetError(err, ErrorKind::kInvalidInput,
                        RowLabel(table, r) + ": product '" + p.id + "' " + NutrientName(n) +
                            " content must be within [0,100]%");
      }
    }
    p.price_per_tonne = NumberOr(table, r, c_price, 0.0);
    p.dose_min = NumberOr(table, r, c_min, 0.0);
    p.dose_max = NumberOr(table, r, c_max, kUnboundedDose);
    if (p.price_per_tonne < 0.0) {
      return SetError(err, ErrorKind::kInvalidInput, RowLabel(table, r) + ": product '" + p.id + "' has a negative price");
    }
    if (p.dose_min < 0.0) {
      return SetError(err, ErrorKind::kInvalidInput, RowLabel(table, r) + ": product '" + p.id + "' has a negative minimum dose");
    }
    if (p.dose_min > p.dose_max) {
      std::ostringstream oss;
      oss << RowLabel(table, r) << ": product '" << p.id << "' minimum dose " << p.dose_min
          << " exceeds maximum dose " << p.dose_max;
      return SetError(err, ErrorKind::kInvalidInput, oss.str());
    }
    ids.push_back(p.id);
    products[p.id] = p;
  }
  if (products.empty()) {
    return SetError(err, ErrorKind::kInvalidInput, "table '" + table.name + "' has no rows");
  }
  *out = std::move(products);
  *order = std::move(ids);
  return true;
}

bool ValidateCropReferences(const InputTables& tables, Error* err) {
  for (const auto& f : tables.fields) {
    if (!tables.FindRequirement(f.crop)) {
      return SetError(err, ErrorKind::kUnknownCrop,
                      "field '" + f.id + "' references crop '" + f.crop + "' absent from the requirement table");
    }
  }
  return true;
}

bool BuildInputTables(RawTable fields, RawTable requirements, RawTable products,
                      InputTables* out, Error* err) {
  if (!out) return SetError(err, ErrorKind::kInvalidInput, "null output tables");
  NormalizeColumns(&fields);
  NormalizeColumns(&requirements);
  NormalizeColumns(&products);
  // Column presence is checked for all tables before any row is read.
  if (!RequireColumns(fields, {columns::kField, columns::kCrop, columns::kArea}, err)) return false;
  if (!RequireColumns(requirements, {columns::kCrop, columns::kReqN, columns::kReqP, columns::kReqK}, err)) return false;
  if (!RequireColumns(products, {columns::kProduct, columns::kPctN, columns::kPctP, columns::kPctK, columns::kPrice}, err)) {
    return false;
  }
  InputTables tables;
  if (!BuildFields(fields, &tables.fields, err)) return false;
  tables.IndexFields();
  if (!BuildRequirements(requirements, &tables.requirements, err)) return false;
  if (!BuildProducts(products, &tables.products, &tables.product_order, err)) return false;
  if (!ValidateCropReferences(tables, err)) return false;
  *out = std::move(tables);
  return true;
}

bool LoadInputTables(const InputPaths& paths, InputTables* out, Error* err) {
  RawTable fields, requirements, products;
  if (!ReadTableFromFile(paths.fields, "fields", &fields, err)) return false;
  if (!ReadTableFromFile(paths.requirements, "requirements", &requirements, err)) return false;
  if (!ReadTableFromFile(paths.products, "products", &products, err)) return false;
  return BuildInputTables(std::move(fields), std::move(requirements), std::move(products), out, err);
}

} // namespace fertiblend
