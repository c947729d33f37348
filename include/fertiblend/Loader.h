// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#pragma once

#include <map>
#include <string>
#include <vector>

#include "fertiblend/Errors.h"
#include "fertiblend/TableFormats.h"
#include "fertiblend/Tables.h"

namespace fertiblend {

// Canonical column names. These match the files the dashboard exchanges.
namespace columns {
constexpr const char* kField = "potrero";
constexpr const char* kCrop = "cultivo";
constexpr const char* kArea = "superficie_ha";
constexpr const char* kReqN = "N_req_kg_ha";
constexpr const char* kReqP = "P2O5_req_kg_ha";
constexpr const char* kReqK = "K2O_req_kg_ha";
constexpr const char* kProduct = "producto";
constexpr const char* kPctN = "N_pct";
constexpr const char* kPctP = "P2O5_pct";
constexpr const char* kPctK = "K2O_pct";
constexpr const char* kPrice = "precio_CLP_ton";
constexpr const char* kDoseMin = "dosis_min_kg_ha";
constexpr const char* kDoseMax = "dosis_max_kg_ha";
constexpr const char* kDose = "kg_ha";
} // namespace columns

struct InputPaths {
  std::string fields;       // potreros.csv
  std::string requirements; // requerimientos.csv
  std::string products;     // productos.csv
};

// Canonical name for a header cell, or the cell unchanged when it is not a
// known synonym (typo'd oxide names, capitalised keys, English aliases).
std::string CanonicalColumnName(const std::string& header);

// Renames known synonyms in place unless the canonical column already exists.
void NormalizeColumns(RawTable* table);

// MissingColumnError naming the first absent column and the table.
bool RequireColumns(const RawTable& table, const std::vector<std::string>& required, Error* err);

// Lenient numeric parse: trims, accepts a decimal comma when the table is not
// comma-delimited, rejects trailing garbage and non-finite values.
bool ParseNumber(const std::string& cell, char delimiter, double* out);

bool BuildFields(const RawTable& table, std::vector<Field>* out, Error* err);
bool BuildRequirements(const RawTable& table, std::map<std::string, CropRequirement>* out, Error* err);
bool BuildProducts(const RawTable& table, std::map<std::string, Product>* out,
                   std::vector<std::string>* order, Error* err);

// UnknownCropError for the first field whose crop has no requirement row.
bool ValidateCropReferences(const InputTables& tables, Error* err);

// Normalises, validates and keys the three raw tables.
bool BuildInputTables(RawTable fields, RawTable requirements, RawTable products,
                      InputTables* out, Error* err);

// Reads the three files (CSV, or Arrow/Parquet when enabled) and builds tables.
bool LoadInputTables(const InputPaths& paths, InputTables* out, Error* err);

} // namespace fertiblend
