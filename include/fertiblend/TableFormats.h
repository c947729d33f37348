// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <vector>

#include "fertiblend/Errors.h"

namespace fertiblend {

enum class TableFormatKind {
  kCSV,
  kArrow,
  kParquet,
};

// Untyped rows exactly as read; every cell is kept as trimmed text so that
// coercion policy lives in one place (the loader).
struct RawTable {
  std::string name;                         // "fields", "requirements", "products"
  std::vector<std::string> columns;         // header, BOM-stripped and trimmed
  std::vector<std::vector<std::string>> rows; // each padded/truncated to columns.size()
  char delimiter = ',';                     // CSV delimiter detected (',' for columnar formats)

  int ColumnIndex(const std::string& column) const;
};

// Format from the file extension; anything not columnar is treated as CSV.
TableFormatKind TableFormatFromPath(const std::string& path);

// Picks the delimiter among , ; \t | that splits the sample most consistently.
char DetectDelimiter(const std::string& sample);

// Parses delimited text. Strips a UTF-8 BOM, skips blank lines, honours quotes.
bool ParseDelimitedText(const std::string& text, const std::string& table_name,
                        RawTable* out, Error* err);

// Reads a table from disk in the format implied by its extension. Arrow and
// Parquet need a build with FERTIBLEND_ARROW_ENABLED.
bool ReadTableFromFile(const std::string& path, const std::string& table_name,
                       RawTable* out, Error* err);

} // namespace fertiblend
