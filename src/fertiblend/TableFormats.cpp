// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#include "fertiblend/TableFormats.h"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#ifdef FERTIBLEND_ARROW_ENABLED
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <arrow/ipc/api.h>
#include <parquet/arrow/reader.h>
#endif

namespace {

using fertiblend::Error;
using fertiblend::ErrorKind;
using fertiblend::SetError;

constexpr char kCandidateDelimiters[] = {',', ';', '\t', '|'};
constexpr int kDelimiterSampleLines = 6;
const std::string kUtf8Bom = "\xEF\xBB\xBF";

std::string Trim(const std::string& s) {
  std::size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
  std::size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  return s.substr(start, end - start);
}

std::string StripBom(const std::string& s) {
  if (s.compare(0, kUtf8Bom.size(), kUtf8Bom) == 0) return s.substr(kUtf8Bom.size());
  return s;
}

bool IsBlank(const std::string& line) {
  return std::all_of(line.begin(), line.end(), [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
}

void SplitCSV(const std::string& line, char delimiter, std::vector<std::string>* out) {
  out->clear();
  std::string field;
  field.reserve(16);
  bool in_quotes = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (c == '"') {
      if (in_quotes && i + 1 < line.size() && line[i + 1] == '"') {
        field.push_back('"');
        ++i;
      } else {
        in_quotes = !in_quotes;
      }
    } else if (c == delimiter && !in_quotes) {
      out->push_back(field);
      field.clear();
    } else {
      field.push_back(c);
    }
  }
  out->push_back(field);
}

std::vector<std::string> NonBlankLines(const std::string& text, int limit) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (IsBlank(line)) continue;
    lines.push_back(line);
    if (limit > 0 && static_cast<int>(lines.size()) >= limit) break;
  }
  return lines;
}

#ifdef FERTIBLEND_ARROW_ENABLED

bool ArrowStatusOk(const arrow::Status& status,
                   const std::string& context,
                   Error* err) {
  if (status.ok()) return true;
  return SetError(err, ErrorKind::kIo, context + ": " + status.ToString());
}

template <typename T>
bool AssignArrowResult(arrow::Result<T>&& result,
                       T* out,
                       const std::string& context,
                       Error* err) {
  if (!result.ok()) {
    return SetError(err, ErrorKind::kIo, context + ": " + result.status().ToString());
  }
  *out = std::move(result).ValueOrDie();
  return true;
}

// Arrow tables arrive typed; cells are rendered back to text so the loader
// applies one coercion policy whatever the source format.
bool ArrowTableToRaw(const std::shared_ptr<arrow::Table>& table,
                     const std::string& table_name,
                     fertiblend::RawTable* out,
                     Error* err) {
  if (!table) {
    return SetError(err, ErrorKind::kIo, "table '" + table_name + "' Arrow source is empty");
  }
  auto combined_result = table->CombineChunks();
  std::shared_ptr<arrow::Table> combined;
  if (!AssignArrowResult(std::move(combined_result), &combined, "combine Arrow chunks for '" + table_name + "'", err)) {
    return false;
  }
  out->name = table_name;
  out->delimiter = ',';
  out->columns.clear();
  out->rows.assign(static_cast<std::size_t>(combined->num_rows()),
                   std::vector<std::string>(static_cast<std::size_t>(combined->num_columns())));
  for (int c = 0; c < combined->num_columns(); ++c) {
    out->columns.push_back(Trim(StripBom(combined->schema()->field(c)->name())));
    auto column = combined->column(c);
    if (column->num_chunks() == 0) continue;
    auto array = column->chunk(0);
    for (int64_t r = 0; r < array->length(); ++r) {
      if (array->IsNull(r)) continue;
      std::shared_ptr<arrow::Scalar> scalar;
      if (!AssignArrowResult(array->GetScalar(r), &scalar, "read cell of '" + table_name + "'", err)) {
        return false;
      }
      out->rows[static_cast<std::size_t>(r)][static_cast<std::size_t>(c)] = Trim(scalar->ToString());
    }
  }
  return true;
}

bool ReadArrowIpcFile(const std::string& path,
                      std::shared_ptr<arrow::Table>* table,
                      Error* err) {
  std::shared_ptr<arrow::io::ReadableFile> input;
  if (!AssignArrowResult(arrow::io::ReadableFile::Open(path), &input, "open Arrow file '" + path + "'", err)) {
    return false;
  }
  auto file_reader_result = arrow::ipc::RecordBatchFileReader::Open(input);
  std::vector<std::shared_ptr<arrow::RecordBatch>> batches;
  if (file_reader_result.ok()) {
    auto reader = std::move(file_reader_result).ValueOrDie();
    for (int i = 0; i < reader->num_record_batches(); ++i) {
      std::shared_ptr<arrow::RecordBatch> batch;
      if (!AssignArrowResult(reader->ReadRecordBatch(i), &batch, "read Arrow batch from '" + path + "'", err)) {
        return false;
      }
      batches.push_back(batch);
    }
    return AssignArrowResult(arrow::Table::FromRecordBatches(reader->schema(), batches), table, "Arrow file to table", err);
  }
  if (!ArrowStatusOk(input->Seek(0), "rewind Arrow file '" + path + "'", err)) {
    return false;
  }
  std::shared_ptr<arrow::ipc::RecordBatchStreamReader> stream;
  if (!AssignArrowResult(arrow::ipc::RecordBatchStreamReader::Open(input), &stream,
                         "interpret Arrow file '" + path + "'", err)) {
    return false;
  }
  while (true) {
    std::shared_ptr<arrow::RecordBatch> batch;
    if (!AssignArrowResult(stream->Next(), &batch, "Arrow stream read from '" + path + "'", err)) {
      return false;
    }
    if (!batch) break;
    batches.push_back(batch);
  }
  return AssignArrowResult(arrow::Table::FromRecordBatches(stream->schema(), batches), table, "Arrow stream to table", err);
}

bool ReadParquetFile(const std::string& path,
                     std::shared_ptr<arrow::Table>* table,
                     Error* err) {
  std::shared_ptr<arrow::io::ReadableFile> input;
  if (!AssignArrowResult(arrow::io::ReadableFile::Open(path), &input, "open Parquet file '" + path + "'", err)) {
    return false;
  }
  auto reader_result = parquet::arrow::OpenFile(input, arrow::default_memory_pool());
  if (!reader_result.ok()) {
    return SetError(err, ErrorKind::kIo, "read Parquet file '" + path + "': " + reader_result.status().ToString());
  }
  std::unique_ptr<parquet::arrow::FileReader> reader = std::move(reader_result).ValueOrDie();
  return ArrowStatusOk(reader->ReadTable(table), "convert Parquet file '" + path + "'", err);
}

#endif // FERTIBLEND_ARROW_ENABLED

} // namespace

namespace fertiblend {

int RawTable::ColumnIndex(const std::string& column) const {
  auto it = std::find(columns.begin(), columns.end(), column);
  return it == columns.end() ? -1 : static_cast<int>(std::distance(columns.begin(), it));
}

TableFormatKind TableFormatFromPath(const std::string& path) {
  auto dot = path.find_last_of('.');
  if (dot == std::string::npos) return TableFormatKind::kCSV;
  std::string ext = path.substr(dot + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
  if (ext == "arrow" || ext == "feather" || ext == "ipc") return TableFormatKind::kArrow;
  if (ext == "parquet") return TableFormatKind::kParquet;
  return TableFormatKind::kCSV;
}

char DetectDelimiter(const std::string& sample) {
  auto lines = NonBlankLines(StripBom(sample), kDelimiterSampleLines);
  if (lines.empty()) return ',';
  char best = ',';
  bool best_consistent = false;
  std::size_t best_columns = 1;
  std::vector<std::string> fields;
  for (char candidate : kCandidateDelimiters) {
    SplitCSV(lines[0], candidate, &fields);
    const std::size_t header_columns = fields.size();
    if (header_columns < 2) continue;
    bool consistent = true;
    for (std::size_t i = 1; i < lines.size(); ++i) {
      SplitCSV(lines[i], candidate, &fields);
      if (fields.size() != header_columns) { consistent = false; break; }
    }
    // Consistency first, then width; earlier candidates win ties.
    if ((consistent && !best_consistent) ||
        (consistent == best_consistent && header_columns > best_columns)) {
      best = candidate;
      best_consistent = consistent;
      best_columns = header_columns;
    }
  }
  return best;
}

bool ParseDelimitedText(const std::string& text, const std::string& table_name,
                        RawTable* out, Error* err) {
  if (!out) return SetError(err, ErrorKind::kIo, "null output table");
  const std::string body = StripBom(text);
  const char delimiter = DetectDelimiter(body);
  RawTable table;
  table.name = table_name;
  table.delimiter = delimiter;

  std::vector<std::string> fields;
  fields.reserve(8);
  bool header_processed = false;
  std::istringstream in(body);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (IsBlank(line)) continue;
    SplitCSV(line, delimiter, &fields);
    if (!header_processed) {
      for (const auto& col : fields) table.columns.push_back(Trim(StripBom(col)));
      header_processed = true;
      continue;
    }
    std::vector<std::string> row(table.columns.size());
    for (std::size_t i = 0; i < row.size() && i < fields.size(); ++i) {
      row[i] = Trim(fields[i]);
    }
    table.rows.push_back(std::move(row));
  }
  if (!header_processed) {
    return SetError(err, ErrorKind::kIo, "table '" + table_name + "' is empty (no header row)");
  }
  *out = std::move(table);
  return true;
}

bool ReadTableFromFile(const std::string& path, const std::string& table_name,
                       RawTable* out, Error* err) {
  switch (TableFormatFromPath(path)) {
    case TableFormatKind::kCSV: {
      std::ifstream in(path, std::ios::binary);
      if (!in) return SetError(err, ErrorKind::kIo, "failed to open " + table_name + " file '" + path + "'");
      std::ostringstream buffer;
      buffer << in.rdbuf();
      return ParseDelimitedText(buffer.str(), table_name, out, err);
    }
    case TableFormatKind::kArrow:
#ifdef FERTIBLEND_ARROW_ENABLED
    {
      std::shared_ptr<arrow::Table> table;
      if (!ReadArrowIpcFile(path, &table, err)) return false;
      return ArrowTableToRaw(table, table_name, out, err);
    }
#else
      return SetError(err, ErrorKind::kIo, table_name + " file '" + path + "': Arrow format not supported in this build");
#endif
    case TableFormatKind::kParquet:
#ifdef FERTIBLEND_ARROW_ENABLED
    {
      std::shared_ptr<arrow::Table> table;
      if (!ReadParquetFile(path, &table, err)) return false;
      return ArrowTableToRaw(table, table_name, out, err);
    }
#else
      return SetError(err, ErrorKind::kIo, table_name + " file '" + path + "': Parquet format not supported in this build");
#endif
  }
  return SetError(err, ErrorKind::kIo, table_name + " file '" + path + "' has an unexpected format");
}

} // namespace fertiblend
