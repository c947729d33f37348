// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <vector>

namespace fertiblend {

enum class ErrorKind {
  kNone,
  kIo,                  // unreadable or unsupported input/output file
  kMissingColumn,       // required column absent from an input table
  kUnknownCrop,         // field references a crop missing from requirements
  kInvalidInput,        // structurally invalid row (bad area, min > max, ...)
  kInvalidParameters,   // scenario parameters out of range
  kPrecheckInfeasible,  // conservative feasibility check failed
  kSolverNonOptimal,    // LP returned infeasible/unbounded/abnormal
  kSolverTimeout,       // LP hit its time limit before proving optimality
};

// Error payload filled by every fallible call through an optional Error*.
struct Error {
  ErrorKind kind = ErrorKind::kNone;
  std::string message;
  std::vector<std::string> diagnostics; // one line per precheck finding

  bool ok() const { return kind == ErrorKind::kNone; }
  void Clear() { kind = ErrorKind::kNone; message.clear(); diagnostics.clear(); }
};

// Stable name used in CLI output, e.g. "MissingColumnError".
const char* ErrorKindName(ErrorKind kind);

// Fills err (when non-null) and returns false so callers can `return SetError(...)`.
bool SetError(Error* err, ErrorKind kind, const std::string& message);

// Multi-line rendering: "<Kind>: message" followed by "  - diagnostic" lines.
std::string FormatError(const Error& err);

} // namespace fertiblend
