// Copyright (c) 2025
// SPDX-License-Identifier: MIT

#include "fertiblend/Errors.h"

#include <sstream>

namespace fertiblend {

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone: return "Ok";
    case ErrorKind::kIo: return "IoError";
    case ErrorKind::kMissingColumn: return "MissingColumnError";
    case ErrorKind::kUnknownCrop: return "UnknownCropError";
    case ErrorKind::kInvalidInput: return "InvalidInputError";
    case ErrorKind::kInvalidParameters: return "InvalidParameters";
    case ErrorKind::kPrecheckInfeasible: return "PrecheckInfeasible";
    case ErrorKind::kSolverNonOptimal: return "SolverNonOptimal";
    case ErrorKind::kSolverTimeout: return "SolverTimeout";
  }
  return "UnknownError";
}

bool SetError(Error* err, ErrorKind kind, const std::string& message) {
  if (err) {
    err->kind = kind;
    err->message = message;
  }
  return false;
}

std::string FormatError(const Error& err) {
  std::ostringstream oss;
  oss << ErrorKindName(err.kind) << ": " << err.message;
  for (const auto& line : err.diagnostics) {
    oss << "\n  - " << line;
  }
  return oss.str();
}

} // namespace fertiblend
