#pragma once

#include "core/errors/exit_codes.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cupkit::core::errors {

// Failure classification shared by every cup operation.
enum class ErrorKind {
  kNone,
  kNotFound,
  kAlreadyExists,
  kMissingField,
  kParseError,
  kPartialFailure,
  kInvalidArgument,
  kIoError,
};

// Filled by library calls that return false.
//
// `applied_steps` is only populated for kPartialFailure: it names the
// lifecycle steps that completed and could not be undone, so a caller can
// reconcile the data tree by hand.
struct OpError {
  ErrorKind kind = ErrorKind::kNone;
  std::string message;
  std::vector<std::string> applied_steps;

  void Clear() {
    kind = ErrorKind::kNone;
    message.clear();
    applied_steps.clear();
  }
};

// Convenience for `return Fail(error, kind, "...")` call sites.
inline bool Fail(OpError& error, ErrorKind kind, std::string message) {
  error.kind = kind;
  error.message = std::move(message);
  error.applied_steps.clear();
  return false;
}

constexpr std::string_view ToStableErrorCode(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kNone:
    return "OK";
  case ErrorKind::kNotFound:
    return "NOT_FOUND";
  case ErrorKind::kAlreadyExists:
    return "ALREADY_EXISTS";
  case ErrorKind::kMissingField:
    return "MISSING_FIELD";
  case ErrorKind::kParseError:
    return "PARSE_ERROR";
  case ErrorKind::kPartialFailure:
    return "PARTIAL_FAILURE";
  case ErrorKind::kInvalidArgument:
    return "INVALID_ARGUMENT";
  case ErrorKind::kIoError:
    return "IO_ERROR";
  }
  return "UNKNOWN";
}

constexpr ExitCode ToExitCode(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kNone:
    return ExitCode::kSuccess;
  case ErrorKind::kNotFound:
    return ExitCode::kNotFound;
  case ErrorKind::kAlreadyExists:
    return ExitCode::kAlreadyExists;
  case ErrorKind::kMissingField:
    return ExitCode::kMissingField;
  case ErrorKind::kParseError:
    return ExitCode::kParseError;
  case ErrorKind::kPartialFailure:
    return ExitCode::kPartialFailure;
  case ErrorKind::kInvalidArgument:
    return ExitCode::kUsage;
  case ErrorKind::kIoError:
    return ExitCode::kFailure;
  }
  return ExitCode::kFailure;
}

// Single-line contract text: "<STABLE_CODE>: <message>" followed by the
// applied steps for partial failures.
inline std::string FormatOpError(const OpError& error) {
  std::string text = std::string(ToStableErrorCode(error.kind)) + ": " + error.message;
  if (!error.applied_steps.empty()) {
    text += " applied_steps=[";
    for (std::size_t i = 0; i < error.applied_steps.size(); ++i) {
      if (i > 0U) {
        text += ", ";
      }
      text += error.applied_steps[i];
    }
    text += "]";
  }
  return text;
}

} // namespace cupkit::core::errors
