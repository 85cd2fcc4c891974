#pragma once

namespace cupkit::core::errors {

// Stable process-exit contract for CLI automation.
//
// The first three values preserve conventional meanings used by scripts:
// - 0 success
// - 1 generic command failure
// - 2 usage/argument failure
//
// Additional values classify cup operation failures so wrappers can branch
// without scraping stderr text.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kNotFound = 10,
  kAlreadyExists = 11,
  kMissingField = 12,
  kParseError = 13,
  kPartialFailure = 20,
  kInconsistent = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace cupkit::core::errors
