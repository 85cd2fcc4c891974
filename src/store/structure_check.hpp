#pragma once

#include "core/errors/op_error.hpp"
#include "store/cup_store.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace cupkit::store {

enum class IssueSeverity {
  kError,
  kWarning,
};

const char* ToString(IssueSeverity severity);

struct StructureIssue {
  IssueSeverity severity = IssueSeverity::kError;
  std::string path;
  std::string message;
};

struct StructureReport {
  std::string codename;
  std::string league; // empty when the definition has none
  std::vector<StructureIssue> issues;

  std::size_t ErrorCount() const;
  std::size_t WarningCount() const;
  bool HasErrors() const {
    return ErrorCount() > 0U;
  }
};

// Read-only consistency check of one cup across all of its artifacts:
// definition fields, registry entry mirroring `name`/`title`, the override
// file and every ranking category for the definition's league. Ranking
// directories outside the fixed category set are warnings.
//
// Returns false only for an invalid codename; every finding about the data
// tree itself lands in `report`.
bool CheckCupStructure(const CupStore& store, std::string_view codename, StructureReport& report,
                       core::errors::OpError& error);

} // namespace cupkit::store
