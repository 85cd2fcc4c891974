#pragma once

#include "core/errors/op_error.hpp"
#include "core/logging/logger.hpp"
#include "store/cup_store.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace cupkit::lifecycle {

struct CreateRequest {
  std::string codename;
  std::string title;
  store::CpTier cp_tier = store::CpTier::k1500;
  // Raw JSON object text for the cup definition. `name` and `title` are
  // assigned by create; every other field is written as given.
  std::string definition_body;
};

// Create/clone/rename/delete over every artifact group of a cup.
//
// Each operation checks its preconditions first (nothing is touched when they
// fail) and then runs an ordered StepJournal, so a failure part-way rolls the
// completed steps back or reports kPartialFailure.
//
// Concurrency contract: no locking is done here. Callers must serialize all
// operations that touch the same (root, codename) pair, including the source
// and destination codenames of clone/rename. Operations on different roots
// are independent.
class CupLifecycleManager {
public:
  CupLifecycleManager(store::CupStore store, core::logging::Logger& logger);

  const store::CupStore& Store() const {
    return store_;
  }

  // Precondition: no definition for the codename (kAlreadyExists).
  // `written` receives every file created, in write order.
  bool Create(const CreateRequest& request, std::vector<std::filesystem::path>& written,
              core::errors::OpError& error);

  // Preconditions: source definition and registry entry exist (kNotFound);
  // nothing exists yet for the new codename (kAlreadyExists).
  bool Clone(std::string_view old_codename, std::string_view new_codename,
             std::string_view new_title, std::vector<std::filesystem::path>& written,
             core::errors::OpError& error);

  // Same preconditions as Clone. Artifacts are moved, not copied.
  bool Rename(std::string_view old_codename, std::string_view new_codename,
              std::string_view new_title, std::vector<std::filesystem::path>& moved,
              core::errors::OpError& error);

  // Removes whatever exists; absent artifacts are skipped. Deletes cannot be
  // undone, so a failure after the first removal is kPartialFailure.
  bool Delete(std::string_view codename, std::vector<std::filesystem::path>& removed,
              core::errors::OpError& error);

private:
  store::CupStore store_;
  core::logging::Logger& logger_;
};

// "january2026" => "January2026". Used when a caller gives no display title.
std::string DefaultTitleFor(std::string_view codename);

} // namespace cupkit::lifecycle
