#pragma once

#include "core/errors/op_error.hpp"
#include "core/logging/logger.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cupkit::merge {

// Unmerged states as reported by `git status --porcelain` (X = ours, Y = theirs).
enum class ConflictState {
  kBothDeleted,   // DD
  kAddedByUs,     // AU
  kDeletedByThem, // UD
  kAddedByThem,   // UA
  kDeletedByUs,   // DU
  kBothAdded,     // AA
  kBothModified,  // UU
};

bool ParseConflictState(std::string_view code, ConflictState& state);
const char* ToString(ConflictState state);

bool OursExists(ConflictState state);
bool TheirsExists(ConflictState state);

struct Conflict {
  std::string path; // relative to the working tree root, '/' separated
  ConflictState state = ConflictState::kBothModified;
};

enum class ResolutionAction {
  kDelete,
  kKeepOurs,
  kTakeTheirs,
  kArchiveAndReset,
};

const char* ToString(ResolutionAction action);

struct Resolution {
  std::string path;
  ConflictState state = ConflictState::kBothModified;
  ResolutionAction action = ResolutionAction::kTakeTheirs;
  int rule = 0; // 1-based precedence rule that claimed the path
};

inline constexpr std::string_view kFormatsRegistryPath = "src/data/gamemaster/formats.json";
inline constexpr std::string_view kMinifiedGamemasterPath = "src/data/gamemaster.min.json";
inline constexpr std::string_view kGamemasterSourcePath = "src/data/gamemaster.json";

// True for ranking outputs: any file named `rankings-*.json`.
bool IsRankingOutput(std::string_view path);

// Fixed precedence, each rule only seeing paths earlier rules left:
//   1. deleted upstream, modified locally      -> delete
//   2. formats registry                        -> keep ours
//   3. minified gamemaster                     -> take theirs
//   4. ranking outputs                         -> take theirs
//   5. gamemaster source                       -> archive, then reset to []
//   6. everything else                         -> take theirs
// The result is grouped by rule and keeps input order inside a rule.
std::vector<Resolution> PlanResolutions(const std::vector<Conflict>& conflicts);

// Working-tree operations the policy needs. GitWorkspace drives a real
// checkout; tests use an in-memory fake.
class ConflictWorkspace {
public:
  virtual ~ConflictWorkspace() = default;

  virtual bool ListConflicts(std::vector<Conflict>& conflicts, core::errors::OpError& error) = 0;
  virtual bool Exists(const std::string& path) = 0;
  virtual bool CheckoutOurs(const std::string& path, core::errors::OpError& error) = 0;
  virtual bool CheckoutTheirs(const std::string& path, core::errors::OpError& error) = 0;
  // Deletes the file from the working tree.
  virtual bool Remove(const std::string& path, core::errors::OpError& error) = 0;
  virtual bool Move(const std::string& from, const std::string& to,
                    core::errors::OpError& error) = 0;
  virtual bool Write(const std::string& path, std::string_view text,
                     core::errors::OpError& error) = 0;
  // Records the working-tree state of `path` (including its absence) in the index.
  virtual bool Stage(const std::string& path, core::errors::OpError& error) = 0;
};

struct ResolveReport {
  std::vector<Resolution> applied;
  std::vector<std::string> backups;
};

// Applies `plan` in order, staging every resolved path. `stamp` names the
// gamemaster backup: `<path>.<stamp>.bak`. Stops at the first failure; the
// report then lists what was already applied.
bool ApplyResolutions(ConflictWorkspace& workspace, const std::vector<Resolution>& plan,
                      std::string_view stamp, ResolveReport& report,
                      core::errors::OpError& error,
                      core::logging::Logger& logger = core::logging::NullLogger());

// ListConflicts + PlanResolutions + ApplyResolutions with a UTC stamp taken now.
bool ResolveConflicts(ConflictWorkspace& workspace, ResolveReport& report,
                      core::errors::OpError& error,
                      core::logging::Logger& logger = core::logging::NullLogger());

} // namespace cupkit::merge
