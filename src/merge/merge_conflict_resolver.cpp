#include "merge/merge_conflict_resolver.hpp"

#include "core/time_utils.hpp"

#include <chrono>
#include <functional>

namespace cupkit::merge {

namespace {

using core::errors::ErrorKind;
using core::errors::OpError;

struct Rule {
  ResolutionAction action;
  std::function<bool(const Conflict&)> matches;
};

std::string_view FileName(std::string_view path) {
  const std::size_t slash = path.rfind('/');
  return slash == std::string_view::npos ? path : path.substr(slash + 1U);
}

const std::vector<Rule>& Rules() {
  static const std::vector<Rule> rules = {
      {ResolutionAction::kDelete,
       [](const Conflict& c) { return c.state == ConflictState::kDeletedByThem; }},
      {ResolutionAction::kKeepOurs,
       [](const Conflict& c) { return c.path == kFormatsRegistryPath; }},
      {ResolutionAction::kTakeTheirs,
       [](const Conflict& c) { return c.path == kMinifiedGamemasterPath; }},
      {ResolutionAction::kTakeTheirs, [](const Conflict& c) { return IsRankingOutput(c.path); }},
      {ResolutionAction::kArchiveAndReset,
       [](const Conflict& c) { return c.path == kGamemasterSourcePath; }},
      {ResolutionAction::kTakeTheirs, [](const Conflict&) { return true; }},
  };
  return rules;
}

bool ApplyOne(ConflictWorkspace& workspace, const Resolution& resolution, std::string_view stamp,
              ResolveReport& report, OpError& error, core::logging::Logger& logger) {
  const std::string& path = resolution.path;
  switch (resolution.action) {
  case ResolutionAction::kDelete:
    if (workspace.Exists(path) && !workspace.Remove(path, error)) {
      return false;
    }
    break;
  case ResolutionAction::kKeepOurs:
    if (!OursExists(resolution.state)) {
      if (workspace.Exists(path) && !workspace.Remove(path, error)) {
        return false;
      }
    } else if (!workspace.CheckoutOurs(path, error)) {
      return false;
    }
    break;
  case ResolutionAction::kTakeTheirs:
    if (!TheirsExists(resolution.state)) {
      if (workspace.Exists(path) && !workspace.Remove(path, error)) {
        return false;
      }
    } else if (!workspace.CheckoutTheirs(path, error)) {
      return false;
    }
    break;
  case ResolutionAction::kArchiveAndReset: {
    if (workspace.Exists(path)) {
      const std::string backup = path + "." + std::string(stamp) + ".bak";
      if (!workspace.Move(path, backup, error) || !workspace.Stage(backup, error)) {
        return false;
      }
      report.backups.push_back(backup);
      logger.Info("gamemaster archived", {{"path", path}, {"backup", backup}});
    }
    if (!workspace.Write(path, "[]\n", error)) {
      return false;
    }
    break;
  }
  }

  if (!workspace.Stage(path, error)) {
    return false;
  }
  logger.Info("conflict resolved", {{"path", path},
                                    {"state", ToString(resolution.state)},
                                    {"action", ToString(resolution.action)},
                                    {"rule", std::to_string(resolution.rule)}});
  return true;
}

} // namespace

bool ParseConflictState(std::string_view code, ConflictState& state) {
  if (code == "DD") {
    state = ConflictState::kBothDeleted;
  } else if (code == "AU") {
    state = ConflictState::kAddedByUs;
  } else if (code == "UD") {
    state = ConflictState::kDeletedByThem;
  } else if (code == "UA") {
    state = ConflictState::kAddedByThem;
  } else if (code == "DU") {
    state = ConflictState::kDeletedByUs;
  } else if (code == "AA") {
    state = ConflictState::kBothAdded;
  } else if (code == "UU") {
    state = ConflictState::kBothModified;
  } else {
    return false;
  }
  return true;
}

const char* ToString(ConflictState state) {
  switch (state) {
  case ConflictState::kBothDeleted:
    return "DD";
  case ConflictState::kAddedByUs:
    return "AU";
  case ConflictState::kDeletedByThem:
    return "UD";
  case ConflictState::kAddedByThem:
    return "UA";
  case ConflictState::kDeletedByUs:
    return "DU";
  case ConflictState::kBothAdded:
    return "AA";
  case ConflictState::kBothModified:
    return "UU";
  }
  return "UU";
}

bool OursExists(ConflictState state) {
  return state == ConflictState::kAddedByUs || state == ConflictState::kDeletedByThem ||
         state == ConflictState::kBothAdded || state == ConflictState::kBothModified;
}

bool TheirsExists(ConflictState state) {
  return state == ConflictState::kAddedByThem || state == ConflictState::kDeletedByUs ||
         state == ConflictState::kBothAdded || state == ConflictState::kBothModified;
}

const char* ToString(ResolutionAction action) {
  switch (action) {
  case ResolutionAction::kDelete:
    return "delete";
  case ResolutionAction::kKeepOurs:
    return "keep_ours";
  case ResolutionAction::kTakeTheirs:
    return "take_theirs";
  case ResolutionAction::kArchiveAndReset:
    return "archive_and_reset";
  }
  return "take_theirs";
}

bool IsRankingOutput(std::string_view path) {
  const std::string_view name = FileName(path);
  constexpr std::string_view kPrefix = "rankings-";
  constexpr std::string_view kSuffix = ".json";
  return name.size() >= kPrefix.size() + kSuffix.size() &&
         name.substr(0, kPrefix.size()) == kPrefix &&
         name.substr(name.size() - kSuffix.size()) == kSuffix;
}

std::vector<Resolution> PlanResolutions(const std::vector<Conflict>& conflicts) {
  std::vector<Resolution> plan;
  std::vector<bool> claimed(conflicts.size(), false);
  const auto& rules = Rules();
  for (std::size_t r = 0; r < rules.size(); ++r) {
    for (std::size_t i = 0; i < conflicts.size(); ++i) {
      if (claimed[i] || !rules[r].matches(conflicts[i])) {
        continue;
      }
      claimed[i] = true;
      plan.push_back({conflicts[i].path, conflicts[i].state, rules[r].action,
                      static_cast<int>(r) + 1});
    }
  }
  return plan;
}

bool ApplyResolutions(ConflictWorkspace& workspace, const std::vector<Resolution>& plan,
                      std::string_view stamp, ResolveReport& report, OpError& error,
                      core::logging::Logger& logger) {
  if (stamp.empty()) {
    return core::errors::Fail(error, ErrorKind::kInvalidArgument, "backup stamp cannot be empty");
  }
  for (const auto& resolution : plan) {
    if (!ApplyOne(workspace, resolution, stamp, report, error, logger)) {
      error.message = "resolving '" + resolution.path + "' failed: " + error.message;
      return false;
    }
    report.applied.push_back(resolution);
  }
  return true;
}

bool ResolveConflicts(ConflictWorkspace& workspace, ResolveReport& report, OpError& error,
                      core::logging::Logger& logger) {
  std::vector<Conflict> conflicts;
  if (!workspace.ListConflicts(conflicts, error)) {
    return false;
  }
  if (conflicts.empty()) {
    logger.Info("no unmerged paths");
    return true;
  }

  const std::string stamp = core::FormatBackupStamp(std::chrono::system_clock::now());
  return ApplyResolutions(workspace, PlanResolutions(conflicts), stamp, report, error, logger);
}

} // namespace cupkit::merge
