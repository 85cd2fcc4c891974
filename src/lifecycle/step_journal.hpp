#pragma once

#include "core/errors/op_error.hpp"
#include "core/logging/logger.hpp"

#include <functional>
#include <string>
#include <vector>

namespace cupkit::lifecycle {

// Ordered list of named steps making up one multi-file cup operation.
//
// Run() applies steps in order. On the first failure every completed step is
// undone in reverse order:
// - all undos succeed  => the failing step's error is returned unchanged in
//   kind, with the rolled-back step names appended to the message
// - any step cannot be undone (no undo action, or the undo failed)
//   => kPartialFailure, `applied_steps` lists what is still applied
//
// Steps never retry. The journal holds no locks; see CupLifecycleManager for
// the caller-side serialization contract.
class StepJournal {
public:
  using ApplyFn = std::function<bool(core::errors::OpError&)>;
  using UndoFn = std::function<bool(std::string&)>;

  StepJournal(std::string operation, core::logging::Logger& logger);

  // An empty `undo` marks the step irreversible.
  void Add(std::string name, ApplyFn apply, UndoFn undo = {});

  bool Run(core::errors::OpError& error);

  const std::vector<std::string>& CompletedSteps() const {
    return completed_;
  }

private:
  struct Step {
    std::string name;
    ApplyFn apply;
    UndoFn undo;
  };

  void RollBack(std::size_t completed_count, core::errors::OpError& error);

  std::string operation_;
  core::logging::Logger& logger_;
  std::vector<Step> steps_;
  std::vector<std::string> completed_;
};

} // namespace cupkit::lifecycle
