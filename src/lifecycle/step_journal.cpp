#include "lifecycle/step_journal.hpp"

#include <utility>

namespace cupkit::lifecycle {

using core::errors::ErrorKind;
using core::errors::OpError;

StepJournal::StepJournal(std::string operation, core::logging::Logger& logger)
    : operation_(std::move(operation)), logger_(logger) {}

void StepJournal::Add(std::string name, ApplyFn apply, UndoFn undo) {
  steps_.push_back(Step{std::move(name), std::move(apply), std::move(undo)});
}

bool StepJournal::Run(OpError& error) {
  completed_.clear();

  for (std::size_t i = 0; i < steps_.size(); ++i) {
    const Step& step = steps_[i];
    logger_.Debug("applying step", {{"step", step.name}});

    OpError step_error;
    if (!step.apply(step_error)) {
      logger_.Error("step failed", {{"step", step.name}, {"error", step_error.message}});
      error = std::move(step_error);
      error.message = operation_ + " failed at step '" + step.name + "': " + error.message;
      RollBack(i, error);
      return false;
    }
    completed_.push_back(step.name);
  }

  return true;
}

void StepJournal::RollBack(std::size_t completed_count, OpError& error) {
  if (completed_count == 0U) {
    return;
  }

  std::vector<std::string> rolled_back;
  std::vector<std::string> still_applied;
  for (std::size_t i = completed_count; i-- > 0U;) {
    const Step& step = steps_[i];
    if (!step.undo) {
      logger_.Warn("step cannot be undone", {{"step", step.name}});
      still_applied.push_back(step.name);
      continue;
    }

    std::string undo_error;
    if (!step.undo(undo_error)) {
      logger_.Error("undo failed", {{"step", step.name}, {"error", undo_error}});
      still_applied.push_back(step.name);
      continue;
    }
    logger_.Info("step rolled back", {{"step", step.name}});
    rolled_back.push_back(step.name);
  }

  if (still_applied.empty()) {
    std::string names;
    for (const auto& name : rolled_back) {
      names += names.empty() ? name : ", " + name;
    }
    error.message += " (rolled back: " + names + ")";
    return;
  }

  // Report in application order.
  error.applied_steps.assign(still_applied.rbegin(), still_applied.rend());
  error.kind = ErrorKind::kPartialFailure;
  error.message += " (rollback incomplete, cup left partially migrated)";
}

} // namespace cupkit::lifecycle
