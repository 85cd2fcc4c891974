#include "lifecycle/step_journal.hpp"

#include <catch2/catch_test_macros.hpp>

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using cupkit::core::errors::ErrorKind;
using cupkit::core::errors::OpError;
using cupkit::core::logging::LogLevel;
using cupkit::core::logging::Logger;
using cupkit::lifecycle::StepJournal;

namespace {

StepJournal::ApplyFn Record(std::vector<std::string>& trace, std::string name) {
  return [&trace, name](OpError&) {
    trace.push_back("apply " + name);
    return true;
  };
}

StepJournal::UndoFn RecordUndo(std::vector<std::string>& trace, std::string name) {
  return [&trace, name](std::string&) {
    trace.push_back("undo " + name);
    return true;
  };
}

StepJournal::ApplyFn FailWith(ErrorKind kind, std::string message) {
  return [kind, message](OpError& error) {
    return cupkit::core::errors::Fail(error, kind, message);
  };
}

} // namespace

TEST_CASE("All steps applied in order when nothing fails", "[lifecycle][journal]") {
  std::ostringstream log;
  Logger logger(LogLevel::kDebug, log);
  std::vector<std::string> trace;

  StepJournal journal("create", logger);
  journal.Add("a", Record(trace, "a"), RecordUndo(trace, "a"));
  journal.Add("b", Record(trace, "b"));

  OpError error;
  REQUIRE(journal.Run(error));
  REQUIRE(trace == std::vector<std::string>{"apply a", "apply b"});
  REQUIRE(journal.CompletedSteps() == std::vector<std::string>{"a", "b"});
  REQUIRE(log.str().find("step=\"b\"") != std::string::npos);
}

TEST_CASE("A failure rolls completed steps back in reverse order", "[lifecycle][journal]") {
  Logger logger(LogLevel::kError, std::cerr);
  std::vector<std::string> trace;

  StepJournal journal("clone", logger);
  journal.Add("copy overrides", Record(trace, "overrides"), RecordUndo(trace, "overrides"));
  journal.Add("copy rankings", Record(trace, "rankings"), RecordUndo(trace, "rankings"));
  journal.Add("write definition", FailWith(ErrorKind::kIoError, "disk full"));
  journal.Add("never reached", Record(trace, "never"));

  OpError error;
  REQUIRE_FALSE(journal.Run(error));
  REQUIRE(trace == std::vector<std::string>{"apply overrides", "apply rankings", "undo rankings",
                                            "undo overrides"});
  REQUIRE(error.kind == ErrorKind::kIoError);
  REQUIRE(error.applied_steps.empty());
  REQUIRE(error.message ==
          "clone failed at step 'write definition': disk full "
          "(rolled back: copy rankings, copy overrides)");
}

TEST_CASE("A step without undo turns the failure into a partial failure", "[lifecycle][journal]") {
  Logger logger(LogLevel::kError, std::cerr);
  std::vector<std::string> trace;

  StepJournal journal("delete", logger);
  journal.Add("remove overrides", Record(trace, "overrides"));
  journal.Add("remove rankings", Record(trace, "rankings"));
  journal.Add("remove definition", FailWith(ErrorKind::kIoError, "busy"));

  OpError error;
  REQUIRE_FALSE(journal.Run(error));
  REQUIRE(error.kind == ErrorKind::kPartialFailure);
  REQUIRE(error.applied_steps == std::vector<std::string>{"remove overrides", "remove rankings"});
  REQUIRE(cupkit::core::errors::FormatOpError(error).find(
              "applied_steps=[remove overrides, remove rankings]") != std::string::npos);
}

TEST_CASE("A failing undo keeps only that step applied", "[lifecycle][journal]") {
  Logger logger(LogLevel::kError, std::cerr);
  std::vector<std::string> trace;

  StepJournal journal("rename", logger);
  journal.Add("move overrides", Record(trace, "overrides"), RecordUndo(trace, "overrides"));
  journal.Add("move group", Record(trace, "group"), [](std::string& undo_error) {
    undo_error = "destination reappeared";
    return false;
  });
  journal.Add("move definition", FailWith(ErrorKind::kAlreadyExists, "taken"));

  OpError error;
  REQUIRE_FALSE(journal.Run(error));
  REQUIRE(error.kind == ErrorKind::kPartialFailure);
  REQUIRE(error.applied_steps == std::vector<std::string>{"move group"});
  REQUIRE(trace.back() == "undo overrides");
}

TEST_CASE("A failing first step needs no rollback", "[lifecycle][journal]") {
  Logger logger(LogLevel::kError, std::cerr);
  StepJournal journal("create", logger);
  journal.Add("write definition", FailWith(ErrorKind::kParseError, "bad body"));

  OpError error;
  REQUIRE_FALSE(journal.Run(error));
  REQUIRE(error.kind == ErrorKind::kParseError);
  REQUIRE(error.message == "create failed at step 'write definition': bad body");
}
