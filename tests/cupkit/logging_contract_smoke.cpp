#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/cup_fixtures.hpp"
#include "core/json_dom.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using cupkit::tests::common::AssertContains;
using cupkit::tests::common::AssertExitCode;
using cupkit::tests::common::AssertNotContains;
using cupkit::tests::common::CapturedRun;
using cupkit::tests::common::DispatchCaptured;

int main() {
  const cupkit::tests::common::ScratchRoot scratch("cupkit-logging");
  const fs::path& temp_root = scratch.Path();
  cupkit::tests::common::SeedSpringCup(temp_root);
  const std::string root = temp_root.string();

  // stdout carries only the JSON document; logs go to stderr.
  CapturedRun run =
      DispatchCaptured({"cupkit", "zygarde", "spring", "--root", root, "--log-level", "debug"});
  AssertExitCode(run.exit_code, 0, "zygarde debug");
  cupkit::core::json::Value parsed;
  std::string parse_error;
  if (!cupkit::core::json::Parse(run.stdout_text, parsed, parse_error)) {
    cupkit::tests::common::Fail("stdout is not JSON: " + parse_error);
  }
  AssertNotContains(run.stdout_text, "level=");
  AssertContains(run.stderr_text, "level=DEBUG op=\"zygarde\" msg=\"config resolved\" root=\"" +
                                      root + "\" filedrop=");
  AssertContains(run.stderr_text, "level=INFO op=\"zygarde\" msg=\"using cup file\"");
  AssertContains(run.stderr_text, "ts_utc=");
  AssertContains(run.stderr_text, "count=\"4\"");

  // Default level hides debug lines.
  run = DispatchCaptured({"cupkit", "zygarde", "spring", "--root", root});
  AssertExitCode(run.exit_code, 0, "zygarde default level");
  AssertNotContains(run.stderr_text, "level=DEBUG");
  AssertContains(run.stderr_text, "level=INFO");

  // error level keeps stderr quiet on success.
  run = DispatchCaptured({"cupkit", "clone", "spring", "summer", "--root", root, "--log-level",
                          "error"});
  AssertExitCode(run.exit_code, 0, "clone quiet");
  if (!run.stderr_text.empty()) {
    cupkit::tests::common::Fail("expected no log lines at error level: " + run.stderr_text);
  }

  // Failures log the stable code and print one contract line.
  run = DispatchCaptured({"cupkit", "clone", "spring", "summer", "--root", root});
  AssertExitCode(run.exit_code, 11, "clone collision");
  AssertContains(run.stderr_text, "level=ERROR op=\"clone\" msg=\"operation failed\" root=\"" +
                                      root + "\" code=\"ALREADY_EXISTS\"");
  AssertContains(run.stderr_text, "\nerror: ALREADY_EXISTS: ");
  return 0;
}
