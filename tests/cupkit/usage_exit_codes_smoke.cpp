#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"

#include <string>
#include <vector>

using cupkit::tests::common::AssertContains;
using cupkit::tests::common::AssertExitCode;
using cupkit::tests::common::CapturedRun;
using cupkit::tests::common::DispatchCaptured;

namespace {

void ExpectUsageError(const std::vector<std::string>& argv, std::string_view needle) {
  const CapturedRun run = DispatchCaptured(argv);
  AssertExitCode(run.exit_code, 2, argv.size() > 1U ? argv[1] : "no args");
  AssertContains(run.stderr_text, needle);
  if (!run.stdout_text.empty()) {
    cupkit::tests::common::Fail("usage errors must not write to stdout: " + run.stdout_text);
  }
}

} // namespace

int main() {
  ExpectUsageError({"cupkit"}, "usage:");
  ExpectUsageError({"cupkit", "frobnicate"}, "unknown subcommand: frobnicate");
  ExpectUsageError({"cupkit", "clone", "spring"}, "clone requires exactly 2 arguments");
  ExpectUsageError({"cupkit", "delete", "spring", "--force", "yes"},
                   "delete: unknown option: --force");
  ExpectUsageError({"cupkit", "rename", "a", "b", "--title"}, "missing value for --title");
  ExpectUsageError({"cupkit", "clone", "a", "b", "--title", "x", "--title", "y"},
                   "duplicate option: --title");
  ExpectUsageError({"cupkit", "create", "winter", "--cp", "1500"},
                   "create requires --cp <500|1500|2500|10000> and --definition");
  ExpectUsageError({"cupkit", "zygarde", "spring", "--archive", "x.zip"},
                   "exactly one of <name> or --archive");
  ExpectUsageError({"cupkit", "zygarde", "spring", "--snapshot", "group"},
                   "expected rankings|overrides");
  ExpectUsageError({"cupkit", "list", "--log-level", "loud"}, "invalid --log-level 'loud'");
  ExpectUsageError({"cupkit", "version", "extra"}, "version does not accept arguments");

  CapturedRun run = DispatchCaptured({"cupkit", "version"});
  AssertExitCode(run.exit_code, 0, "version");
  AssertContains(run.stdout_text, "cupkit ");

  run = DispatchCaptured({"cupkit", "help"});
  AssertExitCode(run.exit_code, 0, "help");
  AssertContains(run.stdout_text, "cupkit resolve-conflicts <worktree>");
  return 0;
}
