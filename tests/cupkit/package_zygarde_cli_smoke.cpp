#include "archive/zip_reader.hpp"
#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/cup_fixtures.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using cupkit::tests::common::AssertContains;
using cupkit::tests::common::AssertEqual;
using cupkit::tests::common::AssertExists;
using cupkit::tests::common::AssertExitCode;
using cupkit::tests::common::CapturedRun;
using cupkit::tests::common::DispatchCaptured;

namespace {

constexpr std::string_view kExpectedRankingsConfig = R"json({
  "allowedMons": "azumarill, venusaur, whimsicott",
  "name": "Spring Cup (Devon)",
  "league": "Great",
  "rulesUri": "https://example.test/spring-rules",
  "uniquenessRule": "DexNumberAndType",
  "slots": 6
}
)json";

} // namespace

int main() {
  const cupkit::tests::common::ScratchRoot scratch("cupkit-package-cli");
  const fs::path& temp_root = scratch.Path();
  const fs::path data_root = temp_root / "data";
  const fs::path filedrop = temp_root / "filedrop";
  cupkit::tests::common::SeedSpringCup(data_root);

  CapturedRun run = DispatchCaptured({"cupkit", "package", "spring", "--root", data_root.string(),
                                      "--filedrop", filedrop.string(), "--uri-root",
                                      "https://files.example.test/drop/"});
  AssertExitCode(run.exit_code, 0, "package");
  const fs::path zip_path = filedrop / "spring.zip";
  AssertContains(run.stdout_text, "archive: " + zip_path.string());
  AssertContains(run.stdout_text, "url: https://files.example.test/drop/spring.zip\n");
  AssertExists(filedrop / "spring" / "overrides" / "spring" / "1500.json");

  cupkit::archive::ZipReader reader;
  cupkit::core::errors::OpError error;
  if (!reader.Open(zip_path, error)) {
    cupkit::tests::common::Fail("archive did not open: " + error.message);
  }
  AssertEqual(reader.Entries().front().name, "spring/cupfile/spring.json", "first entry");

  // Config from the live tree and from the archive must agree.
  run = DispatchCaptured({"cupkit", "zygarde", "spring", "--root", data_root.string()});
  AssertExitCode(run.exit_code, 0, "zygarde from store");
  AssertEqual(run.stdout_text, kExpectedRankingsConfig, "zygarde store output");

  run = DispatchCaptured({"cupkit", "zygarde", "--archive", zip_path.string()});
  AssertExitCode(run.exit_code, 0, "zygarde from archive");
  AssertEqual(run.stdout_text, kExpectedRankingsConfig, "zygarde archive output");

  run = DispatchCaptured(
      {"cupkit", "zygarde", "--archive", zip_path.string(), "--snapshot", "overrides"});
  AssertExitCode(run.exit_code, 0, "zygarde overrides snapshot");
  AssertContains(run.stdout_text, "\"allowedMons\": \"venusaur\"");

  // Threat group over the packaged rankings snapshot.
  const fs::path list_path = temp_root / "threats.txt";
  cupkit::tests::common::WriteFileOrFail(list_path, "whimsicott\nazumarill\nmewtwo\n");
  run = DispatchCaptured({"cupkit", "threat-group", list_path.string(),
                          (filedrop / "spring" / "rankings" / "spring" / "overall" /
                           "rankings-1500.json")
                              .string()});
  AssertExitCode(run.exit_code, 0, "threat-group");
  const std::size_t first = run.stdout_text.find("\"azumarill\"");
  const std::size_t second = run.stdout_text.find("\"azumarill\"", first + 1U);
  const std::size_t last = run.stdout_text.find("\"whimsicott\"");
  if (first == std::string::npos || second == std::string::npos || last < second) {
    cupkit::tests::common::Fail("threat group output not sorted: " + run.stdout_text);
  }
  cupkit::tests::common::AssertNotContains(run.stdout_text, "venusaur");

  run = DispatchCaptured({"cupkit", "package", "winter", "--root", data_root.string(),
                          "--filedrop", filedrop.string()});
  AssertExitCode(run.exit_code, 10, "package unknown cup");

  run = DispatchCaptured({"cupkit", "zygarde", "--archive", (filedrop / "winter.zip").string()});
  AssertExitCode(run.exit_code, 10, "zygarde missing archive");
  return 0;
}
