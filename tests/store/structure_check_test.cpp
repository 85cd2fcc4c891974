#include "store/structure_check.hpp"

#include "common/cup_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using cupkit::core::errors::ErrorKind;
using cupkit::core::errors::OpError;
using cupkit::store::IssueSeverity;
using cupkit::store::StructureReport;

namespace {

bool HasIssue(const StructureReport& report, IssueSeverity severity, const std::string& needle) {
  return std::any_of(report.issues.begin(), report.issues.end(), [&](const auto& issue) {
    return issue.severity == severity &&
           (issue.message.find(needle) != std::string::npos ||
            issue.path.find(needle) != std::string::npos);
  });
}

} // namespace

TEST_CASE("A fully populated cup verifies clean", "[store][verify]") {
  const cupkit::tests::common::ScratchRoot scratch("cupkit-verify-clean");
  const fs::path& root = scratch.Path();
  cupkit::tests::common::SeedSpringCup(root);

  StructureReport report;
  OpError error;
  REQUIRE(cupkit::store::CheckCupStructure(cupkit::store::CupStore(root), "spring", report, error));
  REQUIRE(report.league == "1500");
  REQUIRE(report.issues.empty());
  REQUIRE_FALSE(report.HasErrors());
}

TEST_CASE("Verify flags drift and missing artifacts", "[store][verify]") {
  const cupkit::tests::common::ScratchRoot scratch("cupkit-verify-drift");
  const fs::path& root = scratch.Path();
  cupkit::tests::common::SeedSpringCup(root);
  cupkit::tests::common::WriteFileOrFail(
      root / "gamemaster" / "cups" / "spring.json",
      R"({"name":"spring","title":"Spring Cup Remix","league":1500})");
  fs::remove(root / "rankings" / "spring" / "leads" / "rankings-1500.json");
  fs::remove(root / "groups" / "spring.json");
  fs::create_directories(root / "rankings" / "spring" / "beam");

  StructureReport report;
  OpError error;
  REQUIRE(cupkit::store::CheckCupStructure(cupkit::store::CupStore(root), "spring", report, error));
  REQUIRE(report.HasErrors());
  REQUIRE(HasIssue(report, IssueSeverity::kError, "does not match definition title"));
  REQUIRE(HasIssue(report, IssueSeverity::kError, "leads"));
  REQUIRE(HasIssue(report, IssueSeverity::kWarning, "group file missing"));
  REQUIRE(HasIssue(report, IssueSeverity::kWarning, "beam"));
  REQUIRE(report.ErrorCount() == 2U);
  REQUIRE(report.WarningCount() == 2U);
}

TEST_CASE("Verify of an unknown cup reports errors rather than failing", "[store][verify]") {
  const cupkit::tests::common::ScratchRoot scratch("cupkit-verify-absent");
  const fs::path& root = scratch.Path();

  StructureReport report;
  OpError error;
  REQUIRE(cupkit::store::CheckCupStructure(cupkit::store::CupStore(root), "ghost", report, error));
  REQUIRE(HasIssue(report, IssueSeverity::kError, "file not found"));
  REQUIRE(HasIssue(report, IssueSeverity::kError, "no registry entry"));
  REQUIRE(HasIssue(report, IssueSeverity::kError, "rankings directory missing"));

  REQUIRE_FALSE(
      cupkit::store::CheckCupStructure(cupkit::store::CupStore(root), "Ghost", report, error));
  REQUIRE(error.kind == ErrorKind::kInvalidArgument);
}
