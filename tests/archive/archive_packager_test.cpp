#include "archive/archive_packager.hpp"

#include "archive/zip_reader.hpp"
#include "common/cup_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using cupkit::archive::ArchivePackager;
using cupkit::archive::PackageResult;
using cupkit::archive::ZipReader;
using cupkit::core::errors::ErrorKind;
using cupkit::core::errors::OpError;
using cupkit::core::logging::LogLevel;
using cupkit::core::logging::Logger;

namespace {

std::vector<std::string> EntryNames(const ZipReader& reader) {
  std::vector<std::string> names;
  for (const auto& entry : reader.Entries()) {
    names.push_back(entry.name);
  }
  return names;
}

} // namespace

TEST_CASE("Package stages the cup layout and zips it", "[archive][package]") {
  const cupkit::tests::common::ScratchRoot scratch("cupkit-package");
  const fs::path& root = scratch.Path();
  cupkit::tests::common::SeedSpringCup(root / "data");
  const cupkit::store::CupStore store(root / "data");
  Logger logger(LogLevel::kError, std::cerr);
  const ArchivePackager packager(store, logger);

  PackageResult result;
  OpError error;
  REQUIRE(packager.Package("spring", root / "drop", "https://cdn.example.test/cups/", result,
                           error));
  REQUIRE(result.archive_path == root / "drop" / "spring.zip");
  REQUIRE(result.url == "https://cdn.example.test/cups/spring.zip");
  REQUIRE(result.staged.size() == 4U);
  REQUIRE(fs::is_regular_file(root / "drop" / "spring" / "cupfile" / "spring.json"));
  REQUIRE(fs::is_regular_file(root / "drop" / "spring" / "group" / "spring.json"));

  ZipReader reader;
  REQUIRE(reader.Open(result.archive_path, error));
  const std::vector<std::string> names = EntryNames(reader);
  REQUIRE(names.size() == 10U);
  REQUIRE(names.front() == "spring/cupfile/spring.json");
  REQUIRE(reader.Find("spring/group/spring.json") != nullptr);
  REQUIRE(reader.Find("spring/overrides/spring/1500.json") != nullptr);
  REQUIRE(reader.Find("spring/rankings/spring/leads/rankings-1500.json") != nullptr);

  std::string contents;
  REQUIRE(reader.Read("spring/rankings/spring/overall/rankings-1500.json", contents, error));
  REQUIRE(contents == cupkit::tests::common::kSpringOverall);
  REQUIRE(reader.Read("spring/cupfile/spring.json", contents, error));
  REQUIRE(contents == cupkit::tests::common::kSpringDefinition);

  REQUIRE_FALSE(reader.Read("spring/missing.json", contents, error));
  REQUIRE(error.kind == ErrorKind::kNotFound);
}

TEST_CASE("Package replaces a previous staging tree and skips optional parts",
          "[archive][package]") {
  const cupkit::tests::common::ScratchRoot scratch("cupkit-package-replace");
  const fs::path& root = scratch.Path();
  cupkit::tests::common::SeedSpringCup(root / "data");
  fs::remove_all(root / "data" / "overrides");
  fs::remove(root / "data" / "groups" / "spring.json");
  cupkit::tests::common::WriteFileOrFail(root / "drop" / "spring" / "stale.txt", "old");

  const cupkit::store::CupStore store(root / "data");
  Logger logger(LogLevel::kError, std::cerr);
  const ArchivePackager packager(store, logger);

  PackageResult result;
  OpError error;
  REQUIRE(packager.Package("spring", root / "drop", "https://cdn.example.test", result, error));
  REQUIRE(result.url == "https://cdn.example.test/spring.zip");
  REQUIRE(result.staged.size() == 2U);
  REQUIRE_FALSE(fs::exists(root / "drop" / "spring" / "stale.txt"));

  ZipReader reader;
  REQUIRE(reader.Open(result.archive_path, error));
  REQUIRE(reader.Entries().size() == 8U);
  REQUIRE(reader.Find("spring/stale.txt") == nullptr);
}

TEST_CASE("Package requires the definition and rankings", "[archive][package]") {
  const cupkit::tests::common::ScratchRoot scratch("cupkit-package-missing");
  const fs::path& root = scratch.Path();
  cupkit::tests::common::SeedSpringCup(root / "data");
  const cupkit::store::CupStore store(root / "data");
  Logger logger(LogLevel::kError, std::cerr);
  const ArchivePackager packager(store, logger);
  PackageResult result;

  SECTION("unknown cup") {
    OpError error;
    REQUIRE_FALSE(packager.Package("winter", root / "drop", "u", result, error));
    REQUIRE(error.kind == ErrorKind::kNotFound);
  }

  SECTION("rankings removed") {
    fs::remove_all(root / "data" / "rankings" / "spring");
    OpError error;
    REQUIRE_FALSE(packager.Package("spring", root / "drop", "u", result, error));
    REQUIRE(error.kind == ErrorKind::kNotFound);
    REQUIRE(error.message.find("rankings") != std::string::npos);
  }

  SECTION("bad codename") {
    OpError error;
    REQUIRE_FALSE(packager.Package("../spring", root / "drop", "u", result, error));
    REQUIRE(error.kind == ErrorKind::kInvalidArgument);
  }

  REQUIRE_FALSE(fs::exists(root / "drop" / "spring.zip"));
}
