#include "derive/zygarde_config.hpp"

#include "archive/archive_packager.hpp"
#include "common/cup_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <string>

namespace fs = std::filesystem;
namespace json = cupkit::core::json;
using cupkit::core::errors::ErrorKind;
using cupkit::core::errors::OpError;
using cupkit::derive::SnapshotKind;
using cupkit::derive::ZygardeConfig;

namespace {

json::Value ParseOrFail(std::string_view text) {
  json::Value value;
  std::string error;
  REQUIRE(json::Parse(text, value, error));
  return value;
}

} // namespace

TEST_CASE("League labels map known caps and fall back to Custom", "[derive][zygarde]") {
  REQUIRE(cupkit::derive::LeagueLabel("1500") == "Great");
  REQUIRE(cupkit::derive::LeagueLabel("2500") == "Ultra");
  REQUIRE(cupkit::derive::LeagueLabel("10000") == "Master");
  REQUIRE(cupkit::derive::LeagueLabel("9999") == "Custom(9999)");
  REQUIRE(cupkit::derive::LeagueLabel("500") == "Custom(500)");
}

TEST_CASE("Snapshot kinds parse from their names", "[derive][zygarde]") {
  SnapshotKind kind = SnapshotKind::kRankings;
  std::string error;
  REQUIRE(cupkit::derive::ParseSnapshotKind("overrides", kind, error));
  REQUIRE(kind == SnapshotKind::kOverrides);
  REQUIRE_FALSE(cupkit::derive::ParseSnapshotKind("group", kind, error));
  REQUIRE(error.find("rankings|overrides") != std::string::npos);
}

TEST_CASE("Build deduplicates and sorts allowed species", "[derive][zygarde]") {
  const json::Value definition = ParseOrFail(
      R"({"name":"spring","title":"Spring Cup","league":1500,"link":"https://example.test/r"})");
  const json::Value snapshot = ParseOrFail(cupkit::tests::common::kSpringOverall);

  ZygardeConfig config;
  OpError error;
  REQUIRE(cupkit::derive::BuildZygardeConfig(definition, snapshot, config, error));
  REQUIRE(config.allowed_mons == "azumarill, venusaur, whimsicott");
  REQUIRE(config.name == "Spring Cup (Devon)");
  REQUIRE(config.league == "Great");
  REQUIRE(config.rules_uri == "https://example.test/r");

  REQUIRE(cupkit::derive::ToJson(config) ==
          "{\n"
          "  \"allowedMons\": \"azumarill, venusaur, whimsicott\",\n"
          "  \"name\": \"Spring Cup (Devon)\",\n"
          "  \"league\": \"Great\",\n"
          "  \"rulesUri\": \"https://example.test/r\",\n"
          "  \"uniquenessRule\": \"DexNumberAndType\",\n"
          "  \"slots\": 6\n"
          "}\n");
}

TEST_CASE("Build accepts a string league and an empty snapshot", "[derive][zygarde]") {
  const json::Value definition = ParseOrFail(R"({"title":"Odd Cup","league":"9999"})");

  ZygardeConfig config;
  OpError error;
  REQUIRE(cupkit::derive::BuildZygardeConfig(definition, ParseOrFail("[]"), config, error));
  REQUIRE(config.allowed_mons.empty());
  REQUIRE(config.league == "Custom(9999)");
  REQUIRE(config.rules_uri.empty());
}

TEST_CASE("Build reports missing definition fields", "[derive][zygarde]") {
  ZygardeConfig config;
  OpError error;
  REQUIRE_FALSE(cupkit::derive::BuildZygardeConfig(ParseOrFail(R"({"title":"No League"})"),
                                                   ParseOrFail("[]"), config, error));
  REQUIRE(error.kind == ErrorKind::kMissingField);

  REQUIRE_FALSE(cupkit::derive::BuildZygardeConfig(ParseOrFail(R"({"league":1500,"title":""})"),
                                                   ParseOrFail("[]"), config, error));
  REQUIRE(error.kind == ErrorKind::kMissingField);

  REQUIRE_FALSE(cupkit::derive::BuildZygardeConfig(ParseOrFail(R"({"league":1500,"title":"T"})"),
                                                   ParseOrFail("{}"), config, error));
  REQUIRE(error.kind == ErrorKind::kParseError);
}

TEST_CASE("Generate reads live store snapshots", "[derive][zygarde]") {
  const cupkit::tests::common::ScratchRoot scratch("cupkit-zygarde-store");
  const fs::path& root = scratch.Path();
  cupkit::tests::common::SeedSpringCup(root);
  const cupkit::store::CupStore store(root);

  ZygardeConfig config;
  OpError error;
  REQUIRE(cupkit::derive::GenerateFromStore(store, "spring", SnapshotKind::kOverrides, config,
                                            error));
  REQUIRE(config.allowed_mons == "venusaur");
  REQUIRE(config.rules_uri == "https://example.test/spring-rules");

  REQUIRE_FALSE(
      cupkit::derive::GenerateFromStore(store, "winter", SnapshotKind::kRankings, config, error));
  REQUIRE(error.kind == ErrorKind::kNotFound);
}

TEST_CASE("Generate reads a packaged archive the same way as the store", "[derive][zygarde]") {
  const cupkit::tests::common::ScratchRoot scratch("cupkit-zygarde-archive");
  const fs::path& root = scratch.Path();
  cupkit::tests::common::SeedSpringCup(root / "data");
  const cupkit::store::CupStore store(root / "data");

  cupkit::core::logging::Logger logger(cupkit::core::logging::LogLevel::kError);
  const cupkit::archive::ArchivePackager packager(store, logger);
  cupkit::archive::PackageResult package;
  OpError error;
  REQUIRE(packager.Package("spring", root / "drop", "https://cdn.example.test/cups", package,
                           error));

  ZygardeConfig from_archive;
  REQUIRE(cupkit::derive::GenerateFromArchive(package.archive_path, SnapshotKind::kRankings,
                                              from_archive, error));
  ZygardeConfig from_store;
  REQUIRE(cupkit::derive::GenerateFromStore(store, "spring", SnapshotKind::kRankings, from_store,
                                            error));
  REQUIRE(cupkit::derive::ToJson(from_archive) == cupkit::derive::ToJson(from_store));

  REQUIRE_FALSE(cupkit::derive::GenerateFromArchive(root / "drop" / "missing.zip",
                                                    SnapshotKind::kRankings, from_archive, error));
  REQUIRE(error.kind == ErrorKind::kNotFound);
}
