#include "store/cup_store.hpp"

#include "common/cup_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using cupkit::core::errors::ErrorKind;
using cupkit::core::errors::OpError;
using cupkit::store::ArtifactKind;
using cupkit::store::ArtifactRef;
using cupkit::store::CupStore;
using cupkit::store::RankingCategory;

TEST_CASE("CupStore maps every artifact kind to its canonical path", "[store][paths]") {
  const CupStore store("/data");

  REQUIRE(store.DefinitionPath("spring") == fs::path("/data/gamemaster/cups/spring.json"));
  REQUIRE(store.FormatsRegistryPath() == fs::path("/data/gamemaster/formats.json"));
  REQUIRE(store.GroupPath("spring") == fs::path("/data/groups/spring.json"));
  REQUIRE(store.OverridesPath("spring", "1500") == fs::path("/data/overrides/spring/1500.json"));
  REQUIRE(store.RankingsPath("spring", RankingCategory::kLeads, "2500") ==
          fs::path("/data/rankings/spring/leads/rankings-2500.json"));

  const ArtifactRef ref{ArtifactKind::kRankings, "spring", "10000", RankingCategory::kSwitches};
  REQUIRE(store.PathFor(ref) == fs::path("/data/rankings/spring/switches/rankings-10000.json"));
}

TEST_CASE("CupStore ignores a trailing separator on the root", "[store][paths]") {
  REQUIRE(CupStore("/data/").DefinitionPath("spring") ==
          CupStore("/data").DefinitionPath("spring"));
  REQUIRE(CupStore("/data/").Root() == fs::path("/data"));
}

TEST_CASE("Codenames are lowercase slugs", "[store][codename]") {
  OpError error;
  REQUIRE(cupkit::store::ValidateCodename("spring_2025-b", error));

  for (const char* bad : {"", "Spring", "../etc", "a/b", "cup name", "cup.json"}) {
    OpError bad_error;
    INFO(bad);
    REQUIRE_FALSE(cupkit::store::ValidateCodename(bad, bad_error));
    REQUIRE(bad_error.kind == ErrorKind::kInvalidArgument);
  }
}

TEST_CASE("CP tiers parse only from the fixed set", "[store][tier]") {
  cupkit::store::CpTier tier = cupkit::store::CpTier::k1500;
  std::string error;
  REQUIRE(cupkit::store::ParseCpTier("10000", tier, error));
  REQUIRE(tier == cupkit::store::CpTier::k10000);
  REQUIRE(cupkit::store::ToString(tier) == "10000");

  REQUIRE_FALSE(cupkit::store::ParseCpTier("1501", tier, error));
  REQUIRE(error.find("500|1500|2500|10000") != std::string::npos);
}

TEST_CASE("ResolveForRead reports missing artifacts and ResolveForWrite creates parents",
          "[store][resolve]") {
  const cupkit::tests::common::ScratchRoot scratch("cupkit-cup-store");
  const fs::path& root = scratch.Path();
  const CupStore store(root);
  const ArtifactRef ref{ArtifactKind::kOverrides, "spring", "1500", RankingCategory::kOverall};

  fs::path path;
  OpError error;
  REQUIRE_FALSE(store.ResolveForRead(ref, path, error));
  REQUIRE(error.kind == ErrorKind::kNotFound);

  REQUIRE(store.ResolveForWrite(ref, path, error));
  REQUIRE(path == root / "overrides" / "spring" / "1500.json");
  REQUIRE(fs::is_directory(root / "overrides" / "spring"));

  const ArtifactRef bad{ArtifactKind::kDefinition, "../x", "", RankingCategory::kOverall};
  REQUIRE_FALSE(store.ResolveForWrite(bad, path, error));
  REQUIRE(error.kind == ErrorKind::kInvalidArgument);
}
