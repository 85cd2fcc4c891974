#pragma once

#include "core/errors/op_error.hpp"

#include <array>
#include <filesystem>
#include <string>
#include <string_view>

namespace cupkit::store {

// League stat caps a cup can be ranked for.
enum class CpTier {
  k500 = 500,
  k1500 = 1500,
  k2500 = 2500,
  k10000 = 10000,
};

constexpr int ToInt(CpTier tier) {
  return static_cast<int>(tier);
}

std::string ToString(CpTier tier);
bool ParseCpTier(std::string_view text, CpTier& tier, std::string& error);

// Fixed ranking output categories produced by the ranker for every tier.
enum class RankingCategory {
  kAttackers,
  kChargers,
  kClosers,
  kConsistency,
  kLeads,
  kOverall,
  kSwitches,
};

const char* ToString(RankingCategory category);
const std::array<RankingCategory, 7>& AllRankingCategories();

enum class ArtifactKind {
  kDefinition,
  kOverrides,
  kGroup,
  kRankings,
};

// One physical artifact of a cup. `tier_key` is the league text used in file
// names ("1500"); `category` only matters for kRankings.
struct ArtifactRef {
  ArtifactKind kind = ArtifactKind::kDefinition;
  std::string codename;
  std::string tier_key;
  RankingCategory category = RankingCategory::kOverall;
};

// Lowercase slug: [a-z0-9_-]+.
bool ValidateCodename(std::string_view codename, core::errors::OpError& error);

// Maps (root, codename, kind) to canonical locations under a pvpoke data root:
//
//   gamemaster/cups/<c>.json
//   gamemaster/formats.json
//   groups/<c>.json
//   overrides/<c>/<cp>.json
//   rankings/<c>/<category>/rankings-<cp>.json
//
// Path helpers do no I/O. ResolveForRead/ResolveForWrite add the existence
// check or parent-directory creation on top.
class CupStore {
public:
  explicit CupStore(std::filesystem::path root);

  const std::filesystem::path& Root() const {
    return root_;
  }

  std::filesystem::path FormatsRegistryPath() const;
  std::filesystem::path FormatsTemplatePath() const;
  std::filesystem::path CupsDir() const;

  std::filesystem::path DefinitionPath(std::string_view codename) const;
  std::filesystem::path GroupPath(std::string_view codename) const;
  std::filesystem::path OverridesDir(std::string_view codename) const;
  std::filesystem::path OverridesPath(std::string_view codename, std::string_view tier_key) const;
  std::filesystem::path RankingsDir(std::string_view codename) const;
  std::filesystem::path RankingsPath(std::string_view codename, RankingCategory category,
                                     std::string_view tier_key) const;

  std::filesystem::path PathFor(const ArtifactRef& ref) const;

  // Fails with kNotFound when the artifact does not exist.
  bool ResolveForRead(const ArtifactRef& ref, std::filesystem::path& path,
                      core::errors::OpError& error) const;

  // Creates intermediate directories; fails with kIoError when that fails.
  bool ResolveForWrite(const ArtifactRef& ref, std::filesystem::path& path,
                       core::errors::OpError& error) const;

private:
  std::filesystem::path root_;
};

} // namespace cupkit::store
