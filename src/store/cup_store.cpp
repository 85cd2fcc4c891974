#include "store/cup_store.hpp"

#include "core/fs_utils.hpp"

#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace cupkit::store {

using core::errors::ErrorKind;
using core::errors::OpError;

std::string ToString(CpTier tier) {
  return std::to_string(ToInt(tier));
}

bool ParseCpTier(std::string_view text, CpTier& tier, std::string& error) {
  if (text == "500") {
    tier = CpTier::k500;
    return true;
  }
  if (text == "1500") {
    tier = CpTier::k1500;
    return true;
  }
  if (text == "2500") {
    tier = CpTier::k2500;
    return true;
  }
  if (text == "10000") {
    tier = CpTier::k10000;
    return true;
  }
  error = "invalid cp tier '" + std::string(text) + "' (expected 500|1500|2500|10000)";
  return false;
}

const char* ToString(RankingCategory category) {
  switch (category) {
  case RankingCategory::kAttackers:
    return "attackers";
  case RankingCategory::kChargers:
    return "chargers";
  case RankingCategory::kClosers:
    return "closers";
  case RankingCategory::kConsistency:
    return "consistency";
  case RankingCategory::kLeads:
    return "leads";
  case RankingCategory::kOverall:
    return "overall";
  case RankingCategory::kSwitches:
    return "switches";
  }
  return "overall";
}

const std::array<RankingCategory, 7>& AllRankingCategories() {
  static const std::array<RankingCategory, 7> categories = {
      RankingCategory::kAttackers,   RankingCategory::kChargers, RankingCategory::kClosers,
      RankingCategory::kConsistency, RankingCategory::kLeads,    RankingCategory::kOverall,
      RankingCategory::kSwitches,
  };
  return categories;
}

bool ValidateCodename(std::string_view codename, OpError& error) {
  if (codename.empty()) {
    return core::errors::Fail(error, ErrorKind::kInvalidArgument, "codename cannot be empty");
  }
  for (const char c : codename) {
    const bool allowed = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
    if (!allowed) {
      return core::errors::Fail(error, ErrorKind::kInvalidArgument,
                                "invalid codename '" + std::string(codename) +
                                    "' (expected lowercase letters, digits, '_' or '-')");
    }
  }
  return true;
}

CupStore::CupStore(fs::path root) : root_(root.lexically_normal()) {
  // "/data/" and "/data" must yield identical artifact paths.
  if (root_.filename().empty() && root_.has_relative_path()) {
    root_ = root_.parent_path();
  }
}

fs::path CupStore::FormatsRegistryPath() const {
  return root_ / "gamemaster" / "formats.json";
}

fs::path CupStore::FormatsTemplatePath() const {
  return root_ / "gamemaster" / "formats-new.json";
}

fs::path CupStore::CupsDir() const {
  return root_ / "gamemaster" / "cups";
}

fs::path CupStore::DefinitionPath(std::string_view codename) const {
  return CupsDir() / (std::string(codename) + ".json");
}

fs::path CupStore::GroupPath(std::string_view codename) const {
  return root_ / "groups" / (std::string(codename) + ".json");
}

fs::path CupStore::OverridesDir(std::string_view codename) const {
  return root_ / "overrides" / std::string(codename);
}

fs::path CupStore::OverridesPath(std::string_view codename, std::string_view tier_key) const {
  return OverridesDir(codename) / (std::string(tier_key) + ".json");
}

fs::path CupStore::RankingsDir(std::string_view codename) const {
  return root_ / "rankings" / std::string(codename);
}

fs::path CupStore::RankingsPath(std::string_view codename, RankingCategory category,
                                std::string_view tier_key) const {
  return RankingsDir(codename) / ToString(category) /
         ("rankings-" + std::string(tier_key) + ".json");
}

fs::path CupStore::PathFor(const ArtifactRef& ref) const {
  switch (ref.kind) {
  case ArtifactKind::kDefinition:
    return DefinitionPath(ref.codename);
  case ArtifactKind::kOverrides:
    return OverridesPath(ref.codename, ref.tier_key);
  case ArtifactKind::kGroup:
    return GroupPath(ref.codename);
  case ArtifactKind::kRankings:
    return RankingsPath(ref.codename, ref.category, ref.tier_key);
  }
  return DefinitionPath(ref.codename);
}

bool CupStore::ResolveForRead(const ArtifactRef& ref, fs::path& path, OpError& error) const {
  if (!ValidateCodename(ref.codename, error)) {
    return false;
  }
  path = PathFor(ref);

  std::error_code ec;
  if (!fs::is_regular_file(path, ec) || ec) {
    return core::errors::Fail(error, ErrorKind::kNotFound, "file not found: " + path.string());
  }
  return true;
}

bool CupStore::ResolveForWrite(const ArtifactRef& ref, fs::path& path, OpError& error) const {
  if (!ValidateCodename(ref.codename, error)) {
    return false;
  }
  path = PathFor(ref);

  std::string io_error;
  if (!core::EnsureParentDirectory(path, io_error)) {
    return core::errors::Fail(error, ErrorKind::kIoError, io_error);
  }
  return true;
}

} // namespace cupkit::store
