#pragma once

#include "core/errors/op_error.hpp"
#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"
#include "store/cup_store.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace cupkit::derive {

// Which snapshot of a cup lists its eligible species.
enum class SnapshotKind {
  kRankings,  // rankings/<c>/overall/rankings-<league>.json
  kOverrides, // overrides/<c>/<league>.json
};

const char* ToString(SnapshotKind kind);
bool ParseSnapshotKind(std::string_view text, SnapshotKind& kind, std::string& error);

// Allow-list team builder config derived from one cup.
struct ZygardeConfig {
  std::string allowed_mons;
  std::string name;
  std::string league;
  std::string rules_uri;
  std::string uniqueness_rule = "DexNumberAndType";
  int slots = 6;
};

// 1500 => "Great", 2500 => "Ultra", 10000 => "Master", else "Custom(<league>)".
std::string LeagueLabel(std::string_view league);

// Definition supplies `league`, `title` and optional `link`; `snapshot` is a
// JSON array of `{speciesId, ...}` records.
// Missing or empty league/title => kMissingField; non-array snapshot => kParseError.
bool BuildZygardeConfig(const core::json::Value& definition, const core::json::Value& snapshot,
                        ZygardeConfig& config, core::errors::OpError& error);

// Serialized with two-space indent in the fixed key order
// allowedMons, name, league, rulesUri, uniquenessRule, slots.
std::string ToJson(const ZygardeConfig& config);

// Reads the definition and snapshot from a live data root.
bool GenerateFromStore(const store::CupStore& store, std::string_view codename, SnapshotKind kind,
                       ZygardeConfig& config, core::errors::OpError& error,
                       core::logging::Logger& logger = core::logging::NullLogger());

// Reads the definition and snapshot from a packaged cup archive. The first
// central-directory entry names the cup shortname `s`; the definition is
// `s/cupfile/s.json` and the snapshot is under `s/rankings/s/` or
// `s/overrides/s/`.
bool GenerateFromArchive(const std::filesystem::path& zip_path, SnapshotKind kind,
                         ZygardeConfig& config, core::errors::OpError& error,
                         core::logging::Logger& logger = core::logging::NullLogger());

} // namespace cupkit::derive
