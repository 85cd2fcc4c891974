#include "derive/zygarde_config.hpp"

#include "archive/zip_reader.hpp"
#include "core/json_file.hpp"

#include <set>

namespace fs = std::filesystem;

namespace cupkit::derive {

namespace {

using core::errors::ErrorKind;
using core::errors::OpError;
using core::json::Value;

constexpr std::string_view kNameSuffix = " (Devon)";

// `league` is a number in most definitions but a string in hand-edited ones.
std::string ScalarText(const Value* value) {
  if (value == nullptr) {
    return {};
  }
  if (value->type == Value::Type::kNumber) {
    return value->number_text;
  }
  if (value->IsString()) {
    return value->string_value;
  }
  return {};
}

std::string SnapshotEntryName(std::string_view shortname, SnapshotKind kind,
                              std::string_view league) {
  const std::string s(shortname);
  if (kind == SnapshotKind::kOverrides) {
    return s + "/overrides/" + s + "/" + std::string(league) + ".json";
  }
  return s + "/rankings/" + s + "/overall/rankings-" + std::string(league) + ".json";
}

bool ParseEntry(const archive::ZipReader& reader, const std::string& entry_name, Value& value,
                OpError& error) {
  std::string text;
  if (!reader.Read(entry_name, text, error)) {
    return false;
  }
  std::string parse_error;
  if (!core::json::Parse(text, value, parse_error)) {
    return core::errors::Fail(error, ErrorKind::kParseError, entry_name + ": " + parse_error);
  }
  return true;
}

} // namespace

const char* ToString(SnapshotKind kind) {
  return kind == SnapshotKind::kOverrides ? "overrides" : "rankings";
}

bool ParseSnapshotKind(std::string_view text, SnapshotKind& kind, std::string& error) {
  if (text == "rankings") {
    kind = SnapshotKind::kRankings;
    return true;
  }
  if (text == "overrides") {
    kind = SnapshotKind::kOverrides;
    return true;
  }
  error = "invalid snapshot '" + std::string(text) + "' (expected rankings|overrides)";
  return false;
}

std::string LeagueLabel(std::string_view league) {
  if (league == "1500") {
    return "Great";
  }
  if (league == "2500") {
    return "Ultra";
  }
  if (league == "10000") {
    return "Master";
  }
  return "Custom(" + std::string(league) + ")";
}

bool BuildZygardeConfig(const Value& definition, const Value& snapshot, ZygardeConfig& config,
                        OpError& error) {
  const std::string league = ScalarText(core::json::FindField(definition, "league"));
  if (league.empty()) {
    return core::errors::Fail(error, ErrorKind::kMissingField,
                              "missing or empty 'league' in cup definition");
  }
  const std::string title(core::json::StringField(definition, "title"));
  if (title.empty()) {
    return core::errors::Fail(error, ErrorKind::kMissingField,
                              "missing or empty 'title' in cup definition");
  }
  if (!snapshot.IsArray()) {
    return core::errors::Fail(error, ErrorKind::kParseError, "snapshot must be a JSON array");
  }

  std::set<std::string> ids;
  for (const auto& record : snapshot.array_value) {
    const std::string_view id = core::json::StringField(record, "speciesId");
    if (!id.empty()) {
      ids.emplace(id);
    }
  }

  config = ZygardeConfig{};
  for (const auto& id : ids) {
    if (!config.allowed_mons.empty()) {
      config.allowed_mons += ", ";
    }
    config.allowed_mons += id;
  }
  config.name = title + std::string(kNameSuffix);
  config.league = LeagueLabel(league);
  config.rules_uri = std::string(core::json::StringField(definition, "link"));
  return true;
}

std::string ToJson(const ZygardeConfig& config) {
  Value out = core::json::MakeObject();
  core::json::SetField(out, "allowedMons", core::json::MakeString(config.allowed_mons));
  core::json::SetField(out, "name", core::json::MakeString(config.name));
  core::json::SetField(out, "league", core::json::MakeString(config.league));
  core::json::SetField(out, "rulesUri", core::json::MakeString(config.rules_uri));
  core::json::SetField(out, "uniquenessRule", core::json::MakeString(config.uniqueness_rule));
  core::json::SetField(out, "slots", core::json::MakeNumber(config.slots));
  return core::json::Serialize(out);
}

bool GenerateFromStore(const store::CupStore& store, std::string_view codename, SnapshotKind kind,
                       ZygardeConfig& config, OpError& error, core::logging::Logger& logger) {
  fs::path definition_path;
  if (!store.ResolveForRead({store::ArtifactKind::kDefinition, std::string(codename), {}, {}},
                            definition_path, error)) {
    return false;
  }
  Value definition;
  if (!core::LoadJsonFile(definition_path, definition, error)) {
    return false;
  }

  const std::string league = ScalarText(core::json::FindField(definition, "league"));
  if (league.empty()) {
    return core::errors::Fail(error, ErrorKind::kMissingField,
                              "missing or empty 'league' in " + definition_path.string());
  }

  store::ArtifactRef snapshot_ref{store::ArtifactKind::kRankings, std::string(codename), league,
                                  store::RankingCategory::kOverall};
  if (kind == SnapshotKind::kOverrides) {
    snapshot_ref.kind = store::ArtifactKind::kOverrides;
  }
  fs::path snapshot_path;
  if (!store.ResolveForRead(snapshot_ref, snapshot_path, error)) {
    return false;
  }
  Value snapshot;
  if (!core::LoadJsonFile(snapshot_path, snapshot, error)) {
    return false;
  }

  logger.Info("using cup file", {{"path", definition_path.string()}});
  logger.Info("using snapshot file", {{"path", snapshot_path.string()},
                                      {"kind", ToString(kind)}});
  if (snapshot.IsArray()) {
    logger.Info("snapshot entries",
                {{"count", std::to_string(snapshot.array_value.size())}});
  }

  if (!BuildZygardeConfig(definition, snapshot, config, error)) {
    error.message = definition_path.string() + ": " + error.message;
    return false;
  }
  return true;
}

bool GenerateFromArchive(const fs::path& zip_path, SnapshotKind kind, ZygardeConfig& config,
                         OpError& error, core::logging::Logger& logger) {
  archive::ZipReader reader;
  if (!reader.Open(zip_path, error)) {
    return false;
  }
  if (reader.Entries().empty()) {
    return core::errors::Fail(error, ErrorKind::kNotFound,
                              "archive has no entries: " + zip_path.string());
  }

  const std::string& first = reader.Entries().front().name;
  const std::string shortname = first.substr(0, first.find('/'));
  OpError name_error;
  if (!store::ValidateCodename(shortname, name_error)) {
    return core::errors::Fail(error, ErrorKind::kParseError,
                              "archive does not start with a cup directory: " + first);
  }

  const std::string definition_entry = shortname + "/cupfile/" + shortname + ".json";
  Value definition;
  if (!ParseEntry(reader, definition_entry, definition, error)) {
    return false;
  }

  const std::string league = ScalarText(core::json::FindField(definition, "league"));
  if (league.empty()) {
    return core::errors::Fail(error, ErrorKind::kMissingField,
                              "missing or empty 'league' in " + definition_entry);
  }

  const std::string snapshot_entry = SnapshotEntryName(shortname, kind, league);
  Value snapshot;
  if (!ParseEntry(reader, snapshot_entry, snapshot, error)) {
    return false;
  }

  logger.Info("using archive", {{"path", zip_path.string()}, {"cup", shortname}});
  logger.Info("using snapshot entry", {{"entry", snapshot_entry}});
  if (snapshot.IsArray()) {
    logger.Info("snapshot entries",
                {{"count", std::to_string(snapshot.array_value.size())}});
  }

  if (!BuildZygardeConfig(definition, snapshot, config, error)) {
    error.message = definition_entry + ": " + error.message;
    return false;
  }
  return true;
}

} // namespace cupkit::derive
