#include "derive/moveset_overrides.hpp"

#include "core/json_file.hpp"

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <utility>

namespace fs = std::filesystem;

namespace cupkit::derive {

namespace {

using core::errors::ErrorKind;
using core::errors::OpError;
using core::json::Value;

constexpr std::string_view kSpeciesIdField = "speciesId";

bool IsIdRule(const Value& rule) {
  return rule.IsObject() && core::json::StringField(rule, "filterType") == "id";
}

template <typename Visit>
void ForEachRuleValue(const Value& rule, Visit visit) {
  const Value* values = core::json::FindField(rule, "values");
  if (values == nullptr || !values->IsArray()) {
    return;
  }
  for (const auto& value : values->array_value) {
    if (value.IsString()) {
      visit(value.string_value);
    }
  }
}

bool LoadObject(const store::CupStore& store, const store::ArtifactRef& ref, Value& value,
                OpError& error) {
  fs::path path;
  if (!store.ResolveForRead(ref, path, error)) {
    return false;
  }
  if (!core::LoadJsonFile(path, value, error)) {
    return false;
  }
  if (!value.IsObject()) {
    return core::errors::Fail(error, ErrorKind::kParseError,
                              path.string() + ": cup definition must be a JSON object");
  }
  return true;
}

} // namespace

std::set<std::string> EligibleSpeciesIds(const Value& definition) {
  std::set<std::string> eligible;

  const Value* include = core::json::FindField(definition, "include");
  if (include != nullptr && include->IsArray()) {
    for (const auto& rule : include->array_value) {
      if (IsIdRule(rule)) {
        ForEachRuleValue(rule, [&eligible](const std::string& id) { eligible.insert(id); });
      }
    }
  }

  const Value* exclude = core::json::FindField(definition, "exclude");
  if (exclude != nullptr && exclude->IsArray()) {
    for (const auto& rule : exclude->array_value) {
      if (rule.IsString()) {
        eligible.erase(rule.string_value);
      } else if (IsIdRule(rule)) {
        ForEachRuleValue(rule, [&eligible](const std::string& id) { eligible.erase(id); });
      } else if (const Value* id = core::json::FindField(rule, kSpeciesIdField);
                 id != nullptr && id->IsString()) {
        eligible.erase(id->string_value);
      }
    }
  }
  return eligible;
}

bool BuildMovesetOverrides(const std::set<std::string>& eligible, const Value& rankings,
                           Value& overrides, OpError& error) {
  if (!rankings.IsArray()) {
    return core::errors::Fail(error, ErrorKind::kParseError, "rankings must be a JSON array");
  }

  overrides = core::json::MakeArray();
  for (const auto& record : rankings.array_value) {
    const Value* id = core::json::FindField(record, kSpeciesIdField);
    if (id == nullptr || !id->IsString() || eligible.count(id->string_value) == 0U) {
      continue;
    }

    const Value* moveset = core::json::FindField(record, "moveset");
    const bool usable = moveset != nullptr && moveset->IsArray() &&
                        !moveset->array_value.empty() &&
                        std::all_of(moveset->array_value.begin(), moveset->array_value.end(),
                                    [](const Value& move) { return move.IsString(); });
    if (!usable) {
      return core::errors::Fail(error, ErrorKind::kParseError,
                                "ranking for '" + id->string_value +
                                    "' has no usable moveset (expected a non-empty string array)");
    }

    Value charged = core::json::MakeArray();
    charged.array_value.assign(std::next(moveset->array_value.begin()),
                               moveset->array_value.end());

    Value entry = core::json::MakeObject();
    core::json::SetField(entry, kSpeciesIdField, core::json::MakeString(id->string_value));
    core::json::SetField(entry, "fastMove", moveset->array_value.front());
    core::json::SetField(entry, "chargedMoves", std::move(charged));
    overrides.array_value.push_back(std::move(entry));
  }

  std::stable_sort(overrides.array_value.begin(), overrides.array_value.end(),
                   [](const Value& lhs, const Value& rhs) {
                     return core::json::StringField(lhs, kSpeciesIdField) <
                            core::json::StringField(rhs, kSpeciesIdField);
                   });
  return true;
}

bool ImportMovesets(const store::CupStore& store, std::string_view codename, store::CpTier tier,
                    Value& overrides, OpError& error) {
  store::ArtifactRef definition_ref;
  definition_ref.kind = store::ArtifactKind::kDefinition;
  definition_ref.codename = std::string(codename);

  Value definition;
  if (!LoadObject(store, definition_ref, definition, error)) {
    return false;
  }

  store::ArtifactRef rankings_ref;
  rankings_ref.kind = store::ArtifactKind::kRankings;
  rankings_ref.codename = std::string(codename);
  rankings_ref.tier_key = store::ToString(tier);
  rankings_ref.category = store::RankingCategory::kOverall;

  fs::path rankings_path;
  if (!store.ResolveForRead(rankings_ref, rankings_path, error)) {
    return false;
  }
  Value rankings;
  if (!core::LoadJsonFile(rankings_path, rankings, error)) {
    return false;
  }
  if (!BuildMovesetOverrides(EligibleSpeciesIds(definition), rankings, overrides, error)) {
    error.message = rankings_path.string() + ": " + error.message;
    return false;
  }
  return true;
}

} // namespace cupkit::derive
