#include "store/structure_check.hpp"

#include "core/json_file.hpp"
#include "store/formats_registry.hpp"

#include <algorithm>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace cupkit::store {

namespace {

using core::json::Value;

void AddIssue(StructureReport& report, IssueSeverity severity, const fs::path& path,
              std::string message) {
  report.issues.push_back({severity, path.string(), std::move(message)});
}

std::string LeagueText(const Value& definition) {
  const Value* league = core::json::FindField(definition, "league");
  if (league == nullptr) {
    return {};
  }
  if (league->type == Value::Type::kNumber) {
    return league->number_text;
  }
  return league->IsString() ? league->string_value : std::string();
}

bool IsRegularFile(const fs::path& path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec) && !ec;
}

void CheckRegistryEntry(const CupStore& store, std::string_view codename,
                        std::string_view definition_title, StructureReport& report) {
  const fs::path registry_path = store.FormatsRegistryPath();
  FormatsRegistry registry;
  core::errors::OpError load_error;
  if (!FormatsRegistry::Load(registry_path, registry, load_error)) {
    AddIssue(report, IssueSeverity::kError, registry_path, load_error.message);
    return;
  }

  const Value* entry = registry.Find(codename);
  if (entry == nullptr) {
    AddIssue(report, IssueSeverity::kError, registry_path,
             "no registry entry with cup '" + std::string(codename) + "'");
    return;
  }

  const std::string_view entry_title = core::json::StringField(*entry, kEntryTitleField);
  if (!definition_title.empty() && entry_title != definition_title) {
    AddIssue(report, IssueSeverity::kError, registry_path,
             "registry title '" + std::string(entry_title) + "' does not match definition title '" +
                 std::string(definition_title) + "'");
  }
}

void CheckRankings(const CupStore& store, std::string_view codename, StructureReport& report) {
  const fs::path rankings_dir = store.RankingsDir(codename);
  std::error_code ec;
  if (!fs::is_directory(rankings_dir, ec) || ec) {
    AddIssue(report, IssueSeverity::kError, rankings_dir, "rankings directory missing");
    return;
  }

  std::set<std::string> known;
  for (const RankingCategory category : AllRankingCategories()) {
    known.emplace(ToString(category));
    if (report.league.empty()) {
      continue;
    }
    const fs::path ranking = store.RankingsPath(codename, category, report.league);
    if (!IsRegularFile(ranking)) {
      AddIssue(report, IssueSeverity::kError, ranking, "ranking file missing");
    }
  }

  std::vector<fs::path> extras;
  for (const auto& entry : fs::directory_iterator(rankings_dir, ec)) {
    std::error_code type_ec;
    if (entry.is_directory(type_ec) && known.count(entry.path().filename().string()) == 0U) {
      extras.push_back(entry.path());
    }
  }
  if (ec) {
    AddIssue(report, IssueSeverity::kError, rankings_dir,
             "failed to list rankings directory: " + ec.message());
  }
  std::sort(extras.begin(), extras.end());
  for (const auto& extra : extras) {
    AddIssue(report, IssueSeverity::kWarning, extra, "unexpected ranking category");
  }
}

} // namespace

const char* ToString(IssueSeverity severity) {
  return severity == IssueSeverity::kWarning ? "warning" : "error";
}

std::size_t StructureReport::ErrorCount() const {
  return static_cast<std::size_t>(
      std::count_if(issues.begin(), issues.end(), [](const StructureIssue& issue) {
        return issue.severity == IssueSeverity::kError;
      }));
}

std::size_t StructureReport::WarningCount() const {
  return issues.size() - ErrorCount();
}

bool CheckCupStructure(const CupStore& store, std::string_view codename, StructureReport& report,
                       core::errors::OpError& error) {
  if (!ValidateCodename(codename, error)) {
    return false;
  }
  report = StructureReport{};
  report.codename = std::string(codename);

  const fs::path definition_path = store.DefinitionPath(codename);
  Value definition;
  core::errors::OpError load_error;
  std::string title;
  if (!core::LoadJsonFile(definition_path, definition, load_error)) {
    AddIssue(report, IssueSeverity::kError, definition_path, load_error.message);
  } else if (!definition.IsObject()) {
    AddIssue(report, IssueSeverity::kError, definition_path, "definition is not a JSON object");
  } else {
    const std::string_view name = core::json::StringField(definition, "name");
    if (name.empty()) {
      AddIssue(report, IssueSeverity::kError, definition_path, "missing 'name'");
    } else if (name != codename) {
      AddIssue(report, IssueSeverity::kError, definition_path,
               "'name' is '" + std::string(name) + "', expected '" + std::string(codename) + "'");
    }
    title = std::string(core::json::StringField(definition, "title"));
    if (title.empty()) {
      AddIssue(report, IssueSeverity::kError, definition_path, "missing 'title'");
    }
    report.league = LeagueText(definition);
    if (report.league.empty()) {
      AddIssue(report, IssueSeverity::kError, definition_path, "missing 'league'");
    }
  }

  CheckRegistryEntry(store, codename, title, report);

  if (!report.league.empty()) {
    const fs::path overrides = store.OverridesPath(codename, report.league);
    if (!IsRegularFile(overrides)) {
      AddIssue(report, IssueSeverity::kError, overrides, "override file missing");
    }
  }

  const fs::path group = store.GroupPath(codename);
  if (!IsRegularFile(group)) {
    AddIssue(report, IssueSeverity::kWarning, group, "group file missing");
  }

  CheckRankings(store, codename, report);
  return true;
}

} // namespace cupkit::store
