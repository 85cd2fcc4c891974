#include "lifecycle/cup_lifecycle.hpp"

#include "core/fs_utils.hpp"
#include "core/json_file.hpp"
#include "lifecycle/step_journal.hpp"
#include "store/formats_registry.hpp"

#include <cctype>
#include <functional>
#include <memory>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace cupkit::lifecycle {

namespace {

using core::errors::ErrorKind;
using core::errors::OpError;
using core::json::Value;

constexpr std::string_view kDefinitionIndent = "  ";
constexpr std::string_view kDefinitionNameField = "name";
constexpr std::string_view kDefinitionTitleField = "title";
constexpr std::string_view kDefinitionLeagueField = "league";

// Prior state of one file, captured right before a step overwrites it.
struct FileSnapshot {
  fs::path path;
  bool existed = false;
  std::string contents;
};

bool CaptureSnapshot(const fs::path& path, FileSnapshot& snapshot, OpError& error) {
  snapshot.path = path;
  snapshot.contents.clear();
  std::error_code ec;
  snapshot.existed = fs::exists(path, ec);
  if (ec) {
    return core::errors::Fail(error, ErrorKind::kIoError,
                              "failed to stat '" + path.string() + "': " + ec.message());
  }
  if (!snapshot.existed) {
    return true;
  }

  std::string io_error;
  if (!core::ReadTextFile(path, snapshot.contents, io_error)) {
    return core::errors::Fail(error, ErrorKind::kIoError, io_error);
  }
  return true;
}

bool IsStrictlyInside(const fs::path& dir, const fs::path& root) {
  const fs::path relative = dir.lexically_normal().lexically_relative(root);
  if (relative.empty() || relative == ".") {
    return false;
  }
  return *relative.begin() != "..";
}

// Removes now-empty directories from `start` upwards while they are inside
// `root`, so an undone step does not leave empty cup directories behind.
bool PruneEmptyParents(const fs::path& start, const fs::path& root, std::string& error) {
  fs::path dir = start;
  while (IsStrictlyInside(dir, root)) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec) || ec) {
      dir = dir.parent_path();
      continue;
    }
    if (!fs::is_empty(dir, ec) || ec) {
      return true;
    }
    fs::remove(dir, ec);
    if (ec) {
      error = "failed to remove empty directory '" + dir.string() + "': " + ec.message();
      return false;
    }
    dir = dir.parent_path();
  }
  return true;
}

bool RestoreSnapshot(const FileSnapshot& snapshot, const fs::path& root, std::string& error) {
  if (snapshot.existed) {
    return core::WriteTextFileAtomic(snapshot.path, snapshot.contents, error);
  }
  bool removed = false;
  if (!core::RemovePathIfExists(snapshot.path, removed, error)) {
    return false;
  }
  return PruneEmptyParents(snapshot.path.parent_path(), root, error);
}

bool PathExists(const fs::path& path) {
  std::error_code ec;
  return fs::exists(path, ec) && !ec;
}

Value EmptyList() {
  return core::json::MakeArray();
}

store::ArtifactRef Artifact(store::ArtifactKind kind, std::string_view codename,
                            std::string tier_key = {},
                            store::RankingCategory category = store::RankingCategory::kOverall) {
  store::ArtifactRef ref;
  ref.kind = kind;
  ref.codename = std::string(codename);
  ref.tier_key = std::move(tier_key);
  ref.category = category;
  return ref;
}

// Adds a step that writes `value` to the artifact's canonical path, undone by
// restoring what was there before.
void AddWriteStep(StepJournal& journal, std::string name, const store::CupStore& store,
                  store::ArtifactRef ref, Value value, std::string_view indent,
                  std::vector<fs::path>& written) {
  auto snapshot = std::make_shared<FileSnapshot>();
  journal.Add(
      std::move(name),
      [store, ref = std::move(ref), value = std::move(value), indent, snapshot,
       &written](OpError& error) {
        fs::path path;
        if (!store.ResolveForWrite(ref, path, error)) {
          return false;
        }
        if (!CaptureSnapshot(path, *snapshot, error)) {
          return false;
        }
        if (!core::WriteJsonFile(path, value, indent, error)) {
          return false;
        }
        written.push_back(path);
        return true;
      },
      [snapshot, root = store.Root()](std::string& error) {
        return RestoreSnapshot(*snapshot, root, error);
      });
}

using RegistryMutation = std::function<bool(store::FormatsRegistry&, OpError&)>;

// Adds a load/mutate/save step over formats.json, undone by restoring the
// file bytes captured before the save.
void AddRegistryStep(StepJournal& journal, std::string name, const store::CupStore& store,
                     RegistryMutation mutate, std::vector<fs::path>* written) {
  auto snapshot = std::make_shared<FileSnapshot>();
  const fs::path registry_path = store.FormatsRegistryPath();
  const fs::path root = store.Root();
  journal.Add(
      std::move(name),
      [registry_path, mutate = std::move(mutate), snapshot, written](OpError& error) {
        if (!CaptureSnapshot(registry_path, *snapshot, error)) {
          return false;
        }
        store::FormatsRegistry registry;
        if (!store::FormatsRegistry::Load(registry_path, registry, error)) {
          return false;
        }
        if (!mutate(registry, error)) {
          return false;
        }
        if (!registry.Save(registry_path, error)) {
          return false;
        }
        if (written != nullptr) {
          written->push_back(registry_path);
        }
        return true;
      },
      [snapshot, root](std::string& error) { return RestoreSnapshot(*snapshot, root, error); });
}

void AddCopyTreeStep(StepJournal& journal, std::string name, const fs::path& source,
                     const fs::path& dest, const fs::path& root, std::vector<fs::path>& written) {
  journal.Add(
      std::move(name),
      [source, dest, &written](OpError& error) {
        std::string io_error;
        if (!core::CopyTree(source, dest, io_error)) {
          // A failed recursive copy can leave part of the tree behind.
          bool removed = false;
          std::string cleanup_error;
          if (!core::RemovePathIfExists(dest, removed, cleanup_error)) {
            io_error += "; " + cleanup_error;
          }
          return core::errors::Fail(error, ErrorKind::kIoError, io_error);
        }
        written.push_back(dest);
        return true;
      },
      [dest, root](std::string& error) {
        bool removed = false;
        if (!core::RemovePathIfExists(dest, removed, error)) {
          return false;
        }
        return PruneEmptyParents(dest.parent_path(), root, error);
      });
}

void AddCopyFileStep(StepJournal& journal, std::string name, const fs::path& source,
                     const fs::path& dest, const fs::path& root, std::vector<fs::path>& written) {
  journal.Add(
      std::move(name),
      [source, dest, &written](OpError& error) {
        std::string io_error;
        if (!core::CopyRegularFile(source, dest, io_error)) {
          return core::errors::Fail(error, ErrorKind::kIoError, io_error);
        }
        written.push_back(dest);
        return true;
      },
      [dest, root](std::string& error) {
        bool removed = false;
        if (!core::RemovePathIfExists(dest, removed, error)) {
          return false;
        }
        return PruneEmptyParents(dest.parent_path(), root, error);
      });
}

void AddMoveStep(StepJournal& journal, std::string name, const fs::path& source,
                 const fs::path& dest, std::vector<fs::path>& moved) {
  journal.Add(
      std::move(name),
      [source, dest, &moved](OpError& error) {
        std::string io_error;
        if (!core::MovePath(source, dest, io_error)) {
          return core::errors::Fail(error, ErrorKind::kIoError, io_error);
        }
        moved.push_back(dest);
        return true;
      },
      [source, dest](std::string& error) { return core::MovePath(dest, source, error); });
}

void AddRemoveStep(StepJournal& journal, std::string name, const fs::path& path,
                   std::vector<fs::path>& removed_paths) {
  journal.Add(std::move(name), [path, &removed_paths](OpError& error) {
    bool removed = false;
    std::string io_error;
    if (!core::RemovePathIfExists(path, removed, io_error)) {
      return core::errors::Fail(error, ErrorKind::kIoError, io_error);
    }
    if (removed) {
      removed_paths.push_back(path);
    }
    return true;
  });
}

void AssignNameAndTitle(Value& definition, std::string_view codename, std::string_view title) {
  core::json::SetField(definition, kDefinitionNameField,
                       core::json::MakeString(std::string(codename)));
  core::json::SetField(definition, kDefinitionTitleField,
                       core::json::MakeString(std::string(title)));
}

bool LoadDefinitionObject(const fs::path& path, Value& definition, OpError& error) {
  if (!core::LoadJsonFile(path, definition, error)) {
    return false;
  }
  if (!definition.IsObject()) {
    return core::errors::Fail(error, ErrorKind::kParseError,
                              path.string() + ": cup definition must be a JSON object");
  }
  return true;
}

// The definition's `league` must name the tier the files are created for;
// a body without one gets the tier's value.
bool ReconcileLeague(Value& definition, store::CpTier tier, OpError& error) {
  const std::string tier_key = store::ToString(tier);
  const Value* league = core::json::FindField(definition, kDefinitionLeagueField);
  if (league == nullptr) {
    core::json::SetField(definition, kDefinitionLeagueField,
                         core::json::MakeNumber(store::ToInt(tier)));
    return true;
  }

  std::string league_text;
  if (league->type == Value::Type::kNumber) {
    league_text = league->number_text;
  } else if (league->IsString()) {
    league_text = league->string_value;
  }
  if (league_text == tier_key) {
    return true;
  }
  return core::errors::Fail(error, ErrorKind::kInvalidArgument,
                            "definition league '" +
                                (league_text.empty() ? core::json::Serialize(*league, "")
                                                     : league_text) +
                                "' does not match cp tier " + tier_key);
}

// Shared preconditions of clone and rename.
bool CheckTransferPreconditions(const store::CupStore& store, std::string_view old_codename,
                                std::string_view new_codename, std::string_view new_title,
                                Value& old_definition, OpError& error) {
  if (!store::ValidateCodename(old_codename, error) ||
      !store::ValidateCodename(new_codename, error)) {
    return false;
  }
  if (old_codename == new_codename) {
    return core::errors::Fail(error, ErrorKind::kInvalidArgument,
                              "source and destination codenames are identical");
  }
  if (new_title.empty()) {
    return core::errors::Fail(error, ErrorKind::kInvalidArgument, "title cannot be empty");
  }

  if (!LoadDefinitionObject(store.DefinitionPath(old_codename), old_definition, error)) {
    return false;
  }

  store::FormatsRegistry registry;
  if (!store::FormatsRegistry::Load(store.FormatsRegistryPath(), registry, error)) {
    return false;
  }
  if (registry.Find(old_codename) == nullptr) {
    return core::errors::Fail(error, ErrorKind::kNotFound,
                              "no formats registry entry for cup '" + std::string(old_codename) +
                                  "'");
  }
  if (registry.Find(new_codename) != nullptr) {
    return core::errors::Fail(error, ErrorKind::kAlreadyExists,
                              "formats registry already has cup '" + std::string(new_codename) +
                                  "'");
  }

  const std::vector<fs::path> destinations = {
      store.DefinitionPath(new_codename),
      store.OverridesDir(new_codename),
      store.RankingsDir(new_codename),
      store.GroupPath(new_codename),
  };
  for (const auto& dest : destinations) {
    if (PathExists(dest)) {
      return core::errors::Fail(error, ErrorKind::kAlreadyExists,
                                "destination already exists: " + dest.string());
    }
  }
  return true;
}

} // namespace

CupLifecycleManager::CupLifecycleManager(store::CupStore store, core::logging::Logger& logger)
    : store_(std::move(store)), logger_(logger) {}

bool CupLifecycleManager::Create(const CreateRequest& request, std::vector<fs::path>& written,
                                 OpError& error) {
  written.clear();
  const std::string& codename = request.codename;
  if (!store::ValidateCodename(codename, error)) {
    return false;
  }
  if (request.title.empty()) {
    return core::errors::Fail(error, ErrorKind::kInvalidArgument, "title cannot be empty");
  }

  const fs::path definition_path = store_.DefinitionPath(codename);
  if (PathExists(definition_path)) {
    return core::errors::Fail(error, ErrorKind::kAlreadyExists,
                              "cup definition already exists: " + definition_path.string());
  }

  Value definition;
  std::string parse_error;
  if (!core::json::Parse(request.definition_body, definition, parse_error)) {
    return core::errors::Fail(error, ErrorKind::kParseError, "definition body: " + parse_error);
  }
  if (!definition.IsObject()) {
    return core::errors::Fail(error, ErrorKind::kParseError,
                              "definition body must be a JSON object");
  }
  if (!ReconcileLeague(definition, request.cp_tier, error)) {
    return false;
  }
  AssignNameAndTitle(definition, codename, request.title);

  Value template_entry;
  if (!store::LoadEntryTemplate(store_.FormatsTemplatePath(), template_entry, error)) {
    return false;
  }
  const std::string tier_key = store::ToString(request.cp_tier);
  Value registry_entry = store::DeriveEntryFromTemplate(template_entry, codename, request.title,
                                                        store::ToInt(request.cp_tier));

  logger_.Info("creating cup", {{"cup", codename}, {"title", request.title}, {"cp", tier_key}});

  StepJournal journal("create", logger_);
  AddWriteStep(journal, "write definition", store_,
               Artifact(store::ArtifactKind::kDefinition, codename), std::move(definition),
               kDefinitionIndent, written);
  AddRegistryStep(
      journal, "upsert formats registry entry", store_,
      [registry_entry = std::move(registry_entry)](store::FormatsRegistry& registry,
                                                   OpError& step_error) {
        return registry.Upsert(registry_entry, step_error);
      },
      &written);
  AddWriteStep(journal, "write group", store_, Artifact(store::ArtifactKind::kGroup, codename),
               EmptyList(), kDefinitionIndent, written);
  AddWriteStep(journal, "write overrides " + tier_key, store_,
               Artifact(store::ArtifactKind::kOverrides, codename, tier_key), EmptyList(),
               kDefinitionIndent, written);
  for (const auto category : store::AllRankingCategories()) {
    AddWriteStep(journal, std::string("write rankings ") + store::ToString(category), store_,
                 Artifact(store::ArtifactKind::kRankings, codename, tier_key, category),
                 EmptyList(), kDefinitionIndent, written);
  }

  if (!journal.Run(error)) {
    return false;
  }
  logger_.Info("cup created", {{"cup", codename}, {"files", std::to_string(written.size())}});
  return true;
}

bool CupLifecycleManager::Clone(std::string_view old_codename, std::string_view new_codename,
                                std::string_view new_title, std::vector<fs::path>& written,
                                OpError& error) {
  written.clear();
  Value definition;
  if (!CheckTransferPreconditions(store_, old_codename, new_codename, new_title, definition,
                                  error)) {
    return false;
  }
  AssignNameAndTitle(definition, new_codename, new_title);

  logger_.Info("cloning cup", {{"from", old_codename}, {"to", new_codename}, {"title", new_title}});

  const fs::path& root = store_.Root();
  StepJournal journal("clone", logger_);

  const fs::path old_overrides = store_.OverridesDir(old_codename);
  if (PathExists(old_overrides)) {
    AddCopyTreeStep(journal, "copy overrides", old_overrides, store_.OverridesDir(new_codename),
                    root, written);
  } else {
    logger_.Warn("source has no overrides, skipping", {{"path", old_overrides.string()}});
  }

  const fs::path old_rankings = store_.RankingsDir(old_codename);
  if (PathExists(old_rankings)) {
    AddCopyTreeStep(journal, "copy rankings", old_rankings, store_.RankingsDir(new_codename), root,
                    written);
  } else {
    logger_.Warn("source has no rankings, skipping", {{"path", old_rankings.string()}});
  }

  AddWriteStep(journal, "write definition", store_,
               Artifact(store::ArtifactKind::kDefinition, new_codename), std::move(definition),
               kDefinitionIndent, written);

  const fs::path old_group = store_.GroupPath(old_codename);
  if (PathExists(old_group)) {
    AddCopyFileStep(journal, "copy group", old_group, store_.GroupPath(new_codename), root,
                    written);
  } else {
    logger_.Warn("source has no group, skipping", {{"path", old_group.string()}});
  }

  AddRegistryStep(
      journal, "append formats registry entry", store_,
      [old = std::string(old_codename), fresh = std::string(new_codename),
       title = std::string(new_title)](store::FormatsRegistry& registry, OpError& step_error) {
        return registry.CloneEntry(old, fresh, title, step_error);
      },
      &written);

  if (!journal.Run(error)) {
    return false;
  }
  logger_.Info("cup cloned", {{"from", old_codename}, {"to", new_codename}});
  return true;
}

bool CupLifecycleManager::Rename(std::string_view old_codename, std::string_view new_codename,
                                 std::string_view new_title, std::vector<fs::path>& moved,
                                 OpError& error) {
  moved.clear();
  Value definition;
  if (!CheckTransferPreconditions(store_, old_codename, new_codename, new_title, definition,
                                  error)) {
    return false;
  }
  AssignNameAndTitle(definition, new_codename, new_title);

  logger_.Info("renaming cup", {{"from", old_codename}, {"to", new_codename}, {"title", new_title}});

  StepJournal journal("rename", logger_);

  const fs::path old_overrides = store_.OverridesDir(old_codename);
  if (PathExists(old_overrides)) {
    AddMoveStep(journal, "move overrides", old_overrides, store_.OverridesDir(new_codename), moved);
  }
  const fs::path old_group = store_.GroupPath(old_codename);
  if (PathExists(old_group)) {
    AddMoveStep(journal, "move group", old_group, store_.GroupPath(new_codename), moved);
  }
  const fs::path old_rankings = store_.RankingsDir(old_codename);
  if (PathExists(old_rankings)) {
    AddMoveStep(journal, "move rankings", old_rankings, store_.RankingsDir(new_codename), moved);
  }

  const fs::path new_definition_path = store_.DefinitionPath(new_codename);
  AddMoveStep(journal, "move definition", store_.DefinitionPath(old_codename), new_definition_path,
              moved);

  // Rewrites the moved file in place; `rewritten` keeps `moved` free of
  // duplicate paths.
  std::vector<fs::path> rewritten;
  AddWriteStep(journal, "rewrite definition name and title", store_,
               Artifact(store::ArtifactKind::kDefinition, new_codename), std::move(definition),
               kDefinitionIndent, rewritten);

  AddRegistryStep(
      journal, "rename formats registry entry", store_,
      [old = std::string(old_codename), fresh = std::string(new_codename),
       title = std::string(new_title)](store::FormatsRegistry& registry, OpError& step_error) {
        return registry.RenameCup(old, fresh, title, step_error);
      },
      nullptr);

  if (!journal.Run(error)) {
    return false;
  }
  logger_.Info("cup renamed", {{"from", old_codename}, {"to", new_codename}});
  return true;
}

bool CupLifecycleManager::Delete(std::string_view codename, std::vector<fs::path>& removed,
                                 OpError& error) {
  removed.clear();
  if (!store::ValidateCodename(codename, error)) {
    return false;
  }

  // Parse the registry up front so a malformed formats.json fails before any
  // artifact is removed.
  const fs::path registry_path = store_.FormatsRegistryPath();
  store::FormatsRegistry registry;
  if (!store::FormatsRegistry::Load(registry_path, registry, error)) {
    return false;
  }
  const bool has_entry = registry.Find(codename) != nullptr;

  logger_.Info("deleting cup", {{"cup", codename}});

  StepJournal journal("delete", logger_);
  AddRemoveStep(journal, "remove overrides", store_.OverridesDir(codename), removed);
  AddRemoveStep(journal, "remove rankings", store_.RankingsDir(codename), removed);
  AddRemoveStep(journal, "remove definition", store_.DefinitionPath(codename), removed);
  AddRemoveStep(journal, "remove group", store_.GroupPath(codename), removed);
  if (has_entry) {
    journal.Add("remove formats registry entry",
                [registry_path, cup = std::string(codename), &removed](OpError& step_error) {
                  store::FormatsRegistry current;
                  if (!store::FormatsRegistry::Load(registry_path, current, step_error)) {
                    return false;
                  }
                  if (current.Remove(cup) == 0U) {
                    return true;
                  }
                  if (!current.Save(registry_path, step_error)) {
                    return false;
                  }
                  removed.push_back(registry_path);
                  return true;
                });
  } else {
    logger_.Info("no formats registry entry, skipping", {{"cup", codename}});
  }

  if (!journal.Run(error)) {
    return false;
  }
  logger_.Info("cup deleted", {{"cup", codename}, {"removed", std::to_string(removed.size())}});
  return true;
}

std::string DefaultTitleFor(std::string_view codename) {
  std::string title(codename);
  if (!title.empty()) {
    title.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(title.front())));
  }
  return title;
}

} // namespace cupkit::lifecycle
