#include "store/formats_registry.hpp"

#include "core/json_file.hpp"

#include <algorithm>
#include <iterator>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace cupkit::store {

namespace {

using core::errors::ErrorKind;
using core::errors::OpError;
using core::json::Value;

// jq --tab layout, which is what the serving app's tooling has always emitted.
constexpr std::string_view kRegistryIndent = "\t";

bool EntryMatches(const Value& entry, std::string_view codename) {
  const Value* cup = core::json::FindField(entry, kEntryCupField);
  return cup != nullptr && cup->IsString() && cup->string_value == codename;
}

Value BuiltInTemplate() {
  Value entry = core::json::MakeObject();
  core::json::SetField(entry, kEntryTitleField, core::json::MakeString("Custom"));
  core::json::SetField(entry, kEntryCupField, core::json::MakeString("custom"));
  core::json::SetField(entry, kEntryCpField, core::json::MakeNumber(1500));
  core::json::SetField(entry, kEntryMetaField, core::json::MakeString("custom"));
  core::json::SetField(entry, "showCup", core::json::MakeBool(true));
  core::json::SetField(entry, "showFormat", core::json::MakeBool(true));
  core::json::SetField(entry, "showMeta", core::json::MakeBool(true));
  return entry;
}

} // namespace

bool FormatsRegistry::Load(const fs::path& path, FormatsRegistry& registry, OpError& error) {
  registry.entries_.clear();

  std::error_code ec;
  if (!fs::exists(path, ec) && !ec) {
    return true;
  }

  Value root;
  if (!core::LoadJsonFile(path, root, error)) {
    return false;
  }
  if (!root.IsArray()) {
    return core::errors::Fail(error, ErrorKind::kParseError,
                              path.string() + ": formats registry must be a JSON array");
  }

  registry.entries_ = std::move(root.array_value);
  return true;
}

bool FormatsRegistry::Save(const fs::path& path, OpError& error) const {
  Value root = core::json::MakeArray();
  root.array_value = entries_;
  return core::WriteJsonFile(path, root, kRegistryIndent, error);
}

const Value* FormatsRegistry::Find(std::string_view codename) const {
  const auto it = std::find_if(entries_.begin(), entries_.end(),
                               [codename](const Value& entry) { return EntryMatches(entry, codename); });
  return it == entries_.end() ? nullptr : &*it;
}

bool FormatsRegistry::FindByCup(std::string_view codename, Value& entry, OpError& error) const {
  const Value* found = Find(codename);
  if (found == nullptr) {
    return core::errors::Fail(error, ErrorKind::kNotFound,
                              "no formats registry entry for cup '" + std::string(codename) + "'");
  }
  entry = *found;
  return true;
}

bool FormatsRegistry::Upsert(Value entry, OpError& error) {
  const std::string codename(core::json::StringField(entry, kEntryCupField));
  if (codename.empty()) {
    return core::errors::Fail(error, ErrorKind::kMissingField,
                              "formats registry entry requires a non-empty 'cup' field");
  }

  auto first = std::find_if(entries_.begin(), entries_.end(),
                            [&codename](const Value& e) { return EntryMatches(e, codename); });
  if (first == entries_.end()) {
    entries_.push_back(std::move(entry));
    return true;
  }

  *first = std::move(entry);
  const auto tail = std::remove_if(std::next(first), entries_.end(), [&codename](const Value& e) {
    return EntryMatches(e, codename);
  });
  entries_.erase(tail, entries_.end());
  return true;
}

std::size_t FormatsRegistry::Remove(std::string_view codename) {
  const std::size_t before = entries_.size();
  entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                [codename](const Value& e) { return EntryMatches(e, codename); }),
                 entries_.end());
  return before - entries_.size();
}

bool FormatsRegistry::RenameCup(std::string_view old_codename, std::string_view new_codename,
                                std::string_view new_title, OpError& error) {
  bool renamed = false;
  for (auto& entry : entries_) {
    if (!EntryMatches(entry, old_codename)) {
      continue;
    }
    core::json::SetField(entry, kEntryCupField, core::json::MakeString(std::string(new_codename)));
    core::json::SetField(entry, kEntryTitleField, core::json::MakeString(std::string(new_title)));
    renamed = true;
  }

  if (!renamed) {
    return core::errors::Fail(error, ErrorKind::kNotFound,
                              "no formats registry entry for cup '" + std::string(old_codename) +
                                  "'");
  }
  return true;
}

bool FormatsRegistry::CloneEntry(std::string_view source_codename, std::string_view new_codename,
                                 std::string_view new_title, OpError& error) {
  if (Find(new_codename) != nullptr) {
    return core::errors::Fail(error, ErrorKind::kAlreadyExists,
                              "formats registry already has cup '" + std::string(new_codename) +
                                  "'");
  }

  Value copy;
  if (!FindByCup(source_codename, copy, error)) {
    return false;
  }

  core::json::SetField(copy, kEntryCupField, core::json::MakeString(std::string(new_codename)));
  core::json::SetField(copy, kEntryTitleField, core::json::MakeString(std::string(new_title)));
  if (core::json::StringField(copy, kEntryMetaField) == source_codename) {
    core::json::SetField(copy, kEntryMetaField, core::json::MakeString(std::string(new_codename)));
  }

  entries_.push_back(std::move(copy));
  return true;
}

Value DeriveEntryFromTemplate(const Value& template_entry, std::string_view codename,
                              std::string_view title, int cp_tier) {
  Value entry = template_entry.IsObject() ? template_entry : BuiltInTemplate();
  core::json::SetField(entry, kEntryTitleField, core::json::MakeString(std::string(title)));
  core::json::SetField(entry, kEntryCupField, core::json::MakeString(std::string(codename)));
  core::json::SetField(entry, kEntryCpField, core::json::MakeNumber(cp_tier));
  core::json::SetField(entry, kEntryMetaField, core::json::MakeString(std::string(codename)));
  return entry;
}

bool LoadEntryTemplate(const fs::path& template_path, Value& entry, OpError& error) {
  std::error_code ec;
  if (!fs::exists(template_path, ec) && !ec) {
    entry = BuiltInTemplate();
    return true;
  }

  Value root;
  if (!core::LoadJsonFile(template_path, root, error)) {
    return false;
  }
  if (root.IsArray() && !root.array_value.empty() && root.array_value.front().IsObject()) {
    entry = root.array_value.front();
    return true;
  }
  if (root.IsObject()) {
    entry = std::move(root);
    return true;
  }
  return core::errors::Fail(error, ErrorKind::kParseError,
                            template_path.string() +
                                ": entry template must be an object or a non-empty array of objects");
}

} // namespace cupkit::store
