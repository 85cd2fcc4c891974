#ifndef CUPKIT_STORE_FORMATS_REGISTRY_HPP_
#define CUPKIT_STORE_FORMATS_REGISTRY_HPP_

#include "core/errors/op_error.hpp"
#include "core/json_dom.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace cupkit::store {

// Field names of a formats.json entry that cupkit rewrites. Every other field
// is opaque serving-layer data and is carried through untouched.
inline constexpr std::string_view kEntryCupField = "cup";
inline constexpr std::string_view kEntryTitleField = "title";
inline constexpr std::string_view kEntryCpField = "cp";
inline constexpr std::string_view kEntryMetaField = "meta";

// In-memory view of gamemaster/formats.json: one ordered array of entry
// objects, unique by `cup`.
//
// Contract:
// - Load of a missing file yields an empty registry (fresh data roots).
// - Mutations never reorder entries they do not target.
// - Save writes a tab-indented array through an atomic publish.
class FormatsRegistry {
public:
  static bool Load(const std::filesystem::path& path, FormatsRegistry& registry,
                   core::errors::OpError& error);
  bool Save(const std::filesystem::path& path, core::errors::OpError& error) const;

  const std::vector<core::json::Value>& List() const {
    return entries_;
  }

  // Returns nullptr when no entry has `cup == codename`.
  const core::json::Value* Find(std::string_view codename) const;
  bool FindByCup(std::string_view codename, core::json::Value& entry,
                 core::errors::OpError& error) const;

  // Replaces the first entry with the same `cup` in place (dropping any later
  // duplicates) or appends. Fails with kMissingField when `cup` is absent.
  bool Upsert(core::json::Value entry, core::errors::OpError& error);

  // No-op when absent. Returns the number of entries removed.
  std::size_t Remove(std::string_view codename);

  // Rewrites only `cup` and `title` of the matching entry.
  bool RenameCup(std::string_view old_codename, std::string_view new_codename,
                 std::string_view new_title, core::errors::OpError& error);

  // Copies the entry for `source_codename`, rewrites `cup`/`title` (and `meta`
  // when it points at the source), and appends the copy.
  bool CloneEntry(std::string_view source_codename, std::string_view new_codename,
                  std::string_view new_title, core::errors::OpError& error);

private:
  std::vector<core::json::Value> entries_;
};

// Builds a new entry from a template: `cup`, `title`, `meta` and `cp` are set,
// every other template field is kept in place.
core::json::Value DeriveEntryFromTemplate(const core::json::Value& template_entry,
                                          std::string_view codename, std::string_view title,
                                          int cp_tier);

// Entry template used by create: gamemaster/formats-new.json when present (an
// object, or the first element of an array), otherwise a built-in default.
bool LoadEntryTemplate(const std::filesystem::path& template_path, core::json::Value& entry,
                       core::errors::OpError& error);

} // namespace cupkit::store

#endif // CUPKIT_STORE_FORMATS_REGISTRY_HPP_
