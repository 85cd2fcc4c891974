#include "derive/threat_group_filter.hpp"

#include "core/fs_utils.hpp"
#include "core/json_file.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace fs = std::filesystem;

namespace cupkit::derive {

namespace {

using core::errors::ErrorKind;
using core::errors::OpError;
using core::json::Value;

constexpr std::string_view kSpeciesIdField = "speciesId";

std::string_view Trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

} // namespace

std::set<std::string> ParseWantedIds(std::string_view text) {
  std::set<std::string> ids;
  while (!text.empty()) {
    const std::size_t newline = text.find('\n');
    const std::string_view line = Trim(text.substr(0, newline));
    if (!line.empty()) {
      ids.emplace(line);
    }
    if (newline == std::string_view::npos) {
      break;
    }
    text.remove_prefix(newline + 1U);
  }
  return ids;
}

bool FilterThreatGroup(const std::set<std::string>& wanted_ids, const Value& records,
                       Value& filtered, OpError& error) {
  if (!records.IsArray()) {
    return core::errors::Fail(error, ErrorKind::kParseError,
                              "threat group records must be a JSON array");
  }

  filtered = core::json::MakeArray();
  for (const auto& record : records.array_value) {
    const Value* id = core::json::FindField(record, kSpeciesIdField);
    if (id == nullptr || !id->IsString()) {
      continue;
    }
    if (wanted_ids.count(id->string_value) > 0U) {
      filtered.array_value.push_back(record);
    }
  }

  std::stable_sort(filtered.array_value.begin(), filtered.array_value.end(),
                   [](const Value& lhs, const Value& rhs) {
                     return core::json::StringField(lhs, kSpeciesIdField) <
                            core::json::StringField(rhs, kSpeciesIdField);
                   });
  return true;
}

bool FilterThreatGroupFiles(const fs::path& list_path, const fs::path& records_path,
                            Value& filtered, OpError& error) {
  std::error_code ec;
  if (!fs::is_regular_file(list_path, ec) || ec) {
    return core::errors::Fail(error, ErrorKind::kNotFound,
                              "threat group file not found: " + list_path.string());
  }

  std::string list_text;
  std::string io_error;
  if (!core::ReadTextFile(list_path, list_text, io_error)) {
    return core::errors::Fail(error, ErrorKind::kIoError, io_error);
  }

  Value records;
  if (!core::LoadJsonFile(records_path, records, error)) {
    return false;
  }
  if (!FilterThreatGroup(ParseWantedIds(list_text), records, filtered, error)) {
    error.message = records_path.string() + ": " + error.message;
    return false;
  }
  return true;
}

} // namespace cupkit::derive
