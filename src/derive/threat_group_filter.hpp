#pragma once

#include "core/errors/op_error.hpp"
#include "core/json_dom.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <string_view>

namespace cupkit::derive {

// Builds the wanted-id set from newline-delimited text. Lines are trimmed,
// blank lines dropped, duplicates collapsed.
std::set<std::string> ParseWantedIds(std::string_view text);

// Returns the records whose `speciesId` is in `wanted_ids`, sorted ascending
// by `speciesId` (stable for equal ids). Wanted ids with no matching record
// are ignored. `records` must be a JSON array (kParseError otherwise).
bool FilterThreatGroup(const std::set<std::string>& wanted_ids, const core::json::Value& records,
                       core::json::Value& filtered, core::errors::OpError& error);

// File-level entry point used by the CLI: a newline-delimited id list plus an
// overrides or rankings JSON file.
bool FilterThreatGroupFiles(const std::filesystem::path& list_path,
                            const std::filesystem::path& records_path,
                            core::json::Value& filtered, core::errors::OpError& error);

} // namespace cupkit::derive
