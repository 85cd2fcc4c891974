#pragma once

#include "core/errors/op_error.hpp"
#include "core/json_dom.hpp"
#include "store/cup_store.hpp"

#include <set>
#include <string>
#include <string_view>

namespace cupkit::derive {

// Species admitted by a cup definition's id rules. Every `include` rule with
// `"filterType": "id"` adds its `values`; `exclude` then removes ids given as
// plain strings, `{"speciesId": ...}` objects or `"filterType": "id"` rules.
// Type, tag and other rule kinds select nothing here.
std::set<std::string> EligibleSpeciesIds(const core::json::Value& definition);

// Turns ranked movesets into override records:
//
//   {"speciesId": id, "fastMove": moveset[0], "chargedMoves": moveset[1..]}
//
// for every ranking record whose species is eligible, sorted by speciesId
// (stable for repeated species). `rankings` must be a JSON array and every
// eligible record needs a non-empty string `moveset` (kParseError otherwise).
bool BuildMovesetOverrides(const std::set<std::string>& eligible,
                           const core::json::Value& rankings, core::json::Value& overrides,
                           core::errors::OpError& error);

// Reads the cup definition and `rankings/<c>/overall/rankings-<cp>.json`
// from the store. Missing files => kNotFound.
bool ImportMovesets(const store::CupStore& store, std::string_view codename, store::CpTier tier,
                    core::json::Value& overrides, core::errors::OpError& error);

} // namespace cupkit::derive
