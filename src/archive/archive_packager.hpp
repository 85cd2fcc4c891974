#pragma once

#include "core/errors/op_error.hpp"
#include "core/logging/logger.hpp"
#include "store/cup_store.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace cupkit::archive {

struct PackageResult {
  std::filesystem::path staging_dir;
  std::filesystem::path archive_path;
  // Retrieval URL: `<uri_root>/<codename>.zip`.
  std::string url;
  // Artifact roots copied into the staging tree, in staging order.
  std::vector<std::filesystem::path> staged;
};

// Stages one cup into `<filedrop>/<codename>/` and zips it:
//
//   <codename>/rankings/<codename>/<category>/rankings-<cp>.json
//   <codename>/cupfile/<codename>.json
//   <codename>/overrides/<codename>/<cp>.json    (when present)
//   <codename>/group/<codename>.json             (when present)
//
// The definition and the rankings subtree are required (kNotFound).
// A previous staging tree and zip for the same codename are replaced.
class ArchivePackager {
public:
  ArchivePackager(const store::CupStore& store, core::logging::Logger& logger)
      : store_(store), logger_(logger) {}

  bool Package(std::string_view codename, const std::filesystem::path& filedrop_dir,
               std::string_view uri_root, PackageResult& result,
               core::errors::OpError& error) const;

private:
  const store::CupStore& store_;
  core::logging::Logger& logger_;
};

} // namespace cupkit::archive
