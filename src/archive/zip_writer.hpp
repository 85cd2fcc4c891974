#pragma once

#include <filesystem>
#include <string>

namespace cupkit::archive {

// Bundles a staged cup directory into a sibling zip.
//
// Contract:
// - `staging_dir` is `<filedrop>/<codename>` and holds at least one file.
// - Output path is `<filedrop>/<codename>.zip`; an existing zip is replaced.
// - Entries are deflated (stored when deflate would not shrink them), in
//   sorted path order, every name prefixed with `<codename>/`, so the first
//   entry names the cup.
// - Returns false and fills `error` on failure.
bool WriteArchiveZip(const std::filesystem::path& staging_dir,
                     std::filesystem::path& written_path, std::string& error);

} // namespace cupkit::archive
