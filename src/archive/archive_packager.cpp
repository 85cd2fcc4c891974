#include "archive/archive_packager.hpp"

#include "archive/zip_writer.hpp"
#include "core/fs_utils.hpp"

#include <array>
#include <system_error>

namespace fs = std::filesystem;

namespace cupkit::archive {

namespace {

using core::errors::ErrorKind;
using core::errors::OpError;

constexpr std::array<const char*, 4> kStagingDirs = {"rankings", "cupfile", "overrides", "group"};

bool Exists(const fs::path& path) {
  std::error_code ec;
  return fs::exists(path, ec) && !ec;
}

bool ResetStaging(const fs::path& staging_dir, const fs::path& zip_path, OpError& error) {
  std::string io_error;
  bool removed = false;
  if (!core::RemovePathIfExists(staging_dir, removed, io_error) ||
      !core::RemovePathIfExists(zip_path, removed, io_error)) {
    return core::errors::Fail(error, ErrorKind::kIoError, io_error);
  }

  for (const char* name : kStagingDirs) {
    std::error_code ec;
    fs::create_directories(staging_dir / name, ec);
    if (ec) {
      return core::errors::Fail(error, ErrorKind::kIoError,
                                "failed to create staging directory '" +
                                    (staging_dir / name).string() + "': " + ec.message());
    }
  }
  return true;
}

} // namespace

bool ArchivePackager::Package(std::string_view codename, const fs::path& filedrop_dir,
                              std::string_view uri_root, PackageResult& result,
                              OpError& error) const {
  if (!store::ValidateCodename(codename, error)) {
    return false;
  }
  if (filedrop_dir.empty()) {
    return core::errors::Fail(error, ErrorKind::kInvalidArgument,
                              "filedrop directory cannot be empty");
  }

  const std::string name(codename);
  const fs::path definition = store_.DefinitionPath(name);
  const fs::path rankings = store_.RankingsDir(name);
  const fs::path overrides = store_.OverridesDir(name);
  const fs::path group = store_.GroupPath(name);

  if (!Exists(definition)) {
    return core::errors::Fail(error, ErrorKind::kNotFound,
                              "cup definition not found: " + definition.string());
  }
  if (!Exists(rankings)) {
    return core::errors::Fail(error, ErrorKind::kNotFound,
                              "rankings not found: " + rankings.string());
  }

  result = PackageResult{};
  result.staging_dir = filedrop_dir / name;
  const fs::path zip_path = filedrop_dir / (name + ".zip");
  if (!ResetStaging(result.staging_dir, zip_path, error)) {
    return false;
  }

  std::string io_error;
  const fs::path staged_rankings = result.staging_dir / "rankings" / name;
  if (!core::CopyTree(rankings, staged_rankings, io_error)) {
    return core::errors::Fail(error, ErrorKind::kIoError, io_error);
  }
  result.staged.push_back(staged_rankings);

  const fs::path staged_definition = result.staging_dir / "cupfile" / (name + ".json");
  if (!core::CopyRegularFile(definition, staged_definition, io_error)) {
    return core::errors::Fail(error, ErrorKind::kIoError, io_error);
  }
  result.staged.push_back(staged_definition);

  if (Exists(overrides)) {
    const fs::path staged_overrides = result.staging_dir / "overrides" / name;
    if (!core::CopyTree(overrides, staged_overrides, io_error)) {
      return core::errors::Fail(error, ErrorKind::kIoError, io_error);
    }
    result.staged.push_back(staged_overrides);
  } else {
    logger_.Warn("overrides not found, packaging without them",
                 {{"path", overrides.string()}});
  }

  if (Exists(group)) {
    const fs::path staged_group = result.staging_dir / "group" / (name + ".json");
    if (!core::CopyRegularFile(group, staged_group, io_error)) {
      return core::errors::Fail(error, ErrorKind::kIoError, io_error);
    }
    result.staged.push_back(staged_group);
  } else {
    logger_.Warn("group not found, packaging without it", {{"path", group.string()}});
  }

  if (!WriteArchiveZip(result.staging_dir, result.archive_path, io_error)) {
    return core::errors::Fail(error, ErrorKind::kIoError, io_error);
  }

  std::string uri(uri_root);
  while (!uri.empty() && uri.back() == '/') {
    uri.pop_back();
  }
  result.url = uri + "/" + name + ".zip";

  logger_.Info("archive written", {{"archive", result.archive_path.string()},
                                   {"url", result.url}});
  return true;
}

} // namespace cupkit::archive
