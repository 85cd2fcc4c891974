#ifndef CUPKIT_CORE_FS_UTILS_HPP_
#define CUPKIT_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace cupkit::core {

namespace detail {

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

} // namespace detail

inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const std::filesystem::path parent_dir = output_path.parent_path();
  if (parent_dir.empty()) {
    return true;
  }

  std::error_code ec;
  std::filesystem::create_directories(parent_dir, ec);
  if (ec) {
    error = "failed to create directory '" + parent_dir.string() + "': " + ec.message();
    return false;
  }

  return true;
}

inline bool ReadTextFile(const std::filesystem::path& path, std::string& contents,
                         std::string& error) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "unable to read file: " + path.string();
    return false;
  }

  contents.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    error = "failed while reading file: " + path.string();
    return false;
  }
  return true;
}

// Best-effort atomic text file write:
// 1) write full content to a temporary sibling file
// 2) rename temp file into final destination
//
// Readers of the data tree never observe a half-written cup file.
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  const std::filesystem::path temp_path = detail::BuildAtomicTempPath(output_path);
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp output file '" + temp_path.string() + "'";
      return false;
    }

    out_file << text;
    if (!out_file) {
      error = "failed while writing temp output file '" + temp_path.string() + "'";
      return false;
    }
  }

  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish output file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

// Recursive copy of a directory tree. The destination must not exist yet so a
// copy never merges into stale content.
inline bool CopyTree(const std::filesystem::path& source_dir,
                     const std::filesystem::path& dest_dir, std::string& error) {
  std::error_code ec;
  if (std::filesystem::exists(dest_dir, ec)) {
    error = "copy destination already exists: " + dest_dir.string();
    return false;
  }
  if (!EnsureParentDirectory(dest_dir, error)) {
    return false;
  }

  std::filesystem::copy(source_dir, dest_dir, std::filesystem::copy_options::recursive, ec);
  if (ec) {
    error = "failed to copy '" + source_dir.string() + "' to '" + dest_dir.string() +
            "': " + ec.message();
    return false;
  }
  return true;
}

inline bool CopyRegularFile(const std::filesystem::path& source_path,
                            const std::filesystem::path& dest_path, std::string& error) {
  if (!EnsureParentDirectory(dest_path, error)) {
    return false;
  }

  std::error_code ec;
  std::filesystem::copy_file(source_path, dest_path,
                             std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    error = "failed to copy '" + source_path.string() + "' to '" + dest_path.string() +
            "': " + ec.message();
    return false;
  }
  return true;
}

// Moves a file or directory. Refuses to replace an existing destination.
inline bool MovePath(const std::filesystem::path& source_path,
                     const std::filesystem::path& dest_path, std::string& error) {
  std::error_code ec;
  if (std::filesystem::exists(dest_path, ec)) {
    error = "move destination already exists: " + dest_path.string();
    return false;
  }
  if (!EnsureParentDirectory(dest_path, error)) {
    return false;
  }

  std::filesystem::rename(source_path, dest_path, ec);
  if (ec) {
    error = "failed to move '" + source_path.string() + "' to '" + dest_path.string() +
            "': " + ec.message();
    return false;
  }
  return true;
}

// Removes a file or a whole directory tree. Absence is not an error.
inline bool RemovePathIfExists(const std::filesystem::path& path, bool& removed,
                               std::string& error) {
  removed = false;
  std::error_code ec;
  const auto count = std::filesystem::remove_all(path, ec);
  if (ec) {
    error = "failed to remove '" + path.string() + "': " + ec.message();
    return false;
  }
  removed = count > 0U;
  return true;
}

} // namespace cupkit::core

#endif // CUPKIT_CORE_FS_UTILS_HPP_
