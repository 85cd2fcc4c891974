#ifndef CUPKIT_CORE_CONFIG_ROOT_CONFIG_HPP_
#define CUPKIT_CORE_CONFIG_ROOT_CONFIG_HPP_

#include "core/errors/op_error.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace cupkit::core::config {

// Points at the pvpoke `src` checkout; the data root is its `data` child.
inline constexpr std::string_view kSrcRootEnv = "PVPOKE_SRC_ROOT";
inline constexpr std::string_view kDataDirName = "data";
inline constexpr std::string_view kFiledropEnv = "FILEDROP";
inline constexpr std::string_view kFiledropUriEnv = "PVPOKE_FILEDROP_URI";

inline constexpr std::string_view kDefaultDataRoot =
    "/var/www/builder.devon.gg/public_html/pvpoke/src/data";
inline constexpr std::string_view kDefaultFiledropUri = "https://builder.devon.gg/pvpoke/filedrop";

// Resolved locations for one CLI invocation. Library code never reads the
// environment itself; it receives these values explicitly.
struct RootConfig {
  std::filesystem::path data_root;
  std::filesystem::path filedrop_dir;
  std::string filedrop_uri;
};

inline std::optional<std::string> ReadEnv(std::string_view name) {
  const char* raw = std::getenv(std::string(name).c_str());
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  return std::string(raw);
}

// Precedence for each value: explicit flag, then environment, then default.
// For the data root the environment value is `$PVPOKE_SRC_ROOT/data`.
// The filedrop defaults to a sibling of the pvpoke `src` directory, i.e.
// `<data_root>/../../filedrop`.
inline RootConfig ResolveRootConfig(const std::optional<std::string>& root_flag,
                                    const std::optional<std::string>& filedrop_flag,
                                    const std::optional<std::string>& uri_flag) {
  RootConfig config;

  if (root_flag.has_value()) {
    config.data_root = *root_flag;
  } else if (const auto src_root = ReadEnv(kSrcRootEnv); src_root.has_value()) {
    config.data_root = std::filesystem::path(*src_root) / std::string(kDataDirName);
  } else {
    config.data_root = std::string(kDefaultDataRoot);
  }

  if (filedrop_flag.has_value()) {
    config.filedrop_dir = *filedrop_flag;
  } else if (const auto env_drop = ReadEnv(kFiledropEnv); env_drop.has_value()) {
    config.filedrop_dir = *env_drop;
  } else {
    std::filesystem::path normalized = config.data_root.lexically_normal();
    if (normalized.has_parent_path() && normalized.filename().empty()) {
      normalized = normalized.parent_path();
    }
    config.filedrop_dir = normalized.parent_path().parent_path() / "filedrop";
  }

  if (uri_flag.has_value()) {
    config.filedrop_uri = *uri_flag;
  } else if (const auto env_uri = ReadEnv(kFiledropUriEnv); env_uri.has_value()) {
    config.filedrop_uri = *env_uri;
  } else {
    config.filedrop_uri = std::string(kDefaultFiledropUri);
  }
  while (!config.filedrop_uri.empty() && config.filedrop_uri.back() == '/') {
    config.filedrop_uri.pop_back();
  }

  return config;
}

// Every command that reads or writes cup files runs against an existing
// root; a mistyped root must not grow a fresh data tree.
inline bool CheckDataRootExists(const RootConfig& config, errors::OpError& error) {
  std::error_code ec;
  if (std::filesystem::is_directory(config.data_root, ec) && !ec) {
    return true;
  }
  return errors::Fail(error, errors::ErrorKind::kNotFound,
                      "root directory " + config.data_root.string() + " does not exist");
}

} // namespace cupkit::core::config

#endif // CUPKIT_CORE_CONFIG_ROOT_CONFIG_HPP_
