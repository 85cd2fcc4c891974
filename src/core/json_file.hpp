#ifndef CUPKIT_CORE_JSON_FILE_HPP_
#define CUPKIT_CORE_JSON_FILE_HPP_

#include "core/errors/op_error.hpp"
#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace cupkit::core {

// Reads and parses one JSON document.
// Missing file => kNotFound, unreadable => kIoError, malformed => kParseError.
inline bool LoadJsonFile(const std::filesystem::path& path, json::Value& value,
                         errors::OpError& error) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec) || ec) {
    return errors::Fail(error, errors::ErrorKind::kNotFound, "file not found: " + path.string());
  }

  std::string text;
  std::string io_error;
  if (!ReadTextFile(path, text, io_error)) {
    return errors::Fail(error, errors::ErrorKind::kIoError, io_error);
  }

  std::string parse_error;
  if (!json::Parse(text, value, parse_error)) {
    return errors::Fail(error, errors::ErrorKind::kParseError,
                        path.string() + ": " + parse_error);
  }
  return true;
}

// Serializes and publishes atomically. `indent` follows json::Serialize.
inline bool WriteJsonFile(const std::filesystem::path& path, const json::Value& value,
                          std::string_view indent, errors::OpError& error) {
  std::string io_error;
  if (!WriteTextFileAtomic(path, json::Serialize(value, indent), io_error)) {
    return errors::Fail(error, errors::ErrorKind::kIoError, io_error);
  }
  return true;
}

} // namespace cupkit::core

#endif // CUPKIT_CORE_JSON_FILE_HPP_
