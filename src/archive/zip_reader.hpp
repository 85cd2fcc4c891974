#pragma once

#include "core/errors/op_error.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace cupkit::archive {

struct ZipEntryInfo {
  std::string name;
  std::uint16_t method = 0;
  std::uint32_t crc32 = 0;
  std::uint32_t compressed_size = 0;
  std::uint32_t size = 0;
  std::uint32_t local_header_offset = 0;
};

// Read-only view over a zip32 archive loaded into memory.
//
// Entries are listed in central-directory order. Stored and deflated entries
// can be extracted; Read() rejects other methods with kParseError, as it does
// CRC mismatches, size mismatches and truncated records.
class ZipReader {
public:
  // Missing file => kNotFound, unreadable => kIoError, bad layout => kParseError.
  bool Open(const std::filesystem::path& zip_path, core::errors::OpError& error);

  const std::vector<ZipEntryInfo>& Entries() const {
    return entries_;
  }

  const ZipEntryInfo* Find(std::string_view name) const;

  // Unknown entry => kNotFound.
  bool Read(std::string_view name, std::string& contents, core::errors::OpError& error) const;

private:
  std::filesystem::path path_;
  std::string bytes_;
  std::vector<ZipEntryInfo> entries_;
};

} // namespace cupkit::archive
