#include "archive/zip_reader.hpp"

#include "archive/zip_format.hpp"
#include "core/fs_utils.hpp"

#include <zlib.h>

#include <system_error>

namespace fs = std::filesystem;

namespace cupkit::archive {

namespace {

using core::errors::ErrorKind;
using core::errors::OpError;

std::uint16_t ReadU16(const std::string& bytes, std::size_t offset) {
  return static_cast<std::uint16_t>(static_cast<std::uint8_t>(bytes[offset]) |
                                    (static_cast<std::uint8_t>(bytes[offset + 1U]) << 8));
}

std::uint32_t ReadU32(const std::string& bytes, std::size_t offset) {
  std::uint32_t value = 0;
  for (std::size_t i = 0; i < 4U; ++i) {
    value |= static_cast<std::uint32_t>(static_cast<std::uint8_t>(bytes[offset + i])) << (8U * i);
  }
  return value;
}

bool HasRange(const std::string& bytes, std::size_t offset, std::size_t length) {
  return offset <= bytes.size() && length <= bytes.size() - offset;
}

// The EOCD record sits in the last 22 bytes plus an optional comment of up to
// 64 KiB, so scan backwards for its signature.
bool FindEndOfCentralDirectory(const std::string& bytes, std::size_t& offset) {
  if (bytes.size() < zip::kEndOfCentralDirectorySize) {
    return false;
  }
  const std::size_t last = bytes.size() - zip::kEndOfCentralDirectorySize;
  const std::size_t floor = last > 0xFFFFU ? last - 0xFFFFU : 0U;
  for (std::size_t pos = last + 1U; pos-- > floor;) {
    if (ReadU32(bytes, pos) == zip::kEndOfCentralDirectorySignature) {
      offset = pos;
      return true;
    }
  }
  return false;
}

bool InflateRaw(std::string_view input, std::size_t expected_size, std::string& output,
                std::string& error) {
  z_stream stream{};
  if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
    error = "failed to initialize inflate stream";
    return false;
  }

  // One spare byte so an over-long stream shows up as a size mismatch.
  output.assign(expected_size + 1U, '\0');
  stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
  stream.avail_in = static_cast<uInt>(input.size());
  stream.next_out = reinterpret_cast<Bytef*>(output.data());
  stream.avail_out = static_cast<uInt>(output.size());

  const int status = inflate(&stream, Z_FINISH);
  const uLong produced = stream.total_out;
  inflateEnd(&stream);
  if (status != Z_STREAM_END) {
    error = "inflate failed with status " + std::to_string(status);
    return false;
  }
  if (produced != expected_size) {
    error = "inflated " + std::to_string(produced) + " bytes, expected " +
            std::to_string(expected_size);
    return false;
  }
  output.resize(produced);
  return true;
}

} // namespace

bool ZipReader::Open(const fs::path& zip_path, OpError& error) {
  path_ = zip_path;
  bytes_.clear();
  entries_.clear();

  std::error_code ec;
  if (!fs::is_regular_file(zip_path, ec) || ec) {
    return core::errors::Fail(error, ErrorKind::kNotFound,
                              "archive not found: " + zip_path.string());
  }

  std::string io_error;
  if (!core::ReadTextFile(zip_path, bytes_, io_error)) {
    return core::errors::Fail(error, ErrorKind::kIoError, io_error);
  }

  const std::string malformed = "malformed zip archive: " + zip_path.string();
  std::size_t eocd = 0;
  if (!FindEndOfCentralDirectory(bytes_, eocd)) {
    return core::errors::Fail(error, ErrorKind::kParseError,
                              malformed + " (no end of central directory)");
  }

  const std::uint16_t entry_count = ReadU16(bytes_, eocd + 10U);
  const std::uint32_t central_dir_size = ReadU32(bytes_, eocd + 12U);
  std::size_t cursor = ReadU32(bytes_, eocd + 16U);
  if (!HasRange(bytes_, cursor, central_dir_size)) {
    return core::errors::Fail(error, ErrorKind::kParseError,
                              malformed + " (central directory out of range)");
  }

  entries_.reserve(entry_count);
  for (std::uint16_t i = 0; i < entry_count; ++i) {
    if (!HasRange(bytes_, cursor, zip::kCentralDirectoryHeaderSize) ||
        ReadU32(bytes_, cursor) != zip::kCentralDirectoryHeaderSignature) {
      return core::errors::Fail(error, ErrorKind::kParseError,
                                malformed + " (bad central directory record)");
    }

    ZipEntryInfo entry;
    entry.method = ReadU16(bytes_, cursor + 10U);
    entry.crc32 = ReadU32(bytes_, cursor + 16U);
    entry.compressed_size = ReadU32(bytes_, cursor + 20U);
    entry.size = ReadU32(bytes_, cursor + 24U);
    const std::uint16_t name_length = ReadU16(bytes_, cursor + 28U);
    const std::uint16_t extra_length = ReadU16(bytes_, cursor + 30U);
    const std::uint16_t comment_length = ReadU16(bytes_, cursor + 32U);
    entry.local_header_offset = ReadU32(bytes_, cursor + 42U);

    const std::size_t name_offset = cursor + zip::kCentralDirectoryHeaderSize;
    if (!HasRange(bytes_, name_offset, name_length)) {
      return core::errors::Fail(error, ErrorKind::kParseError,
                                malformed + " (truncated entry name)");
    }
    entry.name = bytes_.substr(name_offset, name_length);
    entries_.push_back(std::move(entry));

    cursor = name_offset + name_length + extra_length + comment_length;
  }
  return true;
}

const ZipEntryInfo* ZipReader::Find(std::string_view name) const {
  for (const auto& entry : entries_) {
    if (entry.name == name) {
      return &entry;
    }
  }
  return nullptr;
}

bool ZipReader::Read(std::string_view name, std::string& contents, OpError& error) const {
  const ZipEntryInfo* entry = Find(name);
  if (entry == nullptr) {
    return core::errors::Fail(error, ErrorKind::kNotFound,
                              "archive entry not found: " + std::string(name) + " in " +
                                  path_.string());
  }
  if (entry->method != zip::kMethodStore && entry->method != zip::kMethodDeflate) {
    return core::errors::Fail(error, ErrorKind::kParseError,
                              "unsupported compression method " +
                                  std::to_string(entry->method) + " for entry " + entry->name);
  }

  const std::size_t header = entry->local_header_offset;
  if (!HasRange(bytes_, header, zip::kLocalFileHeaderSize) ||
      ReadU32(bytes_, header) != zip::kLocalFileHeaderSignature) {
    return core::errors::Fail(error, ErrorKind::kParseError,
                              "bad local header for entry " + entry->name);
  }

  const std::size_t data_offset = header + zip::kLocalFileHeaderSize +
                                  ReadU16(bytes_, header + 26U) + ReadU16(bytes_, header + 28U);
  if (!HasRange(bytes_, data_offset, entry->compressed_size)) {
    return core::errors::Fail(error, ErrorKind::kParseError,
                              "truncated data for entry " + entry->name);
  }

  const std::string_view data =
      std::string_view(bytes_).substr(data_offset, entry->compressed_size);
  if (entry->method == zip::kMethodStore) {
    contents.assign(data);
  } else {
    std::string inflate_error;
    if (!InflateRaw(data, entry->size, contents, inflate_error)) {
      return core::errors::Fail(error, ErrorKind::kParseError,
                                "corrupt deflate data for entry " + entry->name + ": " +
                                    inflate_error);
    }
  }
  if (zip::Crc32(contents) != entry->crc32) {
    return core::errors::Fail(error, ErrorKind::kParseError,
                              "crc mismatch for entry " + entry->name);
  }
  return true;
}

} // namespace cupkit::archive
