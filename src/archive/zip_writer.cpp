#include "archive/zip_writer.hpp"

#include "archive/zip_format.hpp"
#include "core/fs_utils.hpp"

#include <zlib.h>

#include <algorithm>
#include <cstdint>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace cupkit::archive {

namespace {

struct PendingEntry {
  std::string zip_path;
  std::string payload;
  // Bytes written after the local header: `payload` itself when stored.
  std::string data;
  std::uint16_t method = zip::kMethodStore;
  std::uint32_t crc32 = 0;
  std::uint32_t local_header_offset = 0;
};

void AppendU16(std::string& out, std::uint16_t value) {
  out.push_back(static_cast<char>(value & 0xFFU));
  out.push_back(static_cast<char>((value >> 8) & 0xFFU));
}

void AppendU32(std::string& out, std::uint32_t value) {
  for (int shift = 0; shift < 32; shift += 8) {
    out.push_back(static_cast<char>((value >> shift) & 0xFFU));
  }
}

// Raw deflate stream (negative window bits: no zlib header or trailer), the
// form zip method 8 carries.
bool DeflateRaw(std::string_view input, std::string& output, std::string& error) {
  z_stream stream{};
  if (deflateInit2(&stream, Z_BEST_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                   Z_DEFAULT_STRATEGY) != Z_OK) {
    error = "failed to initialize deflate stream";
    return false;
  }

  output.resize(deflateBound(&stream, static_cast<uLong>(input.size())));
  stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
  stream.avail_in = static_cast<uInt>(input.size());
  stream.next_out = reinterpret_cast<Bytef*>(output.data());
  stream.avail_out = static_cast<uInt>(output.size());

  const int status = deflate(&stream, Z_FINISH);
  const uLong produced = stream.total_out;
  deflateEnd(&stream);
  if (status != Z_STREAM_END) {
    error = "deflate failed with status " + std::to_string(status);
    return false;
  }
  output.resize(produced);
  return true;
}

// Deflates the payload, falling back to storing it when compression does not
// shrink it (tiny or already-dense files), as `zip -r` does.
bool EncodePayload(PendingEntry& entry, std::string& error) {
  std::string deflated;
  if (!DeflateRaw(entry.payload, deflated, error)) {
    error = "failed to compress " + entry.zip_path + ": " + error;
    return false;
  }
  if (deflated.size() < entry.payload.size()) {
    entry.method = zip::kMethodDeflate;
    entry.data = std::move(deflated);
  } else {
    entry.method = zip::kMethodStore;
    entry.data = entry.payload;
  }
  return true;
}

bool CollectStagedFiles(const fs::path& staging_dir, std::vector<fs::path>& file_paths,
                        std::string& error) {
  std::error_code ec;
  if (!fs::is_directory(staging_dir, ec) || ec) {
    error = "staging directory not found: " + staging_dir.string();
    return false;
  }

  file_paths.clear();
  for (const auto& entry : fs::recursive_directory_iterator(staging_dir, ec)) {
    if (ec) {
      error = "failed while enumerating staging directory: " + staging_dir.string();
      return false;
    }
    if (entry.is_regular_file()) {
      file_paths.push_back(entry.path());
    }
  }
  if (ec) {
    error = "failed while enumerating staging directory: " + staging_dir.string();
    return false;
  }

  std::sort(file_paths.begin(), file_paths.end());
  if (file_paths.empty()) {
    error = "staging directory contains no files: " + staging_dir.string();
    return false;
  }
  return true;
}

bool LoadEntries(const fs::path& staging_dir, const std::vector<fs::path>& file_paths,
                 std::vector<PendingEntry>& entries, std::string& error) {
  const std::string prefix = staging_dir.filename().string() + "/";
  entries.reserve(file_paths.size());
  for (const auto& path : file_paths) {
    const std::string relative = path.lexically_relative(staging_dir).generic_string();
    if (relative.empty() || relative.rfind("..", 0) == 0U) {
      error = "file is outside staging directory: " + path.string();
      return false;
    }

    PendingEntry entry;
    entry.zip_path = prefix + relative;
    if (entry.zip_path.size() > 0xFFFFU) {
      error = "zip entry path too long: " + entry.zip_path;
      return false;
    }
    if (!core::ReadTextFile(path, entry.payload, error)) {
      return false;
    }
    if (entry.payload.size() > 0xFFFFFFFFULL) {
      error = "file too large for zip32 support: " + path.string();
      return false;
    }
    entry.crc32 = zip::Crc32(entry.payload);
    if (!EncodePayload(entry, error)) {
      return false;
    }
    entries.push_back(std::move(entry));
  }

  if (entries.size() > 0xFFFFU) {
    error = "too many files for zip32 support";
    return false;
  }
  return true;
}

// Fields common to the local header and the central directory record, from
// "version needed" through "extra field length".
void AppendEntryFields(std::string& out, const PendingEntry& entry) {
  AppendU16(out, zip::kVersion);
  AppendU16(out, 0); // general purpose bit flag
  AppendU16(out, entry.method);
  AppendU16(out, 0); // last mod file time
  AppendU16(out, 0); // last mod file date
  AppendU32(out, entry.crc32);
  AppendU32(out, static_cast<std::uint32_t>(entry.data.size()));
  AppendU32(out, static_cast<std::uint32_t>(entry.payload.size()));
  AppendU16(out, static_cast<std::uint16_t>(entry.zip_path.size()));
  AppendU16(out, 0); // extra field length
}

bool EncodeArchive(std::vector<PendingEntry>& entries, std::string& out, std::string& error) {
  for (auto& entry : entries) {
    if (out.size() > 0xFFFFFFFFULL) {
      error = "zip offset overflow while writing local file headers";
      return false;
    }
    entry.local_header_offset = static_cast<std::uint32_t>(out.size());
    AppendU32(out, zip::kLocalFileHeaderSignature);
    AppendEntryFields(out, entry);
    out += entry.zip_path;
    out += entry.data;
  }

  if (out.size() > 0xFFFFFFFFULL) {
    error = "zip central directory offset overflow";
    return false;
  }
  const auto central_dir_offset = static_cast<std::uint32_t>(out.size());

  for (const auto& entry : entries) {
    AppendU32(out, zip::kCentralDirectoryHeaderSignature);
    AppendU16(out, zip::kVersion); // version made by
    AppendEntryFields(out, entry);
    AppendU16(out, 0); // file comment length
    AppendU16(out, 0); // disk number start
    AppendU16(out, 0); // internal file attributes
    AppendU32(out, 0); // external file attributes
    AppendU32(out, entry.local_header_offset);
    out += entry.zip_path;
  }

  if (out.size() > 0xFFFFFFFFULL) {
    error = "zip central directory size overflow";
    return false;
  }
  const auto central_dir_size = static_cast<std::uint32_t>(out.size()) - central_dir_offset;

  AppendU32(out, zip::kEndOfCentralDirectorySignature);
  AppendU16(out, 0); // number of this disk
  AppendU16(out, 0); // disk with the start of the central directory
  AppendU16(out, static_cast<std::uint16_t>(entries.size()));
  AppendU16(out, static_cast<std::uint16_t>(entries.size()));
  AppendU32(out, central_dir_size);
  AppendU32(out, central_dir_offset);
  AppendU16(out, 0); // zip file comment length
  return true;
}

} // namespace

bool WriteArchiveZip(const fs::path& staging_dir, fs::path& written_path, std::string& error) {
  if (staging_dir.empty() || staging_dir.filename().empty()) {
    error = "staging directory must have a valid name";
    return false;
  }

  std::vector<fs::path> file_paths;
  if (!CollectStagedFiles(staging_dir, file_paths, error)) {
    return false;
  }

  std::vector<PendingEntry> entries;
  if (!LoadEntries(staging_dir, file_paths, entries, error)) {
    return false;
  }

  std::string encoded;
  if (!EncodeArchive(entries, encoded, error)) {
    return false;
  }

  written_path = staging_dir;
  written_path += ".zip";
  return core::WriteTextFileAtomic(written_path, encoded, error);
}

} // namespace cupkit::archive
