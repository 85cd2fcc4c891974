#ifndef CUPKIT_ARCHIVE_ZIP_FORMAT_HPP_
#define CUPKIT_ARCHIVE_ZIP_FORMAT_HPP_

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace cupkit::archive::zip {

// Record layout shared by the writer and reader: the zip32 subset with stored
// or deflated entries. The reader rejects every other compression method.
constexpr std::uint32_t kLocalFileHeaderSignature = 0x04034b50U;
constexpr std::uint32_t kCentralDirectoryHeaderSignature = 0x02014b50U;
constexpr std::uint32_t kEndOfCentralDirectorySignature = 0x06054b50U;
constexpr std::uint16_t kVersion = 20; // 2.0
constexpr std::uint16_t kMethodStore = 0;
constexpr std::uint16_t kMethodDeflate = 8;

constexpr std::size_t kLocalFileHeaderSize = 30;
constexpr std::size_t kCentralDirectoryHeaderSize = 46;
constexpr std::size_t kEndOfCentralDirectorySize = 22;

inline const std::array<std::uint32_t, 256>& Crc32Table() {
  static const std::array<std::uint32_t, 256> table = [] {
    std::array<std::uint32_t, 256> generated{};
    for (std::uint32_t i = 0; i < 256U; ++i) {
      std::uint32_t c = i;
      for (int bit = 0; bit < 8; ++bit) {
        c = (c & 1U) != 0U ? (0xEDB88320U ^ (c >> 1)) : (c >> 1);
      }
      generated[i] = c;
    }
    return generated;
  }();
  return table;
}

inline std::uint32_t Crc32(std::string_view data) {
  const auto& table = Crc32Table();
  std::uint32_t c = 0xFFFFFFFFU;
  for (const char ch : data) {
    c = table[(c ^ static_cast<std::uint8_t>(ch)) & 0xFFU] ^ (c >> 8);
  }
  return c ^ 0xFFFFFFFFU;
}

} // namespace cupkit::archive::zip

#endif // CUPKIT_ARCHIVE_ZIP_FORMAT_HPP_
