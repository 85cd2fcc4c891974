#ifndef CUPKIT_CORE_JSON_UTILS_HPP_
#define CUPKIT_CORE_JSON_UTILS_HPP_

#include <cstdio>
#include <string>
#include <string_view>

namespace cupkit::core {

// Appends `input` to `out` with JSON string escaping. Bytes >= 0x80 pass
// through so UTF-8 species names and titles survive unchanged. Shared by the
// DOM serializer and quoted log values.
inline void AppendEscapedJson(std::string& out, std::string_view input) {
  for (const char ch : input) {
    const char* escape = nullptr;
    switch (ch) {
    case '"':
      escape = "\\\"";
      break;
    case '\\':
      escape = "\\\\";
      break;
    case '\b':
      escape = "\\b";
      break;
    case '\f':
      escape = "\\f";
      break;
    case '\n':
      escape = "\\n";
      break;
    case '\r':
      escape = "\\r";
      break;
    case '\t':
      escape = "\\t";
      break;
    default:
      break;
    }

    if (escape != nullptr) {
      out += escape;
    } else if (static_cast<unsigned char>(ch) < 0x20U) {
      char buffer[8];
      std::snprintf(buffer, sizeof(buffer), "\\u%04x",
                    static_cast<unsigned int>(static_cast<unsigned char>(ch)));
      out += buffer;
    } else {
      out.push_back(ch);
    }
  }
}

} // namespace cupkit::core

#endif // CUPKIT_CORE_JSON_UTILS_HPP_
