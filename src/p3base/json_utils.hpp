#pragma once

#include <string>
#include <string_view>

namespace p3::util {

inline std::string quote_json_string(std::string_view value) {
  static constexpr char k_hex[] = "0123456789abcdef";
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('"');
  for (unsigned char c : value) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      // bytes past 0x7f are not valid utf-8 on their own, so they are escaped too
      if (c < 0x20 || c >= 0x7f) {
        out += "\\u00";
        out.push_back(k_hex[(c >> 4) & 0x0f]);
        out.push_back(k_hex[c & 0x0f]);
      } else {
        out.push_back(static_cast<char>(c));
      }
      break;
    }
  }
  out.push_back('"');
  return out;
}

} // namespace p3::util
