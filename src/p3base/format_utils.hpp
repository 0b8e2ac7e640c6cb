#pragma once

#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <span>
#include <sstream>
#include <string>

namespace p3::util {

inline std::string format_number(uint64_t value) {
  std::string out = std::to_string(value);
  for (std::ptrdiff_t i = static_cast<std::ptrdiff_t>(out.size()) - 3; i > 0; i -= 3) {
    out.insert(static_cast<size_t>(i), ",");
  }
  return out;
}

inline std::string format_bytes(uint64_t bytes) {
  static constexpr const char* suffixes[] = {"B", "KB", "MB", "GB", "TB"};
  constexpr size_t suffix_count = sizeof(suffixes) / sizeof(suffixes[0]);
  double value = static_cast<double>(bytes);
  size_t suffix_index = 0;
  while (value >= 1024.0 && suffix_index + 1 < suffix_count) {
    value /= 1024.0;
    ++suffix_index;
  }
  if (suffix_index == 0) {
    return format_number(bytes) + " B";
  }
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << value << " " << suffixes[suffix_index];
  return out.str();
}

inline std::string format_hex(uint64_t value, size_t width = 0) {
  std::ostringstream out;
  out << "0x" << std::hex;
  if (width > 0) {
    out << std::setw(static_cast<int>(width)) << std::setfill('0');
  }
  out << value;
  return out.str();
}

// hex dump of at most limit bytes; a limit of 0 prints everything
inline std::string format_hex_bytes(std::span<const uint8_t> bytes, size_t limit = 0) {
  size_t shown = (limit == 0 || bytes.size() <= limit) ? bytes.size() : limit;
  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (size_t i = 0; i < shown; ++i) {
    out << std::setw(2) << static_cast<int>(bytes[i]);
  }
  if (shown < bytes.size()) {
    out << "...";
  }
  return out.str();
}

// printable ascii preview with everything else shown as '.'
inline std::string format_printable(std::span<const uint8_t> bytes, size_t limit = 0) {
  size_t shown = (limit == 0 || bytes.size() <= limit) ? bytes.size() : limit;
  std::string out;
  out.reserve(shown + 3);
  for (size_t i = 0; i < shown; ++i) {
    uint8_t c = bytes[i];
    out.push_back(c >= 0x20 && c < 0x7f ? static_cast<char>(c) : '.');
  }
  if (shown < bytes.size()) {
    out += "...";
  }
  return out;
}

inline std::string format_bool(bool value) { return value ? "true" : "false"; }

} // namespace p3::util
