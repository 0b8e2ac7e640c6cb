#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace p3::store {

constexpr std::array<uint8_t, 8> k_store_magic = {'P', '3', 'S', 'T', 'O', 'R', 'E', '\0'};
constexpr uint16_t k_store_version_major = 1;
constexpr uint16_t k_store_version_minor = 0;
constexpr uint16_t k_store_header_size = 32;
constexpr uint64_t k_record_count_offset = 16;

constexpr size_t k_frame_header_size = sizeof(uint32_t) + sizeof(uint16_t);
constexpr uint32_t k_default_max_frame_size = 64u * 1024u * 1024u;

using schema_tag = uint16_t;

// tag 0 is never registered
constexpr schema_tag k_invalid_schema_tag = 0;

enum store_flags : uint16_t {
  store_flag_record_count_valid = 1u << 0,
};

struct store_header {
  uint16_t version_major = k_store_version_major;
  uint16_t version_minor = k_store_version_minor;
  uint16_t header_size = k_store_header_size;
  uint16_t flags = 0;
  uint64_t record_count = 0;
  uint64_t reserved = 0;
};

struct frame_header {
  uint32_t length = 0;
  schema_tag tag = k_invalid_schema_tag;
};

enum class error_kind : uint8_t {
  none = 0,
  io_error,
  bad_magic,
  unsupported_version,
  truncated_frame,
  unknown_schema,
  schema_mismatch,
  stream_corrupt,
};

struct store_error {
  error_kind kind = error_kind::none;
  std::string message;
  uint64_t offset = 0;

  explicit operator bool() const { return kind != error_kind::none; }
};

inline std::string_view to_string(error_kind kind) {
  switch (kind) {
  case error_kind::none:
    return "none";
  case error_kind::io_error:
    return "io_error";
  case error_kind::bad_magic:
    return "bad_magic";
  case error_kind::unsupported_version:
    return "unsupported_version";
  case error_kind::truncated_frame:
    return "truncated_frame";
  case error_kind::unknown_schema:
    return "unknown_schema";
  case error_kind::schema_mismatch:
    return "schema_mismatch";
  case error_kind::stream_corrupt:
    return "stream_corrupt";
  }
  return "unknown";
}

// per-record errors leave the frame boundary intact, everything else ends the stream
inline bool is_record_error(error_kind kind) {
  return kind == error_kind::unknown_schema || kind == error_kind::schema_mismatch;
}

inline store_error make_store_error(error_kind kind, std::string message, uint64_t offset = 0) {
  store_error error{};
  error.kind = kind;
  error.message = std::move(message);
  error.offset = offset;
  return error;
}

} // namespace p3::store
