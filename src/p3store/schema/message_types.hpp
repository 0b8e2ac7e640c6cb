#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace p3::store {

using byte_buffer = std::vector<uint8_t>;

enum class stream_direction : uint8_t {
  unknown = 0,
  to_server = 1,
  to_client = 2,
};

// pop3 parser error flags; values are part of the on-disk layout
enum pop3_error_flags : uint8_t {
  pop3_flag_command_too_long = 1u << 0,
  pop3_flag_incorrect_argument_num = 1u << 1,
  pop3_flag_unknown_keyword = 1u << 2,
  pop3_flag_response_too_long = 1u << 3,
};

constexpr uint8_t k_pop3_error_flags_mask = pop3_flag_command_too_long | pop3_flag_incorrect_argument_num |
                                            pop3_flag_unknown_keyword | pop3_flag_response_too_long;

enum class pop3_keyword : uint8_t {
  quit = 1,
  stat = 2,
  list = 3,
  retr = 4,
  dele = 5,
  noop = 6,
  rset = 7,
  top = 8,
  uidl = 9,
  user = 10,
  pass = 11,
  apop = 12,
  capa = 13,
  stls = 14,
  auth = 15,
  sasl = 16,
  unknown = 0xFF,
};

enum class pop3_status : uint8_t {
  ok = 1,
  err = 2,
};

struct opaque_message {
  byte_buffer bytes;

  bool operator==(const opaque_message&) const = default;
};

struct stream_segment {
  stream_direction direction = stream_direction::unknown;
  uint64_t stream_id = 0;
  uint64_t stream_offset = 0;
  byte_buffer data;

  bool operator==(const stream_segment&) const = default;
};

struct pop3_command {
  uint8_t error_flags = 0;
  pop3_keyword keyword = pop3_keyword::noop;
  // only meaningful when keyword == pop3_keyword::unknown
  std::string unknown_keyword;
  std::vector<byte_buffer> args;

  bool operator==(const pop3_command&) const = default;
};

struct pop3_response {
  uint8_t error_flags = 0;
  pop3_status status = pop3_status::ok;
  byte_buffer header;
  std::vector<byte_buffer> data;

  bool operator==(const pop3_response&) const = default;
};

struct pop3_transaction {
  std::optional<pop3_command> command;
  std::optional<pop3_response> response;

  bool operator==(const pop3_transaction&) const = default;
};

struct stream_gap {
  bool operator==(const stream_gap&) const = default;
};

struct capture_info {
  std::string protocol;
  std::string parser_version;
  std::vector<std::pair<std::string, std::string>> attrs;

  bool operator==(const capture_info&) const = default;
};

using message_value = std::variant<
    opaque_message, stream_segment, pop3_command, pop3_response, pop3_transaction, stream_gap, capture_info>;

// alternative index of message_value
enum class message_kind : uint8_t {
  opaque = 0,
  segment = 1,
  pop3_command = 2,
  pop3_response = 3,
  pop3_transaction = 4,
  gap = 5,
  capture_info = 6,
};

constexpr size_t k_message_kind_count = std::variant_size_v<message_value>;

inline message_kind kind_of(const message_value& value) { return static_cast<message_kind>(value.index()); }

std::string_view message_kind_name(message_kind kind);
std::string_view pop3_keyword_name(pop3_keyword keyword);
std::optional<pop3_keyword> parse_pop3_keyword(std::string_view text);
std::string_view pop3_status_name(pop3_status status);
std::string_view stream_direction_name(stream_direction direction);

} // namespace p3::store
