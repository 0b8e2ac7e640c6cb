#pragma once

#include <limits>
#include <span>
#include <vector>

#include <redlog.hpp>

#include "p3store/format/store_io.hpp"
#include "message_types.hpp"

namespace p3::store {

constexpr uint8_t k_pop3_unknown_keyword_code = static_cast<uint8_t>(pop3_keyword::unknown);

enum transaction_presence : uint8_t {
  transaction_has_command = 1u << 0,
  transaction_has_response = 1u << 1,
};

inline bool valid_direction(uint8_t value) { return value <= static_cast<uint8_t>(stream_direction::to_client); }

inline bool valid_pop3_keyword(uint8_t value) {
  return (value >= static_cast<uint8_t>(pop3_keyword::quit) && value <= static_cast<uint8_t>(pop3_keyword::sasl)) ||
         value == k_pop3_unknown_keyword_code;
}

inline bool valid_pop3_status(uint8_t value) {
  return value == static_cast<uint8_t>(pop3_status::ok) || value == static_cast<uint8_t>(pop3_status::err);
}

inline bool write_blob_checked(store_buffer_writer& writer, std::span<const uint8_t> data, redlog::logger& log) {
  if (!writer.write_blob(data)) {
    log.err("field too long", redlog::field("length", data.size()));
    return false;
  }
  return true;
}

inline bool write_string_checked(store_buffer_writer& writer, std::string_view value, redlog::logger& log) {
  if (!writer.write_string(value)) {
    log.err("string too long", redlog::field("length", value.size()));
    return false;
  }
  return true;
}

inline bool write_count_checked(store_buffer_writer& writer, size_t count, redlog::logger& log) {
  if (count > std::numeric_limits<uint32_t>::max()) {
    log.err("list too large", redlog::field("count", count));
    return false;
  }
  writer.write_u32(static_cast<uint32_t>(count));
  return true;
}

inline bool encode_blob_list(const std::vector<byte_buffer>& items, store_buffer_writer& writer, redlog::logger& log) {
  if (!write_count_checked(writer, items.size(), log)) {
    return false;
  }
  for (const auto& item : items) {
    if (!write_blob_checked(writer, item, log)) {
      return false;
    }
  }
  return true;
}

inline bool decode_blob_list(store_buffer_reader& reader, std::vector<byte_buffer>& out) {
  uint32_t count = 0;
  if (!reader.read_count(count, sizeof(uint32_t))) {
    return false;
  }
  out.clear();
  out.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    byte_buffer item;
    if (!reader.read_blob(item)) {
      return false;
    }
    out.push_back(std::move(item));
  }
  return true;
}

// opaque: the payload is the message bytes

inline bool encode_opaque(const opaque_message& message, store_buffer_writer& writer, redlog::logger&) {
  writer.write_bytes(message.bytes);
  return true;
}

inline bool decode_opaque(store_buffer_reader& reader, opaque_message& out) {
  return reader.read_bytes(out.bytes, reader.remaining());
}

// segment v1 predates stream ids; kept so old captures stay readable

inline bool encode_segment_v1(const stream_segment& segment, store_buffer_writer& writer, redlog::logger& log) {
  if (!valid_direction(static_cast<uint8_t>(segment.direction))) {
    log.err("invalid segment direction", redlog::field("direction", static_cast<uint32_t>(segment.direction)));
    return false;
  }
  writer.write_u8(static_cast<uint8_t>(segment.direction));
  return write_blob_checked(writer, segment.data, log);
}

inline bool decode_segment_v1(store_buffer_reader& reader, stream_segment& out) {
  uint8_t direction = 0;
  if (!reader.read_u8(direction) || !valid_direction(direction)) {
    return false;
  }
  out.direction = static_cast<stream_direction>(direction);
  out.stream_id = 0;
  out.stream_offset = 0;
  return reader.read_blob(out.data);
}

inline bool encode_segment_v2(const stream_segment& segment, store_buffer_writer& writer, redlog::logger& log) {
  if (!valid_direction(static_cast<uint8_t>(segment.direction))) {
    log.err("invalid segment direction", redlog::field("direction", static_cast<uint32_t>(segment.direction)));
    return false;
  }
  writer.write_u8(static_cast<uint8_t>(segment.direction));
  writer.write_u64(segment.stream_id);
  writer.write_u64(segment.stream_offset);
  return write_blob_checked(writer, segment.data, log);
}

inline bool decode_segment_v2(store_buffer_reader& reader, stream_segment& out) {
  uint8_t direction = 0;
  if (!reader.read_u8(direction) || !valid_direction(direction)) {
    return false;
  }
  out.direction = static_cast<stream_direction>(direction);
  if (!reader.read_u64(out.stream_id) || !reader.read_u64(out.stream_offset)) {
    return false;
  }
  return reader.read_blob(out.data);
}

inline bool encode_pop3_command(const pop3_command& command, store_buffer_writer& writer, redlog::logger& log) {
  if ((command.error_flags & ~k_pop3_error_flags_mask) != 0) {
    log.err("invalid pop3 error flags", redlog::field("flags", static_cast<uint32_t>(command.error_flags)));
    return false;
  }
  auto keyword = static_cast<uint8_t>(command.keyword);
  if (!valid_pop3_keyword(keyword)) {
    log.err("invalid pop3 keyword", redlog::field("keyword", static_cast<uint32_t>(keyword)));
    return false;
  }
  if (command.keyword != pop3_keyword::unknown && !command.unknown_keyword.empty()) {
    log.err("unknown keyword text set on a known pop3 keyword", redlog::field("text", command.unknown_keyword));
    return false;
  }

  writer.write_u8(command.error_flags);
  writer.write_u8(keyword);
  if (command.keyword == pop3_keyword::unknown) {
    if (!write_string_checked(writer, command.unknown_keyword, log)) {
      return false;
    }
  }
  return encode_blob_list(command.args, writer, log);
}

inline bool decode_pop3_command(store_buffer_reader& reader, pop3_command& out) {
  uint8_t keyword = 0;
  if (!reader.read_u8(out.error_flags) || !reader.read_u8(keyword)) {
    return false;
  }
  if ((out.error_flags & ~k_pop3_error_flags_mask) != 0 || !valid_pop3_keyword(keyword)) {
    return false;
  }
  out.keyword = static_cast<pop3_keyword>(keyword);
  out.unknown_keyword.clear();
  if (out.keyword == pop3_keyword::unknown) {
    if (!reader.read_string(out.unknown_keyword)) {
      return false;
    }
  }
  return decode_blob_list(reader, out.args);
}

inline bool encode_pop3_response(const pop3_response& response, store_buffer_writer& writer, redlog::logger& log) {
  if ((response.error_flags & ~k_pop3_error_flags_mask) != 0) {
    log.err("invalid pop3 error flags", redlog::field("flags", static_cast<uint32_t>(response.error_flags)));
    return false;
  }
  if (!valid_pop3_status(static_cast<uint8_t>(response.status))) {
    log.err("invalid pop3 status", redlog::field("status", static_cast<uint32_t>(response.status)));
    return false;
  }
  writer.write_u8(response.error_flags);
  writer.write_u8(static_cast<uint8_t>(response.status));
  if (!write_blob_checked(writer, response.header, log)) {
    return false;
  }
  return encode_blob_list(response.data, writer, log);
}

inline bool decode_pop3_response(store_buffer_reader& reader, pop3_response& out) {
  uint8_t status = 0;
  if (!reader.read_u8(out.error_flags) || !reader.read_u8(status)) {
    return false;
  }
  if ((out.error_flags & ~k_pop3_error_flags_mask) != 0 || !valid_pop3_status(status)) {
    return false;
  }
  out.status = static_cast<pop3_status>(status);
  if (!reader.read_blob(out.header)) {
    return false;
  }
  return decode_blob_list(reader, out.data);
}

// each present part is a length-delimited tag-3/tag-4 payload
inline bool encode_pop3_transaction(
    const pop3_transaction& transaction, store_buffer_writer& writer, redlog::logger& log
) {
  uint8_t presence = 0;
  if (transaction.command) {
    presence |= transaction_has_command;
  }
  if (transaction.response) {
    presence |= transaction_has_response;
  }
  writer.write_u8(presence);

  std::vector<uint8_t> nested;
  if (transaction.command) {
    store_buffer_writer nested_writer(nested);
    if (!encode_pop3_command(*transaction.command, nested_writer, log)) {
      return false;
    }
    if (!write_blob_checked(writer, nested, log)) {
      return false;
    }
  }
  if (transaction.response) {
    nested.clear();
    store_buffer_writer nested_writer(nested);
    if (!encode_pop3_response(*transaction.response, nested_writer, log)) {
      return false;
    }
    if (!write_blob_checked(writer, nested, log)) {
      return false;
    }
  }
  return true;
}

inline bool decode_pop3_transaction(store_buffer_reader& reader, pop3_transaction& out) {
  uint8_t presence = 0;
  if (!reader.read_u8(presence)) {
    return false;
  }
  if ((presence & ~(transaction_has_command | transaction_has_response)) != 0) {
    return false;
  }

  out.command.reset();
  out.response.reset();
  std::vector<uint8_t> nested;
  if ((presence & transaction_has_command) != 0) {
    if (!reader.read_blob(nested)) {
      return false;
    }
    store_buffer_reader nested_reader(nested);
    pop3_command command;
    if (!decode_pop3_command(nested_reader, command) || !nested_reader.at_end()) {
      return false;
    }
    out.command = std::move(command);
  }
  if ((presence & transaction_has_response) != 0) {
    if (!reader.read_blob(nested)) {
      return false;
    }
    store_buffer_reader nested_reader(nested);
    pop3_response response;
    if (!decode_pop3_response(nested_reader, response) || !nested_reader.at_end()) {
      return false;
    }
    out.response = std::move(response);
  }
  return true;
}

inline bool encode_gap(const stream_gap&, store_buffer_writer&, redlog::logger&) { return true; }

inline bool decode_gap(store_buffer_reader&, stream_gap&) { return true; }

inline bool encode_capture_info(const capture_info& info, store_buffer_writer& writer, redlog::logger& log) {
  if (!write_string_checked(writer, info.protocol, log) || !write_string_checked(writer, info.parser_version, log)) {
    return false;
  }
  if (!write_count_checked(writer, info.attrs.size(), log)) {
    return false;
  }
  for (const auto& [key, value] : info.attrs) {
    if (!write_string_checked(writer, key, log) || !write_string_checked(writer, value, log)) {
      return false;
    }
  }
  return true;
}

inline bool decode_capture_info(store_buffer_reader& reader, capture_info& out) {
  if (!reader.read_string(out.protocol) || !reader.read_string(out.parser_version)) {
    return false;
  }
  uint32_t count = 0;
  if (!reader.read_count(count, 2 * sizeof(uint32_t))) {
    return false;
  }
  out.attrs.clear();
  out.attrs.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    std::string key;
    std::string value;
    if (!reader.read_string(key) || !reader.read_string(value)) {
      return false;
    }
    out.attrs.emplace_back(std::move(key), std::move(value));
  }
  return true;
}

} // namespace p3::store
