#pragma once

#include <cstdint>
#include <istream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "p3store/format/store_format.hpp"

namespace p3::store {

struct frame_limits {
  uint32_t max_frame_size = k_default_max_frame_size;
};

struct record_frame {
  // stream position of the frame; 0 when the source cannot tell
  uint64_t offset = 0;
  schema_tag tag = k_invalid_schema_tag;
  std::vector<uint8_t> payload;
  uint64_t bytes_consumed = 0;
};

enum class unframe_status {
  ok,
  end_of_stream,
  truncated,
  corrupt,
};

std::string_view unframe_status_name(unframe_status status);

// appends [length:u32][tag:u16][payload] to out
bool frame_record(
    schema_tag tag, std::span<const uint8_t> payload, std::vector<uint8_t>& out,
    const frame_limits& limits = frame_limits{}
);

// reads one frame starting at the current stream position; never reads past the frame end
unframe_status unframe_record(std::istream& in, const frame_limits& limits, record_frame& out, std::string& error);

// like unframe_record but steps over the payload without reading it
unframe_status skip_record(
    std::istream& in, const frame_limits& limits, frame_header& header, uint64_t& bytes_consumed, std::string& error
);

} // namespace p3::store
