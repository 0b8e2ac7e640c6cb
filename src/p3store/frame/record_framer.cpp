#include "record_framer.hpp"

#include <algorithm>
#include <array>
#include <limits>

#include "p3store/format/store_io.hpp"

namespace p3::store {

namespace {

// payloads of unseekable sources are read in steps so a bogus length cannot force one large allocation
constexpr size_t k_stream_read_step = 64 * 1024;

unframe_status read_frame_header(
    std::istream& in, const frame_limits& limits, frame_header& header, std::string& error
) {
  std::array<uint8_t, k_frame_header_size> buf{};
  size_t got = read_stream_some(in, buf.data(), buf.size());
  if (got == 0) {
    return unframe_status::end_of_stream;
  }
  if (got < buf.size()) {
    error = "truncated frame header (" + std::to_string(got) + " of " + std::to_string(buf.size()) + " bytes)";
    return unframe_status::truncated;
  }

  header.length = static_cast<uint32_t>(buf[0]) | (static_cast<uint32_t>(buf[1]) << 8) |
                  (static_cast<uint32_t>(buf[2]) << 16) | (static_cast<uint32_t>(buf[3]) << 24);
  header.tag = static_cast<schema_tag>(buf[4] | (static_cast<uint16_t>(buf[5]) << 8));

  if (header.length > limits.max_frame_size) {
    error = "frame length " + std::to_string(header.length) + " exceeds limit " + std::to_string(limits.max_frame_size);
    return unframe_status::corrupt;
  }
  return unframe_status::ok;
}

bool check_remaining(std::istream& in, uint32_t length, bool& known, std::string& error) {
  uint64_t remaining = 0;
  known = stream_remaining(in, remaining);
  if (known && length > remaining) {
    error = "frame declares " + std::to_string(length) + " payload bytes but only " + std::to_string(remaining) +
            " remain";
    return false;
  }
  return true;
}

uint64_t current_offset(std::istream& in) {
  std::streampos pos = in.tellg();
  if (pos < 0) {
    in.clear();
    return 0;
  }
  return static_cast<uint64_t>(pos);
}

} // namespace

std::string_view unframe_status_name(unframe_status status) {
  switch (status) {
  case unframe_status::ok:
    return "ok";
  case unframe_status::end_of_stream:
    return "end_of_stream";
  case unframe_status::truncated:
    return "truncated";
  case unframe_status::corrupt:
    return "corrupt";
  }
  return "unknown";
}

bool frame_record(
    schema_tag tag, std::span<const uint8_t> payload, std::vector<uint8_t>& out, const frame_limits& limits
) {
  if (payload.size() > std::numeric_limits<uint32_t>::max() || payload.size() > limits.max_frame_size) {
    return false;
  }
  store_buffer_writer writer(out);
  writer.write_u32(static_cast<uint32_t>(payload.size()));
  writer.write_u16(tag);
  writer.write_bytes(payload);
  return true;
}

unframe_status unframe_record(std::istream& in, const frame_limits& limits, record_frame& out, std::string& error) {
  out.offset = current_offset(in);
  out.tag = k_invalid_schema_tag;
  out.payload.clear();
  out.bytes_consumed = 0;

  frame_header header{};
  unframe_status status = read_frame_header(in, limits, header, error);
  if (status != unframe_status::ok) {
    return status;
  }

  bool known = false;
  if (!check_remaining(in, header.length, known, error)) {
    return unframe_status::truncated;
  }

  if (known) {
    out.payload.resize(header.length);
    if (!read_stream_bytes(in, out.payload.data(), out.payload.size())) {
      error = "truncated frame payload";
      return unframe_status::truncated;
    }
  } else {
    size_t left = header.length;
    while (left > 0) {
      size_t step = std::min(left, k_stream_read_step);
      size_t start = out.payload.size();
      out.payload.resize(start + step);
      size_t got = read_stream_some(in, out.payload.data() + start, step);
      if (got != step) {
        out.payload.resize(start + got);
        error = "truncated frame payload (" + std::to_string(out.payload.size()) + " of " +
                std::to_string(header.length) + " bytes)";
        return unframe_status::truncated;
      }
      left -= step;
    }
  }

  out.tag = header.tag;
  out.bytes_consumed = k_frame_header_size + header.length;
  return unframe_status::ok;
}

unframe_status skip_record(
    std::istream& in, const frame_limits& limits, frame_header& header, uint64_t& bytes_consumed, std::string& error
) {
  bytes_consumed = 0;
  unframe_status status = read_frame_header(in, limits, header, error);
  if (status != unframe_status::ok) {
    return status;
  }

  bool known = false;
  if (!check_remaining(in, header.length, known, error)) {
    return unframe_status::truncated;
  }

  if (known) {
    in.seekg(static_cast<std::streamoff>(header.length), std::ios::cur);
    if (!in) {
      error = "failed to skip frame payload";
      return unframe_status::truncated;
    }
  } else {
    std::array<uint8_t, 4096> scratch{};
    size_t left = header.length;
    while (left > 0) {
      size_t step = std::min(left, scratch.size());
      if (read_stream_some(in, scratch.data(), step) != step) {
        error = "truncated frame payload";
        return unframe_status::truncated;
      }
      left -= step;
    }
  }

  bytes_consumed = k_frame_header_size + header.length;
  return unframe_status::ok;
}

} // namespace p3::store
