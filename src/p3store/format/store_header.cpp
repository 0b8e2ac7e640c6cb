#include "store_header.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <string>
#include <vector>

#include "store_io.hpp"

namespace p3::store {

namespace {

bool skip_header_extension(std::istream& in, uint64_t extra) {
  uint64_t remaining = 0;
  if (stream_remaining(in, remaining)) {
    if (extra > remaining) {
      return false;
    }
    in.seekg(static_cast<std::streamoff>(extra), std::ios::cur);
    return static_cast<bool>(in);
  }

  std::array<uint8_t, 64> scratch{};
  while (extra > 0) {
    size_t step = static_cast<size_t>(std::min<uint64_t>(extra, scratch.size()));
    if (!read_stream_bytes(in, scratch.data(), step)) {
      return false;
    }
    extra -= step;
  }
  return true;
}

} // namespace

bool write_store_header(std::ostream& out, const store_header& header) {
  std::vector<uint8_t> bytes;
  bytes.reserve(k_store_header_size);
  store_buffer_writer writer(bytes);
  writer.write_bytes(k_store_magic.data(), k_store_magic.size());
  writer.write_u16(header.version_major);
  writer.write_u16(header.version_minor);
  writer.write_u16(k_store_header_size);
  writer.write_u16(header.flags);
  writer.write_u64(header.record_count);
  writer.write_u64(header.reserved);
  return write_stream_bytes(out, bytes.data(), bytes.size());
}

bool read_store_header(std::istream& in, store_header& header, store_error& error) {
  std::array<uint8_t, 8> magic{};
  if (!read_stream_bytes(in, magic.data(), magic.size())) {
    error = make_store_error(error_kind::bad_magic, "truncated store header", 0);
    return false;
  }
  if (std::memcmp(magic.data(), k_store_magic.data(), k_store_magic.size()) != 0) {
    error = make_store_error(error_kind::bad_magic, "unexpected store magic", 0);
    return false;
  }

  store_header parsed{};
  if (!read_stream_u16(in, parsed.version_major) || !read_stream_u16(in, parsed.version_minor) ||
      !read_stream_u16(in, parsed.header_size) || !read_stream_u16(in, parsed.flags) ||
      !read_stream_u64(in, parsed.record_count) || !read_stream_u64(in, parsed.reserved)) {
    error = make_store_error(error_kind::bad_magic, "truncated store header fields", k_store_magic.size());
    return false;
  }

  if (parsed.version_major != k_store_version_major) {
    error = make_store_error(
        error_kind::unsupported_version,
        "unsupported store version " + std::to_string(parsed.version_major) + " (expected " +
            std::to_string(k_store_version_major) + ")",
        k_store_magic.size()
    );
    return false;
  }
  if (parsed.header_size < k_store_header_size) {
    error = make_store_error(error_kind::bad_magic, "store header size invalid", 12);
    return false;
  }

  // later minor versions may extend the header
  if (parsed.header_size > k_store_header_size) {
    if (!skip_header_extension(in, parsed.header_size - k_store_header_size)) {
      error = make_store_error(error_kind::bad_magic, "truncated store header extension", k_store_header_size);
      return false;
    }
  }

  header = parsed;
  return true;
}

} // namespace p3::store
