#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <istream>
#include <limits>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace p3::store {

// little-endian encoding into a caller-owned buffer
class store_buffer_writer {
public:
  explicit store_buffer_writer(std::vector<uint8_t>& out) : out_(out) {}

  void write_u8(uint8_t value) { out_.push_back(value); }

  void write_u16(uint16_t value) {
    out_.push_back(static_cast<uint8_t>(value & 0xFFu));
    out_.push_back(static_cast<uint8_t>((value >> 8) & 0xFFu));
  }

  void write_u32(uint32_t value) {
    for (size_t i = 0; i < 4; ++i) {
      out_.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFFu));
    }
  }

  void write_u64(uint64_t value) {
    for (size_t i = 0; i < 8; ++i) {
      out_.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFFu));
    }
  }

  void write_bytes(const void* data, size_t size) {
    if (size == 0) {
      return;
    }
    const auto* bytes = static_cast<const uint8_t*>(data);
    out_.insert(out_.end(), bytes, bytes + static_cast<std::ptrdiff_t>(size));
  }

  void write_bytes(std::span<const uint8_t> data) { write_bytes(data.data(), data.size()); }

  // u32 length prefix followed by the bytes
  bool write_blob(std::span<const uint8_t> data) {
    if (data.size() > static_cast<size_t>(std::numeric_limits<uint32_t>::max())) {
      return false;
    }
    write_u32(static_cast<uint32_t>(data.size()));
    write_bytes(data);
    return true;
  }

  bool write_string(std::string_view value) {
    if (value.size() > static_cast<size_t>(std::numeric_limits<uint32_t>::max())) {
      return false;
    }
    write_u32(static_cast<uint32_t>(value.size()));
    if (!value.empty()) {
      write_bytes(value.data(), value.size());
    }
    return true;
  }

  size_t size() const { return out_.size(); }

private:
  std::vector<uint8_t>& out_;
};

// bounds-checked decoding; every read fails instead of running past the end
class store_buffer_reader {
public:
  explicit store_buffer_reader(std::span<const uint8_t> data) : data_(data) {}

  bool read_u8(uint8_t& value) { return read_scalar(value); }
  bool read_u16(uint16_t& value) { return read_scalar(value); }
  bool read_u32(uint32_t& value) { return read_scalar(value); }
  bool read_u64(uint64_t& value) { return read_scalar(value); }

  bool read_string(std::string& value) {
    uint32_t len = 0;
    if (!read_u32(len)) {
      return false;
    }
    if (len > remaining()) {
      return false;
    }
    value.assign(reinterpret_cast<const char*>(data_.data() + cursor_), len);
    cursor_ += len;
    return true;
  }

  bool read_blob(std::vector<uint8_t>& out) {
    uint32_t len = 0;
    if (!read_u32(len)) {
      return false;
    }
    return read_bytes(out, len);
  }

  bool read_bytes(std::vector<uint8_t>& out, size_t size) {
    if (size > remaining()) {
      return false;
    }
    auto start = data_.begin() + static_cast<std::ptrdiff_t>(cursor_);
    auto end = start + static_cast<std::ptrdiff_t>(size);
    out.assign(start, end);
    cursor_ += size;
    return true;
  }

  bool read_bytes(void* out, size_t size) {
    if (size > remaining()) {
      return false;
    }
    if (size == 0) {
      return true;
    }
    std::memcpy(out, data_.data() + cursor_, size);
    cursor_ += size;
    return true;
  }

  // a count of elements that each need at least min_element_size bytes
  bool read_count(uint32_t& count, size_t min_element_size) {
    if (!read_u32(count)) {
      return false;
    }
    if (min_element_size != 0 && count > remaining() / min_element_size) {
      return false;
    }
    return true;
  }

  size_t remaining() const { return data_.size() - cursor_; }
  size_t position() const { return cursor_; }
  bool at_end() const { return cursor_ == data_.size(); }

private:
  template <typename T> bool read_scalar(T& value) {
    constexpr size_t size = sizeof(T);
    if (size > remaining()) {
      return false;
    }
    T out = 0;
    for (size_t i = 0; i < size; ++i) {
      out |= static_cast<T>(static_cast<T>(data_[cursor_ + i]) << (8 * i));
    }
    value = out;
    cursor_ += size;
    return true;
  }

  std::span<const uint8_t> data_;
  size_t cursor_ = 0;
};

inline size_t read_stream_some(std::istream& in, void* data, size_t size) {
  if (size == 0) {
    return 0;
  }
  in.read(reinterpret_cast<char*>(data), static_cast<std::streamsize>(size));
  return static_cast<size_t>(in.gcount());
}

inline bool read_stream_bytes(std::istream& in, void* data, size_t size) {
  return read_stream_some(in, data, size) == size;
}

inline bool read_stream_u16(std::istream& in, uint16_t& value) {
  std::array<uint8_t, 2> buf{};
  if (!read_stream_bytes(in, buf.data(), buf.size())) {
    return false;
  }
  value = static_cast<uint16_t>(buf[0] | (static_cast<uint16_t>(buf[1]) << 8));
  return true;
}

inline bool read_stream_u32(std::istream& in, uint32_t& value) {
  std::array<uint8_t, 4> buf{};
  if (!read_stream_bytes(in, buf.data(), buf.size())) {
    return false;
  }
  value = static_cast<uint32_t>(buf[0]) | (static_cast<uint32_t>(buf[1]) << 8) | (static_cast<uint32_t>(buf[2]) << 16) |
          (static_cast<uint32_t>(buf[3]) << 24);
  return true;
}

inline bool read_stream_u64(std::istream& in, uint64_t& value) {
  std::array<uint8_t, 8> buf{};
  if (!read_stream_bytes(in, buf.data(), buf.size())) {
    return false;
  }
  value = 0;
  for (size_t i = 0; i < buf.size(); ++i) {
    value |= static_cast<uint64_t>(buf[i]) << (8 * i);
  }
  return true;
}

inline bool write_stream_bytes(std::ostream& out, const void* data, size_t size) {
  if (size == 0) {
    return true;
  }
  out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
  return out.good();
}

inline bool write_stream_u16(std::ostream& out, uint16_t value) {
  std::array<uint8_t, 2> buf{};
  buf[0] = static_cast<uint8_t>(value & 0xFFu);
  buf[1] = static_cast<uint8_t>((value >> 8) & 0xFFu);
  return write_stream_bytes(out, buf.data(), buf.size());
}

inline bool write_stream_u32(std::ostream& out, uint32_t value) {
  std::array<uint8_t, 4> buf{};
  for (size_t i = 0; i < buf.size(); ++i) {
    buf[i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFFu);
  }
  return write_stream_bytes(out, buf.data(), buf.size());
}

inline bool write_stream_u64(std::ostream& out, uint64_t value) {
  std::array<uint8_t, 8> buf{};
  for (size_t i = 0; i < buf.size(); ++i) {
    buf[i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFFu);
  }
  return write_stream_bytes(out, buf.data(), buf.size());
}

// bytes between the current read position and the end, if the stream can seek
inline bool stream_remaining(std::istream& in, uint64_t& remaining) {
  std::streampos current = in.tellg();
  if (current < 0) {
    in.clear();
    return false;
  }
  in.seekg(0, std::ios::end);
  std::streampos end = in.tellg();
  in.clear();
  in.seekg(current, std::ios::beg);
  if (end < 0 || !in || end < current) {
    in.clear();
    return false;
  }
  remaining = static_cast<uint64_t>(end - current);
  return true;
}

} // namespace p3::store
