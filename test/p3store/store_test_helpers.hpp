#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <iterator>
#include <string>
#include <streambuf>
#include <string_view>
#include <utility>
#include <vector>

#include <doctest/doctest.h>
#include <redlog.hpp>

#include "p3store/io/store_reader.hpp"
#include "p3store/io/store_writer.hpp"
#include "p3store/schema/message_types.hpp"

namespace p3::store::test_helpers {

inline std::filesystem::path temp_path(const char* name) { return std::filesystem::temp_directory_path() / name; }

inline redlog::logger test_log(const char* component) {
  return redlog::get_logger(std::string("test.p3store.") + component);
}

inline byte_buffer bytes_of(std::string_view text) { return byte_buffer(text.begin(), text.end()); }

inline pop3_command make_command(pop3_keyword keyword, std::vector<std::string_view> args = {}) {
  pop3_command command{};
  command.keyword = keyword;
  for (auto arg : args) {
    command.args.push_back(bytes_of(arg));
  }
  return command;
}

inline pop3_response make_response(
    pop3_status status, std::string_view header, std::vector<std::string_view> data = {}
) {
  pop3_response response{};
  response.status = status;
  response.header = bytes_of(header);
  for (auto line : data) {
    response.data.push_back(bytes_of(line));
  }
  return response;
}

inline stream_segment make_segment(
    stream_direction direction, uint64_t stream_id, uint64_t offset, std::string_view data
) {
  stream_segment segment{};
  segment.direction = direction;
  segment.stream_id = stream_id;
  segment.stream_offset = offset;
  segment.data = bytes_of(data);
  return segment;
}

// one value of every kind, in a pop3 session order
inline std::vector<message_value> sample_session() {
  std::vector<message_value> values;

  capture_info info{};
  info.protocol = "pop3";
  info.parser_version = "0.1.0";
  info.attrs = {{"source", "unit-test"}, {"port", "110"}};
  values.emplace_back(info);

  values.emplace_back(make_response(pop3_status::ok, "POP3 server ready"));
  values.emplace_back(make_command(pop3_keyword::user, {"alice"}));
  values.emplace_back(make_response(pop3_status::ok, "send PASS"));

  pop3_command bogus = make_command(pop3_keyword::unknown, {"x", "y"});
  bogus.unknown_keyword = "XFOO";
  bogus.error_flags = pop3_flag_unknown_keyword;
  values.emplace_back(bogus);

  pop3_transaction retr{};
  retr.command = make_command(pop3_keyword::retr, {"1"});
  retr.response = make_response(pop3_status::ok, "120 octets", {"Subject: hi", "", "body"});
  values.emplace_back(retr);

  values.emplace_back(make_segment(stream_direction::to_client, 7, 4096, "+OK bye\r\n"));
  values.emplace_back(stream_gap{});
  values.emplace_back(opaque_message{bytes_of("\x01\x02\x03")});
  return values;
}

inline store_writer_config writer_config(const std::filesystem::path& path) {
  store_writer_config config{};
  config.path = path.string();
  config.log = test_log("writer");
  return config;
}

inline store_reader_config reader_config(const std::filesystem::path& path) {
  store_reader_config config{};
  config.path = path.string();
  config.log = test_log("reader");
  return config;
}

// writes values in order and returns the offset of each frame
inline std::vector<uint64_t> write_store(const std::filesystem::path& path, const std::vector<message_value>& values) {
  store_writer writer(writer_config(path));
  REQUIRE(writer.open());
  std::vector<uint64_t> offsets;
  for (const auto& value : values) {
    uint64_t offset = 0;
    REQUIRE(writer.append(value, offset));
    offsets.push_back(offset);
  }
  writer.close();
  return offsets;
}

inline std::vector<store_entry> read_all(store_reader& reader) {
  std::vector<store_entry> entries;
  store_entry entry;
  while (reader.read_next(entry)) {
    entries.push_back(entry);
  }
  return entries;
}

inline std::vector<uint8_t> read_file_bytes(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  REQUIRE(in.is_open());
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void write_file_bytes(const std::filesystem::path& path, const std::vector<uint8_t>& bytes) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  REQUIRE(out.is_open());
  out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  REQUIRE(out.good());
}

// serves bytes like a pipe: every seek and tell fails
class unseekable_buffer : public std::streambuf {
public:
  explicit unseekable_buffer(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {
    char* base = reinterpret_cast<char*>(bytes_.data());
    setg(base, base, base + bytes_.size());
  }

protected:
  pos_type seekoff(off_type, std::ios_base::seekdir, std::ios_base::openmode) override {
    return pos_type(off_type(-1));
  }
  pos_type seekpos(pos_type, std::ios_base::openmode) override { return pos_type(off_type(-1)); }

private:
  std::vector<uint8_t> bytes_;
};

class unseekable_stream : public std::istream {
public:
  explicit unseekable_stream(std::vector<uint8_t> bytes) : std::istream(nullptr), buffer_(std::move(bytes)) {
    rdbuf(&buffer_);
  }

private:
  unseekable_buffer buffer_;
};

inline void put_u16(std::vector<uint8_t>& bytes, size_t offset, uint16_t value) {
  bytes[offset] = static_cast<uint8_t>(value & 0xFFu);
  bytes[offset + 1] = static_cast<uint8_t>((value >> 8) & 0xFFu);
}

inline void put_u32(std::vector<uint8_t>& bytes, size_t offset, uint32_t value) {
  for (size_t i = 0; i < 4; ++i) {
    bytes[offset + i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFFu);
  }
}

} // namespace p3::store::test_helpers
