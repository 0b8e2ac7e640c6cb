#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <doctest/doctest.h>

#include "p3store/format/store_io.hpp"
#include "p3store/io/store_reader.hpp"
#include "p3store/io/store_writer.hpp"
#include "p3store/schema/message_codec.hpp"
#include "p3store/store_test_helpers.hpp"

namespace {

using namespace p3::store;
using namespace p3::store::test_helpers;

std::vector<uint8_t> legacy_segment_payload(std::string_view data) {
  std::vector<uint8_t> payload;
  store_buffer_writer writer(payload);
  auto log = test_log("io");
  REQUIRE(encode_segment_v1(make_segment(stream_direction::to_client, 0, 0, data), writer, log));
  return payload;
}

} // namespace

TEST_CASE("p3store writer and reader preserve append order") {
  namespace fs = std::filesystem;
  fs::path path = temp_path("p3store_order.p3s");

  auto values = sample_session();
  auto offsets = write_store(path, values);
  REQUIRE(offsets.size() == values.size());
  CHECK(offsets.front() == k_store_header_size);

  store_reader reader(reader_config(path));
  REQUIRE(reader.open());
  CHECK(reader.header().version_major == k_store_version_major);
  CHECK(reader.header().header_size == k_store_header_size);
  CHECK((reader.header().flags & store_flag_record_count_valid) != 0);
  CHECK(reader.header().record_count == values.size());

  auto entries = read_all(reader);
  CHECK(reader.finished());
  CHECK_FALSE(reader.failed());
  REQUIRE(entries.size() == values.size());
  for (size_t i = 0; i < entries.size(); ++i) {
    CAPTURE(i);
    CHECK(entries[i].index == i);
    CHECK(entries[i].offset == offsets[i]);
    REQUIRE(entries[i].ok());
    CHECK(*entries[i].value == values[i]);
  }
  CHECK(reader.records_read() == values.size());
}

TEST_CASE("p3store mixed records land at predictable offsets") {
  namespace fs = std::filesystem;
  fs::path path = temp_path("p3store_mixed.p3s");

  auto legacy = legacy_segment_payload("+OK 2 messages\r\n....");
  REQUIRE(legacy.size() == 25);

  uint64_t offset_a = 0;
  uint64_t offset_b = 0;
  uint64_t offset_c = 0;
  {
    store_writer writer(writer_config(path));
    REQUIRE(writer.open());
    REQUIRE(writer.append(opaque_message{byte_buffer(10, 0x5A)}, offset_a));
    REQUIRE(writer.append(opaque_message{}, offset_b));
    REQUIRE(writer.append_encoded(tags::segment_v1, legacy, offset_c));
    CHECK(writer.record_count() == 3);
    CHECK(writer.bytes_written() == 85);
    writer.close();
  }

  CHECK(offset_a == 32);
  CHECK(offset_b == 48);
  CHECK(offset_c == 54);
  CHECK(fs::file_size(path) == 85);

  store_reader reader(reader_config(path));
  REQUIRE(reader.open());
  CHECK(reader.header().record_count == 3);

  auto entries = read_all(reader);
  REQUIRE(entries.size() == 3);
  CHECK_FALSE(reader.failed());

  REQUIRE(entries[0].ok());
  CHECK(std::get<opaque_message>(*entries[0].value).bytes.size() == 10);
  REQUIRE(entries[1].ok());
  CHECK(std::get<opaque_message>(*entries[1].value).bytes.empty());
  REQUIRE(entries[2].ok());
  CHECK(entries[2].tag == tags::segment_v1);
  const auto& segment = std::get<stream_segment>(*entries[2].value);
  CHECK(segment.direction == stream_direction::to_client);
  CHECK(segment.stream_id == 0);
  CHECK(segment.stream_offset == 0);
  CHECK(segment.data == bytes_of("+OK 2 messages\r\n...."));
}

TEST_CASE("p3store empty store reads as a clean end of stream") {
  namespace fs = std::filesystem;
  fs::path path = temp_path("p3store_empty.p3s");
  write_store(path, {});
  CHECK(fs::file_size(path) == k_store_header_size);

  store_reader reader(reader_config(path));
  REQUIRE(reader.open());
  CHECK(reader.header().record_count == 0);
  CHECK((reader.header().flags & store_flag_record_count_valid) != 0);

  store_entry entry;
  CHECK_FALSE(reader.read_next(entry));
  CHECK(reader.finished());
  CHECK_FALSE(reader.failed());
  CHECK_FALSE(reader.read_next(entry));
}

TEST_CASE("p3store reader skips records it cannot decode") {
  namespace fs = std::filesystem;
  fs::path path = temp_path("p3store_unknown_tag.p3s");

  auto first = make_command(pop3_keyword::stat);
  auto last = make_response(pop3_status::ok, "2 320");
  {
    store_writer writer(writer_config(path));
    REQUIRE(writer.open());
    uint64_t offset = 0;
    REQUIRE(writer.append(first));
    REQUIRE(writer.append_encoded(999, std::vector<uint8_t>{1, 2, 3}, offset));
    REQUIRE(writer.append_encoded(tags::pop3_command, std::vector<uint8_t>{0xFF}, offset));
    REQUIRE(writer.append(last));
    writer.close();
  }

  store_reader reader(reader_config(path));
  REQUIRE(reader.open());
  auto entries = read_all(reader);
  CHECK_FALSE(reader.failed());
  REQUIRE(entries.size() == 4);

  REQUIRE(entries[0].ok());
  CHECK(*entries[0].value == message_value(first));

  CHECK_FALSE(entries[1].ok());
  CHECK(entries[1].tag == 999);
  CHECK(entries[1].payload_size == 3);
  REQUIRE(entries[1].error.has_value());
  CHECK(entries[1].error->kind == error_kind::unknown_schema);
  CHECK(entries[1].error->offset == entries[1].offset);

  CHECK_FALSE(entries[2].ok());
  REQUIRE(entries[2].error.has_value());
  CHECK(entries[2].error->kind == error_kind::schema_mismatch);

  REQUIRE(entries[3].ok());
  CHECK(*entries[3].value == message_value(last));
}

TEST_CASE("p3store truncation at any offset keeps the complete prefix") {
  namespace fs = std::filesystem;
  fs::path source = temp_path("p3store_truncate_source.p3s");
  fs::path path = temp_path("p3store_truncate.p3s");

  auto values = sample_session();
  auto offsets = write_store(source, values);
  auto bytes = read_file_bytes(source);

  for (size_t cut = 0; cut < bytes.size(); ++cut) {
    CAPTURE(cut);
    write_file_bytes(path, std::vector<uint8_t>(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(cut)));

    store_reader reader(reader_config(path));
    if (cut < k_store_header_size) {
      CHECK_FALSE(reader.open());
      CHECK(reader.error().kind == error_kind::bad_magic);
      continue;
    }
    REQUIRE(reader.open());

    size_t complete = 0;
    while (complete < offsets.size()) {
      uint64_t end = complete + 1 < offsets.size() ? offsets[complete + 1] : bytes.size();
      if (end > cut) {
        break;
      }
      ++complete;
    }
    bool at_boundary = cut == k_store_header_size || std::find(offsets.begin(), offsets.end(), cut) != offsets.end();

    auto entries = read_all(reader);
    REQUIRE(entries.size() == complete);
    for (size_t i = 0; i < entries.size(); ++i) {
      REQUIRE(entries[i].ok());
      CHECK(*entries[i].value == values[i]);
    }

    if (at_boundary) {
      CHECK(reader.finished());
      CHECK_FALSE(reader.failed());
    } else {
      REQUIRE(reader.failed());
      CHECK(reader.error().kind == error_kind::truncated_frame);
      CHECK(reader.error().offset == offsets[complete]);
    }
  }
}

TEST_CASE("p3store reader rejects foreign and future files") {
  namespace fs = std::filesystem;
  fs::path source = temp_path("p3store_header_source.p3s");
  fs::path path = temp_path("p3store_header.p3s");
  write_store(source, {make_command(pop3_keyword::quit)});
  auto bytes = read_file_bytes(source);

  SUBCASE("bad magic") {
    bytes[0] = 'X';
    write_file_bytes(path, bytes);
    store_reader reader(reader_config(path));
    CHECK_FALSE(reader.open());
    CHECK(reader.error().kind == error_kind::bad_magic);
    CHECK_FALSE(reader.is_open());
  }

  SUBCASE("newer major version") {
    put_u16(bytes, 8, 2);
    write_file_bytes(path, bytes);
    store_reader reader(reader_config(path));
    CHECK_FALSE(reader.open());
    CHECK(reader.error().kind == error_kind::unsupported_version);
  }

  SUBCASE("major version zero") {
    put_u16(bytes, 8, 0);
    write_file_bytes(path, bytes);
    store_reader reader(reader_config(path));
    CHECK_FALSE(reader.open());
    CHECK(reader.error().kind == error_kind::unsupported_version);
  }

  SUBCASE("header size below the fixed layout") {
    put_u16(bytes, 12, 16);
    write_file_bytes(path, bytes);
    store_reader reader(reader_config(path));
    CHECK_FALSE(reader.open());
    CHECK(reader.error().kind == error_kind::bad_magic);
  }

  SUBCASE("missing file") {
    store_reader reader(reader_config(temp_path("p3store_does_not_exist.p3s")));
    CHECK_FALSE(reader.open());
    CHECK(reader.error().kind == error_kind::io_error);
  }
}

TEST_CASE("p3store reader accepts newer minor versions with a longer header") {
  namespace fs = std::filesystem;
  fs::path source = temp_path("p3store_minor_source.p3s");
  fs::path path = temp_path("p3store_minor.p3s");

  std::vector<message_value> values = {make_command(pop3_keyword::capa), stream_gap{}};
  write_store(source, values);
  auto bytes = read_file_bytes(source);
  put_u16(bytes, 10, 3);
  put_u16(bytes, 12, 40);
  bytes.insert(bytes.begin() + k_store_header_size, 8, 0xEE);
  write_file_bytes(path, bytes);

  store_reader reader(reader_config(path));
  REQUIRE(reader.open());
  CHECK(reader.header().version_minor == 3);
  CHECK(reader.data_offset() == 40);
  auto entries = read_all(reader);
  CHECK_FALSE(reader.failed());
  REQUIRE(entries.size() == 2);
  CHECK(entries[0].offset == 40);
  CHECK(*entries[0].value == values[0]);
  CHECK(*entries[1].value == values[1]);
}

TEST_CASE("p3store oversized frame length stops the stream") {
  namespace fs = std::filesystem;
  fs::path source = temp_path("p3store_corrupt_source.p3s");
  fs::path path = temp_path("p3store_corrupt.p3s");
  write_store(source, {make_command(pop3_keyword::noop), make_command(pop3_keyword::quit)});
  auto bytes = read_file_bytes(source);
  put_u32(bytes, k_store_header_size, 0xFFFFFFFFu);
  write_file_bytes(path, bytes);

  store_reader reader(reader_config(path));
  REQUIRE(reader.open());
  store_entry entry;
  CHECK_FALSE(reader.read_next(entry));
  REQUIRE(reader.failed());
  CHECK(reader.error().kind == error_kind::stream_corrupt);
  CHECK(reader.error().offset == k_store_header_size);
  CHECK_FALSE(reader.read_next(entry));
}

TEST_CASE("p3store header record count is advisory") {
  namespace fs = std::filesystem;
  fs::path source = temp_path("p3store_count_source.p3s");
  fs::path path = temp_path("p3store_count.p3s");
  write_store(source, {stream_gap{}, stream_gap{}});
  auto bytes = read_file_bytes(source);
  put_u32(bytes, k_record_count_offset, 99);
  write_file_bytes(path, bytes);

  store_reader reader(reader_config(path));
  REQUIRE(reader.open());
  CHECK(reader.header().record_count == 99);
  auto entries = read_all(reader);
  CHECK(entries.size() == 2);
  CHECK(reader.finished());
  CHECK_FALSE(reader.failed());
}

TEST_CASE("p3store reader seeks to a known record offset") {
  namespace fs = std::filesystem;
  fs::path path = temp_path("p3store_seek.p3s");
  auto values = sample_session();
  auto offsets = write_store(path, values);

  store_reader reader(reader_config(path));
  REQUIRE(reader.open());
  REQUIRE(reader.seek_to_record(offsets[4], 4));

  store_entry entry;
  REQUIRE(reader.read_next(entry));
  CHECK(entry.index == 4);
  CHECK(entry.offset == offsets[4]);
  CHECK(*entry.value == values[4]);

  auto rest = read_all(reader);
  CHECK(rest.size() == values.size() - 5);
  CHECK_FALSE(reader.failed());

  REQUIRE(reader.seek_to_record(offsets[0]));
  REQUIRE(reader.read_next(entry));
  CHECK(*entry.value == values[0]);

  CHECK_FALSE(reader.seek_to_record(4));
  CHECK_FALSE(reader.seek_to_record(fs::file_size(path) + 1));
  CHECK_FALSE(reader.seek_to_record(100000));

  // rejected seeks leave the reader on the next record
  auto remaining = read_all(reader);
  CHECK_FALSE(reader.failed());
  REQUIRE(remaining.size() == values.size() - 1);
  CHECK(remaining.front().index == 1);
  CHECK(remaining.front().offset == offsets[1]);
  CHECK(*remaining.back().value == values.back());
}

TEST_CASE("p3store reader seeks back after a truncated tail") {
  namespace fs = std::filesystem;
  fs::path source = temp_path("p3store_seek_tail_source.p3s");
  fs::path path = temp_path("p3store_seek_tail.p3s");
  auto values = sample_session();
  auto offsets = write_store(source, values);
  auto bytes = read_file_bytes(source);
  bytes.resize(bytes.size() - 1);
  write_file_bytes(path, bytes);

  store_reader reader(reader_config(path));
  REQUIRE(reader.open());
  auto entries = read_all(reader);
  REQUIRE(reader.failed());
  CHECK(reader.error().kind == error_kind::truncated_frame);
  CHECK(reader.error().offset == offsets.back());
  CHECK(entries.size() == values.size() - 1);

  CHECK_FALSE(reader.seek_to_record(bytes.size() + 1));
  CHECK(reader.failed());
  REQUIRE(reader.seek_to_record(offsets[2], 2));
  CHECK_FALSE(reader.failed());
  store_entry entry;
  REQUIRE(reader.read_next(entry));
  CHECK(entry.offset == offsets[2]);
  CHECK(*entry.value == values[2]);
}

TEST_CASE("p3store reader reports real offsets from unseekable sources") {
  namespace fs = std::filesystem;
  fs::path path = temp_path("p3store_unseekable.p3s");
  auto values = sample_session();
  auto offsets = write_store(path, values);
  auto bytes = read_file_bytes(path);

  store_reader reader(store_reader_config{});
  REQUIRE(reader.open(std::make_unique<unseekable_stream>(bytes)));
  auto entries = read_all(reader);
  CHECK(reader.finished());
  CHECK_FALSE(reader.failed());
  REQUIRE(entries.size() == values.size());
  for (size_t i = 0; i < entries.size(); ++i) {
    CAPTURE(i);
    CHECK(entries[i].offset == offsets[i]);
    CHECK(*entries[i].value == values[i]);
  }
  CHECK(reader.position() == bytes.size());
  CHECK_FALSE(reader.seek_to_record(offsets[0]));
}

TEST_CASE("p3store reader positions errors from unseekable sources") {
  namespace fs = std::filesystem;
  fs::path path = temp_path("p3store_unseekable_errors.p3s");
  uint64_t unknown_offset = 0;
  uint64_t tail_offset = 0;
  {
    store_writer writer(writer_config(path));
    REQUIRE(writer.open());
    REQUIRE(writer.append(stream_gap{}));
    REQUIRE(writer.append_encoded(999, std::vector<uint8_t>{1, 2, 3}, unknown_offset));
    REQUIRE(writer.append(make_command(pop3_keyword::quit), tail_offset));
    writer.close();
  }
  auto bytes = read_file_bytes(path);
  bytes.resize(bytes.size() - 2);

  store_reader reader(store_reader_config{});
  REQUIRE(reader.open(std::make_unique<unseekable_stream>(bytes)));
  auto entries = read_all(reader);
  REQUIRE(entries.size() == 2);
  CHECK(entries[0].offset == k_store_header_size);
  CHECK(entries[1].offset == unknown_offset);
  REQUIRE(entries[1].error.has_value());
  CHECK(entries[1].error->kind == error_kind::unknown_schema);
  CHECK(entries[1].error->offset == unknown_offset);

  REQUIRE(reader.failed());
  CHECK(reader.error().kind == error_kind::truncated_frame);
  CHECK(reader.error().offset == tail_offset);
}

TEST_CASE("p3store reader skips a longer header on unseekable sources") {
  namespace fs = std::filesystem;
  fs::path path = temp_path("p3store_unseekable_minor.p3s");
  std::vector<message_value> values = {make_command(pop3_keyword::capa), stream_gap{}};
  write_store(path, values);
  auto bytes = read_file_bytes(path);
  put_u16(bytes, 10, 2);
  put_u16(bytes, 12, 200);
  bytes.insert(bytes.begin() + k_store_header_size, 200 - k_store_header_size, 0xEE);

  store_reader reader(store_reader_config{});
  REQUIRE(reader.open(std::make_unique<unseekable_stream>(bytes)));
  CHECK(reader.data_offset() == 200);
  auto entries = read_all(reader);
  CHECK_FALSE(reader.failed());
  REQUIRE(entries.size() == 2);
  CHECK(entries[0].offset == 200);
  CHECK(*entries[1].value == values[1]);

  bytes.resize(100);
  store_reader short_reader(store_reader_config{});
  CHECK_FALSE(short_reader.open(std::make_unique<unseekable_stream>(bytes)));
  CHECK(short_reader.error().kind == error_kind::bad_magic);
}

TEST_CASE("p3store reader works over an in-memory stream") {
  namespace fs = std::filesystem;
  fs::path path = temp_path("p3store_memory.p3s");
  auto values = sample_session();
  write_store(path, values);
  auto bytes = read_file_bytes(path);

  store_reader reader(store_reader_config{});
  REQUIRE(reader.open(std::make_unique<std::istringstream>(std::string(bytes.begin(), bytes.end()), std::ios::binary)));
  auto entries = read_all(reader);
  CHECK_FALSE(reader.failed());
  REQUIRE(entries.size() == values.size());
  CHECK(*entries.back().value == values.back());
}

TEST_CASE("p3store writer keeps going after a rejected value") {
  namespace fs = std::filesystem;
  fs::path path = temp_path("p3store_rejected.p3s");

  store_writer writer(writer_config(path));
  REQUIRE(writer.open());

  pop3_command bad = make_command(pop3_keyword::noop);
  bad.error_flags = 0x80;
  CHECK_FALSE(writer.append(bad));
  CHECK(writer.error().kind == error_kind::schema_mismatch);
  CHECK(writer.good());
  CHECK(writer.bytes_written() == k_store_header_size);

  uint64_t offset = 0;
  CHECK_FALSE(writer.append_encoded(k_invalid_schema_tag, std::vector<uint8_t>{1}, offset));
  CHECK(writer.good());

  REQUIRE(writer.append(make_command(pop3_keyword::noop), offset));
  CHECK(offset == k_store_header_size);
  writer.close();
  CHECK_FALSE(writer.good());

  store_reader reader(reader_config(path));
  REQUIRE(reader.open());
  CHECK(reader.header().record_count == 1);
  CHECK(read_all(reader).size() == 1);
}

TEST_CASE("p3store writer finalizes the header when destroyed") {
  namespace fs = std::filesystem;
  fs::path path = temp_path("p3store_scope.p3s");
  {
    store_writer writer(writer_config(path));
    REQUIRE(writer.open());
    REQUIRE(writer.append(stream_gap{}));
    REQUIRE(writer.append(stream_gap{}));
    REQUIRE(writer.flush());
  }

  store_reader reader(reader_config(path));
  REQUIRE(reader.open());
  CHECK((reader.header().flags & store_flag_record_count_valid) != 0);
  CHECK(reader.header().record_count == 2);
}

TEST_CASE("p3store writer without a count patch leaves the count unset") {
  namespace fs = std::filesystem;
  fs::path path = temp_path("p3store_no_patch.p3s");
  {
    auto config = writer_config(path);
    config.patch_record_count = false;
    store_writer writer(std::move(config));
    REQUIRE(writer.open());
    REQUIRE(writer.append(stream_gap{}));
    writer.close();
  }

  store_reader reader(reader_config(path));
  REQUIRE(reader.open());
  CHECK((reader.header().flags & store_flag_record_count_valid) == 0);
  CHECK(reader.header().record_count == 0);
  CHECK(read_all(reader).size() == 1);
}

TEST_CASE("p3store writer picks a default path and refuses appends when closed") {
  namespace fs = std::filesystem;
  store_writer_config config{};
  config.log = test_log("writer");
  store_writer writer(std::move(config));

  CHECK_FALSE(writer.append(stream_gap{}));
  CHECK(writer.error().kind == error_kind::io_error);

  REQUIRE(writer.open());
  CHECK(writer.path().find("p3rsist_") != std::string::npos);
  CHECK(writer.path().size() > 4);
  CHECK(writer.path().substr(writer.path().size() - 4) == ".p3s");
  writer.close();

  std::error_code ec;
  fs::remove(writer.path(), ec);
}

TEST_CASE("p3store writer open fails on an unwritable destination") {
  namespace fs = std::filesystem;
  fs::path blocker = temp_path("p3store_blocker");
  std::error_code ec;
  fs::remove_all(blocker, ec);
  write_file_bytes(blocker, {0x01});

  SUBCASE("parent is a regular file") {
    store_writer writer(writer_config(blocker / "store.p3s"));
    CHECK_FALSE(writer.open());
    CHECK(writer.error().kind == error_kind::io_error);
    CHECK_FALSE(writer.good());
    CHECK_FALSE(writer.append(stream_gap{}));
  }

  SUBCASE("destination is a directory") {
    fs::path dir = temp_path("p3store_dir_target");
    fs::create_directories(dir);
    store_writer writer(writer_config(dir));
    CHECK_FALSE(writer.open());
    CHECK(writer.error().kind == error_kind::io_error);
    CHECK_FALSE(writer.good());
  }

  fs::remove(blocker, ec);
}
