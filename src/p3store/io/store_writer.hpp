#pragma once

#include <cstdint>
#include <fstream>
#include <span>
#include <string>
#include <vector>

#include <redlog.hpp>

#include "p3store/format/store_format.hpp"
#include "p3store/schema/message_types.hpp"
#include "p3store/schema/schema_registry.hpp"

namespace p3::store {

struct store_writer_config {
  std::string path;
  redlog::logger log = redlog::get_logger("p3store.writer");
  const schema_registry* registry = nullptr;
  uint32_t max_frame_size = k_default_max_frame_size;
  bool patch_record_count = true;
};

// appends framed records to a store file; one writer per file, records land in append order
class store_writer {
public:
  explicit store_writer(store_writer_config config);
  ~store_writer();

  store_writer(const store_writer&) = delete;
  store_writer& operator=(const store_writer&) = delete;

  bool open();
  void close();
  bool good() const { return good_; }

  bool append(const message_value& value);
  bool append(const message_value& value, uint64_t& offset_out);
  bool append_encoded(schema_tag tag, std::span<const uint8_t> payload, uint64_t& offset_out);
  bool flush();

  const std::string& path() const { return path_; }
  uint64_t record_count() const { return record_count_; }
  uint64_t bytes_written() const { return end_offset_; }
  const store_error& error() const { return error_; }

private:
  bool write_header();
  bool patch_header();
  bool write_bytes(const void* data, size_t size);
  void mark_failure(std::string message);
  const schema_registry& registry() const;
  std::string make_default_path() const;

  store_writer_config config_;
  std::ofstream stream_;
  std::string path_;
  bool good_ = false;
  uint64_t record_count_ = 0;
  uint64_t end_offset_ = 0;
  std::vector<uint8_t> frame_buffer_;
  store_error error_{};
};

} // namespace p3::store
