#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>

#include <redlog.hpp>

#include "p3store/format/store_format.hpp"
#include "p3store/frame/record_framer.hpp"
#include "p3store/schema/message_types.hpp"
#include "p3store/schema/schema_registry.hpp"

namespace p3::store {

struct store_reader_config {
  std::string path;
  redlog::logger log = redlog::get_logger("p3store.reader");
  const schema_registry* registry = nullptr;
  uint32_t max_frame_size = k_default_max_frame_size;
};

// one stored frame; exactly one of value and error is set
struct store_entry {
  uint64_t index = 0;
  uint64_t offset = 0;
  schema_tag tag = k_invalid_schema_tag;
  uint32_t payload_size = 0;
  std::optional<message_value> value;
  std::optional<store_error> error;

  bool ok() const { return value.has_value(); }
};

class store_reader {
public:
  explicit store_reader(store_reader_config config);

  store_reader(const store_reader&) = delete;
  store_reader& operator=(const store_reader&) = delete;

  bool open();
  bool open(std::unique_ptr<std::istream> source);
  void close();

  // pulls the next frame. false at end of stream or after a terminal error
  bool read_next(store_entry& entry);
  bool seek_to_record(uint64_t offset, uint64_t index = 0);

  bool is_open() const { return stream_ != nullptr; }
  bool finished() const { return finished_; }
  bool failed() const { return static_cast<bool>(error_); }
  const store_error& error() const { return error_; }
  const store_header& header() const { return header_; }
  uint64_t records_read() const { return records_read_; }
  uint64_t data_offset() const { return data_offset_; }
  // offset of the next frame, counted from the header so unseekable sources report real positions
  uint64_t position() const { return position_; }
  const std::string& path() const { return config_.path; }

private:
  bool read_header();
  bool fail(error_kind kind, std::string message, uint64_t offset);
  void check_record_count();
  const schema_registry& registry() const;

  store_reader_config config_;
  std::unique_ptr<std::istream> stream_;
  store_header header_{};
  uint64_t data_offset_ = 0;
  uint64_t position_ = 0;
  uint64_t next_index_ = 0;
  uint64_t records_read_ = 0;
  bool finished_ = false;
  bool seeked_ = false;
  store_error error_{};
};

} // namespace p3::store
