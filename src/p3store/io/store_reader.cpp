#include "store_reader.hpp"

#include <fstream>
#include <utility>

#include "p3store/format/store_header.hpp"
#include "p3store/format/store_io.hpp"

namespace p3::store {

store_reader::store_reader(store_reader_config config) : config_(std::move(config)) {}

const schema_registry& store_reader::registry() const {
  return config_.registry ? *config_.registry : default_schema_registry();
}

bool store_reader::open() {
  close();
  if (config_.path.empty()) {
    config_.log.err("store reader requires a path");
    return fail(error_kind::io_error, "store path is empty", 0);
  }

  auto file = std::make_unique<std::ifstream>(config_.path, std::ios::binary | std::ios::in);
  if (!file->is_open()) {
    config_.log.err("failed to open store", redlog::field("path", config_.path));
    return fail(error_kind::io_error, "failed to open store: " + config_.path, 0);
  }
  return open(std::move(file));
}

bool store_reader::open(std::unique_ptr<std::istream> source) {
  close();
  if (!source) {
    return fail(error_kind::io_error, "store source missing", 0);
  }
  stream_ = std::move(source);

  if (!read_header()) {
    config_.log.err(
        "invalid store header", redlog::field("path", config_.path), redlog::field("kind", to_string(error_.kind)),
        redlog::field("error", error_.message)
    );
    stream_.reset();
    return false;
  }

  config_.log.inf(
      "store reader ready", redlog::field("path", config_.path), redlog::field("version", header_.version_major),
      redlog::field("minor", header_.version_minor)
  );
  return true;
}

void store_reader::close() {
  stream_.reset();
  header_ = {};
  data_offset_ = 0;
  position_ = 0;
  next_index_ = 0;
  records_read_ = 0;
  finished_ = false;
  seeked_ = false;
  error_ = {};
}

bool store_reader::read_header() {
  store_header header{};
  if (!read_store_header(*stream_, header, error_)) {
    return false;
  }
  header_ = header;
  data_offset_ = header.header_size;
  position_ = data_offset_;
  return true;
}

bool store_reader::read_next(store_entry& entry) {
  if (!stream_ || failed() || finished_) {
    return false;
  }

  frame_limits limits{};
  limits.max_frame_size = config_.max_frame_size;

  record_frame frame;
  std::string message;
  uint64_t offset = position_;
  unframe_status status = unframe_record(*stream_, limits, frame, message);
  switch (status) {
  case unframe_status::end_of_stream:
    finished_ = true;
    check_record_count();
    config_.log.dbg("store end reached", redlog::field("records", records_read_));
    return false;
  case unframe_status::truncated:
    config_.log.err("truncated frame", redlog::field("offset", offset), redlog::field("error", message));
    return fail(error_kind::truncated_frame, std::move(message), offset);
  case unframe_status::corrupt:
    config_.log.err("corrupt frame boundary", redlog::field("offset", offset), redlog::field("error", message));
    return fail(error_kind::stream_corrupt, std::move(message), offset);
  case unframe_status::ok:
    break;
  }
  position_ += frame.bytes_consumed;

  entry.index = next_index_++;
  entry.offset = offset;
  entry.tag = frame.tag;
  entry.payload_size = static_cast<uint32_t>(frame.payload.size());
  entry.value.reset();
  entry.error.reset();
  ++records_read_;

  message_value value;
  store_error decode_error{};
  if (decode_message(frame.tag, frame.payload, registry(), value, decode_error)) {
    entry.value = std::move(value);
  } else {
    decode_error.offset = offset;
    config_.log.wrn(
        "skipping undecodable record", redlog::field("index", entry.index), redlog::field("offset", offset),
        redlog::field("tag", frame.tag), redlog::field("kind", to_string(decode_error.kind)),
        redlog::field("error", decode_error.message)
    );
    entry.error = std::move(decode_error);
  }

  config_.log.trc(
      "record read", redlog::field("index", entry.index), redlog::field("offset", entry.offset),
      redlog::field("tag", entry.tag), redlog::field("size", entry.payload_size)
  );
  return true;
}

bool store_reader::seek_to_record(uint64_t offset, uint64_t index) {
  if (!stream_) {
    config_.log.err("store reader not open");
    return false;
  }
  if (offset < data_offset_) {
    config_.log.err("seek before first record", redlog::field("offset", offset));
    return false;
  }

  // measure without moving, so a rejected seek leaves the reader where it was
  stream_->clear();
  std::streampos current = stream_->tellg();
  uint64_t remaining = 0;
  if (current < 0 || !stream_remaining(*stream_, remaining)) {
    stream_->clear();
    config_.log.err("store source cannot seek", redlog::field("offset", offset));
    return false;
  }
  if (offset > static_cast<uint64_t>(current) + remaining) {
    config_.log.err("seek past store end", redlog::field("offset", offset));
    return false;
  }

  stream_->seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  if (!*stream_) {
    stream_->clear();
    stream_->seekg(current);
    config_.log.err("failed to seek store", redlog::field("offset", offset));
    return false;
  }

  // a new position means a new frame boundary, so earlier boundary errors no longer apply
  error_ = {};
  finished_ = false;
  seeked_ = true;
  position_ = offset;
  next_index_ = index;
  return true;
}

bool store_reader::fail(error_kind kind, std::string message, uint64_t offset) {
  error_ = make_store_error(kind, std::move(message), offset);
  return false;
}

void store_reader::check_record_count() {
  if (seeked_ || (header_.flags & store_flag_record_count_valid) == 0) {
    return;
  }
  if (header_.record_count != records_read_) {
    config_.log.wrn(
        "store header record count does not match stream", redlog::field("header", header_.record_count),
        redlog::field("stream", records_read_)
    );
  }
}

} // namespace p3::store
