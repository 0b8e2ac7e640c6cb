#include "store_writer.hpp"

#include <filesystem>
#include <sstream>
#include <system_error>

#include "p3store/format/store_header.hpp"
#include "p3store/format/store_io.hpp"
#include "p3store/frame/record_framer.hpp"

#if defined(_WIN32)
#include <process.h>
#else
#include <unistd.h>
#endif

namespace p3::store {

namespace {
constexpr uint64_t k_flags_offset = 14;
} // namespace

store_writer::store_writer(store_writer_config config) : config_(std::move(config)) {}

store_writer::~store_writer() { close(); }

const schema_registry& store_writer::registry() const {
  return config_.registry ? *config_.registry : default_schema_registry();
}

bool store_writer::open() {
  if (stream_.is_open()) {
    close();
  }

  error_ = {};
  record_count_ = 0;
  end_offset_ = 0;
  path_ = config_.path;
  if (path_.empty()) {
    path_ = make_default_path();
  }

  std::error_code ec;
  std::filesystem::path fs_path(path_);
  if (fs_path.has_parent_path()) {
    std::filesystem::create_directories(fs_path.parent_path(), ec);
    if (ec) {
      config_.log.err(
          "failed to create store directory", redlog::field("path", fs_path.parent_path().string()),
          redlog::field("error", ec.message())
      );
      error_ = make_store_error(error_kind::io_error, "failed to create store directory: " + ec.message());
      good_ = false;
      return false;
    }
  }

  stream_.open(fs_path, std::ios::binary | std::ios::out | std::ios::trunc);
  good_ = stream_.good();
  if (!good_) {
    config_.log.err("failed to open store", redlog::field("path", path_));
    error_ = make_store_error(error_kind::io_error, "failed to open store for writing: " + path_);
    return false;
  }

  if (!write_header()) {
    config_.log.err("failed to write store header", redlog::field("path", path_));
    return false;
  }

  config_.log.inf("store writer ready", redlog::field("path", path_));
  return true;
}

void store_writer::close() {
  if (!stream_.is_open()) {
    good_ = false;
    return;
  }

  if (good_) {
    if (config_.patch_record_count && !patch_header()) {
      config_.log.err("failed to finalize store header", redlog::field("path", path_));
    }
    stream_.flush();
    if (!stream_.good()) {
      mark_failure("failed to flush store");
    }
  }
  stream_.close();

  if (good_) {
    config_.log.inf(
        "store writer closed", redlog::field("path", path_), redlog::field("records", record_count_),
        redlog::field("bytes", end_offset_)
    );
  } else {
    config_.log.wrn(
        "store writer closed after failure", redlog::field("path", path_), redlog::field("records", record_count_),
        redlog::field("error", error_.message)
    );
  }
  good_ = false;
}

bool store_writer::append(const message_value& value) {
  uint64_t offset = 0;
  return append(value, offset);
}

bool store_writer::append(const message_value& value, uint64_t& offset_out) {
  if (!good_) {
    if (!error_) {
      error_ = make_store_error(error_kind::io_error, "store writer not open");
    }
    return false;
  }

  encoded_message encoded;
  store_error encode_error{};
  if (!encode_message(value, registry(), encoded, encode_error, config_.log)) {
    // the value is rejected but the file is untouched
    encode_error.offset = end_offset_;
    error_ = std::move(encode_error);
    return false;
  }
  return append_encoded(encoded.tag, encoded.payload, offset_out);
}

bool store_writer::append_encoded(schema_tag tag, std::span<const uint8_t> payload, uint64_t& offset_out) {
  if (!good_) {
    if (!error_) {
      error_ = make_store_error(error_kind::io_error, "store writer not open");
    }
    return false;
  }
  if (tag == k_invalid_schema_tag) {
    config_.log.err("refusing to write reserved schema tag 0");
    error_ = make_store_error(error_kind::unknown_schema, "schema tag 0 is reserved", end_offset_);
    return false;
  }

  frame_limits limits{};
  limits.max_frame_size = config_.max_frame_size;
  frame_buffer_.clear();
  if (!frame_record(tag, payload, frame_buffer_, limits)) {
    config_.log.err(
        "record payload too large", redlog::field("tag", tag), redlog::field("size", payload.size()),
        redlog::field("limit", config_.max_frame_size)
    );
    error_ = make_store_error(error_kind::schema_mismatch, "record payload exceeds frame limit", end_offset_);
    return false;
  }

  uint64_t offset = end_offset_;
  if (!write_bytes(frame_buffer_.data(), frame_buffer_.size())) {
    config_.log.err("failed to write record", redlog::field("offset", offset), redlog::field("tag", tag));
    return false;
  }

  end_offset_ += frame_buffer_.size();
  ++record_count_;
  offset_out = offset;
  config_.log.trc(
      "record appended", redlog::field("offset", offset), redlog::field("tag", tag),
      redlog::field("size", payload.size())
  );
  return true;
}

bool store_writer::flush() {
  if (!good_) {
    return false;
  }
  stream_.flush();
  if (!stream_.good()) {
    mark_failure("failed to flush store");
    return false;
  }
  return true;
}

bool store_writer::write_header() {
  if (!good_) {
    return false;
  }
  store_header header{};
  if (!write_store_header(stream_, header)) {
    mark_failure("failed to write store header");
    return false;
  }
  end_offset_ = k_store_header_size;
  return true;
}

bool store_writer::patch_header() {
  stream_.flush();
  stream_.seekp(static_cast<std::streamoff>(k_flags_offset), std::ios::beg);
  if (!stream_) {
    mark_failure("failed to seek to store header");
    return false;
  }

  uint16_t flags = store_flag_record_count_valid;
  if (!write_stream_u16(stream_, flags) || !write_stream_u64(stream_, record_count_)) {
    mark_failure("failed to patch store header");
    return false;
  }

  stream_.seekp(0, std::ios::end);
  if (!stream_) {
    mark_failure("failed to seek to store end");
    return false;
  }
  return true;
}

bool store_writer::write_bytes(const void* data, size_t size) {
  if (!good_) {
    return false;
  }
  if (!write_stream_bytes(stream_, data, size)) {
    mark_failure("failed to write store bytes");
    return false;
  }
  return true;
}

void store_writer::mark_failure(std::string message) {
  good_ = false;
  error_ = make_store_error(error_kind::io_error, std::move(message), end_offset_);
}

std::string store_writer::make_default_path() const {
#if defined(_WIN32)
  std::filesystem::path base = std::filesystem::temp_directory_path();
  int pid = static_cast<int>(_getpid());
#else
  std::filesystem::path base = std::filesystem::path("/tmp");
  int pid = static_cast<int>(getpid());
#endif

  std::ostringstream name;
  name << "p3rsist_" << pid << ".p3s";
  base /= name.str();
  return base.string();
}

} // namespace p3::store
