#include "record_index.hpp"

#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "p3store/format/store_header.hpp"
#include "p3store/format/store_io.hpp"

namespace p3::store {

namespace {

constexpr uint64_t k_index_entry_size = sizeof(uint64_t) + sizeof(uint16_t) + sizeof(uint32_t);

struct index_file_header {
  uint16_t version = k_record_index_version;
  uint16_t store_version_major = 0;
  uint16_t store_version_minor = 0;
  uint16_t reserved = 0;
  uint64_t data_offset = 0;
  uint64_t store_size = 0;
  uint64_t entry_count = 0;
};

bool write_index_header(std::ostream& out, const index_file_header& header) {
  if (!write_stream_bytes(out, k_record_index_magic.data(), k_record_index_magic.size())) {
    return false;
  }
  return write_stream_u16(out, header.version) && write_stream_u16(out, header.store_version_major) &&
         write_stream_u16(out, header.store_version_minor) && write_stream_u16(out, header.reserved) &&
         write_stream_u64(out, header.data_offset) && write_stream_u64(out, header.store_size) &&
         write_stream_u64(out, header.entry_count);
}

bool read_index_header(std::istream& in, index_file_header& header) {
  std::array<uint8_t, 8> magic{};
  if (!read_stream_bytes(in, magic.data(), magic.size())) {
    return false;
  }
  if (std::memcmp(magic.data(), k_record_index_magic.data(), k_record_index_magic.size()) != 0) {
    return false;
  }
  return read_stream_u16(in, header.version) && read_stream_u16(in, header.store_version_major) &&
         read_stream_u16(in, header.store_version_minor) && read_stream_u16(in, header.reserved) &&
         read_stream_u64(in, header.data_offset) && read_stream_u64(in, header.store_size) &&
         read_stream_u64(in, header.entry_count);
}

bool entries_consistent(const record_index& index) {
  uint64_t expected = index.data_offset;
  for (const auto& entry : index.entries) {
    if (entry.offset != expected) {
      return false;
    }
    expected += k_frame_header_size + entry.payload_size;
  }
  return expected <= index.store_size;
}

} // namespace

const record_index_entry* record_index::find(uint64_t ordinal) const {
  if (ordinal >= entries.size()) {
    return nullptr;
  }
  return &entries[static_cast<size_t>(ordinal)];
}

std::string_view record_index_status_name(record_index_status status) {
  switch (status) {
  case record_index_status::ok:
    return "ok";
  case record_index_status::missing:
    return "missing";
  case record_index_status::stale:
    return "stale";
  case record_index_status::incompatible:
    return "incompatible";
  }
  return "unknown";
}

std::string default_record_index_path(const std::string& store_path) { return store_path + ".p3idx"; }

bool build_record_index(
    const std::string& store_path, record_index& out, redlog::logger log, const frame_limits& limits
) {
  std::ifstream in(store_path, std::ios::binary | std::ios::in);
  if (!in.is_open()) {
    log.err("failed to open store for indexing", redlog::field("path", store_path));
    return false;
  }

  store_header header{};
  store_error error{};
  if (!read_store_header(in, header, error)) {
    log.err(
        "invalid store header", redlog::field("path", store_path), redlog::field("kind", to_string(error.kind)),
        redlog::field("error", error.message)
    );
    return false;
  }

  record_index index;
  index.store_version_major = header.version_major;
  index.store_version_minor = header.version_minor;
  index.data_offset = header.header_size;

  uint64_t offset = header.header_size;
  for (;;) {
    frame_header frame{};
    uint64_t consumed = 0;
    std::string message;
    unframe_status status = skip_record(in, limits, frame, consumed, message);
    if (status == unframe_status::end_of_stream) {
      break;
    }
    if (status != unframe_status::ok) {
      error_kind kind = status == unframe_status::corrupt ? error_kind::stream_corrupt : error_kind::truncated_frame;
      log.wrn(
          "index scan stopped at bad frame", redlog::field("path", store_path), redlog::field("offset", offset),
          redlog::field("kind", to_string(kind)), redlog::field("error", message)
      );
      index.terminal_error = make_store_error(kind, std::move(message), offset);
      break;
    }

    index.entries.push_back(record_index_entry{offset, frame.tag, frame.length});
    offset += consumed;
  }

  std::error_code ec;
  auto size = std::filesystem::file_size(store_path, ec);
  if (ec) {
    log.err("failed to stat store", redlog::field("path", store_path), redlog::field("error", ec.message()));
    return false;
  }
  index.store_size = static_cast<uint64_t>(size);

  log.dbg(
      "store indexed", redlog::field("path", store_path), redlog::field("records", index.entries.size()),
      redlog::field("size", index.store_size)
  );
  out = std::move(index);
  return true;
}

bool write_record_index(const std::string& index_path, const record_index& index, redlog::logger log) {
  std::ofstream out(index_path, std::ios::binary | std::ios::out | std::ios::trunc);
  if (!out.is_open()) {
    log.err("failed to open record index output", redlog::field("path", index_path));
    return false;
  }

  index_file_header header{};
  header.store_version_major = index.store_version_major;
  header.store_version_minor = index.store_version_minor;
  header.data_offset = index.data_offset;
  header.store_size = index.store_size;
  header.entry_count = index.entries.size();
  if (!write_index_header(out, header)) {
    log.err("failed to write record index header", redlog::field("path", index_path));
    return false;
  }

  for (const auto& entry : index.entries) {
    if (!write_stream_u64(out, entry.offset) || !write_stream_u16(out, entry.tag) ||
        !write_stream_u32(out, entry.payload_size)) {
      log.err("failed to write record index entry", redlog::field("path", index_path));
      return false;
    }
  }

  out.flush();
  if (!out.good()) {
    log.err("failed to flush record index", redlog::field("path", index_path));
    return false;
  }

  log.inf(
      "record index written", redlog::field("path", index_path), redlog::field("records", index.entries.size())
  );
  return true;
}

bool load_record_index(
    const std::string& index_path, const std::string& store_path, record_index& out, record_index_status& status,
    redlog::logger log
) {
  std::error_code ec;
  if (!std::filesystem::exists(index_path, ec) || !std::filesystem::exists(store_path, ec)) {
    log.dbg("record index or store missing", redlog::field("index", index_path), redlog::field("store", store_path));
    status = record_index_status::missing;
    return false;
  }

  std::ifstream in(index_path, std::ios::binary | std::ios::in);
  if (!in.is_open()) {
    log.err("failed to open record index", redlog::field("path", index_path));
    status = record_index_status::missing;
    return false;
  }

  status = record_index_status::incompatible;
  index_file_header header{};
  if (!read_index_header(in, header)) {
    log.err("invalid record index header", redlog::field("path", index_path));
    return false;
  }
  if (header.version != k_record_index_version) {
    log.err("unsupported record index version", redlog::field("version", header.version));
    return false;
  }
  if (header.store_version_major != k_store_version_major) {
    log.err("record index built for another store version", redlog::field("version", header.store_version_major));
    return false;
  }

  uint64_t remaining = 0;
  if (stream_remaining(in, remaining) && header.entry_count > remaining / k_index_entry_size) {
    log.err(
        "record index entry count exceeds file size", redlog::field("path", index_path),
        redlog::field("count", header.entry_count)
    );
    return false;
  }

  record_index index;
  index.store_version_major = header.store_version_major;
  index.store_version_minor = header.store_version_minor;
  index.data_offset = header.data_offset;
  index.store_size = header.store_size;
  index.entries.resize(static_cast<size_t>(header.entry_count));
  for (auto& entry : index.entries) {
    if (!read_stream_u64(in, entry.offset) || !read_stream_u16(in, entry.tag) ||
        !read_stream_u32(in, entry.payload_size)) {
      log.err("failed to read record index entry", redlog::field("path", index_path));
      return false;
    }
  }
  if (!entries_consistent(index)) {
    log.err("record index entries out of order", redlog::field("path", index_path));
    return false;
  }

  auto store_size = std::filesystem::file_size(store_path, ec);
  if (ec) {
    log.err("failed to stat store", redlog::field("path", store_path), redlog::field("error", ec.message()));
    status = record_index_status::missing;
    return false;
  }
  if (static_cast<uint64_t>(store_size) > index.store_size) {
    log.wrn(
        "record index stale", redlog::field("path", index_path), redlog::field("indexed", index.store_size),
        redlog::field("store", static_cast<uint64_t>(store_size))
    );
    status = record_index_status::stale;
    return false;
  }
  if (static_cast<uint64_t>(store_size) < index.store_size) {
    log.err(
        "record index exceeds store size", redlog::field("path", index_path),
        redlog::field("indexed", index.store_size), redlog::field("store", static_cast<uint64_t>(store_size))
    );
    return false;
  }

  status = record_index_status::ok;
  out = std::move(index);
  return true;
}

} // namespace p3::store
