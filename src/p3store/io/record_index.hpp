#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <redlog.hpp>

#include "p3store/format/store_format.hpp"
#include "p3store/frame/record_framer.hpp"

namespace p3::store {

constexpr std::array<uint8_t, 8> k_record_index_magic = {'P', '3', 'I', 'N', 'D', 'E', 'X', '\0'};
constexpr uint16_t k_record_index_version = 1;

struct record_index_entry {
  uint64_t offset = 0;
  schema_tag tag = k_invalid_schema_tag;
  uint32_t payload_size = 0;
};

struct record_index {
  uint16_t store_version_major = k_store_version_major;
  uint16_t store_version_minor = k_store_version_minor;
  uint64_t data_offset = 0;
  uint64_t store_size = 0;
  std::vector<record_index_entry> entries;
  // set by build_record_index when the scan stopped at a bad frame; not persisted
  std::optional<store_error> terminal_error;

  const record_index_entry* find(uint64_t ordinal) const;
  size_t size() const { return entries.size(); }
};

enum class record_index_status {
  ok,
  missing,
  stale,
  incompatible,
};

std::string_view record_index_status_name(record_index_status status);

std::string default_record_index_path(const std::string& store_path);

bool build_record_index(
    const std::string& store_path, record_index& out, redlog::logger log, const frame_limits& limits = frame_limits{}
);

bool write_record_index(const std::string& index_path, const record_index& index, redlog::logger log);

// loads a sidecar and checks it against the current store file. out is only filled when status is ok
bool load_record_index(
    const std::string& index_path, const std::string& store_path, record_index& out, record_index_status& status,
    redlog::logger log
);

} // namespace p3::store
