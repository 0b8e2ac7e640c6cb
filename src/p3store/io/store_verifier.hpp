#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <redlog.hpp>

#include "p3store/format/store_format.hpp"
#include "p3store/schema/schema_registry.hpp"

namespace p3::store {

struct verify_options {
  uint32_t max_frame_size = k_default_max_frame_size;
  // per-record errors past this count are counted but not kept
  size_t max_reported_errors = 1000;
};

struct record_error_entry {
  uint64_t index = 0;
  uint64_t offset = 0;
  schema_tag tag = k_invalid_schema_tag;
  store_error error{};
};

struct store_summary {
  std::string path;
  store_header header{};
  uint64_t frame_count = 0;
  uint64_t decoded_count = 0;
  uint64_t payload_bytes = 0;
  uint64_t record_error_count = 0;
  std::map<schema_tag, uint64_t> tag_counts;
  std::vector<record_error_entry> record_errors;
  std::optional<store_error> terminal_error;
  bool record_count_checked = false;
  // advisory; a mismatch never makes a summary unclean
  bool record_count_matches = true;

  bool clean() const { return record_error_count == 0 && !terminal_error; }
};

// false only when the store cannot be opened or its header is invalid; everything else lands in the summary
bool verify_store(
    const std::string& path, const schema_registry& registry, const verify_options& options, store_summary& summary,
    redlog::logger log
);

} // namespace p3::store
