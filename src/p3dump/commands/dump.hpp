#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace p3dump::commands {

struct dump_options {
  std::string store_path;
  bool jsonl = false;
  // 0 means no limit
  uint64_t limit = 0;
  // frame offset to start from; 0 starts at the first record
  uint64_t start_offset = 0;
  size_t max_bytes = 64;
};

int dump(const dump_options& options);

} // namespace p3dump::commands
