#pragma once

#include <string>

namespace p3dump::commands {

struct index_options {
  std::string store_path;
  // defaults to <store>.p3idx
  std::string output_path;
};

int build_index(const index_options& options);

} // namespace p3dump::commands
