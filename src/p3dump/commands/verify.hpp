#pragma once

#include <cstddef>
#include <string>

namespace p3dump::commands {

struct verify_options {
  std::string store_path;
  size_t max_reported_errors = 20;
};

int verify(const verify_options& options);

} // namespace p3dump::commands
