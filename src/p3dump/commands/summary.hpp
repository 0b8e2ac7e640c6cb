#pragma once

#include <string>

namespace p3dump::commands {

struct summary_options {
  std::string store_path;
};

int summary(const summary_options& options);

} // namespace p3dump::commands
