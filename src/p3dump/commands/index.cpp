#include "index.hpp"

#include <iostream>

#include <redlog.hpp>

#include "p3base/format_utils.hpp"
#include "p3store/io/record_index.hpp"

namespace p3dump::commands {

int build_index(const index_options& options) {
  auto log = redlog::get_logger("p3dump.index");

  if (options.store_path.empty()) {
    log.err("store path required");
    std::cerr << "error: --store is required" << std::endl;
    return 1;
  }

  std::string output_path =
      options.output_path.empty() ? p3::store::default_record_index_path(options.store_path) : options.output_path;

  p3::store::record_index built;
  if (!p3::store::build_record_index(options.store_path, built, log)) {
    std::cerr << "error: failed to index " << options.store_path << std::endl;
    return 1;
  }
  if (!p3::store::write_record_index(output_path, built, log)) {
    std::cerr << "error: failed to write " << output_path << std::endl;
    return 1;
  }

  std::cout << "indexed " << p3::util::format_number(built.size()) << " records into " << output_path << "\n";
  if (built.terminal_error) {
    std::cout << "warning: scan stopped @" << p3::util::format_hex(built.terminal_error->offset) << ": "
              << p3::store::to_string(built.terminal_error->kind) << "\n";
  }
  std::cout.flush();
  return 0;
}

} // namespace p3dump::commands
