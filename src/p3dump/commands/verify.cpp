#include "verify.hpp"

#include <iostream>

#include <redlog.hpp>

#include "p3base/format_utils.hpp"
#include "p3store/io/store_verifier.hpp"

namespace p3dump::commands {

int verify(const verify_options& options) {
  auto log = redlog::get_logger("p3dump.verify");

  if (options.store_path.empty()) {
    log.err("store path required");
    std::cerr << "error: --store is required" << std::endl;
    return 1;
  }

  p3::store::verify_options verify_opts{};
  verify_opts.max_reported_errors = options.max_reported_errors;

  p3::store::store_summary result;
  if (!p3::store::verify_store(
          options.store_path, p3::store::default_schema_registry(), verify_opts, result, log
      )) {
    std::cerr << "error: " << (result.terminal_error ? result.terminal_error->message : "failed to read store")
              << std::endl;
    return 1;
  }

  for (const auto& record : result.record_errors) {
    std::cout << "record #" << record.index << " @" << p3::util::format_hex(record.offset) << " tag=" << record.tag
              << ": " << p3::store::to_string(record.error.kind) << " (" << record.error.message << ")\n";
  }
  if (result.record_error_count > result.record_errors.size()) {
    std::cout << "... " << (result.record_error_count - result.record_errors.size()) << " more record errors\n";
  }
  if (result.terminal_error) {
    std::cout << "stream stopped @" << p3::util::format_hex(result.terminal_error->offset) << ": "
              << p3::store::to_string(result.terminal_error->kind) << " (" << result.terminal_error->message << ")\n";
  }
  if (!result.record_count_matches) {
    std::cout << "warning: header records " << result.header.record_count << " but stream has "
              << result.frame_count << "\n";
  }

  bool ok = result.record_error_count == 0 && !result.terminal_error;
  std::cout << (ok ? "ok" : "failed") << ": " << p3::util::format_number(result.frame_count) << " frames, "
            << p3::util::format_number(result.record_error_count) << " record errors" << std::endl;
  return ok ? 0 : 1;
}

} // namespace p3dump::commands
