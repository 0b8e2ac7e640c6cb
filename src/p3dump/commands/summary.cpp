#include "summary.hpp"

#include <iostream>

#include <redlog.hpp>

#include "p3base/format_utils.hpp"
#include "p3dump/render/message_render.hpp"
#include "p3store/io/store_verifier.hpp"

namespace p3dump::commands {

namespace {

constexpr const char* k_indent1 = "  ";

using p3::util::format_bool;
using p3::util::format_bytes;
using p3::util::format_number;

} // namespace

int summary(const summary_options& options) {
  auto log = redlog::get_logger("p3dump.summary");

  if (options.store_path.empty()) {
    log.err("store path required");
    std::cerr << "error: --store is required" << std::endl;
    return 1;
  }

  const auto& registry = p3::store::default_schema_registry();
  p3::store::store_summary result;
  if (!p3::store::verify_store(options.store_path, registry, p3::store::verify_options{}, result, log)) {
    std::cerr << "error: " << (result.terminal_error ? result.terminal_error->message : "failed to read store")
              << std::endl;
    return 1;
  }

  const auto& header = result.header;
  std::cout << "store: " << result.path << "\n";
  std::cout << k_indent1 << "version: " << header.version_major << "." << header.version_minor << "\n";
  std::cout << k_indent1 << "header_size: " << header.header_size << "\n";
  if ((header.flags & p3::store::store_flag_record_count_valid) != 0) {
    std::cout << k_indent1 << "header_records: " << format_number(header.record_count) << "\n";
  } else {
    std::cout << k_indent1 << "header_records: unset\n";
  }
  std::cout << k_indent1 << "frames: " << format_number(result.frame_count) << "\n";
  std::cout << k_indent1 << "decoded: " << format_number(result.decoded_count) << "\n";
  std::cout << k_indent1 << "payload: " << format_bytes(result.payload_bytes) << "\n";

  std::cout << "schemas:\n";
  for (const auto& [tag, count] : result.tag_counts) {
    std::cout << k_indent1 << render::schema_label(registry, tag) << ": " << format_number(count) << "\n";
  }

  std::cout << "errors:\n";
  std::cout << k_indent1 << "record: " << format_number(result.record_error_count) << "\n";
  std::cout << k_indent1 << "terminal: "
            << (result.terminal_error ? std::string(p3::store::to_string(result.terminal_error->kind)) : "none")
            << "\n";
  if (result.record_count_checked) {
    std::cout << k_indent1 << "record_count_matches: " << format_bool(result.record_count_matches) << "\n";
  }
  std::cout.flush();
  return 0;
}

} // namespace p3dump::commands
