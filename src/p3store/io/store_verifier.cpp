#include "store_verifier.hpp"

#include <utility>

#include "store_reader.hpp"

namespace p3::store {

bool verify_store(
    const std::string& path, const schema_registry& registry, const verify_options& options, store_summary& summary,
    redlog::logger log
) {
  summary = store_summary{};
  summary.path = path;

  store_reader_config config{};
  config.path = path;
  config.registry = &registry;
  config.max_frame_size = options.max_frame_size;
  store_reader reader(std::move(config));
  if (!reader.open()) {
    summary.terminal_error = reader.error();
    log.err(
        "store verification failed to open", redlog::field("path", path),
        redlog::field("kind", to_string(reader.error().kind)), redlog::field("error", reader.error().message)
    );
    return false;
  }
  summary.header = reader.header();

  store_entry entry;
  while (reader.read_next(entry)) {
    summary.frame_count += 1;
    summary.payload_bytes += entry.payload_size;
    summary.tag_counts[entry.tag] += 1;
    if (entry.ok()) {
      summary.decoded_count += 1;
      continue;
    }

    summary.record_error_count += 1;
    if (summary.record_errors.size() < options.max_reported_errors) {
      summary.record_errors.push_back(record_error_entry{entry.index, entry.offset, entry.tag, *entry.error});
    }
  }

  if (reader.failed()) {
    summary.terminal_error = reader.error();
  }

  if ((summary.header.flags & store_flag_record_count_valid) != 0) {
    summary.record_count_checked = true;
    summary.record_count_matches = summary.header.record_count == summary.frame_count;
  }

  log.inf(
      "store verified", redlog::field("path", path), redlog::field("frames", summary.frame_count),
      redlog::field("record_errors", summary.record_error_count),
      redlog::field("terminal", summary.terminal_error ? to_string(summary.terminal_error->kind) : "none")
  );
  return true;
}

} // namespace p3::store
