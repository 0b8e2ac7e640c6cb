#include "dump.hpp"

#include <iostream>
#include <utility>

#include <redlog.hpp>

#include "p3dump/render/message_render.hpp"
#include "p3store/io/store_reader.hpp"

namespace p3dump::commands {

int dump(const dump_options& options) {
  auto log = redlog::get_logger("p3dump.dump");

  if (options.store_path.empty()) {
    log.err("store path required");
    std::cerr << "error: --store is required" << std::endl;
    return 1;
  }

  const auto& registry = p3::store::default_schema_registry();
  p3::store::store_reader_config config{};
  config.path = options.store_path;
  config.registry = &registry;
  p3::store::store_reader reader(std::move(config));
  if (!reader.open()) {
    std::cerr << "error: " << reader.error().message << std::endl;
    return 1;
  }

  if (options.start_offset != 0 && !reader.seek_to_record(options.start_offset)) {
    std::cerr << "error: cannot seek to offset " << options.start_offset << std::endl;
    return 1;
  }

  render::render_options render_opts;
  render_opts.max_bytes = options.max_bytes;

  uint64_t shown = 0;
  p3::store::store_entry entry;
  while ((options.limit == 0 || shown < options.limit) && reader.read_next(entry)) {
    if (options.jsonl) {
      render::write_entry_json(std::cout, entry, registry);
    } else {
      render::write_entry_text(std::cout, entry, registry, render_opts);
    }
    std::cout << "\n";
    ++shown;
  }
  std::cout.flush();

  if (reader.failed()) {
    const auto& error = reader.error();
    log.err(
        "store read stopped", redlog::field("kind", p3::store::to_string(error.kind)),
        redlog::field("offset", error.offset), redlog::field("error", error.message)
    );
    std::cerr << "error: " << p3::store::to_string(error.kind) << " at offset " << error.offset << ": "
              << error.message << std::endl;
    return 1;
  }

  log.dbg("dump complete", redlog::field("records", shown));
  return 0;
}

} // namespace p3dump::commands
