#include <cstdint>
#include <iostream>
#include <string>

#include <args.hxx>
#include <redlog.hpp>

#include "p3base/cli/verbosity.hpp"

#include "commands/dump.hpp"
#include "commands/index.hpp"
#include "commands/summary.hpp"
#include "commands/verify.hpp"

namespace cli {
args::Group arguments("arguments");
args::HelpFlag help_flag(arguments, "help", "help", {'h', "help"});
args::CounterFlag verbosity_flag(arguments, "verbosity", "verbosity level", {'v'});

void apply_verbosity() { p3::cli::apply_verbosity(args::get(verbosity_flag)); }
} // namespace cli

namespace {
auto log_main = redlog::get_logger("p3dump");
int g_exit_code = 0;

bool require_store(const args::ValueFlag<std::string>& store_flag) {
  if (store_flag) {
    return true;
  }
  log_main.err("store path required");
  std::cerr << "error: --store is required" << std::endl;
  g_exit_code = 1;
  return false;
}
} // namespace

void cmd_summary(args::Subparser& parser) {
  cli::apply_verbosity();

  args::ValueFlag<std::string> store_flag(parser, "path", "path to store file", {'s', "store"});
  parser.Parse();

  if (!require_store(store_flag)) {
    return;
  }

  p3dump::commands::summary_options options;
  options.store_path = args::get(store_flag);
  g_exit_code = p3dump::commands::summary(options);
}

void cmd_dump(args::Subparser& parser) {
  cli::apply_verbosity();

  args::ValueFlag<std::string> store_flag(parser, "path", "path to store file", {'s', "store"});
  args::Flag jsonl_flag(parser, "jsonl", "print one json object per record", {"jsonl"});
  args::ValueFlag<uint64_t> limit_flag(parser, "count", "stop after this many records", {'n', "limit"});
  args::ValueFlag<uint64_t> start_flag(parser, "offset", "frame offset to start from", {"start"});
  args::ValueFlag<size_t> bytes_flag(parser, "bytes", "payload bytes shown per field (0 = all)", {"bytes"});
  parser.Parse();

  if (!require_store(store_flag)) {
    return;
  }

  p3dump::commands::dump_options options;
  options.store_path = args::get(store_flag);
  options.jsonl = jsonl_flag;
  options.limit = limit_flag ? args::get(limit_flag) : 0;
  options.start_offset = start_flag ? args::get(start_flag) : 0;
  options.max_bytes = bytes_flag ? args::get(bytes_flag) : 64;
  g_exit_code = p3dump::commands::dump(options);
}

void cmd_verify(args::Subparser& parser) {
  cli::apply_verbosity();

  args::ValueFlag<std::string> store_flag(parser, "path", "path to store file", {'s', "store"});
  args::ValueFlag<size_t> max_errors_flag(parser, "count", "record errors listed", {"max-errors"});
  parser.Parse();

  if (!require_store(store_flag)) {
    return;
  }

  p3dump::commands::verify_options options;
  options.store_path = args::get(store_flag);
  options.max_reported_errors = max_errors_flag ? args::get(max_errors_flag) : 20;
  g_exit_code = p3dump::commands::verify(options);
}

void cmd_index(args::Subparser& parser) {
  cli::apply_verbosity();

  args::ValueFlag<std::string> store_flag(parser, "path", "path to store file", {'s', "store"});
  args::ValueFlag<std::string> output_flag(parser, "path", "index output path", {'o', "output"});
  parser.Parse();

  if (!require_store(store_flag)) {
    return;
  }

  p3dump::commands::index_options options;
  options.store_path = args::get(store_flag);
  options.output_path = output_flag ? args::get(output_flag) : "";
  g_exit_code = p3dump::commands::build_index(options);
}

int main(int argc, char* argv[]) {
  args::ArgumentParser parser("p3dump - message store inspector", "inspect, verify and index p3rsist stores");
  parser.helpParams.showTerminator = false;

  args::GlobalOptions globals(parser, cli::arguments);
  args::Group commands(parser, "commands");

  args::Command summary_cmd(commands, "summary", "print store header and record totals", &cmd_summary);
  args::Command dump_cmd(commands, "dump", "print stored records", &cmd_dump);
  args::Command verify_cmd(commands, "verify", "check every record decodes", &cmd_verify);
  args::Command index_cmd(commands, "index", "build a record index sidecar", &cmd_index);

  try {
    parser.ParseCLI(argc, argv);
  } catch (args::Help) {
    std::cout << parser;
    return 0;
  } catch (args::Error& e) {
    std::cerr << e.what() << std::endl << parser;
    return 1;
  }

  return g_exit_code;
}
