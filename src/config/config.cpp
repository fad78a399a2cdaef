#include "config/config.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include "core/error.hpp"

namespace dsb {
namespace config {

namespace {

// Whole-string unsigned decimal; rejects signs, blanks and overflow
bool parse_unsigned(const std::string& text, std::size_t& out) {
  if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
    return false;
  }
  unsigned long long value = 0;
  try {
    value = std::stoull(text);
  }
  catch (const std::out_of_range&) {
    return false;
  }
  if (value > std::numeric_limits<std::size_t>::max()) {
    return false;
  }
  out = static_cast<std::size_t>(value);
  return true;
}

} // namespace

void NodeConfig::validate() const {
  if (chunk_size == 0) {
    throw Error(ErrorKind::INVALID_ARGUMENT, "Config: Chunk size must be positive");
  }
  if (fetch_timeout.count() < 0) {
    throw Error(ErrorKind::INVALID_ARGUMENT, "Config: Fetch timeout must not be negative");
  }
  if (fetch_timeout.count() > 0 && worker_threads == 0) {
    throw Error(ErrorKind::INVALID_ARGUMENT, "Config: A fetch timeout needs at least one worker thread");
  }
}

void print_usage(const std::string& program_name, std::ostream& out) {
  out << "Usage: " << program_name << " [options]\n"
      << "Options:\n"
      << "  --chunk-size <bytes>   Chunk size for publishing (default 1024)\n"
      << "  --store <dir>          Directory for disk storage (default: in memory)\n"
      << "  --workers <n>          Worker threads for chunk fan-out (default 0: sequential)\n"
      << "  --timeout-ms <ms>      Per-chunk fetch timeout, requires workers (default 0: none)\n"
      << "  --log-file <file>      Log to file instead of the console\n"
      << "  --log-level <level>    trace, debug, info, warning, error or fatal (default info)\n"
      << "  --help                 Show this message\n"
      << "Example: " << program_name << " --store ./dsb_data --workers 4 --timeout-ms 2000\n";
}

ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err) {
  const std::unordered_set<std::string> flags = {
    "--chunk-size", "--store", "--workers", "--timeout-ms", "--log-file", "--log-level"
  };
  const std::string program_name = argc > 0 ? argv[0] : "dsb_node";

  ProgramOptions options;
  NodeConfig& config = options.config;

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "--help" || flag == "-h") {
      options.show_help = true;
      options.valid = true;
      return options;
    }
    if (flags.count(flag) == 0) {
      err << "Error: Unknown argument: " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }
    if (i + 1 >= argc) {
      err << "Error: Missing value for " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }
    const std::string value(argv[++i]);

    std::size_t number = 0;
    if (flag == "--chunk-size") {
      if (!parse_unsigned(value, number)) {
        err << "Error: Invalid chunk size: " << value << '\n';
        print_usage(program_name, err);
        return options;
      }
      config.chunk_size = number;
    } else if (flag == "--store") {
      config.storage_dir = value;
    } else if (flag == "--workers") {
      if (!parse_unsigned(value, number)) {
        err << "Error: Invalid worker count: " << value << '\n';
        print_usage(program_name, err);
        return options;
      }
      config.worker_threads = number;
    } else if (flag == "--timeout-ms") {
      if (!parse_unsigned(value, number) ||
          number > static_cast<std::size_t>(std::numeric_limits<std::chrono::milliseconds::rep>::max())) {
        err << "Error: Invalid timeout: " << value << '\n';
        print_usage(program_name, err);
        return options;
      }
      config.fetch_timeout = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(number));
    } else if (flag == "--log-file") {
      config.log_file = value;
    } else if (flag == "--log-level") {
      auto level = logging::parse_severity(value);
      if (!level) {
        err << "Error: Invalid log level: " << value << '\n';
        print_usage(program_name, err);
        return options;
      }
      config.log_level = *level;
    }
  }

  try {
    config.validate();
  }
  catch (const Error& e) {
    err << "Error: " << e.what() << '\n';
    print_usage(program_name, err);
    return options;
  }

  options.valid = true;
  return options;
}

} // namespace config
} // namespace dsb
