#ifndef DSB_CONFIG_HPP
#define DSB_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <string>
#include "logger/logger.hpp"

namespace dsb {
namespace config {

struct NodeConfig {
  std::size_t chunk_size = 1024;
  std::string storage_dir;                       // empty = in-memory storage
  std::size_t worker_threads = 0;                // 0 = sequential
  std::chrono::milliseconds fetch_timeout{0};    // 0 = wait indefinitely
  std::string log_file;                          // empty = console
  logging::severity_level log_level = logging::severity_level::info;

  // Throws Error(INVALID_ARGUMENT) for an unusable combination
  void validate() const;
};

struct ProgramOptions {
  NodeConfig config;
  bool show_help{false};
  bool valid{false};
};

void print_usage(const std::string& program_name, std::ostream& out);

// Flags take one value each, except --help. Problems are reported on err
// together with the usage text and leave valid == false.
ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err);

} // namespace config
} // namespace dsb

#endif // DSB_CONFIG_HPP
