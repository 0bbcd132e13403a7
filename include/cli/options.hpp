#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>
#include "logger/logger.hpp"
#include "probe/probe_runner.hpp"

namespace diskprobe {
namespace cli {

constexpr const char* VERSION = "0.1.0";

struct ProgramOptions {
  std::string target_dir{"."};
  size_t chunk_count{1};
  std::string chunk_size{"256M"};
  bool quiet{false};
  bool verbose{false};
  bool progress_bar{true};
  bool suppress_tmux_warning{false};
  std::string log_file;
  bool show_help{false};
  bool show_version{false};
  bool valid{false};
  // Reason parsing failed, empty when valid
  std::string error;

  // quiet wins over verbose
  logging::LogConfig log_config() const;
  // Parses the chunk size expression; throws probe::ConfigError
  probe::ProbeConfig probe_config() const;
};

ProgramOptions parse_command_line(const std::vector<std::string>& args);
ProgramOptions parse_command_line(int argc, char* argv[]);

void print_usage(std::ostream& out, const std::string& program_name);

} // namespace cli
} // namespace diskprobe
