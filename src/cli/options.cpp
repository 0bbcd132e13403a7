#include "cli/options.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>
#include "utils/size_format.hpp"

namespace diskprobe {
namespace cli {

namespace {

enum class Flag {
  ChunkCount,
  ChunkSize,
  Quiet,
  Verbose,
  ProgressBar,
  NoProgressBar,
  SuppressTmuxWarning,
  LogFile,
  Help,
  Version
};

const std::unordered_map<std::string, Flag> FLAG_MAP = {
  {"-n", Flag::ChunkCount},
  {"--chunk-count", Flag::ChunkCount},
  {"-s", Flag::ChunkSize},
  {"--chunk-size", Flag::ChunkSize},
  {"-q", Flag::Quiet},
  {"--quiet", Flag::Quiet},
  {"-v", Flag::Verbose},
  {"--verbose", Flag::Verbose},
  {"--progress-bar", Flag::ProgressBar},
  {"--no-progress-bar", Flag::NoProgressBar},
  {"--suppress-tmux-warning", Flag::SuppressTmuxWarning},
  {"--log-file", Flag::LogFile},
  {"-h", Flag::Help},
  {"--help", Flag::Help},
  {"--version", Flag::Version}
};

bool takes_value(Flag flag) {
  return flag == Flag::ChunkCount || flag == Flag::ChunkSize || flag == Flag::LogFile;
}

bool parse_count(const std::string& value, size_t& count) {
  if (value.empty() || !std::all_of(value.begin(), value.end(),
                                    [](unsigned char c) { return std::isdigit(c); })) {
    return false;
  }
  try {
    count = static_cast<size_t>(std::stoull(value));
  } catch (const std::out_of_range&) {
    return false;
  }
  return true;
}

ProgramOptions invalid(ProgramOptions options, const std::string& error) {
  options.valid = false;
  options.error = error;
  return options;
}

} // namespace

//==============================================
// DERIVED CONFIGURATION
//==============================================

logging::LogConfig ProgramOptions::log_config() const {
  logging::LogConfig config;
  if (quiet) {
    config.verbosity = logging::Verbosity::quiet;
  } else if (verbose) {
    config.verbosity = logging::Verbosity::verbose;
  }
  config.log_file = log_file;
  return config;
}

probe::ProbeConfig ProgramOptions::probe_config() const {
  probe::ProbeConfig config;
  config.target_dir = target_dir;
  config.chunk_count = chunk_count;
  config.chunk_size = utils::parse_size(chunk_size);
  config.multiplexer_warning = !suppress_tmux_warning;
  return config;
}

//==============================================
// COMMAND LINE PARSING
//==============================================

ProgramOptions parse_command_line(const std::vector<std::string>& args) {
  ProgramOptions options;
  bool have_path = false;

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];

    // Anything not starting with '-' is the target directory
    if (arg.size() < 2 || arg[0] != '-') {
      if (have_path) {
        return invalid(options, "Unexpected argument: " + arg);
      }
      options.target_dir = arg;
      have_path = true;
      continue;
    }

    auto it = FLAG_MAP.find(arg);
    if (it == FLAG_MAP.end()) {
      return invalid(options, "Unknown argument: " + arg);
    }

    const Flag flag = it->second;
    std::string value;
    if (takes_value(flag)) {
      if (i + 1 >= args.size()) {
        return invalid(options, "Missing value for " + arg);
      }
      value = args[++i];
    }

    switch (flag) {
      case Flag::ChunkCount:
        if (!parse_count(value, options.chunk_count)) {
          return invalid(options, "Invalid chunk count: " + value);
        }
        break;
      case Flag::ChunkSize:
        options.chunk_size = value;
        break;
      case Flag::Quiet:
        options.quiet = true;
        break;
      case Flag::Verbose:
        options.verbose = true;
        break;
      case Flag::ProgressBar:
        options.progress_bar = true;
        break;
      case Flag::NoProgressBar:
        options.progress_bar = false;
        break;
      case Flag::SuppressTmuxWarning:
        options.suppress_tmux_warning = true;
        break;
      case Flag::LogFile:
        options.log_file = value;
        break;
      case Flag::Help:
        options.show_help = true;
        break;
      case Flag::Version:
        options.show_version = true;
        break;
    }
  }

  options.valid = true;
  return options;
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return parse_command_line(args);
}

void print_usage(std::ostream& out, const std::string& program_name) {
  out << "Usage: " << program_name << " [options] <path>\n"
      << "Fills <path> (default: current directory) with random chunk files until\n"
      << "the count is reached or the device is full, then re-reads and verifies them.\n"
      << "Options:\n"
      << "  -n, --chunk-count <N>      Number of chunks to write (default 1)\n"
      << "  -s, --chunk-size <size>    Size of each chunk, e.g. 256M, 1.5G (default 256M)\n"
      << "  -q, --quiet                Do not log except for errors\n"
      << "  -v, --verbose              Verbose log output\n"
      << "      --progress-bar         Output a terminal progress bar (default)\n"
      << "      --no-progress-bar      Do not output a progress bar\n"
      << "      --suppress-tmux-warning\n"
      << "                             Suppress warning of not inside a tmux session\n"
      << "      --log-file <path>      Also write a detailed log to <path>\n"
      << "  -h, --help                 Show this help\n"
      << "      --version              Show version number\n"
      << "Example: " << program_name << " -n 100 -s 1G /mnt/usb\n";
}

} // namespace cli
} // namespace diskprobe
