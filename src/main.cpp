#include <iostream>
#include <memory>
#include <string>
#include "cli/options.hpp"
#include "cli/run.hpp"
#include "crypto/random_source.hpp"
#include "logger/logger.hpp"
#include "probe/progress.hpp"
#include "probe/prompt.hpp"

namespace {

std::unique_ptr<diskprobe::probe::ProgressReporter> make_progress(bool enabled) {
  if (enabled) {
    return std::make_unique<diskprobe::probe::TerminalProgressBar>(std::cerr);
  }
  return std::make_unique<diskprobe::probe::NullProgress>();
}

int run(const diskprobe::cli::ProgramOptions& options) {
  auto progress = make_progress(options.progress_bar);
  diskprobe::crypto::RandomSource random;
  diskprobe::probe::TerminalPrompt prompt(std::cin, std::cout);

  diskprobe::cli::RunServices services{random, *progress, prompt};
  return diskprobe::cli::run_probe(options, services);
}

} // namespace

int main(int argc, char* argv[]) {
  const std::string program_name = argc > 0 ? argv[0] : "diskprobe";

  const auto options = diskprobe::cli::parse_command_line(argc, argv);
  if (!options.valid) {
    std::cerr << "Error: " << options.error << '\n';
    diskprobe::cli::print_usage(std::cerr, program_name);
    return 1;
  }
  if (options.show_help) {
    diskprobe::cli::print_usage(std::cout, program_name);
    return 0;
  }
  if (options.show_version) {
    std::cout << diskprobe::cli::VERSION << '\n';
    return 0;
  }

  try {
    diskprobe::logging::init_logging(options.log_config());
  } catch (const std::exception&) {
    // init_logging has already reported the reason on stderr
    return 1;
  }

  return run(options);
}
