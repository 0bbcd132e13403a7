#include "probe/prompt.hpp"
#include <cstdlib>

namespace diskprobe::probe {

void TerminalPrompt::confirm(const std::string& message) {
  out_ << message << std::flush;
  std::string answer;
  std::getline(in_, answer);
}

bool inside_multiplexer() {
  return std::getenv("TMUX") != nullptr || std::getenv("STY") != nullptr;
}

} // namespace diskprobe::probe
