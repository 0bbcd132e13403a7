#include "probe/progress.hpp"
#include <algorithm>
#include <string>

namespace diskprobe::probe {

namespace {

const char* const COMPLETE_CHAR = "█";
const char* const INCOMPLETE_CHAR = "░";

} // namespace

TerminalProgressBar::TerminalProgressBar(std::ostream& out)
  : out_(out) {}

void TerminalProgressBar::start(size_t total, size_t current) {
  total_ = total;
  current_ = std::min(current, total);
  started_at_ = std::chrono::steady_clock::now();
  active_ = true;
  render();
}

void TerminalProgressBar::update(size_t current) {
  if (!active_) {
    return;
  }
  current_ = std::min(current, total_);
  render();
}

void TerminalProgressBar::stop() {
  if (!active_) {
    return;
  }
  active_ = false;
  out_ << '\n' << std::flush;
}

void TerminalProgressBar::render() {
  // An empty phase is drawn as complete
  double fraction = total_ == 0 ? 1.0 : static_cast<double>(current_) / static_cast<double>(total_);
  auto filled = static_cast<size_t>(fraction * BAR_WIDTH);

  std::string bar;
  for (size_t i = 0; i < BAR_WIDTH; ++i) {
    bar += i < filled ? COMPLETE_CHAR : INCOMPLETE_CHAR;
  }

  auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_at_).count();
  long eta = 0;
  if (current_ > 0 && current_ < total_) {
    eta = static_cast<long>(elapsed / current_ * (total_ - current_) + 0.5);
  }

  out_ << '\r' << ' ' << bar << ' '
       << static_cast<int>(fraction * 100) << "% | ETA: " << eta << "s | "
       << current_ << '/' << total_ << std::flush;
}

} // namespace diskprobe::probe
