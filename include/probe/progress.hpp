#ifndef DISKPROBE_PROBE_PROGRESS_HPP
#define DISKPROBE_PROBE_PROGRESS_HPP

#include <chrono>
#include <cstddef>
#include <ostream>

namespace diskprobe::probe {

// Receives per-phase progress from the write and verify loops.
class ProgressReporter {
public:
  virtual ~ProgressReporter() = default;

  virtual void start(size_t total, size_t current) = 0;
  virtual void update(size_t current) = 0;
  // Must be safe to call when not started
  virtual void stop() = 0;
};

class NullProgress : public ProgressReporter {
public:
  void start(size_t, size_t) override {}
  void update(size_t) override {}
  void stop() override {}
};

// Single-line shaded bar redrawn in place with carriage returns.
class TerminalProgressBar : public ProgressReporter {
public:
  static constexpr size_t BAR_WIDTH = 40;

  explicit TerminalProgressBar(std::ostream& out);

  void start(size_t total, size_t current) override;
  void update(size_t current) override;
  void stop() override;

  bool active() const { return active_; }

private:
  std::ostream& out_;
  bool active_ = false;
  size_t total_ = 0;
  size_t current_ = 0;
  std::chrono::steady_clock::time_point started_at_;

  void render();
};

// Stops the reporter when a phase leaves scope, including by exception
class ProgressScope {
public:
  ProgressScope(ProgressReporter& progress, size_t total)
    : progress_(progress) {
    progress_.start(total, 0);
  }
  ~ProgressScope() { progress_.stop(); }

  ProgressScope(const ProgressScope&) = delete;
  ProgressScope& operator=(const ProgressScope&) = delete;

private:
  ProgressReporter& progress_;
};

} // namespace diskprobe::probe

#endif // DISKPROBE_PROBE_PROGRESS_HPP
