#ifndef DISKPROBE_PROBE_RUNNER_HPP
#define DISKPROBE_PROBE_RUNNER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include "crypto/random_source.hpp"
#include "probe/progress.hpp"
#include "probe/prompt.hpp"
#include "probe/run_state.hpp"
#include "probe/run_summary.hpp"
#include "store/chunk_store.hpp"

namespace diskprobe::probe {

struct ProbeConfig {
  std::filesystem::path target_dir{"."};
  size_t chunk_count = 1;
  uint64_t chunk_size = 256ULL * 1024 * 1024;
  // Ask for confirmation when not inside tmux or screen
  bool multiplexer_warning = true;

  // Throws ConfigError for a zero chunk size, a chunk count whose names
  // would stop sorting in index order, or an unusable target directory
  void validate() const;
};

// Runs the write phase then the verify phase against one storage.
class ProbeRunner {
public:
  ProbeRunner(const ProbeConfig& config, store::ChunkStorage& storage,
              const crypto::RandomSource& random, ProgressReporter& progress,
              ConfirmationPrompt& prompt);

  // Returns the summary of a run whose written chunks all verified.
  // Every other outcome is an exception.
  RunSummary run();

  const RunState& state() const { return state_; }

private:
  ProbeConfig config_;
  store::ChunkStorage& storage_;
  const crypto::RandomSource& random_;
  ProgressReporter& progress_;
  ConfirmationPrompt& prompt_;
  RunState state_;
};

} // namespace diskprobe::probe

#endif // DISKPROBE_PROBE_RUNNER_HPP
