#include "probe/probe_runner.hpp"
#include <limits>
#include "logger/logger.hpp"
#include "probe/probe_error.hpp"
#include "probe/verify_phase.hpp"
#include "probe/write_phase.hpp"

namespace diskprobe::probe {

//==============================================
// CONFIGURATION
//==============================================

void ProbeConfig::validate() const {
  if (chunk_size == 0) {
    throw ConfigError("Chunk size must be at least one byte");
  }
  if (chunk_size > std::numeric_limits<size_t>::max()) {
    throw ConfigError("Chunk size " + std::to_string(chunk_size) + " does not fit in memory");
  }
  if (chunk_count > store::MAX_CHUNK_COUNT) {
    throw ConfigError("Chunk count " + std::to_string(chunk_count) + " exceeds the maximum of "
                      + std::to_string(store::MAX_CHUNK_COUNT));
  }

  try {
    store::check_directory_accessible(target_dir);
  } catch (const store::StoreError& e) {
    throw ConfigError(e.what());
  }
}

//==============================================
// RUN
//==============================================

ProbeRunner::ProbeRunner(const ProbeConfig& config, store::ChunkStorage& storage,
                         const crypto::RandomSource& random, ProgressReporter& progress,
                         ConfirmationPrompt& prompt)
  : config_(config)
  , storage_(storage)
  , random_(random)
  , progress_(progress)
  , prompt_(prompt) {}

RunSummary ProbeRunner::run() {
  config_.validate();
  LOG_TRACE << "Runner: Target " << config_.target_dir.string() << ", " << config_.chunk_count
            << " chunks of " << config_.chunk_size << " bytes";

  if (config_.multiplexer_warning && !inside_multiplexer()) {
    LOG_INFO << "It seems that you are NOT inside a tmux or screen session!!";
    prompt_.confirm("(press enter to continue)");
  }

  state_ = RunState(config_.chunk_count, config_.chunk_size);

  WritePhase(storage_, random_, progress_).run(state_);
  LOG_INFO << RunSummary::from_state(state_).describe_written();

  VerifyPhase(storage_, progress_).run(state_);

  RunSummary summary = RunSummary::from_state(state_);
  LOG_INFO << summary.describe_verified();
  LOG_INFO << summary.describe_status();
  return summary;
}

} // namespace diskprobe::probe
