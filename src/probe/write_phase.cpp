#include "probe/write_phase.hpp"
#include "crypto/hasher.hpp"
#include "logger/logger.hpp"

namespace diskprobe::probe {

WritePhase::WritePhase(store::ChunkStorage& storage, const crypto::RandomSource& random,
                       ProgressReporter& progress)
  : storage_(storage)
  , random_(random)
  , progress_(progress) {}

void WritePhase::run(RunState& state) {
  LOG_TRACE << "Write phase: Writing up to " << state.requested << " chunks of "
            << state.chunk_size << " bytes";

  ProgressScope scope(progress_, state.requested);

  for (size_t i = 0; i < state.requested; ++i) {
    std::vector<uint8_t> data = random_.generate(static_cast<size_t>(state.chunk_size));
    store::WriteOutcome outcome = storage_.write_chunk(i, data);

    if (apply_outcome(state, i, outcome, data) == WriteDecision::Stop) {
      break;
    }
    progress_.update(i + 1);
  }
}

WriteDecision WritePhase::apply_outcome(RunState& state, size_t index,
                                        const store::WriteOutcome& outcome,
                                        const std::vector<uint8_t>& data) {
  const std::string label = store::chunk_label(index);

  switch (outcome.status) {
    case store::WriteStatus::Written: {
      // Hashed from memory; the verify phase does the independent re-read
      std::string hash = crypto::Sha256Hasher::hash(data);
      LOG_DEBUG << "Wrote chunk #" << label << " with hash: " << hash;
      state.records.push_back({index, hash});
      return WriteDecision::Continue;
    }

    case store::WriteStatus::Exhausted:
      LOG_INFO << "Failed to write chunk #" << label << ": No space left on device";
      LOG_INFO << "No space left on device. Moving to verification...";
      state.exhausted_at = index;
      return WriteDecision::Stop;

    case store::WriteStatus::Failed:
    default:
      LOG_TRACE << "Write phase: Aborting at chunk #" << label << " (" << outcome.error.message() << ")";
      throw WriteError(index, label, outcome.error);
  }
}

} // namespace diskprobe::probe
