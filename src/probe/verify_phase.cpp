#include "probe/verify_phase.hpp"
#include "logger/logger.hpp"

namespace diskprobe::probe {

VerifyPhase::VerifyPhase(const store::ChunkStorage& storage, ProgressReporter& progress)
  : storage_(storage)
  , progress_(progress) {}

void VerifyPhase::run(RunState& state) {
  const size_t total = state.files_written();
  LOG_TRACE << "Verify phase: Verifying " << total << " chunks";

  state.files_verified = 0;
  ProgressScope scope(progress_, total);

  for (size_t i = 0; i < total; ++i) {
    const std::string label = store::chunk_label(i);
    const ChunkRecord& record = state.records[i];

    std::string actual;
    try {
      actual = storage_.digest_chunk(i);
    } catch (const std::exception& e) {
      LOG_TRACE << "Verify phase: Aborting at chunk #" << label << " (" << e.what() << ")";
      throw ReadError(i, label, e.what());
    }

    if (actual != record.hash) {
      LOG_ERROR << "Verification failed for chunk #" << label
                << " (expected " << record.hash << ", read " << actual << ")";
      throw VerificationMismatch(i, label, record.hash, actual);
    }

    LOG_DEBUG << "Verified chunk #" << label << ".";
    ++state.files_verified;
    progress_.update(i + 1);
  }
}

} // namespace diskprobe::probe
