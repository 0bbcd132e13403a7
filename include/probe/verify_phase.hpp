#ifndef DISKPROBE_PROBE_VERIFY_PHASE_HPP
#define DISKPROBE_PROBE_VERIFY_PHASE_HPP

#include "probe/probe_error.hpp"
#include "probe/progress.hpp"
#include "probe/run_state.hpp"
#include "store/chunk_store.hpp"

namespace diskprobe::probe {

// Re-reads every chunk the write phase recorded and compares digests.
class VerifyPhase {
public:
  VerifyPhase(const store::ChunkStorage& storage, ProgressReporter& progress);

  // Covers state.files_written() chunks, not state.requested. Throws
  // VerificationMismatch on the first differing chunk and ReadError when a
  // chunk cannot be read back.
  void run(RunState& state);

private:
  const store::ChunkStorage& storage_;
  ProgressReporter& progress_;
};

} // namespace diskprobe::probe

#endif // DISKPROBE_PROBE_VERIFY_PHASE_HPP
