#ifndef DISKPROBE_PROBE_WRITE_PHASE_HPP
#define DISKPROBE_PROBE_WRITE_PHASE_HPP

#include <cstddef>
#include <cstdint>
#include <vector>
#include "crypto/random_source.hpp"
#include "probe/probe_error.hpp"
#include "probe/progress.hpp"
#include "probe/run_state.hpp"
#include "store/chunk_store.hpp"

namespace diskprobe::probe {

// What the write loop does after one write attempt
enum class WriteDecision {
  Continue,
  Stop
};

// Fills the target with chunks 0..requested-1, one at a time, stopping
// early when the device is full.
class WritePhase {
public:
  WritePhase(store::ChunkStorage& storage, const crypto::RandomSource& random,
             ProgressReporter& progress);

  // Appends a record per written chunk to state. Throws WriteError on any
  // failure other than running out of space.
  void run(RunState& state);

  // Folds one write outcome into state. Written records the SHA-256 of the
  // in-memory buffer, Exhausted marks the stop index, Failed throws.
  static WriteDecision apply_outcome(RunState& state, size_t index,
                                     const store::WriteOutcome& outcome,
                                     const std::vector<uint8_t>& data);

private:
  store::ChunkStorage& storage_;
  const crypto::RandomSource& random_;
  ProgressReporter& progress_;
};

} // namespace diskprobe::probe

#endif // DISKPROBE_PROBE_WRITE_PHASE_HPP
