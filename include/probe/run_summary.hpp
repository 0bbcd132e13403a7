#ifndef DISKPROBE_PROBE_RUN_SUMMARY_HPP
#define DISKPROBE_PROBE_RUN_SUMMARY_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include "probe/run_state.hpp"

namespace diskprobe::probe {

// Final counters of a run that reached the end of the verify phase.
// A failed run never produces one; failures leave as exceptions.
struct RunSummary {
  size_t requested = 0;
  size_t written = 0;
  size_t verified = 0;
  uint64_t chunk_size = 0;

  static RunSummary from_state(const RunState& state);

  uint64_t bytes_written() const { return static_cast<uint64_t>(written) * chunk_size; }
  uint64_t bytes_verified() const { return static_cast<uint64_t>(verified) * chunk_size; }

  // Every requested chunk was written and verified
  bool complete() const { return written == requested && verified == written; }

  std::string describe_written() const;
  std::string describe_verified() const;
  std::string describe_status() const;
};

} // namespace diskprobe::probe

#endif // DISKPROBE_PROBE_RUN_SUMMARY_HPP
