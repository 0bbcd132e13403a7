#ifndef DISKPROBE_PROBE_RUN_STATE_HPP
#define DISKPROBE_PROBE_RUN_STATE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace diskprobe::probe {

// Fingerprint of one successfully written chunk
struct ChunkRecord {
  size_t index;
  std::string hash;
};

// Mutable state of a single run. The write phase appends to records, the
// verify phase only reads them; the two never overlap.
struct RunState {
  size_t requested = 0;
  uint64_t chunk_size = 0;

  // records[i].index == i, and records.size() is the written count
  std::vector<ChunkRecord> records;
  // Index whose write hit the out-of-space signal, if any
  std::optional<size_t> exhausted_at;

  size_t files_verified = 0;

  RunState() = default;
  RunState(size_t requested_count, uint64_t size)
    : requested(requested_count), chunk_size(size) {}

  size_t files_written() const { return records.size(); }
  uint64_t bytes_written() const { return static_cast<uint64_t>(files_written()) * chunk_size; }
  uint64_t bytes_verified() const { return static_cast<uint64_t>(files_verified) * chunk_size; }
};

} // namespace diskprobe::probe

#endif // DISKPROBE_PROBE_RUN_STATE_HPP
