#include "probe/run_summary.hpp"
#include "utils/size_format.hpp"

namespace diskprobe::probe {

RunSummary RunSummary::from_state(const RunState& state) {
  RunSummary summary;
  summary.requested = state.requested;
  summary.written = state.files_written();
  summary.verified = state.files_verified;
  summary.chunk_size = state.chunk_size;
  return summary;
}

std::string RunSummary::describe_written() const {
  return "Wrote " + std::to_string(written) + " chunks, totalling "
       + utils::format_size(bytes_written()) + " data.";
}

std::string RunSummary::describe_verified() const {
  return "Verified " + std::to_string(verified) + " chunks, totalling "
       + utils::format_size(bytes_verified()) + " data";
}

std::string RunSummary::describe_status() const {
  if (complete()) {
    return "All chunks have been written and verified successfully";
  }
  return "Partly done, some chunks have errors.";
}

} // namespace diskprobe::probe
