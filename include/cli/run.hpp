#pragma once

#include "cli/options.hpp"
#include "crypto/random_source.hpp"
#include "probe/progress.hpp"
#include "probe/prompt.hpp"
#include "store/chunk_store.hpp"

namespace diskprobe {
namespace cli {

// Collaborators of a run that main wires to the terminal and the disk
struct RunServices {
  const crypto::RandomSource& random;
  probe::ProgressReporter& progress;
  probe::ConfirmationPrompt& prompt;
  // Null means a DirectoryChunkStore on the configured target directory
  store::ChunkStorage* storage = nullptr;
};

// Runs the write and verify phases for parsed options and returns the
// process exit code: 0 on full or partial success, 1 on any error. On
// error the progress bar is stopped before "An error occurred: <reason>"
// is logged at fatal.
int run_probe(const ProgramOptions& options, RunServices& services);

} // namespace cli
} // namespace diskprobe
