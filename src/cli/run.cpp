#include "cli/run.hpp"
#include <exception>
#include <memory>
#include "logger/logger.hpp"
#include "probe/probe_runner.hpp"

namespace diskprobe {
namespace cli {

int run_probe(const ProgramOptions& options, RunServices& services) {
  try {
    probe::ProbeConfig config = options.probe_config();
    config.validate();

    std::unique_ptr<store::DirectoryChunkStore> directory_store;
    store::ChunkStorage* storage = services.storage;
    if (storage == nullptr) {
      directory_store = std::make_unique<store::DirectoryChunkStore>(config.target_dir);
      storage = directory_store.get();
    }

    probe::ProbeRunner runner(config, *storage, services.random, services.progress, services.prompt);
    runner.run();
    return 0;
  } catch (const std::exception& e) {
    services.progress.stop();
    LOG_FATAL << "An error occurred: " << e.what();
    return 1;
  }
}

} // namespace cli
} // namespace diskprobe
