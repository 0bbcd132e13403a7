#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include "probe/probe_error.hpp"
#include "probe/probe_runner.hpp"
#include "test_utils.hpp"

using namespace diskprobe::probe;
using diskprobe::store::DirectoryChunkStore;
using diskprobe::store::WriteOutcome;
using diskprobe::test_support::MockChunkStorage;
using diskprobe::test_support::PatternRandomSource;
using diskprobe::test_support::TempDir;
using ::testing::_;
using ::testing::Return;

namespace {

class MockPrompt : public ConfirmationPrompt {
public:
  MOCK_METHOD(void, confirm, (const std::string& message), (override));
};

// Restores an environment variable on scope exit
class ScopedEnv {
public:
  ScopedEnv(const char* name, const char* value) : name_(name) {
    if (const char* old = std::getenv(name)) {
      previous_ = std::string(old);
    }
    if (value) {
      ::setenv(name, value, 1);
    } else {
      ::unsetenv(name);
    }
  }

  ~ScopedEnv() {
    if (previous_) {
      ::setenv(name_.c_str(), previous_->c_str(), 1);
    } else {
      ::unsetenv(name_.c_str());
    }
  }

private:
  std::string name_;
  std::optional<std::string> previous_;
};

} // namespace

class ProbeRunnerTest : public ::testing::Test {
protected:
  void SetUp() override {
    diskprobe::test_support::init_test_logging();
    dir = std::make_unique<TempDir>("probe_runner_test");
    config.target_dir = dir->path();
    config.chunk_count = 3;
    config.chunk_size = 1024;
    config.multiplexer_warning = false;
  }

  std::unique_ptr<TempDir> dir;
  ProbeConfig config;
  PatternRandomSource random;
  NullProgress progress;
  NullPrompt prompt;
};

TEST_F(ProbeRunnerTest, FullRunWritesAndVerifiesEveryChunk) {
  DirectoryChunkStore store(dir->path());
  ProbeRunner runner(config, store, random, progress, prompt);

  RunSummary summary = runner.run();

  EXPECT_TRUE(summary.complete());
  EXPECT_EQ(summary.written, 3u);
  EXPECT_EQ(summary.verified, 3u);
  EXPECT_EQ(summary.bytes_verified(), 3072u);

  for (const char* name : {"chk_00000.bin", "chk_00001.bin", "chk_00002.bin"}) {
    auto path = dir->path() / name;
    ASSERT_TRUE(std::filesystem::exists(path)) << name;
    EXPECT_EQ(std::filesystem::file_size(path), 1024u) << name;
  }
  EXPECT_FALSE(std::filesystem::exists(dir->path() / "chk_00003.bin"));
}

TEST_F(ProbeRunnerTest, ZeroChunksCompletesWithoutFiles) {
  config.chunk_count = 0;
  DirectoryChunkStore store(dir->path());
  RunSummary summary = ProbeRunner(config, store, random, progress, prompt).run();

  EXPECT_TRUE(summary.complete());
  EXPECT_TRUE(std::filesystem::is_empty(dir->path()));
}

TEST_F(ProbeRunnerTest, FullDeviceGivesPartialSuccess) {
  if (!std::filesystem::exists("/dev/full")) {
    GTEST_SKIP() << "/dev/full is not available";
  }
  config.chunk_count = 6;
  std::filesystem::create_symlink("/dev/full", dir->path() / "chk_00002.bin");

  DirectoryChunkStore store(dir->path());
  ProbeRunner runner(config, store, random, progress, prompt);
  RunSummary summary = runner.run();

  EXPECT_EQ(summary.written, 2u);
  EXPECT_EQ(summary.verified, 2u);
  EXPECT_FALSE(summary.complete());
  EXPECT_EQ(summary.describe_status(), "Partly done, some chunks have errors.");
  EXPECT_EQ(runner.state().exhausted_at, std::optional<size_t>(2));
  EXPECT_FALSE(std::filesystem::exists(
    std::filesystem::symlink_status(dir->path() / "chk_00002.bin")));
  EXPECT_FALSE(std::filesystem::exists(dir->path() / "chk_00003.bin"));
}

TEST_F(ProbeRunnerTest, WriteFailureSkipsVerification) {
  MockChunkStorage storage;
  EXPECT_CALL(storage, write_chunk(0, _)).WillOnce(Return(WriteOutcome::written()));
  EXPECT_CALL(storage, write_chunk(1, _))
    .WillOnce(Return(WriteOutcome::failed(std::error_code(EIO, std::generic_category()))));
  EXPECT_CALL(storage, digest_chunk(_)).Times(0);

  ProbeRunner runner(config, storage, random, progress, prompt);
  try {
    runner.run();
    FAIL() << "Expected WriteError";
  } catch (const WriteError& e) {
    EXPECT_EQ(e.index(), 1u);
  }
}

TEST_F(ProbeRunnerTest, CorruptionBetweenPhasesIsFatal) {
  MockChunkStorage storage;
  EXPECT_CALL(storage, write_chunk(_, _)).WillRepeatedly(Return(WriteOutcome::written()));
  EXPECT_CALL(storage, digest_chunk(_)).WillRepeatedly(Return(std::string(64, '0')));

  ProbeRunner runner(config, storage, random, progress, prompt);
  try {
    runner.run();
    FAIL() << "Expected VerificationMismatch";
  } catch (const VerificationMismatch& e) {
    EXPECT_EQ(e.index(), 0u);
  }
}

TEST_F(ProbeRunnerTest, ConfigErrorsPrecedeAnyWrite) {
  MockChunkStorage storage;
  EXPECT_CALL(storage, write_chunk(_, _)).Times(0);

  ProbeConfig missing_dir = config;
  missing_dir.target_dir = dir->path() / "missing";
  EXPECT_THROW(ProbeRunner(missing_dir, storage, random, progress, prompt).run(), ConfigError);

  ProbeConfig zero_size = config;
  zero_size.chunk_size = 0;
  EXPECT_THROW(ProbeRunner(zero_size, storage, random, progress, prompt).run(), ConfigError);

  ProbeConfig too_many = config;
  too_many.chunk_count = diskprobe::store::MAX_CHUNK_COUNT + 1;
  EXPECT_THROW(ProbeRunner(too_many, storage, random, progress, prompt).run(), ConfigError);
}

TEST_F(ProbeRunnerTest, PromptsOnceOutsideMultiplexer) {
  ScopedEnv tmux("TMUX", nullptr);
  ScopedEnv screen("STY", nullptr);
  config.multiplexer_warning = true;

  MockPrompt mock_prompt;
  EXPECT_CALL(mock_prompt, confirm("(press enter to continue)")).Times(1);

  DirectoryChunkStore store(dir->path());
  ProbeRunner(config, store, random, progress, mock_prompt).run();
}

TEST_F(ProbeRunnerTest, NoPromptInsideMultiplexerOrWhenSuppressed) {
  ScopedEnv screen("STY", nullptr);
  MockPrompt mock_prompt;
  EXPECT_CALL(mock_prompt, confirm(_)).Times(0);
  DirectoryChunkStore store(dir->path());

  {
    ScopedEnv tmux("TMUX", "/tmp/tmux-0/default,1,0");
    config.multiplexer_warning = true;
    ProbeRunner(config, store, random, progress, mock_prompt).run();
  }
  {
    ScopedEnv tmux("TMUX", nullptr);
    config.multiplexer_warning = false;
    ProbeRunner(config, store, random, progress, mock_prompt).run();
  }
}
