#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include "crypto/hasher.hpp"
#include "probe/verify_phase.hpp"
#include "probe/write_phase.hpp"
#include "test_utils.hpp"

using namespace diskprobe::probe;
using diskprobe::store::DirectoryChunkStore;
using diskprobe::store::StoreError;
using diskprobe::test_support::MockChunkStorage;
using diskprobe::test_support::PatternRandomSource;
using diskprobe::test_support::TempDir;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

namespace {

RunState state_with_records(size_t requested, uint64_t chunk_size, size_t written) {
  RunState state(requested, chunk_size);
  for (size_t i = 0; i < written; ++i) {
    state.records.push_back({i, "hash-" + std::to_string(i)});
  }
  return state;
}

} // namespace

class VerifyPhaseTest : public ::testing::Test {
protected:
  void SetUp() override {
    diskprobe::test_support::init_test_logging();
  }

  MockChunkStorage storage;
  NullProgress progress;
};

TEST_F(VerifyPhaseTest, VerifiesOnlyWrittenChunks) {
  RunState state = state_with_records(10, 8, 3);
  EXPECT_CALL(storage, digest_chunk(0)).WillOnce(Return("hash-0"));
  EXPECT_CALL(storage, digest_chunk(1)).WillOnce(Return("hash-1"));
  EXPECT_CALL(storage, digest_chunk(2)).WillOnce(Return("hash-2"));
  EXPECT_CALL(storage, digest_chunk(3)).Times(0);

  VerifyPhase(storage, progress).run(state);

  EXPECT_EQ(state.files_verified, 3u);
  EXPECT_EQ(state.bytes_verified(), 24u);
}

TEST_F(VerifyPhaseTest, NothingWrittenNothingVerified) {
  RunState state = state_with_records(5, 8, 0);
  EXPECT_CALL(storage, digest_chunk(_)).Times(0);

  VerifyPhase(storage, progress).run(state);
  EXPECT_EQ(state.files_verified, 0u);
}

TEST_F(VerifyPhaseTest, MismatchIsFatalAndNamesChunk) {
  RunState state = state_with_records(4, 8, 4);
  EXPECT_CALL(storage, digest_chunk(0)).WillOnce(Return("hash-0"));
  EXPECT_CALL(storage, digest_chunk(1)).WillOnce(Return("corrupted"));
  EXPECT_CALL(storage, digest_chunk(2)).Times(0);

  try {
    VerifyPhase(storage, progress).run(state);
    FAIL() << "Expected VerificationMismatch";
  } catch (const VerificationMismatch& e) {
    EXPECT_EQ(e.index(), 1u);
    EXPECT_EQ(e.expected(), "hash-1");
    EXPECT_EQ(e.actual(), "corrupted");
    EXPECT_STREQ(e.what(), "Verification failed for chunk #00001");
  }
  EXPECT_EQ(state.files_verified, 1u);
}

TEST_F(VerifyPhaseTest, UnreadableChunkIsReadError) {
  RunState state = state_with_records(2, 8, 2);
  EXPECT_CALL(storage, digest_chunk(0)).WillOnce(Throw(StoreError("Failed to open file: chk_00000.bin")));

  try {
    VerifyPhase(storage, progress).run(state);
    FAIL() << "Expected ReadError";
  } catch (const ReadError& e) {
    EXPECT_EQ(e.index(), 0u);
    EXPECT_NE(std::string(e.what()).find("chunk #00000"), std::string::npos) << e.what();
  }
}

class VerifyPhaseDiskTest : public ::testing::Test {
protected:
  void SetUp() override {
    diskprobe::test_support::init_test_logging();
    dir = std::make_unique<TempDir>("verify_phase_test");
    store = std::make_unique<DirectoryChunkStore>(dir->path());

    state = RunState(5, 4096);
    WritePhase(*store, random, progress).run(state);
    ASSERT_EQ(state.files_written(), 5u);
  }

  std::unique_ptr<TempDir> dir;
  std::unique_ptr<DirectoryChunkStore> store;
  PatternRandomSource random;
  NullProgress progress;
  RunState state;
};

TEST_F(VerifyPhaseDiskTest, IntactChunksVerify) {
  VerifyPhase(*store, progress).run(state);
  EXPECT_EQ(state.files_verified, 5u);
}

TEST_F(VerifyPhaseDiskTest, DetectsFlippedByte) {
  diskprobe::test_support::overwrite_byte(store->chunk_path(3), 100);

  try {
    VerifyPhase(*store, progress).run(state);
    FAIL() << "Expected VerificationMismatch";
  } catch (const VerificationMismatch& e) {
    EXPECT_EQ(e.index(), 3u);
  }
  EXPECT_EQ(state.files_verified, 3u);
}

TEST_F(VerifyPhaseDiskTest, DetectsTruncation) {
  std::filesystem::resize_file(store->chunk_path(2), 4000);
  EXPECT_THROW(VerifyPhase(*store, progress).run(state), VerificationMismatch);
}

TEST_F(VerifyPhaseDiskTest, DetectsDeletedChunk) {
  std::filesystem::remove(store->chunk_path(4));
  try {
    VerifyPhase(*store, progress).run(state);
    FAIL() << "Expected ReadError";
  } catch (const ReadError& e) {
    EXPECT_EQ(e.index(), 4u);
  }
}
