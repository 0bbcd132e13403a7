#include <gtest/gtest.h>
#include "crypto/random_source.hpp"

using namespace diskprobe::crypto;

TEST(RandomSourceTest, GeneratesRequestedSize) {
  RandomSource random;
  EXPECT_EQ(random.generate(1).size(), 1u);
  EXPECT_EQ(random.generate(4096).size(), 4096u);
  EXPECT_EQ(random.generate(3 * 1024 * 1024 + 17).size(), 3u * 1024 * 1024 + 17);
}

TEST(RandomSourceTest, ZeroSizeIsEmpty) {
  RandomSource random;
  EXPECT_TRUE(random.generate(0).empty());
}

TEST(RandomSourceTest, SuccessiveBuffersDiffer) {
  RandomSource random;
  auto first = random.generate(64);
  auto second = random.generate(64);
  EXPECT_NE(first, second);
  EXPECT_NE(first, std::vector<uint8_t>(64, 0));
}
