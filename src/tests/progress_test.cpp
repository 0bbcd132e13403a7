#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include "probe/progress.hpp"

using namespace diskprobe::probe;

TEST(ProgressTest, RendersCountsAndPercentage) {
  std::ostringstream out;
  TerminalProgressBar bar(out);

  bar.start(4, 0);
  bar.update(1);
  EXPECT_NE(out.str().find("25% | ETA:"), std::string::npos) << out.str();
  EXPECT_NE(out.str().find("1/4"), std::string::npos);

  bar.update(4);
  EXPECT_NE(out.str().find("100%"), std::string::npos);
  EXPECT_NE(out.str().find("4/4"), std::string::npos);
  bar.stop();
  EXPECT_EQ(out.str().back(), '\n');
}

TEST(ProgressTest, EmptyPhaseRendersComplete) {
  std::ostringstream out;
  TerminalProgressBar bar(out);
  bar.start(0, 0);
  EXPECT_NE(out.str().find("100%"), std::string::npos);
  EXPECT_NE(out.str().find("0/0"), std::string::npos);
}

TEST(ProgressTest, StopIsIdempotentAndUpdateIgnoredWhenStopped) {
  std::ostringstream out;
  TerminalProgressBar bar(out);

  bar.stop();
  EXPECT_TRUE(out.str().empty());

  bar.start(2, 0);
  bar.stop();
  bar.stop();
  const std::string after_stop = out.str();
  bar.update(2);
  EXPECT_EQ(out.str(), after_stop);
  EXPECT_FALSE(bar.active());
}

TEST(ProgressTest, ScopeStopsOnException) {
  std::ostringstream out;
  TerminalProgressBar bar(out);

  try {
    ProgressScope scope(bar, 10);
    EXPECT_TRUE(bar.active());
    throw std::runtime_error("boom");
  } catch (const std::runtime_error&) {
  }
  EXPECT_FALSE(bar.active());
}
