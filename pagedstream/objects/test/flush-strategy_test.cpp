#include "pagedstream/flush-strategy.hpp"

#include <gtest/gtest.h>

#include <optional>

namespace pagedstream {

TEST(FlushStrategy, ItemsPerFlushDependsOnTotalCount) {
  EXPECT_EQ(FlushStrategy::ItemsPerFlush(std::nullopt), 100U);
  EXPECT_EQ(FlushStrategy::ItemsPerFlush(0), 200U);
  EXPECT_EQ(FlushStrategy::ItemsPerFlush(999), 200U);
  EXPECT_EQ(FlushStrategy::ItemsPerFlush(1000), 100U);
  EXPECT_EQ(FlushStrategy::ItemsPerFlush(9999), 100U);
  EXPECT_EQ(FlushStrategy::ItemsPerFlush(10000), 50U);
  EXPECT_EQ(FlushStrategy::ItemsPerFlush(99999), 50U);
  EXPECT_EQ(FlushStrategy::ItemsPerFlush(100000), 25U);
}

TEST(FlushStrategy, FlushesEveryNItems) {
  FlushStrategy strategy(200000, 1UL << 20);
  int nbFlushes = 0;
  for (int i = 0; i < 100; ++i) {
    if (strategy.onItem(10)) {
      ++nbFlushes;
    }
  }
  EXPECT_EQ(nbFlushes, 4);
  EXPECT_EQ(strategy.nbPendingBytes(), 0U);
}

TEST(FlushStrategy, FlushesWhenTooManyBytesArePending) {
  FlushStrategy strategy(std::nullopt, 100);
  EXPECT_FALSE(strategy.onItem(60));
  EXPECT_EQ(strategy.nbPendingBytes(), 60U);
  EXPECT_TRUE(strategy.onItem(60));
  EXPECT_EQ(strategy.nbPendingBytes(), 0U);
}

}  // namespace pagedstream
