#include "flowqos/threads/overwrite-queue.h"

#include <string>
#include <thread>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace flowqos {
namespace {

TEST(OverwriteQueueTest, FifoBelowCapacity) {
  OverwriteQueue<int> q(4);
  EXPECT_EQ(q.Write(1), 0);
  EXPECT_EQ(q.Write(2), 0);
  EXPECT_EQ(q.Write(3), 0);
  EXPECT_EQ(q.size(), 3);
  EXPECT_EQ(q.TryRead(), std::optional<int>(1));
  EXPECT_EQ(q.TryRead(), std::optional<int>(2));
  EXPECT_EQ(q.TryRead(), std::optional<int>(3));
  EXPECT_EQ(q.TryRead(), std::nullopt);
}

TEST(OverwriteQueueTest, FullQueueDropsOldest) {
  OverwriteQueue<std::string> q(2);
  EXPECT_EQ(q.Write("a"), 0);
  EXPECT_EQ(q.Write("b"), 0);
  EXPECT_EQ(q.Write("c"), 1);
  EXPECT_EQ(q.Write("d"), 1);
  EXPECT_EQ(q.size(), 2);
  EXPECT_EQ(q.TryRead(), std::optional<std::string>("c"));
  EXPECT_EQ(q.TryRead(), std::optional<std::string>("d"));
}

TEST(OverwriteQueueTest, CloseDrainsThenEnds) {
  OverwriteQueue<int> q(3);
  q.Write(7);
  q.Close();
  EXPECT_TRUE(q.closed());
  EXPECT_EQ(q.Write(8), 0);
  EXPECT_EQ(q.Read(), std::optional<int>(7));
  EXPECT_EQ(q.Read(), std::nullopt);
}

TEST(OverwriteQueueTest, ReadWithTimeoutExpires) {
  OverwriteQueue<int> q(1);
  absl::Time start = absl::Now();
  EXPECT_EQ(q.ReadWithTimeout(absl::Milliseconds(20)), std::nullopt);
  EXPECT_GE(absl::Now() - start, absl::Milliseconds(15));
}

TEST(OverwriteQueueTest, ReadBlocksUntilWrite) {
  OverwriteQueue<int> q(1);
  std::thread writer([&q] {
    absl::SleepFor(absl::Milliseconds(10));
    q.Write(42);
  });
  EXPECT_EQ(q.Read(), std::optional<int>(42));
  writer.join();
}

TEST(OverwriteQueueTest, WriterNeverBlocksOnSlowReader) {
  OverwriteQueue<int> q(8);
  int dropped = 0;
  for (int i = 0; i < 1000; ++i) {
    dropped += q.Write(i);
  }
  EXPECT_EQ(dropped, 992);
  for (int i = 992; i < 1000; ++i) {
    EXPECT_EQ(q.TryRead(), std::optional<int>(i));
  }
}

}  // namespace
}  // namespace flowqos
