#include "flowqos/threads/deadline-runner.h"

#include <atomic>

#include "absl/synchronization/notification.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace flowqos {
namespace {

TEST(DeadlineRunnerTest, ReturnsResult) {
  DeadlineRunner runner("test");
  absl::StatusOr<int> got =
      runner.Run<int>(absl::Seconds(5), []() -> absl::StatusOr<int> { return 17; });
  ASSERT_TRUE(got.ok());
  EXPECT_EQ(*got, 17);
}

TEST(DeadlineRunnerTest, PropagatesError) {
  DeadlineRunner runner("test");
  absl::Status st = runner.RunStatus(
      absl::Seconds(5), [] { return absl::UnavailableError("store down"); });
  EXPECT_EQ(st.code(), absl::StatusCode::kUnavailable);
}

TEST(DeadlineRunnerTest, TimesOutSlowCall) {
  DeadlineRunner runner("test");
  auto release = std::make_shared<absl::Notification>();
  absl::Time start = absl::Now();
  absl::StatusOr<int> got =
      runner.Run<int>(absl::Milliseconds(30), [release]() -> absl::StatusOr<int> {
        release->WaitForNotification();
        return 1;
      });
  EXPECT_EQ(got.status().code(), absl::StatusCode::kDeadlineExceeded);
  EXPECT_LT(absl::Now() - start, absl::Seconds(2));
  EXPECT_EQ(runner.num_abandoned(), 1);
  release->Notify();
}

TEST(DeadlineRunnerTest, SkipsCallsAbandonedBeforeStart) {
  DeadlineRunner runner("test");
  auto release = std::make_shared<absl::Notification>();
  auto second_ran = std::make_shared<std::atomic<bool>>(false);

  EXPECT_FALSE(runner
                   .RunStatus(absl::Milliseconds(10),
                              [release] {
                                release->WaitForNotification();
                                return absl::OkStatus();
                              })
                   .ok());
  EXPECT_FALSE(runner
                   .RunStatus(absl::Milliseconds(10),
                              [second_ran] {
                                second_ran->store(true);
                                return absl::OkStatus();
                              })
                   .ok());
  release->Notify();

  // The runner is usable again once the slow call finishes.
  EXPECT_TRUE(runner.RunStatus(absl::Seconds(5), [] { return absl::OkStatus(); }).ok());
  EXPECT_FALSE(second_ran->load());
}

}  // namespace
}  // namespace flowqos
