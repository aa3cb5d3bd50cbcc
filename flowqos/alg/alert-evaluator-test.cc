#include "flowqos/alg/alert-evaluator.h"

#include <algorithm>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "flowqos/alg/qos-allocator.h"
#include "flowqos/proto/parse-text.h"

namespace flowqos {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::SizeIs;

const absl::Time kNow = absl::FromUnixSeconds(1'700'000'000);

std::vector<proto::QosRule> StandardRules() {
  return {
      ParseTextProto<proto::QosRule>(R"(
        traffic_class: TC_VIDEO priority: 3
        min_bandwidth_mbps: 5 max_bandwidth_mbps: 50 enabled: true
      )"),
      ParseTextProto<proto::QosRule>(R"(
        traffic_class: TC_VOICE priority: 3
        min_bandwidth_mbps: 0.1 max_bandwidth_mbps: 10 enabled: true
      )"),
      ParseTextProto<proto::QosRule>(R"(
        traffic_class: TC_FILE priority: 1
        min_bandwidth_mbps: 0.5 max_bandwidth_mbps: 30 enabled: true
      )"),
      ParseTextProto<proto::QosRule>(R"(
        traffic_class: TC_BACKGROUND priority: 0
        min_bandwidth_mbps: 0 max_bandwidth_mbps: 20 enabled: true
      )"),
  };
}

int CountSeverity(const std::vector<proto::Alert>& alerts, proto::AlertSeverity s) {
  return std::count_if(alerts.begin(), alerts.end(),
                       [s](const proto::Alert& a) { return a.severity() == s; });
}

TEST(DeriveAlertsTest, ScarceBudgetRaisesOneCriticalAndOneWarning) {
  QosAllocator allocator;
  std::vector<proto::QosRule> rules = StandardRules();
  AllocationOutput out = allocator.Allocate(
      {
          {proto::TC_VIDEO, 40},
          {proto::TC_VOICE, 2},
          {proto::TC_FILE, 25},
          {proto::TC_BACKGROUND, 30},
      },
      rules, 3);

  std::vector<proto::Alert> alerts = DeriveAlerts(kNow, out.results, rules, {}, {});
  ASSERT_THAT(alerts, SizeIs(2));
  EXPECT_EQ(CountSeverity(alerts, proto::AS_CRITICAL), 1);
  EXPECT_EQ(CountSeverity(alerts, proto::AS_WARNING), 1);
  EXPECT_EQ(alerts[0].severity(), proto::AS_CRITICAL);
  EXPECT_EQ(alerts[0].title(), "Minimum bandwidth not met for voice");
  EXPECT_EQ(alerts[1].severity(), proto::AS_WARNING);
  EXPECT_EQ(alerts[1].title(), "Minimum bandwidth not met for file");
  EXPECT_FALSE(alerts[0].resolved());
  EXPECT_FALSE(alerts[0].has_related_flow_id());
}

TEST(DeriveAlertsTest, AmpleBudgetRaisesNothing) {
  QosAllocator allocator;
  std::vector<proto::QosRule> rules = StandardRules();
  AllocationOutput out = allocator.Allocate({{proto::TC_VIDEO, 40}}, rules, 100);
  EXPECT_THAT(DeriveAlerts(kNow, out.results, rules, {}, {}), IsEmpty());
}

TEST(DeriveAlertsTest, NewFlowWithoutRuleIsInfo) {
  std::vector<proto::QosRule> rules = StandardRules();
  rules.pop_back();  // background
  proto::Flow bg = ParseTextProto<proto::Flow>(R"(
    id: 12 source_endpoint: "10.0.0.1" dest_endpoint: "10.0.0.2"
    traffic_class: TC_BACKGROUND
  )");
  proto::Flow video = ParseTextProto<proto::Flow>(R"(
    id: 13 source_endpoint: "10.0.0.1" dest_endpoint: "10.0.0.3"
    traffic_class: TC_VIDEO
  )");
  std::vector<proto::Alert> alerts = DeriveAlerts(kNow, {}, rules, {}, {bg, video});
  ASSERT_THAT(alerts, SizeIs(1));
  EXPECT_EQ(alerts[0].severity(), proto::AS_INFO);
  EXPECT_EQ(alerts[0].related_flow_id(), 12);
}

TEST(SustainedOverDemandTrackerTest, NeedsThreeConsecutiveTicks) {
  SustainedOverDemandTracker tracker;
  auto over = ParseTextProto<proto::AllocationResult>(R"(
    traffic_class: TC_FILE requested_mbps: 25 allocated_mbps: 10
  )");
  auto fine = ParseTextProto<proto::AllocationResult>(R"(
    traffic_class: TC_FILE requested_mbps: 20 allocated_mbps: 10
  )");
  EXPECT_THAT(tracker.Update({over}), IsEmpty());
  EXPECT_THAT(tracker.Update({over}), IsEmpty());
  EXPECT_THAT(tracker.Update({fine}), IsEmpty());
  EXPECT_THAT(tracker.Update({over}), IsEmpty());
  EXPECT_THAT(tracker.Update({over}), IsEmpty());
  EXPECT_THAT(tracker.Update({over}), ElementsAre(proto::TC_FILE));
  EXPECT_THAT(tracker.Update({over}), ElementsAre(proto::TC_FILE));

  std::vector<proto::Alert> alerts =
      DeriveAlerts(kNow, {over}, StandardRules(), {proto::TC_FILE}, {});
  ASSERT_THAT(alerts, SizeIs(1));
  EXPECT_EQ(alerts[0].severity(), proto::AS_WARNING);
  EXPECT_EQ(alerts[0].title(), "Sustained over-demand for file");
}

TEST(AlertBookTest, DeduplicatesWithinCooldown) {
  AlertBook book(absl::Seconds(60));
  proto::Alert a = MakeAlert(proto::AS_CRITICAL, "t", "m", kNow);

  AlertBook::Changes c = book.Update(kNow, {a});
  EXPECT_THAT(c.raised, SizeIs(1));
  EXPECT_EQ(book.num_active(), 1);

  for (int i = 1; i < 60; ++i) {
    c = book.Update(kNow + absl::Seconds(i), {a});
    EXPECT_TRUE(c.empty()) << "i = " << i;
  }
  // Re-emitted once the cool-down has passed.
  c = book.Update(kNow + absl::Seconds(60), {a});
  EXPECT_THAT(c.raised, SizeIs(1));
  EXPECT_EQ(book.num_active(), 1);
}

TEST(AlertBookTest, DifferentFlowsAreDifferentKeys) {
  AlertBook book(absl::Seconds(60));
  AlertBook::Changes c = book.Update(
      kNow, {MakeAlert(proto::AS_INFO, "t", "m", kNow, 1),
             MakeAlert(proto::AS_INFO, "t", "m", kNow, 2),
             MakeAlert(proto::AS_INFO, "t", "m", kNow),
             MakeAlert(proto::AS_WARNING, "t", "m", kNow, 1)});
  EXPECT_THAT(c.raised, SizeIs(4));
  EXPECT_EQ(book.num_active(), 4);
}

TEST(AlertBookTest, ResolvesAfterQuietCooldown) {
  AlertBook book(absl::Seconds(60));
  proto::Alert a = MakeAlert(proto::AS_WARNING, "t", "m", kNow);
  book.Update(kNow, {a});
  book.Update(kNow + absl::Seconds(10), {a});

  AlertBook::Changes c = book.Update(kNow + absl::Seconds(69), {});
  EXPECT_TRUE(c.empty());
  c = book.Update(kNow + absl::Seconds(70), {});
  ASSERT_THAT(c.resolved, SizeIs(1));
  EXPECT_TRUE(c.resolved[0].resolved());
  EXPECT_EQ(c.resolved[0].title(), "t");
  EXPECT_EQ(book.num_active(), 0);

  // Raising it again starts a fresh alert.
  c = book.Update(kNow + absl::Seconds(71), {a});
  EXPECT_THAT(c.raised, SizeIs(1));
}

TEST(AlertBookTest, ActiveOrderedBySeverityThenAge) {
  AlertBook book(absl::Seconds(60));
  book.Update(kNow, {MakeAlert(proto::AS_INFO, "a", "", kNow)});
  book.Update(kNow + absl::Seconds(1), {MakeAlert(proto::AS_WARNING, "b", "", kNow)});
  book.Update(kNow + absl::Seconds(2), {MakeAlert(proto::AS_CRITICAL, "c", "", kNow),
                                        MakeAlert(proto::AS_WARNING, "d", "", kNow)});
  std::vector<proto::Alert> active = book.Active();
  ASSERT_THAT(active, SizeIs(4));
  EXPECT_EQ(active[0].title(), "c");
  EXPECT_EQ(active[1].title(), "b");
  EXPECT_EQ(active[2].title(), "d");
  EXPECT_EQ(active[3].title(), "a");
  EXPECT_NE(book.FindActive(MakeAlert(proto::AS_WARNING, "d", "", kNow)), nullptr);
  EXPECT_EQ(book.FindActive(MakeAlert(proto::AS_INFO, "d", "", kNow)), nullptr);
}

}  // namespace
}  // namespace flowqos
