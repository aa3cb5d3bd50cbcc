#include "flowqos/alg/qos-allocator.h"

#include "absl/random/random.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "flowqos/proto/parse-text.h"
#include "flowqos/proto/testing.h"

namespace flowqos {
namespace {

std::vector<proto::QosRule> StandardRules() {
  return {
      ParseTextProto<proto::QosRule>(R"(
        traffic_class: TC_BACKGROUND
        priority: 0
        min_bandwidth_mbps: 0
        max_bandwidth_mbps: 20
        enabled: true
      )"),
      ParseTextProto<proto::QosRule>(R"(
        traffic_class: TC_FILE
        priority: 1
        min_bandwidth_mbps: 0.5
        max_bandwidth_mbps: 30
        enabled: true
      )"),
      ParseTextProto<proto::QosRule>(R"(
        traffic_class: TC_VOICE
        priority: 3
        min_bandwidth_mbps: 0.1
        max_bandwidth_mbps: 10
        dscp: 46
        enabled: true
      )"),
      ParseTextProto<proto::QosRule>(R"(
        traffic_class: TC_VIDEO
        priority: 3
        min_bandwidth_mbps: 5
        max_bandwidth_mbps: 50
        dscp: 34
        enabled: true
      )"),
  };
}

std::map<proto::TrafficClass, double> StandardDemand() {
  return {
      {proto::TC_VIDEO, 40},
      {proto::TC_VOICE, 2},
      {proto::TC_FILE, 25},
      {proto::TC_BACKGROUND, 30},
  };
}

const proto::AllocationResult& ResultFor(const AllocationOutput& out,
                                         proto::TrafficClass c) {
  for (const proto::AllocationResult& r : out.results) {
    if (r.traffic_class() == c) {
      return r;
    }
  }
  ADD_FAILURE() << "no result for class " << c;
  return proto::AllocationResult::default_instance();
}

double SumAllocated(const AllocationOutput& out) {
  double sum = 0;
  for (const proto::AllocationResult& r : out.results) {
    sum += r.allocated_mbps();
  }
  return sum;
}

TEST(QosAllocatorTest, AmpleBudget) {
  QosAllocator allocator;
  AllocationOutput out = allocator.Allocate(StandardDemand(), StandardRules(), 100);

  ASSERT_EQ(out.results.size(), 4);
  EXPECT_EQ(out.results[0].traffic_class(), proto::TC_VIDEO);
  EXPECT_EQ(out.results[1].traffic_class(), proto::TC_VOICE);
  EXPECT_EQ(out.results[2].traffic_class(), proto::TC_FILE);
  EXPECT_EQ(out.results[3].traffic_class(), proto::TC_BACKGROUND);

  EXPECT_NEAR(ResultFor(out, proto::TC_VIDEO).allocated_mbps(), 48, 1e-9);
  EXPECT_NEAR(ResultFor(out, proto::TC_VOICE).allocated_mbps(), 2.4, 1e-9);
  EXPECT_NEAR(ResultFor(out, proto::TC_FILE).allocated_mbps(), 25, 1e-9);
  EXPECT_NEAR(ResultFor(out, proto::TC_BACKGROUND).allocated_mbps(), 20, 1e-9);
  for (const proto::AllocationResult& r : out.results) {
    EXPECT_TRUE(r.satisfied_min()) << r.DebugString();
    EXPECT_TRUE(r.has_rule());
  }
  EXPECT_NEAR(ResultFor(out, proto::TC_BACKGROUND).throttled_mbps(), 10, 1e-9);
  EXPECT_NEAR(ResultFor(out, proto::TC_VIDEO).throttled_mbps(), 0, 1e-9);

  EXPECT_LE(SumAllocated(out), 100);
  EXPECT_NEAR(out.summary.total_allocated_mbps(), 95.4, 1e-9);
  EXPECT_NEAR(out.summary.remaining_mbps(), 4.6, 1e-9);
  EXPECT_DOUBLE_EQ(out.summary.utilization_percent(), 95.4);
  EXPECT_EQ(out.summary.total_budget_mbps(), 100);
}

TEST(QosAllocatorTest, ScarceBudget) {
  QosAllocator allocator;
  AllocationOutput out = allocator.Allocate(StandardDemand(), StandardRules(), 3);

  const proto::AllocationResult& video = ResultFor(out, proto::TC_VIDEO);
  EXPECT_DOUBLE_EQ(video.allocated_mbps(), 3);
  EXPECT_TRUE(video.satisfied_min());

  const proto::AllocationResult& voice = ResultFor(out, proto::TC_VOICE);
  EXPECT_EQ(voice.allocated_mbps(), 0);
  EXPECT_FALSE(voice.satisfied_min());

  const proto::AllocationResult& file = ResultFor(out, proto::TC_FILE);
  EXPECT_EQ(file.allocated_mbps(), 0);
  EXPECT_FALSE(file.satisfied_min());

  const proto::AllocationResult& background = ResultFor(out, proto::TC_BACKGROUND);
  EXPECT_EQ(background.allocated_mbps(), 0);
  EXPECT_TRUE(background.satisfied_min());

  EXPECT_DOUBLE_EQ(out.summary.utilization_percent(), 100);
}

TEST(QosAllocatorTest, ZeroBudget) {
  QosAllocator allocator;
  AllocationOutput out = allocator.Allocate(StandardDemand(), StandardRules(), 0);
  for (const proto::AllocationResult& r : out.results) {
    EXPECT_EQ(r.allocated_mbps(), 0);
  }
  EXPECT_TRUE(ResultFor(out, proto::TC_VIDEO).satisfied_min());
  EXPECT_EQ(out.summary.utilization_percent(), 0);
}

TEST(QosAllocatorTest, GrowthNeverShrinksReservation) {
  QosAllocator allocator;
  AllocationOutput out = allocator.Allocate({{proto::TC_VIDEO, 1}}, StandardRules(), 100);
  EXPECT_DOUBLE_EQ(ResultFor(out, proto::TC_VIDEO).allocated_mbps(), 5);
  EXPECT_DOUBLE_EQ(ResultFor(out, proto::TC_VOICE).allocated_mbps(), 0.1);
  EXPECT_DOUBLE_EQ(ResultFor(out, proto::TC_FILE).allocated_mbps(), 0.5);
  // Leftover capacity goes to background even without demand.
  EXPECT_DOUBLE_EQ(ResultFor(out, proto::TC_BACKGROUND).allocated_mbps(), 20);
}

TEST(QosAllocatorTest, ClassWithoutRuleGetsNothing) {
  QosAllocator allocator;
  std::vector<proto::QosRule> rules = StandardRules();
  rules.erase(rules.begin() + 1);  // file

  AllocationOutput out = allocator.Allocate(StandardDemand(), rules, 100);
  ASSERT_EQ(out.results.size(), 4);
  const proto::AllocationResult& file = out.results.back();
  EXPECT_EQ(file.traffic_class(), proto::TC_FILE);
  EXPECT_FALSE(file.has_rule());
  EXPECT_EQ(file.allocated_mbps(), 0);
  EXPECT_EQ(file.throttled_mbps(), 25);
  EXPECT_EQ(file.requested_mbps(), 25);
}

TEST(QosAllocatorTest, DisabledRuleGetsNothingButIsSatisfied) {
  QosAllocator allocator;
  std::vector<proto::QosRule> rules = StandardRules();
  rules[3].set_enabled(false);  // video

  AllocationOutput out = allocator.Allocate(StandardDemand(), rules, 100);
  const proto::AllocationResult& video = ResultFor(out, proto::TC_VIDEO);
  EXPECT_EQ(video.allocated_mbps(), 0);
  EXPECT_TRUE(video.satisfied_min());
  EXPECT_TRUE(video.has_rule());
  EXPECT_EQ(out.results.back().traffic_class(), proto::TC_VIDEO);
}

TEST(QosAllocatorTest, LeftoverSplitFairlyAmongLowestPriority) {
  std::vector<proto::QosRule> rules = {
      ParseTextProto<proto::QosRule>(R"(
        traffic_class: TC_FILE priority: 0 min_bandwidth_mbps: 0
        max_bandwidth_mbps: 4 enabled: true
      )"),
      ParseTextProto<proto::QosRule>(R"(
        traffic_class: TC_BACKGROUND priority: 0 min_bandwidth_mbps: 1
        max_bandwidth_mbps: 30 enabled: true
      )"),
  };
  QosAllocator allocator;
  AllocationOutput out = allocator.Allocate({}, rules, 13);
  EXPECT_DOUBLE_EQ(ResultFor(out, proto::TC_FILE).allocated_mbps(), 4);
  EXPECT_DOUBLE_EQ(ResultFor(out, proto::TC_BACKGROUND).allocated_mbps(), 9);
}

TEST(QosAllocatorTest, Deterministic) {
  QosAllocator allocator;
  std::vector<proto::QosRule> rules = StandardRules();
  AllocationOutput a = allocator.Allocate(StandardDemand(), rules, 57.3);
  std::reverse(rules.begin(), rules.end());
  AllocationOutput b = allocator.Allocate(StandardDemand(), rules, 57.3);
  QosAllocator other;
  AllocationOutput c = other.Allocate(StandardDemand(), StandardRules(), 57.3);

  ASSERT_EQ(a.results.size(), b.results.size());
  for (size_t i = 0; i < a.results.size(); ++i) {
    EXPECT_EQ(a.results[i].SerializeAsString(), b.results[i].SerializeAsString());
    EXPECT_EQ(a.results[i].SerializeAsString(), c.results[i].SerializeAsString());
  }
  EXPECT_EQ(a.summary.SerializeAsString(), c.summary.SerializeAsString());
}

TEST(QosAllocatorTest, RandomizedConservationAndPriorityMonotonicity) {
  absl::BitGen gen;
  QosAllocator allocator;
  for (int iter = 0; iter < 500; ++iter) {
    std::vector<proto::QosRule> rules;
    std::map<proto::TrafficClass, double> demand;
    for (proto::TrafficClass c : {proto::TC_VIDEO, proto::TC_VOICE, proto::TC_FILE,
                                  proto::TC_BACKGROUND}) {
      proto::QosRule r;
      r.set_traffic_class(c);
      r.set_priority(absl::Uniform(gen, 0, 4));
      r.set_min_bandwidth_mbps(absl::Uniform(gen, 0.0, 20.0));
      r.set_max_bandwidth_mbps(r.min_bandwidth_mbps() + absl::Uniform(gen, 0.0, 50.0));
      r.set_enabled(true);
      rules.push_back(r);
      demand[c] = absl::Uniform(gen, 0.0, 80.0);
    }
    const double budget = absl::Uniform(gen, 0.0, 120.0);
    AllocationOutput out = allocator.Allocate(demand, rules, budget);
    SCOPED_TRACE(testing::Message() << "iter = " << iter << " budget = " << budget);

    EXPECT_LE(SumAllocated(out), budget + 1e-6);

    for (const proto::AllocationResult& hi : out.results) {
      for (const proto::AllocationResult& lo : out.results) {
        const proto::QosRule* hi_rule = nullptr;
        const proto::QosRule* lo_rule = nullptr;
        for (const proto::QosRule& r : rules) {
          if (r.traffic_class() == hi.traffic_class()) hi_rule = &r;
          if (r.traffic_class() == lo.traffic_class()) lo_rule = &r;
        }
        // A lower class that actually needed a minimum and got it implies
        // every higher class got its own.
        if (hi_rule->priority() > lo_rule->priority() && lo.satisfied_min() &&
            lo_rule->min_bandwidth_mbps() > 1e-6) {
          EXPECT_TRUE(hi.satisfied_min());
        }
      }
    }
  }
}

}  // namespace
}  // namespace flowqos
