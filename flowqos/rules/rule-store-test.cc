#include "flowqos/rules/rule-store.h"

#include <limits>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "flowqos/proto/testing.h"

namespace flowqos {
namespace {

proto::QosRule Rule(proto::TrafficClass c, int priority, double min, double max) {
  proto::QosRule r;
  r.set_traffic_class(c);
  r.set_priority(priority);
  r.set_min_bandwidth_mbps(min);
  r.set_max_bandwidth_mbps(max);
  r.set_enabled(true);
  return r;
}

TEST(RuleStoreTest, GetRulesOrdersByPriorityThenClass) {
  RuleStore store;
  ASSERT_TRUE(store
                  .LoadRules({
                      Rule(proto::TC_BACKGROUND, 0, 0, 20),
                      Rule(proto::TC_FILE, 1, 0.5, 30),
                      Rule(proto::TC_VOICE, 3, 0.1, 10),
                      Rule(proto::TC_VIDEO, 3, 5, 50),
                  })
                  .ok());
  std::vector<proto::QosRule> rules = store.GetRules();
  ASSERT_EQ(rules.size(), 4);
  EXPECT_EQ(rules[0].traffic_class(), proto::TC_VIDEO);
  EXPECT_EQ(rules[1].traffic_class(), proto::TC_VOICE);
  EXPECT_EQ(rules[2].traffic_class(), proto::TC_FILE);
  EXPECT_EQ(rules[3].traffic_class(), proto::TC_BACKGROUND);
}

TEST(RuleStoreTest, SetRuleUpserts) {
  RuleStore store;
  ASSERT_TRUE(store.SetRule(Rule(proto::TC_FILE, 1, 0.5, 30)).ok());
  ASSERT_TRUE(store.SetRule(Rule(proto::TC_BACKGROUND, 0, 0, 20)).ok());
  ASSERT_TRUE(store.SetRule(Rule(proto::TC_FILE, 2, 1, 40)).ok());

  std::vector<proto::QosRule> rules = store.GetRules();
  ASSERT_EQ(rules.size(), 2);
  EXPECT_THAT(rules[0], EqProto(Rule(proto::TC_FILE, 2, 1, 40)));
  EXPECT_EQ(store.version(), 3);
}

TEST(RuleStoreTest, RejectsInvalidRuleAndKeepsPrior) {
  RuleStore store;
  ASSERT_TRUE(store.SetRule(Rule(proto::TC_VIDEO, 3, 5, 50)).ok());

  EXPECT_EQ(store.SetRule(Rule(proto::TC_VIDEO, 3, 60, 50)).code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(store.SetRule(Rule(proto::TC_VIDEO, 4, 5, 50)).code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(store.SetRule(Rule(proto::TC_UNKNOWN, 0, 0, 1)).code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(store.SetRule(Rule(proto::TC_VOICE, 3, -1, 1)).code(),
            absl::StatusCode::kInvalidArgument);
  proto::QosRule bad_dscp = Rule(proto::TC_VOICE, 3, 0, 1);
  bad_dscp.set_dscp(64);
  EXPECT_EQ(store.SetRule(bad_dscp).code(), absl::StatusCode::kInvalidArgument);

  ASSERT_EQ(store.GetRules().size(), 1);
  EXPECT_THAT(store.GetRules()[0], EqProto(Rule(proto::TC_VIDEO, 3, 5, 50)));
}

TEST(RuleStoreTest, RejectsNonFiniteBandwidths) {
  constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
  constexpr double kInf = std::numeric_limits<double>::infinity();
  RuleStore store;
  ASSERT_TRUE(store.SetRule(Rule(proto::TC_VOICE, 3, 5, 10)).ok());

  EXPECT_EQ(store.SetRule(Rule(proto::TC_VOICE, 3, kNaN, 50)).code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(store.SetRule(Rule(proto::TC_VOICE, 3, 5, kNaN)).code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(store.SetRule(Rule(proto::TC_VIDEO, 2, 5, kInf)).code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(store.LoadRules({Rule(proto::TC_FILE, 1, kNaN, kNaN)}).code(),
            absl::StatusCode::kInvalidArgument);

  ASSERT_EQ(store.GetRules().size(), 1);
  EXPECT_THAT(store.GetRules()[0], EqProto(Rule(proto::TC_VOICE, 3, 5, 10)));
  EXPECT_EQ(store.version(), 1);
}

TEST(RuleStoreTest, LoadRulesRejectsDuplicates) {
  RuleStore store;
  ASSERT_TRUE(store.SetRule(Rule(proto::TC_VOICE, 3, 0.1, 10)).ok());
  absl::Status st = store.LoadRules({
      Rule(proto::TC_FILE, 1, 0.5, 30),
      Rule(proto::TC_FILE, 0, 0, 20),
  });
  EXPECT_EQ(st.code(), absl::StatusCode::kInvalidArgument);
  ASSERT_EQ(store.GetRules().size(), 1);
  EXPECT_EQ(store.GetRules()[0].traffic_class(), proto::TC_VOICE);
}

TEST(RuleStoreTest, SnapshotIsUnaffectedByLaterUpdates) {
  RuleStore store;
  ASSERT_TRUE(store.SetRule(Rule(proto::TC_VIDEO, 3, 5, 50)).ok());
  RuleSnapshot snap = store.Snapshot();
  ASSERT_TRUE(store.SetRule(Rule(proto::TC_VIDEO, 3, 1, 2)).ok());
  ASSERT_TRUE(store.SetRule(Rule(proto::TC_VOICE, 3, 1, 2)).ok());

  ASSERT_EQ(snap->size(), 1);
  EXPECT_EQ((*snap)[0].max_bandwidth_mbps(), 50);
  EXPECT_EQ(store.Snapshot()->size(), 2);
}

}  // namespace
}  // namespace flowqos
