#include "flowqos/alg/qos-actions.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "flowqos/proto/parse-text.h"
#include "flowqos/proto/testing.h"

namespace flowqos {
namespace {

proto::Flow FlowAt(double mbps) {
  proto::Flow f;
  f.set_id(9);
  f.set_traffic_class(proto::TC_VIDEO);
  f.set_current_bandwidth_mbps(mbps);
  return f;
}

proto::QosRule VideoRule() {
  return ParseTextProto<proto::QosRule>(R"(
    traffic_class: TC_VIDEO
    priority: 3
    min_bandwidth_mbps: 5
    max_bandwidth_mbps: 50
    dscp: 34
    enabled: true
  )");
}

TEST(DecideQosActionTest, Throttle) {
  proto::QosRule rule = VideoRule();
  EXPECT_THAT(DecideQosAction(FlowAt(60), &rule),
              EqProto(ParseTextProto<proto::FlowQosDecision>(R"(
                flow_id: 9
                action: QA_THROTTLE
                target_bandwidth_mbps: 50
                dscp: 34
                reason: "exceeds_max"
              )")));
}

TEST(DecideQosActionTest, Prioritize) {
  proto::QosRule rule = VideoRule();
  EXPECT_THAT(DecideQosAction(FlowAt(1), &rule),
              EqProto(ParseTextProto<proto::FlowQosDecision>(R"(
                flow_id: 9
                action: QA_PRIORITIZE
                target_bandwidth_mbps: 5
                dscp: 34
                reason: "below_min"
              )")));
}

TEST(DecideQosActionTest, Maintain) {
  proto::QosRule rule = VideoRule();
  proto::FlowQosDecision d = DecideQosAction(FlowAt(50), &rule);
  EXPECT_EQ(d.action(), proto::QA_MAINTAIN);
  EXPECT_EQ(d.target_bandwidth_mbps(), 50);
  EXPECT_EQ(d.reason(), "within_limits");
}

TEST(DecideQosActionTest, NoRule) {
  EXPECT_THAT(DecideQosAction(FlowAt(50), nullptr),
              EqProto(ParseTextProto<proto::FlowQosDecision>(R"(
                flow_id: 9
                action: QA_NONE
                reason: "no_rule"
              )")));
}

}  // namespace
}  // namespace flowqos
