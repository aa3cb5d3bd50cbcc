#include "flowqos/cli/parse.h"

#include <limits>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "flowqos/proto/parse-text.h"
#include "flowqos/proto/testing.h"

namespace flowqos {
namespace {

TEST(ParseAbslDurationTest, Basic) {
  EXPECT_EQ(*ParseAbslDuration("500ms", "x", absl::Seconds(1)), absl::Milliseconds(500));
  EXPECT_EQ(*ParseAbslDuration("", "x", absl::Seconds(1)), absl::Seconds(1));
  absl::StatusOr<absl::Duration> bad = ParseAbslDuration("fast", "tick_period", {});
  EXPECT_EQ(bad.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(std::string(bad.status().message()), testing::HasSubstr("tick_period"));
}

TEST(ParseMonitorConfigTest, Defaults) {
  absl::StatusOr<EngineOptions> o = ParseMonitorConfig(proto::MonitorConfig());
  ASSERT_TRUE(o.ok()) << o.status();
  EXPECT_EQ(o->tick_period, absl::Seconds(1));
  EXPECT_EQ(o->silence_interval, absl::Seconds(30));
  EXPECT_EQ(o->upstream_timeout, absl::Milliseconds(500));
  EXPECT_EQ(o->predictor_timeout, absl::Milliseconds(500));
  EXPECT_EQ(o->alert_cooldown, absl::Seconds(60));
  EXPECT_EQ(o->total_bandwidth_mbps, 100);
  EXPECT_EQ(o->confidence_threshold, 50);
  EXPECT_EQ(o->subscriber_buffer_size, 64);
  EXPECT_EQ(o->max_flows_per_update, 100);
  EXPECT_EQ(o->history_length, 100);
  EXPECT_TRUE(o->rules.empty());
}

TEST(ParseMonitorConfigTest, Full) {
  absl::StatusOr<EngineOptions> o =
      ParseMonitorConfig(ParseTextProto<proto::MonitorConfig>(R"(
        tick_period: "250ms"
        silence_interval: "10s"
        alert_cooldown: "5m"
        total_bandwidth_mbps: 0
        confidence_threshold: 80
        subscriber_buffer_size: 8
        rules {
          traffic_class: TC_VOICE
          priority: 3
          min_bandwidth_mbps: 0.1
          max_bandwidth_mbps: 10
          dscp: 46
          enabled: true
        }
        server_addresses: "127.0.0.1:4560"
      )"));
  ASSERT_TRUE(o.ok()) << o.status();
  EXPECT_EQ(o->tick_period, absl::Milliseconds(250));
  EXPECT_EQ(o->silence_interval, absl::Seconds(10));
  EXPECT_EQ(o->alert_cooldown, absl::Minutes(5));
  EXPECT_EQ(o->total_bandwidth_mbps, 0);
  EXPECT_EQ(o->confidence_threshold, 80);
  EXPECT_EQ(o->subscriber_buffer_size, 8);
  ASSERT_EQ(o->rules.size(), 1u);
  EXPECT_EQ(o->rules[0].traffic_class(), proto::TC_VOICE);
  EXPECT_THAT(o->server_addresses, testing::ElementsAre("127.0.0.1:4560"));
}

TEST(ParseMonitorConfigTest, RejectsNonPositiveTick) {
  EXPECT_EQ(ParseMonitorConfig(ParseTextProto<proto::MonitorConfig>(R"(
              tick_period: "0s"
            )"))
                .status()
                .code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(ParseMonitorConfig(ParseTextProto<proto::MonitorConfig>(R"(
              tick_period: "-1s"
            )"))
                .status()
                .code(),
            absl::StatusCode::kInvalidArgument);
}

TEST(ParseMonitorConfigTest, RejectsNegativeBudget) {
  EXPECT_EQ(ParseMonitorConfig(ParseTextProto<proto::MonitorConfig>(R"(
              total_bandwidth_mbps: -1
            )"))
                .status()
                .code(),
            absl::StatusCode::kInvalidArgument);
}

TEST(ParseMonitorConfigTest, RejectsNonFiniteNumbers) {
  constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
  proto::MonitorConfig budget;
  budget.set_total_bandwidth_mbps(kNaN);
  EXPECT_EQ(ParseMonitorConfig(budget).status().code(),
            absl::StatusCode::kInvalidArgument);

  budget.set_total_bandwidth_mbps(std::numeric_limits<double>::infinity());
  EXPECT_EQ(ParseMonitorConfig(budget).status().code(),
            absl::StatusCode::kInvalidArgument);

  proto::MonitorConfig rule = ParseTextProto<proto::MonitorConfig>(R"(
    rules { traffic_class: TC_VOICE priority: 3 max_bandwidth_mbps: 10 enabled: true }
  )");
  rule.mutable_rules(0)->set_min_bandwidth_mbps(kNaN);
  EXPECT_EQ(ParseMonitorConfig(rule).status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(ParseMonitorConfigTest, RejectsBadRules) {
  EXPECT_EQ(ParseMonitorConfig(ParseTextProto<proto::MonitorConfig>(R"(
              rules {
                traffic_class: TC_VIDEO
                priority: 3
                min_bandwidth_mbps: 60
                max_bandwidth_mbps: 50
                enabled: true
              }
            )"))
                .status()
                .code(),
            absl::StatusCode::kInvalidArgument);

  absl::StatusOr<EngineOptions> dup =
      ParseMonitorConfig(ParseTextProto<proto::MonitorConfig>(R"(
        rules { traffic_class: TC_FILE priority: 1 max_bandwidth_mbps: 30 enabled: true }
        rules { traffic_class: TC_FILE priority: 1 max_bandwidth_mbps: 20 enabled: true }
      )"));
  EXPECT_EQ(dup.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(std::string(dup.status().message()), testing::HasSubstr("duplicate"));
}

}  // namespace
}  // namespace flowqos
