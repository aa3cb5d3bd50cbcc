#include "flowqos/flows/stats-aggregator.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "flowqos/proto/constructors.h"
#include "flowqos/proto/parse-text.h"
#include "flowqos/proto/testing.h"

namespace flowqos {
namespace {

const absl::Time kStart = absl::FromUnixSeconds(1'700'000'000);

StatsAggregator::Config TestConfig() {
  return {
      .tick_period = absl::Seconds(1),
      .silence_interval = absl::Seconds(30),
      .history_length = 3,
  };
}

TEST(StatsAggregatorTest, GroupsByClassTreatingMissingThroughputAsZero) {
  StatsAggregator agg(TestConfig(), &DefaultClassifierTable());
  TickStats stats = agg.Ingest(
      kStart, {
                  ProtoTrafficSample({.timestamp = kStart,
                                      .source_endpoint = "h1",
                                      .dest_endpoint = "h2",
                                      .traffic_class = proto::TC_VIDEO,
                                      .packet_size = 1200,
                                      .throughput_mbps = 10}),
                  ProtoTrafficSample({.timestamp = kStart,
                                      .source_endpoint = "h1",
                                      .dest_endpoint = "h3",
                                      .traffic_class = proto::TC_VIDEO,
                                      .packet_size = 800}),
                  ProtoTrafficSample({.timestamp = kStart,
                                      .source_endpoint = "h4",
                                      .dest_endpoint = "h2",
                                      .traffic_class = proto::TC_FILE,
                                      .packet_size = 1500,
                                      .throughput_mbps = 3}),
              });

  EXPECT_EQ(stats.per_class[CanonicalRank(proto::TC_VIDEO)].count, 2);
  EXPECT_DOUBLE_EQ(stats.per_class[CanonicalRank(proto::TC_VIDEO)].avg_throughput_mbps(), 5);
  EXPECT_EQ(stats.per_class[CanonicalRank(proto::TC_FILE)].count, 1);
  EXPECT_EQ(stats.per_class[CanonicalRank(proto::TC_VOICE)].count, 0);
  EXPECT_EQ(stats.per_class[CanonicalRank(proto::TC_VOICE)].avg_throughput_mbps(), 0);
  EXPECT_EQ(stats.new_flows.size(), 3);

  EXPECT_THAT(ToTrafficByType(stats), EqProto(ParseTextProto<proto::TrafficByType>(R"(
    timestamp { seconds: 1700000000 }
    video { count: 2 avg_throughput_mbps: 5 }
    voice {}
    file { count: 1 avg_throughput_mbps: 3 }
    background {}
  )")));

  EXPECT_DOUBLE_EQ(agg.ObservedDemand(proto::TC_VIDEO), 10);
  EXPECT_DOUBLE_EQ(agg.ObservedDemand(proto::TC_FILE), 3);
  EXPECT_FALSE(agg.HasActiveFlows(proto::TC_BACKGROUND));
}

TEST(StatsAggregatorTest, ClassifiesUnspecifiedAndSkipsUnknown) {
  StatsAggregator agg(TestConfig(), &DefaultClassifierTable());
  TickStats stats =
      agg.Ingest(kStart, {
                             ProtoTrafficSample({.timestamp = kStart,
                                                 .source_endpoint = "h1",
                                                 .dest_endpoint = "dns",
                                                 .throughput_mbps = 0.1,
                                                 .src_port = 40000,
                                                 .dst_port = 53}),
                             ProtoTrafficSample({.timestamp = kStart,
                                                 .source_endpoint = "h1",
                                                 .dest_endpoint = "??",
                                                 .throughput_mbps = 7,
                                                 .src_port = 40000,
                                                 .dst_port = 40001}),
                         });
  EXPECT_EQ(stats.per_class[CanonicalRank(proto::TC_BACKGROUND)].count, 1);
  EXPECT_EQ(stats.unknown_samples, 1);
  EXPECT_EQ(agg.flows().size(), 1);
}

TEST(StatsAggregatorTest, ExpiresFlowsAndReportsClosure) {
  StatsAggregator agg(TestConfig(), &DefaultClassifierTable());
  agg.Ingest(kStart, {ProtoTrafficSample({.timestamp = kStart,
                                          .source_endpoint = "h1",
                                          .dest_endpoint = "h2",
                                          .traffic_class = proto::TC_VOICE,
                                          .throughput_mbps = 0.1})});
  TickStats stats = agg.Ingest(kStart + absl::Seconds(10), {});
  EXPECT_TRUE(stats.closed.empty());
  EXPECT_TRUE(agg.HasActiveFlows(proto::TC_VOICE));

  stats = agg.Ingest(kStart + absl::Seconds(31), {});
  ASSERT_EQ(stats.closed.size(), 1);
  EXPECT_EQ(stats.closed[0].flow().traffic_class(), proto::TC_VOICE);
  EXPECT_FALSE(agg.HasActiveFlows(proto::TC_VOICE));
}

TEST(StatsAggregatorTest, PredictionRequestCarriesBoundedHistory) {
  StatsAggregator agg(TestConfig(), &DefaultClassifierTable());
  for (int i = 1; i <= 5; ++i) {
    agg.Ingest(kStart + absl::Seconds(i),
               {
                   ProtoTrafficSample({.timestamp = kStart + absl::Seconds(i),
                                       .source_endpoint = "h1",
                                       .dest_endpoint = "h2",
                                       .traffic_class = proto::TC_VIDEO,
                                       .packet_size = 1000,
                                       .throughput_mbps = static_cast<double>(i)}),
                   ProtoTrafficSample({.timestamp = kStart + absl::Seconds(i),
                                       .source_endpoint = "h1",
                                       .dest_endpoint = "h2",
                                       .traffic_class = proto::TC_VIDEO,
                                       .packet_size = 2000,
                                       .throughput_mbps = static_cast<double>(i)}),
               });
  }
  proto::PredictionRequest req = agg.BuildPredictionRequest(proto::TC_VIDEO);
  EXPECT_THAT(req.throughput_history_mbps(), testing::ElementsAre(3, 4, 5));
  EXPECT_DOUBLE_EQ(req.packet_rate(), 2);
  EXPECT_DOUBLE_EQ(req.average_packet_size(), 1500);
  EXPECT_DOUBLE_EQ(req.current_throughput_mbps(), 5);
}

}  // namespace
}  // namespace flowqos
