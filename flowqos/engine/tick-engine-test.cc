#include "flowqos/engine/tick-engine.h"

#include <thread>

#include "absl/synchronization/notification.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "flowqos/proto/constructors.h"
#include "flowqos/proto/parse-text.h"
#include "flowqos/proto/testing.h"
#include "flowqos/store/in-memory-store.h"
#include "flowqos/traffic/traffic-class.h"

using ::testing::_;
using ::testing::DoubleNear;
using ::testing::NiceMock;
using ::testing::Return;

namespace flowqos {
namespace {

class MockTrafficStore : public TrafficStore {
 public:
  MOCK_METHOD(absl::StatusOr<SampleBatch>, ReadSamplesSince, (int64_t cursor),
              (override));
  MOCK_METHOD(absl::Status, RecordPrediction, (const proto::Prediction& prediction),
              (override));
  MOCK_METHOD(absl::Status, RecordAlert, (const proto::Alert& alert), (override));
  MOCK_METHOD(absl::Status, RecordFlowClosed, (const proto::FlowClosed& closed),
              (override));
};

class MockPredictor : public BandwidthPredictor {
 public:
  MOCK_METHOD(absl::StatusOr<proto::Prediction>, Predict,
              (const proto::PredictionRequest& req), (override));
};

std::vector<proto::QosRule> DefaultRules() {
  return {
      ParseTextProto<proto::QosRule>(R"(
        traffic_class: TC_VIDEO
        priority: 3
        min_bandwidth_mbps: 5
        max_bandwidth_mbps: 50
        dscp: 34
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
        traffic_class: TC_FILE
        priority: 1
        min_bandwidth_mbps: 0.5
        max_bandwidth_mbps: 30
        enabled: true
      )"),
      ParseTextProto<proto::QosRule>(R"(
        traffic_class: TC_BACKGROUND
        priority: 0
        min_bandwidth_mbps: 0
        max_bandwidth_mbps: 20
        enabled: true
      )"),
  };
}

proto::Prediction LowConfidencePrediction() {
  return ParseTextProto<proto::Prediction>(R"(
    predicted_bandwidth_mbps: 99
    confidence: 10
    model_type: "test"
  )");
}

std::vector<proto::TrafficSample> VideoSamples(absl::Time now) {
  return {
      ProtoTrafficSample({
          .timestamp = now - absl::Milliseconds(500),
          .source_endpoint = "10.0.0.1",
          .dest_endpoint = "10.0.0.2",
          .packet_size = 1200,
          .throughput_mbps = 10,
          .dst_port = 5004,
      }),
      ProtoTrafficSample({
          .timestamp = now - absl::Milliseconds(200),
          .source_endpoint = "10.0.0.1",
          .dest_endpoint = "10.0.0.2",
          .packet_size = 1200,
          .throughput_mbps = 12,
          .dst_port = 5004,
      }),
  };
}

std::vector<proto::BroadcastMessage> ReadAll(Subscriber* sub) {
  std::vector<proto::BroadcastMessage> mesgs;
  while (std::optional<proto::BroadcastMessage> m = sub->TryNext()) {
    mesgs.push_back(std::move(*m));
  }
  return mesgs;
}

const proto::AllocationResult* FindAllocation(const proto::AllocationUpdate& u,
                                              proto::TrafficClass c) {
  for (const proto::AllocationResult& r : u.allocations()) {
    if (r.traffic_class() == c) {
      return &r;
    }
  }
  return nullptr;
}

struct Fixture {
  Fixture(TrafficStore* store, BandwidthPredictor* predictor,
          EngineOptions options = EngineOptions())
      : broadcaster(64) {
    options.rules = DefaultRules();
    EXPECT_TRUE(rules.LoadRules(options.rules).ok());
    engine = std::make_unique<TickEngine>(options, TickEngine::Deps{
                                                       .store = store,
                                                       .predictor = predictor,
                                                       .rules = &rules,
                                                       .broadcaster = &broadcaster,
                                                   });
  }

  RuleStore rules;
  Broadcaster broadcaster;
  std::unique_ptr<TickEngine> engine;
};

TEST(TickEngineTest, ClassifiesAggregatesAndPublishes) {
  const absl::Time now = absl::FromUnixSeconds(1000);
  InMemoryTrafficStore store;
  store.AppendSamples(VideoSamples(now));
  NiceMock<MockPredictor> predictor;
  ON_CALL(predictor, Predict(_)).WillByDefault(Return(LowConfidencePrediction()));

  Fixture f(&store, &predictor);
  auto h = f.broadcaster.Connect("test", now);
  f.engine->Tick(now);

  std::vector<proto::BroadcastMessage> mesgs = ReadAll(h->subscriber());
  ASSERT_EQ(mesgs.size(), 3u);
  for (const proto::BroadcastMessage& m : mesgs) {
    EXPECT_EQ(m.tick(), 1u);
  }

  ASSERT_TRUE(mesgs[0].has_traffic_update());
  const proto::TrafficUpdate& traffic = mesgs[0].traffic_update();
  ASSERT_EQ(traffic.flows_size(), 1);
  EXPECT_EQ(traffic.flows(0).traffic_class(), proto::TC_VIDEO);
  EXPECT_EQ(traffic.flows(0).packet_count(), 2);
  EXPECT_EQ(traffic.flows(0).current_bandwidth_mbps(), 12);
  EXPECT_THAT(traffic.flows(0).allocated_bandwidth_mbps(), DoubleNear(14.4, 1e-9));
  EXPECT_THAT(traffic.stats(), EqProto(ParseTextProto<proto::TrafficStats>(R"(
                total_flows: 1
                total_packets: 2
                active_alerts: 0
              )")));
  ASSERT_EQ(traffic.decisions_size(), 1);
  EXPECT_EQ(traffic.decisions(0).action(), proto::QA_MAINTAIN);

  ASSERT_TRUE(mesgs[1].has_traffic_by_type());
  EXPECT_EQ(mesgs[1].traffic_by_type().video().count(), 2);
  EXPECT_THAT(mesgs[1].traffic_by_type().video().avg_throughput_mbps(),
              DoubleNear(11, 1e-9));
  EXPECT_EQ(mesgs[1].traffic_by_type().voice().count(), 0);

  ASSERT_TRUE(mesgs[2].has_allocation_update());
  const proto::AllocationResult* video =
      FindAllocation(mesgs[2].allocation_update(), proto::TC_VIDEO);
  ASSERT_NE(video, nullptr);
  EXPECT_THAT(video->allocated_mbps(), DoubleNear(14.4, 1e-9));
  EXPECT_EQ(video->demand_source(), proto::AllocationResult::DS_OBSERVED);
  const proto::AllocationResult* voice =
      FindAllocation(mesgs[2].allocation_update(), proto::TC_VOICE);
  ASSERT_NE(voice, nullptr);
  EXPECT_EQ(voice->demand_source(), proto::AllocationResult::DS_RULE_MINIMUM);
}

TEST(TickEngineTest, TrustedPredictionIsUsedAndRecorded) {
  const absl::Time now = absl::FromUnixSeconds(1000);
  InMemoryTrafficStore store;
  store.AppendSamples(VideoSamples(now));
  NiceMock<MockPredictor> predictor;
  ON_CALL(predictor, Predict(_))
      .WillByDefault(Return(ParseTextProto<proto::Prediction>(R"(
        traffic_class: TC_VIDEO
        predicted_bandwidth_mbps: 20
        confidence: 90
      )")));

  Fixture f(&store, &predictor);
  auto h = f.broadcaster.Connect("test", now);
  ASSERT_TRUE(h->subscriber()->Subscribe("allocation").ok());
  f.engine->Tick(now);

  std::vector<proto::BroadcastMessage> mesgs = ReadAll(h->subscriber());
  ASSERT_EQ(mesgs.size(), 1u);
  const proto::AllocationResult* video =
      FindAllocation(mesgs[0].allocation_update(), proto::TC_VIDEO);
  ASSERT_NE(video, nullptr);
  EXPECT_THAT(video->allocated_mbps(), DoubleNear(24, 1e-9));
  EXPECT_EQ(video->demand_source(), proto::AllocationResult::DS_PREDICTION);

  ASSERT_EQ(store.predictions().size(), 1u);
  EXPECT_EQ(store.predictions()[0].predicted_bandwidth_mbps(), 20);
}

TEST(TickEngineTest, PredictorFailureFallsBackAndAlerts) {
  const absl::Time now = absl::FromUnixSeconds(1000);
  InMemoryTrafficStore store;
  store.AppendSamples(VideoSamples(now));
  NiceMock<MockPredictor> predictor;
  ON_CALL(predictor, Predict(_))
      .WillByDefault(Return(absl::UnavailableError("model server down")));

  Fixture f(&store, &predictor);
  auto h = f.broadcaster.Connect("test", now);
  f.engine->Tick(now);

  std::vector<proto::BroadcastMessage> mesgs = ReadAll(h->subscriber());
  ASSERT_EQ(mesgs.size(), 4u);
  const proto::AllocationResult* video =
      FindAllocation(mesgs[2].allocation_update(), proto::TC_VIDEO);
  ASSERT_NE(video, nullptr);
  EXPECT_EQ(video->demand_source(), proto::AllocationResult::DS_OBSERVED);

  ASSERT_TRUE(mesgs[3].has_alert_update());
  ASSERT_EQ(mesgs[3].alert_update().alerts_size(), 1);
  EXPECT_EQ(mesgs[3].alert_update().alerts(0).title(), kPredictorUnavailableTitle);
  EXPECT_EQ(mesgs[3].alert_update().alerts(0).severity(), proto::AS_WARNING);
}

TEST(TickEngineTest, DegradedReadRepeatsPreviousMessages) {
  const absl::Time t1 = absl::FromUnixSeconds(1000);
  const absl::Time t2 = t1 + absl::Seconds(1);

  NiceMock<MockTrafficStore> store;
  EXPECT_CALL(store, ReadSamplesSince(0))
      .WillOnce(Return(SampleBatch{.samples = VideoSamples(t1), .next_cursor = 2}));
  EXPECT_CALL(store, ReadSamplesSince(2))
      .WillOnce(Return(absl::UnavailableError("store down")));
  NiceMock<MockPredictor> predictor;
  ON_CALL(predictor, Predict(_)).WillByDefault(Return(LowConfidencePrediction()));

  Fixture f(&store, &predictor);
  auto h = f.broadcaster.Connect("test", t1);
  f.engine->Tick(t1);
  std::vector<proto::BroadcastMessage> before = ReadAll(h->subscriber());
  ASSERT_EQ(before.size(), 3u);

  f.engine->Tick(t2);
  std::vector<proto::BroadcastMessage> after = ReadAll(h->subscriber());
  ASSERT_EQ(after.size(), 4u);
  EXPECT_EQ(f.engine->num_degraded_ticks(), 1);

  proto::Alert degraded =
      MakeAlert(proto::AS_WARNING, kUpstreamDegradedTitle,
                "sample read failed: store down", t2);

  proto::BroadcastMessage want_traffic = before[0];
  want_traffic.set_tick(2);
  *want_traffic.mutable_traffic_update()->mutable_timestamp() = ToProtoTimestamp(t2);
  *want_traffic.mutable_traffic_update()->add_alerts() = degraded;
  EXPECT_THAT(after[0], EqProto(want_traffic));

  proto::BroadcastMessage want_by_type = before[1];
  want_by_type.set_tick(2);
  *want_by_type.mutable_traffic_by_type()->mutable_timestamp() = ToProtoTimestamp(t2);
  EXPECT_THAT(after[1], EqProto(want_by_type));

  proto::BroadcastMessage want_alloc = before[2];
  want_alloc.set_tick(2);
  *want_alloc.mutable_allocation_update()->mutable_timestamp() = ToProtoTimestamp(t2);
  EXPECT_THAT(after[2], EqProto(want_alloc));

  ASSERT_TRUE(after[3].has_alert_update());
  EXPECT_THAT(after[3].alert_update().alerts(),
              EqRepeatedProto(std::vector<proto::Alert>{degraded}));
}

TEST(TickEngineTest, LongOutageKeepsAlertsRaised) {
  const absl::Time t1 = absl::FromUnixSeconds(1000);
  NiceMock<MockTrafficStore> store;
  EXPECT_CALL(store, ReadSamplesSince(0))
      .WillOnce(Return(SampleBatch{}))
      .WillRepeatedly(Return(absl::UnavailableError("store down")));
  NiceMock<MockPredictor> predictor;

  EngineOptions options;
  options.total_bandwidth_mbps = 3;
  options.alert_cooldown = absl::Seconds(10);
  Fixture f(&store, &predictor, options);
  auto h = f.broadcaster.Connect("test", t1);

  f.engine->Tick(t1);
  std::vector<proto::BroadcastMessage> mesgs = ReadAll(h->subscriber());
  ASSERT_EQ(mesgs.size(), 4u);
  ASSERT_TRUE(mesgs[3].has_alert_update());
  const proto::Alert critical = mesgs[3].alert_update().alerts(0);
  ASSERT_EQ(critical.severity(), proto::AS_CRITICAL);

  for (int i = 1; i <= 15; ++i) {
    f.engine->Tick(t1 + absl::Seconds(i));
  }
  EXPECT_EQ(f.engine->num_degraded_ticks(), 15);

  mesgs = ReadAll(h->subscriber());
  ASSERT_FALSE(mesgs.empty());
  for (const proto::BroadcastMessage& m : mesgs) {
    if (!m.has_alert_update()) {
      continue;
    }
    for (const proto::Alert& a : m.alert_update().alerts()) {
      EXPECT_FALSE(a.resolved()) << "tick " << m.tick() << ": " << a.title();
    }
  }

  // The last repeated traffic update still lists the critical alert.
  const proto::BroadcastMessage* last_traffic = nullptr;
  for (const proto::BroadcastMessage& m : mesgs) {
    if (m.has_traffic_update()) {
      last_traffic = &m;
    }
  }
  ASSERT_NE(last_traffic, nullptr);
  EXPECT_EQ(last_traffic->tick(), 16u);
  bool found = false;
  for (const proto::Alert& a : last_traffic->traffic_update().alerts()) {
    found = found || (a.title() == critical.title() && a.severity() == critical.severity());
  }
  EXPECT_TRUE(found);

  f.engine->Drain(t1 + absl::Seconds(20));
  mesgs = ReadAll(h->subscriber());
  ASSERT_EQ(mesgs.size(), 1u);
  const proto::AlertUpdate& drained = mesgs[0].alert_update();
  ASSERT_GE(drained.alerts_size(), 2);
  EXPECT_EQ(drained.alerts(0).title(), critical.title());
  EXPECT_FALSE(drained.alerts(0).resolved());
}

TEST(TickEngineTest, HungPredictorCostsOneTimeoutPerTick) {
  const absl::Time now = absl::FromUnixSeconds(1000);
  auto sample = [now](int32_t dst_port, std::string src) {
    return ProtoTrafficSample({
        .timestamp = now - absl::Milliseconds(100),
        .source_endpoint = std::move(src),
        .dest_endpoint = "10.0.0.100",
        .packet_size = 500,
        .throughput_mbps = 1,
        .dst_port = dst_port,
    });
  };
  InMemoryTrafficStore store;
  store.AppendSamples({sample(5004, "10.0.0.1"), sample(5060, "10.0.0.2"),
                       sample(21, "10.0.0.3"), sample(53, "10.0.0.4")});

  absl::Notification release;
  NiceMock<MockPredictor> predictor;
  ON_CALL(predictor, Predict(_))
      .WillByDefault(testing::Invoke(
          [&release](const proto::PredictionRequest&) -> absl::StatusOr<proto::Prediction> {
            release.WaitForNotificationWithTimeout(absl::Seconds(10));
            return LowConfidencePrediction();
          }));

  EngineOptions options;
  options.predictor_timeout = absl::Milliseconds(200);
  Fixture f(&store, &predictor, options);
  auto h = f.broadcaster.Connect("test", now);
  ASSERT_TRUE(h->subscriber()->Subscribe("allocation").ok());

  const absl::Time start = absl::Now();
  f.engine->Tick(now);
  const absl::Duration elapsed = absl::Now() - start;
  release.Notify();

  // One class per timeout would take at least 800ms.
  EXPECT_LT(elapsed, absl::Milliseconds(600));

  std::vector<proto::BroadcastMessage> mesgs = ReadAll(h->subscriber());
  ASSERT_EQ(mesgs.size(), 1u);
  for (proto::TrafficClass c : kQosClasses) {
    const proto::AllocationResult* r = FindAllocation(mesgs[0].allocation_update(), c);
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->demand_source(), proto::AllocationResult::DS_OBSERVED)
        << TrafficClassName(c);
  }
}

TEST(TickEngineTest, SlowUpstreamReadTimesOut) {
  const absl::Time now = absl::FromUnixSeconds(1000);
  NiceMock<MockTrafficStore> store;
  absl::Notification release;
  EXPECT_CALL(store, ReadSamplesSince(0))
      .WillOnce(testing::Invoke([&release](int64_t) -> absl::StatusOr<SampleBatch> {
        release.WaitForNotificationWithTimeout(absl::Seconds(5));
        return SampleBatch{};
      }));
  NiceMock<MockPredictor> predictor;

  EngineOptions options;
  options.upstream_timeout = absl::Milliseconds(20);
  Fixture f(&store, &predictor, options);
  auto h = f.broadcaster.Connect("test", now);
  f.engine->Tick(now);
  release.Notify();

  // Nothing was published before, so only the alert goes out.
  std::vector<proto::BroadcastMessage> mesgs = ReadAll(h->subscriber());
  ASSERT_EQ(mesgs.size(), 1u);
  ASSERT_TRUE(mesgs[0].has_alert_update());
  EXPECT_EQ(mesgs[0].alert_update().alerts(0).title(), kUpstreamDegradedTitle);
  EXPECT_EQ(f.engine->num_degraded_ticks(), 1);
}

TEST(TickEngineTest, StateIsReadableDuringSlowRead) {
  const absl::Time now = absl::FromUnixSeconds(1000);
  NiceMock<MockTrafficStore> store;
  absl::Notification reading;
  absl::Notification release;
  EXPECT_CALL(store, ReadSamplesSince(0))
      .WillOnce(testing::Invoke(
          [&reading, &release](int64_t) -> absl::StatusOr<SampleBatch> {
            reading.Notify();
            release.WaitForNotificationWithTimeout(absl::Seconds(5));
            return SampleBatch{};
          }));
  NiceMock<MockPredictor> predictor;

  EngineOptions options;
  options.upstream_timeout = absl::Seconds(5);
  Fixture f(&store, &predictor, options);

  std::thread ticker([&f, now] { f.engine->Tick(now); });
  ASSERT_TRUE(reading.WaitForNotificationWithTimeout(absl::Seconds(5)));

  const absl::Time start = absl::Now();
  EXPECT_EQ(f.engine->num_ticks(), 0u);
  EXPECT_LT(absl::Now() - start, absl::Milliseconds(500));

  release.Notify();
  ticker.join();
  EXPECT_EQ(f.engine->num_ticks(), 1u);
}

TEST(TickEngineTest, RuleUpdatesApplyOnNextTick) {
  const absl::Time t1 = absl::FromUnixSeconds(1000);
  InMemoryTrafficStore store;
  store.AppendSamples(VideoSamples(t1));
  NiceMock<MockPredictor> predictor;
  ON_CALL(predictor, Predict(_)).WillByDefault(Return(LowConfidencePrediction()));

  Fixture f(&store, &predictor);
  auto h = f.broadcaster.Connect("test", t1);
  ASSERT_TRUE(h->subscriber()->Subscribe("allocation").ok());

  f.engine->Tick(t1);
  ASSERT_TRUE(f.rules
                  .SetRule(ParseTextProto<proto::QosRule>(R"(
                    traffic_class: TC_VIDEO
                    priority: 3
                    min_bandwidth_mbps: 5
                    max_bandwidth_mbps: 8
                    enabled: true
                  )"))
                  .ok());
  f.engine->Tick(t1 + absl::Seconds(1));

  std::vector<proto::BroadcastMessage> mesgs = ReadAll(h->subscriber());
  ASSERT_EQ(mesgs.size(), 2u);
  const proto::AllocationResult* before =
      FindAllocation(mesgs[0].allocation_update(), proto::TC_VIDEO);
  const proto::AllocationResult* after =
      FindAllocation(mesgs[1].allocation_update(), proto::TC_VIDEO);
  ASSERT_NE(before, nullptr);
  ASSERT_NE(after, nullptr);
  EXPECT_THAT(before->allocated_mbps(), DoubleNear(14.4, 1e-9));
  EXPECT_THAT(after->allocated_mbps(), DoubleNear(8, 1e-9));
}

TEST(TickEngineTest, DrainRepeatsUnresolvedAlerts) {
  const absl::Time now = absl::FromUnixSeconds(1000);
  InMemoryTrafficStore store;
  NiceMock<MockPredictor> predictor;

  EngineOptions options;
  options.total_bandwidth_mbps = 3;
  Fixture f(&store, &predictor, options);
  auto h = f.broadcaster.Connect("test", now);
  ASSERT_TRUE(h->subscriber()->Subscribe("alerts").ok());

  f.engine->Tick(now);
  std::vector<proto::BroadcastMessage> mesgs = ReadAll(h->subscriber());
  ASSERT_EQ(mesgs.size(), 1u);
  const proto::AlertUpdate& raised = mesgs[0].alert_update();
  ASSERT_EQ(raised.alerts_size(), 2);
  EXPECT_EQ(raised.alerts(0).severity(), proto::AS_CRITICAL);
  EXPECT_EQ(raised.alerts(0).title(), "Minimum bandwidth not met for voice");
  EXPECT_EQ(raised.alerts(1).severity(), proto::AS_WARNING);
  EXPECT_EQ(raised.alerts(1).title(), "Minimum bandwidth not met for file");
  EXPECT_EQ(store.alerts().size(), 2u);

  f.engine->Drain(now + absl::Seconds(1));
  mesgs = ReadAll(h->subscriber());
  ASSERT_EQ(mesgs.size(), 1u);
  EXPECT_THAT(mesgs[0].alert_update().alerts(),
              EqRepeatedProto(std::vector<proto::Alert>{raised.alerts(0),
                                                         raised.alerts(1)}));
  for (const proto::Alert& a : mesgs[0].alert_update().alerts()) {
    EXPECT_FALSE(a.resolved());
  }
}

TEST(TickEngineTest, TimestampsIncrease) {
  const absl::Time now = absl::FromUnixSeconds(1000);
  InMemoryTrafficStore store;
  NiceMock<MockPredictor> predictor;
  Fixture f(&store, &predictor);
  auto h = f.broadcaster.Connect("test", now);
  ASSERT_TRUE(h->subscriber()->Subscribe("traffic").ok());

  f.engine->Tick(now);
  f.engine->Tick(now);
  std::vector<proto::BroadcastMessage> mesgs = ReadAll(h->subscriber());
  ASSERT_EQ(mesgs.size(), 2u);
  EXPECT_LT(FromProtoTimestamp(mesgs[0].traffic_update().timestamp()),
            FromProtoTimestamp(mesgs[1].traffic_update().timestamp()));
  EXPECT_EQ(f.engine->num_ticks(), 2u);
}

}  // namespace
}  // namespace flowqos
