#include "flowqos/server/monitor-service.h"

#include "absl/synchronization/notification.h"
#include "gmock/gmock.h"
#include "grpcpp/grpcpp.h"
#include "gtest/gtest.h"
#include "flowqos/proto/constructors.h"
#include "flowqos/proto/parse-text.h"
#include "flowqos/proto/testing.h"
#include "flowqos/server/methods.h"
#include "flowqos/server/monitor-channel.h"
#include "flowqos/store/in-memory-store.h"

namespace flowqos {
namespace {

struct TestServer {
  TestServer() : broadcaster(16), service(&broadcaster, &rules, &store, 0) {
    grpc::ServerBuilder builder;
    builder.RegisterCallbackGenericService(&service);
    server = builder.BuildAndStart();
    channel = server->InProcessChannel({});
  }

  ~TestServer() {
    server->Shutdown();
    server->Wait();
  }

  Broadcaster broadcaster;
  RuleStore rules;
  InMemoryTrafficStore store;
  MonitorService service;
  std::unique_ptr<grpc::Server> server;
  std::shared_ptr<grpc::Channel> channel;
};

proto::QosRule VoiceRule() {
  return ParseTextProto<proto::QosRule>(R"(
    traffic_class: TC_VOICE
    priority: 3
    min_bandwidth_mbps: 0.1
    max_bandwidth_mbps: 10
    dscp: 46
    enabled: true
  )");
}

void WaitForSubscribers(Broadcaster* b, size_t want) {
  for (int i = 0; i < 500 && b->num_subscribers() != want; ++i) {
    absl::SleepFor(absl::Milliseconds(10));
  }
}

TEST(MonitorServiceTest, MethodNamesMatchProto) {
  const google::protobuf::ServiceDescriptor* svc =
      proto::WatchRequest::descriptor()->file()->FindServiceByName("TrafficMonitor");
  ASSERT_NE(svc, nullptr);
  auto path = [svc](const char* name) {
    return "/" + svc->full_name() + "/" + svc->FindMethodByName(name)->name();
  };
  EXPECT_EQ(path("Watch"), kWatchMethod);
  EXPECT_EQ(path("SetRule"), kSetRuleMethod);
  EXPECT_EQ(path("GetRules"), kGetRulesMethod);
  EXPECT_EQ(path("ListSubscribers"), kListSubscribersMethod);
  EXPECT_EQ(path("AppendSamples"), kAppendSamplesMethod);
}

TEST(MonitorServiceTest, SetAndGetRules) {
  TestServer s;
  MonitorChannel client(s.channel);

  ASSERT_TRUE(client.SetRule(VoiceRule()).ok());

  proto::QosRule bad = VoiceRule();
  bad.set_min_bandwidth_mbps(20);
  grpc::Status st = client.SetRule(bad);
  EXPECT_EQ(st.error_code(), grpc::StatusCode::INVALID_ARGUMENT);

  proto::RuleList rules;
  ASSERT_TRUE(client.GetRules(&rules).ok());
  EXPECT_THAT(rules.rules(), EqRepeatedProto(std::vector<proto::QosRule>{VoiceRule()}));
}

TEST(MonitorServiceTest, AppendSamplesFeedsTheStore) {
  TestServer s;
  MonitorChannel client(s.channel);

  proto::SampleList list;
  *list.add_samples() = ProtoTrafficSample({
      .timestamp = absl::FromUnixSeconds(1000),
      .source_endpoint = "10.0.0.1",
      .dest_endpoint = "10.0.0.2",
      .packet_size = 160,
      .throughput_mbps = 0.1,
      .dst_port = 5060,
  });
  *list.add_samples() = ProtoTrafficSample({
      .timestamp = absl::FromUnixSeconds(1001),
      .source_endpoint = "10.0.0.3",
      .dest_endpoint = "10.0.0.4",
      .packet_size = 1200,
      .throughput_mbps = 8,
      .dst_port = 5004,
  });
  int64_t num_accepted = 0;
  ASSERT_TRUE(client.AppendSamples(list, &num_accepted).ok());
  EXPECT_EQ(num_accepted, 2);

  absl::StatusOr<SampleBatch> batch = s.store.ReadSamplesSince(0);
  ASSERT_TRUE(batch.ok());
  EXPECT_THAT(batch->samples, EqRepeatedProto(std::vector<proto::TrafficSample>(
                                  list.samples().begin(), list.samples().end())));
}

TEST(MonitorServiceTest, AppendSamplesRejectsWholeBatchOnBadSample) {
  TestServer s;
  MonitorChannel client(s.channel);

  proto::SampleList list;
  *list.add_samples() = ProtoTrafficSample({
      .timestamp = absl::FromUnixSeconds(1000),
      .source_endpoint = "10.0.0.1",
      .dest_endpoint = "10.0.0.2",
      .packet_size = 160,
      .throughput_mbps = 0.1,
      .dst_port = 5060,
  });
  list.add_samples()->set_source_endpoint("no timestamp");

  grpc::Status st = client.AppendSamples(list);
  EXPECT_EQ(st.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_THAT(st.error_message(), testing::HasSubstr("sample 1"));
  EXPECT_EQ(s.store.num_samples(), 0);
}

TEST(MonitorServiceTest, WatchFiltersByChannel) {
  TestServer s;
  MonitorChannel client(s.channel);
  std::unique_ptr<WatchStream> watch = client.Watch();

  std::optional<proto::WatchEvent> ev = watch->NextWithTimeout(absl::Seconds(5));
  ASSERT_TRUE(ev.has_value());
  ASSERT_EQ(ev->kind_case(), proto::WatchEvent::kConnectedSubscriberId);
  const uint64_t id = ev->connected_subscriber_id();

  watch->Subscribe("alerts");
  ev = watch->NextWithTimeout(absl::Seconds(5));
  ASSERT_TRUE(ev.has_value());
  EXPECT_EQ(ev->subscribed(), "alerts");

  proto::SubscriberList subs;
  ASSERT_TRUE(client.ListSubscribers(&subs).ok());
  ASSERT_EQ(subs.subscribers_size(), 1);
  EXPECT_EQ(subs.subscribers(0).id(), id);
  EXPECT_THAT(subs.subscribers(0).channels(), testing::ElementsAre("alerts"));

  proto::BroadcastMessage traffic;
  traffic.set_tick(1);
  traffic.mutable_traffic_update()->mutable_stats()->set_total_flows(3);
  proto::BroadcastMessage alerts;
  alerts.set_tick(1);
  alerts.mutable_alert_update()->add_alerts()->set_title("Predictor unavailable");
  s.broadcaster.Publish(traffic);
  s.broadcaster.Publish(alerts);

  ev = watch->NextWithTimeout(absl::Seconds(5));
  ASSERT_TRUE(ev.has_value());
  ASSERT_TRUE(ev->has_message());
  EXPECT_THAT(ev->message(), EqProto(alerts));
  EXPECT_FALSE(watch->NextWithTimeout(absl::Milliseconds(100)).has_value());

  watch.reset();
  WaitForSubscribers(&s.broadcaster, 0);
  EXPECT_EQ(s.broadcaster.num_subscribers(), 0u);
}

TEST(MonitorServiceTest, UnknownChannelEndsWatch) {
  TestServer s;
  MonitorChannel client(s.channel);
  std::unique_ptr<WatchStream> watch = client.Watch();
  watch->Subscribe("flows");
  EXPECT_EQ(watch->Await().error_code(), grpc::StatusCode::INVALID_ARGUMENT);
}

TEST(MonitorServiceTest, BroadcasterCloseEndsWatch) {
  TestServer s;
  MonitorChannel client(s.channel);
  std::unique_ptr<WatchStream> watch = client.Watch();
  ASSERT_TRUE(watch->NextWithTimeout(absl::Seconds(5)).has_value());
  WaitForSubscribers(&s.broadcaster, 1);
  s.broadcaster.Close();
  EXPECT_TRUE(watch->Await().ok());
}

TEST(MonitorServiceTest, UnknownMethod) {
  TestServer s;
  grpc::TemplatedGenericStub<proto::GetRulesRequest, proto::RuleList> stub(s.channel);
  grpc::ClientContext ctx;
  proto::GetRulesRequest req;
  proto::RuleList resp;
  absl::Notification done;
  grpc::Status status;
  stub.UnaryCall(&ctx, "/flowqos.proto.TrafficMonitor/DropAll", grpc::StubOptions(), &req,
                 &resp, [&](grpc::Status st) {
                   status = std::move(st);
                   done.Notify();
                 });
  done.WaitForNotification();
  EXPECT_EQ(status.error_code(), grpc::StatusCode::UNIMPLEMENTED);
}

}  // namespace
}  // namespace flowqos
