#include "flowqos/broadcast/broadcaster.h"

#include <thread>

#include "absl/synchronization/notification.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "flowqos/proto/parse-text.h"
#include "flowqos/proto/testing.h"

namespace flowqos {
namespace {

proto::BroadcastMessage TrafficMesg(uint64_t tick) {
  proto::BroadcastMessage m;
  m.set_tick(tick);
  m.mutable_traffic_update()->mutable_stats()->set_total_flows(tick);
  return m;
}

proto::BroadcastMessage AlertMesg(uint64_t tick) {
  proto::BroadcastMessage m;
  m.set_tick(tick);
  proto::Alert* a = m.mutable_alert_update()->add_alerts();
  a->set_severity(proto::AS_CRITICAL);
  a->set_title("Minimum bandwidth not met for voice");
  return m;
}

proto::BroadcastMessage AllocMesg(uint64_t tick) {
  proto::BroadcastMessage m;
  m.set_tick(tick);
  m.mutable_allocation_update()->mutable_summary()->set_total_budget_mbps(100);
  return m;
}

TEST(ChannelOfTest, Basic) {
  EXPECT_EQ(ChannelOf(TrafficMesg(1)), "traffic");
  EXPECT_EQ(ChannelOf(AlertMesg(1)), "alerts");
  EXPECT_EQ(ChannelOf(AllocMesg(1)), "allocation");
  proto::BroadcastMessage by_type;
  by_type.mutable_traffic_by_type();
  EXPECT_EQ(ChannelOf(by_type), "traffic-by-type");
  EXPECT_EQ(ChannelOf(proto::BroadcastMessage()), "");
}

TEST(BroadcasterTest, AlertsOnlySubscriberSeesOnlyAlerts) {
  Broadcaster b(64);
  auto h = b.Connect("test", absl::UnixEpoch());
  ASSERT_TRUE(h->subscriber()->Subscribe("alerts").ok());

  for (uint64_t tick = 1; tick <= 5; ++tick) {
    b.Publish(TrafficMesg(tick));
    b.Publish(AlertMesg(tick));
    b.Publish(AllocMesg(tick));
  }

  for (uint64_t tick = 1; tick <= 5; ++tick) {
    std::optional<proto::BroadcastMessage> m = h->subscriber()->TryNext();
    ASSERT_TRUE(m.has_value());
    EXPECT_THAT(*m, EqProto(AlertMesg(tick)));
  }
  EXPECT_FALSE(h->subscriber()->TryNext().has_value());
}

TEST(BroadcasterTest, UnfilteredSubscriberSeesAll) {
  Broadcaster b(64);
  auto h = b.Connect("test", absl::UnixEpoch());
  EXPECT_EQ(b.Publish(TrafficMesg(1)), 1);
  EXPECT_EQ(b.Publish(AllocMesg(1)), 1);
  EXPECT_THAT(*h->subscriber()->TryNext(), EqProto(TrafficMesg(1)));
  EXPECT_THAT(*h->subscriber()->TryNext(), EqProto(AllocMesg(1)));
}

TEST(BroadcasterTest, IdempotentSubscribe) {
  Broadcaster b(64);
  auto h = b.Connect("test", absl::UnixEpoch());
  Subscriber* s = h->subscriber();
  ASSERT_TRUE(s->Subscribe("allocation").ok());
  ASSERT_TRUE(s->Subscribe("allocation").ok());
  EXPECT_THAT(s->channels(), testing::ElementsAre("allocation"));

  b.Publish(AllocMesg(1));
  EXPECT_THAT(*s->TryNext(), EqProto(AllocMesg(1)));
  EXPECT_FALSE(s->TryNext().has_value());

  s->Unsubscribe("traffic");
  EXPECT_THAT(s->channels(), testing::ElementsAre("allocation"));
}

TEST(BroadcasterTest, UnsubscribingLastChannelReceivesNothing) {
  Broadcaster b(64);
  auto h = b.Connect("test", absl::UnixEpoch());
  Subscriber* s = h->subscriber();
  ASSERT_TRUE(s->Subscribe("alerts").ok());
  s->Unsubscribe("alerts");
  EXPECT_TRUE(s->channels().empty());

  EXPECT_EQ(b.Publish(TrafficMesg(1)), 0);
  EXPECT_EQ(b.Publish(AlertMesg(1)), 0);
  EXPECT_EQ(b.Publish(AllocMesg(1)), 0);
  EXPECT_FALSE(s->TryNext().has_value());

  ASSERT_TRUE(s->Subscribe("allocation").ok());
  EXPECT_EQ(b.Publish(AllocMesg(2)), 1);
  EXPECT_THAT(*s->TryNext(), EqProto(AllocMesg(2)));
}

TEST(BroadcasterTest, UnknownChannelRejected) {
  Broadcaster b(64);
  auto h = b.Connect("test", absl::UnixEpoch());
  absl::Status st = h->subscriber()->Subscribe("flows");
  EXPECT_EQ(st.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_TRUE(h->subscriber()->channels().empty());
}

TEST(BroadcasterTest, OverflowDropsOldest) {
  Broadcaster b(3);
  auto slow = b.Connect("slow", absl::UnixEpoch());
  auto fast = b.Connect("fast", absl::UnixEpoch());

  for (uint64_t tick = 1; tick <= 5; ++tick) {
    b.Publish(TrafficMesg(tick));
    std::optional<proto::BroadcastMessage> m = fast->subscriber()->TryNext();
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->tick(), tick);
  }

  EXPECT_EQ(slow->subscriber()->dropped_messages(), 2);
  EXPECT_EQ(fast->subscriber()->dropped_messages(), 0);
  for (uint64_t tick = 3; tick <= 5; ++tick) {
    EXPECT_EQ(slow->subscriber()->TryNext()->tick(), tick);
  }
}

TEST(BroadcasterTest, PerSubscriberFifoAcrossThreads) {
  Broadcaster b(1024);
  auto h = b.Connect("reader", absl::UnixEpoch());
  constexpr uint64_t kNumTicks = 500;

  std::thread reader([&h] {
    uint64_t last = 0;
    for (uint64_t i = 0; i < kNumTicks; ++i) {
      std::optional<proto::BroadcastMessage> m = h->subscriber()->Next();
      ASSERT_TRUE(m.has_value());
      EXPECT_GT(m->tick(), last);
      last = m->tick();
    }
  });
  for (uint64_t tick = 1; tick <= kNumTicks; ++tick) {
    b.Publish(TrafficMesg(tick));
  }
  reader.join();
}

TEST(BroadcasterTest, HandleRemovesSubscriber) {
  Broadcaster b(8);
  auto h1 = b.Connect("a", absl::FromUnixSeconds(10));
  auto h2 = b.Connect("b", absl::FromUnixSeconds(20));
  ASSERT_TRUE(h2->subscriber()->Subscribe("alerts").ok());

  EXPECT_THAT(b.ListSubscribers(),
              EqRepeatedProto(std::vector<proto::SubscriberInfo>{
                  ParseTextProto<proto::SubscriberInfo>(R"(
                    id: 1
                    connected_at { seconds: 10 }
                    peer: "a"
                  )"),
                  ParseTextProto<proto::SubscriberInfo>(R"(
                    id: 2
                    connected_at { seconds: 20 }
                    channels: "alerts"
                    peer: "b"
                  )"),
              }));

  h1.reset();
  EXPECT_EQ(b.num_subscribers(), 1u);
  EXPECT_EQ(b.Publish(AlertMesg(1)), 1);
}

TEST(BroadcasterTest, OnReadyRunsAfterDelivery) {
  Broadcaster b(8);
  auto h = b.Connect("test", absl::UnixEpoch());
  int calls = 0;
  h->subscriber()->SetOnReady([&calls] { ++calls; });
  b.Publish(TrafficMesg(1));
  b.Publish(TrafficMesg(2));
  EXPECT_EQ(calls, 2);
}

TEST(BroadcasterTest, CloseWakesReaders) {
  Broadcaster b(8);
  auto h = b.Connect("test", absl::UnixEpoch());
  absl::Notification started;
  std::thread reader([&] {
    started.Notify();
    EXPECT_FALSE(h->subscriber()->Next().has_value());
  });
  started.WaitForNotification();
  b.Close();
  reader.join();
  EXPECT_TRUE(h->subscriber()->closed());
}

}  // namespace
}  // namespace flowqos
