#include "flowqos/flows/flow-table.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/strings/str_cat.h"
#include "flowqos/proto/constructors.h"

namespace flowqos {
namespace {

const absl::Time kStart = absl::FromUnixSeconds(1'700'000'000);

proto::TrafficSample Sample(absl::Duration at, std::string src, std::string dst,
                            proto::TrafficClass c, double mbps, int64_t size = 1000) {
  return ProtoTrafficSample({
      .timestamp = kStart + at,
      .source_endpoint = src,
      .dest_endpoint = dst,
      .traffic_class = c,
      .packet_size = size,
      .throughput_mbps = mbps,
  });
}

TEST(FlowTableTest, CreatesOneFlowPerKey) {
  FlowTable table(absl::Seconds(30));
  auto r1 = table.Observe(Sample(absl::ZeroDuration(), "a", "b", proto::TC_VIDEO, 4));
  auto r2 = table.Observe(Sample(absl::Seconds(1), "a", "b", proto::TC_VIDEO, 6, 500));
  auto r3 = table.Observe(Sample(absl::Seconds(1), "a", "b", proto::TC_FILE, 1));
  auto r4 = table.Observe(Sample(absl::Seconds(1), "b", "a", proto::TC_VIDEO, 1));

  EXPECT_TRUE(r1.is_new);
  EXPECT_FALSE(r2.is_new);
  EXPECT_EQ(r1.flow_id, r2.flow_id);
  EXPECT_TRUE(r3.is_new);
  EXPECT_TRUE(r4.is_new);
  EXPECT_NE(r3.flow_id, r1.flow_id);
  EXPECT_NE(r4.flow_id, r3.flow_id);
  EXPECT_EQ(table.size(), 3);

  const proto::Flow* f = table.Find(r1.flow_id);
  ASSERT_NE(f, nullptr);
  EXPECT_EQ(f->current_bandwidth_mbps(), 6);
  EXPECT_EQ(f->packet_count(), 2);
  EXPECT_EQ(f->byte_count(), 1500);
  EXPECT_EQ(FromProtoTimestamp(f->started_at()), kStart);
  EXPECT_EQ(FromProtoTimestamp(f->last_seen_at()), kStart + absl::Seconds(1));
  EXPECT_FALSE(f->has_allocated_bandwidth_mbps());
}

TEST(FlowTableTest, MissingThroughputIsZero) {
  FlowTable table(absl::Seconds(30));
  auto r = table.Observe(Sample(absl::ZeroDuration(), "a", "b", proto::TC_VOICE, -1));
  EXPECT_EQ(table.Find(r.flow_id)->current_bandwidth_mbps(), 0);
}

TEST(FlowTableTest, ExpiresSilentFlows) {
  FlowTable table(absl::Seconds(30));
  auto old_flow = table.Observe(Sample(absl::ZeroDuration(), "a", "b", proto::TC_VIDEO, 4));
  auto fresh = table.Observe(Sample(absl::Seconds(20), "c", "d", proto::TC_VOICE, 1));

  EXPECT_TRUE(table.Expire(kStart + absl::Seconds(30)).empty());

  std::vector<proto::FlowClosed> closed = table.Expire(kStart + absl::Seconds(31));
  ASSERT_EQ(closed.size(), 1);
  EXPECT_EQ(closed[0].flow().id(), old_flow.flow_id);
  EXPECT_EQ(FromProtoTimestamp(closed[0].closed_at()), kStart + absl::Seconds(31));
  EXPECT_EQ(table.Find(old_flow.flow_id), nullptr);
  EXPECT_NE(table.Find(fresh.flow_id), nullptr);

  // The same key later starts a new flow with a new id.
  auto again = table.Observe(Sample(absl::Seconds(40), "a", "b", proto::TC_VIDEO, 4));
  EXPECT_TRUE(again.is_new);
  EXPECT_GT(again.flow_id, fresh.flow_id);
}

TEST(FlowTableTest, IteratesInIdOrder) {
  FlowTable table(absl::Seconds(30));
  for (int i = 0; i < 50; ++i) {
    table.Observe(Sample(absl::ZeroDuration(), absl::StrCat("src", i), "dst",
                         proto::TC_BACKGROUND, i));
  }
  uint64_t last = 0;
  table.ForEachActiveFlow([&last](const proto::Flow& f) {
    EXPECT_GT(f.id(), last);
    last = f.id();
  });
  EXPECT_EQ(table.ActiveFlows().size(), 50);
}

TEST(FlowTableTest, SetAllocated) {
  FlowTable table(absl::Seconds(30));
  auto r = table.Observe(Sample(absl::ZeroDuration(), "a", "b", proto::TC_FILE, 3));
  EXPECT_TRUE(table.SetAllocated(r.flow_id, 2.5));
  EXPECT_EQ(table.Find(r.flow_id)->allocated_bandwidth_mbps(), 2.5);
  EXPECT_FALSE(table.SetAllocated(r.flow_id + 100, 1));
}

}  // namespace
}  // namespace flowqos
