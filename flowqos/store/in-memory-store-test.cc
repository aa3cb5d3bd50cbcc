#include "flowqos/store/in-memory-store.h"

#include <unistd.h>

#include <cstdio>

#include "absl/strings/str_cat.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "flowqos/proto/constructors.h"
#include "flowqos/proto/fileio.h"
#include "flowqos/proto/testing.h"

namespace flowqos {
namespace {

proto::TrafficSample Sample(int64_t unix_sec, std::string src) {
  return ProtoTrafficSample({
      .timestamp = absl::FromUnixSeconds(unix_sec),
      .source_endpoint = src,
      .dest_endpoint = "sink",
      .traffic_class = proto::TC_FILE,
      .packet_size = 100,
      .throughput_mbps = 1,
  });
}

TEST(InMemoryTrafficStoreTest, CursorAdvances) {
  InMemoryTrafficStore store;
  store.AppendSamples({Sample(1, "a"), Sample(2, "b")});

  auto batch = store.ReadSamplesSince(0);
  ASSERT_TRUE(batch.ok());
  EXPECT_EQ(batch->samples.size(), 2);
  EXPECT_EQ(batch->next_cursor, 2);

  batch = store.ReadSamplesSince(2);
  ASSERT_TRUE(batch.ok());
  EXPECT_TRUE(batch->samples.empty());

  store.AppendSamples({Sample(3, "c")});
  batch = store.ReadSamplesSince(2);
  ASSERT_TRUE(batch.ok());
  ASSERT_EQ(batch->samples.size(), 1);
  EXPECT_THAT(batch->samples[0], EqProto(Sample(3, "c")));
  EXPECT_EQ(batch->next_cursor, 3);
}

TEST(InMemoryTrafficStoreTest, RejectsBadCursor) {
  InMemoryTrafficStore store;
  EXPECT_EQ(store.ReadSamplesSince(5).status().code(), absl::StatusCode::kOutOfRange);
}

TEST(InMemoryTrafficStoreTest, LoadsNdjsonAndRebases) {
  char path[] = "/tmp/flowqos-store-test-XXXXXX";
  int fd = mkstemp(path);
  ASSERT_NE(fd, -1);
  FILE* out = fdopen(fd, "w");
  ASSERT_NE(out, nullptr);
  ASSERT_TRUE(WriteJsonLine(Sample(100, "a"), out).ok());
  ASSERT_TRUE(WriteJsonLine(Sample(110, "b"), out).ok());
  fclose(out);

  InMemoryTrafficStore store;
  ASSERT_TRUE(store.LoadSamplesFromFile(path, absl::FromUnixSeconds(1000)).ok());
  unlink(path);

  auto batch = store.ReadSamplesSince(0);
  ASSERT_TRUE(batch.ok());
  ASSERT_EQ(batch->samples.size(), 2);
  EXPECT_EQ(batch->samples[0].timestamp().seconds(), 990);
  EXPECT_EQ(batch->samples[1].timestamp().seconds(), 1000);
  EXPECT_EQ(batch->samples[1].source_endpoint(), "b");
}

TEST(InMemoryTrafficStoreTest, MissingFileIsAnError) {
  InMemoryTrafficStore store;
  EXPECT_FALSE(store.LoadSamplesFromFile("/nonexistent/flowqos/samples.ndjson").ok());
  EXPECT_EQ(store.num_samples(), 0);
}

TEST(InMemoryTrafficStoreTest, RecordsOutputs) {
  InMemoryTrafficStore store;
  proto::Alert alert;
  alert.set_title("t");
  ASSERT_TRUE(store.RecordAlert(alert).ok());
  proto::Prediction p;
  p.set_traffic_class(proto::TC_VOICE);
  ASSERT_TRUE(store.RecordPrediction(p).ok());
  ASSERT_TRUE(store.RecordFlowClosed(proto::FlowClosed()).ok());
  EXPECT_EQ(store.alerts().size(), 1);
  EXPECT_EQ(store.predictions().size(), 1);
  EXPECT_EQ(store.closed_flows().size(), 1);
}

TEST(InMemoryTrafficStoreTest, ConsumedSamplesAreReleased) {
  InMemoryTrafficStore store;
  store.AppendSamples({Sample(1, "a"), Sample(2, "b"), Sample(3, "c")});
  auto batch = store.ReadSamplesSince(0);
  ASSERT_TRUE(batch.ok());
  EXPECT_EQ(store.num_samples(), 3);

  // Re-reading from the same cursor still works until the reader moves on.
  batch = store.ReadSamplesSince(0);
  ASSERT_TRUE(batch.ok());
  EXPECT_EQ(batch->samples.size(), 3);

  store.AppendSamples({Sample(4, "d")});
  batch = store.ReadSamplesSince(3);
  ASSERT_TRUE(batch.ok());
  ASSERT_EQ(batch->samples.size(), 1);
  EXPECT_EQ(batch->samples[0].source_endpoint(), "d");
  EXPECT_EQ(batch->next_cursor, 4);
  EXPECT_EQ(store.num_samples(), 1);
}

TEST(InMemoryTrafficStoreTest, UnreadSamplesAreBounded) {
  InMemoryTrafficStore store(InMemoryStoreLimits{.max_pending_samples = 2});
  store.AppendSamples({Sample(1, "a"), Sample(2, "b"), Sample(3, "c")});
  EXPECT_EQ(store.num_samples(), 2);
  EXPECT_EQ(store.num_dropped_samples(), 1);

  auto batch = store.ReadSamplesSince(0);
  ASSERT_TRUE(batch.ok());
  ASSERT_EQ(batch->samples.size(), 2);
  EXPECT_EQ(batch->samples[0].source_endpoint(), "b");
  EXPECT_EQ(batch->samples[1].source_endpoint(), "c");
  EXPECT_EQ(batch->next_cursor, 3);
}

TEST(InMemoryTrafficStoreTest, RecordsKeepNewest) {
  InMemoryTrafficStore store(InMemoryStoreLimits{.max_records = 3});
  for (int i = 0; i < 10; ++i) {
    proto::Prediction p;
    p.set_predicted_bandwidth_mbps(i);
    ASSERT_TRUE(store.RecordPrediction(p).ok());
    proto::Alert a;
    a.set_title(absl::StrCat("alert ", i));
    ASSERT_TRUE(store.RecordAlert(a).ok());
    ASSERT_TRUE(store.RecordFlowClosed(proto::FlowClosed()).ok());
  }
  std::vector<proto::Prediction> predictions = store.predictions();
  ASSERT_EQ(predictions.size(), 3);
  EXPECT_EQ(predictions[0].predicted_bandwidth_mbps(), 7);
  EXPECT_EQ(predictions[2].predicted_bandwidth_mbps(), 9);
  std::vector<proto::Alert> alerts = store.alerts();
  ASSERT_EQ(alerts.size(), 3);
  EXPECT_EQ(alerts[0].title(), "alert 7");
  EXPECT_EQ(store.closed_flows().size(), 3);
}

}  // namespace
}  // namespace flowqos
