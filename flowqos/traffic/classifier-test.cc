#include "flowqos/traffic/classifier.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace flowqos {
namespace {

proto::RawPacketMeta Meta(int32_t src_port, int32_t dst_port, std::string app = "") {
  proto::RawPacketMeta meta;
  meta.set_src_port(src_port);
  meta.set_dst_port(dst_port);
  meta.set_protocol(proto::TP_TCP);
  meta.set_app_protocol(app);
  return meta;
}

TEST(ClassifierTest, DefaultPorts) {
  const ClassifierTable& t = DefaultClassifierTable();
  EXPECT_EQ(t.Classify(Meta(50000, 1935)), proto::TC_VIDEO);
  EXPECT_EQ(t.Classify(Meta(50000, 6975)), proto::TC_VIDEO);
  EXPECT_EQ(t.Classify(Meta(50000, 5061)), proto::TC_VOICE);
  EXPECT_EQ(t.Classify(Meta(50000, 16390)), proto::TC_VOICE);
  EXPECT_EQ(t.Classify(Meta(50000, 22)), proto::TC_FILE);
  EXPECT_EQ(t.Classify(Meta(50000, 8443)), proto::TC_FILE);
  EXPECT_EQ(t.Classify(Meta(50000, 53)), proto::TC_BACKGROUND);
  EXPECT_EQ(t.Classify(Meta(50000, 5432)), proto::TC_BACKGROUND);
}

TEST(ClassifierTest, DestinationPortBeforeSourcePort) {
  const ClassifierTable& t = DefaultClassifierTable();
  EXPECT_EQ(t.Classify(Meta(53, 1935)), proto::TC_VIDEO);
  EXPECT_EQ(t.Classify(Meta(5060, 40000)), proto::TC_VOICE);
}

TEST(ClassifierTest, FallsBackToAppProtocol) {
  const ClassifierTable& t = DefaultClassifierTable();
  EXPECT_EQ(t.Classify(Meta(40000, 40001, "SIP")), proto::TC_VOICE);
  EXPECT_EQ(t.Classify(Meta(40000, 40001, "rtsp")), proto::TC_VIDEO);
  EXPECT_EQ(t.Classify(Meta(40000, 40001, "postgresql")), proto::TC_BACKGROUND);
  EXPECT_EQ(t.Classify(Meta(40000, 40001, "smb")), proto::TC_FILE);
}

TEST(ClassifierTest, UnmatchedIsUnknown) {
  const ClassifierTable& t = DefaultClassifierTable();
  EXPECT_EQ(t.Classify(Meta(40000, 40001)), proto::TC_UNKNOWN);
  EXPECT_EQ(t.Classify(Meta(40000, 40001, "gopher")), proto::TC_UNKNOWN);
}

TEST(ClassifierTest, DefaultTableIsDisjoint) {
  EXPECT_TRUE(ClassifierTable::Create(DefaultClassifierEntries()).ok());
}

TEST(ClassifierTest, RejectsOverlappingPorts) {
  auto table_or = ClassifierTable::Create({
      {proto::TC_VIDEO, {{5000, 5010}}, {}},
      {proto::TC_VOICE, {{5010, 5020}}, {}},
  });
  EXPECT_EQ(table_or.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(ClassifierTest, RejectsSharedProtocol) {
  auto table_or = ClassifierTable::Create({
      {proto::TC_VIDEO, {}, {"rtp"}},
      {proto::TC_VOICE, {}, {"RTP"}},
  });
  EXPECT_EQ(table_or.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(ClassifierTest, RejectsBadRangeAndNonQosClass) {
  EXPECT_FALSE(ClassifierTable::Create({{proto::TC_FILE, {{30, 20}}, {}}}).ok());
  EXPECT_FALSE(ClassifierTable::Create({{proto::TC_UNKNOWN, {{1, 2}}, {}}}).ok());
}

}  // namespace
}  // namespace flowqos
