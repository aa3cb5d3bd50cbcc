#include "flowqos/proto/ndjson-recorder.h"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "flowqos/proto/fileio.h"
#include "flowqos/proto/flowqos.pb.h"
#include "flowqos/proto/parse-text.h"
#include "flowqos/proto/testing.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace flowqos {
namespace {

std::string TempPath(const std::string& name) {
  const char* dir = std::getenv("TEST_TMPDIR");
  return absl::StrCat(dir != nullptr ? dir : "/tmp", "/", name, ".ndjson");
}

TEST(NdjsonRecorderTest, RecordsReadBackInOrder) {
  const std::string path = TempPath("ndjson-recorder-alerts");
  auto recorder_or = NdjsonRecorder::Open(path);
  ASSERT_TRUE(recorder_or.ok()) << recorder_or.status();
  NdjsonRecorder& recorder = **recorder_or;
  EXPECT_TRUE(recorder.enabled());

  const auto first = ParseTextProto<proto::Alert>(R"(
    severity: AS_CRITICAL
    title: "Minimum not met"
    message: "voice got 0 of 0.1 Mbps"
  )");
  const auto second = ParseTextProto<proto::Alert>(R"(
    severity: AS_INFO
    title: "Unruled traffic"
    related_flow_id: 7
    resolved: true
  )");
  ASSERT_TRUE(recorder.Record(first).ok());
  ASSERT_TRUE(recorder.Record(second).ok());
  EXPECT_EQ(recorder.num_records(), 2);
  ASSERT_TRUE(recorder.Close().ok());

  std::vector<proto::Alert> got;
  absl::Status st = ReadJsonLines(path, proto::Alert::default_instance(),
                                  [&got](const google::protobuf::Message& m) {
                                    got.push_back(static_cast<const proto::Alert&>(m));
                                  });
  ASSERT_TRUE(st.ok()) << st;
  ASSERT_EQ(got.size(), 2u);
  EXPECT_THAT(got[0], EqProto(first));
  EXPECT_THAT(got[1], EqProto(second));
  std::remove(path.c_str());
}

TEST(NdjsonRecorderTest, RecordAfterCloseFails) {
  const std::string path = TempPath("ndjson-recorder-closed");
  auto recorder_or = NdjsonRecorder::Open(path);
  ASSERT_TRUE(recorder_or.ok()) << recorder_or.status();
  ASSERT_TRUE((*recorder_or)->Close().ok());
  EXPECT_TRUE((*recorder_or)->Close().ok());

  absl::Status st = (*recorder_or)->Record(proto::Alert());
  EXPECT_EQ(st.code(), absl::StatusCode::kFailedPrecondition);
  std::remove(path.c_str());
}

TEST(NdjsonRecorderTest, DisabledDropsRecords) {
  std::unique_ptr<NdjsonRecorder> recorder = NdjsonRecorder::Disabled();
  EXPECT_FALSE(recorder->enabled());
  EXPECT_TRUE(recorder->Record(proto::Alert()).ok());
  EXPECT_EQ(recorder->num_records(), 0);
  EXPECT_TRUE(recorder->Close().ok());
}

TEST(NdjsonRecorderTest, OpenFailsForMissingDirectory) {
  auto recorder_or = NdjsonRecorder::Open("/nonexistent-dir/flowqos/out.ndjson");
  EXPECT_EQ(recorder_or.status().code(), absl::StatusCode::kInternal);
}

TEST(ReadTextProtoFromFileTest, ReportsPosition) {
  const std::string path = TempPath("bad-config");
  FILE* f = std::fopen(path.c_str(), "w");
  ASSERT_NE(f, nullptr);
  std::fputs("severity: AS_WARNING\nbogus_field: 1\n", f);
  std::fclose(f);

  proto::Alert alert;
  absl::Status st = ReadTextProtoFromFile(path, &alert);
  EXPECT_EQ(st.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(std::string(st.message()), testing::HasSubstr(":2:"));
  std::remove(path.c_str());

  EXPECT_EQ(ReadTextProtoFromFile(path, &alert).code(), absl::StatusCode::kNotFound);
}

}  // namespace
}  // namespace flowqos
