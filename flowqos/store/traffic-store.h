#ifndef FLOWQOS_STORE_TRAFFIC_STORE_H_
#define FLOWQOS_STORE_TRAFFIC_STORE_H_

#include <cstdint>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "flowqos/proto/flowqos.pb.h"

namespace flowqos {

struct SampleBatch {
  std::vector<proto::TrafficSample> samples;
  int64_t next_cursor = 0;
};

// TrafficStore is the persistence collaborator. Calls may block, so the
// engine always makes them through a DeadlineRunner.
class TrafficStore {
 public:
  virtual ~TrafficStore() = default;

  // ReadSamplesSince returns the samples recorded at or after cursor (an
  // offset) and the cursor to use on the next call. Gaps and duplicate
  // samples are tolerated by the caller.
  virtual absl::StatusOr<SampleBatch> ReadSamplesSince(int64_t cursor) = 0;

  virtual absl::Status RecordPrediction(const proto::Prediction& prediction) = 0;
  virtual absl::Status RecordAlert(const proto::Alert& alert) = 0;
  virtual absl::Status RecordFlowClosed(const proto::FlowClosed& closed) = 0;
};

// SampleSink accepts samples from live producers.
class SampleSink {
 public:
  virtual ~SampleSink() = default;

  virtual void AppendSamples(absl::Span<const proto::TrafficSample> samples) = 0;
};

}  // namespace flowqos

#endif  // FLOWQOS_STORE_TRAFFIC_STORE_H_
