#ifndef FLOWQOS_STORE_IN_MEMORY_STORE_H_
#define FLOWQOS_STORE_IN_MEMORY_STORE_H_

#include <cstdint>
#include <deque>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "flowqos/store/traffic-store.h"
#include "spdlog/spdlog.h"

namespace flowqos {

struct InMemoryStoreLimits {
  // Samples not yet read past. The oldest are dropped beyond this.
  size_t max_pending_samples = 1 << 20;
  // Each of predictions, alerts and closed flows keeps only its newest
  // max_records entries.
  size_t max_records = 4096;
};

// InMemoryTrafficStore keeps everything in process memory. It backs the
// monitor, which fills it from a replay file and the AppendSamples RPC, and
// is used in tests.
//
// Cursors are absolute sample offsets. Samples below the cursor passed to
// ReadSamplesSince are discarded, so there must be a single reader.
class InMemoryTrafficStore : public TrafficStore, public SampleSink {
 public:
  InMemoryTrafficStore();
  explicit InMemoryTrafficStore(InMemoryStoreLimits limits);

  absl::StatusOr<SampleBatch> ReadSamplesSince(int64_t cursor) override;
  absl::Status RecordPrediction(const proto::Prediction& prediction) override;
  absl::Status RecordAlert(const proto::Alert& alert) override;
  absl::Status RecordFlowClosed(const proto::FlowClosed& closed) override;

  void AppendSamples(absl::Span<const proto::TrafficSample> samples) override;

  // LoadSamplesFromFile appends every TrafficSample from an NDJSON file.
  // If rebase_to is not InfinitePast, timestamps are shifted so that the
  // newest sample lands at rebase_to.
  absl::Status LoadSamplesFromFile(const std::string& path,
                                   absl::Time rebase_to = absl::InfinitePast());

  std::vector<proto::Prediction> predictions() const;
  std::vector<proto::Alert> alerts() const;
  std::vector<proto::FlowClosed> closed_flows() const;
  // num_samples counts samples still held, not every sample ever appended.
  size_t num_samples() const;
  int64_t num_dropped_samples() const;

 private:
  const InMemoryStoreLimits limits_;
  spdlog::logger logger_;

  mutable absl::Mutex mu_;
  std::deque<proto::TrafficSample> samples_ ABSL_GUARDED_BY(mu_);
  int64_t first_offset_ ABSL_GUARDED_BY(mu_) = 0;  // offset of samples_.front()
  int64_t num_dropped_ ABSL_GUARDED_BY(mu_) = 0;
  std::deque<proto::Prediction> predictions_ ABSL_GUARDED_BY(mu_);
  std::deque<proto::Alert> alerts_ ABSL_GUARDED_BY(mu_);
  std::deque<proto::FlowClosed> closed_ ABSL_GUARDED_BY(mu_);
};

}  // namespace flowqos

#endif  // FLOWQOS_STORE_IN_MEMORY_STORE_H_
