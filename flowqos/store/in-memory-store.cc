#include "flowqos/store/in-memory-store.h"

#include <algorithm>

#include "absl/strings/str_cat.h"
#include "flowqos/log/spdlog.h"
#include "flowqos/proto/constructors.h"
#include "flowqos/proto/fileio.h"

namespace flowqos {

namespace {

template <typename T>
void PushBounded(std::deque<T>* records, const T& r, size_t max_records) {
  records->push_back(r);
  while (records->size() > max_records) {
    records->pop_front();
  }
}

}  // namespace

InMemoryTrafficStore::InMemoryTrafficStore()
    : InMemoryTrafficStore(InMemoryStoreLimits()) {}

InMemoryTrafficStore::InMemoryTrafficStore(InMemoryStoreLimits limits)
    : limits_(limits), logger_(MakeLogger("in-memory-store")) {}

absl::StatusOr<SampleBatch> InMemoryTrafficStore::ReadSamplesSince(int64_t cursor) {
  absl::MutexLock l(&mu_);
  const int64_t end_offset = first_offset_ + static_cast<int64_t>(samples_.size());
  if (cursor < 0 || cursor > end_offset) {
    return absl::OutOfRangeError(
        absl::StrCat("cursor ", cursor, " outside [0, ", end_offset, "]"));
  }
  // Everything below cursor has been consumed.
  while (first_offset_ < cursor) {
    samples_.pop_front();
    ++first_offset_;
  }
  SampleBatch batch;
  batch.samples.assign(samples_.begin(), samples_.end());
  batch.next_cursor = end_offset;
  return batch;
}

absl::Status InMemoryTrafficStore::RecordPrediction(const proto::Prediction& prediction) {
  absl::MutexLock l(&mu_);
  PushBounded(&predictions_, prediction, limits_.max_records);
  return absl::OkStatus();
}

absl::Status InMemoryTrafficStore::RecordAlert(const proto::Alert& alert) {
  absl::MutexLock l(&mu_);
  PushBounded(&alerts_, alert, limits_.max_records);
  return absl::OkStatus();
}

absl::Status InMemoryTrafficStore::RecordFlowClosed(const proto::FlowClosed& closed) {
  absl::MutexLock l(&mu_);
  PushBounded(&closed_, closed, limits_.max_records);
  return absl::OkStatus();
}

void InMemoryTrafficStore::AppendSamples(
    absl::Span<const proto::TrafficSample> samples) {
  absl::MutexLock l(&mu_);
  samples_.insert(samples_.end(), samples.begin(), samples.end());
  int64_t dropped = 0;
  while (samples_.size() > limits_.max_pending_samples) {
    samples_.pop_front();
    ++first_offset_;
    ++dropped;
  }
  if (dropped > 0) {
    num_dropped_ += dropped;
    SPDLOG_LOGGER_WARN(&logger_, "dropped {} unread samples ({} total)", dropped,
                       num_dropped_);
  }
}

absl::Status InMemoryTrafficStore::LoadSamplesFromFile(const std::string& path,
                                                       absl::Time rebase_to) {
  std::vector<proto::TrafficSample> loaded;
  absl::Status st = ReadJsonLines(path, proto::TrafficSample::default_instance(),
                                  [&loaded](const google::protobuf::Message& m) {
                                    loaded.push_back(
                                        static_cast<const proto::TrafficSample&>(m));
                                  });
  if (!st.ok()) {
    return st;
  }
  if (rebase_to != absl::InfinitePast() && !loaded.empty()) {
    absl::Time newest = absl::InfinitePast();
    for (const proto::TrafficSample& s : loaded) {
      newest = std::max(newest, FromProtoTimestamp(s.timestamp()));
    }
    const absl::Duration shift = rebase_to - newest;
    for (proto::TrafficSample& s : loaded) {
      *s.mutable_timestamp() = ToProtoTimestamp(FromProtoTimestamp(s.timestamp()) + shift);
    }
  }
  AppendSamples(loaded);
  return absl::OkStatus();
}

std::vector<proto::Prediction> InMemoryTrafficStore::predictions() const {
  absl::MutexLock l(&mu_);
  return std::vector<proto::Prediction>(predictions_.begin(), predictions_.end());
}

std::vector<proto::Alert> InMemoryTrafficStore::alerts() const {
  absl::MutexLock l(&mu_);
  return std::vector<proto::Alert>(alerts_.begin(), alerts_.end());
}

std::vector<proto::FlowClosed> InMemoryTrafficStore::closed_flows() const {
  absl::MutexLock l(&mu_);
  return std::vector<proto::FlowClosed>(closed_.begin(), closed_.end());
}

size_t InMemoryTrafficStore::num_samples() const {
  absl::MutexLock l(&mu_);
  return samples_.size();
}

int64_t InMemoryTrafficStore::num_dropped_samples() const {
  absl::MutexLock l(&mu_);
  return num_dropped_;
}

}  // namespace flowqos
