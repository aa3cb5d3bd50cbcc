#ifndef FLOWQOS_FLOWS_FLOW_TABLE_H_
#define FLOWQOS_FLOWS_FLOW_TABLE_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/functional/function_ref.h"
#include "absl/time/time.h"
#include "flowqos/proto/flowqos.pb.h"

namespace flowqos {

struct FlowKey {
  std::string source_endpoint;
  std::string dest_endpoint;
  proto::TrafficClass traffic_class = proto::TC_UNSPECIFIED;

  bool operator==(const FlowKey& other) const {
    return source_endpoint == other.source_endpoint &&
           dest_endpoint == other.dest_endpoint && traffic_class == other.traffic_class;
  }

  template <typename H>
  friend H AbslHashValue(H h, const FlowKey& k) {
    return H::combine(std::move(h), k.source_endpoint, k.dest_endpoint,
                      static_cast<int>(k.traffic_class));
  }
};

// FlowTable holds the active flows, keyed by (source, destination, class).
//
// Flow ids come from a sequence number and are never reused. The table is
// owned by the tick driver and is not thread-safe.
class FlowTable {
 public:
  explicit FlowTable(absl::Duration silence_interval);

  struct ObserveResult {
    uint64_t flow_id = 0;
    bool is_new = false;
  };

  // Observe folds sample into the flow for its key, creating the flow on first sight.
  // sample.traffic_class must already be set.
  ObserveResult Observe(const proto::TrafficSample& sample);

  // Expire removes every flow whose last sample is older than the silence
  // interval at now, and returns the closures in flow id order.
  std::vector<proto::FlowClosed> Expire(absl::Time now);

  // SetAllocated records the allocation engine's share for a flow.
  // Returns false if the flow is not active.
  bool SetAllocated(uint64_t flow_id, double mbps);

  // ForEachActiveFlow visits flows in increasing id order.
  void ForEachActiveFlow(absl::FunctionRef<void(const proto::Flow&)> func) const;

  std::vector<proto::Flow> ActiveFlows() const;
  const proto::Flow* Find(uint64_t flow_id) const;

  size_t size() const { return flows_.size(); }

 private:
  std::vector<uint64_t> SortedIds() const;

  const absl::Duration silence_interval_;
  uint64_t next_seqnum_ = 1;
  absl::flat_hash_map<FlowKey, uint64_t> id_by_key_;
  absl::flat_hash_map<uint64_t, proto::Flow> flows_;
};

}  // namespace flowqos

#endif  // FLOWQOS_FLOWS_FLOW_TABLE_H_
