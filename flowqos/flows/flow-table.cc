#include "flowqos/flows/flow-table.h"

#include <algorithm>

#include "flowqos/proto/constructors.h"

namespace flowqos {

FlowTable::FlowTable(absl::Duration silence_interval)
    : silence_interval_(silence_interval) {}

FlowTable::ObserveResult FlowTable::Observe(const proto::TrafficSample& sample) {
  FlowKey key{sample.source_endpoint(), sample.dest_endpoint(), sample.traffic_class()};
  ObserveResult result;
  auto id_iter = id_by_key_.find(key);
  if (id_iter == id_by_key_.end()) {
    result.flow_id = next_seqnum_++;
    result.is_new = true;
    id_by_key_[key] = result.flow_id;

    proto::Flow& f = flows_[result.flow_id];
    f.set_id(result.flow_id);
    f.set_source_endpoint(sample.source_endpoint());
    f.set_dest_endpoint(sample.dest_endpoint());
    f.set_traffic_class(sample.traffic_class());
    *f.mutable_started_at() = sample.timestamp();
    *f.mutable_last_seen_at() = sample.timestamp();
  } else {
    result.flow_id = id_iter->second;
  }

  proto::Flow& f = flows_[result.flow_id];
  // Missing throughput counts as zero.
  f.set_current_bandwidth_mbps(sample.has_throughput_mbps() ? sample.throughput_mbps() : 0);
  f.set_packet_count(f.packet_count() + 1);
  f.set_byte_count(f.byte_count() + sample.packet_size());
  if (FromProtoTimestamp(sample.timestamp()) > FromProtoTimestamp(f.last_seen_at())) {
    *f.mutable_last_seen_at() = sample.timestamp();
  }
  return result;
}

std::vector<uint64_t> FlowTable::SortedIds() const {
  std::vector<uint64_t> ids;
  ids.reserve(flows_.size());
  for (const auto& [id, f] : flows_) {
    ids.push_back(id);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

std::vector<proto::FlowClosed> FlowTable::Expire(absl::Time now) {
  std::vector<proto::FlowClosed> closed;
  for (uint64_t id : SortedIds()) {
    auto iter = flows_.find(id);
    if (now - FromProtoTimestamp(iter->second.last_seen_at()) <= silence_interval_) {
      continue;
    }
    proto::FlowClosed c;
    *c.mutable_flow() = std::move(iter->second);
    *c.mutable_closed_at() = ToProtoTimestamp(now);
    id_by_key_.erase(FlowKey{c.flow().source_endpoint(), c.flow().dest_endpoint(),
                             c.flow().traffic_class()});
    flows_.erase(iter);
    closed.push_back(std::move(c));
  }
  return closed;
}

bool FlowTable::SetAllocated(uint64_t flow_id, double mbps) {
  auto iter = flows_.find(flow_id);
  if (iter == flows_.end()) {
    return false;
  }
  iter->second.set_allocated_bandwidth_mbps(mbps);
  return true;
}

void FlowTable::ForEachActiveFlow(
    absl::FunctionRef<void(const proto::Flow&)> func) const {
  for (uint64_t id : SortedIds()) {
    func(flows_.at(id));
  }
}

std::vector<proto::Flow> FlowTable::ActiveFlows() const {
  std::vector<proto::Flow> flows;
  flows.reserve(flows_.size());
  ForEachActiveFlow([&flows](const proto::Flow& f) { flows.push_back(f); });
  return flows;
}

const proto::Flow* FlowTable::Find(uint64_t flow_id) const {
  auto iter = flows_.find(flow_id);
  if (iter == flows_.end()) {
    return nullptr;
  }
  return &iter->second;
}

}  // namespace flowqos
