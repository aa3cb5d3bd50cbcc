#include "flowqos/flows/stats-aggregator.h"

#include <algorithm>

#include "flowqos/log/spdlog.h"
#include "flowqos/proto/constructors.h"

namespace flowqos {

StatsAggregator::StatsAggregator(Config config, const ClassifierTable* classifier)
    : config_(config),
      classifier_(classifier),
      logger_(MakeLogger("stats-aggregator")),
      flows_(config.silence_interval) {}

TickStats StatsAggregator::Ingest(absl::Time now,
                                  std::vector<proto::TrafficSample> samples) {
  std::stable_sort(samples.begin(), samples.end(),
                   [](const proto::TrafficSample& lhs, const proto::TrafficSample& rhs) {
                     return FromProtoTimestamp(lhs.timestamp()) <
                            FromProtoTimestamp(rhs.timestamp());
                   });

  TickStats stats;
  stats.now = now;
  for (proto::TrafficSample& s : samples) {
    if (s.traffic_class() == proto::TC_UNSPECIFIED) {
      s.set_traffic_class(classifier_->Classify(MetaFromSample(s)));
    }
    if (!IsQosClass(s.traffic_class())) {
      ++stats.unknown_samples;
      SPDLOG_LOGGER_DEBUG(&logger_, "unclassified sample {} -> {} ports {}->{} app '{}'",
                          s.source_endpoint(), s.dest_endpoint(), s.src_port(),
                          s.dst_port(), s.app_protocol());
      continue;
    }

    ClassTickStats& cs = stats.per_class[CanonicalRank(s.traffic_class())];
    cs.count++;
    cs.sum_throughput_mbps += s.has_throughput_mbps() ? s.throughput_mbps() : 0;
    cs.sum_packet_bytes += s.packet_size();

    FlowTable::ObserveResult r = flows_.Observe(s);
    if (r.is_new) {
      stats.new_flows.push_back(*flows_.Find(r.flow_id));
    }
  }

  stats.closed = flows_.Expire(now);
  for (const proto::FlowClosed& c : stats.closed) {
    SPDLOG_LOGGER_INFO(&logger_, "flow {} ({} -> {}, {}) expired after {} packets",
                       c.flow().id(), c.flow().source_endpoint(),
                       c.flow().dest_endpoint(),
                       TrafficClassName(c.flow().traffic_class()),
                       c.flow().packet_count());
  }
  // A flow that appeared and expired in the same tick is not reported as new.
  stats.new_flows.erase(
      std::remove_if(stats.new_flows.begin(), stats.new_flows.end(),
                     [this](const proto::Flow& f) {
                       return flows_.Find(f.id()) == nullptr;
                     }),
      stats.new_flows.end());
  for (proto::Flow& f : stats.new_flows) {
    f = *flows_.Find(f.id());
  }

  const double tick_sec = absl::ToDoubleSeconds(config_.tick_period);
  for (proto::TrafficClass c : kQosClasses) {
    const int rank = CanonicalRank(c);
    ClassHistory& h = history_[rank];
    h.demand_mbps.push_back(ObservedDemand(c));
    const size_t max_len = std::max(config_.history_length, 1);
    while (h.demand_mbps.size() > max_len) {
      h.demand_mbps.pop_front();
    }
    const ClassTickStats& cs = stats.per_class[rank];
    h.packet_rate = tick_sec > 0 ? cs.count / tick_sec : 0;
    h.average_packet_size =
        cs.count == 0 ? 0 : static_cast<double>(cs.sum_packet_bytes) / cs.count;
  }
  return stats;
}

double StatsAggregator::ObservedDemand(proto::TrafficClass c) const {
  double sum = 0;
  flows_.ForEachActiveFlow([c, &sum](const proto::Flow& f) {
    if (f.traffic_class() == c) {
      sum += f.current_bandwidth_mbps();
    }
  });
  return sum;
}

bool StatsAggregator::HasActiveFlows(proto::TrafficClass c) const {
  bool found = false;
  flows_.ForEachActiveFlow([c, &found](const proto::Flow& f) {
    if (f.traffic_class() == c) {
      found = true;
    }
  });
  return found;
}

proto::PredictionRequest StatsAggregator::BuildPredictionRequest(
    proto::TrafficClass c) const {
  proto::PredictionRequest req;
  req.set_traffic_class(c);
  if (!IsQosClass(c)) {
    return req;
  }
  const ClassHistory& h = history_[CanonicalRank(c)];
  for (double d : h.demand_mbps) {
    req.add_throughput_history_mbps(d);
  }
  req.set_packet_rate(h.packet_rate);
  req.set_average_packet_size(h.average_packet_size);
  req.set_current_throughput_mbps(ObservedDemand(c));
  return req;
}

proto::TrafficByType ToTrafficByType(const TickStats& stats) {
  proto::TrafficByType by_type;
  *by_type.mutable_timestamp() = ToProtoTimestamp(stats.now);
  auto fill = [&stats](proto::TrafficClass c, proto::ClassStats* out) {
    const ClassTickStats& cs = stats.per_class[CanonicalRank(c)];
    out->set_count(cs.count);
    out->set_avg_throughput_mbps(cs.avg_throughput_mbps());
  };
  fill(proto::TC_VIDEO, by_type.mutable_video());
  fill(proto::TC_VOICE, by_type.mutable_voice());
  fill(proto::TC_FILE, by_type.mutable_file());
  fill(proto::TC_BACKGROUND, by_type.mutable_background());
  return by_type;
}

}  // namespace flowqos
