#ifndef FLOWQOS_FLOWS_STATS_AGGREGATOR_H_
#define FLOWQOS_FLOWS_STATS_AGGREGATOR_H_

#include <array>
#include <cstdint>
#include <deque>
#include <vector>

#include "absl/time/time.h"
#include "flowqos/flows/flow-table.h"
#include "flowqos/proto/flowqos.pb.h"
#include "flowqos/traffic/classifier.h"
#include "flowqos/traffic/traffic-class.h"
#include "spdlog/spdlog.h"

namespace flowqos {

struct ClassTickStats {
  int64_t count = 0;
  double sum_throughput_mbps = 0;
  int64_t sum_packet_bytes = 0;

  double avg_throughput_mbps() const {
    return count == 0 ? 0 : sum_throughput_mbps / count;
  }
};

struct TickStats {
  absl::Time now;
  // Indexed by CanonicalRank.
  std::array<ClassTickStats, kQosClasses.size()> per_class;
  int64_t unknown_samples = 0;
  std::vector<proto::Flow> new_flows;
  std::vector<proto::FlowClosed> closed;
};

// StatsAggregator turns each tick's batch of samples into per-class
// statistics and keeps the active flow table current.
class StatsAggregator {
 public:
  struct Config {
    absl::Duration tick_period = absl::Seconds(1);
    absl::Duration silence_interval = absl::Seconds(30);
    int history_length = 100;
  };

  StatsAggregator(Config config, const ClassifierTable* classifier);

  // Ingest classifies samples without a class, groups them by class, folds
  // them into the flow table and expires silent flows.
  TickStats Ingest(absl::Time now, std::vector<proto::TrafficSample> samples);

  // ObservedDemand is the sum of current bandwidth over the active flows of c.
  double ObservedDemand(proto::TrafficClass c) const;
  bool HasActiveFlows(proto::TrafficClass c) const;

  proto::PredictionRequest BuildPredictionRequest(proto::TrafficClass c) const;

  FlowTable& flows() { return flows_; }
  const FlowTable& flows() const { return flows_; }

 private:
  struct ClassHistory {
    std::deque<double> demand_mbps;  // one entry per tick, oldest first
    double packet_rate = 0;
    double average_packet_size = 0;
  };

  const Config config_;
  const ClassifierTable* classifier_;
  spdlog::logger logger_;
  FlowTable flows_;
  std::array<ClassHistory, kQosClasses.size()> history_;
};

proto::TrafficByType ToTrafficByType(const TickStats& stats);

}  // namespace flowqos

#endif  // FLOWQOS_FLOWS_STATS_AGGREGATOR_H_
