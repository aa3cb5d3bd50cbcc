#ifndef FLOWQOS_ALG_ALERT_EVALUATOR_H_
#define FLOWQOS_ALG_ALERT_EVALUATOR_H_

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/time/time.h"
#include "absl/types/span.h"
#include "flowqos/proto/flowqos.pb.h"
#include "flowqos/traffic/traffic-class.h"
#include "spdlog/spdlog.h"

namespace flowqos {

proto::Alert MakeAlert(proto::AlertSeverity severity, std::string title,
                       std::string message, absl::Time now,
                       std::optional<uint64_t> related_flow_id = std::nullopt);

// SustainedOverDemandTracker counts, per class, how many consecutive ticks
// the requested bandwidth exceeded factor times the allocation.
class SustainedOverDemandTracker {
 public:
  explicit SustainedOverDemandTracker(int num_ticks = 3, double factor = 2);

  // Update returns the classes that have been over-demanded for at least
  // num_ticks consecutive ticks, in canonical order.
  std::vector<proto::TrafficClass> Update(
      absl::Span<const proto::AllocationResult> allocations);

 private:
  const int num_ticks_;
  const double factor_;
  std::array<int, kQosClasses.size()> streak_{};
};

// DeriveAlerts maps one tick's results to candidate alerts:
//   critical  minimum not met for a class whose rule has priority >= 3
//   warning   minimum not met for any other class
//   warning   sustained over-demand
//   info      a new flow of a class without an enabled rule
std::vector<proto::Alert> DeriveAlerts(
    absl::Time now, absl::Span<const proto::AllocationResult> allocations,
    absl::Span<const proto::QosRule> rules,
    absl::Span<const proto::TrafficClass> over_demanded,
    absl::Span<const proto::Flow> new_flows);

// AlertBook deduplicates alerts and tracks which are still active.
//
// Alerts are keyed by (severity, title, related flow id). A key that is
// raised again within the cool-down of its last emission is suppressed.
// A key that has not been raised for a full cool-down is resolved.
class AlertBook {
 public:
  explicit AlertBook(absl::Duration cooldown);

  struct Changes {
    std::vector<proto::Alert> raised;
    std::vector<proto::Alert> resolved;

    bool empty() const { return raised.empty() && resolved.empty(); }
  };

  Changes Update(absl::Time now, absl::Span<const proto::Alert> candidates);

  // Active returns the unresolved alerts, most severe first, then oldest first.
  std::vector<proto::Alert> Active() const;
  const proto::Alert* FindActive(const proto::Alert& like) const;
  int64_t num_active() const { return active_.size(); }

 private:
  using Key = std::tuple<int, std::string, uint64_t>;

  struct Entry {
    proto::Alert alert;
    absl::Time last_emitted;
    absl::Time last_raised;
    uint64_t seqnum;
  };

  static Key KeyOf(const proto::Alert& alert);

  const absl::Duration cooldown_;
  spdlog::logger logger_;
  uint64_t next_seqnum_ = 0;
  absl::flat_hash_map<Key, Entry> active_;
};

}  // namespace flowqos

#endif  // FLOWQOS_ALG_ALERT_EVALUATOR_H_
