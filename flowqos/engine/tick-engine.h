#ifndef FLOWQOS_ENGINE_TICK_ENGINE_H_
#define FLOWQOS_ENGINE_TICK_ENGINE_H_

#include <atomic>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "flowqos/alg/alert-evaluator.h"
#include "flowqos/alg/demand-predictor.h"
#include "flowqos/alg/qos-allocator.h"
#include "flowqos/broadcast/broadcaster.h"
#include "flowqos/engine/options.h"
#include "flowqos/flows/stats-aggregator.h"
#include "flowqos/proto/flowqos.pb.h"
#include "flowqos/proto/ndjson-recorder.h"
#include "flowqos/rules/rule-store.h"
#include "flowqos/store/traffic-store.h"
#include "flowqos/threads/deadline-runner.h"
#include "flowqos/threads/mutex-helpers.h"
#include "flowqos/traffic/classifier.h"
#include "spdlog/spdlog.h"

namespace flowqos {

constexpr char kUpstreamDegradedTitle[] = "Upstream read degraded";
constexpr char kPredictorUnavailableTitle[] = "Predictor unavailable";

// TickEngine runs the per-tick pipeline:
//   read samples -> aggregate -> predict -> allocate -> alert -> broadcast
//
// Calls to the store are bounded by upstream_timeout each, and all of a
// tick's predictor calls together by predictor_timeout. The sample read and
// the writes to the store happen outside the state lock. If the sample read
// fails, the previous tick's messages and alerts are repeated with a
// degraded-mode alert added.
class TickEngine {
 public:
  struct Deps {
    TrafficStore* store = nullptr;
    BandwidthPredictor* predictor = nullptr;
    RuleStore* rules = nullptr;
    Broadcaster* broadcaster = nullptr;
    const ClassifierTable* classifier = nullptr;  // defaults to DefaultClassifierTable
    NdjsonRecorder* alloc_recorder = nullptr;     // optional
    NdjsonRecorder* alert_recorder = nullptr;     // optional
  };

  TickEngine(const EngineOptions& options, Deps deps);

  // Tick runs one cycle. Timestamps are forced to increase across ticks.
  // Concurrent calls run one after another.
  void Tick(absl::Time now);

  // Drain broadcasts every unresolved alert one last time. Call at shutdown.
  void Drain(absl::Time now);

  uint64_t num_ticks() const;
  int64_t num_degraded_ticks() const;

 private:
  struct ClassDemand {
    std::map<proto::TrafficClass, double> mbps;
    std::map<proto::TrafficClass, proto::AllocationResult::DemandSource> source;
    std::vector<proto::Prediction> predictions;
    bool predictor_failed = false;
  };

  // Tick output that still has to be written to the store.
  struct TickOutput {
    uint64_t tick = 0;
    std::vector<proto::FlowClosed> closed;
    std::vector<proto::Prediction> predictions;
    std::vector<proto::Alert> alerts;
  };

  absl::Time NextTimestamp(absl::Time now) ABSL_EXCLUSIVE_LOCKS_REQUIRED(state_mu_);

  TickOutput RunHealthy(absl::Time now, const std::vector<proto::QosRule>& rules,
                        std::vector<proto::TrafficSample> samples)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(state_mu_);

  ClassDemand ComputeDemand(const std::vector<proto::QosRule>& rules)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(state_mu_);
  void AssignFlowAllocations(const std::vector<proto::AllocationResult>& results)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(state_mu_);

  TickOutput PublishDegraded(absl::Time now, const absl::Status& read_status)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(state_mu_);
  void PublishAlertChanges(absl::Time now, const AlertBook::Changes& changes)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(state_mu_);
  void Persist(TickOutput out);

  const EngineOptions options_;
  const Deps deps_;
  mutable spdlog::logger logger_;

  DeadlineRunner upstream_runner_;
  DeadlineRunner predictor_runner_;

  // Serializes Tick. Taken before state_mu_.
  absl::Mutex tick_mu_;
  int64_t cursor_ ABSL_GUARDED_BY(tick_mu_) = 0;

  mutable TimedMutex state_mu_;
  StatsAggregator aggregator_ ABSL_GUARDED_BY(state_mu_);
  QosAllocator allocator_ ABSL_GUARDED_BY(state_mu_);
  SustainedOverDemandTracker over_demand_ ABSL_GUARDED_BY(state_mu_);
  AlertBook alert_book_ ABSL_GUARDED_BY(state_mu_);
  uint64_t tick_ ABSL_GUARDED_BY(state_mu_) = 0;
  int64_t num_degraded_ticks_ ABSL_GUARDED_BY(state_mu_) = 0;
  absl::Time last_now_ ABSL_GUARDED_BY(state_mu_) = absl::InfinitePast();
  // traffic, traffic-by-type and allocation messages of the last healthy tick
  std::vector<proto::BroadcastMessage> last_messages_ ABSL_GUARDED_BY(state_mu_);
  // alert candidates of the last healthy tick, raised again on degraded ticks
  std::vector<proto::Alert> last_candidates_ ABSL_GUARDED_BY(state_mu_);
};

// RunLoop ticks the engine every tick_period until should_exit is set.
void RunLoop(TickEngine* engine, absl::Duration tick_period,
             std::atomic<bool>* should_exit, spdlog::logger* logger);

}  // namespace flowqos

#endif  // FLOWQOS_ENGINE_TICK_ENGINE_H_
