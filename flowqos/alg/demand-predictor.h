#ifndef FLOWQOS_ALG_DEMAND_PREDICTOR_H_
#define FLOWQOS_ALG_DEMAND_PREDICTOR_H_

#include <optional>

#include "absl/status/statusor.h"
#include "flowqos/proto/flowqos.pb.h"

namespace flowqos {

// BandwidthPredictor estimates the bandwidth a traffic class will need.
// Implementations may block; errors mean that no prediction is available.
class BandwidthPredictor {
 public:
  virtual ~BandwidthPredictor() = default;

  virtual absl::StatusOr<proto::Prediction> Predict(
      const proto::PredictionRequest& req) = 0;
};

// RuleBasedPredictor scales a per-class base rate by the observed packet
// rate and packet size. Confidence grows as recent history gets steadier.
class RuleBasedPredictor : public BandwidthPredictor {
 public:
  absl::StatusOr<proto::Prediction> Predict(const proto::PredictionRequest& req) override;

  static double BaseMbps(proto::TrafficClass c);
};

struct DemandEstimate {
  double mbps = 0;
  proto::AllocationResult::DemandSource source = proto::AllocationResult::DS_UNSET;
};

// ResolveDemand picks the demand for one class: a prediction trusted at
// confidence_threshold or above, else the observed demand, else the rule's
// minimum, else zero.
DemandEstimate ResolveDemand(const proto::Prediction* prediction,
                             double confidence_threshold,
                             std::optional<double> observed_mbps,
                             const proto::QosRule* rule);

}  // namespace flowqos

#endif  // FLOWQOS_ALG_DEMAND_PREDICTOR_H_
