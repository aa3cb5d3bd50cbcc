#include "flowqos/alg/demand-predictor.h"

#include <algorithm>

#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "flowqos/proto/constructors.h"
#include "flowqos/traffic/traffic-class.h"

namespace flowqos {

namespace {

constexpr int kConfidenceWindow = 5;

double Variance(const double* begin, const double* end) {
  const double n = end - begin;
  double mean = 0;
  for (const double* p = begin; p != end; ++p) {
    mean += *p;
  }
  mean /= n;
  double var = 0;
  for (const double* p = begin; p != end; ++p) {
    var += (*p - mean) * (*p - mean);
  }
  return var / n;
}

}  // namespace

double RuleBasedPredictor::BaseMbps(proto::TrafficClass c) {
  switch (c) {
    case proto::TC_VIDEO:
      return 5;
    case proto::TC_VOICE:
      return 0.1;
    case proto::TC_FILE:
      return 2;
    case proto::TC_BACKGROUND:
      return 0.5;
    default:
      return 1;
  }
}

absl::StatusOr<proto::Prediction> RuleBasedPredictor::Predict(
    const proto::PredictionRequest& req) {
  if (req.packet_rate() < 0 || req.average_packet_size() < 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("negative packet rate or size for ",
                     TrafficClassName(req.traffic_class())));
  }
  const double rate_factor = std::min(req.packet_rate() / 1000.0, 2.0);
  const double size_factor = std::min(req.average_packet_size() / 1500.0, 1.5);

  double confidence = 70;
  const auto& hist = req.throughput_history_mbps();
  if (hist.size() > kConfidenceWindow) {
    const double* end = hist.data() + hist.size();
    confidence = std::clamp(100 - 10 * Variance(end - kConfidenceWindow, end), 50.0, 95.0);
  }

  proto::Prediction p;
  p.set_traffic_class(req.traffic_class());
  p.set_predicted_bandwidth_mbps(BaseMbps(req.traffic_class()) * rate_factor *
                                 size_factor);
  p.set_confidence(confidence);
  *p.mutable_produced_at() = ToProtoTimestamp(absl::Now());
  p.set_model_type("rule_based");
  return p;
}

DemandEstimate ResolveDemand(const proto::Prediction* prediction,
                             double confidence_threshold,
                             std::optional<double> observed_mbps,
                             const proto::QosRule* rule) {
  DemandEstimate est;
  if (prediction != nullptr && prediction->confidence() >= confidence_threshold) {
    est.mbps = std::max(prediction->predicted_bandwidth_mbps(), 0.0);
    est.source = proto::AllocationResult::DS_PREDICTION;
  } else if (observed_mbps.has_value()) {
    est.mbps = std::max(*observed_mbps, 0.0);
    est.source = proto::AllocationResult::DS_OBSERVED;
  } else {
    est.mbps = rule != nullptr ? rule->min_bandwidth_mbps() : 0;
    est.source = proto::AllocationResult::DS_RULE_MINIMUM;
  }
  return est;
}

}  // namespace flowqos
