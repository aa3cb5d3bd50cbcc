#include "flowqos/alg/demand-predictor.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "flowqos/proto/parse-text.h"

namespace flowqos {
namespace {

TEST(RuleBasedPredictorTest, ScalesBaseRate) {
  RuleBasedPredictor predictor;
  auto p = predictor.Predict(ParseTextProto<proto::PredictionRequest>(R"(
    traffic_class: TC_VIDEO
    packet_rate: 500
    average_packet_size: 750
  )"));
  ASSERT_TRUE(p.ok());
  EXPECT_DOUBLE_EQ(p->predicted_bandwidth_mbps(), 5 * 0.5 * 0.5);
  EXPECT_EQ(p->confidence(), 70);
  EXPECT_EQ(p->model_type(), "rule_based");
  EXPECT_EQ(p->traffic_class(), proto::TC_VIDEO);
}

TEST(RuleBasedPredictorTest, CapsFactors) {
  RuleBasedPredictor predictor;
  auto p = predictor.Predict(ParseTextProto<proto::PredictionRequest>(R"(
    traffic_class: TC_FILE
    packet_rate: 100000
    average_packet_size: 9000
  )"));
  ASSERT_TRUE(p.ok());
  EXPECT_DOUBLE_EQ(p->predicted_bandwidth_mbps(), 2 * 2 * 1.5);
}

TEST(RuleBasedPredictorTest, ConfidenceFromRecentVariance) {
  RuleBasedPredictor predictor;

  // Last five entries are constant: variance 0, confidence capped at 95.
  auto steady = predictor.Predict(ParseTextProto<proto::PredictionRequest>(R"(
    traffic_class: TC_VOICE
    throughput_history_mbps: [ 100, 1, 1, 1, 1, 1 ]
  )"));
  ASSERT_TRUE(steady.ok());
  EXPECT_DOUBLE_EQ(steady->confidence(), 95);

  // Last five are 0, 2, 0, 2, 0: mean 0.8, variance 0.96.
  auto noisy = predictor.Predict(ParseTextProto<proto::PredictionRequest>(R"(
    traffic_class: TC_VOICE
    throughput_history_mbps: [ 5, 0, 2, 0, 2, 0 ]
  )"));
  ASSERT_TRUE(noisy.ok());
  EXPECT_NEAR(noisy->confidence(), 90.4, 1e-9);

  auto wild = predictor.Predict(ParseTextProto<proto::PredictionRequest>(R"(
    traffic_class: TC_VOICE
    throughput_history_mbps: [ 0, 0, 50, 0, 50, 0 ]
  )"));
  ASSERT_TRUE(wild.ok());
  EXPECT_DOUBLE_EQ(wild->confidence(), 50);
}

TEST(RuleBasedPredictorTest, RejectsNegativeInputs) {
  RuleBasedPredictor predictor;
  proto::PredictionRequest req;
  req.set_packet_rate(-1);
  EXPECT_EQ(predictor.Predict(req).status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(ResolveDemandTest, PrefersConfidentPrediction) {
  proto::Prediction p;
  p.set_predicted_bandwidth_mbps(12);
  p.set_confidence(50);
  proto::QosRule rule;
  rule.set_min_bandwidth_mbps(3);

  DemandEstimate est = ResolveDemand(&p, 50, 7.0, &rule);
  EXPECT_EQ(est.mbps, 12);
  EXPECT_EQ(est.source, proto::AllocationResult::DS_PREDICTION);

  p.set_confidence(49.9);
  est = ResolveDemand(&p, 50, 7.0, &rule);
  EXPECT_EQ(est.mbps, 7);
  EXPECT_EQ(est.source, proto::AllocationResult::DS_OBSERVED);

  est = ResolveDemand(nullptr, 50, std::nullopt, &rule);
  EXPECT_EQ(est.mbps, 3);
  EXPECT_EQ(est.source, proto::AllocationResult::DS_RULE_MINIMUM);

  est = ResolveDemand(nullptr, 50, std::nullopt, nullptr);
  EXPECT_EQ(est.mbps, 0);
}

}  // namespace
}  // namespace flowqos
