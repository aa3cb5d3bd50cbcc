#include "flowqos/alg/max-min-fairness.h"

#include <numeric>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace flowqos {
namespace {

using ::testing::DoubleEq;
using ::testing::DoubleNear;
using ::testing::ElementsAre;
using ::testing::SizeIs;

TEST(SingleLinkMaxMinFairnessProblemTest, NoRequests) {
  SingleLinkMaxMinFairnessProblem problem;
  std::vector<double> result;
  double waterlevel = problem.ComputeWaterlevel(100, {});
  problem.SetAllocations(waterlevel, {}, &result);
  EXPECT_EQ(waterlevel, 0);
  EXPECT_THAT(result, SizeIs(0));
}

TEST(SingleLinkMaxMinFairnessProblemTest, AllSatisfied) {
  SingleLinkMaxMinFairnessProblem problem;
  std::vector<double> demands{3, 1.5, 9};
  std::vector<double> result;
  double waterlevel = problem.ComputeWaterlevel(20, demands);
  problem.SetAllocations(waterlevel, demands, &result);
  EXPECT_DOUBLE_EQ(waterlevel, 9);
  EXPECT_THAT(result, ElementsAre(DoubleEq(3), DoubleEq(1.5), DoubleEq(9)));
}

TEST(SingleLinkMaxMinFairnessProblemTest, SplitsEvenlyAboveSmallDemands) {
  SingleLinkMaxMinFairnessProblem problem;
  std::vector<double> demands{2, 50, 30};
  std::vector<double> result;
  double waterlevel = problem.ComputeWaterlevel(24.6, demands);
  problem.SetAllocations(waterlevel, demands, &result);
  EXPECT_NEAR(waterlevel, 11.3, 1e-9);
  EXPECT_THAT(result,
              ElementsAre(DoubleEq(2), DoubleNear(11.3, 1e-9), DoubleNear(11.3, 1e-9)));
  EXPECT_NEAR(std::accumulate(result.begin(), result.end(), 0.0), 24.6, 1e-9);
}

TEST(SingleLinkMaxMinFairnessProblemTest, ZeroCapacity) {
  SingleLinkMaxMinFairnessProblem problem;
  std::vector<double> demands{4, 0, 8};
  std::vector<double> result;
  double waterlevel = problem.ComputeWaterlevel(0, demands);
  problem.SetAllocations(waterlevel, demands, &result);
  EXPECT_EQ(waterlevel, 0);
  EXPECT_THAT(result, ElementsAre(0, 0, 0));
}

}  // namespace
}  // namespace flowqos
