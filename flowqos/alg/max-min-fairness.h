#ifndef FLOWQOS_ALG_MAX_MIN_FAIRNESS_H_
#define FLOWQOS_ALG_MAX_MIN_FAIRNESS_H_

#include <vector>

namespace flowqos {

// SingleLinkMaxMinFairnessProblem computes a max-min fair split of some
// shared capacity among individual demands.
//
// Runtime is O(N * log(N)) where N = demands.size().
class SingleLinkMaxMinFairnessProblem {
 public:
  // Computes the max-min fair waterlevel.
  double ComputeWaterlevel(double capacity, const std::vector<double>& demands);

  // Sets allocations[i] = min(demands[i], waterlevel).
  void SetAllocations(double waterlevel, const std::vector<double>& demands,
                      std::vector<double>* allocations);

 private:
  std::vector<double> sorted_demands_buf_;
};

}  // namespace flowqos

#endif  // FLOWQOS_ALG_MAX_MIN_FAIRNESS_H_
