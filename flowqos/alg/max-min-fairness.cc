#include "flowqos/alg/max-min-fairness.h"

#include <algorithm>

#include "absl/base/macros.h"

namespace flowqos {

double SingleLinkMaxMinFairnessProblem::ComputeWaterlevel(
    double capacity, const std::vector<double>& demands) {
  ABSL_ASSERT(capacity >= 0);

  // Sort all demands in increasing order to make it easy to track how many
  // demands have been satisfied (or not).
  sorted_demands_buf_ = demands;
  std::sort(sorted_demands_buf_.begin(), sorted_demands_buf_.end());

  // Progressively raise the waterlevel, and mark any demands that can be
  // satisfied as we go.
  double waterlevel = 0;
  size_t next = 0;
  while (next < sorted_demands_buf_.size()) {
    const double delta = std::max(sorted_demands_buf_[next] - waterlevel, 0.0);
    const double num_unsatisfied = sorted_demands_buf_.size() - next;

    const double ask = delta * num_unsatisfied;
    if (ask <= capacity) {
      waterlevel += delta;
      capacity -= ask;
      next++;
    } else {
      // Since we cannot satisfy any more demands, evenly divide the remaining
      // capacity across the unsatisfied demands.
      waterlevel += capacity / num_unsatisfied;
      break;
    }
  }

  return waterlevel;
}

void SingleLinkMaxMinFairnessProblem::SetAllocations(double waterlevel,
                                                     const std::vector<double>& demands,
                                                     std::vector<double>* allocations) {
  allocations->resize(demands.size(), 0);
  for (size_t i = 0; i < demands.size(); i++) {
    (*allocations)[i] = std::min(waterlevel, demands[i]);
  }
}

}  // namespace flowqos
