#ifndef FLOWQOS_ALG_QOS_ALLOCATOR_H_
#define FLOWQOS_ALG_QOS_ALLOCATOR_H_

#include <map>
#include <vector>

#include "absl/types/span.h"
#include "flowqos/alg/max-min-fairness.h"
#include "flowqos/proto/flowqos.pb.h"
#include "spdlog/spdlog.h"

namespace flowqos {

struct AllocationOutput {
  // Enabled rules in allocation order (priority descending, then canonical
  // class order), then disabled rules, then classes without a rule.
  std::vector<proto::AllocationResult> results;
  proto::AllocationSummary summary;
};

// QosAllocator divides a bandwidth budget among traffic classes.
//
// Enabled rules are visited in priority order, ties broken by the canonical
// class order:
//   1. Reserve each rule's minimum (as much as is left).
//   2. Priority >= 2: grow toward demand * 1.2, up to the rule's max.
//   3. Priority 1: grow toward demand, up to the rule's max.
//   4. Priority 0: split the rest max-min fairly, each class up to its max.
// A class with a disabled rule gets nothing and is considered satisfied.
// A class with demand but no rule gets nothing and is reported with
// has_rule = false.
//
// The output depends only on the inputs, never on container iteration order.
class QosAllocator {
 public:
  static constexpr double kHeadroom = 1.2;

  QosAllocator();

  // Allocate requires total_budget >= 0 and min <= max for every rule.
  AllocationOutput Allocate(const std::map<proto::TrafficClass, double>& demand,
                            absl::Span<const proto::QosRule> rules, double total_budget);

 private:
  spdlog::logger logger_;
  SingleLinkMaxMinFairnessProblem leftover_problem_;
};

// SortRulesForAllocation orders rules by priority descending, then by the
// canonical class order.
std::vector<proto::QosRule> SortRulesForAllocation(absl::Span<const proto::QosRule> rules);

}  // namespace flowqos

#endif  // FLOWQOS_ALG_QOS_ALLOCATOR_H_
