#include "flowqos/alg/qos-allocator.h"

#include <algorithm>
#include <cmath>

#include "flowqos/log/spdlog.h"
#include "flowqos/traffic/traffic-class.h"

namespace flowqos {

namespace {

// Tolerance for comparing sums of floating point allocations.
constexpr double kEpsilon = 1e-9;

double DemandFor(const std::map<proto::TrafficClass, double>& demand,
                 proto::TrafficClass c) {
  auto iter = demand.find(c);
  if (iter == demand.end()) {
    return 0;
  }
  return std::max(iter->second, 0.0);
}

}  // namespace

std::vector<proto::QosRule> SortRulesForAllocation(
    absl::Span<const proto::QosRule> rules) {
  std::vector<proto::QosRule> sorted(rules.begin(), rules.end());
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const proto::QosRule& lhs, const proto::QosRule& rhs) {
                     if (lhs.priority() != rhs.priority()) {
                       return lhs.priority() > rhs.priority();
                     }
                     return CanonicalRank(lhs.traffic_class()) <
                            CanonicalRank(rhs.traffic_class());
                   });
  return sorted;
}

QosAllocator::QosAllocator() : logger_(MakeLogger("qos-allocator")) {}

AllocationOutput QosAllocator::Allocate(
    const std::map<proto::TrafficClass, double>& demand,
    absl::Span<const proto::QosRule> rules, double total_budget) {
  FQ_SPDLOG_CHECK_GE_MESG(&logger_, total_budget, 0.0, "budget must be non-negative");

  std::vector<proto::QosRule> sorted = SortRulesForAllocation(rules);
  std::vector<const proto::QosRule*> enabled;
  std::vector<const proto::QosRule*> disabled;
  for (const proto::QosRule& r : sorted) {
    FQ_SPDLOG_CHECK_LE(&logger_, r.min_bandwidth_mbps(), r.max_bandwidth_mbps());
    if (r.enabled()) {
      enabled.push_back(&r);
    } else {
      disabled.push_back(&r);
    }
  }

  std::vector<double> alloc(enabled.size(), 0);
  double remaining = total_budget;

  // Pass 1: guarantee minimums.
  for (size_t i = 0; i < enabled.size(); ++i) {
    const double reserve = std::min(enabled[i]->min_bandwidth_mbps(), remaining);
    alloc[i] = reserve;
    remaining = std::max(remaining - reserve, 0.0);
  }

  auto grow_toward = [&](size_t i, double target) {
    const double grow = std::min(std::max(target - alloc[i], 0.0), remaining);
    alloc[i] += grow;
    remaining = std::max(remaining - grow, 0.0);
  };

  // Pass 2: high priority classes grow toward demand plus headroom.
  for (size_t i = 0; i < enabled.size(); ++i) {
    if (enabled[i]->priority() >= 2) {
      const double d = DemandFor(demand, enabled[i]->traffic_class());
      grow_toward(i, std::min(d * kHeadroom, enabled[i]->max_bandwidth_mbps()));
    }
  }

  // Pass 3: medium priority classes grow toward demand.
  for (size_t i = 0; i < enabled.size(); ++i) {
    if (enabled[i]->priority() == 1) {
      const double d = DemandFor(demand, enabled[i]->traffic_class());
      grow_toward(i, std::min(d, enabled[i]->max_bandwidth_mbps()));
    }
  }

  // Pass 4: leftover goes to the lowest priority classes, each up to its max.
  std::vector<size_t> leftover_idx;
  std::vector<double> headroom;
  for (size_t i = 0; i < enabled.size(); ++i) {
    if (enabled[i]->priority() <= 0) {
      leftover_idx.push_back(i);
      headroom.push_back(std::max(enabled[i]->max_bandwidth_mbps() - alloc[i], 0.0));
    }
  }
  if (!leftover_idx.empty() && remaining > 0) {
    std::vector<double> shares;
    double waterlevel = leftover_problem_.ComputeWaterlevel(remaining, headroom);
    leftover_problem_.SetAllocations(waterlevel, headroom, &shares);
    double given = 0;
    for (size_t j = 0; j < leftover_idx.size(); ++j) {
      alloc[leftover_idx[j]] += shares[j];
      given += shares[j];
    }
    remaining = std::max(remaining - given, 0.0);
  }

  AllocationOutput out;
  double total_allocated = 0;
  for (size_t i = 0; i < enabled.size(); ++i) {
    const proto::QosRule& r = *enabled[i];
    const double d = DemandFor(demand, r.traffic_class());
    proto::AllocationResult res;
    res.set_traffic_class(r.traffic_class());
    res.set_requested_mbps(d);
    res.set_allocated_mbps(alloc[i]);
    res.set_satisfied_min(alloc[i] + kEpsilon >=
                          std::min(r.min_bandwidth_mbps(), total_budget));
    res.set_throttled_mbps(std::max(d - alloc[i], 0.0));
    res.set_has_rule(true);
    total_allocated += alloc[i];
    out.results.push_back(std::move(res));
  }
  for (const proto::QosRule* r : disabled) {
    const double d = DemandFor(demand, r->traffic_class());
    proto::AllocationResult res;
    res.set_traffic_class(r->traffic_class());
    res.set_requested_mbps(d);
    res.set_allocated_mbps(0);
    res.set_satisfied_min(true);
    res.set_throttled_mbps(d);
    res.set_has_rule(true);
    out.results.push_back(std::move(res));
  }
  for (proto::TrafficClass c : kQosClasses) {
    bool has_rule =
        std::any_of(sorted.begin(), sorted.end(),
                    [c](const proto::QosRule& r) { return r.traffic_class() == c; });
    if (has_rule || demand.find(c) == demand.end()) {
      continue;
    }
    const double d = DemandFor(demand, c);
    proto::AllocationResult res;
    res.set_traffic_class(c);
    res.set_requested_mbps(d);
    res.set_allocated_mbps(0);
    res.set_satisfied_min(true);
    res.set_throttled_mbps(d);
    res.set_has_rule(false);
    out.results.push_back(std::move(res));
  }

  FQ_SPDLOG_CHECK_LE_MESG(&logger_, total_allocated, total_budget + kEpsilon,
                          "allocation exceeds budget");

  out.summary.set_total_budget_mbps(total_budget);
  out.summary.set_total_allocated_mbps(total_allocated);
  out.summary.set_remaining_mbps(std::max(total_budget - total_allocated, 0.0));
  out.summary.set_utilization_percent(
      total_budget > 0 ? std::round(total_allocated / total_budget * 1000) / 10 : 0);

  SPDLOG_LOGGER_DEBUG(&logger_, "allocated {} of {} Mbps across {} classes",
                      total_allocated, total_budget, out.results.size());
  return out;
}

}  // namespace flowqos
