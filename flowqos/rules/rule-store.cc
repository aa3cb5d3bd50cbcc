#include "flowqos/rules/rule-store.h"

#include <cmath>

#include "absl/strings/str_cat.h"
#include "flowqos/alg/qos-allocator.h"
#include "flowqos/log/spdlog.h"
#include "flowqos/traffic/traffic-class.h"

namespace flowqos {

absl::Status ValidateRule(const proto::QosRule& rule) {
  if (!IsQosClass(rule.traffic_class())) {
    return absl::InvalidArgumentError(absl::StrCat(
        "rule must name video, voice, file or background; got ",
        TrafficClassName(rule.traffic_class())));
  }
  const std::string name = TrafficClassName(rule.traffic_class());
  if (rule.priority() < 0 || rule.priority() > 3) {
    return absl::InvalidArgumentError(
        absl::StrCat(name, ": priority ", rule.priority(), " outside [0, 3]"));
  }
  if (!std::isfinite(rule.min_bandwidth_mbps()) ||
      !std::isfinite(rule.max_bandwidth_mbps())) {
    return absl::InvalidArgumentError(absl::StrCat(
        name, ": bandwidths must be finite; got min ", rule.min_bandwidth_mbps(),
        " max ", rule.max_bandwidth_mbps()));
  }
  if (rule.min_bandwidth_mbps() < 0) {
    return absl::InvalidArgumentError(absl::StrCat(
        name, ": min_bandwidth_mbps ", rule.min_bandwidth_mbps(), " is negative"));
  }
  if (rule.min_bandwidth_mbps() > rule.max_bandwidth_mbps()) {
    return absl::InvalidArgumentError(absl::StrCat(
        name, ": min_bandwidth_mbps ", rule.min_bandwidth_mbps(),
        " > max_bandwidth_mbps ", rule.max_bandwidth_mbps()));
  }
  if (rule.has_dscp() && (rule.dscp() < 0 || rule.dscp() > 63)) {
    return absl::InvalidArgumentError(
        absl::StrCat(name, ": dscp ", rule.dscp(), " outside [0, 63]"));
  }
  return absl::OkStatus();
}

RuleStore::RuleStore()
    : logger_(MakeLogger("rule-store")),
      rules_(std::make_shared<const std::vector<proto::QosRule>>()) {}

absl::Status RuleStore::LoadRules(absl::Span<const proto::QosRule> rules) {
  std::vector<bool> seen(kQosClasses.size(), false);
  for (const proto::QosRule& r : rules) {
    absl::Status st = ValidateRule(r);
    if (!st.ok()) {
      return st;
    }
    const int rank = CanonicalRank(r.traffic_class());
    if (seen[rank]) {
      return absl::InvalidArgumentError(absl::StrCat(
          "duplicate rule for ", TrafficClassName(r.traffic_class())));
    }
    seen[rank] = true;
  }
  auto next = std::make_shared<const std::vector<proto::QosRule>>(
      SortRulesForAllocation(rules));

  absl::MutexLock l(&mu_);
  rules_ = std::move(next);
  ++version_;
  SPDLOG_LOGGER_INFO(&logger_, "loaded {} rules (version {})", rules_->size(), version_);
  return absl::OkStatus();
}

absl::Status RuleStore::SetRule(const proto::QosRule& rule) {
  absl::Status st = ValidateRule(rule);
  if (!st.ok()) {
    SPDLOG_LOGGER_WARN(&logger_, "rejected rule: {}", st.ToString());
    return st;
  }

  absl::MutexLock l(&mu_);
  std::vector<proto::QosRule> next;
  next.reserve(rules_->size() + 1);
  for (const proto::QosRule& r : *rules_) {
    if (r.traffic_class() != rule.traffic_class()) {
      next.push_back(r);
    }
  }
  next.push_back(rule);
  rules_ = std::make_shared<const std::vector<proto::QosRule>>(
      SortRulesForAllocation(next));
  ++version_;
  SPDLOG_LOGGER_INFO(&logger_, "set rule for {} (version {}): {}",
                     TrafficClassName(rule.traffic_class()), version_,
                     rule.ShortDebugString());
  return absl::OkStatus();
}

std::vector<proto::QosRule> RuleStore::GetRules() const { return *Snapshot(); }

RuleSnapshot RuleStore::Snapshot() const {
  absl::MutexLock l(&mu_);
  return rules_;
}

uint64_t RuleStore::version() const {
  absl::MutexLock l(&mu_);
  return version_;
}

}  // namespace flowqos
