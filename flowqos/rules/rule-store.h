#ifndef FLOWQOS_RULES_RULE_STORE_H_
#define FLOWQOS_RULES_RULE_STORE_H_

#include <cstdint>
#include <memory>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/span.h"
#include "flowqos/proto/flowqos.pb.h"
#include "spdlog/spdlog.h"

namespace flowqos {

absl::Status ValidateRule(const proto::QosRule& rule);

using RuleSnapshot = std::shared_ptr<const std::vector<proto::QosRule>>;

// RuleStore holds one QosRule per traffic class.
//
// Updates replace the whole table, so a Snapshot taken at the start of a tick
// stays consistent for the rest of that tick no matter what SetRule calls
// happen concurrently.
class RuleStore {
 public:
  RuleStore();

  // LoadRules replaces every rule. On error the current rules are kept.
  absl::Status LoadRules(absl::Span<const proto::QosRule> rules);

  // SetRule inserts or replaces the rule for rule.traffic_class.
  absl::Status SetRule(const proto::QosRule& rule);

  // GetRules returns the rules by priority descending, then canonical class order.
  std::vector<proto::QosRule> GetRules() const;

  RuleSnapshot Snapshot() const;
  uint64_t version() const;

 private:
  spdlog::logger logger_;

  mutable absl::Mutex mu_;
  RuleSnapshot rules_ ABSL_GUARDED_BY(mu_);
  uint64_t version_ ABSL_GUARDED_BY(mu_) = 0;
};

}  // namespace flowqos

#endif  // FLOWQOS_RULES_RULE_STORE_H_
