#include "flowqos/alg/alert-evaluator.h"

#include <algorithm>

#include "absl/strings/str_format.h"
#include "flowqos/log/spdlog.h"
#include "flowqos/proto/constructors.h"

namespace flowqos {

proto::Alert MakeAlert(proto::AlertSeverity severity, std::string title,
                       std::string message, absl::Time now,
                       std::optional<uint64_t> related_flow_id) {
  proto::Alert a;
  a.set_severity(severity);
  a.set_title(std::move(title));
  a.set_message(std::move(message));
  if (related_flow_id.has_value()) {
    a.set_related_flow_id(*related_flow_id);
  }
  *a.mutable_created_at() = ToProtoTimestamp(now);
  a.set_resolved(false);
  return a;
}

SustainedOverDemandTracker::SustainedOverDemandTracker(int num_ticks, double factor)
    : num_ticks_(num_ticks), factor_(factor) {}

std::vector<proto::TrafficClass> SustainedOverDemandTracker::Update(
    absl::Span<const proto::AllocationResult> allocations) {
  std::array<bool, kQosClasses.size()> over{};
  for (const proto::AllocationResult& r : allocations) {
    if (!IsQosClass(r.traffic_class())) {
      continue;
    }
    over[CanonicalRank(r.traffic_class())] =
        r.requested_mbps() > factor_ * r.allocated_mbps();
  }
  std::vector<proto::TrafficClass> sustained;
  for (proto::TrafficClass c : kQosClasses) {
    int& streak = streak_[CanonicalRank(c)];
    streak = over[CanonicalRank(c)] ? streak + 1 : 0;
    if (streak >= num_ticks_) {
      sustained.push_back(c);
    }
  }
  return sustained;
}

std::vector<proto::Alert> DeriveAlerts(
    absl::Time now, absl::Span<const proto::AllocationResult> allocations,
    absl::Span<const proto::QosRule> rules,
    absl::Span<const proto::TrafficClass> over_demanded,
    absl::Span<const proto::Flow> new_flows) {
  auto rule_for = [&rules](proto::TrafficClass c) -> const proto::QosRule* {
    for (const proto::QosRule& r : rules) {
      if (r.traffic_class() == c) {
        return &r;
      }
    }
    return nullptr;
  };

  std::vector<proto::Alert> alerts;
  for (const proto::AllocationResult& r : allocations) {
    if (r.satisfied_min()) {
      continue;
    }
    const proto::QosRule* rule = rule_for(r.traffic_class());
    const bool high = rule != nullptr && rule->priority() >= 3;
    const std::string name = TrafficClassName(r.traffic_class());
    alerts.push_back(MakeAlert(
        high ? proto::AS_CRITICAL : proto::AS_WARNING,
        absl::StrFormat("Minimum bandwidth not met for %s", name),
        absl::StrFormat("%s allocated %.3f Mbps, below its %.3f Mbps minimum", name,
                        r.allocated_mbps(),
                        rule != nullptr ? rule->min_bandwidth_mbps() : 0.0),
        now));
  }

  for (proto::TrafficClass c : over_demanded) {
    const std::string name = TrafficClassName(c);
    double requested = 0;
    double allocated = 0;
    for (const proto::AllocationResult& r : allocations) {
      if (r.traffic_class() == c) {
        requested = r.requested_mbps();
        allocated = r.allocated_mbps();
      }
    }
    alerts.push_back(MakeAlert(
        proto::AS_WARNING, absl::StrFormat("Sustained over-demand for %s", name),
        absl::StrFormat("%s demand %.3f Mbps is more than twice its %.3f Mbps allocation",
                        name, requested, allocated),
        now));
  }

  for (const proto::Flow& f : new_flows) {
    const proto::QosRule* rule = rule_for(f.traffic_class());
    if (rule != nullptr && rule->enabled()) {
      continue;
    }
    const std::string name = TrafficClassName(f.traffic_class());
    alerts.push_back(MakeAlert(
        proto::AS_INFO, absl::StrFormat("New %s flow without QoS rule", name),
        absl::StrFormat("flow %d (%s -> %s) has no enabled %s rule", f.id(),
                        f.source_endpoint(), f.dest_endpoint(), name),
        now, f.id()));
  }
  return alerts;
}

AlertBook::AlertBook(absl::Duration cooldown)
    : cooldown_(cooldown), logger_(MakeLogger("alert-book")) {}

AlertBook::Key AlertBook::KeyOf(const proto::Alert& alert) {
  // Flow ids are shifted by one so that 0 means "no related flow".
  return Key(alert.severity(), alert.title(),
             alert.has_related_flow_id() ? alert.related_flow_id() + 1 : 0);
}

AlertBook::Changes AlertBook::Update(absl::Time now,
                                     absl::Span<const proto::Alert> candidates) {
  Changes changes;
  for (const proto::Alert& c : candidates) {
    Key key = KeyOf(c);
    auto iter = active_.find(key);
    if (iter == active_.end()) {
      Entry e{c, now, now, next_seqnum_++};
      e.alert.set_resolved(false);
      changes.raised.push_back(e.alert);
      SPDLOG_LOGGER_INFO(&logger_, "raised {} alert: {}: {}",
                         proto::AlertSeverity_Name(c.severity()), c.title(), c.message());
      active_.insert({std::move(key), std::move(e)});
      continue;
    }
    Entry& e = iter->second;
    e.last_raised = now;
    if (now - e.last_emitted >= cooldown_) {
      e.last_emitted = now;
      e.alert.set_message(c.message());
      changes.raised.push_back(e.alert);
    }
  }

  std::vector<Key> to_resolve;
  for (const auto& [key, e] : active_) {
    if (now - e.last_raised >= cooldown_) {
      to_resolve.push_back(key);
    }
  }
  std::sort(to_resolve.begin(), to_resolve.end(), [this](const Key& a, const Key& b) {
    return active_.at(a).seqnum < active_.at(b).seqnum;
  });
  for (const Key& key : to_resolve) {
    auto iter = active_.find(key);
    proto::Alert a = std::move(iter->second.alert);
    a.set_resolved(true);
    SPDLOG_LOGGER_INFO(&logger_, "resolved {} alert: {}",
                       proto::AlertSeverity_Name(a.severity()), a.title());
    changes.resolved.push_back(std::move(a));
    active_.erase(iter);
  }
  return changes;
}

std::vector<proto::Alert> AlertBook::Active() const {
  std::vector<const Entry*> entries;
  entries.reserve(active_.size());
  for (const auto& [key, e] : active_) {
    entries.push_back(&e);
  }
  std::sort(entries.begin(), entries.end(), [](const Entry* a, const Entry* b) {
    if (a->alert.severity() != b->alert.severity()) {
      return a->alert.severity() > b->alert.severity();
    }
    return a->seqnum < b->seqnum;
  });
  std::vector<proto::Alert> alerts;
  alerts.reserve(entries.size());
  for (const Entry* e : entries) {
    alerts.push_back(e->alert);
  }
  return alerts;
}

const proto::Alert* AlertBook::FindActive(const proto::Alert& like) const {
  auto iter = active_.find(KeyOf(like));
  if (iter == active_.end()) {
    return nullptr;
  }
  return &iter->second.alert;
}

}  // namespace flowqos
