#include "flowqos/cli/parse.h"

#include <cmath>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"
#include "flowqos/rules/rule-store.h"
#include "flowqos/traffic/traffic-class.h"

namespace flowqos {

absl::StatusOr<absl::Duration> ParseAbslDuration(absl::string_view dur,
                                                 absl::string_view field_name_on_error,
                                                 absl::Duration default_value) {
  if (dur.empty()) {
    return default_value;
  }
  absl::Duration d;
  if (!absl::ParseDuration(dur, &d)) {
    return absl::InvalidArgumentError(
        absl::StrCat("invalid ", field_name_on_error, ": ", dur));
  }
  return d;
}

namespace {

absl::Status ParsePositiveDuration(absl::string_view dur, absl::string_view field_name,
                                   absl::Duration* out) {
  auto d_or = ParseAbslDuration(dur, field_name, *out);
  if (!d_or.ok()) {
    return d_or.status();
  }
  if (*d_or <= absl::ZeroDuration()) {
    return absl::InvalidArgumentError(
        absl::StrCat(field_name, " must be positive; got ", absl::FormatDuration(*d_or)));
  }
  *out = *d_or;
  return absl::OkStatus();
}

// Zero keeps the default.
absl::Status ParseOptionalCount(int32_t v, absl::string_view field_name, int* out) {
  if (v < 0) {
    return absl::InvalidArgumentError(
        absl::StrCat(field_name, " must not be negative; got ", v));
  }
  if (v > 0) {
    *out = v;
  }
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<EngineOptions> ParseMonitorConfig(const proto::MonitorConfig& c) {
  EngineOptions o;
  absl::Status st = ParsePositiveDuration(c.tick_period(), "tick_period", &o.tick_period);
  if (st.ok()) {
    st = ParsePositiveDuration(c.silence_interval(), "silence_interval",
                               &o.silence_interval);
  }
  if (st.ok()) {
    st = ParsePositiveDuration(c.upstream_timeout(), "upstream_timeout",
                               &o.upstream_timeout);
  }
  if (st.ok()) {
    st = ParsePositiveDuration(c.predictor_timeout(), "predictor_timeout",
                               &o.predictor_timeout);
  }
  if (st.ok()) {
    st = ParsePositiveDuration(c.alert_cooldown(), "alert_cooldown", &o.alert_cooldown);
  }
  if (st.ok()) {
    st = ParseOptionalCount(c.subscriber_buffer_size(), "subscriber_buffer_size",
                          &o.subscriber_buffer_size);
  }
  if (st.ok()) {
    st = ParseOptionalCount(c.max_flows_per_update(), "max_flows_per_update",
                          &o.max_flows_per_update);
  }
  if (st.ok()) {
    st = ParseOptionalCount(c.history_length(), "history_length", &o.history_length);
  }
  if (!st.ok()) {
    return st;
  }

  if (c.has_total_bandwidth_mbps()) {
    if (!std::isfinite(c.total_bandwidth_mbps()) || c.total_bandwidth_mbps() < 0) {
      return absl::InvalidArgumentError(absl::StrCat(
          "total_bandwidth_mbps must be finite and not negative; got ", c.total_bandwidth_mbps()));
    }
    o.total_bandwidth_mbps = c.total_bandwidth_mbps();
  }
  if (c.has_confidence_threshold()) {
    if (!std::isfinite(c.confidence_threshold()) || c.confidence_threshold() < 0 ||
        c.confidence_threshold() > 100) {
      return absl::InvalidArgumentError(
          absl::StrCat("confidence_threshold must be in [0, 100]; got ",
                       c.confidence_threshold()));
    }
    o.confidence_threshold = c.confidence_threshold();
  }

  absl::flat_hash_set<int> seen;
  for (const proto::QosRule& rule : c.rules()) {
    absl::Status rule_st = ValidateRule(rule);
    if (!rule_st.ok()) {
      return rule_st;
    }
    if (!seen.insert(rule.traffic_class()).second) {
      return absl::InvalidArgumentError(absl::StrCat(
          "duplicate rule for traffic class ", TrafficClassName(rule.traffic_class())));
    }
    o.rules.push_back(rule);
  }
  o.server_addresses.assign(c.server_addresses().begin(), c.server_addresses().end());
  return o;
}

}  // namespace flowqos
