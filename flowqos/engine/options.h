#ifndef FLOWQOS_ENGINE_OPTIONS_H_
#define FLOWQOS_ENGINE_OPTIONS_H_

#include <string>
#include <vector>

#include "absl/time/time.h"
#include "flowqos/proto/flowqos.pb.h"

namespace flowqos {

struct EngineOptions {
  absl::Duration tick_period = absl::Seconds(1);
  absl::Duration silence_interval = absl::Seconds(30);
  absl::Duration upstream_timeout = absl::Milliseconds(500);
  absl::Duration predictor_timeout = absl::Milliseconds(500);
  absl::Duration alert_cooldown = absl::Seconds(60);

  double total_bandwidth_mbps = 100;
  double confidence_threshold = 50;

  int subscriber_buffer_size = 64;
  int max_flows_per_update = 100;
  int history_length = 100;

  std::vector<proto::QosRule> rules;
  std::vector<std::string> server_addresses;
};

}  // namespace flowqos

#endif  // FLOWQOS_ENGINE_OPTIONS_H_
