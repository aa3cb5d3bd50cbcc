#ifndef FLOWQOS_CLI_PARSE_H_
#define FLOWQOS_CLI_PARSE_H_

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "flowqos/engine/options.h"
#include "flowqos/proto/config.pb.h"

namespace flowqos {

// ParseAbslDuration returns default_value when dur is empty.
absl::StatusOr<absl::Duration> ParseAbslDuration(absl::string_view dur,
                                                 absl::string_view field_name_on_error,
                                                 absl::Duration default_value);

// ParseMonitorConfig fills unset fields with defaults and rejects configs the
// engine cannot start with: unparsable or non-positive durations, a negative
// budget, invalid or duplicate rules.
absl::StatusOr<EngineOptions> ParseMonitorConfig(const proto::MonitorConfig& c);

}  // namespace flowqos

#endif  // FLOWQOS_CLI_PARSE_H_
