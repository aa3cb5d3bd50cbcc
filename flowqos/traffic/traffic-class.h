#ifndef FLOWQOS_TRAFFIC_TRAFFIC_CLASS_H_
#define FLOWQOS_TRAFFIC_TRAFFIC_CLASS_H_

#include <array>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "flowqos/proto/flowqos.pb.h"

namespace flowqos {

// The classes that take part in QoS accounting, in canonical order.
// Ties between equal-priority classes are always broken by this order.
constexpr std::array<proto::TrafficClass, 4> kQosClasses = {
    proto::TC_VIDEO,
    proto::TC_VOICE,
    proto::TC_FILE,
    proto::TC_BACKGROUND,
};

bool IsQosClass(proto::TrafficClass c);

// CanonicalRank is the position of c in kQosClasses. Non-QoS classes sort last.
int CanonicalRank(proto::TrafficClass c);

// StaticPriority: video 3, voice 3, file 1, everything else 0.
int StaticPriority(proto::TrafficClass c);

std::string TrafficClassName(proto::TrafficClass c);

absl::StatusOr<proto::TrafficClass> ParseTrafficClass(absl::string_view name);

}  // namespace flowqos

#endif  // FLOWQOS_TRAFFIC_TRAFFIC_CLASS_H_
