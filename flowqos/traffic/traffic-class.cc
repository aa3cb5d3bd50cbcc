#include "flowqos/traffic/traffic-class.h"

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"

namespace flowqos {

bool IsQosClass(proto::TrafficClass c) {
  return CanonicalRank(c) < static_cast<int>(kQosClasses.size());
}

int CanonicalRank(proto::TrafficClass c) {
  switch (c) {
    case proto::TC_VIDEO:
      return 0;
    case proto::TC_VOICE:
      return 1;
    case proto::TC_FILE:
      return 2;
    case proto::TC_BACKGROUND:
      return 3;
    case proto::TC_UNKNOWN:
      return 4;
    default:
      return 5;
  }
}

int StaticPriority(proto::TrafficClass c) {
  switch (c) {
    case proto::TC_VIDEO:
    case proto::TC_VOICE:
      return 3;
    case proto::TC_FILE:
      return 1;
    default:
      return 0;
  }
}

std::string TrafficClassName(proto::TrafficClass c) {
  switch (c) {
    case proto::TC_VIDEO:
      return "video";
    case proto::TC_VOICE:
      return "voice";
    case proto::TC_FILE:
      return "file";
    case proto::TC_BACKGROUND:
      return "background";
    case proto::TC_UNKNOWN:
      return "unknown";
    default:
      return "unspecified";
  }
}

absl::StatusOr<proto::TrafficClass> ParseTrafficClass(absl::string_view name) {
  std::string lower = absl::AsciiStrToLower(name);
  if (lower == "video") return proto::TC_VIDEO;
  if (lower == "voice") return proto::TC_VOICE;
  if (lower == "file") return proto::TC_FILE;
  if (lower == "background") return proto::TC_BACKGROUND;
  if (lower == "unknown") return proto::TC_UNKNOWN;
  return absl::InvalidArgumentError(absl::StrCat("unknown traffic class: ", name));
}

}  // namespace flowqos
