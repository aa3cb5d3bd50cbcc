#ifndef FLOWQOS_PROTO_TESTING_H_
#define FLOWQOS_PROTO_TESTING_H_

#include <string>

#include "gmock/gmock.h"
#include "google/protobuf/util/message_differencer.h"

namespace flowqos {
namespace testing_internal {

// ProtoDiff returns an empty string if a and b are equivalent (unset fields
// compare equal to their defaults), and a description of the differences
// otherwise.
inline std::string ProtoDiff(const google::protobuf::Message& a,
                             const google::protobuf::Message& b) {
  std::string diff;
  google::protobuf::util::MessageDifferencer differencer;
  differencer.set_message_field_comparison(
      google::protobuf::util::MessageDifferencer::EQUIVALENT);
  differencer.ReportDifferencesToString(&diff);
  if (differencer.Compare(a, b)) {
    return "";
  }
  return diff.empty() ? "messages differ" : diff;
}

}  // namespace testing_internal

MATCHER_P(EqProto, other, "") {
  std::string diff = testing_internal::ProtoDiff(arg, other);
  if (!diff.empty()) {
    *result_listener << "\n" << diff;
  }
  return diff.empty();
}

// EqRepeatedProto compares element-wise, so arg and other may be any pair of
// indexable containers (std::vector, RepeatedPtrField).
MATCHER_P(EqRepeatedProto, other, "") {
  if (static_cast<size_t>(arg.size()) != static_cast<size_t>(other.size())) {
    *result_listener << "have " << arg.size() << " elements, want " << other.size();
    return false;
  }
  for (size_t i = 0; i < static_cast<size_t>(arg.size()); ++i) {
    std::string diff = testing_internal::ProtoDiff(arg[i], other[i]);
    if (!diff.empty()) {
      *result_listener << "\nelement " << i << ":\n" << diff;
      return false;
    }
  }
  return true;
}

}  // namespace flowqos

#endif  // FLOWQOS_PROTO_TESTING_H_
