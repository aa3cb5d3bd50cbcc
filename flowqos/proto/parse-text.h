#ifndef FLOWQOS_PROTO_PARSE_TEXT_H_
#define FLOWQOS_PROTO_PARSE_TEXT_H_

#include <string>

#include "flowqos/log/spdlog.h"
#include "google/protobuf/text_format.h"

namespace flowqos {

// ParseTextProto parses a text-format message that is known to be valid, such
// as a fixture in a test or a built-in table. It exits on a parse error.
template <typename ProtoT>
ProtoT ParseTextProto(const std::string& text) {
  ProtoT mesg;
  const bool ok = google::protobuf::TextFormat::ParseFromString(text, &mesg);
  FQ_ASSERT_MESG(ok, "bad " + ProtoT::descriptor()->full_name() + " text:\n" + text);
  return mesg;
}

}  // namespace flowqos

#endif  // FLOWQOS_PROTO_PARSE_TEXT_H_
