#ifndef FLOWQOS_PROTO_FILEIO_H_
#define FLOWQOS_PROTO_FILEIO_H_

#include <cstdio>
#include <string>

#include "absl/functional/function_ref.h"
#include "absl/status/status.h"
#include "google/protobuf/message.h"

namespace flowqos {

// ReadTextProtoFromFile parses a text-format proto. Parse errors carry the
// line and column of the first problem.
absl::Status ReadTextProtoFromFile(const std::string& path, google::protobuf::Message* out);

// WriteJsonLine writes mesg as one line of compact JSON, printing fields that
// hold default values too.
absl::Status WriteJsonLine(const google::protobuf::Message& mesg, FILE* out);

// ReadJsonLines parses every non-empty line of path into a fresh copy of
// prototype and hands it to on_record. Stops at the first malformed line.
absl::Status ReadJsonLines(
    const std::string& path, const google::protobuf::Message& prototype,
    absl::FunctionRef<void(const google::protobuf::Message&)> on_record);

}  // namespace flowqos

#endif  // FLOWQOS_PROTO_FILEIO_H_
