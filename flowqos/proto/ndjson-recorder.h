#ifndef FLOWQOS_PROTO_NDJSON_RECORDER_H_
#define FLOWQOS_PROTO_NDJSON_RECORDER_H_

#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "google/protobuf/message.h"
#include "spdlog/spdlog.h"

namespace flowqos {

// NdjsonRecorder appends protobuf messages to a file as newline-delimited JSON.
// It is used to keep an offline record of allocations and alerts.
class NdjsonRecorder {
 public:
  // Open truncates path.
  static absl::StatusOr<std::unique_ptr<NdjsonRecorder>> Open(const std::string& path);

  // Disabled returns a recorder that accepts and discards every record.
  static std::unique_ptr<NdjsonRecorder> Disabled();

  ~NdjsonRecorder();

  NdjsonRecorder(const NdjsonRecorder&) = delete;
  NdjsonRecorder& operator=(const NdjsonRecorder&) = delete;

  bool enabled() const { return enabled_; }

  absl::Status Record(const google::protobuf::Message& mesg);

  // Close flushes and closes the file. Records after Close fail.
  absl::Status Close();

  int64_t num_records() const;

 private:
  NdjsonRecorder(std::string path, FILE* out);

  const std::string path_;
  const bool enabled_;
  spdlog::logger logger_;

  mutable absl::Mutex mu_;
  FILE* out_ ABSL_GUARDED_BY(mu_);
  int64_t num_records_ ABSL_GUARDED_BY(mu_) = 0;
};

}  // namespace flowqos

#endif  // FLOWQOS_PROTO_NDJSON_RECORDER_H_
