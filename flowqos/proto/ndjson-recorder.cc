#include "flowqos/proto/ndjson-recorder.h"

#include <cerrno>

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "flowqos/log/spdlog.h"
#include "flowqos/posix/strerror.h"
#include "flowqos/proto/fileio.h"

namespace flowqos {

NdjsonRecorder::NdjsonRecorder(std::string path, FILE* out)
    : path_(std::move(path)),
      enabled_(out != nullptr),
      logger_(MakeLogger("ndjson-recorder")),
      out_(out) {}

absl::StatusOr<std::unique_ptr<NdjsonRecorder>> NdjsonRecorder::Open(
    const std::string& path) {
  FILE* out = fopen(path.c_str(), "w");
  if (out == nullptr) {
    return absl::InternalError(
        absl::StrCat("failed to create ", path, ": ", StrError(errno)));
  }
  return absl::WrapUnique(new NdjsonRecorder(path, out));
}

std::unique_ptr<NdjsonRecorder> NdjsonRecorder::Disabled() {
  return absl::WrapUnique(new NdjsonRecorder("", nullptr));
}

NdjsonRecorder::~NdjsonRecorder() {
  absl::MutexLock l(&mu_);
  if (out_ != nullptr) {
    SPDLOG_LOGGER_WARN(&logger_, "{} was not closed; closing now", path_);
    if (fclose(out_) != 0) {
      SPDLOG_LOGGER_WARN(&logger_, "failed to close {}: {}", path_, StrError(errno));
    }
  }
}

absl::Status NdjsonRecorder::Record(const google::protobuf::Message& mesg) {
  if (!enabled_) {
    return absl::OkStatus();
  }
  absl::MutexLock l(&mu_);
  if (out_ == nullptr) {
    return absl::FailedPreconditionError(absl::StrCat(path_, " is already closed"));
  }
  absl::Status st = WriteJsonLine(mesg, out_);
  if (!st.ok()) {
    return absl::Status(st.code(), absl::StrCat("failed to record to ", path_, ": ",
                                                st.message()));
  }
  ++num_records_;
  return absl::OkStatus();
}

absl::Status NdjsonRecorder::Close() {
  absl::MutexLock l(&mu_);
  if (out_ == nullptr) {
    return absl::OkStatus();
  }
  int ret = fclose(out_);
  out_ = nullptr;
  if (ret != 0) {
    return absl::InternalError(
        absl::StrCat("failed to close ", path_, ": ", StrError(errno)));
  }
  SPDLOG_LOGGER_INFO(&logger_, "wrote {} records to {}", num_records_, path_);
  return absl::OkStatus();
}

int64_t NdjsonRecorder::num_records() const {
  absl::MutexLock l(&mu_);
  return num_records_;
}

}  // namespace flowqos
