#include "flowqos/threads/deadline-runner.h"

#include "absl/strings/str_cat.h"
#include "flowqos/log/spdlog.h"
#include "flowqos/threads/set-name.h"

namespace flowqos {

DeadlineRunner::DeadlineRunner(const char* thread_name)
    : logger_(MakeLogger(absl::StrCat("deadline-runner-", thread_name))) {
  std::string name(thread_name);
  worker_ = std::thread([this, name] {
    SetCurThreadName(name);
    WorkerLoop();
  });
}

DeadlineRunner::~DeadlineRunner() {
  {
    absl::MutexLock l(&mu_);
    dead_ = true;
  }
  worker_.join();
}

void DeadlineRunner::WorkerLoop() {
  while (true) {
    mu_.LockWhen(absl::Condition(
        +[](DeadlineRunner* self) { return self->dead_ || !self->pending_.empty(); },
        this));
    if (dead_) {
      for (auto& call : pending_) {
        absl::MutexLock cl(&call->mu);
        call->abandoned = true;
        call->done = true;
      }
      pending_.clear();
      mu_.Unlock();
      return;
    }
    std::shared_ptr<Call> call = std::move(pending_.front());
    pending_.pop_front();
    mu_.Unlock();

    bool skip = false;
    {
      absl::MutexLock cl(&call->mu);
      skip = call->abandoned;
    }
    if (skip) {
      SPDLOG_LOGGER_DEBUG(&logger_, "skipping call abandoned before it started");
      continue;
    }
    call->fn();
    absl::MutexLock cl(&call->mu);
    call->done = true;
  }
}

absl::Status DeadlineRunner::Submit(absl::Duration timeout, std::function<void()> fn) {
  auto call = std::make_shared<Call>();
  call->fn = std::move(fn);
  {
    absl::MutexLock l(&mu_);
    if (dead_) {
      return absl::FailedPreconditionError("runner is shut down");
    }
    pending_.push_back(call);
  }

  call->mu.LockWhenWithTimeout(absl::Condition(&call->done), timeout);
  bool done = call->done;
  bool abandoned = call->abandoned;
  if (!done) {
    call->abandoned = true;
  }
  call->mu.Unlock();

  if (done && !abandoned) {
    return absl::OkStatus();
  }
  if (done) {
    return absl::CancelledError("runner shut down before call ran");
  }
  {
    absl::MutexLock l(&mu_);
    ++num_abandoned_;
  }
  return absl::DeadlineExceededError(
      absl::StrCat("call did not finish within ", absl::FormatDuration(timeout)));
}

absl::Status DeadlineRunner::RunStatus(absl::Duration timeout,
                                       std::function<absl::Status()> fn) {
  auto result = std::make_shared<absl::Status>(absl::UnknownError("call not run"));
  absl::Status st = Submit(timeout, [result, fn] { *result = fn(); });
  if (!st.ok()) {
    return st;
  }
  return *result;
}

int64_t DeadlineRunner::num_abandoned() const {
  absl::MutexLock l(&mu_);
  return num_abandoned_;
}

}  // namespace flowqos
