#ifndef FLOWQOS_THREADS_DEADLINE_RUNNER_H_
#define FLOWQOS_THREADS_DEADLINE_RUNNER_H_

#include <deque>
#include <functional>
#include <memory>
#include <thread>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "spdlog/spdlog.h"

namespace flowqos {

// DeadlineRunner runs blocking calls on a dedicated worker thread so that the
// caller can stop waiting for them after a timeout.
//
// Calls run one at a time in submission order. A call whose caller has given
// up before it started is skipped. A call that is already running when its
// caller gives up runs to completion, and its result is discarded.
class DeadlineRunner {
 public:
  explicit DeadlineRunner(const char* thread_name);
  ~DeadlineRunner();

  DeadlineRunner(const DeadlineRunner&) = delete;
  DeadlineRunner& operator=(const DeadlineRunner&) = delete;

  // Run waits up to timeout for fn to complete and returns its result, or
  // DeadlineExceeded. fn must not reference the caller's stack.
  template <typename T>
  absl::StatusOr<T> Run(absl::Duration timeout, std::function<absl::StatusOr<T>()> fn);

  absl::Status RunStatus(absl::Duration timeout, std::function<absl::Status()> fn);

  int64_t num_abandoned() const;

 private:
  struct Call {
    std::function<void()> fn;
    absl::Mutex mu;
    bool done = false;
    bool abandoned = false;
  };

  absl::Status Submit(absl::Duration timeout, std::function<void()> fn);
  void WorkerLoop();

  spdlog::logger logger_;

  mutable absl::Mutex mu_;
  std::deque<std::shared_ptr<Call>> pending_ ABSL_GUARDED_BY(mu_);
  bool dead_ ABSL_GUARDED_BY(mu_) = false;
  int64_t num_abandoned_ ABSL_GUARDED_BY(mu_) = 0;

  std::thread worker_;
};

template <typename T>
absl::StatusOr<T> DeadlineRunner::Run(absl::Duration timeout,
                                      std::function<absl::StatusOr<T>()> fn) {
  auto result = std::make_shared<absl::StatusOr<T>>(absl::UnknownError("call not run"));
  absl::Status st = Submit(timeout, [result, fn] { *result = fn(); });
  if (!st.ok()) {
    return st;
  }
  return std::move(*result);
}

}  // namespace flowqos

#endif  // FLOWQOS_THREADS_DEADLINE_RUNNER_H_
