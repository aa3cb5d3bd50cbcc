#ifndef FLOWQOS_THREADS_MUTEX_HELPERS_H_
#define FLOWQOS_THREADS_MUTEX_HELPERS_H_

#include <mutex>

#include "absl/base/thread_annotations.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "spdlog/spdlog.h"

namespace flowqos {

// TimedMutex is a std::timed_mutex with thread-safety annotations.
class ABSL_LOCKABLE TimedMutex {
 public:
  bool TryLockFor(absl::Duration dur) ABSL_EXCLUSIVE_TRYLOCK_FUNCTION(true) {
    return mu_.try_lock_for(absl::ToChronoNanoseconds(dur));
  }

  void Unlock() ABSL_UNLOCK_FUNCTION() { mu_.unlock(); }

 private:
  std::timed_mutex mu_;
};

// MutexLockWarnLong holds mu for its lifetime. It warns for every long_dur
// spent waiting to acquire mu, and once more on release if mu was held for
// longer than long_dur. lock_name must outlive the lock.
class ABSL_SCOPED_LOCKABLE MutexLockWarnLong {
 public:
  MutexLockWarnLong(TimedMutex* mu, absl::Duration long_dur, spdlog::logger* logger,
                    const char* lock_name) ABSL_EXCLUSIVE_LOCK_FUNCTION(mu)
      : mu_(mu), long_dur_(long_dur), logger_(logger), lock_name_(lock_name) {
    absl::Time wait_start = absl::Now();
    while (!mu_->TryLockFor(long_dur_)) {
      SPDLOG_LOGGER_WARN(logger_, "still waiting to acquire {} after {}", lock_name_,
                         absl::FormatDuration(absl::Now() - wait_start));
    }
    acquired_at_ = absl::Now();
  }

  MutexLockWarnLong(const MutexLockWarnLong&) = delete;
  MutexLockWarnLong& operator=(const MutexLockWarnLong&) = delete;

  ~MutexLockWarnLong() ABSL_UNLOCK_FUNCTION() {
    absl::Duration held = absl::Now() - acquired_at_;
    mu_->Unlock();
    if (held > long_dur_) {
      SPDLOG_LOGGER_WARN(logger_, "held {} for {}", lock_name_,
                         absl::FormatDuration(held));
    }
  }

 private:
  TimedMutex* mu_;
  const absl::Duration long_dur_;
  spdlog::logger* logger_;
  const char* lock_name_;
  absl::Time acquired_at_;
};

}  // namespace flowqos

#endif  // FLOWQOS_THREADS_MUTEX_HELPERS_H_
