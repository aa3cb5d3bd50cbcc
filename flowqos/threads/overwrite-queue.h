#ifndef FLOWQOS_THREADS_OVERWRITE_QUEUE_H_
#define FLOWQOS_THREADS_OVERWRITE_QUEUE_H_

#include <cstddef>
#include <deque>
#include <optional>

#include "absl/base/macros.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

namespace flowqos {

// OverwriteQueue is a bounded FIFO queue that never blocks writers.
// Writing to a full queue evicts the oldest element.
template <typename T>
class OverwriteQueue {
 public:
  explicit OverwriteQueue(size_t capacity) : capacity_(capacity) {
    ABSL_ASSERT(capacity > 0);
  }

  OverwriteQueue(const OverwriteQueue<T>&) = delete;
  OverwriteQueue<T>& operator=(const OverwriteQueue<T>&) = delete;

  // Read blocks until an element is available or the queue is closed.
  // Elements written before Close are still returned.
  std::optional<T> Read();
  std::optional<T> ReadWithTimeout(absl::Duration timeout);
  std::optional<T> TryRead();

  // Write returns the number of elements evicted to make room (0 or 1).
  // Writes to a closed queue are discarded.
  int Write(T data);
  void Close();

  bool closed() const;
  size_t size() const;
  size_t capacity() const { return capacity_; }

 private:
  std::optional<T> PopLocked();

  const size_t capacity_;

  mutable absl::Mutex mu_;
  std::deque<T> data_;
  bool closed_ = false;
};

template <typename T>
std::optional<T> OverwriteQueue<T>::PopLocked() {
  if (data_.empty()) {
    return std::nullopt;
  }
  T data = std::move(data_.front());
  data_.pop_front();
  return data;
}

template <typename T>
std::optional<T> OverwriteQueue<T>::Read() {
  mu_.LockWhen(absl::Condition(
      +[](OverwriteQueue<T>* self) {
        return !self->data_.empty() || self->closed_;
      },
      this));
  std::optional<T> data = PopLocked();
  mu_.Unlock();
  return data;
}

template <typename T>
std::optional<T> OverwriteQueue<T>::ReadWithTimeout(absl::Duration timeout) {
  mu_.LockWhenWithTimeout(
      absl::Condition(
          +[](OverwriteQueue<T>* self) {
            return !self->data_.empty() || self->closed_;
          },
          this),
      timeout);
  std::optional<T> data = PopLocked();
  mu_.Unlock();
  return data;
}

template <typename T>
std::optional<T> OverwriteQueue<T>::TryRead() {
  absl::MutexLock l(&mu_);
  return PopLocked();
}

template <typename T>
int OverwriteQueue<T>::Write(T data) {
  absl::MutexLock l(&mu_);
  if (closed_) {
    return 0;
  }
  int dropped = 0;
  while (data_.size() >= capacity_) {
    data_.pop_front();
    ++dropped;
  }
  data_.push_back(std::move(data));
  return dropped;
}

template <typename T>
void OverwriteQueue<T>::Close() {
  absl::MutexLock l(&mu_);
  closed_ = true;
}

template <typename T>
bool OverwriteQueue<T>::closed() const {
  absl::MutexLock l(&mu_);
  return closed_;
}

template <typename T>
size_t OverwriteQueue<T>::size() const {
  absl::MutexLock l(&mu_);
  return data_.size();
}

}  // namespace flowqos

#endif  // FLOWQOS_THREADS_OVERWRITE_QUEUE_H_
