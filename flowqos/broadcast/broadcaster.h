#ifndef FLOWQOS_BROADCAST_BROADCASTER_H_
#define FLOWQOS_BROADCAST_BROADCASTER_H_

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "flowqos/proto/flowqos.pb.h"
#include "flowqos/threads/mutex-helpers.h"
#include "flowqos/threads/overwrite-queue.h"
#include "spdlog/spdlog.h"

namespace flowqos {

inline constexpr char kTrafficChannel[] = "traffic";
inline constexpr char kTrafficByTypeChannel[] = "traffic-by-type";
inline constexpr char kAllocationChannel[] = "allocation";
inline constexpr char kAlertsChannel[] = "alerts";

bool IsKnownChannel(absl::string_view channel);

// ChannelOf returns the channel a message is published on, or "" if the
// message carries no payload.
absl::string_view ChannelOf(const proto::BroadcastMessage& mesg);

// Subscriber is one connected observer. Messages wait in a bounded queue;
// when the subscriber falls behind, the oldest queued message is dropped.
class Subscriber {
 public:
  Subscriber(uint64_t id, std::string peer, absl::Time connected_at,
             size_t buffer_size, spdlog::logger* logger);

  uint64_t id() const { return id_; }

  // Subscribe fails only for unknown channel names. Repeat calls are no-ops.
  absl::Status Subscribe(absl::string_view channel);
  // Unsubscribe of a channel that was never subscribed is a no-op.
  void Unsubscribe(absl::string_view channel);

  // A subscriber that never called Subscribe receives every channel. After
  // the first Subscribe, it receives only the channels in its set, which may
  // become empty.
  bool Wants(absl::string_view channel) const;
  std::vector<std::string> channels() const;

  // Deliver never blocks. Messages are dropped once the subscriber is closed.
  void Deliver(const proto::BroadcastMessage& mesg);

  std::optional<proto::BroadcastMessage> Next() { return queue_.Read(); }
  std::optional<proto::BroadcastMessage> NextWithTimeout(absl::Duration timeout) {
    return queue_.ReadWithTimeout(timeout);
  }
  std::optional<proto::BroadcastMessage> TryNext() { return queue_.TryRead(); }

  // on_ready runs after every delivery and on Close, on the calling thread.
  // It must not block or call SetOnReady. Once SetOnReady returns, the
  // previous callback is no longer running and will not run again.
  void SetOnReady(std::function<void()> on_ready);

  void Close();
  bool closed() const { return queue_.closed(); }

  int64_t dropped_messages() const { return dropped_.load(); }
  proto::SubscriberInfo Info() const;

 private:
  const uint64_t id_;
  const std::string peer_;
  const absl::Time connected_at_;
  spdlog::logger* logger_;

  OverwriteQueue<proto::BroadcastMessage> queue_;
  std::atomic<int64_t> dropped_{0};

  void NotifyReady();

  mutable absl::Mutex mu_;
  std::set<std::string> channels_ ABSL_GUARDED_BY(mu_);
  bool filtered_ ABSL_GUARDED_BY(mu_) = false;

  absl::Mutex ready_mu_;
  std::function<void()> on_ready_ ABSL_GUARDED_BY(ready_mu_);
};

// Broadcaster fans tick output out to every live subscriber.
//
// The subscriber set is locked only while it is mutated or copied, never
// while messages are delivered, so a slow subscriber cannot stall Publish or
// other subscribers.
class Broadcaster {
 public:
  explicit Broadcaster(size_t buffer_size);
  ~Broadcaster();

  Broadcaster(const Broadcaster&) = delete;
  Broadcaster& operator=(const Broadcaster&) = delete;

  class Handle;

  // Connect registers a new subscriber. It is removed when the handle is destroyed.
  std::unique_ptr<Handle> Connect(std::string peer, absl::Time now);

  // Publish returns the number of subscribers the message was queued for.
  int Publish(const proto::BroadcastMessage& mesg);

  std::vector<proto::SubscriberInfo> ListSubscribers() const;
  size_t num_subscribers() const;

  // Close closes every subscriber queue. Later connections start closed.
  void Close();

  class Handle {
   public:
    ~Handle();

    Handle(const Handle&) = delete;
    Handle& operator=(const Handle&) = delete;

    Subscriber* subscriber() const { return sub_.get(); }
    uint64_t id() const { return sub_->id(); }

   private:
    Handle(Broadcaster* broadcaster, std::shared_ptr<Subscriber> sub);

    Broadcaster* broadcaster_;
    std::shared_ptr<Subscriber> sub_;

    friend class Broadcaster;
  };

 private:
  void Remove(uint64_t id);

  const size_t buffer_size_;
  mutable spdlog::logger logger_;

  mutable TimedMutex mu_;
  uint64_t next_id_ ABSL_GUARDED_BY(mu_) = 1;
  bool closed_ ABSL_GUARDED_BY(mu_) = false;
  std::map<uint64_t, std::shared_ptr<Subscriber>> subs_ ABSL_GUARDED_BY(mu_);
};

}  // namespace flowqos

#endif  // FLOWQOS_BROADCAST_BROADCASTER_H_
