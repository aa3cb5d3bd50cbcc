#ifndef FLOWQOS_SERVER_MONITOR_CHANNEL_H_
#define FLOWQOS_SERVER_MONITOR_CHANNEL_H_

#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "flowqos/proto/flowqos.pb.h"
#include "flowqos/threads/overwrite-queue.h"
#include "grpcpp/generic/generic_stub.h"
#include "grpcpp/grpcpp.h"

namespace flowqos {

// WatchStream is the client end of a TrafficMonitor.Watch call. Events are
// buffered as they arrive; when the buffer is full the oldest is dropped.
class WatchStream final
    : public grpc::ClientBidiReactor<proto::WatchRequest, proto::WatchEvent> {
 public:
  WatchStream(std::shared_ptr<grpc::Channel> channel, size_t buffer_size);

  // Cancels the call if it is still running and waits for it to end.
  ~WatchStream() override;

  WatchStream(const WatchStream&) = delete;
  WatchStream& operator=(const WatchStream&) = delete;

  void Subscribe(absl::string_view channel);
  void Unsubscribe(absl::string_view channel);

  // Next returns nullopt once the call has ended and every event was read.
  std::optional<proto::WatchEvent> Next() { return events_.Read(); }
  std::optional<proto::WatchEvent> NextWithTimeout(absl::Duration timeout) {
    return events_.ReadWithTimeout(timeout);
  }

  void Cancel() { ctx_.TryCancel(); }

  // Await blocks until the call ends and returns its status.
  grpc::Status Await();
  bool finished();

  void OnReadDone(bool ok) override;
  void OnWriteDone(bool ok) override;
  void OnDone(const grpc::Status& status) override;

 private:
  void Send(proto::WatchRequest req);

  grpc::TemplatedGenericStub<proto::WatchRequest, proto::WatchEvent> stub_;
  grpc::ClientContext ctx_;
  proto::WatchEvent event_;
  OverwriteQueue<proto::WatchEvent> events_;

  absl::Mutex mu_;
  std::deque<proto::WatchRequest> pending_ ABSL_GUARDED_BY(mu_);
  bool writing_ ABSL_GUARDED_BY(mu_) = false;
  bool done_ ABSL_GUARDED_BY(mu_) = false;
  grpc::Status status_ ABSL_GUARDED_BY(mu_);
};

// MonitorChannel is a blocking client for the TrafficMonitor service.
class MonitorChannel {
 public:
  explicit MonitorChannel(std::shared_ptr<grpc::Channel> channel,
                          absl::Duration rpc_timeout = absl::Seconds(5));

  grpc::Status SetRule(const proto::QosRule& rule);
  grpc::Status GetRules(proto::RuleList* rules);
  grpc::Status ListSubscribers(proto::SubscriberList* subscribers);
  grpc::Status AppendSamples(const proto::SampleList& samples,
                             int64_t* num_accepted = nullptr);

  std::unique_ptr<WatchStream> Watch(size_t buffer_size = 1024);

 private:
  template <typename Req, typename Resp>
  grpc::Status Call(const std::string& method, const Req& req, Resp* resp);

  std::shared_ptr<grpc::Channel> channel_;
  const absl::Duration rpc_timeout_;
};

}  // namespace flowqos

#endif  // FLOWQOS_SERVER_MONITOR_CHANNEL_H_
