#include "flowqos/server/monitor-channel.h"

#include "absl/synchronization/notification.h"
#include "flowqos/server/methods.h"

namespace flowqos {

WatchStream::WatchStream(std::shared_ptr<grpc::Channel> channel, size_t buffer_size)
    : stub_(std::move(channel)), events_(buffer_size) {
  stub_.PrepareBidiStreamingCall(&ctx_, kWatchMethod, grpc::StubOptions(), this);
  StartRead(&event_);
  StartCall();
}

WatchStream::~WatchStream() {
  ctx_.TryCancel();
  mu_.LockWhen(absl::Condition(+[](bool* done) { return *done; }, &done_));
  mu_.Unlock();
}

void WatchStream::Subscribe(absl::string_view channel) {
  proto::WatchRequest req;
  req.set_subscribe(std::string(channel));
  Send(std::move(req));
}

void WatchStream::Unsubscribe(absl::string_view channel) {
  proto::WatchRequest req;
  req.set_unsubscribe(std::string(channel));
  Send(std::move(req));
}

void WatchStream::Send(proto::WatchRequest req) {
  const proto::WatchRequest* to_write = nullptr;
  {
    absl::MutexLock l(&mu_);
    if (done_) {
      return;
    }
    pending_.push_back(std::move(req));
    if (writing_) {
      return;
    }
    writing_ = true;
    to_write = &pending_.front();
  }
  StartWrite(to_write);
}

void WatchStream::OnWriteDone(bool ok) {
  const proto::WatchRequest* to_write = nullptr;
  {
    absl::MutexLock l(&mu_);
    pending_.pop_front();
    if (!ok || done_ || pending_.empty()) {
      writing_ = false;
      return;
    }
    to_write = &pending_.front();
  }
  StartWrite(to_write);
}

void WatchStream::OnReadDone(bool ok) {
  if (!ok) {
    return;
  }
  events_.Write(event_);
  StartRead(&event_);
}

void WatchStream::OnDone(const grpc::Status& status) {
  absl::MutexLock l(&mu_);
  status_ = status;
  done_ = true;
  events_.Close();
}

grpc::Status WatchStream::Await() {
  mu_.LockWhen(absl::Condition(+[](bool* done) { return *done; }, &done_));
  grpc::Status st = status_;
  mu_.Unlock();
  return st;
}

bool WatchStream::finished() {
  absl::MutexLock l(&mu_);
  return done_;
}

MonitorChannel::MonitorChannel(std::shared_ptr<grpc::Channel> channel,
                               absl::Duration rpc_timeout)
    : channel_(std::move(channel)), rpc_timeout_(rpc_timeout) {}

template <typename Req, typename Resp>
grpc::Status MonitorChannel::Call(const std::string& method, const Req& req, Resp* resp) {
  grpc::TemplatedGenericStub<Req, Resp> stub(channel_);
  grpc::ClientContext ctx;
  ctx.set_deadline(absl::ToChronoTime(absl::Now() + rpc_timeout_));

  absl::Notification done;
  grpc::Status status;
  stub.UnaryCall(&ctx, method, grpc::StubOptions(), &req, resp,
                 [&status, &done](grpc::Status st) {
                   status = std::move(st);
                   done.Notify();
                 });
  done.WaitForNotification();
  return status;
}

grpc::Status MonitorChannel::SetRule(const proto::QosRule& rule) {
  proto::SetRuleResponse resp;
  return Call(kSetRuleMethod, rule, &resp);
}

grpc::Status MonitorChannel::GetRules(proto::RuleList* rules) {
  return Call(kGetRulesMethod, proto::GetRulesRequest(), rules);
}

grpc::Status MonitorChannel::ListSubscribers(proto::SubscriberList* subscribers) {
  return Call(kListSubscribersMethod, proto::ListSubscribersRequest(), subscribers);
}

grpc::Status MonitorChannel::AppendSamples(const proto::SampleList& samples,
                                           int64_t* num_accepted) {
  proto::AppendSamplesResponse resp;
  grpc::Status st = Call(kAppendSamplesMethod, samples, &resp);
  if (st.ok() && num_accepted != nullptr) {
    *num_accepted = resp.num_accepted();
  }
  return st;
}

std::unique_ptr<WatchStream> MonitorChannel::Watch(size_t buffer_size) {
  return std::make_unique<WatchStream>(channel_, buffer_size);
}

}  // namespace flowqos
