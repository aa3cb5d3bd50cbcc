#include "flowqos/server/monitor-service.h"

#include <cmath>
#include <deque>
#include <functional>
#include <vector>

#include "absl/strings/str_cat.h"
#include "flowqos/log/spdlog.h"
#include "flowqos/proto/flowqos.pb.h"
#include "flowqos/server/methods.h"
#include "flowqos/threads/mutex-helpers.h"

namespace flowqos {

class WatchReactor : public grpc::ServerGenericBidiReactor {
 public:
  WatchReactor(MonitorService* service, grpc::GenericCallbackServerContext* context)
      : peer_(context->peer()),
        service_(service),
        handle_(service->broadcaster_->Connect(peer_, absl::Now())),
        sub_(handle_->subscriber()),
        wip_write_(false),
        finished_(false) {
    SPDLOG_LOGGER_INFO(&service_->logger_, "{}: new watch from {} as subscriber {}",
                       __func__, peer_, handle_->id());
    {
      MutexLockWarnLong l(&mu_, kLongLockDur, &service_->logger_, "WatchReactor.mu_");
      proto::WatchEvent connected;
      connected.set_connected_subscriber_id(handle_->id());
      control_.push_back(std::move(connected));
      MaybeWrite();
    }
    sub_->SetOnReady([this] { OnMessageReady(); });
    StartRead(&read_buf_);
  }

  void OnReadDone(bool ok) override {
    MutexLockWarnLong l(&mu_, kLongLockDur, &service_->logger_, "WatchReactor.mu_");
    if (finished_) {
      return;
    }
    if (!ok) {
      // The client is done sending requests but may still want messages.
      return;
    }

    proto::WatchRequest req;
    if (grpc::Status st = ParseFromBuffer(&read_buf_, &req); !st.ok()) {
      FinishLocked(grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                                absl::StrCat("malformed WatchRequest: ",
                                             st.error_message())));
      return;
    }

    proto::WatchEvent ack;
    switch (req.op_case()) {
      case proto::WatchRequest::kSubscribe: {
        absl::Status st = sub_->Subscribe(req.subscribe());
        if (!st.ok()) {
          FinishLocked(ToGrpcStatus(st));
          return;
        }
        ack.set_subscribed(req.subscribe());
        break;
      }
      case proto::WatchRequest::kUnsubscribe:
        sub_->Unsubscribe(req.unsubscribe());
        ack.set_unsubscribed(req.unsubscribe());
        break;
      default:
        FinishLocked(
            grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "empty WatchRequest"));
        return;
    }
    SPDLOG_LOGGER_INFO(&service_->logger_, "subscriber {}: {}", handle_->id(),
                       req.ShortDebugString());
    control_.push_back(std::move(ack));
    MaybeWrite();
    StartRead(&read_buf_);
  }

  void OnMessageReady() {
    MutexLockWarnLong l(&mu_, kLongLockDur, &service_->logger_, "WatchReactor.mu_");
    MaybeWrite();
  }

  void OnWriteDone(bool ok) override {
    MutexLockWarnLong l(&mu_, kLongLockDur, &service_->logger_, "WatchReactor.mu_");
    wip_write_ = false;
    if (!ok) {
      SPDLOG_LOGGER_ERROR(&service_->logger_, "write failed to {}", peer_);
      FinishLocked(grpc::Status(grpc::StatusCode::UNKNOWN, "failed write"));
      return;
    }
    MaybeWrite();
  }

  void OnCancel() override {
    MutexLockWarnLong l(&mu_, kLongLockDur, &service_->logger_, "WatchReactor.mu_");
    FinishLocked(grpc::Status::CANCELLED);
  }

  void OnDone() override {
    sub_->SetOnReady(nullptr);
    SPDLOG_LOGGER_INFO(&service_->logger_, "watch from {} done", peer_);
    handle_.reset();
    delete this;
  }

 private:
  static constexpr absl::Duration kLongLockDur = absl::Milliseconds(5);

  void FinishLocked(grpc::Status st) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_) {
    if (!finished_) {
      finished_ = true;
      Finish(std::move(st));
    }
  }

  // MaybeWrite starts the next write if none is in flight. Acknowledgements go
  // out before broadcast messages.
  void MaybeWrite() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_) {
    if (wip_write_ || finished_) {
      return;
    }
    proto::WatchEvent ev;
    if (!control_.empty()) {
      ev = std::move(control_.front());
      control_.pop_front();
    } else if (std::optional<proto::BroadcastMessage> m = sub_->TryNext()) {
      *ev.mutable_message() = std::move(*m);
    } else if (sub_->closed()) {
      FinishLocked(grpc::Status::OK);
      return;
    } else {
      return;
    }

    write_buf_.Clear();
    if (grpc::Status st = SerializeToBuffer(ev, &write_buf_); !st.ok()) {
      SPDLOG_LOGGER_ERROR(&service_->logger_, "failed to serialize event for {}: {}",
                          peer_, st.error_message());
      FinishLocked(st);
      return;
    }
    wip_write_ = true;
    StartWrite(&write_buf_);
  }

  const std::string peer_;
  MonitorService* service_;
  std::unique_ptr<Broadcaster::Handle> handle_;
  Subscriber* sub_;
  grpc::ByteBuffer read_buf_;

  TimedMutex mu_;
  std::deque<proto::WatchEvent> control_ ABSL_GUARDED_BY(mu_);
  grpc::ByteBuffer write_buf_ ABSL_GUARDED_BY(mu_);
  bool wip_write_ ABSL_GUARDED_BY(mu_);
  bool finished_ ABSL_GUARDED_BY(mu_);
};

namespace {

// UnaryReactor reads one request, runs handler on it and sends the response.
class UnaryReactor : public grpc::ServerGenericBidiReactor {
 public:
  using Handler = std::function<grpc::Status(grpc::ByteBuffer*, grpc::ByteBuffer*)>;

  explicit UnaryReactor(Handler handler) : handler_(std::move(handler)) {
    StartRead(&req_);
  }

  void OnReadDone(bool ok) override {
    if (!ok) {
      Finish(grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "missing request"));
      return;
    }
    grpc::Status st = handler_(&req_, &resp_);
    if (!st.ok()) {
      Finish(st);
      return;
    }
    StartWriteAndFinish(&resp_, grpc::WriteOptions(), grpc::Status::OK);
  }

  void OnDone() override { delete this; }

 private:
  Handler handler_;
  grpc::ByteBuffer req_;
  grpc::ByteBuffer resp_;
};

class UnimplementedReactor : public grpc::ServerGenericBidiReactor {
 public:
  explicit UnimplementedReactor(const std::string& method) {
    Finish(grpc::Status(grpc::StatusCode::UNIMPLEMENTED,
                        absl::StrCat("unknown method ", method)));
  }

  void OnDone() override { delete this; }
};

absl::Status ValidateSample(const proto::TrafficSample& sample) {
  if (!sample.has_timestamp()) {
    return absl::InvalidArgumentError("sample has no timestamp");
  }
  if (sample.packet_size() < 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("negative packet_size ", sample.packet_size()));
  }
  if (sample.has_throughput_mbps() &&
      (!std::isfinite(sample.throughput_mbps()) || sample.throughput_mbps() < 0)) {
    return absl::InvalidArgumentError(
        absl::StrCat("bad throughput_mbps ", sample.throughput_mbps()));
  }
  return absl::OkStatus();
}

}  // namespace

MonitorService::MonitorService(Broadcaster* broadcaster, RuleStore* rules,
                               SampleSink* samples, int id)
    : broadcaster_(broadcaster),
      rules_(rules),
      samples_(samples),
      logger_(MakeLogger(absl::StrCat("monitor-svc-", id))) {}

grpc::ServerGenericBidiReactor* MonitorService::CreateReactor(
    grpc::GenericCallbackServerContext* context) {
  const std::string& method = context->method();
  if (method == kWatchMethod) {
    return new WatchReactor(this, context);
  }
  if (method == kSetRuleMethod) {
    return new UnaryReactor([this](grpc::ByteBuffer* req, grpc::ByteBuffer* resp) {
      return SetRule(req, resp);
    });
  }
  if (method == kGetRulesMethod) {
    return new UnaryReactor([this](grpc::ByteBuffer* req, grpc::ByteBuffer* resp) {
      return GetRules(req, resp);
    });
  }
  if (method == kListSubscribersMethod) {
    return new UnaryReactor([this](grpc::ByteBuffer* req, grpc::ByteBuffer* resp) {
      return ListSubscribers(req, resp);
    });
  }
  if (method == kAppendSamplesMethod) {
    return new UnaryReactor([this](grpc::ByteBuffer* req, grpc::ByteBuffer* resp) {
      return AppendSamples(req, resp);
    });
  }
  SPDLOG_LOGGER_WARN(&logger_, "call to unknown method {} from {}", method,
                     context->peer());
  return new UnimplementedReactor(method);
}

grpc::Status MonitorService::SetRule(grpc::ByteBuffer* req, grpc::ByteBuffer* resp) {
  proto::QosRule rule;
  if (grpc::Status st = ParseFromBuffer(req, &rule); !st.ok()) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "malformed QosRule");
  }
  if (absl::Status st = rules_->SetRule(rule); !st.ok()) {
    return ToGrpcStatus(st);
  }
  return SerializeToBuffer(proto::SetRuleResponse(), resp);
}

grpc::Status MonitorService::GetRules(grpc::ByteBuffer* req, grpc::ByteBuffer* resp) {
  proto::GetRulesRequest get_req;
  if (grpc::Status st = ParseFromBuffer(req, &get_req); !st.ok()) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "malformed GetRulesRequest");
  }
  proto::RuleList list;
  for (proto::QosRule& r : rules_->GetRules()) {
    *list.add_rules() = std::move(r);
  }
  return SerializeToBuffer(list, resp);
}

grpc::Status MonitorService::ListSubscribers(grpc::ByteBuffer* req,
                                             grpc::ByteBuffer* resp) {
  proto::ListSubscribersRequest list_req;
  if (grpc::Status st = ParseFromBuffer(req, &list_req); !st.ok()) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                        "malformed ListSubscribersRequest");
  }
  proto::SubscriberList list;
  for (proto::SubscriberInfo& info : broadcaster_->ListSubscribers()) {
    *list.add_subscribers() = std::move(info);
  }
  return SerializeToBuffer(list, resp);
}

grpc::Status MonitorService::AppendSamples(grpc::ByteBuffer* req,
                                           grpc::ByteBuffer* resp) {
  if (samples_ == nullptr) {
    return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION,
                        "this server does not accept samples");
  }
  proto::SampleList list;
  if (grpc::Status st = ParseFromBuffer(req, &list); !st.ok()) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "malformed SampleList");
  }
  for (int i = 0; i < list.samples_size(); ++i) {
    if (absl::Status st = ValidateSample(list.samples(i)); !st.ok()) {
      return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                          absl::StrCat("sample ", i, ": ", st.message()));
    }
  }
  std::vector<proto::TrafficSample> samples(list.samples().begin(),
                                            list.samples().end());
  samples_->AppendSamples(samples);
  SPDLOG_LOGGER_DEBUG(&logger_, "appended {} samples", list.samples_size());

  proto::AppendSamplesResponse append_resp;
  append_resp.set_num_accepted(list.samples_size());
  return SerializeToBuffer(append_resp, resp);
}

}  // namespace flowqos
