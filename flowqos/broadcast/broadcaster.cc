#include "flowqos/broadcast/broadcaster.h"

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "flowqos/log/spdlog.h"
#include "flowqos/proto/constructors.h"

namespace flowqos {

namespace {

constexpr absl::Duration kLongLockDur = absl::Milliseconds(20);

// Overflow is logged on the first drop and then once per this many drops.
constexpr int64_t kDropLogInterval = 100;

}  // namespace

bool IsKnownChannel(absl::string_view channel) {
  return channel == kTrafficChannel || channel == kTrafficByTypeChannel ||
         channel == kAllocationChannel || channel == kAlertsChannel;
}

absl::string_view ChannelOf(const proto::BroadcastMessage& mesg) {
  switch (mesg.kind_case()) {
    case proto::BroadcastMessage::kTrafficUpdate:
      return kTrafficChannel;
    case proto::BroadcastMessage::kTrafficByType:
      return kTrafficByTypeChannel;
    case proto::BroadcastMessage::kAllocationUpdate:
      return kAllocationChannel;
    case proto::BroadcastMessage::kAlertUpdate:
      return kAlertsChannel;
    default:
      return "";
  }
}

Subscriber::Subscriber(uint64_t id, std::string peer, absl::Time connected_at,
                       size_t buffer_size, spdlog::logger* logger)
    : id_(id),
      peer_(std::move(peer)),
      connected_at_(connected_at),
      logger_(logger),
      queue_(buffer_size) {}

absl::Status Subscriber::Subscribe(absl::string_view channel) {
  if (!IsKnownChannel(channel)) {
    return absl::InvalidArgumentError(absl::StrCat("unknown channel: ", channel));
  }
  absl::MutexLock l(&mu_);
  filtered_ = true;
  channels_.insert(std::string(channel));
  return absl::OkStatus();
}

void Subscriber::Unsubscribe(absl::string_view channel) {
  absl::MutexLock l(&mu_);
  channels_.erase(std::string(channel));
}

bool Subscriber::Wants(absl::string_view channel) const {
  absl::MutexLock l(&mu_);
  return !filtered_ || channels_.count(std::string(channel)) > 0;
}

std::vector<std::string> Subscriber::channels() const {
  absl::MutexLock l(&mu_);
  return std::vector<std::string>(channels_.begin(), channels_.end());
}

void Subscriber::Deliver(const proto::BroadcastMessage& mesg) {
  int dropped = queue_.Write(mesg);
  if (dropped > 0) {
    int64_t total = dropped_.fetch_add(dropped) + dropped;
    if ((total - 1) % kDropLogInterval == 0) {
      SPDLOG_LOGGER_WARN(logger_,
                         "subscriber {} ({}) is falling behind: {} messages dropped",
                         id_, peer_, total);
    }
  }
  NotifyReady();
}

void Subscriber::SetOnReady(std::function<void()> on_ready) {
  absl::MutexLock l(&ready_mu_);
  on_ready_ = std::move(on_ready);
}

void Subscriber::NotifyReady() {
  absl::MutexLock l(&ready_mu_);
  if (on_ready_) {
    on_ready_();
  }
}

void Subscriber::Close() {
  queue_.Close();
  NotifyReady();
}

proto::SubscriberInfo Subscriber::Info() const {
  proto::SubscriberInfo info;
  info.set_id(id_);
  *info.mutable_connected_at() = ToProtoTimestamp(connected_at_);
  for (std::string& c : channels()) {
    info.add_channels(std::move(c));
  }
  info.set_dropped_messages(dropped_messages());
  info.set_peer(peer_);
  return info;
}

Broadcaster::Broadcaster(size_t buffer_size)
    : buffer_size_(buffer_size), logger_(MakeLogger("broadcaster")) {}

Broadcaster::~Broadcaster() { Close(); }

Broadcaster::Handle::Handle(Broadcaster* broadcaster, std::shared_ptr<Subscriber> sub)
    : broadcaster_(broadcaster), sub_(std::move(sub)) {}

Broadcaster::Handle::~Handle() {
  sub_->Close();
  broadcaster_->Remove(sub_->id());
}

std::unique_ptr<Broadcaster::Handle> Broadcaster::Connect(std::string peer,
                                                          absl::Time now) {
  MutexLockWarnLong l(&mu_, kLongLockDur, &logger_, "mu_ in Connect");
  const uint64_t id = next_id_++;
  auto sub = std::make_shared<Subscriber>(id, peer, now, buffer_size_, &logger_);
  if (closed_) {
    sub->Close();
  } else {
    subs_[id] = sub;
  }
  SPDLOG_LOGGER_INFO(&logger_, "subscriber {} connected from {}", id, peer);
  return absl::WrapUnique(new Handle(this, std::move(sub)));
}

void Broadcaster::Remove(uint64_t id) {
  MutexLockWarnLong l(&mu_, kLongLockDur, &logger_, "mu_ in Remove");
  if (subs_.erase(id) > 0) {
    SPDLOG_LOGGER_INFO(&logger_, "subscriber {} disconnected", id);
  }
}

int Broadcaster::Publish(const proto::BroadcastMessage& mesg) {
  absl::string_view channel = ChannelOf(mesg);
  FQ_SPDLOG_CHECK_MESG(&logger_, !channel.empty(), "published message has no payload");

  std::vector<std::shared_ptr<Subscriber>> targets;
  {
    MutexLockWarnLong l(&mu_, kLongLockDur, &logger_, "mu_ in Publish");
    targets.reserve(subs_.size());
    for (const auto& [id, sub] : subs_) {
      targets.push_back(sub);
    }
  }

  int num = 0;
  for (const std::shared_ptr<Subscriber>& sub : targets) {
    if (sub->Wants(channel)) {
      sub->Deliver(mesg);
      ++num;
    }
  }
  return num;
}

std::vector<proto::SubscriberInfo> Broadcaster::ListSubscribers() const {
  std::vector<std::shared_ptr<Subscriber>> subs;
  {
    MutexLockWarnLong l(&mu_, kLongLockDur, &logger_, "mu_ in ListSubscribers");
    for (const auto& [id, sub] : subs_) {
      subs.push_back(sub);
    }
  }
  std::vector<proto::SubscriberInfo> infos;
  infos.reserve(subs.size());
  for (const auto& sub : subs) {
    infos.push_back(sub->Info());
  }
  return infos;
}

size_t Broadcaster::num_subscribers() const {
  MutexLockWarnLong l(&mu_, kLongLockDur, &logger_, "mu_ in num_subscribers");
  return subs_.size();
}

void Broadcaster::Close() {
  std::vector<std::shared_ptr<Subscriber>> subs;
  {
    MutexLockWarnLong l(&mu_, kLongLockDur, &logger_, "mu_ in Close");
    closed_ = true;
    for (const auto& [id, sub] : subs_) {
      subs.push_back(sub);
    }
  }
  for (const auto& sub : subs) {
    sub->Close();
  }
}

}  // namespace flowqos
