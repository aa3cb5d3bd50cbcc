#ifndef FLOWQOS_SERVER_MONITOR_SERVICE_H_
#define FLOWQOS_SERVER_MONITOR_SERVICE_H_

#include "flowqos/broadcast/broadcaster.h"
#include "flowqos/rules/rule-store.h"
#include "flowqos/store/traffic-store.h"
#include "grpcpp/generic/async_generic_service.h"
#include "grpcpp/grpcpp.h"
#include "spdlog/spdlog.h"

namespace flowqos {

// MonitorService serves flowqos.proto.TrafficMonitor.
//
// Watch streams connect a subscriber to the broadcaster for the lifetime of
// the stream. The rule methods act on the shared RuleStore. AppendSamples
// validates every sample and then hands the whole list to the sample sink;
// it fails with FAILED_PRECONDITION when the service has no sink.
class MonitorService final : public grpc::CallbackGenericService {
 public:
  MonitorService(Broadcaster* broadcaster, RuleStore* rules, SampleSink* samples,
                 int id);

  grpc::ServerGenericBidiReactor* CreateReactor(
      grpc::GenericCallbackServerContext* context) override;

 private:
  grpc::Status SetRule(grpc::ByteBuffer* req, grpc::ByteBuffer* resp);
  grpc::Status GetRules(grpc::ByteBuffer* req, grpc::ByteBuffer* resp);
  grpc::Status ListSubscribers(grpc::ByteBuffer* req, grpc::ByteBuffer* resp);
  grpc::Status AppendSamples(grpc::ByteBuffer* req, grpc::ByteBuffer* resp);

  Broadcaster* broadcaster_;
  RuleStore* rules_;
  SampleSink* samples_;
  spdlog::logger logger_;

  friend class WatchReactor;
};

}  // namespace flowqos

#endif  // FLOWQOS_SERVER_MONITOR_SERVICE_H_
