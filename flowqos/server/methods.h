#ifndef FLOWQOS_SERVER_METHODS_H_
#define FLOWQOS_SERVER_METHODS_H_

#include <string>

#include "absl/status/status.h"
#include "grpcpp/grpcpp.h"
#include "grpcpp/impl/codegen/proto_utils.h"
#include "grpcpp/support/byte_buffer.h"

namespace flowqos {

// Methods of the flowqos.proto.TrafficMonitor service.
inline constexpr char kWatchMethod[] = "/flowqos.proto.TrafficMonitor/Watch";
inline constexpr char kSetRuleMethod[] = "/flowqos.proto.TrafficMonitor/SetRule";
inline constexpr char kGetRulesMethod[] = "/flowqos.proto.TrafficMonitor/GetRules";
inline constexpr char kListSubscribersMethod[] =
    "/flowqos.proto.TrafficMonitor/ListSubscribers";
inline constexpr char kAppendSamplesMethod[] =
    "/flowqos.proto.TrafficMonitor/AppendSamples";

inline grpc::Status ToGrpcStatus(const absl::Status& st) {
  if (st.ok()) {
    return grpc::Status::OK;
  }
  return grpc::Status(static_cast<grpc::StatusCode>(st.code()),
                      std::string(st.message()));
}

template <typename M>
grpc::Status SerializeToBuffer(const M& msg, grpc::ByteBuffer* buf) {
  bool own_buffer = false;
  return grpc::SerializationTraits<M>::Serialize(msg, buf, &own_buffer);
}

// ParseFromBuffer consumes buf.
template <typename M>
grpc::Status ParseFromBuffer(grpc::ByteBuffer* buf, M* msg) {
  return grpc::SerializationTraits<M>::Deserialize(buf, msg);
}

}  // namespace flowqos

#endif  // FLOWQOS_SERVER_METHODS_H_
