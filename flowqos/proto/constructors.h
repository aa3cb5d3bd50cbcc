#ifndef FLOWQOS_PROTO_CONSTRUCTORS_H_
#define FLOWQOS_PROTO_CONSTRUCTORS_H_

#include <cstdint>
#include <string>

#include "absl/base/macros.h"
#include "absl/time/time.h"
#include "flowqos/proto/flowqos.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace flowqos {

struct SampleStruct {
  absl::Time timestamp = absl::UnixEpoch();
  std::string source_endpoint;
  std::string dest_endpoint;
  proto::TransportProtocol protocol = proto::TP_TCP;
  proto::TrafficClass traffic_class = proto::TC_UNSPECIFIED;
  int64_t packet_size = 0;
  double throughput_mbps = -1;  // negative means unset
  int32_t src_port = 0;
  int32_t dst_port = 0;
};

inline proto::TrafficSample ProtoTrafficSample(SampleStruct st);

inline absl::Time FromProtoTimestamp(const google::protobuf::Timestamp& timestamp);

inline google::protobuf::Timestamp ToProtoTimestamp(absl::Time time);

// Implementation

inline proto::TrafficSample ProtoTrafficSample(SampleStruct st) {
  proto::TrafficSample p;
  *p.mutable_timestamp() = ToProtoTimestamp(st.timestamp);
  p.set_source_endpoint(st.source_endpoint);
  p.set_dest_endpoint(st.dest_endpoint);
  p.set_protocol(st.protocol);
  p.set_traffic_class(st.traffic_class);
  p.set_packet_size(st.packet_size);
  if (st.throughput_mbps >= 0) {
    p.set_throughput_mbps(st.throughput_mbps);
  }
  p.set_src_port(st.src_port);
  p.set_dst_port(st.dst_port);
  return p;
}

inline absl::Time FromProtoTimestamp(const google::protobuf::Timestamp& timestamp) {
  return absl::FromUnixSeconds(timestamp.seconds()) +
         absl::Nanoseconds(timestamp.nanos());
}

inline google::protobuf::Timestamp ToProtoTimestamp(absl::Time time) {
  google::protobuf::Timestamp timestamp;
  timestamp.set_seconds(absl::ToUnixSeconds(time));
  int64_t nanos =
      absl::ToInt64Nanoseconds(time - absl::FromUnixSeconds(absl::ToUnixSeconds(time)));
  ABSL_ASSERT(nanos < 1'000'000'000);
  timestamp.set_nanos(nanos);
  return timestamp;
}

}  // namespace flowqos

#endif  // FLOWQOS_PROTO_CONSTRUCTORS_H_
