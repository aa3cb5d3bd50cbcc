#ifndef FLOWQOS_TRAFFIC_CLASSIFIER_H_
#define FLOWQOS_TRAFFIC_CLASSIFIER_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "flowqos/proto/flowqos.pb.h"

namespace flowqos {

struct PortRange {
  int32_t lo;
  int32_t hi;  // inclusive

  bool Contains(int32_t port) const { return lo <= port && port <= hi; }
};

struct ClassifierEntry {
  proto::TrafficClass traffic_class;
  std::vector<PortRange> ports;
  std::vector<std::string> app_protocols;  // lower case
};

// ClassifierTable maps packet metadata to a traffic class.
//
// Lookup tries the destination port, then the source port, then the
// application protocol name. Within each step the first matching entry wins.
// Create rejects tables in which two entries share a port or a protocol name,
// so the answer never depends on entry order.
class ClassifierTable {
 public:
  static absl::StatusOr<ClassifierTable> Create(std::vector<ClassifierEntry> entries);

  proto::TrafficClass Classify(const proto::RawPacketMeta& meta) const;

  const std::vector<ClassifierEntry>& entries() const { return entries_; }

 private:
  explicit ClassifierTable(std::vector<ClassifierEntry> entries)
      : entries_(std::move(entries)) {}

  proto::TrafficClass ClassifyPort(int32_t port) const;

  std::vector<ClassifierEntry> entries_;
};

std::vector<ClassifierEntry> DefaultClassifierEntries();

// DefaultClassifierTable returns an immutable table built from
// DefaultClassifierEntries.
const ClassifierTable& DefaultClassifierTable();

proto::RawPacketMeta MetaFromSample(const proto::TrafficSample& sample);

}  // namespace flowqos

#endif  // FLOWQOS_TRAFFIC_CLASSIFIER_H_
