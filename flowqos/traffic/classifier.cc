#include "flowqos/traffic/classifier.h"

#include "absl/container/flat_hash_map.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "flowqos/log/spdlog.h"
#include "flowqos/traffic/traffic-class.h"

namespace flowqos {

absl::StatusOr<ClassifierTable> ClassifierTable::Create(
    std::vector<ClassifierEntry> entries) {
  absl::flat_hash_map<std::string, proto::TrafficClass> proto_owner;
  for (size_t i = 0; i < entries.size(); ++i) {
    const ClassifierEntry& e = entries[i];
    if (!IsQosClass(e.traffic_class)) {
      return absl::InvalidArgumentError(absl::StrCat(
          "classifier entry ", i, " maps to non-QoS class ",
          TrafficClassName(e.traffic_class)));
    }
    for (const PortRange& r : e.ports) {
      if (r.lo > r.hi || r.lo < 0 || r.hi > 65535) {
        return absl::InvalidArgumentError(
            absl::StrCat("invalid port range [", r.lo, ", ", r.hi, "] for ",
                         TrafficClassName(e.traffic_class)));
      }
      for (size_t j = 0; j < i; ++j) {
        for (const PortRange& other : entries[j].ports) {
          if (r.lo <= other.hi && other.lo <= r.hi) {
            return absl::InvalidArgumentError(absl::StrCat(
                "port range [", r.lo, ", ", r.hi, "] of ",
                TrafficClassName(e.traffic_class), " overlaps [", other.lo, ", ",
                other.hi, "] of ", TrafficClassName(entries[j].traffic_class)));
          }
        }
      }
    }
    for (const std::string& p : e.app_protocols) {
      std::string lower = absl::AsciiStrToLower(p);
      auto [it, inserted] = proto_owner.insert({lower, e.traffic_class});
      if (!inserted) {
        return absl::InvalidArgumentError(
            absl::StrCat("app protocol ", lower, " claimed by both ",
                         TrafficClassName(it->second), " and ",
                         TrafficClassName(e.traffic_class)));
      }
    }
  }
  for (ClassifierEntry& e : entries) {
    for (std::string& p : e.app_protocols) {
      p = absl::AsciiStrToLower(p);
    }
  }
  return ClassifierTable(std::move(entries));
}

proto::TrafficClass ClassifierTable::ClassifyPort(int32_t port) const {
  for (const ClassifierEntry& e : entries_) {
    for (const PortRange& r : e.ports) {
      if (r.Contains(port)) {
        return e.traffic_class;
      }
    }
  }
  return proto::TC_UNKNOWN;
}

proto::TrafficClass ClassifierTable::Classify(const proto::RawPacketMeta& meta) const {
  proto::TrafficClass c = ClassifyPort(meta.dst_port());
  if (c != proto::TC_UNKNOWN) {
    return c;
  }
  c = ClassifyPort(meta.src_port());
  if (c != proto::TC_UNKNOWN) {
    return c;
  }
  if (!meta.app_protocol().empty()) {
    std::string app = absl::AsciiStrToLower(meta.app_protocol());
    for (const ClassifierEntry& e : entries_) {
      for (const std::string& p : e.app_protocols) {
        if (p == app) {
          return e.traffic_class;
        }
      }
    }
  }
  return proto::TC_UNKNOWN;
}

std::vector<ClassifierEntry> DefaultClassifierEntries() {
  return {
      {
          proto::TC_VIDEO,
          {{1755, 1755}, {1935, 1935}, {3478, 3479}, {5004, 5005}, {6970, 6979},
           {8554, 8554}},
          {"rtmp", "rtsp", "rtp"},
      },
      {
          proto::TC_VOICE,
          {{5060, 5062}, {16384, 16396}},
          {"sip"},
      },
      {
          proto::TC_FILE,
          {{20, 22}, {25, 25}, {110, 110}, {143, 143}, {445, 445}, {3389, 3389},
           {8080, 8080}, {8443, 8443}},
          {"ftp", "sftp", "smtp", "pop3", "imap", "smb"},
      },
      {
          proto::TC_BACKGROUND,
          {{53, 53}, {123, 123}, {161, 162}, {389, 389}, {636, 636}, {3306, 3306},
           {5432, 5432}},
          {"dns", "ntp", "snmp", "ldap", "mysql", "postgresql"},
      },
  };
}

const ClassifierTable& DefaultClassifierTable() {
  static const ClassifierTable* table = [] {
    auto table_or = ClassifierTable::Create(DefaultClassifierEntries());
    FQ_ASSERT_MESG(table_or.ok(), table_or.status().ToString());
    return new ClassifierTable(std::move(*table_or));
  }();
  return *table;
}

proto::RawPacketMeta MetaFromSample(const proto::TrafficSample& sample) {
  proto::RawPacketMeta meta;
  meta.set_src_port(sample.src_port());
  meta.set_dst_port(sample.dst_port());
  meta.set_protocol(sample.protocol());
  meta.set_app_protocol(sample.app_protocol());
  return meta;
}

}  // namespace flowqos
