#include <atomic>
#include <cstdint>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/strings/str_split.h"
#include "absl/time/time.h"
#include "flowqos/init/init.h"
#include "flowqos/proto/fileio.h"
#include "flowqos/server/monitor-channel.h"
#include "google/protobuf/text_format.h"
#include "google/protobuf/util/json_util.h"
#include "grpcpp/grpcpp.h"

ABSL_FLAG(std::string, channels, "",
          "comma-separated channels to subscribe to; empty means all");
ABSL_FLAG(std::string, set_rule, "",
          "if set, a QosRule text proto to install, then exit");
ABSL_FLAG(bool, list, false, "print the rules and subscribers, then exit");
ABSL_FLAG(std::string, send_samples, "",
          "if set, an NDJSON file of TrafficSamples to send to the monitor, then exit");

static std::atomic<bool> should_exit_flag{false};

static void InterruptHandler(int signal) {
  if (signal == SIGINT) {
    should_exit_flag.store(true);
  }
}

namespace flowqos {
namespace {

int PrintJson(const google::protobuf::Message& msg) {
  std::string out;
  auto st = google::protobuf::util::MessageToJsonString(msg, &out);
  if (!st.ok()) {
    std::cerr << "failed to format message: " << st.ToString() << "\n";
    return 4;
  }
  std::cout << out << std::endl;
  return 0;
}

int SetRule(MonitorChannel* client, const std::string& text) {
  proto::QosRule rule;
  if (!google::protobuf::TextFormat::ParseFromString(text, &rule)) {
    std::cerr << "failed to parse rule\n";
    return 2;
  }
  grpc::Status st = client->SetRule(rule);
  if (!st.ok()) {
    std::cerr << "SetRule failed: " << st.error_message() << "\n";
    return 3;
  }
  return 0;
}

int List(MonitorChannel* client) {
  proto::RuleList rules;
  if (grpc::Status st = client->GetRules(&rules); !st.ok()) {
    std::cerr << "GetRules failed: " << st.error_message() << "\n";
    return 3;
  }
  proto::SubscriberList subs;
  if (grpc::Status st = client->ListSubscribers(&subs); !st.ok()) {
    std::cerr << "ListSubscribers failed: " << st.error_message() << "\n";
    return 3;
  }
  int ret = PrintJson(rules);
  if (ret == 0) {
    ret = PrintJson(subs);
  }
  return ret;
}

int SendSamples(MonitorChannel* client, const std::string& path) {
  proto::SampleList list;
  absl::Status st = ReadJsonLines(path, proto::TrafficSample::default_instance(),
                                  [&list](const google::protobuf::Message& m) {
                                    *list.add_samples() =
                                        static_cast<const proto::TrafficSample&>(m);
                                  });
  if (!st.ok()) {
    std::cerr << "failed to read samples: " << st << "\n";
    return 2;
  }
  int64_t num_accepted = 0;
  grpc::Status rpc_st = client->AppendSamples(list, &num_accepted);
  if (!rpc_st.ok()) {
    std::cerr << "AppendSamples failed: " << rpc_st.error_message() << "\n";
    return 3;
  }
  std::cout << "sent " << num_accepted << " samples" << std::endl;
  return 0;
}

int Watch(MonitorChannel* client) {
  std::unique_ptr<WatchStream> watch = client->Watch();
  std::string channels = absl::GetFlag(FLAGS_channels);
  for (absl::string_view channel : absl::StrSplit(channels, ',', absl::SkipEmpty())) {
    watch->Subscribe(channel);
  }
  while (!should_exit_flag.load()) {
    std::optional<proto::WatchEvent> ev = watch->NextWithTimeout(absl::Milliseconds(200));
    if (ev.has_value()) {
      if (int ret = PrintJson(*ev); ret != 0) {
        return ret;
      }
    } else if (watch->finished()) {
      break;
    }
  }
  watch->Cancel();
  grpc::Status st = watch->Await();
  if (!st.ok() && st.error_code() != grpc::StatusCode::CANCELLED) {
    std::cerr << "watch ended: " << st.error_message() << "\n";
    return 3;
  }
  return 0;
}

}  // namespace
}  // namespace flowqos

int main(int argc, char** argv) {
  std::vector<std::string> args = flowqos::MainInit(
      argc, argv, "usage: flowqos-watch [flags] host:port");
  std::signal(SIGINT, InterruptHandler);

  if (args.size() != 1) {
    std::cerr << "usage: " << argv[0] << " host:port\n";
    return 1;
  }

  flowqos::MonitorChannel client(
      grpc::CreateChannel(args[0], grpc::InsecureChannelCredentials()));
  if (std::string rule = absl::GetFlag(FLAGS_set_rule); !rule.empty()) {
    return flowqos::SetRule(&client, rule);
  }
  if (std::string path = absl::GetFlag(FLAGS_send_samples); !path.empty()) {
    return flowqos::SendSamples(&client, path);
  }
  if (absl::GetFlag(FLAGS_list)) {
    return flowqos::List(&client);
  }
  return flowqos::Watch(&client);
}
