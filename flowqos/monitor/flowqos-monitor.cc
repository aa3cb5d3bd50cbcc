#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/status/status.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/time/time.h"
#include "flowqos/alg/demand-predictor.h"
#include "flowqos/broadcast/broadcaster.h"
#include "flowqos/cli/parse.h"
#include "flowqos/engine/tick-engine.h"
#include "flowqos/init/init.h"
#include "flowqos/log/spdlog.h"
#include "flowqos/proto/config.pb.h"
#include "flowqos/proto/fileio.h"
#include "flowqos/proto/ndjson-recorder.h"
#include "flowqos/rules/rule-store.h"
#include "flowqos/server/monitor-service.h"
#include "flowqos/store/in-memory-store.h"
#include "flowqos/threads/set-name.h"
#include "grpcpp/grpcpp.h"

ABSL_FLAG(std::string, samples, "",
          "NDJSON file of TrafficSamples to replay; timestamps are shifted to end now");
ABSL_FLAG(std::string, alloc_logs, "", "path to write every allocation update as NDJSON");
ABSL_FLAG(std::string, alert_logs, "", "path to write every emitted alert as NDJSON");

static std::atomic<bool> should_exit_flag{false};

static void InterruptHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    should_exit_flag.store(true);
  }
}

namespace flowqos {
namespace {

absl::StatusOr<std::unique_ptr<NdjsonRecorder>> MaybeCreateRecorder(
    const std::string& path) {
  if (path.empty()) {
    return NdjsonRecorder::Disabled();
  }
  return NdjsonRecorder::Open(path);
}

absl::Status Run(const proto::MonitorConfig& c) {
  absl::StatusOr<EngineOptions> options_or = ParseMonitorConfig(c);
  if (!options_or.ok()) {
    return options_or.status();
  }
  const EngineOptions& options = *options_or;

  RuleStore rules;
  if (absl::Status st = rules.LoadRules(options.rules); !st.ok()) {
    return st;
  }

  InMemoryTrafficStore store;
  if (std::string samples_path = absl::GetFlag(FLAGS_samples); !samples_path.empty()) {
    absl::Status st = store.LoadSamplesFromFile(samples_path, absl::Now());
    if (!st.ok()) {
      return st;
    }
  }

  auto alloc_recorder_or = MaybeCreateRecorder(absl::GetFlag(FLAGS_alloc_logs));
  if (!alloc_recorder_or.ok()) {
    return alloc_recorder_or.status();
  }
  auto alert_recorder_or = MaybeCreateRecorder(absl::GetFlag(FLAGS_alert_logs));
  if (!alert_recorder_or.ok()) {
    return alert_recorder_or.status();
  }

  RuleBasedPredictor predictor;
  Broadcaster broadcaster(options.subscriber_buffer_size);
  TickEngine engine(options, TickEngine::Deps{
                                 .store = &store,
                                 .predictor = &predictor,
                                 .rules = &rules,
                                 .broadcaster = &broadcaster,
                                 .alloc_recorder = alloc_recorder_or->get(),
                                 .alert_recorder = alert_recorder_or->get(),
                             });

  auto logger = MakeLogger("main");
  std::vector<std::unique_ptr<MonitorService>> services;
  std::vector<std::unique_ptr<grpc::Server>> servers;
  services.reserve(options.server_addresses.size());
  servers.reserve(options.server_addresses.size());
  for (const std::string& address : options.server_addresses) {
    std::vector<std::string> parts = absl::StrSplit(address, ":");
    int id = 0;
    if (!absl::SimpleAtoi(parts[parts.size() - 1], &id)) {
      SPDLOG_LOGGER_INFO(
          &logger, "failed to parse port in {}: service ids may not be useful", address);
    }

    auto service = std::make_unique<MonitorService>(&broadcaster, &rules, &store, id);
    grpc::ServerBuilder builder;
    builder.AddListeningPort(address, grpc::InsecureServerCredentials());
    builder.RegisterCallbackGenericService(service.get());
    std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
    if (server == nullptr) {
      return absl::UnavailableError(absl::StrCat("failed to listen on ", address));
    }
    servers.push_back(std::move(server));
    services.push_back(std::move(service));
    SPDLOG_LOGGER_INFO(&logger, "Server listening on {}", address);
  }

  SetCurThreadName("tick-loop");
  RunLoop(&engine, options.tick_period, &should_exit_flag, &logger);

  SPDLOG_LOGGER_INFO(&logger, "shutting down");
  engine.Drain(absl::Now());
  broadcaster.Close();
  for (std::unique_ptr<grpc::Server>& server : servers) {
    server->Shutdown(absl::ToChronoTime(absl::Now() + absl::Seconds(2)));
    server->Wait();
  }

  for (NdjsonRecorder* recorder : {alloc_recorder_or->get(), alert_recorder_or->get()}) {
    if (absl::Status st = recorder->Close(); !st.ok()) {
      SPDLOG_LOGGER_WARN(&logger, "failed to close recorder: {}", st.ToString());
    }
  }
  return absl::OkStatus();
}

}  // namespace
}  // namespace flowqos

int main(int argc, char** argv) {
  std::vector<std::string> args = flowqos::MainInit(
      argc, argv, "usage: flowqos-monitor [flags] config_path.textproto");
  std::signal(SIGINT, InterruptHandler);
  std::signal(SIGTERM, InterruptHandler);

  if (args.size() != 1) {
    std::cerr << "usage: " << argv[0] << " config_path.textproto\n";
    return 1;
  }

  flowqos::proto::MonitorConfig config;
  if (absl::Status st = flowqos::ReadTextProtoFromFile(args[0], &config); !st.ok()) {
    std::cerr << "failed to read config: " << st << "\n";
    return 2;
  }

  absl::Status s = flowqos::Run(config);
  if (!s.ok()) {
    std::cerr << "failed to run: " << s << "\n";
    return 3;
  }
}
