#include "flowqos/log/spdlog.h"

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include "absl/debugging/stacktrace.h"
#include "absl/debugging/symbolize.h"
#include "absl/flags/flag.h"
#include "absl/strings/str_format.h"
#include "spdlog/pattern_formatter.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_sinks.h"

ABSL_FLAG(std::string, spdlog_file, "", "if set, log to this file instead of stderr");
ABSL_FLAG(std::string, spdlog_level, "info",
          "minimum level to log: trace, debug, info, warning, error, critical or off");

namespace flowqos {
namespace {

constexpr int kMaxStackFrames = 32;

const std::vector<spdlog::sink_ptr>& Sinks() {
  static const auto* sinks = [] {
    auto* sinks = new std::vector<spdlog::sink_ptr>;
    const std::string path = absl::GetFlag(FLAGS_spdlog_file);
    if (path.empty()) {
      sinks->push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());
    } else {
      sinks->push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, true));
    }
    spdlog::flush_every(std::chrono::seconds(2));
    return sinks;
  }();
  return *sinks;
}

std::vector<std::string> SymbolizedStack() {
  void* stack[kMaxStackFrames];
  // Skip CheckFailed and SymbolizedStack.
  int num_frames = absl::GetStackTrace(stack, kMaxStackFrames, 2);
  std::vector<std::string> frames;
  frames.reserve(num_frames);
  for (int i = 0; i < num_frames; ++i) {
    char symbol[1024];
    if (!absl::Symbolize(stack[i], symbol, sizeof(symbol))) {
      absl::SNPrintF(symbol, sizeof(symbol), "(unknown)");
    }
    frames.push_back(absl::StrFormat("  %p %s", stack[i], symbol));
  }
  return frames;
}

}  // namespace

spdlog::logger MakeLogger(absl::string_view name) {
  const auto& sinks = Sinks();
  spdlog::logger logger(std::string(name), sinks.begin(), sinks.end());
  logger.set_formatter(std::make_unique<spdlog::pattern_formatter>(
      "T=%t %+", spdlog::pattern_time_type::utc));
  logger.set_level(spdlog::level::from_str(absl::GetFlag(FLAGS_spdlog_level)));
  return logger;
}

namespace log_internal {

void CheckFailed(spdlog::logger* logger, const char* file, int line,
                 const std::string& what, const std::string& mesg) {
  std::string report = absl::StrFormat("%s:%d: invariant violation: wanted %s", file,
                                       line, what);
  if (!mesg.empty()) {
    absl::StrAppendFormat(&report, ": %s", mesg);
  }
  std::vector<std::string> frames = SymbolizedStack();
  if (logger != nullptr) {
    SPDLOG_LOGGER_CRITICAL(logger, "{}", report);
    for (const std::string& f : frames) {
      SPDLOG_LOGGER_CRITICAL(logger, "{}", f);
    }
    logger->flush();
  } else {
    absl::FPrintF(stderr, "%s\n", report);
    for (const std::string& f : frames) {
      absl::FPrintF(stderr, "%s\n", f);
    }
  }
  std::exit(5);
}

}  // namespace log_internal
}  // namespace flowqos
