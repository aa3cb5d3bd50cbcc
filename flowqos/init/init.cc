#include "flowqos/init/init.h"

#include "absl/debugging/failure_signal_handler.h"
#include "absl/debugging/symbolize.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"

namespace flowqos {

std::vector<std::string> MainInit(int argc, char** argv, absl::string_view usage) {
  absl::InitializeSymbolizer(argv[0]);
  absl::InstallFailureSignalHandler(absl::FailureSignalHandlerOptions());
  absl::SetProgramUsageMessage(usage);
  std::vector<char*> remaining = absl::ParseCommandLine(argc, argv);
  return std::vector<std::string>(remaining.begin() + 1, remaining.end());
}

}  // namespace flowqos
