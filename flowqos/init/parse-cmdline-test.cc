#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "flowqos/init/init.h"

ABSL_FLAG(std::string, tick_label, "unset", "label used only by this test");
ABSL_FLAG(int, max_subscribers, 0, "count used only by this test");

int main() {
  const char* args[] = {"parse-cmdline-test", "--tick_label=fast",
                        "config.textproto",   "-max_subscribers", "12",
                        "samples.ndjson"};
  std::vector<std::string> positional = flowqos::MainInit(
      6, const_cast<char**>(args), "parse-cmdline-test: checks MainInit");

  int failures = 0;
  const std::vector<std::string> want = {"config.textproto", "samples.ndjson"};
  if (positional != want) {
    absl::FPrintF(stderr, "positional: want [%s], got [%s]\n",
                  absl::StrJoin(want, ", "), absl::StrJoin(positional, ", "));
    ++failures;
  }
  if (absl::GetFlag(FLAGS_tick_label) != "fast") {
    absl::FPrintF(stderr, "tick_label: want fast, got %s\n",
                  absl::GetFlag(FLAGS_tick_label));
    ++failures;
  }
  if (absl::GetFlag(FLAGS_max_subscribers) != 12) {
    absl::FPrintF(stderr, "max_subscribers: want 12, got %d\n",
                  absl::GetFlag(FLAGS_max_subscribers));
    ++failures;
  }
  return failures == 0 ? 0 : 2;
}
