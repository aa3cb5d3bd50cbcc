#ifndef FLOWQOS_LOG_SPDLOG_H_
#define FLOWQOS_LOG_SPDLOG_H_

#include <string>

#include "absl/base/optimization.h"
#include "absl/strings/string_view.h"
#include "spdlog/fmt/fmt.h"
#include "spdlog/fmt/ostr.h"  // export
#include "spdlog/spdlog.h"

namespace flowqos {

// MakeLogger returns a logger named name that writes to the process-wide sinks
// (stderr, or --spdlog_file) at the level given by --spdlog_level.
spdlog::logger MakeLogger(absl::string_view name);

namespace log_internal {

// CheckFailed reports a failed invariant and exits with status 5. If logger is
// null, the report goes to stderr.
[[noreturn]] void CheckFailed(spdlog::logger* logger, const char* file, int line,
                              const std::string& what, const std::string& mesg);

}  // namespace log_internal

//// Checks (uses logger) ////

#define FQ_SPDLOG_CHECK_MESG(logger, cond, mesg)                                    \
  do {                                                                              \
    if (ABSL_PREDICT_FALSE(!(cond))) {                                              \
      ::flowqos::log_internal::CheckFailed(logger, __FILE__, __LINE__, #cond, mesg); \
    }                                                                               \
  } while (0)

#define FQ_SPDLOG_CHECK_OP_MESG(logger, op, val1, val2, mesg)                       \
  do {                                                                              \
    const auto& fq_check_v1 = (val1);                                               \
    const auto& fq_check_v2 = (val2);                                               \
    if (ABSL_PREDICT_FALSE(!(fq_check_v1 op fq_check_v2))) {                        \
      ::flowqos::log_internal::CheckFailed(                                         \
          logger, __FILE__, __LINE__,                                               \
          fmt::format("{} [{}] {} {} [{}]", #val1, fq_check_v1, #op, #val2,         \
                      fq_check_v2),                                                 \
          mesg);                                                                    \
    }                                                                               \
  } while (0)

#define FQ_SPDLOG_CHECK(logger, cond) FQ_SPDLOG_CHECK_MESG(logger, cond, "")
#define FQ_SPDLOG_CHECK_LE_MESG(logger, val1, val2, mesg) \
  FQ_SPDLOG_CHECK_OP_MESG(logger, <=, val1, val2, mesg)
#define FQ_SPDLOG_CHECK_GE_MESG(logger, val1, val2, mesg) \
  FQ_SPDLOG_CHECK_OP_MESG(logger, >=, val1, val2, mesg)
#define FQ_SPDLOG_CHECK_LE(logger, val1, val2) \
  FQ_SPDLOG_CHECK_LE_MESG(logger, val1, val2, "")

//// Assertions (uses stderr) ////

#define FQ_ASSERT_MESG(cond, mesg) FQ_SPDLOG_CHECK_MESG(nullptr, cond, mesg)
#define FQ_ASSERT(cond) FQ_ASSERT_MESG(cond, "")

}  // namespace flowqos

#endif  // FLOWQOS_LOG_SPDLOG_H_
