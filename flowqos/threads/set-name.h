#ifndef FLOWQOS_THREADS_SET_NAME_H_
#define FLOWQOS_THREADS_SET_NAME_H_

#include "absl/strings/string_view.h"

namespace flowqos {

// SetCurThreadName names the calling thread for debuggers and top(1).
// Linux keeps at most 15 bytes of a name, so longer names keep only their
// last 15 bytes.
void SetCurThreadName(absl::string_view name);

}  // namespace flowqos

#endif  // FLOWQOS_THREADS_SET_NAME_H_
