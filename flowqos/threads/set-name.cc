#include "flowqos/threads/set-name.h"

#include <pthread.h>

#include <string>

namespace flowqos {

namespace {
constexpr size_t kMaxThreadNameLen = 15;
}  // namespace

void SetCurThreadName(absl::string_view name) {
  if (name.size() > kMaxThreadNameLen) {
    name.remove_prefix(name.size() - kMaxThreadNameLen);
  }
#ifdef __linux__
  pthread_setname_np(pthread_self(), std::string(name).c_str());
#endif
}

}  // namespace flowqos
