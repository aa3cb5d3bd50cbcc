#include "flowqos/posix/strerror.h"

#include <string.h>

#include "absl/strings/str_cat.h"

namespace flowqos {

namespace {

// Selected by overload resolution: glibc exposes the GNU variant that returns
// a char* that may or may not point into buf.
std::string FromStrErrorR(char* result, const char* buf) { return result; }

// XSI variant: returns 0 on success and fills buf.
std::string FromStrErrorR(int result, const char* buf) {
  if (result != 0) {
    return "";
  }
  return buf;
}

}  // namespace

std::string StrError(int error_number) {
  char buf[256];
  buf[0] = '\0';
  std::string s = FromStrErrorR(strerror_r(error_number, buf, sizeof(buf)), buf);
  if (s.empty()) {
    return absl::StrCat("Error number ", error_number);
  }
  return s;
}

}  // namespace flowqos
