#ifndef FLOWQOS_POSIX_STRERROR_H_
#define FLOWQOS_POSIX_STRERROR_H_

#include <string>

namespace flowqos {

// StrError is a thread-safe, C++ friendly variant of strerror.
std::string StrError(int error_number);

}  // namespace flowqos

#endif  // FLOWQOS_POSIX_STRERROR_H_
