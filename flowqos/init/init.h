#ifndef FLOWQOS_INIT_INIT_H_
#define FLOWQOS_INIT_INIT_H_

#include <string>
#include <vector>

#include "absl/strings/string_view.h"

namespace flowqos {

// MainInit sets the --help usage text, installs the failure signal handler
// and parses absl flags. It returns the positional arguments, without the
// program name.
std::vector<std::string> MainInit(int argc, char** argv, absl::string_view usage);

}  // namespace flowqos

#endif  // FLOWQOS_INIT_INIT_H_
