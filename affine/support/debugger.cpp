#include <affine/support/debugger.hpp>

#include <fstream>
#include <string>
#include <string_view>

namespace affine::support {

static const std::string_view kTracerPid = "TracerPid:";

bool DebuggerAttached() {
  std::ifstream status("/proc/self/status");
  if (!status) {
    return false;
  }

  std::string line;
  while (std::getline(status, line)) {
    if (!line.starts_with(kTracerPid)) {
      continue;
    }

    // "TracerPid:\t0" -- nobody is watching
    auto pos = line.find_first_not_of(" \t", kTracerPid.size());
    return pos != std::string::npos && line[pos] != '0';
  }

  return false;
}

}  // namespace affine::support
