#ifndef PBR_PLATFORM_PROCESS_H
#define PBR_PLATFORM_PROCESS_H

#include <string>
#include <system_error>
#include <vector>

namespace pbr::platform {

struct ProcessResult {
  int exit_code{-1};
  bool signaled{false};
  std::string stdout_data;
  std::string stderr_data;
};

// Runs argv[0] (looked up in PATH) with `stdin_data` fed to its standard
// input and both output streams captured. Returns false only when the child
// could not be started; a non-zero exit is reported through `out`.
bool RunProcess(const std::vector<std::string>& argv,
                const std::string& stdin_data,
                ProcessResult& out,
                std::error_code& ec);

}  // namespace pbr::platform

#endif  // PBR_PLATFORM_PROCESS_H
