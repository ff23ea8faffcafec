#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace clubhouse::process {

struct ExecResult {
    int exit_code = -1;
    bool timed_out = false;
    bool launched = false;
    std::string output;
    std::string error;
};

// Runs a binary to completion with a deadline, capturing stdout and stderr.
// Launch failures are reported through ExecResult, never thrown.
class CommandRunner {
public:
    static ExecResult Run(const std::string& binary,
                          const std::vector<std::string>& args,
                          const std::string& working_dir,
                          std::chrono::milliseconds timeout);
};

}  // namespace clubhouse::process
