#pragma once

#include "result.hpp"

#include <string>
#include <vector>

namespace toolroute::core {

struct ProcessOptions {
    std::string working_dir;
    std::string stdin_data;
    int timeout_ms = 60000;
    size_t max_output = 30000;
};

struct ProcessResult {
    int exit_code = -1;
    std::string stdout_output;
    std::string stderr_output;
    bool timed_out = false;
    bool truncated = false;
};

// Run argv[0] directly (execvp, no shell) and capture its output.
// Fails only when the process could not be started.
Result<ProcessResult, Error> run_process(const std::vector<std::string>& argv,
                                         const ProcessOptions& options);

}  // namespace toolroute::core
