#pragma once

#include <chrono>
#include <expected>
#include <stop_token>
#include <string>
#include <vector>

namespace platform {

struct ProcessOptions {
    std::chrono::milliseconds timeout{0}; // 0 disables the timeout
    bool capture_stdout = false;
    std::stop_token stop;
};

struct ProcessResult {
    int exit_code = -1;       // -1 when the child did not exit normally
    bool timed_out = false;
    bool cancelled = false;
    std::string output;       // captured stdout
};

// Runs argv[0] (looked up on PATH) in its own process group with stdin and
// stderr on /dev/null. The child is killed on timeout or stop request.
// Only spawn failures are reported as errors; exit status is in the result.
std::expected<ProcessResult, std::string>
    run_process(const std::vector<std::string>& argv, const ProcessOptions& opts = {});

} // namespace platform
