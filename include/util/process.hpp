#pragma once

#include "util/result.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace pkgrepo {

struct ProcessSpec {
    std::vector<std::string> argv;
    std::string cwd;
    // Added to (or overriding) the inherited environment.
    std::vector<std::pair<std::string, std::string>> env;
    std::string stdin_data;
    std::chrono::milliseconds timeout{0}; // 0 => no limit
};

struct ProcessOutput {
    int exit_code = -1;
    std::string out;
    std::string err;
    bool timed_out = false;
};

// Runs the command to completion. Fails only when the process cannot be
// started or exceeds its timeout; a non-zero exit is reported in out.exit_code.
Result RunProcess(const ProcessSpec& spec, ProcessOutput& out);

// Like RunProcess, but a non-zero exit is a failure carrying failure_code.
Result RunProcessChecked(const ProcessSpec& spec, ProcessOutput& out, ErrorCode failure_code);

std::string DescribeCommand(const std::vector<std::string>& argv);

} // namespace pkgrepo
