#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "utils/cancellation.hpp"

namespace margin::sandbox {

enum class ExecStatus {
    kExited,
    kTimedOut,
    kCancelled,
    kNotFound,
    kFailed
};

struct ExecRequest {
    std::string program;
    std::vector<std::string> args;
    // Written to the child's stdin, which is then closed. Without it the
    // child reads from the null device.
    std::optional<std::string> input;
};

struct ExecResult {
    ExecStatus status = ExecStatus::kFailed;
    int exit_code = -1;
    // stdout and stderr interleaved in the order the child wrote them.
    std::string output;
    std::string error;
};

class SandboxExecutor {
public:
    using Clock = std::chrono::steady_clock;

    static ExecResult Run(const ExecRequest& request,
                          Clock::time_point deadline,
                          const utils::CancellationToken& cancel);

    // Absolute path of program, searched on PATH when it has no directory
    // part. Empty when nothing executable matches.
    static std::string ResolveProgram(const std::string& program);
};

}  // namespace margin::sandbox
